#include "episweep/SweepResultTable.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace episweep {

    SweepResultTable::SweepResultTable(std::vector<double> beta_values,
                                       std::vector<double> time_points,
                                       std::vector<std::string> compartment_names)
        : beta_values_(std::move(beta_values)),
          time_points_(std::move(time_points)),
          compartment_names_(std::move(compartment_names))
    {
        if (beta_values_.empty()) {
            THROW_INVALID_PARAM("SweepResultTable::SweepResultTable", "At least one beta value is required.");
        }
        if (time_points_.empty()) {
            THROW_INVALID_PARAM("SweepResultTable::SweepResultTable", "At least one time point is required.");
        }
        if (compartment_names_.empty()) {
            THROW_INVALID_PARAM("SweepResultTable::SweepResultTable", "At least one compartment is required.");
        }
        for (size_t i = 1; i < time_points_.size(); ++i) {
            if (time_points_[i] <= time_points_[i - 1]) {
                THROW_INVALID_PARAM("SweepResultTable::SweepResultTable", "Time points must be strictly increasing.");
            }
        }

        filled_.assign(beta_values_.size(), false);
        data_ = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(beta_values_.size() * time_points_.size()),
                                      FIRST_COMPARTMENT_COLUMN + static_cast<Eigen::Index>(compartment_names_.size()));
        for (int b = 0; b < numBeta(); ++b) {
            Eigen::Index first = groupStartRow(b);
            data_.block(first, BETA_COLUMN, numTimeSteps(), 1).setConstant(beta_values_[b]);
            for (int k = 0; k < numTimeSteps(); ++k) {
                data_(first + k, TIME_COLUMN) = time_points_[k];
            }
        }
    }

    void SweepResultTable::setGroup(int beta_index, const SimulationResult& result) {
        checkBetaIndex(beta_index, "SweepResultTable::setGroup");
        if (filled_[beta_index]) {
            THROW_INVALID_PARAM("SweepResultTable::setGroup", "Group " + std::to_string(beta_index) + " has already been written.");
        }
        if (!result.isValid()) {
            throw InvalidResultException("SweepResultTable::setGroup", "Simulation result object is invalid or empty.");
        }
        if (result.time_points.size() != time_points_.size()) {
            throw InvalidResultException("SweepResultTable::setGroup",
                                         "Expected " + std::to_string(time_points_.size()) + " samples for beta=" +
                                         std::to_string(beta_values_[beta_index]) + ", got " +
                                         std::to_string(result.time_points.size()) + ".");
        }

        const Eigen::Index first = groupStartRow(beta_index);
        for (size_t k = 0; k < time_points_.size(); ++k) {
            const double tolerance = 1e-9 * std::max(1.0, std::abs(time_points_[k]));
            if (std::abs(result.time_points[k] - time_points_[k]) > tolerance) {
                throw InvalidResultException("SweepResultTable::setGroup",
                                             "Sample " + std::to_string(k) + " taken at t=" + std::to_string(result.time_points[k]) +
                                             ", expected t=" + std::to_string(time_points_[k]) + ".");
            }
            const state_type& state = result.solution[k];
            if (state.size() != compartment_names_.size()) {
                throw InvalidResultException("SweepResultTable::setGroup",
                                             "State size " + std::to_string(state.size()) + " does not match " +
                                             std::to_string(compartment_names_.size()) + " compartments.");
            }
            for (size_t c = 0; c < state.size(); ++c) {
                data_(first + static_cast<Eigen::Index>(k), FIRST_COMPARTMENT_COLUMN + static_cast<Eigen::Index>(c)) = state[c];
            }
        }
        filled_[beta_index] = true;
    }

    int SweepResultTable::numBeta() const {
        return static_cast<int>(beta_values_.size());
    }

    int SweepResultTable::numTimeSteps() const {
        return static_cast<int>(time_points_.size());
    }

    int SweepResultTable::numCompartments() const {
        return static_cast<int>(compartment_names_.size());
    }

    Eigen::Index SweepResultTable::numRows() const {
        return data_.rows();
    }

    const std::vector<double>& SweepResultTable::betaValues() const {
        return beta_values_;
    }

    const std::vector<double>& SweepResultTable::timePoints() const {
        return time_points_;
    }

    const std::vector<std::string>& SweepResultTable::compartmentNames() const {
        return compartment_names_;
    }

    bool SweepResultTable::isComplete() const {
        return std::all_of(filled_.begin(), filled_.end(), [](bool f) { return f; });
    }

    bool SweepResultTable::isGroupFilled(int beta_index) const {
        checkBetaIndex(beta_index, "SweepResultTable::isGroupFilled");
        return filled_[beta_index];
    }

    Eigen::VectorXd SweepResultTable::trajectory(int beta_index, int compartment_index) const {
        checkBetaIndex(beta_index, "SweepResultTable::trajectory");
        if (compartment_index < 0 || compartment_index >= numCompartments()) {
            THROW_OUT_OF_RANGE("SweepResultTable::trajectory",
                               "Compartment index " + std::to_string(compartment_index) + " out of range [0, " +
                               std::to_string(numCompartments()) + ").");
        }
        return data_.block(groupStartRow(beta_index), FIRST_COMPARTMENT_COLUMN + compartment_index, numTimeSteps(), 1);
    }

    Eigen::VectorXd SweepResultTable::trajectory(int beta_index, const std::string& compartment) const {
        return trajectory(beta_index, compartmentIndex(compartment));
    }

    int SweepResultTable::compartmentIndex(const std::string& compartment) const {
        auto it = std::find(compartment_names_.begin(), compartment_names_.end(), compartment);
        if (it == compartment_names_.end()) {
            THROW_INVALID_PARAM("SweepResultTable::compartmentIndex", "Unknown compartment '" + compartment + "'.");
        }
        return static_cast<int>(std::distance(compartment_names_.begin(), it));
    }

    Eigen::Index SweepResultTable::groupStartRow(int beta_index) const {
        checkBetaIndex(beta_index, "SweepResultTable::groupStartRow");
        return static_cast<Eigen::Index>(beta_index) * numTimeSteps();
    }

    const Eigen::MatrixXd& SweepResultTable::data() const {
        return data_;
    }

    void SweepResultTable::checkBetaIndex(int beta_index, const std::string& caller) const {
        if (beta_index < 0 || beta_index >= numBeta()) {
            THROW_OUT_OF_RANGE(caller, "Beta index " + std::to_string(beta_index) + " out of range [0, " +
                               std::to_string(numBeta()) + ").");
        }
    }

} // namespace episweep
