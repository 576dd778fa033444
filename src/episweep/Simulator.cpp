#include "episweep/Simulator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <utility>

namespace episweep {

    Simulator::Simulator(std::shared_ptr<EpidemicModel> model,
                         std::shared_ptr<IOdeSolverStrategy> solver,
                         double start_time,
                         double end_time,
                         double dt_hint,
                         double abs_error,
                         double rel_error)
        : model_(std::move(model)),
          solver_(std::move(solver)),
          start_time_(start_time),
          end_time_(end_time),
          dt_hint_(dt_hint)
    {
        if (!model_) {
            THROW_INVALID_PARAM("Simulator::Simulator", "Model pointer cannot be null.");
        }
        if (!solver_) {
            THROW_INVALID_PARAM("Simulator::Simulator", "Solver strategy pointer cannot be null.");
        }
        if (!std::isfinite(start_time_) || !std::isfinite(end_time_) || end_time_ <= start_time_) {
            THROW_INVALID_PARAM("Simulator::Simulator", "End time must be greater than start time. Got [" +
                                std::to_string(start_time_) + ", " + std::to_string(end_time_) + "].");
        }
        if (!(dt_hint_ > 0)) {
            THROW_INVALID_PARAM("Simulator::Simulator", "Time step hint must be positive.");
        }
        setErrorTolerance(abs_error, rel_error);
    }

    void Simulator::setErrorTolerance(double abs_error, double rel_error) {
        if (abs_error < 0 || rel_error < 0) {
            THROW_INVALID_PARAM("Simulator::setErrorTolerance",
                                "Error tolerances cannot be negative. Got abs_error=" + std::to_string(abs_error) +
                                ", rel_error=" + std::to_string(rel_error) + ".");
        }
        if (abs_error == 0 && rel_error == 0) {
            THROW_INVALID_PARAM("Simulator::setErrorTolerance", "At least one error tolerance must be positive.");
        }
        abs_error_ = abs_error;
        rel_error_ = rel_error;
    }

    void Simulator::validateRunInputs(const Eigen::VectorXd& initial_state,
                                      const std::vector<double>& output_times) const {
        if (initial_state.size() != model_->getStateSize()) {
            THROW_INVALID_PARAM("Simulator::run", "Initial state has " + std::to_string(initial_state.size()) +
                                " entries, " + model_->getModelName() + " has " +
                                std::to_string(model_->getStateSize()) + " compartments.");
        }
        if (!initial_state.allFinite()) {
            THROW_INVALID_PARAM("Simulator::run", "Initial state contains non-finite values.");
        }
        if (output_times.empty()) {
            THROW_INVALID_PARAM("Simulator::run", "At least one output time is required.");
        }
        if (output_times.front() < start_time_ || output_times.back() > end_time_) {
            THROW_INVALID_PARAM("Simulator::run", "Output times [" + std::to_string(output_times.front()) + ", " +
                                std::to_string(output_times.back()) + "] leave the horizon [" +
                                std::to_string(start_time_) + ", " + std::to_string(end_time_) + "].");
        }
        for (size_t i = 1; i < output_times.size(); ++i) {
            if (!(output_times[i] > output_times[i - 1])) {
                THROW_INVALID_PARAM("Simulator::run", "Output times must be strictly increasing; " +
                                    std::to_string(output_times[i]) + " follows " +
                                    std::to_string(output_times[i - 1]) + ".");
            }
        }
    }

    SimulationResult Simulator::run(const Eigen::VectorXd& initial_state,
                                    const std::vector<double>& output_times) const {
        validateRunInputs(initial_state, output_times);

        SimulationResult result;
        result.compartment_names = model_->getStateNames();
        result.time_points.reserve(output_times.size());
        result.solution.reserve(output_times.size());

        // The initial state belongs to start_time_; a later first sample is integrated up to.
        const bool leading_start = output_times.front() > start_time_;
        std::vector<double> solver_times;
        if (leading_start) {
            solver_times.reserve(output_times.size() + 1);
            solver_times.push_back(start_time_);
        }
        solver_times.insert(solver_times.end(), output_times.begin(), output_times.end());

        state_type x(initial_state.data(), initial_state.data() + initial_state.size());
        const EpidemicModel& model = *model_;
        auto system = [&model](const state_type& state, state_type& dxdt, double t) {
            model(state, dxdt, t);
        };
        bool skip_next = leading_start;
        auto observer = [&result, &skip_next](const state_type& state, double t) {
            for (double v : state) {
                if (!std::isfinite(v)) {
                    THROW_SIMULATION_ERROR("Simulator::run", "Non-finite state encountered at t = " + std::to_string(t) + ".");
                }
            }
            if (skip_next) {
                skip_next = false;
                return;
            }
            result.time_points.push_back(t);
            result.solution.push_back(state);
        };

        try {
            solver_->integrate(system, x, solver_times, dt_hint_, observer, abs_error_, rel_error_);
        } catch (const ModelException& e) {
            Logger::getInstance().error("Simulator::run", e.what());
            throw;
        } catch (const std::exception& e) {
            const std::string msg = solver_->name() + " integration failed: " + e.what();
            Logger::getInstance().error("Simulator::run", msg);
            throw SimulationException("Simulator::run", msg);
        }

        if (result.time_points.size() != output_times.size()) {
            throw SimulationException("Simulator::run", solver_->name() + " reported " +
                                      std::to_string(result.time_points.size()) + " samples, expected " +
                                      std::to_string(output_times.size()) + ".");
        }
        return result;
    }

    std::vector<double> Simulator::uniformTimePoints(double start, double end, int count) {
        if (count < 2) {
            THROW_INVALID_PARAM("Simulator::uniformTimePoints", "At least two time points are required. Got " + std::to_string(count) + ".");
        }
        if (!(end > start)) {
            THROW_INVALID_PARAM("Simulator::uniformTimePoints", "End time must be greater than start time.");
        }
        std::vector<double> times(static_cast<size_t>(count));
        const double span = end - start;
        for (int i = 0; i < count; ++i) {
            times[i] = start + span * static_cast<double>(i) / static_cast<double>(count - 1);
        }
        times.back() = end;
        return times;
    }

} // namespace episweep
