#include "episweep/ParameterSweep.hpp"
#include "episweep/Simulator.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <utility>

namespace episweep {

    ParameterSweep::ParameterSweep(ModelBuilder builder,
                                   Eigen::VectorXd initial_state,
                                   std::vector<double> beta_values,
                                   std::shared_ptr<IOdeSolverStrategy> solver,
                                   SweepTimeOptions options)
        : builder_(std::move(builder)),
          initial_state_(std::move(initial_state)),
          beta_values_(std::move(beta_values)),
          solver_(std::move(solver)),
          options_(options)
    {
        if (!builder_) {
            THROW_INVALID_PARAM("ParameterSweep::ParameterSweep", "Model builder cannot be empty.");
        }
        if (!solver_) {
            THROW_INVALID_PARAM("ParameterSweep::ParameterSweep", "Solver strategy pointer cannot be null.");
        }
        if (beta_values_.empty()) {
            THROW_INVALID_PARAM("ParameterSweep::ParameterSweep", "At least one beta value is required.");
        }
        for (double beta : beta_values_) {
            if (!std::isfinite(beta) || beta < 0) {
                THROW_INVALID_PARAM("ParameterSweep::ParameterSweep", "Beta values must be finite and non-negative. Got " + std::to_string(beta) + ".");
            }
        }
        if (options_.num_tsteps < 2) {
            THROW_INVALID_PARAM("ParameterSweep::ParameterSweep", "At least two time samples are required.");
        }
        if (options_.end_time <= options_.start_time) {
            THROW_INVALID_PARAM("ParameterSweep::ParameterSweep", "End time must be greater than start time.");
        }
        if (options_.dt_hint <= 0) {
            THROW_INVALID_PARAM("ParameterSweep::ParameterSweep", "Time step hint must be positive.");
        }
        if (options_.abs_error < 0 || options_.rel_error < 0) {
            THROW_INVALID_PARAM("ParameterSweep::ParameterSweep", "Error tolerances cannot be negative.");
        }
    }

    std::vector<double> ParameterSweep::timePoints() const {
        return Simulator::uniformTimePoints(options_.start_time, options_.end_time, options_.num_tsteps);
    }

    const std::vector<double>& ParameterSweep::betaValues() const {
        return beta_values_;
    }

    SweepResultTable ParameterSweep::run() const {
        Logger& logger = Logger::getInstance();
        const std::vector<double> times = timePoints();

        std::vector<std::shared_ptr<EpidemicModel>> models;
        models.reserve(beta_values_.size());
        for (double beta : beta_values_) {
            std::shared_ptr<EpidemicModel> model = builder_(beta);
            if (!model) {
                throw ModelConstructionException("ParameterSweep::run", "Model builder returned null for beta=" + std::to_string(beta) + ".");
            }
            if (initial_state_.size() != model->getStateSize()) {
                THROW_INVALID_PARAM("ParameterSweep::run",
                                    "Initial state size (" + std::to_string(initial_state_.size()) +
                                    ") does not match model state size (" + std::to_string(model->getStateSize()) + ").");
            }
            models.push_back(model);
        }
        logger.info("ParameterSweep::run", "Built " + std::to_string(models.size()) + " " + models.front()->getModelName() +
                    " models; integrating with " + solver_->name() + " over [" + std::to_string(options_.start_time) +
                    ", " + std::to_string(options_.end_time) + "] with " + std::to_string(times.size()) + " samples.");

        SweepResultTable table(beta_values_, times, models.front()->getStateNames());

        for (size_t i = 0; i < models.size(); ++i) {
            const double beta = beta_values_[i];
            Simulator simulator(models[i], solver_, options_.start_time, options_.end_time,
                                options_.dt_hint, options_.abs_error, options_.rel_error);
            SimulationResult result;
            try {
                result = simulator.run(initial_state_, times);
            } catch (const SimulationException& e) {
                logger.error("ParameterSweep::run", "Aborting sweep at beta=" + std::to_string(beta) + ": " + e.what());
                throw SimulationException("ParameterSweep::run",
                                          "Integration failed for beta=" + std::to_string(beta) + ": " + e.what());
            }
            table.setGroup(static_cast<int>(i), result);
            logger.debug("ParameterSweep::run", "beta=" + std::to_string(beta) + " done (" +
                         std::to_string(i + 1) + "/" + std::to_string(models.size()) + ").");
        }

        if (!table.isComplete()) {
            throw InvalidResultException("ParameterSweep::run", "Result table is incomplete after the sweep.");
        }
        logger.info("ParameterSweep::run", "Sweep finished: " + std::to_string(table.numRows()) + " rows.");
        return table;
    }

} // namespace episweep
