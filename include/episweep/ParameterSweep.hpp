#ifndef PARAMETER_SWEEP_HPP
#define PARAMETER_SWEEP_HPP

#include "EpidemicModel.hpp"
#include "SweepResultTable.hpp"
#include "interfaces/IOdeSolverStrategy.hpp"
#include "ModelConstants.hpp"
#include <Eigen/Dense>
#include <functional>
#include <memory>
#include <vector>

namespace episweep {

    /**
     * @struct SweepTimeOptions
     * @brief Integration horizon, sampling grid and solver tolerances shared by every run of a sweep.
     */
    struct SweepTimeOptions {
        double start_time = constants::DEFAULT_START_TIME;
        double end_time = constants::DEFAULT_END_TIME;
        int num_tsteps = constants::DEFAULT_NUM_TSTEPS;
        double dt_hint = constants::DEFAULT_DT_HINT;
        double abs_error = constants::DEFAULT_ABS_ERROR;
        double rel_error = constants::DEFAULT_REL_ERROR;
    };

    /**
     * @class ParameterSweep
     * @brief Integrates one model per beta value and collects the sampled trajectories.
     *
     * Every model of the sweep is built (and so validated) before the first integration.
     * Each run starts from the same initial state with a fresh model. A failed run aborts
     * the whole sweep: the result table is only returned when every group is filled.
     */
    class ParameterSweep {
    public:
        /** @brief Builds the model for one beta value; may throw ModelConstructionException. */
        using ModelBuilder = std::function<std::shared_ptr<EpidemicModel>(double beta)>;

        /**
         * @throws InvalidParameterException If `builder` or `solver` is empty, `beta_values` is empty or
         *         contains negative or non-finite values, or the time options are invalid.
         */
        ParameterSweep(ModelBuilder builder,
                       Eigen::VectorXd initial_state,
                       std::vector<double> beta_values,
                       std::shared_ptr<IOdeSolverStrategy> solver,
                       SweepTimeOptions options = SweepTimeOptions());

        /**
         * @brief Runs the sweep.
         *
         * @return SweepResultTable with `beta_values.size()` groups of `num_tsteps` rows.
         * @throws ModelConstructionException If a model cannot be built (before any integration).
         * @throws InvalidParameterException If the initial state does not fit the model.
         * @throws SimulationException If the integration for any beta fails.
         * @throws InvalidResultException If the table is incomplete after the sweep.
         */
        SweepResultTable run() const;

        /** @brief Sampling times used by every run. */
        std::vector<double> timePoints() const;

        const std::vector<double>& betaValues() const;

    private:
        ModelBuilder builder_;
        Eigen::VectorXd initial_state_;
        std::vector<double> beta_values_;
        std::shared_ptr<IOdeSolverStrategy> solver_;
        SweepTimeOptions options_;
    };

} // namespace episweep

#endif // PARAMETER_SWEEP_HPP
