#ifndef SIMULATOR_H
#define SIMULATOR_H

#include "SimulationResult.hpp"
#include "EpidemicModel.hpp"
#include "interfaces/IOdeSolverStrategy.hpp"
#include <memory>
#include <vector>
#include <Eigen/Dense>

namespace episweep {

/**
 * @class Simulator
 * @brief Integrates one model over [start_time, end_time] and samples it at requested times.
 *
 * Sampling comes from the solver's continuous solution, so the result holds exactly the
 * requested times regardless of the internal step sizes.
 */
class Simulator {
public:
    /**
     * @param model Model to integrate.
     * @param solver Integration strategy.
     * @param start_time Start of the horizon.
     * @param end_time End of the horizon.
     * @param dt_hint Initial step size for the adaptive solver.
     * @param abs_error Absolute error tolerance.
     * @param rel_error Relative error tolerance.
     *
     * @throws InvalidParameterException On null pointers, an empty horizon, a non-positive step
     *         hint, negative tolerances or both tolerances zero.
     */
    Simulator(std::shared_ptr<EpidemicModel> model,
              std::shared_ptr<IOdeSolverStrategy> solver,
              double start_time,
              double end_time,
              double dt_hint,
              double abs_error = 1.0e-6,
              double rel_error = 1.0e-6);

    /** @throws InvalidParameterException If either tolerance is negative or both are zero. */
    void setErrorTolerance(double abs_error, double rel_error);

    /**
     * @brief Integrates from @p initial_state and records the state at every output time.
     *
     * @param initial_state State at start_time; one entry per model compartment, all finite.
     * @param output_times Strictly increasing, within [start_time, end_time]. When the first
     *        output time is after start_time, the model is integrated from start_time up to it.
     *
     * @throws InvalidParameterException If the inputs are inconsistent.
     * @throws SimulationException If the solver fails, the state becomes non-finite, or a
     *         requested time is not reported.
     */
    SimulationResult run(const Eigen::VectorXd& initial_state,
                         const std::vector<double>& output_times) const;

    /**
     * @brief @p count evenly spaced points from @p start to @p end, both included.
     * @throws InvalidParameterException If count < 2 or end <= start.
     */
    static std::vector<double> uniformTimePoints(double start, double end, int count);

    std::shared_ptr<EpidemicModel> getModel() const { return model_; }
    double getStartTime() const { return start_time_; }
    double getEndTime() const { return end_time_; }

private:
    void validateRunInputs(const Eigen::VectorXd& initial_state,
                           const std::vector<double>& output_times) const;

    std::shared_ptr<EpidemicModel> model_;
    std::shared_ptr<IOdeSolverStrategy> solver_;
    double start_time_;
    double end_time_;
    double dt_hint_;
    double abs_error_ = 0.0;
    double rel_error_ = 0.0;
};

} // namespace episweep

#endif // SIMULATOR_H
