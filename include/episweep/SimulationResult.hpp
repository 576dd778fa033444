#ifndef SIMULATION_RESULT_HPP
#define SIMULATION_RESULT_HPP

#include <vector>
#include <string>

namespace episweep {

    /** @brief Compartment values at one instant, in model state order. */
    using state_type = std::vector<double>;

    /**
     * @brief Trajectory of one model run, sampled at the requested output times.
     */
    struct SimulationResult {
        std::vector<double> time_points;
        std::vector<state_type> solution;            ///< solution[k] is the state at time_points[k]
        std::vector<std::string> compartment_names;

        bool isValid() const {
            return !time_points.empty() && time_points.size() == solution.size();
        }
    };

} // namespace episweep

#endif // SIMULATION_RESULT_HPP
