#ifndef SWEEP_ANALYSER_HPP
#define SWEEP_ANALYSER_HPP

#include "SweepResultTable.hpp"
#include <string>
#include <vector>

namespace episweep {

    /**
     * @struct SweepSummary
     * @brief Epidemic indicators of one beta group.
     */
    struct SweepSummary {
        double beta = 0.0;
        double peak_infected = 0.0;        ///< Largest sampled value of I
        double peak_time = 0.0;            ///< Time of the largest sampled value of I
        double mean_infected = 0.0;        ///< Mean of I over the sampled horizon
        double final_susceptible_fraction = 0.0; ///< S(t_end) / S+...(t_end)
        bool has_deaths = false;           ///< True when the model has a D compartment
        double final_dead = 0.0;           ///< D(t_end), 0 when has_deaths is false
    };

    /**
     * @class SweepAnalyser
     * @brief Per-beta summary statistics of a complete sweep.
     */
    class SweepAnalyser {
    public:
        SweepAnalyser() = delete;

        /**
         * @brief One summary per beta group, in sweep order.
         *
         * @param table Complete sweep result table.
         * @param infected_compartment Name of the infected compartment.
         * @throws InvalidResultException If the table is incomplete.
         * @throws InvalidParameterException If the table has no such compartment.
         */
        static std::vector<SweepSummary> summarize(const SweepResultTable& table,
                                                   const std::string& infected_compartment = "I");

        /** @brief Single-line description for log output. */
        static std::string describe(const SweepSummary& summary);
    };

} // namespace episweep

#endif // SWEEP_ANALYSER_HPP
