#ifndef TRACE_BUILDER_HPP
#define TRACE_BUILDER_HPP

#include "episweep/SweepResultTable.hpp"
#include "episweep/plotting/Trace.hpp"
#include <string>
#include <vector>

namespace episweep {

    /**
     * @class TraceBuilder
     * @brief Turns a sweep result table into one trace per (compartment, beta).
     */
    class TraceBuilder {
    public:
        /** @brief Deleted default constructor to enforce static utility class behavior. */
        TraceBuilder() = delete;

        /**
         * @brief Builds all traces of a complete sweep.
         *
         * Traces are ordered compartment-major (all betas of the first compartment, then all
         * betas of the second, ...), matching traceIndex().
         *
         * @throws InvalidResultException If the table is not complete.
         */
        static std::vector<Trace> buildTraces(const SweepResultTable& table);

        /**
         * @brief Index of the value in `beta_values` closest to `target`; ties go to the lower index.
         * @throws InvalidParameterException If `beta_values` is empty.
         */
        static int closestBetaIndex(const std::vector<double>& beta_values, double target);

        /** @brief Legend label for a state name ("S" -> "Susceptible"); unknown names are returned as-is. */
        static std::string displayName(const std::string& compartment);

        /** @brief Line colour for a state name. */
        static std::string compartmentColor(const std::string& compartment);
    };

} // namespace episweep

#endif // TRACE_BUILDER_HPP
