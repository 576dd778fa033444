#ifndef FIGURE_ASSEMBLER_HPP
#define FIGURE_ASSEMBLER_HPP

#include "episweep/plotting/Figure.hpp"
#include <string>
#include <utility>
#include <vector>

namespace episweep {

    /**
     * @class FigureAssembler
     * @brief Combines the traces of a sweep into a Figure with a beta slider.
     */
    class FigureAssembler {
    public:
        FigureAssembler() = delete;

        /**
         * @brief Assembles the figure.
         *
         * @param time_axis Shared x values of every trace.
         * @param traces Traces in compartment-major order (see traceIndex()).
         * @param beta_values Swept beta values, one slider step each.
         * @param compartment_count Number of compartments per beta group.
         * @param default_index Beta index shown initially.
         * @param model_name Model name used in the title (e.g. "SEIR").
         * @param fixed_parameters Non-swept parameters embedded in every step's title.
         *
         * @throws FigureConstructionException If the number of traces is not
         *         `compartment_count * beta_values.size()`, a trace is out of place in the
         *         compartment-major layout, a trace's length differs from the time axis, or
         *         `default_index` is out of range.
         */
        static Figure assemble(const std::vector<double>& time_axis,
                               std::vector<Trace> traces,
                               const std::vector<double>& beta_values,
                               int compartment_count,
                               int default_index,
                               const std::string& model_name,
                               const std::vector<std::pair<std::string, double>>& fixed_parameters);

        /** @brief beta rounded to two decimals, e.g. 0.5 -> "0.50". */
        static std::string formatStepLabel(double beta);

        /**
         * @brief Title for one slider step, e.g.
         *        "SEIR model, β = 0.50 (N = 330000000, γ = 0.1, σ = 0.2)".
         */
        static std::string buildTitle(const std::string& model_name,
                                      double beta,
                                      const std::vector<std::pair<std::string, double>>& fixed_parameters);

        /** @brief Greek letter for a parameter name ("gamma" -> "γ"); other names unchanged. */
        static std::string parameterSymbol(const std::string& name);

        /** @brief Compact value formatting: integers without decimals, others with up to 6 significant digits. */
        static std::string formatParameterValue(double value);
    };

} // namespace episweep

#endif // FIGURE_ASSEMBLER_HPP
