#ifndef FIGURE_HPP
#define FIGURE_HPP

#include "episweep/plotting/Trace.hpp"
#include <string>
#include <vector>

namespace episweep {

    /**
     * @struct SliderStep
     * @brief One slider position: shows one beta group and sets the title.
     */
    struct SliderStep {
        std::string label;    ///< beta rounded to two decimals
        double beta = 0.0;
        int group_index = 0;  ///< beta index whose traces become visible
        std::string title;    ///< figure title while this step is active
    };

    /**
     * @struct Figure
     * @brief All traces of a sweep plus the slider that selects one beta group at a time.
     *
     * Built by FigureAssembler::assemble, which guarantees that `traces` holds
     * `compartment_count * num_beta` traces in compartment-major order and that `steps`
     * holds one step per beta.
     */
    struct Figure {
        std::vector<double> time_axis;
        std::vector<Trace> traces;
        std::vector<SliderStep> steps;
        int num_beta = 0;
        int compartment_count = 0;
        int active_step = 0;
        std::string x_axis_title = "Time (days)";
        std::string y_axis_title = "Population";
        std::string slider_prefix = "β = ";

        /**
         * @brief Visibility vector for slider step `step`, computed with computeVisibility().
         * @throws OutOfRangeException If `step` is out of range.
         */
        std::vector<bool> visibilityForStep(int step) const;

        /** @brief Visibility vector of the initially selected step. */
        std::vector<bool> initialVisibility() const;

        /** @brief Title of the initially selected step. */
        const std::string& activeTitle() const;
    };

} // namespace episweep

#endif // FIGURE_HPP
