#include "episweep/plotting/Figure.hpp"
#include "episweep/plotting/Visibility.hpp"
#include "exceptions/Exceptions.hpp"

namespace episweep {

    std::vector<bool> Figure::visibilityForStep(int step) const {
        if (step < 0 || step >= static_cast<int>(steps.size())) {
            THROW_OUT_OF_RANGE("Figure::visibilityForStep", "Step " + std::to_string(step) + " out of range [0, " +
                               std::to_string(steps.size()) + ").");
        }
        return computeVisibility(steps[step].group_index, num_beta, compartment_count);
    }

    std::vector<bool> Figure::initialVisibility() const {
        return visibilityForStep(active_step);
    }

    const std::string& Figure::activeTitle() const {
        if (active_step < 0 || active_step >= static_cast<int>(steps.size())) {
            THROW_OUT_OF_RANGE("Figure::activeTitle", "Active step " + std::to_string(active_step) + " out of range.");
        }
        return steps[active_step].title;
    }

} // namespace episweep
