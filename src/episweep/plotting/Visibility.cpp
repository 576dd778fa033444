#include "episweep/plotting/Visibility.hpp"
#include "exceptions/Exceptions.hpp"
#include <string>

namespace episweep {

    std::vector<bool> computeVisibility(int selected, int num_beta, int compartment_count) {
        if (num_beta <= 0 || compartment_count <= 0) {
            THROW_INVALID_PARAM("computeVisibility", "Beta and compartment counts must be positive. Got num_beta=" +
                                std::to_string(num_beta) + ", compartment_count=" + std::to_string(compartment_count) + ".");
        }
        if (selected < 0 || selected >= num_beta) {
            THROW_OUT_OF_RANGE("computeVisibility", "Selected group " + std::to_string(selected) +
                               " out of range [0, " + std::to_string(num_beta) + ").");
        }
        std::vector<bool> visible(static_cast<size_t>(num_beta) * compartment_count, false);
        for (int c = 0; c < compartment_count; ++c) {
            visible[traceIndex(c, selected, num_beta)] = true;
        }
        return visible;
    }

} // namespace episweep
