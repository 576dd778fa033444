#ifndef VISIBILITY_HPP
#define VISIBILITY_HPP

#include <vector>

namespace episweep {

    /**
     * @brief Visibility of every trace when beta group `selected` is shown.
     *
     * Traces are laid out compartment-major, so the result has `compartment_count * num_beta`
     * entries and is true exactly at `selected + k * num_beta` for k in [0, compartment_count).
     *
     * @throws InvalidParameterException If `num_beta` or `compartment_count` is not positive.
     * @throws OutOfRangeException If `selected` is not in [0, num_beta).
     */
    std::vector<bool> computeVisibility(int selected, int num_beta, int compartment_count);

    /**
     * @brief Index of trace (compartment, beta) in the compartment-major layout.
     */
    inline int traceIndex(int compartment_index, int beta_index, int num_beta) {
        return compartment_index * num_beta + beta_index;
    }

} // namespace episweep

#endif // VISIBILITY_HPP
