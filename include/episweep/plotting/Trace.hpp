#ifndef TRACE_HPP
#define TRACE_HPP

#include <string>
#include <vector>

namespace episweep {

    /**
     * @struct Trace
     * @brief One plotted curve: a single compartment's trajectory for a single beta value.
     *
     * The x values are the figure's shared time axis; each trace owns its y values.
     * Visibility is not stored here, it is derived from the selected slider step.
     */
    struct Trace {
        std::string name;          ///< Legend label, e.g. "Infected"
        std::string compartment;   ///< State name, e.g. "I"
        std::string color;         ///< CSS colour of the line
        int compartment_index = 0; ///< Position of the compartment in the state vector
        int beta_index = 0;        ///< Position of beta in the sweep
        double beta = 0.0;
        std::vector<double> y;
    };

} // namespace episweep

#endif // TRACE_HPP
