#ifndef I_ODE_SOLVER_STRATEGY_HPP
#define I_ODE_SOLVER_STRATEGY_HPP

#include "../SimulationResult.hpp"
#include <functional>
#include <string>
#include <vector>

namespace episweep {

/**
 * @brief Pluggable integrator used by Simulator.
 *
 * Implementations must call the observer exactly once per requested time, in order,
 * with the solution interpolated or stepped to that time.
 */
class IOdeSolverStrategy {
public:
    using SystemFunction = std::function<void(const state_type&, state_type&, double)>;
    using Observer = std::function<void(const state_type&, double)>;

    virtual ~IOdeSolverStrategy() = default;

    /**
     * @param system Right-hand side dxdt = f(x, t).
     * @param state Initial state on entry; overwritten while integrating.
     * @param times Output times, strictly increasing. times.front() is the start time.
     * @param dt_hint Initial step size.
     * @param observer Receives (state, t) for every entry of @p times.
     * @param abs_error Absolute tolerance.
     * @param rel_error Relative tolerance.
     * @throws SimulationException If integration fails.
     */
    virtual void integrate(const SystemFunction& system,
                           state_type& state,
                           const std::vector<double>& times,
                           double dt_hint,
                           Observer observer,
                           double abs_error,
                           double rel_error) const = 0;

    virtual std::string name() const = 0;
};

} // namespace episweep

#endif // I_ODE_SOLVER_STRATEGY_HPP
