#ifndef DOPRI5_SOLVER_STRATEGY_HPP
#define DOPRI5_SOLVER_STRATEGY_HPP

#include "episweep/interfaces/IOdeSolverStrategy.hpp"

namespace episweep {

    /**
     * @brief ODE solver strategy using Boost.Odeint's Dormand-Prince 5(4) dense-output stepper.
     *
     * The stepper advances with adaptive step size control and the requested time points are
     * evaluated from the continuous interpolant of the current step, so the output grid does
     * not constrain the step size.
     */
    class Dopri5SolverStrategy : public IOdeSolverStrategy {
    public:
        /**
         * @brief Integrates the system and samples the dense solution at `times`.
         *
         * @throws SimulationException If Boost.Odeint reports an error (e.g. step size
         *         underflow or too many steps without progress).
         */
        void integrate(
            const SystemFunction& system,
            state_type& initial_state,
            const std::vector<double>& times,
            double dt_hint,
            Observer observer,
            double abs_error,
            double rel_error) const override;

        std::string name() const override { return "dopri5"; }
    };

} // namespace episweep

#endif // DOPRI5_SOLVER_STRATEGY_HPP
