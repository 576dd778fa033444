#ifndef RKF45_SOLVER_STRATEGY_HPP
#define RKF45_SOLVER_STRATEGY_HPP

#include "episweep/interfaces/IOdeSolverStrategy.hpp"

namespace episweep {

    /**
     * @brief ODE solver strategy using the GSL odeiv2 driver with the Runge-Kutta-Fehlberg (4, 5) stepper.
     *
     * The driver is advanced from one requested time point to the next; its adaptive steps are
     * truncated to land exactly on each output time.
     */
    class Rkf45SolverStrategy : public IOdeSolverStrategy {
    public:
        /**
         * @param max_steps Maximum number of driver steps between two output points
         *                  before the integration is reported as failed.
         */
        explicit Rkf45SolverStrategy(unsigned long max_steps = 100000);

        /**
         * @throws SimulationException If the GSL driver returns an error status, or rethrows the
         *         exception raised by `system`.
         */
        void integrate(
            const SystemFunction& system,
            state_type& initial_state,
            const std::vector<double>& times,
            double dt_hint,
            Observer observer,
            double abs_error,
            double rel_error) const override;

        std::string name() const override { return "rkf45"; }

    private:
        unsigned long max_steps_;
    };

} // namespace episweep

#endif // RKF45_SOLVER_STRATEGY_HPP
