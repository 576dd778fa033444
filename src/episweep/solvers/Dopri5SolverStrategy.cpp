#include "episweep/solvers/Dopri5SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <boost/numeric/odeint/integrate/integrate_times.hpp>
#include <boost/numeric/odeint/stepper/runge_kutta_dopri5.hpp>
#include <boost/numeric/odeint/stepper/generation.hpp>

namespace episweep {

namespace odeint = boost::numeric::odeint;

namespace {
    using dopri5_type = odeint::runge_kutta_dopri5<state_type>;
}

void Dopri5SolverStrategy::integrate(const SystemFunction& system,
                                     state_type& initial_state,
                                     const std::vector<double>& times,
                                     double dt_hint,
                                     Observer observer,
                                     double abs_error,
                                     double rel_error) const
{
    // Dense output interpolates to each requested time without shrinking the step.
    auto stepper = odeint::make_dense_output(abs_error, rel_error, dopri5_type());
    try {
        odeint::integrate_times(stepper, system, initial_state,
                                times.begin(), times.end(), dt_hint, observer);
    } catch (const ModelException&) {
        throw;
    } catch (const std::exception& e) {
        THROW_SIMULATION_ERROR("Dopri5SolverStrategy::integrate",
                               std::string("dopri5 integration failed: ") + e.what());
    }
}

} // namespace episweep
