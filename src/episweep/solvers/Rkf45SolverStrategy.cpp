#include "episweep/solvers/Rkf45SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <exception>
#include <memory>
#include <gsl/gsl_errno.h>
#include <gsl/gsl_odeiv2.h>

namespace episweep {

namespace {

    struct GslSystemContext {
        const IOdeSolverStrategy::SystemFunction* system;
        state_type x;
        state_type dxdt;
        std::exception_ptr error;
    };

    int sys_function(double t, const double y[], double f[], void* params) {
        GslSystemContext* ctx = static_cast<GslSystemContext*>(params);
        try {
            std::copy(y, y + ctx->x.size(), ctx->x.begin());
            (*ctx->system)(ctx->x, ctx->dxdt, t);
            std::copy(ctx->dxdt.begin(), ctx->dxdt.end(), f);
        } catch (...) {
            // GSL is C code; the exception is rethrown once the driver returns.
            ctx->error = std::current_exception();
            return GSL_EBADFUNC;
        }
        return GSL_SUCCESS;
    }

    // GSL aborts on internal errors unless its handler is switched off.
    class ScopedGslErrorHandlerOff {
    public:
        ScopedGslErrorHandlerOff() : previous_(gsl_set_error_handler_off()) {}
        ~ScopedGslErrorHandlerOff() { gsl_set_error_handler(previous_); }
        ScopedGslErrorHandlerOff(const ScopedGslErrorHandlerOff&) = delete;
        ScopedGslErrorHandlerOff& operator=(const ScopedGslErrorHandlerOff&) = delete;
    private:
        gsl_error_handler_t* previous_;
    };

} // namespace

Rkf45SolverStrategy::Rkf45SolverStrategy(unsigned long max_steps) : max_steps_(max_steps) {
    if (max_steps_ == 0) {
        THROW_INVALID_PARAM("Rkf45SolverStrategy::Rkf45SolverStrategy", "Maximum step count must be positive.");
    }
}

void Rkf45SolverStrategy::integrate(
    const SystemFunction& system,
    state_type& initial_state,
    const std::vector<double>& times,
    double dt_hint,
    Observer observer,
    double abs_error,
    double rel_error) const
{
    if (times.empty()) {
        THROW_INVALID_PARAM("Rkf45SolverStrategy::integrate", "Output time points vector cannot be empty.");
    }

    ScopedGslErrorHandlerOff handler_guard;

    GslSystemContext ctx{&system, state_type(initial_state.size()), state_type(initial_state.size()), nullptr};
    gsl_odeiv2_system sys = { sys_function, nullptr, initial_state.size(), &ctx };

    std::unique_ptr<gsl_odeiv2_driver, decltype(&gsl_odeiv2_driver_free)> driver(
        gsl_odeiv2_driver_alloc_y_new(&sys, gsl_odeiv2_step_rkf45, dt_hint, abs_error, rel_error),
        &gsl_odeiv2_driver_free);
    if (!driver) {
        throw SimulationException("Rkf45SolverStrategy::integrate", "Failed to allocate GSL driver.");
    }
    gsl_odeiv2_driver_set_nmax(driver.get(), max_steps_);

    double t = times.front();
    observer(initial_state, t);

    for (size_t i = 1; i < times.size(); ++i) {
        int status = gsl_odeiv2_driver_apply(driver.get(), &t, times[i], initial_state.data());
        if (ctx.error) {
            std::rethrow_exception(ctx.error);
        }
        if (status != GSL_SUCCESS) {
            throw SimulationException("Rkf45SolverStrategy::integrate",
                                      "GSL solver failed with code " + std::to_string(status) + " (" +
                                      gsl_strerror(status) + ") at t = " + std::to_string(t) + ".");
        }
        observer(initial_state, times[i]);
    }
}

} // namespace episweep
