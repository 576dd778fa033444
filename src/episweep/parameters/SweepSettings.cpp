#include "episweep/parameters/SweepSettings.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <cmath>

namespace episweep {

void BetaGrid::validate() const {
    if (!std::isfinite(start) || !std::isfinite(stop) || !std::isfinite(step)) {
        THROW_INVALID_PARAM("BetaGrid::validate", "Beta grid bounds and step must be finite.");
    }
    if (start < 0) {
        THROW_INVALID_PARAM("BetaGrid::validate", "Beta grid start cannot be negative. Got " + std::to_string(start) + ".");
    }
    if (stop < start) {
        THROW_INVALID_PARAM("BetaGrid::validate", "Beta grid stop (" + std::to_string(stop) +
                            ") must not be below start (" + std::to_string(start) + ").");
    }
    if (step <= 0) {
        THROW_INVALID_PARAM("BetaGrid::validate", "Beta grid step must be positive. Got " + std::to_string(step) + ".");
    }
}

int BetaGrid::count() const {
    validate();
    // Values past stop are dropped, so the grid never overshoots its upper bound.
    return static_cast<int>(std::floor((stop - start) / step + constants::BETA_GRID_TOLERANCE)) + 1;
}

std::vector<double> BetaGrid::values() const {
    const int n = count();
    std::vector<double> betas(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        // Rounded to 1e-12 so that e.g. 0.01 + 49 * 0.01 compares equal to 0.5.
        betas[i] = std::min(std::round((start + step * i) * 1e12) / 1e12, stop);
    }
    return betas;
}

SweepSettings defaultSEIRSettings() {
    SweepSettings settings;
    settings.output_html = "seir-graph.html";
    return settings;
}

SweepSettings defaultSIRDSettings() {
    SweepSettings settings;
    settings.output_html = "sird-graph.html";
    return settings;
}

void validateSweepSettings(const SweepSettings& settings) {
    const std::string fn = "validateSweepSettings";
    if (!std::isfinite(settings.N) || settings.N <= 0) {
        THROW_INVALID_PARAM(fn, "Population size N must be positive. Got " + std::to_string(settings.N) + ".");
    }
    if (!(settings.gamma >= 0) || !(settings.sigma >= 0)) {
        THROW_INVALID_PARAM(fn, "Rates gamma and sigma cannot be negative.");
    }
    if (!(settings.alpha >= 0 && settings.alpha <= 1)) {
        THROW_INVALID_PARAM(fn, "Mortality fraction alpha must be between 0 and 1. Got " + std::to_string(settings.alpha) + ".");
    }
    if (!(settings.initial_infected > 0 && settings.initial_infected <= settings.N)) {
        THROW_INVALID_PARAM(fn, "Initial infected count must be in (0, N]. Got " + std::to_string(settings.initial_infected) + ".");
    }
    settings.beta_grid.validate();
    if (!std::isfinite(settings.default_beta)) {
        THROW_INVALID_PARAM(fn, "Default beta must be finite.");
    }
    if (!std::isfinite(settings.start_time) || !std::isfinite(settings.end_time) ||
        settings.end_time <= settings.start_time) {
        THROW_INVALID_PARAM(fn, "Simulation end time must be greater than start time.");
    }
    if (settings.num_tsteps < 2) {
        THROW_INVALID_PARAM(fn, "At least two time samples are required. Got " + std::to_string(settings.num_tsteps) + ".");
    }
    if (!(settings.dt_hint > 0)) {
        THROW_INVALID_PARAM(fn, "Step size hint must be positive.");
    }
    if (settings.abs_error < 0 || settings.rel_error < 0 || (settings.abs_error == 0 && settings.rel_error == 0)) {
        THROW_INVALID_PARAM(fn, "Error tolerances must be non-negative and not both zero.");
    }
    if (settings.solver != "dopri5" && settings.solver != "rkf45") {
        THROW_INVALID_PARAM(fn, "Unknown solver '" + settings.solver + "'. Expected 'dopri5' or 'rkf45'.");
    }
    if (settings.output_html.empty()) {
        THROW_INVALID_PARAM(fn, "Output path cannot be empty.");
    }
    if (settings.plotly_js.empty()) {
        THROW_INVALID_PARAM(fn, "plotly_js must name a plotly.js bundle or be 'cdn'.");
    }
}

} // namespace episweep
