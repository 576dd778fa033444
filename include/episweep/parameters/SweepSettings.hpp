#ifndef SWEEP_SETTINGS_HPP
#define SWEEP_SETTINGS_HPP

#include "episweep/ModelConstants.hpp"
#include "episweep/parameters/ModelParameters.hpp"
#include <string>
#include <vector>

namespace episweep {

/**
 * @struct BetaGrid
 * @brief Inclusive, evenly spaced range of transmission rates.
 */
struct BetaGrid {
    double start = constants::DEFAULT_BETA_START;
    double stop = constants::DEFAULT_BETA_STOP;
    double step = constants::DEFAULT_BETA_STEP;

    /**
     * @brief Number of grid values, floor((stop - start) / step) + 1 (with a small tolerance).
     * @throws InvalidParameterException If the grid is invalid (see validate()).
     */
    int count() const;

    /**
     * @brief Grid values start + i * step for i in [0, count()), none above stop.
     *
     * The last value equals stop when the span is a whole number of steps.
     * @throws InvalidParameterException If the grid is invalid.
     */
    std::vector<double> values() const;

    /**
     * @brief Rejects non-finite bounds, negative start, stop < start and non-positive step.
     * @throws InvalidParameterException
     */
    void validate() const;
};

/**
 * @struct SweepSettings
 * @brief Everything one sweep pipeline needs: epidemiological constants, sweep grid,
 *        time grid, solver choice and output location.
 */
struct SweepSettings {
    double N = constants::DEFAULT_POPULATION;
    double gamma = constants::DEFAULT_GAMMA;
    double sigma = constants::DEFAULT_SIGMA;          ///< SEIR only
    double alpha = constants::DEFAULT_ALPHA;          ///< SIRD only
    double initial_infected = constants::DEFAULT_INITIAL_INFECTED;

    BetaGrid beta_grid;
    double default_beta = constants::DEFAULT_SELECTED_BETA;

    double start_time = constants::DEFAULT_START_TIME;
    double end_time = constants::DEFAULT_END_TIME;
    int num_tsteps = constants::DEFAULT_NUM_TSTEPS;

    double dt_hint = constants::DEFAULT_DT_HINT;
    double abs_error = constants::DEFAULT_ABS_ERROR;
    double rel_error = constants::DEFAULT_REL_ERROR;

    std::string solver = "dopri5";
    std::string output_html;
    std::string plotly_js = "data/js/plotly.min.js";  ///< Bundle inlined into the page, or "cdn"
    std::string log_level = "info";
    std::string log_file;                              ///< Empty: console only
};

/** @brief Defaults for the SEIR pipeline (writes seir-graph.html). */
SweepSettings defaultSEIRSettings();

/** @brief Defaults for the SIRD pipeline (writes sird-graph.html). */
SweepSettings defaultSIRDSettings();

/**
 * @brief Checks a settings object for consistency before any integration starts.
 *
 * @throws InvalidParameterException On non-positive N, negative rates, alpha outside [0, 1],
 *         initial infected outside (0, N], an invalid beta grid, a non-positive horizon,
 *         fewer than 2 samples, a non-positive step hint, invalid tolerances, an unknown
 *         solver name, or an empty output path or plotly_js setting.
 */
void validateSweepSettings(const SweepSettings& settings);

} // namespace episweep

#endif // SWEEP_SETTINGS_HPP
