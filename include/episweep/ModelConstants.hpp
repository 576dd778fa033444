#ifndef MODEL_CONSTANTS_HPP
#define MODEL_CONSTANTS_HPP

namespace episweep {
namespace constants {

    constexpr double DEFAULT_POPULATION = 330000000.0;
    constexpr double DEFAULT_GAMMA = 0.1;
    constexpr double DEFAULT_SIGMA = 0.2;
    constexpr double DEFAULT_ALPHA = 0.03;
    constexpr double DEFAULT_INITIAL_INFECTED = 1.0;

    constexpr double DEFAULT_BETA_START = 0.01;
    constexpr double DEFAULT_BETA_STOP = 1.0;
    constexpr double DEFAULT_BETA_STEP = 0.01;
    constexpr double DEFAULT_SELECTED_BETA = 0.5;

    constexpr double DEFAULT_START_TIME = 0.0;
    constexpr double DEFAULT_END_TIME = 365.0;
    constexpr int DEFAULT_NUM_TSTEPS = 730;

    constexpr double DEFAULT_DT_HINT = 0.1;
    constexpr double DEFAULT_ABS_ERROR = 1.0e-6;
    constexpr double DEFAULT_REL_ERROR = 1.0e-8;

    constexpr int NUM_COMPARTMENTS_SEIR = 4;
    constexpr int NUM_COMPARTMENTS_SIRD = 4;

    /// Slack in (stop - start) / step so that a stop on the grid is not lost to rounding.
    constexpr double BETA_GRID_TOLERANCE = 1e-9;

} // namespace constants
} // namespace episweep

#endif // MODEL_CONSTANTS_HPP
