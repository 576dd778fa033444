#ifndef MODEL_PARAMETERS_HPP
#define MODEL_PARAMETERS_HPP

#include "episweep/ModelConstants.hpp"

/**
 * @namespace episweep
 * @brief Compartmental model simulation over a sweep of transmission rates.
 */
namespace episweep {

/**
 * @struct SEIRParameters
 * @brief Parameters of the Susceptible-Exposed-Infected-Recovered model.
 */
struct SEIRParameters {
    /** @brief Total population size (constant, must be positive) */
    double N = constants::DEFAULT_POPULATION;

    /** @brief Transmission rate, the swept parameter */
    double beta = constants::DEFAULT_SELECTED_BETA;

    /** @brief Recovery rate (1 / infectious period) */
    double gamma = constants::DEFAULT_GAMMA;

    /** @brief Latent-activation rate (1 / incubation period) */
    double sigma = constants::DEFAULT_SIGMA;
};

/**
 * @struct SIRDParameters
 * @brief Parameters of the Susceptible-Infected-Recovered-Dead model.
 */
struct SIRDParameters {
    /** @brief Total population size (constant, must be positive) */
    double N = constants::DEFAULT_POPULATION;

    /** @brief Transmission rate, the swept parameter */
    double beta = constants::DEFAULT_SELECTED_BETA;

    /** @brief Recovery rate (1 / infectious period) */
    double gamma = constants::DEFAULT_GAMMA;

    /** @brief Fraction of those leaving Infected who die, in [0, 1] */
    double alpha = constants::DEFAULT_ALPHA;
};

} // namespace episweep

#endif // MODEL_PARAMETERS_HPP
