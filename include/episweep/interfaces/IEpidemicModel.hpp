#ifndef I_EPIDEMIC_MODEL_H
#define I_EPIDEMIC_MODEL_H

#include <vector>
#include <string>
#include <utility>

namespace episweep {

/**
 * @class IEpidemicModel
 * @brief A closed-population compartmental model with constant rates.
 */
class IEpidemicModel {
public:
    virtual ~IEpidemicModel() = default;

    /**
     * @brief Right-hand side of the ODE system.
     *
     * @param state Compartment values in getStateNames() order.
     * @param derivatives Output, pre-sized to getStateSize().
     * @param time Current time; the models here are autonomous.
     * @throws InvalidParameterException If either vector has the wrong size.
     */
    virtual void computeDerivatives(const std::vector<double>& state,
                                    std::vector<double>& derivatives,
                                    double time) const = 0;

    virtual int getStateSize() const = 0;

    /** @brief Compartment symbols, e.g. {"S", "E", "I", "R"}. */
    virtual std::vector<std::string> getStateNames() const = 0;

    /** @brief Short name used in titles and log messages, e.g. "SEIR". */
    virtual std::string getModelName() const = 0;

    virtual double getPopulationSize() const = 0;

    /** @brief The swept parameter beta. */
    virtual double getTransmissionRate() const = 0;

    /** @brief Parameters held fixed across the sweep, as (name, value) pairs in display order. */
    virtual std::vector<std::pair<std::string, double>> getFixedParameters() const = 0;
};

} // namespace episweep

#endif // I_EPIDEMIC_MODEL_H
