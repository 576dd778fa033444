#ifndef EPIDEMIC_MODEL_H
#define EPIDEMIC_MODEL_H

#include <vector>
#include <string>
#include "interfaces/IEpidemicModel.hpp"

namespace episweep {

/**
 * @class EpidemicModel
 * @brief Base of the concrete models; callable as an ODE right-hand side.
 */
class EpidemicModel : public IEpidemicModel {
public:
    virtual ~EpidemicModel() = default;

    /** @brief dxdt = f(x, t), the signature Boost.Odeint and the GSL adapter call. */
    void operator()(const std::vector<double>& x, std::vector<double>& dxdt, double t) const {
        computeDerivatives(x, dxdt, t);
    }

    /** @throws InvalidParameterException If the model has no compartment called @p name. */
    int getCompartmentIndex(const std::string& name) const;

protected:
    EpidemicModel() = default;

    void checkVectorSizes(const std::vector<double>& state,
                          const std::vector<double>& derivatives,
                          const std::string& caller) const;
};

} // namespace episweep
#endif // EPIDEMIC_MODEL_H
