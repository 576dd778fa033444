#include "episweep/EpidemicModel.hpp"
#include "exceptions/Exceptions.hpp"

namespace episweep {

    int EpidemicModel::getCompartmentIndex(const std::string& name) const {
        const std::vector<std::string> names = getStateNames();
        for (size_t i = 0; i < names.size(); ++i) {
            if (names[i] == name) {
                return static_cast<int>(i);
            }
        }
        THROW_INVALID_PARAM("EpidemicModel::getCompartmentIndex",
                            "Model " + getModelName() + " has no compartment named '" + name + "'.");
    }

    void EpidemicModel::checkVectorSizes(const std::vector<double>& state,
                                         const std::vector<double>& derivatives,
                                         const std::string& caller) const {
        const size_t expected = static_cast<size_t>(getStateSize());
        if (state.size() != expected || derivatives.size() != expected) {
            THROW_INVALID_PARAM(caller, "State or derivative vector size mismatch. Expected " + std::to_string(expected) +
                                ", got state=" + std::to_string(state.size()) +
                                ", derivatives=" + std::to_string(derivatives.size()) + ".");
        }
    }

} // namespace episweep
