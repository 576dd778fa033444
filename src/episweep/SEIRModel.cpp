#include "episweep/SEIRModel.hpp"
#include <cmath>

namespace episweep {

std::shared_ptr<SEIRModel> SEIRModel::create(const SEIRParameters& params) {
    if (!std::isfinite(params.N) || params.N <= 0) {
        throw ModelConstructionException("SEIRModel::create", "Population size N must be positive and finite. Got " + std::to_string(params.N) + ".");
    }
    if (!std::isfinite(params.beta) || !std::isfinite(params.gamma) || !std::isfinite(params.sigma)) {
        throw ModelConstructionException("SEIRModel::create", "Rates (beta, gamma, sigma) must be finite.");
    }
    if (params.beta < 0 || params.gamma < 0 || params.sigma < 0) {
        throw ModelConstructionException("SEIRModel::create", "Rates (beta, gamma, sigma) cannot be negative. Got beta=" +
                                         std::to_string(params.beta) + ", gamma=" + std::to_string(params.gamma) +
                                         ", sigma=" + std::to_string(params.sigma) + ".");
    }

    struct MakeSharedEnabler : public SEIRModel {
        explicit MakeSharedEnabler(const SEIRParameters& p) : SEIRModel(p) {}
    };
    return std::make_shared<MakeSharedEnabler>(params);
}

SEIRModel::SEIRModel(const SEIRParameters& params) : params_(params) {}

void SEIRModel::computeDerivatives(const std::vector<double>& state,
                                   std::vector<double>& derivatives,
                                   [[maybe_unused]] double time) const {
    checkVectorSizes(state, derivatives, "SEIRModel::computeDerivatives");

    const double S = state[0];
    const double E = state[1];
    const double I = state[2];

    const double infection = params_.beta * S * I / params_.N;
    const double activation = params_.sigma * E;
    const double recovery = params_.gamma * I;

    derivatives[0] = -infection;                 // dS/dt
    derivatives[1] = infection - activation;     // dE/dt
    derivatives[2] = activation - recovery;      // dI/dt
    derivatives[3] = recovery;                   // dR/dt
}

int SEIRModel::getStateSize() const {
    return constants::NUM_COMPARTMENTS_SEIR;
}

std::vector<std::string> SEIRModel::getStateNames() const {
    return {"S", "E", "I", "R"};
}

std::string SEIRModel::getModelName() const {
    return "SEIR";
}

double SEIRModel::getPopulationSize() const {
    return params_.N;
}

double SEIRModel::getTransmissionRate() const {
    return params_.beta;
}

std::vector<std::pair<std::string, double>> SEIRModel::getFixedParameters() const {
    return {{"N", params_.N}, {"gamma", params_.gamma}, {"sigma", params_.sigma}};
}

double SEIRModel::getRecoveryRate() const {
    return params_.gamma;
}

double SEIRModel::getLatentRate() const {
    return params_.sigma;
}

const SEIRParameters& SEIRModel::getParameters() const {
    return params_;
}

} // namespace episweep
