#include "episweep/SIRDModel.hpp"
#include <cmath>

namespace episweep {

std::shared_ptr<SIRDModel> SIRDModel::create(const SIRDParameters& params) {
    if (!std::isfinite(params.N) || params.N <= 0) {
        throw ModelConstructionException("SIRDModel::create", "Population size N must be positive and finite. Got " + std::to_string(params.N) + ".");
    }
    if (!std::isfinite(params.beta) || !std::isfinite(params.gamma) || !std::isfinite(params.alpha)) {
        throw ModelConstructionException("SIRDModel::create", "Parameters (beta, gamma, alpha) must be finite.");
    }
    if (params.beta < 0 || params.gamma < 0) {
        throw ModelConstructionException("SIRDModel::create", "Rates (beta, gamma) cannot be negative. Got beta=" +
                                         std::to_string(params.beta) + ", gamma=" + std::to_string(params.gamma) + ".");
    }
    if (params.alpha < 0 || params.alpha > 1) {
        throw ModelConstructionException("SIRDModel::create", "Mortality fraction alpha must be between 0 and 1. Got " +
                                         std::to_string(params.alpha) + ".");
    }

    struct MakeSharedEnabler : public SIRDModel {
        explicit MakeSharedEnabler(const SIRDParameters& p) : SIRDModel(p) {}
    };
    return std::make_shared<MakeSharedEnabler>(params);
}

SIRDModel::SIRDModel(const SIRDParameters& params) : params_(params) {}

void SIRDModel::computeDerivatives(const std::vector<double>& state,
                                   std::vector<double>& derivatives,
                                   [[maybe_unused]] double time) const {
    checkVectorSizes(state, derivatives, "SIRDModel::computeDerivatives");

    const double S = state[0];
    const double I = state[1];

    const double infection = params_.beta * S * I / params_.N;
    const double removal = params_.gamma * I;

    derivatives[0] = -infection;
    derivatives[1] = infection - removal;
    derivatives[2] = (1.0 - params_.alpha) * removal;
    derivatives[3] = params_.alpha * removal;
}

int SIRDModel::getStateSize() const {
    return constants::NUM_COMPARTMENTS_SIRD;
}

std::vector<std::string> SIRDModel::getStateNames() const {
    return {"S", "I", "R", "D"};
}

std::string SIRDModel::getModelName() const {
    return "SIRD";
}

double SIRDModel::getPopulationSize() const {
    return params_.N;
}

double SIRDModel::getTransmissionRate() const {
    return params_.beta;
}

std::vector<std::pair<std::string, double>> SIRDModel::getFixedParameters() const {
    return {{"N", params_.N}, {"gamma", params_.gamma}, {"alpha", params_.alpha}};
}

double SIRDModel::getRecoveryRate() const {
    return params_.gamma;
}

double SIRDModel::getMortalityFraction() const {
    return params_.alpha;
}

const SIRDParameters& SIRDModel::getParameters() const {
    return params_;
}

} // namespace episweep
