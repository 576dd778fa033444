#include "exceptions/Exceptions.hpp"
#include "episweep/ModelFactory.hpp"
#include <cmath>

namespace episweep {

    std::shared_ptr<SEIRModel> ModelFactory::createSEIRModel(const SEIRParameters& params)
    {
        try {
            return SEIRModel::create(params);
        } catch (const ModelConstructionException&) {
            throw;
        } catch (const std::exception& e) {
            throw ModelConstructionException("ModelFactory::createSEIRModel", "Unexpected error during SEIRModel creation: " + std::string(e.what()));
        }
    }

    std::shared_ptr<SIRDModel> ModelFactory::createSIRDModel(const SIRDParameters& params)
    {
        try {
            return SIRDModel::create(params);
        } catch (const ModelConstructionException&) {
            throw;
        } catch (const std::exception& e) {
            throw ModelConstructionException("ModelFactory::createSIRDModel", "Unexpected error during SIRDModel creation: " + std::string(e.what()));
        }
    }

    void ModelFactory::validateInitialCases(const std::string& caller, double N, double initial_infected)
    {
        if (!std::isfinite(N) || N <= 0) {
            THROW_INVALID_PARAM(caller, "Population size must be positive. Got " + std::to_string(N) + ".");
        }
        if (!std::isfinite(initial_infected) || initial_infected <= 0 || initial_infected > N) {
            THROW_INVALID_PARAM(caller, "Initial infected count must be in (0, N]. Got " + std::to_string(initial_infected) + ".");
        }
    }

    Eigen::VectorXd ModelFactory::createInitialSEIRState(double N, double initial_infected)
    {
        validateInitialCases("ModelFactory::createInitialSEIRState", N, initial_infected);
        Eigen::VectorXd state(constants::NUM_COMPARTMENTS_SEIR);
        state << N - initial_infected, 0.0, initial_infected, 0.0;
        return state;
    }

    Eigen::VectorXd ModelFactory::createInitialSIRDState(double N, double initial_infected)
    {
        validateInitialCases("ModelFactory::createInitialSIRDState", N, initial_infected);
        Eigen::VectorXd state(constants::NUM_COMPARTMENTS_SIRD);
        state << N - initial_infected, initial_infected, 0.0, 0.0;
        return state;
    }

} // namespace episweep
