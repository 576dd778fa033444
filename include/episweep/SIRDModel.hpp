#ifndef SIRD_MODEL_HPP
#define SIRD_MODEL_HPP

#include "EpidemicModel.hpp"
#include "parameters/ModelParameters.hpp"
#include "exceptions/Exceptions.hpp"
#include <vector>
#include <string>
#include <memory>

namespace episweep {

    class ModelFactory;

    /**
     * @class SIRDModel
     * @brief Deterministic Susceptible-Infected-Recovered-Dead model for a closed population.
     *
     * State layout is [S, I, R, D]. A fraction alpha of the flow out of I goes to D,
     * the rest to R:
     * - dS/dt = -beta*S*I/N
     * - dI/dt =  beta*S*I/N - gamma*I
     * - dR/dt =  (1-alpha)*gamma*I
     * - dD/dt =  alpha*gamma*I
     */
    class SIRDModel : public EpidemicModel {
    public:
        SIRDModel() = delete;

        /**
         * @brief Compute dS/dt, dI/dt, dR/dt, dD/dt.
         *
         * @throws episweep::InvalidParameterException If `state` or `derivatives` do not have 4 entries.
         */
        void computeDerivatives(const std::vector<double>& state,
                                std::vector<double>& derivatives,
                                double time) const override;

        int getStateSize() const override;
        std::vector<std::string> getStateNames() const override;
        std::string getModelName() const override;
        double getPopulationSize() const override;
        double getTransmissionRate() const override;

        /**
         * @brief Returns {("N", N), ("gamma", gamma), ("alpha", alpha)}.
         */
        std::vector<std::pair<std::string, double>> getFixedParameters() const override;

        double getRecoveryRate() const;
        double getMortalityFraction() const;
        const SIRDParameters& getParameters() const;

        /**
         * @brief Factory method to create a SIRDModel instance.
         *
         * @param[in] params Model parameters. N must be positive, beta and gamma non-negative, alpha in [0, 1].
         * @return std::shared_ptr<SIRDModel> Shared pointer to the created model instance.
         *
         * @throws episweep::ModelConstructionException If parameters are invalid.
         */
        static std::shared_ptr<SIRDModel> create(const SIRDParameters& params);

    private:
        explicit SIRDModel(const SIRDParameters& params);
        friend class episweep::ModelFactory;

        SIRDParameters params_;
    };

} // namespace episweep

#endif // SIRD_MODEL_HPP
