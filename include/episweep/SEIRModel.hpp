#ifndef SEIR_MODEL_HPP
#define SEIR_MODEL_HPP

#include "EpidemicModel.hpp"
#include "parameters/ModelParameters.hpp"
#include "exceptions/Exceptions.hpp"
#include <vector>
#include <string>
#include <memory>

namespace episweep {

    class ModelFactory;

    /**
     * @class SEIRModel
     * @brief Deterministic Susceptible-Exposed-Infected-Recovered model for a closed population.
     *
     * State layout is [S, E, I, R]. The system is
     * - dS/dt = -beta*S*I/N
     * - dE/dt =  beta*S*I/N - sigma*E
     * - dI/dt =  sigma*E - gamma*I
     * - dR/dt =  gamma*I
     *
     * The derivatives sum to zero, so S+E+I+R stays equal to N.
     * Instances are immutable once created; a sweep builds one model per beta.
     */
    class SEIRModel : public EpidemicModel {
    public:
        SEIRModel() = delete;

        /**
         * @brief Compute dS/dt, dE/dt, dI/dt, dR/dt.
         *
         * @param[in] state Current state vector [S, E, I, R].
         * @param[out] derivatives Output vector of size 4.
         * @param[in] time Current simulation time (unused, the system is autonomous).
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
         * @brief Returns {("N", N), ("gamma", gamma), ("sigma", sigma)}.
         */
        std::vector<std::pair<std::string, double>> getFixedParameters() const override;

        /** @brief Recovery rate gamma. */
        double getRecoveryRate() const;

        /** @brief Latent-activation rate sigma. */
        double getLatentRate() const;

        /** @brief Copy of the parameters the model was built with. */
        const SEIRParameters& getParameters() const;

        /**
         * @brief Factory method to create a SEIRModel instance.
         *
         * @param[in] params Model parameters. N must be positive and finite, beta, gamma and sigma non-negative and finite.
         * @return std::shared_ptr<SEIRModel> Shared pointer to the created model instance.
         *
         * @throws episweep::ModelConstructionException If parameters are invalid.
         */
        static std::shared_ptr<SEIRModel> create(const SEIRParameters& params);

    private:
        explicit SEIRModel(const SEIRParameters& params);
        friend class episweep::ModelFactory;

        SEIRParameters params_;
    };

} // namespace episweep

#endif // SEIR_MODEL_HPP
