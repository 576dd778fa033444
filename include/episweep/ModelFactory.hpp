#ifndef MODEL_FACTORY
#define MODEL_FACTORY

#include "episweep/SEIRModel.hpp"
#include "episweep/SIRDModel.hpp"
#include "episweep/parameters/ModelParameters.hpp"
#include "exceptions/Exceptions.hpp"
#include <memory>
#include <Eigen/Dense>

namespace episweep {
    /**
     * @class ModelFactory
     * @brief Creates validated model instances and their initial state vectors.
     */
    class ModelFactory {
        public:
            /**
             * @brief Creates a SEIRModel.
             * @throws ModelConstructionException If the parameters are invalid.
             */
            static std::shared_ptr<SEIRModel> createSEIRModel(const SEIRParameters& params);

            /**
             * @brief Creates a SIRDModel.
             * @throws ModelConstructionException If the parameters are invalid.
             */
            static std::shared_ptr<SIRDModel> createSIRDModel(const SIRDParameters& params);

            /**
             * @brief Initial SEIR state: everyone susceptible except `initial_infected` infected.
             *
             * @param N Total population (positive).
             * @param initial_infected Number of initial cases, in (0, N].
             * @return Eigen::VectorXd [N - I0, 0, I0, 0].
             * @throws InvalidParameterException If N or I0 is out of range.
             */
            static Eigen::VectorXd createInitialSEIRState(double N, double initial_infected);

            /**
             * @brief Initial SIRD state: everyone susceptible except `initial_infected` infected.
             *
             * @return Eigen::VectorXd [N - I0, I0, 0, 0].
             * @throws InvalidParameterException If N or I0 is out of range.
             */
            static Eigen::VectorXd createInitialSIRDState(double N, double initial_infected);

        private:
            static void validateInitialCases(const std::string& caller, double N, double initial_infected);
    };
} // namespace episweep
#endif // MODEL_FACTORY
