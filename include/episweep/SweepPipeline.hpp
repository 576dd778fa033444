#ifndef SWEEP_PIPELINE_HPP
#define SWEEP_PIPELINE_HPP

#include "ParameterSweep.hpp"
#include "SweepAnalyser.hpp"
#include "SweepResultTable.hpp"
#include "interfaces/IOdeSolverStrategy.hpp"
#include "parameters/SweepSettings.hpp"
#include "plotting/Figure.hpp"
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace episweep {

    /**
     * @struct PipelineOutput
     * @brief Everything one pipeline run produced.
     */
    struct PipelineOutput {
        SweepResultTable table;
        Figure figure;
        std::vector<SweepSummary> summaries;
        std::string output_path;
    };

    /**
     * @class SweepPipeline
     * @brief Runs a full sweep: integration, trace building, figure assembly and HTML export.
     *
     * The stages run strictly one after another; the figure is only exported once the
     * sweep has produced a complete table.
     */
    class SweepPipeline {
    public:
        SweepPipeline() = delete;

        /**
         * @brief SEIR sweep from (N - I0, 0, I0, 0).
         * @throws InvalidParameterException, ModelConstructionException before any integration on bad settings.
         * @throws SimulationException If any integration fails.
         * @throws FigureConstructionException, FileIOException From figure assembly and export.
         */
        static PipelineOutput runSEIR(const SweepSettings& settings);

        /**
         * @brief SIRD sweep from (N - I0, I0, 0, 0).
         * @throws Same as runSEIR().
         */
        static PipelineOutput runSIRD(const SweepSettings& settings);

        /**
         * @brief Solver strategy for a configured name ("dopri5" or "rkf45").
         * @throws InvalidParameterException For unknown names.
         */
        static std::shared_ptr<IOdeSolverStrategy> makeSolver(const std::string& name);

        /** @brief Integration options taken from the settings. */
        static SweepTimeOptions timeOptions(const SweepSettings& settings);

    private:
        static PipelineOutput run(const SweepSettings& settings,
                                  const std::string& model_name,
                                  ParameterSweep::ModelBuilder builder,
                                  const Eigen::VectorXd& initial_state,
                                  const std::vector<std::pair<std::string, double>>& fixed_parameters);
    };

} // namespace episweep

#endif // SWEEP_PIPELINE_HPP
