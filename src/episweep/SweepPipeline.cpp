#include "episweep/SweepPipeline.hpp"
#include "episweep/ModelFactory.hpp"
#include "episweep/plotting/FigureAssembler.hpp"
#include "episweep/plotting/HtmlExporter.hpp"
#include "episweep/plotting/TraceBuilder.hpp"
#include "episweep/solvers/Dopri5SolverStrategy.hpp"
#include "episweep/solvers/Rkf45SolverStrategy.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <chrono>

using namespace std::chrono;

namespace episweep {

    namespace {
        double secondsSince(const high_resolution_clock::time_point& start) {
            return duration_cast<duration<double>>(high_resolution_clock::now() - start).count();
        }
    }

    std::shared_ptr<IOdeSolverStrategy> SweepPipeline::makeSolver(const std::string& name) {
        if (name == "dopri5") return std::make_shared<Dopri5SolverStrategy>();
        if (name == "rkf45") return std::make_shared<Rkf45SolverStrategy>();
        THROW_INVALID_PARAM("SweepPipeline::makeSolver", "Unknown solver '" + name + "'. Expected 'dopri5' or 'rkf45'.");
    }

    SweepTimeOptions SweepPipeline::timeOptions(const SweepSettings& settings) {
        SweepTimeOptions options;
        options.start_time = settings.start_time;
        options.end_time = settings.end_time;
        options.num_tsteps = settings.num_tsteps;
        options.dt_hint = settings.dt_hint;
        options.abs_error = settings.abs_error;
        options.rel_error = settings.rel_error;
        return options;
    }

    PipelineOutput SweepPipeline::runSEIR(const SweepSettings& settings) {
        validateSweepSettings(settings);
        SEIRParameters base;
        base.N = settings.N;
        base.gamma = settings.gamma;
        base.sigma = settings.sigma;

        ParameterSweep::ModelBuilder builder = [base](double beta) -> std::shared_ptr<EpidemicModel> {
            SEIRParameters params = base;
            params.beta = beta;
            return ModelFactory::createSEIRModel(params);
        };
        return run(settings, "SEIR", builder,
                   ModelFactory::createInitialSEIRState(settings.N, settings.initial_infected),
                   ModelFactory::createSEIRModel(base)->getFixedParameters());
    }

    PipelineOutput SweepPipeline::runSIRD(const SweepSettings& settings) {
        validateSweepSettings(settings);
        SIRDParameters base;
        base.N = settings.N;
        base.gamma = settings.gamma;
        base.alpha = settings.alpha;

        ParameterSweep::ModelBuilder builder = [base](double beta) -> std::shared_ptr<EpidemicModel> {
            SIRDParameters params = base;
            params.beta = beta;
            return ModelFactory::createSIRDModel(params);
        };
        return run(settings, "SIRD", builder,
                   ModelFactory::createInitialSIRDState(settings.N, settings.initial_infected),
                   ModelFactory::createSIRDModel(base)->getFixedParameters());
    }

    PipelineOutput SweepPipeline::run(const SweepSettings& settings,
                                      const std::string& model_name,
                                      ParameterSweep::ModelBuilder builder,
                                      const Eigen::VectorXd& initial_state,
                                      const std::vector<std::pair<std::string, double>>& fixed_parameters)
    {
        Logger& logger = Logger::getInstance();
        const std::string source = "SweepPipeline::run(" + model_name + ")";
        const std::vector<double> betas = settings.beta_grid.values();
        // Loaded before the sweep so a missing bundle fails fast.
        const std::string plotly_tag = HtmlExporter::plotlyScriptTag(settings.plotly_js);
        logger.info(source, "Sweeping beta over [" + std::to_string(betas.front()) + ", " + std::to_string(betas.back()) +
                    "] (" + std::to_string(betas.size()) + " values).");

        auto start = high_resolution_clock::now();
        ParameterSweep sweep(builder, initial_state, betas, makeSolver(settings.solver), timeOptions(settings));
        SweepResultTable table = sweep.run();
        logger.info(source, "Sweep completed in " + std::to_string(secondsSince(start)) + " s.");

        start = high_resolution_clock::now();
        std::vector<Trace> traces = TraceBuilder::buildTraces(table);
        const int default_index = TraceBuilder::closestBetaIndex(table.betaValues(), settings.default_beta);
        Figure figure = FigureAssembler::assemble(table.timePoints(), std::move(traces), table.betaValues(),
                                                  table.numCompartments(), default_index,
                                                  model_name, fixed_parameters);
        logger.info(source, "Figure assembled with " + std::to_string(figure.traces.size()) + " traces in " +
                    std::to_string(secondsSince(start)) + " s; default beta " + figure.steps[default_index].label + ".");

        HtmlExporter::writeHtml(figure, settings.output_html, plotly_tag);

        std::vector<SweepSummary> summaries = SweepAnalyser::summarize(table);
        logger.info(source, "Lowest beta:  " + SweepAnalyser::describe(summaries.front()));
        logger.info(source, "Default beta: " + SweepAnalyser::describe(summaries[default_index]));
        logger.info(source, "Highest beta: " + SweepAnalyser::describe(summaries.back()));
        for (const SweepSummary& summary : summaries) {
            logger.debug(source, SweepAnalyser::describe(summary));
        }

        return PipelineOutput{std::move(table), std::move(figure), std::move(summaries), settings.output_html};
    }

} // namespace episweep
