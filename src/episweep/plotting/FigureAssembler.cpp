#include "episweep/plotting/FigureAssembler.hpp"
#include "episweep/plotting/Visibility.hpp"
#include "exceptions/Exceptions.hpp"
#include "utils/Logger.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>
#include <utility>

namespace episweep {

    Figure FigureAssembler::assemble(const std::vector<double>& time_axis,
                                     std::vector<Trace> traces,
                                     const std::vector<double>& beta_values,
                                     int compartment_count,
                                     int default_index,
                                     const std::string& model_name,
                                     const std::vector<std::pair<std::string, double>>& fixed_parameters)
    {
        const int num_beta = static_cast<int>(beta_values.size());
        if (num_beta == 0 || compartment_count <= 0) {
            throw FigureConstructionException("FigureAssembler::assemble", "A figure needs at least one beta value and one compartment.");
        }
        const size_t expected = static_cast<size_t>(num_beta) * compartment_count;
        if (traces.size() != expected) {
            throw FigureConstructionException("FigureAssembler::assemble",
                                              "Got " + std::to_string(traces.size()) + " traces for " + std::to_string(num_beta) +
                                              " slider steps of " + std::to_string(compartment_count) +
                                              " compartments; expected " + std::to_string(expected) + ".");
        }
        if (default_index < 0 || default_index >= num_beta) {
            throw FigureConstructionException("FigureAssembler::assemble",
                                              "Default step " + std::to_string(default_index) + " out of range [0, " +
                                              std::to_string(num_beta) + ").");
        }
        for (size_t i = 0; i < traces.size(); ++i) {
            const Trace& trace = traces[i];
            if (trace.compartment_index < 0 || trace.compartment_index >= compartment_count ||
                trace.beta_index < 0 || trace.beta_index >= num_beta ||
                traceIndex(trace.compartment_index, trace.beta_index, num_beta) != static_cast<int>(i)) {
                throw FigureConstructionException("FigureAssembler::assemble",
                                                  "Trace " + std::to_string(i) + " (" + trace.name + ", beta index " +
                                                  std::to_string(trace.beta_index) + ") is out of compartment-major order.");
            }
            if (trace.y.size() != time_axis.size()) {
                throw FigureConstructionException("FigureAssembler::assemble",
                                                  "Trace " + std::to_string(i) + " has " + std::to_string(trace.y.size()) +
                                                  " points; the time axis has " + std::to_string(time_axis.size()) + ".");
            }
        }

        Figure figure;
        figure.time_axis = time_axis;
        figure.traces = std::move(traces);
        figure.num_beta = num_beta;
        figure.compartment_count = compartment_count;
        figure.active_step = default_index;
        figure.steps.reserve(num_beta);
        for (int b = 0; b < num_beta; ++b) {
            SliderStep step;
            step.label = formatStepLabel(beta_values[b]);
            step.beta = beta_values[b];
            step.group_index = b;
            step.title = buildTitle(model_name, beta_values[b], fixed_parameters);
            figure.steps.push_back(step);
        }

        Logger::getInstance().debug("FigureAssembler::assemble",
                                    std::to_string(figure.traces.size()) + " traces, " + std::to_string(figure.steps.size()) +
                                    " slider steps, default step " + figure.steps[default_index].label + ".");
        return figure;
    }

    std::string FigureAssembler::formatStepLabel(double beta) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(2) << beta;
        return oss.str();
    }

    std::string FigureAssembler::buildTitle(const std::string& model_name,
                                            double beta,
                                            const std::vector<std::pair<std::string, double>>& fixed_parameters)
    {
        std::ostringstream oss;
        oss << model_name << " model, " << parameterSymbol("beta") << " = " << formatStepLabel(beta);
        if (!fixed_parameters.empty()) {
            oss << " (";
            for (size_t i = 0; i < fixed_parameters.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << parameterSymbol(fixed_parameters[i].first) << " = " << formatParameterValue(fixed_parameters[i].second);
            }
            oss << ")";
        }
        return oss.str();
    }

    std::string FigureAssembler::parameterSymbol(const std::string& name) {
        if (name == "beta") return "β";
        if (name == "gamma") return "γ";
        if (name == "sigma") return "σ";
        if (name == "alpha") return "α";
        return name;
    }

    std::string FigureAssembler::formatParameterValue(double value) {
        std::ostringstream oss;
        if (std::isfinite(value) && value == std::floor(value) && std::abs(value) < 1e15) {
            oss << std::fixed << std::setprecision(0) << value;
        } else {
            oss << std::setprecision(6) << value;
        }
        return oss.str();
    }

} // namespace episweep
