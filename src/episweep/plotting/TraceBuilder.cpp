#include "episweep/plotting/TraceBuilder.hpp"
#include "episweep/plotting/Visibility.hpp"
#include "exceptions/Exceptions.hpp"
#include <cmath>
#include <map>

namespace episweep {

    std::vector<Trace> TraceBuilder::buildTraces(const SweepResultTable& table) {
        if (!table.isComplete()) {
            throw InvalidResultException("TraceBuilder::buildTraces", "Cannot build traces from an incomplete sweep table.");
        }

        const int num_beta = table.numBeta();
        const int num_compartments = table.numCompartments();
        const std::vector<std::string>& names = table.compartmentNames();
        const std::vector<double>& betas = table.betaValues();

        std::vector<Trace> traces(static_cast<size_t>(num_beta) * num_compartments);
        for (int c = 0; c < num_compartments; ++c) {
            const std::string label = displayName(names[c]);
            const std::string color = compartmentColor(names[c]);
            for (int b = 0; b < num_beta; ++b) {
                Trace& trace = traces[traceIndex(c, b, num_beta)];
                trace.name = label;
                trace.compartment = names[c];
                trace.color = color;
                trace.compartment_index = c;
                trace.beta_index = b;
                trace.beta = betas[b];
                const Eigen::VectorXd y = table.trajectory(b, c);
                trace.y.assign(y.data(), y.data() + y.size());
            }
        }
        return traces;
    }

    int TraceBuilder::closestBetaIndex(const std::vector<double>& beta_values, double target) {
        if (beta_values.empty()) {
            THROW_INVALID_PARAM("TraceBuilder::closestBetaIndex", "Beta value list cannot be empty.");
        }
        int best = 0;
        double best_distance = std::abs(beta_values[0] - target);
        for (size_t i = 1; i < beta_values.size(); ++i) {
            double distance = std::abs(beta_values[i] - target);
            if (distance < best_distance) {
                best_distance = distance;
                best = static_cast<int>(i);
            }
        }
        return best;
    }

    std::string TraceBuilder::displayName(const std::string& compartment) {
        static const std::map<std::string, std::string> names = {
            {"S", "Susceptible"},
            {"E", "Exposed"},
            {"I", "Infected"},
            {"R", "Recovered"},
            {"D", "Dead"}
        };
        auto it = names.find(compartment);
        return it != names.end() ? it->second : compartment;
    }

    std::string TraceBuilder::compartmentColor(const std::string& compartment) {
        static const std::map<std::string, std::string> colors = {
            {"S", "#1f77b4"},
            {"E", "#ff7f0e"},
            {"I", "#d62728"},
            {"R", "#2ca02c"},
            {"D", "#555555"}
        };
        auto it = colors.find(compartment);
        return it != colors.end() ? it->second : "#9467bd";
    }

} // namespace episweep
