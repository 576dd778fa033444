#include "episweep/SweepAnalyser.hpp"
#include "exceptions/Exceptions.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <boost/accumulators/accumulators.hpp>
#include <boost/accumulators/statistics/stats.hpp>
#include <boost/accumulators/statistics/max.hpp>
#include <boost/accumulators/statistics/mean.hpp>

namespace episweep {

    namespace acc = boost::accumulators;

    std::vector<SweepSummary> SweepAnalyser::summarize(const SweepResultTable& table,
                                                       const std::string& infected_compartment)
    {
        if (!table.isComplete()) {
            throw InvalidResultException("SweepAnalyser::summarize", "Cannot summarize an incomplete sweep table.");
        }
        const int infected = table.compartmentIndex(infected_compartment);
        const int susceptible = table.compartmentIndex("S");
        const std::vector<std::string>& names = table.compartmentNames();
        const bool has_deaths = std::find(names.begin(), names.end(), "D") != names.end();
        const int last = table.numTimeSteps() - 1;

        std::vector<SweepSummary> summaries;
        summaries.reserve(table.numBeta());
        for (int b = 0; b < table.numBeta(); ++b) {
            const Eigen::VectorXd I = table.trajectory(b, infected);

            acc::accumulator_set<double, acc::stats<acc::tag::max, acc::tag::mean>> prevalence;
            for (Eigen::Index k = 0; k < I.size(); ++k) {
                prevalence(I(k));
            }
            Eigen::Index peak_index = 0;
            I.maxCoeff(&peak_index);

            const Eigen::Index final_row = table.groupStartRow(b) + last;
            const double total = table.data().row(final_row).tail(table.numCompartments()).sum();

            SweepSummary summary;
            summary.beta = table.betaValues()[b];
            summary.peak_infected = acc::max(prevalence);
            summary.peak_time = table.timePoints()[static_cast<size_t>(peak_index)];
            summary.mean_infected = acc::mean(prevalence);
            summary.final_susceptible_fraction = total > 0 ? table.trajectory(b, susceptible)(last) / total : 0.0;
            summary.has_deaths = has_deaths;
            summary.final_dead = has_deaths ? table.trajectory(b, "D")(last) : 0.0;
            summaries.push_back(summary);
        }
        return summaries;
    }

    std::string SweepAnalyser::describe(const SweepSummary& summary) {
        std::ostringstream oss;
        oss << "beta=" << std::fixed << std::setprecision(2) << summary.beta
            << " peak I=" << std::setprecision(0) << summary.peak_infected
            << " at t=" << std::setprecision(1) << summary.peak_time
            << ", mean I=" << std::setprecision(0) << summary.mean_infected
            << ", final S fraction=" << std::setprecision(4) << summary.final_susceptible_fraction;
        if (summary.has_deaths) {
            oss << ", deaths=" << std::setprecision(0) << summary.final_dead;
        }
        return oss.str();
    }

} // namespace episweep
