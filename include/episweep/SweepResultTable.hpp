#ifndef SWEEP_RESULT_TABLE_HPP
#define SWEEP_RESULT_TABLE_HPP

#include "SimulationResult.hpp"
#include <Eigen/Dense>
#include <string>
#include <vector>

namespace episweep {

    /**
     * @class SweepResultTable
     * @brief Fixed-size table of all trajectories of a beta sweep.
     *
     * The table holds `num_beta * num_tsteps` rows, allocated up front. Rows are grouped by
     * beta (outer) and ordered by time (inner): row `b * num_tsteps + k` is beta index `b`
     * at time index `k`. Columns are beta, time, then one column per compartment.
     * Each group is written exactly once with setGroup().
     */
    class SweepResultTable {
    public:
        static constexpr int BETA_COLUMN = 0;
        static constexpr int TIME_COLUMN = 1;
        static constexpr int FIRST_COMPARTMENT_COLUMN = 2;

        /**
         * @param beta_values Swept beta values, one group each.
         * @param time_points Shared sampling times, strictly increasing.
         * @param compartment_names Names of the state vector entries.
         *
         * @throws InvalidParameterException If any argument is empty or `time_points` is not strictly increasing.
         */
        SweepResultTable(std::vector<double> beta_values,
                         std::vector<double> time_points,
                         std::vector<std::string> compartment_names);

        /**
         * @brief Stores the trajectory of beta group `beta_index`.
         *
         * @throws OutOfRangeException If `beta_index` is out of range.
         * @throws InvalidParameterException If the group was already written.
         * @throws InvalidResultException If `result` is invalid, has a different number of samples or
         *         compartments, or was sampled at different times than the table.
         */
        void setGroup(int beta_index, const SimulationResult& result);

        int numBeta() const;
        int numTimeSteps() const;
        int numCompartments() const;
        Eigen::Index numRows() const;

        const std::vector<double>& betaValues() const;
        const std::vector<double>& timePoints() const;
        const std::vector<std::string>& compartmentNames() const;

        /** @brief True once every beta group has been written. */
        bool isComplete() const;
        bool isGroupFilled(int beta_index) const;

        /**
         * @brief Trajectory of one compartment for one beta group.
         * @return Eigen::VectorXd of length numTimeSteps().
         * @throws OutOfRangeException If an index is out of range.
         */
        Eigen::VectorXd trajectory(int beta_index, int compartment_index) const;

        /**
         * @brief Same as trajectory(int, int), looking the compartment up by name.
         * @throws InvalidParameterException If there is no such compartment.
         */
        Eigen::VectorXd trajectory(int beta_index, const std::string& compartment) const;

        /** @brief Position of a compartment in compartmentNames(). */
        int compartmentIndex(const std::string& compartment) const;

        /** @brief Index of the first row of a beta group. */
        Eigen::Index groupStartRow(int beta_index) const;

        /** @brief Raw table, one row per (beta, time). */
        const Eigen::MatrixXd& data() const;

    private:
        void checkBetaIndex(int beta_index, const std::string& caller) const;

        std::vector<double> beta_values_;
        std::vector<double> time_points_;
        std::vector<std::string> compartment_names_;
        std::vector<bool> filled_;
        Eigen::MatrixXd data_;
    };

} // namespace episweep

#endif // SWEEP_RESULT_TABLE_HPP
