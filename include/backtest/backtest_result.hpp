// SPDX-License-Identifier: MIT
/**
 * @file backtest_result.hpp
 * @brief Weight time series produced by a backtest run.
 *
 * One entry per rebalance date, in chronological order. Weights computed
 * at a rebalance date are held constant until the next rebalance date.
 */

#ifndef CONVEXFOLIO_BACKTEST_BACKTEST_RESULT_HPP
#define CONVEXFOLIO_BACKTEST_BACKTEST_RESULT_HPP

#include "optimizer/optimization_result.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace convexfolio
{
    namespace backtest
    {

        /**
         * @struct BacktestEntry
         * @brief Outcome of one rebalance
         */
        struct BacktestEntry
        {
            std::string date;          ///< Rebalance date (weights apply from here on)
            size_t row = 0;            ///< Row of the date in the sample
            size_t window_begin = 0;   ///< First row of the estimation window
            size_t window_end = 0;     ///< One past the last row (== row)
            bool failed = false;       ///< Solve failed; weights follow the failure policy
            optimizer::OptimizationResult result;
        };

        /**
         * @struct BacktestResult
         * @brief Container for backtest output
         */
        struct BacktestResult
        {
            std::vector<std::string> assets;
            std::vector<BacktestEntry> entries;
            std::vector<std::string> skipped_dates; ///< Rebalance dates with too short a window
            int failure_count = 0;
            bool complete = false;                  ///< Horizon exhausted
            std::string message;

            size_t num_entries() const { return entries.size(); }

            /**
             * @brief Weights held on a date
             *
             * The weights of the latest entry dated on or before `date`;
             * NaN if `date` precedes the first entry.
             */
            Eigen::VectorXd weights_at(const std::string &date) const;

            /**
             * @brief Held weights for a sequence of dates (one row per date)
             */
            Eigen::MatrixXd held_weights(const std::vector<std::string> &dates) const;

            /**
             * @brief Print a summary of the run to stdout.
             */
            void print_summary() const;

            /**
             * @brief Export one row of weights per rebalance date to CSV.
             * @param filepath Path to write the CSV file.
             * @throws std::runtime_error If the file cannot be opened.
             */
            void export_weights_csv(const std::string &filepath) const;

            nlohmann::json to_json() const;
        };

    } // namespace backtest
} // namespace convexfolio

#endif // CONVEXFOLIO_BACKTEST_BACKTEST_RESULT_HPP
