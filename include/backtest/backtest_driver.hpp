// SPDX-License-Identifier: MIT
#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>
#include <stdexcept>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "model/portfolio_spec.hpp"
#include "model/return_sample.hpp"
#include "backtest/backtest_result.hpp"
#include "backtest/rebalance_scheduler.hpp"
#include "optimizer/portfolio_optimizer.hpp"

namespace convexfolio
{
    namespace backtest
    {

        /**
         * @enum FailurePolicy
         * @brief What a failed rebalance leaves in the weight series
         */
        enum class FailurePolicy
        {
            HOLD_PREVIOUS,  ///< Keep the last successful weights (NaN if none)
            MARK_UNDEFINED, ///< NaN weights for the failed date
            ABORT           ///< Rethrow the solve error
        };

        std::string to_string(FailurePolicy policy);
        FailurePolicy parse_failure_policy(const std::string &tag);

        /**
         * @enum DriverState
         * @brief Position of the driver on its rebalance schedule
         */
        enum class DriverState
        {
            ACCUMULATING, ///< No full training window seen yet
            REBALANCING,  ///< At least one window solved or attempted
            EXHAUSTED     ///< Schedule consumed (terminal)
        };

        std::string to_string(DriverState state);

        /**
         * @struct BacktestConfig
         * @brief Schedule, window and failure handling of a backtest
         *
         * rolling_window == 0 selects an expanding window [0, d) that
         * starts once training_length observations exist; otherwise the
         * window is the W rows [d - W, d).
         */
        struct BacktestConfig
        {
            RebalanceConfig rebalance;
            size_t training_length = 60;
            size_t rolling_window = 0;
            size_t min_observations = 2;
            FailurePolicy failure_policy = FailurePolicy::HOLD_PREVIOUS;
            optimizer::OptimizationMode mode = optimizer::OptimizationMode::PLAIN;
            std::string solver;     ///< Empty uses the spec's solver preference
            size_t max_workers = 1; ///< > 1 solves windows concurrently
            bool verbose = false;

            bool is_rolling() const { return rolling_window > 0; }

            /// Observations a window needs before it is solved
            size_t required_observations() const;

            /**
             * @throws ValidationError for window lengths below 2 or zero workers
             */
            void validate() const;

            static BacktestConfig from_json(const nlohmann::json &j);
        };

        /**
         * @class BacktestDriver
         * @brief Re-solves a portfolio spec over a rebalance schedule
         *
         * At rebalance row d only rows strictly before d are visible to the
         * optimizer, so no window ever contains its own rebalance date.
         *
         * Usage Example:
         * @code
         * BacktestConfig config;
         * config.rebalance.frequency = RebalanceFrequency::MONTHLY;
         * config.training_length = 120;
         *
         * BacktestDriver driver(spec, sample, config);
         * BacktestResult result = driver.run();
         * result.print_summary();
         * @endcode
         */
        class BacktestDriver
        {
        public:
            /**
             * @throws ValidationError if the spec, configuration or sample
             *         columns are inconsistent
             * @throws InvalidObjectiveCombination if the mode does not fit
             *         the spec's objectives
             */
            BacktestDriver(const model::PortfolioSpec &spec,
                           const model::ReturnSample &sample,
                           const BacktestConfig &config,
                           const optimizer::PortfolioOptimizer &optimizer = optimizer::PortfolioOptimizer());

            /**
             * @brief Process the next scheduled rebalance date
             * @return false once the schedule is exhausted
             * @throws SolveError subclasses under FailurePolicy::ABORT
             */
            bool step();

            /**
             * @brief Run to the end of the schedule
             *
             * With max_workers > 1 windows are solved concurrently and
             * merged in chronological order.
             */
            BacktestResult run();

            DriverState state() const { return state_; }
            const BacktestResult &result() const { return result_; }
            const std::vector<size_t> &schedule() const { return schedule_; }
            const BacktestConfig &config() const { return config_; }

            /// Half-open row range [begin, end) of the window for rebalance row d
            std::pair<size_t, size_t> window_bounds(size_t row) const;

            bool has_full_window(size_t row) const;

        private:
            model::PortfolioSpec spec_;
            model::ReturnSample sample_;
            BacktestConfig config_;
            optimizer::PortfolioOptimizer optimizer_;

            std::vector<size_t> schedule_;
            size_t cursor_;
            DriverState state_;
            BacktestResult result_;
            Eigen::VectorXd last_good_weights_;

            optimizer::OptimizationResult solve_window(size_t row) const;

            void advance(size_t row, const std::function<optimizer::OptimizationResult()> &produce);

            void finish_if_exhausted();
        };

    } // namespace backtest
} // namespace convexfolio
