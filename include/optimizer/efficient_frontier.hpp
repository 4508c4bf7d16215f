// SPDX-License-Identifier: MIT
/**
 * @file efficient_frontier.hpp
 * @brief Discretized efficient frontier for variance, ES or EQS
 *
 * Computes the frontier by solving a sequence of minimum-risk problems
 * over a grid of target returns.
 *
 * Mathematical Background:
 *
 *     Anchors:   w_max = argmax mu'w           subject to C
 *                w_min = argmin R(w)           subject to C
 *
 *     For each r_k = r_min + k (r_max - r_min) / (N - 1), k = 0..N-1:
 *                minimize   R(w)
 *                subject to C,  mu'w >= r_k   (or = r_k)
 *
 * where C are the spec's constraints, r_min = mu'w_min, r_max = mu'w_max
 * and R is variance, ES_p or EQS_p. On an exact frontier the means are
 * strictly increasing and the risks non-decreasing; numerical violations
 * are reported, never smoothed away.
 */

#pragma once

#include "model/portfolio_spec.hpp"
#include "model/return_sample.hpp"
#include "optimizer/portfolio_optimizer.hpp"

#include <Eigen/Dense>
#include <string>
#include <vector>

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @struct FrontierPoint
         * @brief Single point on the efficient frontier
         */
        struct FrontierPoint
        {
            double target_return;    ///< Return target of this solve
            double expected_return;  ///< Realized mu'w
            double risk;             ///< Value of the frontier's risk measure
            double volatility;       ///< Portfolio volatility (std dev)
            Eigen::VectorXd weights; ///< Portfolio weights
            SolverStatus status;     ///< Solver status (failure kept)
            std::string message;     ///< Solver or failure message
            bool is_valid;           ///< Point successfully computed

            FrontierPoint();

            /**
             * @brief Construct from a successful optimization result
             */
            FrontierPoint(const OptimizationResult &result, model::RiskMeasure measure,
                          double target_return);
        };

        /**
         * @struct EfficientFrontierResult
         * @brief Ordered frontier points plus anchors and diagnostics
         */
        struct EfficientFrontierResult
        {
            model::RiskMeasure risk_measure;      ///< Measure on the risk axis
            double tail_probability;              ///< p for ES/EQS
            std::vector<std::string> assets;      ///< Column names of the weights
            std::vector<FrontierPoint> points;    ///< Ascending target order
            FrontierPoint min_risk_portfolio;     ///< Minimum-risk anchor
            FrontierPoint max_return_portfolio;   ///< Maximum-mean anchor
            bool success;                         ///< Anchors solved
            bool monotonic;                       ///< Means increasing, risks non-decreasing
            std::vector<std::string> warnings;    ///< Monotonicity violations, failed targets
            std::string message;                  ///< Status message

            EfficientFrontierResult();

            bool is_valid() const;

            size_t num_valid_points() const;

            void print_summary() const;

            /**
             * @brief Write one row per point, with one weight column per asset
             * @throws std::runtime_error if the file cannot be opened
             */
            void export_to_csv(const std::string &filepath) const;
        };

        /**
         * @class EfficientFrontier
         * @brief Frontier generator on top of PortfolioOptimizer
         *
         * Usage Example:
         * @code
         * EfficientFrontier frontier;
         * frontier.set_num_points(25);
         * auto result = frontier.compute(spec, sample, model::RiskMeasure::EXPECTED_SHORTFALL, 0.05);
         * result.print_summary();
         * @endcode
         */
        class EfficientFrontier
        {
        public:
            static constexpr int DEFAULT_NUM_POINTS = 25;

            explicit EfficientFrontier(const PortfolioOptimizer &optimizer = PortfolioOptimizer());

            /**
             * @brief Set number of frontier points
             * @throws std::invalid_argument if num_points < 2
             */
            void set_num_points(int num_points);

            /// Use mu'w = r_k instead of mu'w >= r_k
            void set_equality_target(bool equality) { equality_target_ = equality; }

            /**
             * @brief Tolerance for degenerate ranges and monotonicity checks
             */
            void set_tolerance(double tolerance);

            int get_num_points() const { return num_points_; }
            bool get_equality_target() const { return equality_target_; }

            /**
             * @brief Compute the frontier
             *
             * The spec's objectives are ignored; its constraints, asset
             * universe, risk-free rate and solver preference are kept.
             *
             * @param spec Portfolio specification
             * @param sample Return window
             * @param measure Risk measure on the frontier's risk axis
             * @param tail_probability p for ES/EQS (ignored for variance)
             * @param solver_choice Backend override, empty for spec.solver()
             *
             * @throws ValidationError and friends for a malformed spec
             * @throws SolveError subclasses if an anchor solve fails
             */
            EfficientFrontierResult compute(const model::PortfolioSpec &spec,
                                            const model::ReturnSample &sample,
                                            model::RiskMeasure measure,
                                            double tail_probability = model::DEFAULT_TAIL_PROBABILITY,
                                            const std::string &solver_choice = "") const;

            /**
             * @brief Flag valid points whose mean does not strictly increase
             *        or whose risk decreases
             *
             * Appends one warning per violation and clears result.monotonic.
             */
            void check_monotonicity(EfficientFrontierResult &result) const;

        private:
            PortfolioOptimizer optimizer_;
            int num_points_;
            bool equality_target_;
            double tolerance_;
        };

    } // namespace optimizer
} // namespace convexfolio
