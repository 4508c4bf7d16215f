// SPDX-License-Identifier: MIT
/**
 * @file optimization_result.hpp
 * @brief Outcome of a single-period optimization
 */

#pragma once

#include "model/errors.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @struct OptimizationResult
         * @brief Weights, realized risk/return components and solver report
         *
         * Realized components are recomputed from the weights on the window
         * that was solved, not read back from auxiliary solver variables.
         * A failed solve inside a backtest is also recorded as an
         * OptimizationResult, with a failure status and the weights the
         * failure policy chose.
         */
        struct OptimizationResult
        {
            Eigen::VectorXd weights;  ///< Portfolio weights (N x 1)
            double expected_return;   ///< mu' w
            double variance;          ///< w' Sigma w
            double volatility;        ///< sqrt(variance)
            std::optional<double> expected_shortfall;           ///< Present with an ES objective
            std::optional<double> expected_quadratic_shortfall; ///< Present with an EQS objective
            double objective_value;   ///< Composite objective at the weights
            std::optional<double> ratio; ///< Excess return per unit risk (ratio modes)

            std::string solver_name;  ///< Backend that produced the solution
            SolverStatus status;      ///< Solver status
            int iterations;           ///< Solver iterations
            std::string message;      ///< Solver or failure message

            OptimizationResult();

            /**
             * @brief Check if the solve succeeded and weights are finite
             */
            bool is_valid() const;

            /**
             * @brief Print formatted summary to stdout
             */
            void print_summary() const;

            /**
             * @brief Serialize; weights are keyed by asset when names are given
             */
            nlohmann::json to_json(const std::vector<std::string> &assets = {}) const;
        };

    } // namespace optimizer
} // namespace convexfolio
