// SPDX-License-Identifier: MIT
/**
 * @file problem_builder.hpp
 * @brief Compiles a PortfolioSpec and a return window into a CanonicalProgram
 *
 * Plain mode sums every objective term:
 *
 *   minimize  - sum_k weight_k * mu' w  +  sum_r lambda_r * R_r(w)
 *
 * Shortfall risk terms are linearized with auxiliary variables:
 *
 *   ES_p(w)  = min_{t,u}  -t + 1/(T p) * sum_i u_i,   u_i >= t - r_i'w,  u >= 0
 *   EQS_p(w) = min_{t,s,z} -t + z / p,                s_i >= t - r_i'w,  s >= 0,
 *                                                     ||s||_2 <= z
 *
 * Ratio modes use the homogeneous substitution w = y / kappa:
 *
 *   minimize  R(y)
 *   subject to (mu - r_f)' y = 1,   1' y = kappa,   homogenized constraints
 *
 * so max (mu - r_f)'w / R(w) is solved as a single convex program. This is
 * the Charnes-Cooper / Schaible transformation; it requires R to be
 * positively homogeneous, which holds for sqrt(variance), ES and EQS.
 */

#pragma once

#include "model/portfolio_spec.hpp"
#include "model/return_sample.hpp"
#include "optimizer/canonical_program.hpp"

#include <optional>
#include <string>

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @enum OptimizationMode
         * @brief Plain objective sum or one of the ratio objectives
         */
        enum class OptimizationMode
        {
            PLAIN,            ///< Sum of objective terms
            MAX_SHARPE_RATIO, ///< (mu - rf)'w / sqrt(w' Sigma w)
            MAX_ES_RATIO,     ///< (mu - rf)'w / ES_p(w)
            MAX_EQS_RATIO     ///< (mu - rf)'w / EQS_p(w)
        };

        std::string to_string(OptimizationMode mode);

        /**
         * @brief Parse "plain", "max_sharpe_ratio", "max_es_ratio", "max_eqs_ratio"
         * @throws ValidationError for any other tag
         */
        OptimizationMode parse_optimization_mode(const std::string &tag);

        /**
         * @brief Risk measure in the denominator of a ratio mode, empty for PLAIN
         */
        std::optional<model::RiskMeasure> ratio_risk_measure(OptimizationMode mode);

        /**
         * @struct BuilderOptions
         * @brief Tunables of the reformulation
         */
        struct BuilderOptions
        {
            /// Above this many assets variance is emitted as y = F w, y'y
            int dense_covariance_threshold = 200;
        };

        /**
         * @class ProblemBuilder
         * @brief Stateless compiler from (spec, window, mode) to CanonicalProgram
         */
        class ProblemBuilder
        {
        public:
            explicit ProblemBuilder(const BuilderOptions &options = BuilderOptions());

            /**
             * @brief Build the canonical program for one solve
             *
             * @param spec Portfolio specification
             * @param window Return window; its columns must match spec.assets()
             * @param mode Plain or ratio mode
             * @return Program with problem class and variable layout filled in
             *
             * @throws ValidationError on inconsistent constraints, asset
             *         mismatch, non-finite returns or too few observations
             * @throws InvalidObjectiveCombination if a ratio mode does not
             *         have exactly one return and one matching risk objective
             */
            CanonicalProgram build(const model::PortfolioSpec &spec,
                                   const model::ReturnSample &window,
                                   OptimizationMode mode) const;

            /**
             * @brief Check that the objectives fit the mode
             * @throws ValidationError if the spec has no objectives
             * @throws InvalidObjectiveCombination for ratio-mode mismatches
             */
            static void check_objectives(const model::PortfolioSpec &spec,
                                         OptimizationMode mode);

            /**
             * @brief Whether variance would be emitted in factorized form
             */
            bool use_factor_form(size_t num_assets, size_t num_observations) const;

            const BuilderOptions &options() const { return options_; }

        private:
            BuilderOptions options_;

            static void validate_window(const model::PortfolioSpec &spec,
                                        const model::ReturnSample &window);
        };

    } // namespace optimizer
} // namespace convexfolio
