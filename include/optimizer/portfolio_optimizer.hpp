// SPDX-License-Identifier: MIT
/**
 * @file portfolio_optimizer.hpp
 * @brief Single-period entry point: spec + window -> OptimizationResult
 *
 * Builds a fresh CanonicalProgram for every call, dispatches it through
 * the SolverAdapter and recomputes the realized risk/return components
 * from the returned weights. Apart from the solver call the optimizer has
 * no side effects, so one instance may be shared by concurrent callers.
 */

#pragma once

#include "model/portfolio_spec.hpp"
#include "model/return_sample.hpp"
#include "optimizer/optimization_result.hpp"
#include "optimizer/problem_builder.hpp"
#include "optimizer/solver_adapter.hpp"

#include <Eigen/Dense>
#include <string>

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @class PortfolioOptimizer
         * @brief Compile, solve and evaluate one portfolio problem
         *
         * Usage Example:
         * @code
         * PortfolioOptimizer optimizer;
         * auto result = optimizer.optimize(spec, sample, OptimizationMode::MAX_SHARPE_RATIO);
         * result.print_summary();
         * @endcode
         */
        class PortfolioOptimizer
        {
        public:
            /// kappa at or below this value means no positive-excess-return portfolio exists
            static constexpr double KAPPA_TOLERANCE = 1e-9;

            explicit PortfolioOptimizer(const SolverAdapterConfig &config = SolverAdapterConfig(),
                                        const BuilderOptions &builder_options = BuilderOptions());

            /**
             * @brief Optimize one portfolio
             *
             * @param spec Portfolio specification
             * @param window Return window; columns aligned with spec.assets()
             * @param mode Plain objective sum or a ratio objective
             * @param solver_choice "auto", a backend name, or empty to use spec.solver()
             * @return Result with weights and realized components
             *
             * @throws ValidationError, InvalidObjectiveCombination,
             *         UnsupportedProblemClass before any solve
             * @throws InfeasibleProblem, InfeasibleRatio, SolverTimeout,
             *         SolverNumericalFailure when the solve fails
             */
            OptimizationResult optimize(const model::PortfolioSpec &spec,
                                        const model::ReturnSample &window,
                                        OptimizationMode mode = OptimizationMode::PLAIN,
                                        const std::string &solver_choice = "") const;

            /**
             * @brief Realized components of fixed weights on a window
             *
             * Mean and variance always; ES and EQS for the first objective of
             * each kind; the composite objective sums every objective term;
             * the ratio is set for ratio modes.
             */
            static OptimizationResult evaluate(const model::PortfolioSpec &spec,
                                               const model::ReturnSample &window,
                                               const Eigen::VectorXd &weights,
                                               OptimizationMode mode = OptimizationMode::PLAIN);

            const ProblemBuilder &builder() const { return builder_; }
            const SolverAdapter &adapter() const { return adapter_; }
            SolverAdapter &adapter() { return adapter_; }

        private:
            ProblemBuilder builder_;
            SolverAdapter adapter_;
        };

    } // namespace optimizer
} // namespace convexfolio
