// SPDX-License-Identifier: MIT
/**
 * @file osqp_backend.hpp
 * @brief OSQP-based LP/QP backend
 *
 * Wraps the OSQP library. OSQP (Operator Splitting Quadratic Program)
 * solves
 *
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   l <= A x <= u
 *
 * which is exactly the linear part of a CanonicalProgram, so rows pass
 * through unchanged. Programs with second-order cones are not supported.
 *
 * Performance: typically converges in 10-100 iterations for portfolio
 * problems; LPs (P = 0) are handled by the same ADMM iteration with
 * solution polishing.
 */

#pragma once

#include "optimizer/solver_backend.hpp"

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @class OSQPBackend
         * @brief LP/QP backend using OSQP
         *
         * Usage Example:
         * @code
         * OSQPBackend backend;
         * SolverOptions options;
         * options.max_iterations = 10000;
         * options.tolerance = 1e-6;
         *
         * SolverResult result = backend.solve(program, options);
         * if (result.success()) {
         *     std::cout << "Converged in " << result.iterations << " iterations\n";
         * }
         * @endcode
         */
        class OSQPBackend : public SolverBackend
        {
        public:
            static constexpr const char *NAME = "osqp";

            OSQPBackend() = default;

            std::string name() const override { return NAME; }

            bool supports(ProblemClass problem_class) const override;

            /**
             * @brief Solve an LP or QP
             * @param program Canonical program without cones
             * @param options Solver configuration
             * @return Solution with status, iterations and objective value
             *
             * Infinite row bounds are mapped to OSQP_INFTY.
             */
            SolverResult solve(const CanonicalProgram &program,
                               const SolverOptions &options) const override;
        };

    } // namespace optimizer
} // namespace convexfolio
