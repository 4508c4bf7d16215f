// SPDX-License-Identifier: MIT
/**
 * @file scs_backend.hpp
 * @brief SCS-based LP/QP/SOCP backend
 *
 * SCS (Splitting Conic Solver) solves
 *
 *   minimize     (1/2) x^T P x + c^T x
 *   subject to   A x + s = b,   s in K
 *
 * with K a product of the zero cone, the nonnegative orthant and
 * second-order cones, in that row order. Each two-sided row of a
 * CanonicalProgram becomes one zero-cone row (equality) or up to two
 * orthant rows; each SecondOrderCone becomes a block of rows whose slack
 * equals (x_bound, x_members).
 */

#pragma once

#include "optimizer/solver_backend.hpp"

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @class SCSBackend
         * @brief Conic backend using SCS 3.x
         */
        class SCSBackend : public SolverBackend
        {
        public:
            static constexpr const char *NAME = "scs";

            SCSBackend() = default;

            std::string name() const override { return NAME; }

            bool supports(ProblemClass problem_class) const override;

            SolverResult solve(const CanonicalProgram &program,
                               const SolverOptions &options) const override;
        };

    } // namespace optimizer
} // namespace convexfolio
