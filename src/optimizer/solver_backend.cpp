// SPDX-License-Identifier: MIT
/**
 * @file solver_backend.cpp
 * @brief SolverResult defaults
 */

#include "optimizer/solver_backend.hpp"

namespace convexfolio
{
    namespace optimizer
    {

        SolverResult::SolverResult()
            : status(SolverStatus::NUMERICAL_FAILURE),
              iterations(0),
              objective_value(0.0)
        {
        }

    } // namespace optimizer
} // namespace convexfolio
