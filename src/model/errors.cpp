// SPDX-License-Identifier: MIT
/**
 * @file errors.cpp
 * @brief Solver status helpers and SolveError construction
 */

#include "model/errors.hpp"

namespace convexfolio
{

    std::string to_string(SolverStatus status)
    {
        switch (status)
        {
        case SolverStatus::SOLVED:
            return "solved";
        case SolverStatus::SOLVED_INACCURATE:
            return "solved_inaccurate";
        case SolverStatus::INFEASIBLE:
            return "infeasible";
        case SolverStatus::INFEASIBLE_RATIO:
            return "infeasible_ratio";
        case SolverStatus::UNBOUNDED:
            return "unbounded";
        case SolverStatus::TIMEOUT:
            return "timeout";
        case SolverStatus::NUMERICAL_FAILURE:
            return "numerical_failure";
        }
        return "unknown";
    }

    bool is_success(SolverStatus status)
    {
        return status == SolverStatus::SOLVED ||
               status == SolverStatus::SOLVED_INACCURATE;
    }

    SolveError::SolveError(const std::string &message,
                           SolverStatus status,
                           const std::string &solver_name)
        : std::runtime_error(message),
          status_(status),
          solver_name_(solver_name)
    {
    }

    void throw_for_status(SolverStatus status,
                          const std::string &solver_name,
                          const std::string &message)
    {
        const std::string what = "[" + solver_name + "] " + to_string(status) +
                                 (message.empty() ? "" : ": " + message);
        switch (status)
        {
        case SolverStatus::INFEASIBLE:
        case SolverStatus::UNBOUNDED:
            throw InfeasibleProblem(what, status, solver_name);
        case SolverStatus::INFEASIBLE_RATIO:
            throw InfeasibleRatio(what, status, solver_name);
        case SolverStatus::TIMEOUT:
            throw SolverTimeout(what, status, solver_name);
        case SolverStatus::NUMERICAL_FAILURE:
            throw SolverNumericalFailure(what, status, solver_name);
        case SolverStatus::SOLVED:
        case SolverStatus::SOLVED_INACCURATE:
            break;
        }
        throw std::logic_error("throw_for_status called with success status: " + what);
    }

} // namespace convexfolio
