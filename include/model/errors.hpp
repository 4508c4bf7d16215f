// SPDX-License-Identifier: MIT
/**
 * @file errors.hpp
 * @brief Error taxonomy and solver status codes
 *
 * Configuration and specification problems derive from
 * std::invalid_argument and are raised before any program is built.
 * Solver outcomes derive from std::runtime_error and carry the status
 * and the name of the backend that produced them.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace convexfolio
{

    /**
     * @enum SolverStatus
     * @brief Normalized outcome of a backend solve
     */
    enum class SolverStatus
    {
        SOLVED,            ///< Converged to requested tolerance
        SOLVED_INACCURATE, ///< Converged to relaxed tolerance
        INFEASIBLE,        ///< Primal infeasible
        INFEASIBLE_RATIO,  ///< Ratio normalization scalar vanished
        UNBOUNDED,         ///< Objective unbounded below
        TIMEOUT,           ///< Time limit reached
        NUMERICAL_FAILURE  ///< Iteration limit, non-convexity or internal error
    };

    /**
     * @brief Human readable status name
     */
    std::string to_string(SolverStatus status);

    /**
     * @brief True for SOLVED and SOLVED_INACCURATE
     */
    bool is_success(SolverStatus status);

    /// Malformed specification, configuration or input data.
    class ValidationError : public std::invalid_argument
    {
    public:
        explicit ValidationError(const std::string &message)
            : std::invalid_argument(message) {}
    };

    /// Requested backend cannot express the program's class.
    class UnsupportedProblemClass : public std::invalid_argument
    {
    public:
        explicit UnsupportedProblemClass(const std::string &message)
            : std::invalid_argument(message) {}
    };

    /// Ratio mode without exactly one return and one matching risk objective.
    class InvalidObjectiveCombination : public std::invalid_argument
    {
    public:
        explicit InvalidObjectiveCombination(const std::string &message)
            : std::invalid_argument(message) {}
    };

    /**
     * @class SolveError
     * @brief Base for failures reported by a backend
     */
    class SolveError : public std::runtime_error
    {
    public:
        SolveError(const std::string &message,
                   SolverStatus status,
                   const std::string &solver_name);

        SolverStatus status() const { return status_; }
        const std::string &solver_name() const { return solver_name_; }

    private:
        SolverStatus status_;
        std::string solver_name_;
    };

    class InfeasibleProblem : public SolveError
    {
    public:
        using SolveError::SolveError;
    };

    class InfeasibleRatio : public SolveError
    {
    public:
        using SolveError::SolveError;
    };

    class SolverTimeout : public SolveError
    {
    public:
        using SolveError::SolveError;
    };

    class SolverNumericalFailure : public SolveError
    {
    public:
        using SolveError::SolveError;
    };

    /**
     * @brief Raise the SolveError subclass matching a failure status
     * @param status Failure status (must not be a success status)
     * @param solver_name Backend that produced the status
     * @param message Backend message
     * @throws std::logic_error if status is a success status
     */
    [[noreturn]] void throw_for_status(SolverStatus status,
                                       const std::string &solver_name,
                                       const std::string &message);

} // namespace convexfolio
