// SPDX-License-Identifier: MIT
/**
 * @file solver_backend.hpp
 * @brief Interface implemented by every LP/QP/SOCP solver wrapper
 *
 * A backend receives a CanonicalProgram, translates it to its library's
 * native form, and reports a normalized SolverResult. Backends never throw
 * on solver failure: failure is a status, and the caller decides what to
 * do with it.
 */

#pragma once

#include "model/errors.hpp"
#include "optimizer/canonical_program.hpp"

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <string>
#include <vector>

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @struct SolverOptions
         * @brief Settings forwarded to the backend library
         */
        struct SolverOptions
        {
            int max_iterations = 10000;      ///< Maximum iterations
            double tolerance = 1e-6;         ///< Absolute and relative tolerance
            double time_limit_seconds = 0.0; ///< 0 disables the limit
            bool verbose = false;            ///< Let the library print progress

            SolverOptions() = default;
        };

        /**
         * @struct SolverResult
         * @brief Normalized outcome of one backend call
         */
        struct SolverResult
        {
            Eigen::VectorXd solution;   ///< Full variable vector x
            SolverStatus status;        ///< Normalized status
            std::string solver_name;    ///< Backend that produced this result
            int iterations;             ///< Iterations performed
            double objective_value;     ///< (1/2) x'Px + q'x at the solution
            std::string message;        ///< Library status text

            SolverResult();

            bool success() const { return is_success(status); }
        };

        /**
         * @class SolverBackend
         * @brief Abstract solver wrapper
         */
        class SolverBackend
        {
        public:
            virtual ~SolverBackend() = default;

            /// Registry name, e.g. "osqp"
            virtual std::string name() const = 0;

            /// Whether the backend can express programs of this class
            virtual bool supports(ProblemClass problem_class) const = 0;

            /**
             * @brief Solve a canonical program
             * @param program Validated program; its class must be supported
             * @param options Iteration, tolerance and time limits
             * @return Normalized result; failures are reported via status
             */
            virtual SolverResult solve(const CanonicalProgram &program,
                                       const SolverOptions &options) const = 0;
        };

        /**
         * @struct CscArrays
         * @brief Compressed sparse column arrays in a library's index/value types
         */
        template <typename Float, typename Int>
        struct CscArrays
        {
            Int rows = 0;
            Int cols = 0;
            std::vector<Float> values;
            std::vector<Int> row_indices;
            std::vector<Int> column_pointers;
        };

        /**
         * @brief Convert an Eigen sparse matrix to CSC arrays
         *
         * Both OSQP and SCS take CSC input; only the scalar and index types
         * differ.
         */
        template <typename Float, typename Int>
        CscArrays<Float, Int> to_csc(const Eigen::SparseMatrix<double> &matrix)
        {
            CscArrays<Float, Int> csc;
            csc.rows = static_cast<Int>(matrix.rows());
            csc.cols = static_cast<Int>(matrix.cols());
            csc.values.reserve(static_cast<size_t>(matrix.nonZeros()));
            csc.row_indices.reserve(static_cast<size_t>(matrix.nonZeros()));
            csc.column_pointers.reserve(static_cast<size_t>(matrix.cols() + 1));

            csc.column_pointers.push_back(0);
            for (Eigen::Index j = 0; j < matrix.outerSize(); ++j)
            {
                for (Eigen::SparseMatrix<double>::InnerIterator it(matrix, j); it; ++it)
                {
                    csc.values.push_back(static_cast<Float>(it.value()));
                    csc.row_indices.push_back(static_cast<Int>(it.row()));
                }
                csc.column_pointers.push_back(static_cast<Int>(csc.values.size()));
            }

            return csc;
        }

    } // namespace optimizer
} // namespace convexfolio
