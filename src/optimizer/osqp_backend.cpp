// SPDX-License-Identifier: MIT
/**
 * @file osqp_backend.cpp
 * @brief Implementation of OSQP backend
 */

#include "optimizer/osqp_backend.hpp"

#include <osqp/osqp.h>

#include <cmath>
#include <iostream>
#include <memory>
#include <vector>

namespace convexfolio
{
    namespace optimizer
    {

        namespace
        {
            struct OSQPWorkspaceDeleter
            {
                void operator()(::OSQPSolver *solver) const
                {
                    osqp_cleanup(solver);
                }
            };

            using OSQPWorkspace = std::unique_ptr<::OSQPSolver, OSQPWorkspaceDeleter>;

            SolverStatus map_status(OSQPInt status_val)
            {
                switch (status_val)
                {
                case OSQP_SOLVED:
                    return SolverStatus::SOLVED;
                case OSQP_SOLVED_INACCURATE:
                    return SolverStatus::SOLVED_INACCURATE;
                case OSQP_PRIMAL_INFEASIBLE:
                case OSQP_PRIMAL_INFEASIBLE_INACCURATE:
                    return SolverStatus::INFEASIBLE;
                case OSQP_DUAL_INFEASIBLE:
                case OSQP_DUAL_INFEASIBLE_INACCURATE:
                    return SolverStatus::UNBOUNDED;
                case OSQP_TIME_LIMIT_REACHED:
                    return SolverStatus::TIMEOUT;
                default:
                    // Max iterations, non-convex P, interrupted or unsolved
                    return SolverStatus::NUMERICAL_FAILURE;
                }
            }

            OSQPFloat clamp_bound(double value)
            {
                if (value >= OSQP_INFTY)
                    return OSQP_INFTY;
                if (value <= -OSQP_INFTY)
                    return -OSQP_INFTY;
                return static_cast<OSQPFloat>(value);
            }
        } // anonymous namespace

        bool OSQPBackend::supports(ProblemClass problem_class) const
        {
            return problem_class == ProblemClass::LP || problem_class == ProblemClass::QP;
        }

        SolverResult OSQPBackend::solve(const CanonicalProgram &program,
                                        const SolverOptions &options) const
        {
            SolverResult result;
            result.solver_name = NAME;

            if (!program.cones.empty())
            {
                result.message = "OSQP cannot solve programs with second-order cones";
                return result;
            }

            const OSQPInt n = static_cast<OSQPInt>(program.num_variables);
            const OSQPInt m = static_cast<OSQPInt>(program.num_rows());

            // OSQP reads the upper triangle of P in CSC format
            auto P = to_csc<OSQPFloat, OSQPInt>(program.P);
            auto A = to_csc<OSQPFloat, OSQPInt>(program.A);

            std::vector<OSQPFloat> q(program.q.data(), program.q.data() + n);
            std::vector<OSQPFloat> l(static_cast<size_t>(m));
            std::vector<OSQPFloat> u(static_cast<size_t>(m));
            for (OSQPInt i = 0; i < m; ++i)
            {
                l[static_cast<size_t>(i)] = clamp_bound(program.lower(i));
                u[static_cast<size_t>(i)] = clamp_bound(program.upper(i));
            }

            OSQPCscMatrix P_csc{};
            P_csc.m = n;
            P_csc.n = n;
            P_csc.p = P.column_pointers.data();
            P_csc.i = P.row_indices.data();
            P_csc.x = P.values.data();
            P_csc.nzmax = static_cast<OSQPInt>(P.values.size());
            P_csc.nz = -1; // -1 means CSC format (not triplet)

            OSQPCscMatrix A_csc{};
            A_csc.m = m;
            A_csc.n = n;
            A_csc.p = A.column_pointers.data();
            A_csc.i = A.row_indices.data();
            A_csc.x = A.values.data();
            A_csc.nzmax = static_cast<OSQPInt>(A.values.size());
            A_csc.nz = -1;

            OSQPSettings settings;
            osqp_set_default_settings(&settings);
            settings.verbose = options.verbose ? 1 : 0;
            settings.eps_abs = options.tolerance;
            settings.eps_rel = options.tolerance;
            settings.max_iter = options.max_iterations;
            settings.polishing = 1;
            if (options.time_limit_seconds > 0.0)
            {
                settings.time_limit = options.time_limit_seconds;
            }

            ::OSQPSolver *raw_work = nullptr;
            OSQPInt exit_flag = osqp_setup(&raw_work, &P_csc, q.data(), &A_csc,
                                           l.data(), u.data(), m, n, &settings);
            OSQPWorkspace work(raw_work);

            if (exit_flag != 0 || !work)
            {
                result.message = "OSQP setup failed with code " + std::to_string(exit_flag);
                if (options.verbose)
                {
                    std::cerr << "Warning: " << result.message << "\n";
                }
                return result;
            }

            osqp_solve(work.get());

            result.solution = Eigen::VectorXd::Zero(n);
            for (OSQPInt i = 0; i < n; ++i)
            {
                result.solution(i) = work->solution->x[i];
            }

            result.iterations = static_cast<int>(work->info->iter);
            result.objective_value = work->info->obj_val;
            result.status = map_status(work->info->status_val);
            result.message = work->info->status;

            return result;
        }

    } // namespace optimizer
} // namespace convexfolio
