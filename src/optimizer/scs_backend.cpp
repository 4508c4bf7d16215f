// SPDX-License-Identifier: MIT
/**
 * @file scs_backend.cpp
 * @brief Implementation of SCS backend
 */

#include "optimizer/scs_backend.hpp"

extern "C"
{
#include <scs/scs.h>
}

#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <vector>

namespace convexfolio
{
    namespace optimizer
    {

        namespace
        {
            /// Slack rows of one cone block, before stacking into A and b
            struct ConeRows
            {
                std::vector<Eigen::Triplet<double>> entries;
                std::vector<double> rhs;

                int add(const std::vector<std::pair<int, double>> &coefficients, double b)
                {
                    const int row = static_cast<int>(rhs.size());
                    for (const auto &entry : coefficients)
                    {
                        entries.emplace_back(row, entry.first, entry.second);
                    }
                    rhs.push_back(b);
                    return row;
                }
            };

            void free_solution(ScsSolution &solution)
            {
                std::free(solution.x);
                std::free(solution.y);
                std::free(solution.s);
                solution.x = nullptr;
                solution.y = nullptr;
                solution.s = nullptr;
            }

            SolverStatus map_status(scs_int status_val, bool hit_time_limit)
            {
                switch (status_val)
                {
                case SCS_SOLVED:
                    return SolverStatus::SOLVED;
                case SCS_SOLVED_INACCURATE:
                    return hit_time_limit ? SolverStatus::TIMEOUT : SolverStatus::SOLVED_INACCURATE;
                case SCS_INFEASIBLE:
                case SCS_INFEASIBLE_INACCURATE:
                    return SolverStatus::INFEASIBLE;
                case SCS_UNBOUNDED:
                case SCS_UNBOUNDED_INACCURATE:
                    return SolverStatus::UNBOUNDED;
                case SCS_UNFINISHED:
                    return hit_time_limit ? SolverStatus::TIMEOUT : SolverStatus::NUMERICAL_FAILURE;
                default:
                    // Indeterminate, failed, interrupted
                    return SolverStatus::NUMERICAL_FAILURE;
                }
            }
        } // anonymous namespace

        bool SCSBackend::supports(ProblemClass) const
        {
            return true;
        }

        SolverResult SCSBackend::solve(const CanonicalProgram &program,
                                       const SolverOptions &options) const
        {
            SolverResult result;
            result.solver_name = NAME;

            const int n = program.num_variables;

            // Split the linear rows into zero-cone and orthant blocks
            ConeRows zero_rows;
            ConeRows positive_rows;
            ConeRows soc_rows;

            const Eigen::SparseMatrix<double, Eigen::RowMajor> rows = program.A;
            for (int r = 0; r < program.num_rows(); ++r)
            {
                std::vector<std::pair<int, double>> coefficients;
                for (Eigen::SparseMatrix<double, Eigen::RowMajor>::InnerIterator it(rows, r); it; ++it)
                {
                    coefficients.emplace_back(static_cast<int>(it.col()), it.value());
                }

                const double lo = program.lower(r);
                const double hi = program.upper(r);

                if (std::isfinite(lo) && lo == hi)
                {
                    // a'x + s = lo, s = 0
                    zero_rows.add(coefficients, lo);
                    continue;
                }
                if (std::isfinite(hi))
                {
                    // a'x + s = hi, s >= 0
                    positive_rows.add(coefficients, hi);
                }
                if (std::isfinite(lo))
                {
                    // -a'x + s = -lo, s >= 0
                    std::vector<std::pair<int, double>> negated = coefficients;
                    for (auto &entry : negated)
                    {
                        entry.second = -entry.second;
                    }
                    positive_rows.add(negated, -lo);
                }
            }

            // Slack (x_bound, x_members) lies in the second-order cone
            std::vector<scs_int> cone_sizes;
            for (const auto &cone : program.cones)
            {
                soc_rows.add({{cone.bound, -1.0}}, 0.0);
                for (int member : cone.members)
                {
                    soc_rows.add({{member, -1.0}}, 0.0);
                }
                cone_sizes.push_back(static_cast<scs_int>(cone.members.size() + 1));
            }

            const int num_zero = static_cast<int>(zero_rows.rhs.size());
            const int num_positive = static_cast<int>(positive_rows.rhs.size());
            const int num_soc = static_cast<int>(soc_rows.rhs.size());
            const int m = num_zero + num_positive + num_soc;

            if (m == 0)
            {
                result.message = "SCS requires at least one constraint row";
                return result;
            }

            std::vector<Eigen::Triplet<double>> stacked;
            stacked.reserve(zero_rows.entries.size() + positive_rows.entries.size() + soc_rows.entries.size());
            for (const auto &t : zero_rows.entries)
                stacked.emplace_back(t.row(), t.col(), t.value());
            for (const auto &t : positive_rows.entries)
                stacked.emplace_back(num_zero + t.row(), t.col(), t.value());
            for (const auto &t : soc_rows.entries)
                stacked.emplace_back(num_zero + num_positive + t.row(), t.col(), t.value());

            Eigen::SparseMatrix<double> A_sparse(m, n);
            A_sparse.setFromTriplets(stacked.begin(), stacked.end());
            A_sparse.makeCompressed();

            std::vector<scs_float> b;
            b.reserve(static_cast<size_t>(m));
            b.insert(b.end(), zero_rows.rhs.begin(), zero_rows.rhs.end());
            b.insert(b.end(), positive_rows.rhs.begin(), positive_rows.rhs.end());
            b.insert(b.end(), soc_rows.rhs.begin(), soc_rows.rhs.end());

            std::vector<scs_float> c(program.q.data(), program.q.data() + n);

            auto A_csc = to_csc<scs_float, scs_int>(A_sparse);
            auto P_csc = to_csc<scs_float, scs_int>(program.P);

            ScsMatrix A;
            A.m = A_csc.rows;
            A.n = A_csc.cols;
            A.p = A_csc.column_pointers.data();
            A.i = A_csc.row_indices.data();
            A.x = A_csc.values.data();

            // SCS reads the upper triangle of P; omit it entirely for LPs
            ScsMatrix P;
            P.m = P_csc.rows;
            P.n = P_csc.cols;
            P.p = P_csc.column_pointers.data();
            P.i = P_csc.row_indices.data();
            P.x = P_csc.values.data();

            ScsData data;
            std::memset(&data, 0, sizeof(data));
            data.m = static_cast<scs_int>(m);
            data.n = static_cast<scs_int>(n);
            data.A = &A;
            data.P = P_csc.values.empty() ? nullptr : &P;
            data.b = b.data();
            data.c = c.data();

            ScsCone cone;
            std::memset(&cone, 0, sizeof(cone));
            cone.z = static_cast<scs_int>(num_zero);
            cone.l = static_cast<scs_int>(num_positive);
            cone.q = cone_sizes.empty() ? nullptr : cone_sizes.data();
            cone.qsize = static_cast<scs_int>(cone_sizes.size());

            ScsSettings settings;
            scs_set_default_settings(&settings);
            settings.eps_abs = options.tolerance;
            settings.eps_rel = options.tolerance;
            settings.max_iters = static_cast<scs_int>(options.max_iterations);
            settings.verbose = options.verbose ? 1 : 0;
            if (options.time_limit_seconds > 0.0)
            {
                settings.time_limit_secs = options.time_limit_seconds;
            }

            ScsSolution solution;
            std::memset(&solution, 0, sizeof(solution));
            ScsInfo info;
            std::memset(&info, 0, sizeof(info));

            const scs_int status_val = scs(&data, &cone, &settings, &solution, &info);

            // setup_time and solve_time are reported in milliseconds
            const bool hit_time_limit =
                options.time_limit_seconds > 0.0 &&
                (info.setup_time + info.solve_time) / 1000.0 >= options.time_limit_seconds;

            result.status = map_status(status_val, hit_time_limit);
            result.iterations = static_cast<int>(info.iter);
            result.objective_value = info.pobj;
            result.message = info.status;

            if (solution.x != nullptr)
            {
                result.solution = Eigen::VectorXd::Zero(n);
                for (int j = 0; j < n; ++j)
                {
                    result.solution(j) = solution.x[j];
                }
            }
            else if (result.success())
            {
                result.status = SolverStatus::NUMERICAL_FAILURE;
                result.message = "SCS returned no primal solution";
            }

            free_solution(solution);

            if (options.verbose)
            {
                std::cout << "SCS finished: " << result.message << " after "
                          << result.iterations << " iterations\n";
            }

            return result;
        }

    } // namespace optimizer
} // namespace convexfolio
