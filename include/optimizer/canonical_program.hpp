// SPDX-License-Identifier: MIT
/**
 * @file canonical_program.hpp
 * @brief Solver-agnostic convex program produced by the problem builder
 *
 * Problem formulation:
 *
 *   minimize     (1/2) x^T P x + q^T x
 *   subject to   l <= A x <= u
 *                || x_J ||_2 <= x_j      for every second-order cone (j, J)
 *
 * P is stored upper-triangular, as OSQP and SCS expect. Rows with l == u
 * are equalities; infinite entries of l or u mark one-sided rows.
 *
 * The variable vector is laid out as [w | kappa | per-risk-term auxiliaries];
 * VariableLayout records where each block lives so the optimizer can read
 * the solution back.
 */

#pragma once

#include "model/portfolio_spec.hpp"

#include <Eigen/Dense>
#include <Eigen/Sparse>
#include <string>
#include <vector>

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @enum ProblemClass
         * @brief Smallest cone class able to express a program
         */
        enum class ProblemClass
        {
            LP,  ///< Linear objective, linear rows
            QP,  ///< Quadratic objective, linear rows
            SOCP ///< Second-order cone rows present
        };

        std::string to_string(ProblemClass problem_class);

        /**
         * @struct SecondOrderCone
         * @brief || x[members] ||_2 <= x[bound]
         */
        struct SecondOrderCone
        {
            int bound = -1;
            std::vector<int> members;
        };

        /**
         * @struct RiskTermLayout
         * @brief Variables introduced for one risk objective
         */
        struct RiskTermLayout
        {
            model::RiskMeasure measure = model::RiskMeasure::VARIANCE;
            double tail_probability = 0.0; ///< Effective p (shortfall terms)
            int threshold = -1;            ///< t (shortfall terms)
            int aux_offset = -1;           ///< u or s, one per observation
            int aux_count = 0;
            int cone_bound = -1;           ///< z (EQS)
            int factor_offset = -1;        ///< y = F w (factorized variance)
            int factor_count = 0;
        };

        /**
         * @struct VariableLayout
         * @brief Position of each variable block in x
         */
        struct VariableLayout
        {
            int weights_offset = 0;
            int num_weights = 0;
            int kappa = -1; ///< Normalization scalar, ratio modes only
            std::vector<RiskTermLayout> risk_terms;
        };

        /**
         * @struct CanonicalProgram
         * @brief Complete program handed to a solver backend
         */
        struct CanonicalProgram
        {
            ProblemClass problem_class = ProblemClass::LP;
            int num_variables = 0;

            Eigen::SparseMatrix<double> P; ///< Quadratic term, upper triangle (n_var x n_var)
            Eigen::VectorXd q;             ///< Linear term (n_var)

            Eigen::SparseMatrix<double> A; ///< Linear rows (m x n_var)
            Eigen::VectorXd lower;         ///< Row lower bounds (m), may be -inf
            Eigen::VectorXd upper;         ///< Row upper bounds (m), may be +inf
            std::vector<std::string> row_labels; ///< Origin of each row

            std::vector<SecondOrderCone> cones;

            VariableLayout layout;

            int num_rows() const { return static_cast<int>(A.rows()); }

            /**
             * @brief Number of rows whose label starts with a prefix
             */
            int count_rows(const std::string &label_prefix) const;

            /**
             * @brief (1/2) x^T P x + q^T x, using the stored upper triangle
             */
            double objective_value(const Eigen::VectorXd &x) const;

            /**
             * @brief Weight block of a solution vector
             */
            Eigen::VectorXd weights(const Eigen::VectorXd &x) const;

            /**
             * @brief Check dimensions, bound ordering and cone indices
             * @throws std::invalid_argument if the program is ill-formed
             */
            void validate() const;
        };

    } // namespace optimizer
} // namespace convexfolio
