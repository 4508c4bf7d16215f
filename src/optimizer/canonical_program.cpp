// SPDX-License-Identifier: MIT
/**
 * @file canonical_program.cpp
 * @brief Implementation of CanonicalProgram helpers
 */

#include "optimizer/canonical_program.hpp"
#include <stdexcept>

namespace convexfolio
{
    namespace optimizer
    {

        std::string to_string(ProblemClass problem_class)
        {
            switch (problem_class)
            {
            case ProblemClass::LP:
                return "LP";
            case ProblemClass::QP:
                return "QP";
            case ProblemClass::SOCP:
                return "SOCP";
            }
            return "unknown";
        }

        int CanonicalProgram::count_rows(const std::string &label_prefix) const
        {
            int count = 0;
            for (const auto &label : row_labels)
            {
                if (label.compare(0, label_prefix.size(), label_prefix) == 0)
                {
                    ++count;
                }
            }
            return count;
        }

        double CanonicalProgram::objective_value(const Eigen::VectorXd &x) const
        {
            // P holds the upper triangle only
            Eigen::VectorXd Px = P.selfadjointView<Eigen::Upper>() * x;
            return 0.5 * x.dot(Px) + q.dot(x);
        }

        Eigen::VectorXd CanonicalProgram::weights(const Eigen::VectorXd &x) const
        {
            return x.segment(layout.weights_offset, layout.num_weights);
        }

        void CanonicalProgram::validate() const
        {
            if (num_variables <= 0)
            {
                throw std::invalid_argument("Canonical program has no variables");
            }

            if (P.rows() != num_variables || P.cols() != num_variables)
            {
                throw std::invalid_argument("P matrix size mismatch");
            }

            if (q.size() != num_variables)
            {
                throw std::invalid_argument("q vector size mismatch");
            }

            if (A.cols() != num_variables)
            {
                throw std::invalid_argument("A matrix column count mismatch");
            }

            if (lower.size() != A.rows() || upper.size() != A.rows())
            {
                throw std::invalid_argument("Row bound vectors do not match A");
            }

            for (Eigen::Index i = 0; i < lower.size(); ++i)
            {
                if (lower(i) > upper(i))
                {
                    throw std::invalid_argument(
                        "Row " + std::to_string(i) + " has lower bound above upper bound");
                }
            }

            for (const auto &cone : cones)
            {
                if (cone.bound < 0 || cone.bound >= num_variables || cone.members.empty())
                {
                    throw std::invalid_argument("Second-order cone has invalid bound index");
                }
                for (int member : cone.members)
                {
                    if (member < 0 || member >= num_variables)
                    {
                        throw std::invalid_argument("Second-order cone has invalid member index");
                    }
                }
            }

            if (!cones.empty() && problem_class != ProblemClass::SOCP)
            {
                throw std::invalid_argument("Program with cones must be tagged SOCP");
            }
        }

    } // namespace optimizer
} // namespace convexfolio
