// SPDX-License-Identifier: MIT
/**
 * @file risk_measures.hpp
 * @brief Realized shortfall measures for a fixed weight vector
 *
 * These are the direct (non-optimization) evaluations of the shortfall
 * risk measures that the problem builder reformulates into LP/SOCP form.
 * They are used to report realized risk components of an optimized
 * portfolio and serve as oracles for the reformulations.
 *
 * For portfolio returns x_1..x_T and tail probability p:
 *
 *     ES_p(x)  = min_t { -t + 1/(T p) * sum_i max(0, t - x_i) }
 *     EQS_p(x) = min_t { -t + 1/p * || max(0, t - x) ||_2 }
 *
 * ES is evaluated in closed form by sorting; EQS by a one-dimensional
 * convex minimization over t.
 */

#pragma once

#include <Eigen/Dense>

namespace convexfolio
{
    namespace risk
    {

        /**
         * @brief Realized portfolio returns, returns * weights
         * @param returns Return matrix (T x N)
         * @param weights Portfolio weights (N x 1)
         * @throws std::invalid_argument on dimension mismatch
         */
        Eigen::VectorXd portfolio_returns(const Eigen::MatrixXd &returns,
                                          const Eigen::VectorXd &weights);

        /**
         * @brief Sample Expected Shortfall (positive number = expected loss)
         *
         * Sorts the returns ascending; with k = floor(T p) and
         * f = T p - k, ES = -(x_(1) + ... + x_(k) + f * x_(k+1)) / (T p).
         *
         * @param portfolio_returns Realized portfolio returns (T x 1)
         * @param tail_probability p, mapped through effective_tail_probability
         * @throws std::invalid_argument if the series is empty
         */
        double expected_shortfall(const Eigen::VectorXd &portfolio_returns,
                                  double tail_probability);

        /**
         * @brief Sample Expected Quadratic Shortfall
         *
         * The minimizing threshold lies in [min x, max x]; the objective is
         * convex in t, so a golden-section search converges to it.
         *
         * @param portfolio_returns Realized portfolio returns (T x 1)
         * @param tail_probability p, mapped through effective_tail_probability
         * @throws std::invalid_argument if the series is empty
         */
        double expected_quadratic_shortfall(const Eigen::VectorXd &portfolio_returns,
                                            double tail_probability);

        /**
         * @brief EQS objective at a given threshold t
         */
        double quadratic_shortfall_at(const Eigen::VectorXd &portfolio_returns,
                                      double threshold,
                                      double tail_probability);

    } // namespace risk
} // namespace convexfolio
