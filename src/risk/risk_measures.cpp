// SPDX-License-Identifier: MIT
/**
 * @file risk_measures.cpp
 * @brief Closed-form and line-search evaluation of shortfall measures
 */

#include "risk/risk_measures.hpp"
#include "model/portfolio_spec.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace convexfolio
{
    namespace risk
    {

        Eigen::VectorXd portfolio_returns(const Eigen::MatrixXd &returns,
                                          const Eigen::VectorXd &weights)
        {
            if (returns.cols() != weights.size())
            {
                throw std::invalid_argument(
                    "Weight vector size (" + std::to_string(weights.size()) +
                    ") does not match number of assets (" + std::to_string(returns.cols()) + ")");
            }
            return returns * weights;
        }

        double expected_shortfall(const Eigen::VectorXd &portfolio_returns,
                                  double tail_probability)
        {
            const Eigen::Index n = portfolio_returns.size();
            if (n == 0)
            {
                throw std::invalid_argument("Cannot compute expected shortfall of an empty series");
            }

            const double p = model::effective_tail_probability(tail_probability);

            std::vector<double> sorted(portfolio_returns.data(), portfolio_returns.data() + n);
            std::sort(sorted.begin(), sorted.end());

            const double tail_mass = static_cast<double>(n) * p;
            // Guard against T*p landing a hair below an integer
            const Eigen::Index k = std::min<Eigen::Index>(
                n - 1, static_cast<Eigen::Index>(std::floor(tail_mass + 1e-12)));
            const double fraction = std::max(0.0, tail_mass - static_cast<double>(k));

            double tail_sum = 0.0;
            for (Eigen::Index i = 0; i < k; ++i)
            {
                tail_sum += sorted[static_cast<size_t>(i)];
            }
            tail_sum += fraction * sorted[static_cast<size_t>(k)];

            return -tail_sum / tail_mass;
        }

        double quadratic_shortfall_at(const Eigen::VectorXd &portfolio_returns,
                                      double threshold,
                                      double tail_probability)
        {
            const double p = model::effective_tail_probability(tail_probability);
            Eigen::VectorXd shortfall =
                (Eigen::VectorXd::Constant(portfolio_returns.size(), threshold) - portfolio_returns)
                    .cwiseMax(0.0);
            return -threshold + shortfall.norm() / p;
        }

        double expected_quadratic_shortfall(const Eigen::VectorXd &portfolio_returns,
                                            double tail_probability)
        {
            if (portfolio_returns.size() == 0)
            {
                throw std::invalid_argument("Cannot compute expected quadratic shortfall of an empty series");
            }

            double lo = portfolio_returns.minCoeff();
            double hi = portfolio_returns.maxCoeff();

            const double ratio = 0.5 * (std::sqrt(5.0) - 1.0);
            double a = hi - ratio * (hi - lo);
            double b = lo + ratio * (hi - lo);
            double fa = quadratic_shortfall_at(portfolio_returns, a, tail_probability);
            double fb = quadratic_shortfall_at(portfolio_returns, b, tail_probability);

            for (int it = 0; it < 200 && (hi - lo) > 1e-14 * (1.0 + std::abs(lo)); ++it)
            {
                if (fa <= fb)
                {
                    hi = b;
                    b = a;
                    fb = fa;
                    a = hi - ratio * (hi - lo);
                    fa = quadratic_shortfall_at(portfolio_returns, a, tail_probability);
                }
                else
                {
                    lo = a;
                    a = b;
                    fa = fb;
                    b = lo + ratio * (hi - lo);
                    fb = quadratic_shortfall_at(portfolio_returns, b, tail_probability);
                }
            }

            // Endpoints included: the minimizer may sit on min x
            double best = std::min(fa, fb);
            best = std::min(best, quadratic_shortfall_at(portfolio_returns, lo, tail_probability));
            best = std::min(best, quadratic_shortfall_at(portfolio_returns, hi, tail_probability));
            return best;
        }

    } // namespace risk
} // namespace convexfolio
