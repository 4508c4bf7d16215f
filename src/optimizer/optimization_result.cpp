// SPDX-License-Identifier: MIT
/**
 * @file optimization_result.cpp
 * @brief Implementation of OptimizationResult reporting
 */

#include "optimizer/optimization_result.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>

namespace convexfolio
{
    namespace optimizer
    {

        OptimizationResult::OptimizationResult()
            : expected_return(0.0),
              variance(0.0),
              volatility(0.0),
              objective_value(0.0),
              status(SolverStatus::NUMERICAL_FAILURE),
              iterations(0)
        {
        }

        bool OptimizationResult::is_valid() const
        {
            return is_success(status) && weights.size() > 0 && weights.allFinite();
        }

        void OptimizationResult::print_summary() const
        {
            std::cout << "\n=== Optimization Result ===\n";
            std::cout << "Status: " << to_string(status) << "\n";
            std::cout << "Solver: " << solver_name << "\n";
            std::cout << "Message: " << message << "\n";
            std::cout << "Iterations: " << iterations << "\n";
            std::cout << std::string(50, '-') << "\n";

            if (is_valid())
            {
                std::cout << "Portfolio Statistics:\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << expected_return * 100 << "%\n";
                std::cout << "  Volatility:       " << volatility * 100 << "%\n";
                if (expected_shortfall)
                {
                    std::cout << "  Expected Shortfall: " << *expected_shortfall * 100 << "%\n";
                }
                if (expected_quadratic_shortfall)
                {
                    std::cout << "  Expected Quadratic Shortfall: "
                              << *expected_quadratic_shortfall * 100 << "%\n";
                }
                if (ratio)
                {
                    std::cout << "  Ratio:            " << std::setprecision(3) << *ratio << "\n";
                }
                std::cout << "  Objective Value:  " << std::setprecision(6)
                          << objective_value << "\n";

                std::cout << "\nWeight Statistics:\n";
                std::cout << "  Number of assets: " << weights.size() << "\n";
                std::cout << "  Sum of weights:   " << std::setprecision(4)
                          << weights.sum() << "\n";
                std::cout << "  Min weight:       " << weights.minCoeff() << "\n";
                std::cout << "  Max weight:       " << weights.maxCoeff() << "\n";

                int non_zero = 0;
                for (int i = 0; i < weights.size(); ++i)
                {
                    if (std::abs(weights(i)) > 1e-6)
                    {
                        ++non_zero;
                    }
                }
                std::cout << "  Non-zero positions: " << non_zero << "\n";
            }

            std::cout << "===========================\n"
                      << std::endl;
        }

        nlohmann::json OptimizationResult::to_json(const std::vector<std::string> &assets) const
        {
            nlohmann::json j;
            j["status"] = to_string(status);
            j["solver"] = solver_name;
            j["iterations"] = iterations;
            j["message"] = message;

            // NaN is not representable in JSON; undefined weights become null
            auto number = [](double value) -> nlohmann::json
            {
                return std::isfinite(value) ? nlohmann::json(value) : nlohmann::json(nullptr);
            };

            if (assets.size() == static_cast<size_t>(weights.size()))
            {
                nlohmann::json w = nlohmann::json::object();
                for (size_t i = 0; i < assets.size(); ++i)
                {
                    w[assets[i]] = number(weights(static_cast<Eigen::Index>(i)));
                }
                j["weights"] = w;
            }
            else
            {
                nlohmann::json w = nlohmann::json::array();
                for (Eigen::Index i = 0; i < weights.size(); ++i)
                {
                    w.push_back(number(weights(i)));
                }
                j["weights"] = w;
            }

            if (is_valid())
            {
                j["expected_return"] = expected_return;
                j["variance"] = variance;
                j["volatility"] = volatility;
                j["objective_value"] = objective_value;
                if (expected_shortfall)
                    j["expected_shortfall"] = *expected_shortfall;
                if (expected_quadratic_shortfall)
                    j["expected_quadratic_shortfall"] = *expected_quadratic_shortfall;
                if (ratio)
                    j["ratio"] = *ratio;
            }

            return j;
        }

    } // namespace optimizer
} // namespace convexfolio
