// SPDX-License-Identifier: MIT
/**
 * @file efficient_frontier.cpp
 * @brief Implementation of efficient frontier computation
 */

#include "optimizer/efficient_frontier.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace convexfolio
{
    namespace optimizer
    {

        namespace
        {
            double risk_value(const OptimizationResult &result, model::RiskMeasure measure)
            {
                switch (measure)
                {
                case model::RiskMeasure::VARIANCE:
                    return result.variance;
                case model::RiskMeasure::EXPECTED_SHORTFALL:
                    return result.expected_shortfall.value_or(std::numeric_limits<double>::quiet_NaN());
                case model::RiskMeasure::EXPECTED_QUADRATIC_SHORTFALL:
                    return result.expected_quadratic_shortfall.value_or(std::numeric_limits<double>::quiet_NaN());
                }
                return std::numeric_limits<double>::quiet_NaN();
            }
        } // anonymous namespace

        // ============================================================================
        // FrontierPoint Implementation
        // ============================================================================

        FrontierPoint::FrontierPoint()
            : target_return(0.0),
              expected_return(0.0),
              risk(0.0),
              volatility(0.0),
              status(SolverStatus::NUMERICAL_FAILURE),
              is_valid(false)
        {
        }

        FrontierPoint::FrontierPoint(const OptimizationResult &result, model::RiskMeasure measure,
                                     double target)
            : target_return(target),
              expected_return(result.expected_return),
              risk(risk_value(result, measure)),
              volatility(result.volatility),
              weights(result.weights),
              status(result.status),
              message(result.message),
              is_valid(result.is_valid())
        {
        }

        // ============================================================================
        // EfficientFrontierResult Implementation
        // ============================================================================

        EfficientFrontierResult::EfficientFrontierResult()
            : risk_measure(model::RiskMeasure::VARIANCE),
              tail_probability(model::DEFAULT_TAIL_PROBABILITY),
              success(false),
              monotonic(true)
        {
        }

        bool EfficientFrontierResult::is_valid() const
        {
            return success && num_valid_points() > 0;
        }

        size_t EfficientFrontierResult::num_valid_points() const
        {
            return static_cast<size_t>(std::count_if(points.begin(), points.end(),
                                                     [](const FrontierPoint &p)
                                                     { return p.is_valid; }));
        }

        void EfficientFrontierResult::print_summary() const
        {
            std::cout << "\n=== Efficient Frontier Summary ===\n";
            std::cout << "Status: " << (success ? "SUCCESS" : "FAILED") << "\n";
            std::cout << "Message: " << message << "\n";
            std::cout << "Risk measure: " << model::to_string(risk_measure);
            if (risk_measure != model::RiskMeasure::VARIANCE)
            {
                std::cout << " (p = " << tail_probability << ")";
            }
            std::cout << "\n";
            std::cout << "Total points: " << points.size() << "\n";
            std::cout << "Valid points: " << num_valid_points() << "\n";
            std::cout << "Monotonic: " << (monotonic ? "yes" : "no") << "\n";
            std::cout << std::string(60, '-') << "\n";

            if (min_risk_portfolio.is_valid)
            {
                std::cout << "\nMinimum Risk Portfolio:\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << min_risk_portfolio.expected_return * 100 << "%\n";
                std::cout << "  Risk:             " << std::setprecision(6)
                          << min_risk_portfolio.risk << "\n";
            }

            if (max_return_portfolio.is_valid)
            {
                std::cout << "\nMaximum Return Portfolio:\n";
                std::cout << "  Expected Return:  " << std::fixed << std::setprecision(4)
                          << max_return_portfolio.expected_return * 100 << "%\n";
                std::cout << "  Risk:             " << std::setprecision(6)
                          << max_return_portfolio.risk << "\n";
            }

            if (num_valid_points() > 0)
            {
                std::cout << "\n  " << std::setw(12) << "Return" << std::setw(14) << "Risk"
                          << std::setw(14) << "Volatility" << "\n";
                for (const auto &point : points)
                {
                    if (!point.is_valid)
                    {
                        std::cout << "  " << std::setw(12) << point.target_return
                                  << "  (failed: " << to_string(point.status) << ")\n";
                        continue;
                    }
                    std::cout << "  " << std::setw(12) << std::setprecision(6) << point.expected_return
                              << std::setw(14) << point.risk
                              << std::setw(14) << point.volatility << "\n";
                }
            }

            for (const auto &warning : warnings)
            {
                std::cout << "  Warning: " << warning << "\n";
            }

            std::cout << "================================\n"
                      << std::endl;
        }

        void EfficientFrontierResult::export_to_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "target_return,expected_return,risk,volatility,status,is_valid";
            for (const auto &asset : assets)
            {
                file << "," << asset;
            }
            file << "\n";

            for (const auto &point : points)
            {
                file << std::fixed << std::setprecision(8)
                     << point.target_return << ","
                     << point.expected_return << ","
                     << point.risk << ","
                     << point.volatility << ","
                     << to_string(point.status) << ","
                     << (point.is_valid ? "1" : "0");
                for (size_t i = 0; i < assets.size(); ++i)
                {
                    file << ",";
                    if (point.is_valid && static_cast<size_t>(point.weights.size()) == assets.size())
                    {
                        file << point.weights(static_cast<Eigen::Index>(i));
                    }
                }
                file << "\n";
            }

            file.close();
        }

        // ============================================================================
        // EfficientFrontier Implementation
        // ============================================================================

        EfficientFrontier::EfficientFrontier(const PortfolioOptimizer &optimizer)
            : optimizer_(optimizer),
              num_points_(DEFAULT_NUM_POINTS),
              equality_target_(false),
              tolerance_(1e-6)
        {
        }

        void EfficientFrontier::set_num_points(int num_points)
        {
            if (num_points < 2)
            {
                throw std::invalid_argument(
                    "Number of points must be at least 2, got: " +
                    std::to_string(num_points));
            }
            num_points_ = num_points;
        }

        void EfficientFrontier::set_tolerance(double tolerance)
        {
            if (!(tolerance > 0.0))
            {
                throw std::invalid_argument("Frontier tolerance must be positive");
            }
            tolerance_ = tolerance;
        }

        EfficientFrontierResult EfficientFrontier::compute(const model::PortfolioSpec &spec,
                                                           const model::ReturnSample &sample,
                                                           model::RiskMeasure measure,
                                                           double tail_probability,
                                                           const std::string &solver_choice) const
        {
            EfficientFrontierResult result;
            result.risk_measure = measure;
            result.tail_probability = tail_probability;
            result.assets = spec.assets();

            const model::PortfolioSpec base = spec.without_objectives();
            const model::Objective risk_objective = model::make_risk_objective(measure, tail_probability, 1.0);

            // Anchor solves; failures here propagate to the caller
            const model::PortfolioSpec max_return_spec = base.with_objective(model::MeanReturn{});
            const model::PortfolioSpec min_risk_spec = base.with_objective(risk_objective);

            OptimizationResult max_return = optimizer_.optimize(max_return_spec, sample,
                                                                OptimizationMode::PLAIN, solver_choice);
            OptimizationResult min_risk = optimizer_.optimize(min_risk_spec, sample,
                                                              OptimizationMode::PLAIN, solver_choice);

            // Risk of the max-return anchor is measured with the frontier's measure
            OptimizationResult max_return_evaluated =
                PortfolioOptimizer::evaluate(min_risk_spec, sample, max_return.weights);
            max_return_evaluated.status = max_return.status;
            max_return_evaluated.message = max_return.message;

            result.max_return_portfolio = FrontierPoint(max_return_evaluated, measure,
                                                        max_return.expected_return);
            result.min_risk_portfolio = FrontierPoint(min_risk, measure, min_risk.expected_return);
            result.success = true;

            const double low = min_risk.expected_return;
            const double high = max_return.expected_return;

            if (high - low <= tolerance_ * (1.0 + std::abs(high)))
            {
                result.points.push_back(result.min_risk_portfolio);
                result.message = "Degenerate return range: minimum-risk portfolio already has the maximum mean";
                return result;
            }

            result.points.reserve(static_cast<size_t>(num_points_));
            for (int k = 0; k < num_points_; ++k)
            {
                const double target = low + (high - low) * static_cast<double>(k) /
                                                  static_cast<double>(num_points_ - 1);

                const model::PortfolioSpec target_spec =
                    base.with_constraint(model::ReturnTarget{target, equality_target_})
                        .with_objective(risk_objective);

                try
                {
                    OptimizationResult solved = optimizer_.optimize(target_spec, sample,
                                                                    OptimizationMode::PLAIN, solver_choice);
                    result.points.emplace_back(solved, measure, target);
                }
                catch (const SolveError &e)
                {
                    FrontierPoint failed;
                    failed.target_return = target;
                    failed.status = e.status();
                    failed.message = e.what();
                    result.points.push_back(failed);

                    std::ostringstream oss;
                    oss << "target return " << target << " failed: " << e.what();
                    result.warnings.push_back(oss.str());
                    std::cerr << "Warning: Frontier " << oss.str() << "\n";
                }
            }

            check_monotonicity(result);

            std::ostringstream oss;
            oss << "Computed " << result.num_valid_points() << " of " << num_points_
                << " frontier points";
            result.message = oss.str();

            return result;
        }

        void EfficientFrontier::check_monotonicity(EfficientFrontierResult &result) const
        {
            const FrontierPoint *previous = nullptr;

            for (const auto &point : result.points)
            {
                if (!point.is_valid)
                {
                    continue;
                }

                if (previous != nullptr)
                {
                    const double mean_slack = tolerance_ * (1.0 + std::abs(previous->expected_return));
                    const double risk_slack = tolerance_ * (1.0 + std::abs(previous->risk));

                    if (point.expected_return <= previous->expected_return + mean_slack)
                    {
                        std::ostringstream oss;
                        oss << "mean does not increase from " << previous->expected_return << " to "
                            << point.expected_return << " at target " << point.target_return;
                        result.warnings.push_back(oss.str());
                        result.monotonic = false;
                    }

                    if (point.risk < previous->risk - risk_slack)
                    {
                        std::ostringstream oss;
                        oss << "risk decreases from " << previous->risk << " to "
                            << point.risk << " at target " << point.target_return;
                        result.warnings.push_back(oss.str());
                        result.monotonic = false;
                    }
                }

                previous = &point;
            }

            if (!result.monotonic)
            {
                std::cerr << "Warning: Efficient frontier is not monotonic ("
                          << result.warnings.size() << " warnings)\n";
            }
        }

    } // namespace optimizer
} // namespace convexfolio
