// SPDX-License-Identifier: MIT
/**
 * @file portfolio_optimizer.cpp
 * @brief Implementation of the single-period optimizer
 */

#include "optimizer/portfolio_optimizer.hpp"
#include "risk/risk_measures.hpp"
#include "risk/sample_covariance.hpp"

#include <cmath>
#include <sstream>

namespace convexfolio
{
    namespace optimizer
    {

        PortfolioOptimizer::PortfolioOptimizer(const SolverAdapterConfig &config,
                                               const BuilderOptions &builder_options)
            : builder_(builder_options),
              adapter_(config)
        {
        }

        OptimizationResult PortfolioOptimizer::optimize(const model::PortfolioSpec &spec,
                                                        const model::ReturnSample &window,
                                                        OptimizationMode mode,
                                                        const std::string &solver_choice) const
        {
            const CanonicalProgram program = builder_.build(spec, window, mode);
            const std::string choice = solver_choice.empty() ? spec.solver() : solver_choice;
            const bool ratio_mode = mode != OptimizationMode::PLAIN;

            SolverResult solved = adapter_.solve(program, choice);

            if (!solved.success())
            {
                if (ratio_mode && solved.status == SolverStatus::INFEASIBLE)
                {
                    // (mu - rf)'y = 1 cannot be met: no portfolio earns a positive excess return
                    throw_for_status(SolverStatus::INFEASIBLE_RATIO, solved.solver_name,
                                     "no feasible portfolio with positive excess return (" +
                                         solved.message + ")");
                }
                throw_for_status(solved.status, solved.solver_name, solved.message);
            }

            Eigen::VectorXd weights = program.weights(solved.solution);

            if (ratio_mode)
            {
                const double kappa = solved.solution(program.layout.kappa);
                if (!(kappa > KAPPA_TOLERANCE))
                {
                    std::ostringstream oss;
                    oss << "normalization scalar kappa = " << kappa
                        << " is not positive; the ratio is undefined";
                    throw_for_status(SolverStatus::INFEASIBLE_RATIO, solved.solver_name, oss.str());
                }
                weights /= kappa;
            }

            if (!weights.allFinite())
            {
                throw_for_status(SolverStatus::NUMERICAL_FAILURE, solved.solver_name,
                                 "solver returned non-finite weights");
            }

            OptimizationResult result = evaluate(spec, window, weights, mode);
            result.solver_name = solved.solver_name;
            result.status = solved.status;
            result.iterations = solved.iterations;
            result.message = solved.message;
            return result;
        }

        OptimizationResult PortfolioOptimizer::evaluate(const model::PortfolioSpec &spec,
                                                        const model::ReturnSample &window,
                                                        const Eigen::VectorXd &weights,
                                                        OptimizationMode mode)
        {
            if (weights.size() != static_cast<Eigen::Index>(window.num_assets()))
            {
                throw ValidationError(
                    "Weight vector size (" + std::to_string(weights.size()) +
                    ") does not match number of assets (" + std::to_string(window.num_assets()) + ")");
            }

            OptimizationResult result;
            result.weights = weights;
            result.status = SolverStatus::SOLVED;

            const Eigen::VectorXd mu = window.mean();
            const Eigen::VectorXd realized = risk::portfolio_returns(window.returns(), weights);

            // w' Sigma w = ||F w||^2 with the T x n factor; Sigma itself is never formed
            const Eigen::MatrixXd factor = risk::SampleCovariance().estimate_factor(window.returns());

            result.expected_return = mu.dot(weights);
            result.variance = (factor * weights).squaredNorm();
            result.volatility = std::sqrt(result.variance);

            double objective = 0.0;
            for (const auto &term : spec.objectives())
            {
                if (const auto *mean = std::get_if<model::MeanReturn>(&term))
                {
                    objective -= mean->weight * result.expected_return;
                }
                else if (const auto *variance = std::get_if<model::Variance>(&term))
                {
                    objective += variance->risk_aversion * result.variance;
                }
                else if (const auto *es = std::get_if<model::ExpectedShortfall>(&term))
                {
                    const double value = risk::expected_shortfall(realized, es->tail_probability);
                    if (!result.expected_shortfall)
                    {
                        result.expected_shortfall = value;
                    }
                    objective += es->risk_aversion * value;
                }
                else if (const auto *eqs = std::get_if<model::ExpectedQuadraticShortfall>(&term))
                {
                    const double value = risk::expected_quadratic_shortfall(realized, eqs->tail_probability);
                    if (!result.expected_quadratic_shortfall)
                    {
                        result.expected_quadratic_shortfall = value;
                    }
                    objective += eqs->risk_aversion * value;
                }
            }
            result.objective_value = objective;

            const auto measure = ratio_risk_measure(mode);
            if (measure)
            {
                double risk = result.volatility;
                if (*measure == model::RiskMeasure::EXPECTED_SHORTFALL && result.expected_shortfall)
                {
                    risk = *result.expected_shortfall;
                }
                else if (*measure == model::RiskMeasure::EXPECTED_QUADRATIC_SHORTFALL &&
                         result.expected_quadratic_shortfall)
                {
                    risk = *result.expected_quadratic_shortfall;
                }

                if (risk > 0.0)
                {
                    result.ratio = (result.expected_return - spec.risk_free_rate()) / risk;
                }
            }

            return result;
        }

    } // namespace optimizer
} // namespace convexfolio
