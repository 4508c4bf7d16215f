// SPDX-License-Identifier: MIT
/**
 * @file problem_builder.cpp
 * @brief Implementation of the LP/QP/SOCP reformulations
 */

#include "optimizer/problem_builder.hpp"
#include "model/errors.hpp"
#include "risk/sample_covariance.hpp"
#include "util/string_utils.hpp"

#include <cmath>
#include <limits>
#include <utility>
#include <vector>

namespace convexfolio
{
    namespace optimizer
    {

        namespace
        {
            const double INF = std::numeric_limits<double>::infinity();

            using RowCoefficients = std::vector<std::pair<int, double>>;

            /**
             * Accumulates variables, objective terms, rows and cones, then
             * freezes them into a CanonicalProgram.
             */
            class ProgramAssembly
            {
            public:
                ProgramAssembly(int num_weights, bool homogeneous)
                {
                    layout_.weights_offset = 0;
                    layout_.num_weights = num_weights;
                    add_variables(num_weights);
                    if (homogeneous)
                    {
                        layout_.kappa = add_variables(1);
                    }
                }

                int add_variables(int count)
                {
                    const int offset = num_variables_;
                    num_variables_ += count;
                    linear_.resize(static_cast<size_t>(num_variables_), 0.0);
                    return offset;
                }

                void add_linear(int index, double coefficient)
                {
                    linear_[static_cast<size_t>(index)] += coefficient;
                }

                void add_quadratic(int i, int j, double value)
                {
                    if (i > j)
                    {
                        std::swap(i, j);
                    }
                    quadratic_.emplace_back(i, j, value);
                }

                void add_row(const RowCoefficients &coefficients, double lower, double upper,
                             const std::string &label)
                {
                    const int row = static_cast<int>(lower_.size());
                    for (const auto &entry : coefficients)
                    {
                        if (entry.second != 0.0)
                        {
                            rows_.emplace_back(row, entry.first, entry.second);
                        }
                    }
                    lower_.push_back(lower);
                    upper_.push_back(upper);
                    labels_.push_back(label);
                }

                /**
                 * lower <= a'w <= upper. With kappa present the row is
                 * homogenized to a'y - lower*kappa >= 0, a'y - upper*kappa <= 0.
                 */
                void add_weight_row(const RowCoefficients &coefficients, double lower, double upper,
                                    const std::string &label)
                {
                    if (layout_.kappa < 0)
                    {
                        if (std::isfinite(lower) || std::isfinite(upper))
                        {
                            add_row(coefficients, lower, upper, label);
                        }
                        return;
                    }

                    if (std::isfinite(lower) && lower == upper)
                    {
                        add_row(with_kappa(coefficients, -lower), 0.0, 0.0, label);
                        return;
                    }
                    if (std::isfinite(lower))
                    {
                        add_row(with_kappa(coefficients, -lower), 0.0, INF, label);
                    }
                    if (std::isfinite(upper))
                    {
                        add_row(with_kappa(coefficients, -upper), -INF, 0.0, label);
                    }
                }

                void add_cone(int bound, int offset, int count)
                {
                    SecondOrderCone cone;
                    cone.bound = bound;
                    for (int k = 0; k < count; ++k)
                    {
                        cone.members.push_back(offset + k);
                    }
                    cones_.push_back(cone);
                }

                void add_risk_term(const RiskTermLayout &term)
                {
                    layout_.risk_terms.push_back(term);
                }

                int kappa() const { return layout_.kappa; }

                CanonicalProgram finish(ProblemClass problem_class) const
                {
                    CanonicalProgram program;
                    program.problem_class = problem_class;
                    program.num_variables = num_variables_;

                    program.P.resize(num_variables_, num_variables_);
                    program.P.setFromTriplets(quadratic_.begin(), quadratic_.end());
                    program.P.makeCompressed();

                    program.q = Eigen::Map<const Eigen::VectorXd>(
                        linear_.data(), static_cast<Eigen::Index>(linear_.size()));

                    const auto num_rows = static_cast<Eigen::Index>(lower_.size());
                    program.A.resize(num_rows, num_variables_);
                    program.A.setFromTriplets(rows_.begin(), rows_.end());
                    program.A.makeCompressed();

                    program.lower = Eigen::Map<const Eigen::VectorXd>(lower_.data(), num_rows);
                    program.upper = Eigen::Map<const Eigen::VectorXd>(upper_.data(), num_rows);
                    program.row_labels = labels_;
                    program.cones = cones_;
                    program.layout = layout_;

                    program.validate();
                    return program;
                }

            private:
                int num_variables_ = 0;
                std::vector<double> linear_;
                std::vector<Eigen::Triplet<double>> quadratic_;
                std::vector<Eigen::Triplet<double>> rows_;
                std::vector<double> lower_;
                std::vector<double> upper_;
                std::vector<std::string> labels_;
                std::vector<SecondOrderCone> cones_;
                VariableLayout layout_;

                RowCoefficients with_kappa(const RowCoefficients &coefficients, double kappa_coefficient) const
                {
                    RowCoefficients row = coefficients;
                    row.emplace_back(layout_.kappa, kappa_coefficient);
                    return row;
                }
            };

            RowCoefficients weight_coefficients(const std::vector<int> &indices, double value)
            {
                RowCoefficients row;
                row.reserve(indices.size());
                for (int i : indices)
                {
                    row.emplace_back(i, value);
                }
                return row;
            }

            void add_variance_term(ProgramAssembly &assembly, const Eigen::MatrixXd &returns,
                                   double risk_aversion, bool factor_form)
            {
                const int n = static_cast<int>(returns.cols());
                risk::SampleCovariance estimator;

                RiskTermLayout term;
                term.measure = model::RiskMeasure::VARIANCE;

                if (factor_form)
                {
                    // y = F w with F'F = Sigma, objective lambda * y'y
                    const Eigen::MatrixXd factor = estimator.estimate_factor(returns);
                    const int k = static_cast<int>(factor.rows());
                    const int offset = assembly.add_variables(k);

                    for (int r = 0; r < k; ++r)
                    {
                        RowCoefficients row;
                        row.emplace_back(offset + r, 1.0);
                        for (int j = 0; j < n; ++j)
                        {
                            row.emplace_back(j, -factor(r, j));
                        }
                        assembly.add_row(row, 0.0, 0.0, "variance_factor");
                        assembly.add_quadratic(offset + r, offset + r, 2.0 * risk_aversion);
                    }

                    term.factor_offset = offset;
                    term.factor_count = k;
                }
                else
                {
                    const Eigen::MatrixXd covariance = estimator.estimate_covariance(returns);
                    for (int i = 0; i < n; ++i)
                    {
                        for (int j = i; j < n; ++j)
                        {
                            if (covariance(i, j) != 0.0)
                            {
                                assembly.add_quadratic(i, j, 2.0 * risk_aversion * covariance(i, j));
                            }
                        }
                    }
                }

                assembly.add_risk_term(term);
            }

            /**
             * Shared rows of the ES and EQS reformulations:
             * aux_i - t + r_i'w >= 0 and aux_i >= 0.
             */
            int add_shortfall_rows(ProgramAssembly &assembly, const Eigen::MatrixXd &returns,
                                   int threshold, const std::string &prefix)
            {
                const int T = static_cast<int>(returns.rows());
                const int n = static_cast<int>(returns.cols());
                const int aux = assembly.add_variables(T);

                for (int i = 0; i < T; ++i)
                {
                    RowCoefficients row;
                    row.reserve(static_cast<size_t>(n + 2));
                    row.emplace_back(aux + i, 1.0);
                    row.emplace_back(threshold, -1.0);
                    for (int j = 0; j < n; ++j)
                    {
                        row.emplace_back(j, returns(i, j));
                    }
                    assembly.add_row(row, 0.0, INF, prefix + "_shortfall");
                }

                for (int i = 0; i < T; ++i)
                {
                    assembly.add_row({{aux + i, 1.0}}, 0.0, INF, prefix + "_nonnegative");
                }

                return aux;
            }

            void add_expected_shortfall_term(ProgramAssembly &assembly, const Eigen::MatrixXd &returns,
                                             double tail_probability, double risk_aversion)
            {
                const int T = static_cast<int>(returns.rows());
                const double p = model::effective_tail_probability(tail_probability);

                RiskTermLayout term;
                term.measure = model::RiskMeasure::EXPECTED_SHORTFALL;
                term.tail_probability = p;
                term.threshold = assembly.add_variables(1);
                term.aux_offset = add_shortfall_rows(assembly, returns, term.threshold, "es");
                term.aux_count = T;

                assembly.add_linear(term.threshold, -risk_aversion);
                for (int i = 0; i < T; ++i)
                {
                    assembly.add_linear(term.aux_offset + i, risk_aversion / (T * p));
                }

                assembly.add_risk_term(term);
            }

            void add_quadratic_shortfall_term(ProgramAssembly &assembly, const Eigen::MatrixXd &returns,
                                              double tail_probability, double risk_aversion)
            {
                const int T = static_cast<int>(returns.rows());
                const double p = model::effective_tail_probability(tail_probability);

                RiskTermLayout term;
                term.measure = model::RiskMeasure::EXPECTED_QUADRATIC_SHORTFALL;
                term.tail_probability = p;
                term.threshold = assembly.add_variables(1);
                term.aux_offset = add_shortfall_rows(assembly, returns, term.threshold, "eqs");
                term.aux_count = T;
                term.cone_bound = assembly.add_variables(1);

                assembly.add_cone(term.cone_bound, term.aux_offset, T);
                assembly.add_linear(term.threshold, -risk_aversion);
                assembly.add_linear(term.cone_bound, risk_aversion / p);

                assembly.add_risk_term(term);
            }

        } // anonymous namespace

        std::string to_string(OptimizationMode mode)
        {
            switch (mode)
            {
            case OptimizationMode::PLAIN:
                return "plain";
            case OptimizationMode::MAX_SHARPE_RATIO:
                return "max_sharpe_ratio";
            case OptimizationMode::MAX_ES_RATIO:
                return "max_es_ratio";
            case OptimizationMode::MAX_EQS_RATIO:
                return "max_eqs_ratio";
            }
            return "unknown";
        }

        OptimizationMode parse_optimization_mode(const std::string &tag)
        {
            const std::string s = util::to_lower(tag);
            if (s == "plain")
                return OptimizationMode::PLAIN;
            if (s == "max_sharpe_ratio" || s == "sharpe")
                return OptimizationMode::MAX_SHARPE_RATIO;
            if (s == "max_es_ratio")
                return OptimizationMode::MAX_ES_RATIO;
            if (s == "max_eqs_ratio")
                return OptimizationMode::MAX_EQS_RATIO;

            throw ValidationError("Unknown optimization mode: '" + tag +
                                  "'. Valid values: plain, max_sharpe_ratio, max_es_ratio, max_eqs_ratio");
        }

        std::optional<model::RiskMeasure> ratio_risk_measure(OptimizationMode mode)
        {
            switch (mode)
            {
            case OptimizationMode::MAX_SHARPE_RATIO:
                return model::RiskMeasure::VARIANCE;
            case OptimizationMode::MAX_ES_RATIO:
                return model::RiskMeasure::EXPECTED_SHORTFALL;
            case OptimizationMode::MAX_EQS_RATIO:
                return model::RiskMeasure::EXPECTED_QUADRATIC_SHORTFALL;
            case OptimizationMode::PLAIN:
                break;
            }
            return std::nullopt;
        }

        ProblemBuilder::ProblemBuilder(const BuilderOptions &options) : options_(options)
        {
            if (options_.dense_covariance_threshold < 1)
            {
                throw ValidationError("dense_covariance_threshold must be at least 1");
            }
        }

        bool ProblemBuilder::use_factor_form(size_t num_assets, size_t num_observations) const
        {
            return num_assets > static_cast<size_t>(options_.dense_covariance_threshold) ||
                   num_assets >= num_observations;
        }

        void ProblemBuilder::check_objectives(const model::PortfolioSpec &spec,
                                              OptimizationMode mode)
        {
            if (spec.objectives().empty())
            {
                throw ValidationError("Portfolio specification has no objectives");
            }

            const auto measure = ratio_risk_measure(mode);
            if (!measure)
            {
                return;
            }

            if (spec.num_return_objectives() != 1 || spec.num_risk_objectives() != 1)
            {
                throw InvalidObjectiveCombination(
                    "Mode " + to_string(mode) + " requires exactly one return objective and one " +
                    model::to_string(*measure) + " objective; got " +
                    std::to_string(spec.num_return_objectives()) + " return and " +
                    std::to_string(spec.num_risk_objectives()) + " risk objectives");
            }

            for (const auto &objective : spec.objectives())
            {
                const auto objective_measure = model::risk_measure_of(objective);
                if (objective_measure && *objective_measure != *measure)
                {
                    throw InvalidObjectiveCombination(
                        "Mode " + to_string(mode) + " requires a " + model::to_string(*measure) +
                        " objective, not " + model::objective_name(objective));
                }
            }
        }

        void ProblemBuilder::validate_window(const model::PortfolioSpec &spec,
                                             const model::ReturnSample &window)
        {
            if (window.num_assets() != spec.num_assets())
            {
                throw ValidationError(
                    "Asset count mismatch: specification has " + std::to_string(spec.num_assets()) +
                    " assets, return window has " + std::to_string(window.num_assets()));
            }

            for (size_t i = 0; i < spec.num_assets(); ++i)
            {
                if (window.assets()[i] != spec.assets()[i])
                {
                    throw ValidationError(
                        "Return column " + std::to_string(i) + " is '" + window.assets()[i] +
                        "' but specification asset is '" + spec.assets()[i] +
                        "'; align columns with ReturnSample::select");
                }
            }

            if (window.num_observations() < 2)
            {
                throw ValidationError(
                    "Return window needs at least 2 observations, got " +
                    std::to_string(window.num_observations()));
            }

            window.require_finite();
        }

        CanonicalProgram ProblemBuilder::build(const model::PortfolioSpec &spec,
                                               const model::ReturnSample &window,
                                               OptimizationMode mode) const
        {
            check_objectives(spec, mode);
            spec.validate();
            validate_window(spec, window);

            const Eigen::MatrixXd &returns = window.returns();
            const Eigen::VectorXd mu = window.mean();
            const int n = static_cast<int>(spec.num_assets());
            const bool homogeneous = mode != OptimizationMode::PLAIN;

            ProgramAssembly assembly(n, homogeneous);

            // Linear constraint block
            for (const auto &constraint : spec.constraints())
            {
                if (std::holds_alternative<model::FullInvestment>(constraint))
                {
                    // Implied by 1'y = kappa in ratio modes
                    if (!homogeneous)
                    {
                        assembly.add_weight_row(weight_coefficients(spec.asset_indices({}), 1.0),
                                                1.0, 1.0, "full_investment");
                    }
                }
                else if (std::holds_alternative<model::LongOnly>(constraint))
                {
                    for (int i = 0; i < n; ++i)
                    {
                        assembly.add_weight_row({{i, 1.0}}, 0.0, INF, "long_only");
                    }
                }
                else if (const auto *box = std::get_if<model::Box>(&constraint))
                {
                    for (int i : spec.asset_indices(box->assets))
                    {
                        assembly.add_weight_row({{i, 1.0}}, box->min_weight, box->max_weight,
                                                "box:" + spec.assets()[static_cast<size_t>(i)]);
                    }
                }
                else if (const auto *group = std::get_if<model::Group>(&constraint))
                {
                    assembly.add_weight_row(weight_coefficients(spec.asset_indices(group->assets), 1.0),
                                            group->min_weight, group->max_weight,
                                            "group:" + group->name);
                }
                else if (const auto *target = std::get_if<model::ReturnTarget>(&constraint))
                {
                    RowCoefficients row;
                    for (int i = 0; i < n; ++i)
                    {
                        row.emplace_back(i, mu(i));
                    }
                    assembly.add_weight_row(row, target->target,
                                            target->equality ? target->target : INF,
                                            "return_target");
                }
            }

            if (homogeneous)
            {
                RowCoefficients excess;
                RowCoefficients budget;
                for (int i = 0; i < n; ++i)
                {
                    excess.emplace_back(i, mu(i) - spec.risk_free_rate());
                    budget.emplace_back(i, 1.0);
                }
                budget.emplace_back(assembly.kappa(), -1.0);

                assembly.add_row(excess, 1.0, 1.0, "ratio_normalization");
                assembly.add_row(budget, 0.0, 0.0, "ratio_budget");
            }

            // Objective terms
            bool has_variance = false;
            bool has_cone = false;
            const bool factor_form = use_factor_form(spec.num_assets(), window.num_observations());

            for (const auto &objective : spec.objectives())
            {
                if (const auto *mean = std::get_if<model::MeanReturn>(&objective))
                {
                    // The numerator is fixed by the normalization row in ratio modes
                    if (!homogeneous)
                    {
                        for (int i = 0; i < n; ++i)
                        {
                            assembly.add_linear(i, -mean->weight * mu(i));
                        }
                    }
                }
                else if (const auto *variance = std::get_if<model::Variance>(&objective))
                {
                    add_variance_term(assembly, returns, variance->risk_aversion, factor_form);
                    has_variance = true;
                }
                else if (const auto *es = std::get_if<model::ExpectedShortfall>(&objective))
                {
                    add_expected_shortfall_term(assembly, returns, es->tail_probability, es->risk_aversion);
                }
                else if (const auto *eqs = std::get_if<model::ExpectedQuadraticShortfall>(&objective))
                {
                    add_quadratic_shortfall_term(assembly, returns, eqs->tail_probability, eqs->risk_aversion);
                    has_cone = true;
                }
            }

            ProblemClass problem_class = ProblemClass::LP;
            if (has_cone)
            {
                problem_class = ProblemClass::SOCP;
            }
            else if (has_variance)
            {
                problem_class = ProblemClass::QP;
            }

            return assembly.finish(problem_class);
        }

    } // namespace optimizer
} // namespace convexfolio
