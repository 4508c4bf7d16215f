// SPDX-License-Identifier: MIT
/**
 * @file test_problem_builder.cpp
 * @brief Unit tests for the PortfolioSpec-to-program compiler
 */

#include <catch2/catch.hpp>
#include "optimizer/problem_builder.hpp"
#include "risk/risk_measures.hpp"
#include "risk/sample_covariance.hpp"
#include "model/errors.hpp"
#include <limits>

using namespace convexfolio;
using namespace convexfolio::model;
using namespace convexfolio::optimizer;
using Catch::Detail::Approx;
using Catch::Matchers::WithinAbs;

namespace {

ReturnSample four_period_sample() {
    Eigen::MatrixXd r(4, 3);
    r << 0.01, 0.02, -0.01,
         0.00, 0.01, 0.02,
         -0.02, 0.00, 0.01,
         0.03, -0.01, 0.00;
    return ReturnSample(r, {"2024-01-31", "2024-02-29", "2024-03-31", "2024-04-30"}, {"A", "B", "C"});
}

PortfolioSpec base_spec() {
    return PortfolioSpec({"A", "B", "C"})
        .with_constraint(FullInvestment{})
        .with_constraint(LongOnly{});
}

// Largest violation of lower <= A x <= upper
double max_row_violation(const CanonicalProgram& program, const Eigen::VectorXd& x) {
    const Eigen::VectorXd ax = program.A * x;
    double worst = 0.0;
    for (Eigen::Index i = 0; i < ax.size(); ++i) {
        worst = std::max(worst, program.lower(i) - ax(i));
        worst = std::max(worst, ax(i) - program.upper(i));
    }
    return worst;
}

} // namespace

TEST_CASE("Problem class follows the objectives", "[ProblemBuilder]") {
    ProblemBuilder builder;
    auto sample = four_period_sample();

    SECTION("Mean return alone is an LP") {
        auto program = builder.build(base_spec().with_objective(MeanReturn{}), sample, OptimizationMode::PLAIN);
        REQUIRE(program.problem_class == ProblemClass::LP);
        REQUIRE(program.P.nonZeros() == 0);
        REQUIRE(program.num_variables == 3);
    }

    SECTION("Expected shortfall stays an LP") {
        auto program = builder.build(base_spec().with_objective(ExpectedShortfall{0.25, 1.0}),
                                     sample, OptimizationMode::PLAIN);
        REQUIRE(program.problem_class == ProblemClass::LP);
        // w, t, u_1..u_4
        REQUIRE(program.num_variables == 8);
        REQUIRE(program.count_rows("es_shortfall") == 4);
        REQUIRE(program.count_rows("es_nonnegative") == 4);
    }

    SECTION("Variance makes a QP") {
        auto program = builder.build(base_spec().with_objective(Variance{}), sample, OptimizationMode::PLAIN);
        REQUIRE(program.problem_class == ProblemClass::QP);
        REQUIRE(program.count_rows("variance_factor") == 0);
    }

    SECTION("Quadratic shortfall makes an SOCP") {
        auto program = builder.build(base_spec()
                                         .with_objective(Variance{})
                                         .with_objective(ExpectedQuadraticShortfall{0.25, 1.0}),
                                     sample, OptimizationMode::PLAIN);
        REQUIRE(program.problem_class == ProblemClass::SOCP);
        REQUIRE(program.cones.size() == 1);
        REQUIRE(program.cones[0].members.size() == 4);
        REQUIRE(program.count_rows("eqs_shortfall") == 4);
    }
}

TEST_CASE("Constraint rows", "[ProblemBuilder]") {
    ProblemBuilder builder;
    auto sample = four_period_sample();

    auto spec = base_spec()
                    .with_constraint(Box{0.0, 0.5, {}})
                    .with_constraint(Group{"AB", {"A", "B"}, 0.2, 0.8})
                    .with_constraint(ReturnTarget{0.001, false})
                    .with_objective(Variance{});

    auto program = builder.build(spec, sample, OptimizationMode::PLAIN);
    REQUIRE(program.count_rows("full_investment") == 1);
    REQUIRE(program.count_rows("long_only") == 3);
    REQUIRE(program.count_rows("box:") == 3);
    REQUIRE(program.count_rows("box:B") == 1);
    REQUIRE(program.count_rows("group:AB") == 1);
    REQUIRE(program.count_rows("return_target") == 1);
    REQUIRE(program.num_rows() == 9);
    REQUIRE(program.row_labels.size() == 9);

    SECTION("Equal-weight portfolio satisfies every row") {
        Eigen::VectorXd x = Eigen::VectorXd::Constant(3, 1.0 / 3.0);
        // mean return of equal weights is 0.005 >= 0.001
        REQUIRE(max_row_violation(program, x) <= 1e-12);
    }

    SECTION("Full weight on one asset violates the box") {
        Eigen::VectorXd x(3);
        x << 1.0, 0.0, 0.0;
        REQUIRE(max_row_violation(program, x) > 0.4);
    }
}

TEST_CASE("Objective value of the reformulated program", "[ProblemBuilder]") {
    ProblemBuilder builder;
    auto sample = four_period_sample();
    Eigen::VectorXd w(3);
    w << 0.2, 0.5, 0.3;
    const Eigen::VectorXd mu = sample.mean();

    SECTION("Mean-variance: -mu'w + lambda w'Sigma w") {
        auto program = builder.build(base_spec().with_objective(MeanReturn{}).with_objective(Variance{3.0}),
                                     sample, OptimizationMode::PLAIN);
        const Eigen::MatrixXd cov = risk::SampleCovariance().estimate_covariance(sample.returns());
        const double expected = -mu.dot(w) + 3.0 * w.dot(cov * w);
        REQUIRE(program.objective_value(w) == Approx(expected).margin(1e-14));
    }

    SECTION("Expected shortfall at the optimal threshold equals the closed form") {
        const double lambda = 2.0;
        auto program = builder.build(base_spec().with_objective(ExpectedShortfall{0.25, lambda}),
                                     sample, OptimizationMode::PLAIN);

        const Eigen::VectorXd x_p = risk::portfolio_returns(sample.returns(), w);
        const auto& term = program.layout.risk_terms.at(0);

        // T p = 1: the optimal threshold is the worst realized return
        Eigen::VectorXd x = Eigen::VectorXd::Zero(program.num_variables);
        x.head(3) = w;
        x(term.threshold) = x_p.minCoeff();
        for (int i = 0; i < term.aux_count; ++i) {
            x(term.aux_offset + i) = std::max(0.0, x(term.threshold) - x_p(i));
        }

        REQUIRE(max_row_violation(program, x) <= 1e-12);
        REQUIRE(program.objective_value(x) ==
                Approx(lambda * risk::expected_shortfall(x_p, 0.25)).margin(1e-12));
    }
}

TEST_CASE("Factorized variance", "[ProblemBuilder]") {
    auto sample = four_period_sample();

    SECTION("Selection rule") {
        ProblemBuilder builder;
        REQUIRE_FALSE(builder.use_factor_form(3, 4));
        REQUIRE(builder.use_factor_form(3, 3));
        REQUIRE(builder.use_factor_form(201, 1000));

        BuilderOptions options;
        options.dense_covariance_threshold = 2;
        REQUIRE(ProblemBuilder(options).use_factor_form(3, 100));
    }

    SECTION("Factor rows reproduce the dense quadratic form") {
        BuilderOptions options;
        options.dense_covariance_threshold = 2;
        ProblemBuilder factor_builder(options);
        ProblemBuilder dense_builder;

        auto spec = base_spec().with_objective(Variance{1.5});
        auto factored = factor_builder.build(spec, sample, OptimizationMode::PLAIN);
        auto dense = dense_builder.build(spec, sample, OptimizationMode::PLAIN);

        const auto& term = factored.layout.risk_terms.at(0);
        REQUIRE(term.factor_count == 4);
        REQUIRE(factored.count_rows("variance_factor") == 4);

        Eigen::VectorXd w(3);
        w << 0.6, 0.1, 0.3;
        const Eigen::MatrixXd F = risk::SampleCovariance().estimate_factor(sample.returns());
        Eigen::VectorXd x = Eigen::VectorXd::Zero(factored.num_variables);
        x.head(3) = w;
        x.segment(term.factor_offset, term.factor_count) = F * w;

        REQUIRE(max_row_violation(factored, x) <= 1e-12);
        REQUIRE(factored.objective_value(x) == Approx(dense.objective_value(w)).margin(1e-14));
    }
}

TEST_CASE("Ratio modes", "[ProblemBuilder]") {
    ProblemBuilder builder;
    auto sample = four_period_sample();

    auto spec = base_spec()
                    .with_constraint(Box{0.0, 0.5, {}})
                    .with_objective(MeanReturn{})
                    .with_objective(Variance{});

    auto program = builder.build(spec, sample, OptimizationMode::MAX_SHARPE_RATIO);

    REQUIRE(program.layout.kappa == 3);
    REQUIRE(program.count_rows("full_investment") == 0);
    REQUIRE(program.count_rows("ratio_normalization") == 1);
    REQUIRE(program.count_rows("ratio_budget") == 1);
    // Two-sided box rows split into y - lo*kappa >= 0 and y - hi*kappa <= 0
    REQUIRE(program.count_rows("box:") == 6);
    // Return numerator is fixed by normalization, not in q
    REQUIRE(program.q.head(3).cwiseAbs().maxCoeff() == 0.0);

    SECTION("Scaled feasible point satisfies the homogenized rows") {
        // Any long-only weights with positive excess mean scale to a feasible (y, kappa)
        Eigen::VectorXd w(3);
        w << 0.3, 0.4, 0.3;
        const double excess = sample.mean().dot(w);
        REQUIRE(excess > 0.0);
        Eigen::VectorXd x(4);
        x.head(3) = w / excess;
        x(3) = 1.0 / excess;
        REQUIRE(max_row_violation(program, x) <= 1e-9);
    }
}

TEST_CASE("Objective and mode compatibility", "[ProblemBuilder]") {
    auto spec = base_spec();

    SECTION("No objectives") {
        REQUIRE_THROWS_AS(ProblemBuilder::check_objectives(spec, OptimizationMode::PLAIN), ValidationError);
    }

    SECTION("Ratio mode without a return objective") {
        REQUIRE_THROWS_AS(ProblemBuilder::check_objectives(spec.with_objective(Variance{}),
                                                           OptimizationMode::MAX_SHARPE_RATIO),
                          InvalidObjectiveCombination);
    }

    SECTION("Ratio mode with the wrong risk measure") {
        auto s = spec.with_objective(MeanReturn{}).with_objective(Variance{});
        REQUIRE_THROWS_AS(ProblemBuilder::check_objectives(s, OptimizationMode::MAX_ES_RATIO),
                          InvalidObjectiveCombination);
    }

    SECTION("Ratio mode with two risk objectives") {
        auto s = spec.with_objective(MeanReturn{})
                     .with_objective(ExpectedShortfall{})
                     .with_objective(ExpectedShortfall{0.1, 1.0});
        REQUIRE_THROWS_AS(ProblemBuilder::check_objectives(s, OptimizationMode::MAX_ES_RATIO),
                          InvalidObjectiveCombination);
    }

    SECTION("Plain mode accepts any combination") {
        auto s = spec.with_objective(Variance{}).with_objective(ExpectedShortfall{});
        REQUIRE_NOTHROW(ProblemBuilder::check_objectives(s, OptimizationMode::PLAIN));
    }

    SECTION("Mode tags") {
        REQUIRE(parse_optimization_mode("max_eqs_ratio") == OptimizationMode::MAX_EQS_RATIO);
        REQUIRE(parse_optimization_mode("Sharpe") == OptimizationMode::MAX_SHARPE_RATIO);
        REQUIRE_THROWS_AS(parse_optimization_mode("max_sortino"), ValidationError);
    }
}

TEST_CASE("Return window validation", "[ProblemBuilder]") {
    ProblemBuilder builder;
    auto spec = base_spec().with_objective(MeanReturn{});
    auto sample = four_period_sample();

    SECTION("Columns out of order") {
        REQUIRE_THROWS_AS(builder.build(spec, sample.select({"B", "A", "C"}), OptimizationMode::PLAIN),
                          ValidationError);
    }

    SECTION("Asset count mismatch") {
        REQUIRE_THROWS_AS(builder.build(spec, sample.select({"A", "B"}), OptimizationMode::PLAIN),
                          ValidationError);
    }

    SECTION("Single observation") {
        REQUIRE_THROWS_AS(builder.build(spec, sample.slice(0, 1), OptimizationMode::PLAIN), ValidationError);
    }

    SECTION("Missing value in window") {
        Eigen::MatrixXd r = sample.returns();
        r(2, 1) = std::numeric_limits<double>::quiet_NaN();
        ReturnSample gappy(r, sample.dates(), sample.assets());
        REQUIRE_THROWS_AS(builder.build(spec, gappy, OptimizationMode::PLAIN), ValidationError);
        REQUIRE_NOTHROW(builder.build(spec, gappy.slice(0, 2), OptimizationMode::PLAIN));
    }

    SECTION("Inconsistent constraints are rejected before building") {
        auto bad = spec.with_constraint(Box{0.0, 0.2, {}});
        REQUIRE_THROWS_AS(builder.build(bad, sample, OptimizationMode::PLAIN), ValidationError);
    }
}
