// SPDX-License-Identifier: MIT
/**
 * @file test_risk_measures.cpp
 * @brief Unit tests for realized shortfall measures and covariance estimation
 */

#include <catch2/catch.hpp>
#include "risk/risk_measures.hpp"
#include "risk/sample_covariance.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <cmath>

using namespace convexfolio;
using namespace convexfolio::risk;
using Catch::Detail::Approx;
using Catch::Matchers::WithinAbs;

namespace {

// Brute force min over t of the ES objective; the minimum sits on a sample point
double es_by_threshold_search(const Eigen::VectorXd& x, double p) {
    const double T = static_cast<double>(x.size());
    double best = 1e300;
    for (Eigen::Index k = 0; k < x.size(); ++k) {
        const double t = x(k);
        const double shortfall = (Eigen::VectorXd::Constant(x.size(), t) - x).cwiseMax(0.0).sum();
        best = std::min(best, -t + shortfall / (T * p));
    }
    return best;
}

} // namespace

TEST_CASE("Expected shortfall closed form", "[RiskMeasures]") {
    Eigen::VectorXd x(5);
    x << 0.03, -0.05, 0.04, -0.02, 0.01;

    SECTION("Integer tail mass") {
        REQUIRE_THAT(expected_shortfall(x, 0.2), WithinAbs(0.05, 1e-12));
        REQUIRE_THAT(expected_shortfall(x, 0.4), WithinAbs(0.035, 1e-12));
    }

    SECTION("Fractional tail mass interpolates the next order statistic") {
        // T p = 1.5: (0.05 + 0.5 * 0.02) / 1.5
        REQUIRE_THAT(expected_shortfall(x, 0.3), WithinAbs(0.04, 1e-12));
    }

    SECTION("Matches the threshold minimization") {
        for (double p : {0.2, 0.3, 0.4, 0.5}) {
            REQUIRE(expected_shortfall(x, p) == Approx(es_by_threshold_search(x, p)).margin(1e-12));
        }
    }

    SECTION("Confidence level maps to tail probability") {
        REQUIRE_THAT(expected_shortfall(x, 0.8), WithinAbs(expected_shortfall(x, 0.2), 1e-12));
    }

    SECTION("Empty series rejected") {
        REQUIRE_THROWS_AS(expected_shortfall(Eigen::VectorXd(0), 0.05), std::invalid_argument);
    }
}

TEST_CASE("Expected quadratic shortfall", "[RiskMeasures]") {
    Eigen::VectorXd x(8);
    x << 0.012, -0.031, 0.004, -0.008, 0.021, -0.015, 0.009, -0.002;

    SECTION("Line search reaches the grid minimum") {
        const double p = 0.25;
        double grid_min = 1e300;
        const double lo = x.minCoeff();
        const double hi = x.maxCoeff();
        for (int k = 0; k <= 20000; ++k) {
            const double t = lo + (hi - lo) * k / 20000.0;
            grid_min = std::min(grid_min, quadratic_shortfall_at(x, t, p));
        }
        const double eqs = expected_quadratic_shortfall(x, p);
        REQUIRE(eqs <= grid_min + 1e-9);
        REQUIRE(eqs == Approx(grid_min).margin(1e-6));
    }

    SECTION("Non-decreasing as the tail probability decreases") {
        const double eqs_10 = expected_quadratic_shortfall(x, 0.10);
        const double eqs_05 = expected_quadratic_shortfall(x, 0.05);
        const double eqs_01 = expected_quadratic_shortfall(x, 0.01);
        REQUIRE(eqs_05 >= eqs_10 - 1e-12);
        REQUIRE(eqs_01 >= eqs_05 - 1e-12);
    }

    SECTION("Dominates the loss at the worst observation") {
        REQUIRE(expected_quadratic_shortfall(x, 0.05) >= -x.minCoeff() - 1e-12);
    }
}

TEST_CASE("Portfolio returns", "[RiskMeasures]") {
    Eigen::MatrixXd r(2, 3);
    r << 0.01, 0.02, 0.03,
         -0.01, 0.00, 0.01;
    Eigen::VectorXd w(3);
    w << 0.5, 0.25, 0.25;

    auto x = portfolio_returns(r, w);
    REQUIRE_THAT(x(0), WithinAbs(0.0175, 1e-12));
    REQUIRE_THAT(x(1), WithinAbs(-0.0025, 1e-12));

    REQUIRE_THROWS_AS(portfolio_returns(r, Eigen::VectorXd::Ones(2)), std::invalid_argument);
}

TEST_CASE("Sample covariance and its factor", "[RiskModel]") {
    Eigen::MatrixXd r(4, 2);
    r << 0.01, 0.02,
         0.03, -0.01,
         -0.02, 0.00,
         0.02, 0.03;

    SampleCovariance model;
    REQUIRE(model.get_name() == "SampleCovariance");

    const Eigen::MatrixXd cov = model.estimate_covariance(r);
    REQUIRE(cov.rows() == 2);
    REQUIRE_THAT(cov(0, 1), WithinAbs(cov(1, 0), 1e-15));

    // Var(A) with Bessel's correction: mean 0.01, deviations 0, .02, -.03, .01
    REQUIRE_THAT(cov(0, 0), WithinAbs(0.0014 / 3.0, 1e-12));

    const Eigen::MatrixXd F = model.estimate_factor(r);
    REQUIRE(F.cols() == 2);
    REQUIRE((F.transpose() * F - cov).cwiseAbs().maxCoeff() < 1e-14);

    SECTION("Fewer than two observations rejected") {
        REQUIRE_THROWS_AS(model.estimate_covariance(r.topRows(1)), std::invalid_argument);
    }

    SECTION("Biased estimator divides by T") {
        REQUIRE(model.uses_bias_correction());

        SampleCovariance biased(false);
        REQUIRE_FALSE(biased.uses_bias_correction());

        const Eigen::MatrixXd biased_cov = biased.estimate_covariance(r);
        REQUIRE_THAT(biased_cov(0, 0), WithinAbs(0.0014 / 4.0, 1e-12));
        REQUIRE((biased_cov * 4.0 - cov * 3.0).cwiseAbs().maxCoeff() < 1e-14);

        const Eigen::MatrixXd biased_F = biased.estimate_factor(r);
        REQUIRE((biased_F.transpose() * biased_F - biased_cov).cwiseAbs().maxCoeff() < 1e-14);
    }
}
