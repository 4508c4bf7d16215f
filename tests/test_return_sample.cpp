// SPDX-License-Identifier: MIT
/**
 * @file test_return_sample.cpp
 * @brief Unit tests for the dated return container
 */

#include <catch2/catch.hpp>
#include "model/return_sample.hpp"
#include "model/errors.hpp"
#include <limits>

using namespace convexfolio;
using namespace convexfolio::model;
using Catch::Matchers::WithinAbs;

namespace {

ReturnSample make_sample() {
    Eigen::MatrixXd r(4, 2);
    r << 0.01, 0.02,
         0.03, -0.01,
         -0.02, 0.00,
         0.02, 0.03;
    return ReturnSample(r, {"2024-01-02", "2024-01-03", "2024-01-04", "2024-01-05"}, {"A", "B"});
}

} // namespace

TEST_CASE("ReturnSample construction", "[ReturnSample]") {
    SECTION("Valid sample") {
        auto sample = make_sample();
        REQUIRE(sample.num_observations() == 4);
        REQUIRE(sample.num_assets() == 2);
        REQUIRE(sample.all_finite());
    }

    SECTION("Row/date mismatch") {
        Eigen::MatrixXd r(2, 1);
        r << 0.1, 0.2;
        REQUIRE_THROWS_AS(ReturnSample(r, {"2024-01-01"}, {"A"}), ValidationError);
    }

    SECTION("Column/asset mismatch") {
        Eigen::MatrixXd r(1, 2);
        r << 0.1, 0.2;
        REQUIRE_THROWS_AS(ReturnSample(r, {"2024-01-01"}, {"A"}), ValidationError);
    }

    SECTION("Dates must increase") {
        Eigen::MatrixXd r(2, 1);
        r << 0.1, 0.2;
        REQUIRE_THROWS_AS(ReturnSample(r, {"2024-01-02", "2024-01-01"}, {"A"}), ValidationError);
        REQUIRE_THROWS_AS(ReturnSample(r, {"2024-01-02", "2024-01-02"}, {"A"}), ValidationError);
    }
}

TEST_CASE("ReturnSample windows", "[ReturnSample]") {
    auto sample = make_sample();

    SECTION("Slice copies rows [begin, end)") {
        auto window = sample.slice(1, 3);
        REQUIRE(window.num_observations() == 2);
        REQUIRE(window.dates().front() == "2024-01-03");
        REQUIRE(window.dates().back() == "2024-01-04");
        REQUIRE_THAT(window.returns()(0, 0), WithinAbs(0.03, 1e-12));
    }

    SECTION("Empty slice allowed") {
        REQUIRE(sample.slice(2, 2).num_observations() == 0);
    }

    SECTION("Out of range slice rejected") {
        REQUIRE_THROWS_AS(sample.slice(3, 5), ValidationError);
        REQUIRE_THROWS_AS(sample.slice(3, 2), ValidationError);
    }

    SECTION("Select reorders columns") {
        auto swapped = sample.select({"B", "A"});
        REQUIRE(swapped.assets() == std::vector<std::string>{"B", "A"});
        REQUIRE_THAT(swapped.returns()(0, 0), WithinAbs(0.02, 1e-12));
        REQUIRE_THROWS_AS(sample.select({"C"}), ValidationError);
    }
}

TEST_CASE("ReturnSample statistics and lookup", "[ReturnSample]") {
    auto sample = make_sample();

    auto mu = sample.mean();
    REQUIRE_THAT(mu(0), WithinAbs(0.01, 1e-12));
    REQUIRE_THAT(mu(1), WithinAbs(0.01, 1e-12));

    REQUIRE(sample.index_of("2024-01-04").value() == 2);
    REQUIRE_FALSE(sample.index_of("2024-01-06").has_value());

    REQUIRE_THROWS_AS(sample.slice(0, 0).mean(), ValidationError);
}

TEST_CASE("ReturnSample rejects missing values on demand", "[ReturnSample]") {
    Eigen::MatrixXd r(2, 2);
    r << 0.01, std::numeric_limits<double>::quiet_NaN(),
         0.02, 0.03;
    ReturnSample sample(r, {"2024-01-02", "2024-01-03"}, {"A", "B"});

    REQUIRE_FALSE(sample.all_finite());
    REQUIRE_THROWS_AS(sample.require_finite(), ValidationError);
    REQUIRE_NOTHROW(sample.slice(1, 2).require_finite());
}
