// SPDX-License-Identifier: MIT
#include <catch2/catch.hpp>
#include "data/engine_config.hpp"
#include "model/errors.hpp"
#include <nlohmann/json.hpp>

using namespace convexfolio;
using namespace convexfolio::data;
using Catch::Matchers::WithinAbs;

namespace {

nlohmann::json full_config() {
    return nlohmann::json::parse(R"({
        "data": {
            "returns_file": "data/returns.csv",
            "start_date": "2015-01-01",
            "end_date": "2023-12-31"
        },
        "portfolio": {
            "assets": ["SPY", "TLT", "GLD", "EFA"],
            "risk_free_rate": 0.0001,
            "solver": "auto",
            "constraints": [
                {"type": "full_investment"},
                {"type": "long_only"},
                {"type": "box", "min": 0.0, "max": 0.6},
                {"type": "group", "name": "equity", "assets": ["SPY", "EFA"], "max": 0.7},
                {"type": "return_target", "target": 0.0002}
            ],
            "objectives": [
                {"type": "mean_return"},
                {"type": "expected_shortfall", "p": 0.05, "risk_aversion": 2.0}
            ]
        },
        "optimizer": {
            "mode": "plain",
            "dense_covariance_threshold": 50
        },
        "solver": {
            "defaults": {"lp": "osqp", "qp": "osqp", "socp": "scs"},
            "max_iterations": 20000,
            "tolerance": 1e-7,
            "fallback_backend": "scs"
        },
        "backtest": {
            "rebalance_frequency": "monthly",
            "training_length": 252,
            "failure_policy": "hold_previous"
        },
        "frontier": {
            "risk_measure": "eqs",
            "p": 0.1,
            "num_points": 15
        }
    })");
}

} // namespace

TEST_CASE("EngineConfig from a complete document", "[EngineConfig]") {
    auto config = EngineConfig::from_json(full_config());

    REQUIRE(config.data.returns_file == "data/returns.csv");
    REQUIRE(config.data.start_date == "2015-01-01");

    REQUIRE(config.portfolio.assets.size() == 4);
    REQUIRE_THAT(config.portfolio.risk_free_rate, WithinAbs(0.0001, 1e-15));
    REQUIRE(config.portfolio.constraints.size() == 5);
    REQUIRE(config.portfolio.objectives.size() == 2);

    REQUIRE(config.optimizer.mode == optimizer::OptimizationMode::PLAIN);
    REQUIRE(config.optimizer.to_builder_options().dense_covariance_threshold == 50);

    auto adapter = config.solver.to_adapter_config();
    REQUIRE(adapter.defaults.socp == "scs");
    REQUIRE(adapter.options.max_iterations == 20000);
    REQUIRE(adapter.fallback_backend == "scs");

    REQUIRE(config.backtest.rebalance.frequency == backtest::RebalanceFrequency::MONTHLY);
    REQUIRE(config.backtest.training_length == 252);

    REQUIRE(config.frontier.risk_measure == model::RiskMeasure::EXPECTED_QUADRATIC_SHORTFALL);
    REQUIRE_THAT(config.frontier.tail_probability, WithinAbs(0.1, 1e-15));
    REQUIRE(config.frontier.num_points == 15);
}

TEST_CASE("Constraint and objective parsing", "[EngineConfig]") {
    SECTION("Box") {
        auto c = PortfolioConfig::parse_constraint(
            nlohmann::json::parse(R"({"type": "BOX", "max": 0.3, "assets": ["SPY"]})"));
        const auto& box = std::get<model::Box>(c);
        REQUIRE_THAT(box.min_weight, WithinAbs(0.0, 1e-15));
        REQUIRE_THAT(box.max_weight, WithinAbs(0.3, 1e-15));
        REQUIRE(box.assets == std::vector<std::string>{"SPY"});
    }

    SECTION("Group") {
        auto c = PortfolioConfig::parse_constraint(
            nlohmann::json::parse(R"({"type": "group", "name": "bonds", "assets": ["TLT"], "min": 0.1})"));
        const auto& group = std::get<model::Group>(c);
        REQUIRE(group.name == "bonds");
        REQUIRE_THAT(group.min_weight, WithinAbs(0.1, 1e-15));
    }

    SECTION("Return target") {
        auto c = PortfolioConfig::parse_constraint(
            nlohmann::json::parse(R"({"type": "return_target", "target": 0.01, "equality": true})"));
        REQUIRE(std::get<model::ReturnTarget>(c).equality);
    }

    SECTION("Risk objectives") {
        auto es = PortfolioConfig::parse_objective(
            nlohmann::json::parse(R"({"type": "cvar", "tail_probability": 0.025})"));
        REQUIRE_THAT(std::get<model::ExpectedShortfall>(es).tail_probability, WithinAbs(0.025, 1e-15));

        auto variance = PortfolioConfig::parse_objective(
            nlohmann::json::parse(R"({"type": "variance", "risk_aversion": 3.0})"));
        REQUIRE_THAT(std::get<model::Variance>(variance).risk_aversion, WithinAbs(3.0, 1e-15));

        auto mean = PortfolioConfig::parse_objective(nlohmann::json::parse(R"({"type": "mean"})"));
        REQUIRE(std::holds_alternative<model::MeanReturn>(mean));
    }

    SECTION("Malformed entries") {
        REQUIRE_THROWS_AS(PortfolioConfig::parse_constraint(nlohmann::json::parse(R"({"type": "turnover"})")),
                          ValidationError);
        REQUIRE_THROWS_AS(PortfolioConfig::parse_constraint(nlohmann::json::parse(R"({"min": 0.1})")),
                          ValidationError);
        REQUIRE_THROWS_AS(PortfolioConfig::parse_constraint(nlohmann::json::parse(R"({"type": "group"})")),
                          ValidationError);
        REQUIRE_THROWS_AS(PortfolioConfig::parse_constraint(nlohmann::json::parse(R"({"type": "return_target"})")),
                          ValidationError);
        REQUIRE_THROWS_AS(PortfolioConfig::parse_objective(nlohmann::json::parse(R"({"type": "sortino"})")),
                          ValidationError);
    }
}

TEST_CASE("PortfolioConfig builds a spec", "[EngineConfig]") {
    auto config = EngineConfig::from_json(full_config());
    auto spec = config.portfolio.to_spec();

    REQUIRE(spec.assets() == std::vector<std::string>{"SPY", "TLT", "GLD", "EFA"});
    REQUIRE(spec.constraints().size() == 5);
    REQUIRE(spec.objectives().size() == 2);
    REQUIRE_THAT(spec.risk_free_rate(), WithinAbs(0.0001, 1e-15));

    SECTION("Empty asset list takes the supplied universe") {
        PortfolioConfig bare;
        bare.constraints.push_back(model::FullInvestment{});
        bare.objectives.push_back(model::MeanReturn{});
        auto universe_spec = bare.to_spec({"A", "B"});
        REQUIRE(universe_spec.assets() == std::vector<std::string>{"A", "B"});
    }

    SECTION("Inconsistent bounds are rejected") {
        PortfolioConfig bad;
        bad.assets = {"A", "B"};
        bad.constraints.push_back(model::FullInvestment{});
        bad.constraints.push_back(model::Box{0.0, 0.3, {}});
        REQUIRE_THROWS_AS(bad.to_spec(), ValidationError);
    }
}

TEST_CASE("EngineConfig section defaults and validation", "[EngineConfig]") {
    SECTION("Backtest mode follows the optimizer section") {
        auto j = nlohmann::json::parse(R"({
            "optimizer": {"mode": "max_es_ratio"},
            "backtest": {"training_length": 10}
        })");
        auto config = EngineConfig::from_json(j);
        REQUIRE(config.backtest.mode == optimizer::OptimizationMode::MAX_ES_RATIO);

        j["backtest"]["mode"] = "plain";
        REQUIRE(EngineConfig::from_json(j).backtest.mode == optimizer::OptimizationMode::PLAIN);

        j.erase("backtest");
        REQUIRE(EngineConfig::from_json(j).backtest.mode == optimizer::OptimizationMode::MAX_ES_RATIO);
    }

    SECTION("Empty document keeps defaults") {
        auto config = EngineConfig::from_json(nlohmann::json::object());
        REQUIRE(config.portfolio.solver == "auto");
        REQUIRE(config.frontier.num_points == 25);
        REQUIRE(config.backtest.failure_policy == backtest::FailurePolicy::HOLD_PREVIOUS);
    }

    SECTION("Root must be an object") {
        REQUIRE_THROWS_AS(EngineConfig::from_json(nlohmann::json::array()), ValidationError);
    }

    SECTION("JSON type errors become validation errors") {
        auto j = nlohmann::json::parse(R"({"portfolio": {"risk_free_rate": "low"}})");
        REQUIRE_THROWS_AS(EngineConfig::from_json(j), ValidationError);
    }

    SECTION("Unknown tags") {
        REQUIRE_THROWS_AS(EngineConfig::from_json(nlohmann::json::parse(R"({"optimizer": {"mode": "max_sortino"}})")),
                          ValidationError);
        REQUIRE_THROWS_AS(EngineConfig::from_json(nlohmann::json::parse(R"({"backtest": {"rebalance_frequency": "hourly"}})")),
                          ValidationError);
    }

    SECTION("Out of range values") {
        REQUIRE_THROWS_AS(EngineConfig::from_json(nlohmann::json::parse(R"({"solver": {"tolerance": 0}})")),
                          ValidationError);
        REQUIRE_THROWS_AS(EngineConfig::from_json(nlohmann::json::parse(R"({"frontier": {"num_points": 1}})")),
                          ValidationError);
    }

    SECTION("Missing file") {
        REQUIRE_THROWS_AS(EngineConfig::load_from_file("/nonexistent/config.json"), std::runtime_error);
    }
}
