// SPDX-License-Identifier: MIT
/**
 * @file engine_config.hpp
 * @brief JSON configuration of a convexfolio run
 *
 * Each section of the configuration file maps to one struct with a static
 * from_json(). Tag strings (constraint and objective types, modes,
 * frequencies, backend names) are parsed here once; unknown values raise
 * ValidationError naming the offending text.
 */

#ifndef CONVEXFOLIO_ENGINE_CONFIG_HPP
#define CONVEXFOLIO_ENGINE_CONFIG_HPP

#include "model/portfolio_spec.hpp"
#include "optimizer/problem_builder.hpp"
#include "optimizer/solver_adapter.hpp"
#include "backtest/backtest_driver.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace convexfolio {
namespace data {

/**
 * @struct DataConfig
 * @brief Location and date range of the return matrix
 */
struct DataConfig {
    std::string returns_file;                  ///< Wide return CSV
    std::string start_date;                    ///< Inclusive, empty = open
    std::string end_date;                      ///< Inclusive, empty = open

    static DataConfig from_json(const nlohmann::json& j);
};

/**
 * @struct PortfolioConfig
 * @brief Asset universe, constraints and objectives
 */
struct PortfolioConfig {
    std::vector<std::string> assets;           ///< Empty = all columns of the returns file
    double risk_free_rate = 0.0;
    std::string solver = model::PortfolioSpec::AUTO_SOLVER;
    std::vector<model::Constraint> constraints;
    std::vector<model::Objective> objectives;

    static PortfolioConfig from_json(const nlohmann::json& j);

    /**
     * @brief Parse {"type": "box", "min": 0.0, "max": 0.5, ...}
     * @throws ValidationError for unknown types or missing fields
     */
    static model::Constraint parse_constraint(const nlohmann::json& j);

    /**
     * @brief Parse {"type": "expected_shortfall", "p": 0.05, "risk_aversion": 2.0}
     * @throws ValidationError for unknown types
     */
    static model::Objective parse_objective(const nlohmann::json& j);

    /**
     * @brief Assemble the immutable spec
     * @param universe Asset universe to use when assets is empty
     * @throws ValidationError if the result is inconsistent
     */
    model::PortfolioSpec to_spec(const std::vector<std::string>& universe = {}) const;
};

/**
 * @struct OptimizerConfig
 * @brief Single-solve options
 */
struct OptimizerConfig {
    optimizer::OptimizationMode mode = optimizer::OptimizationMode::PLAIN;
    int dense_covariance_threshold = optimizer::BuilderOptions().dense_covariance_threshold;

    static OptimizerConfig from_json(const nlohmann::json& j);

    optimizer::BuilderOptions to_builder_options() const;
};

/**
 * @struct SolverConfig
 * @brief Default backends, backend options and fallback
 */
struct SolverConfig {
    optimizer::DefaultSolverMap defaults;
    optimizer::SolverOptions options;
    std::string fallback_backend;

    static SolverConfig from_json(const nlohmann::json& j);

    optimizer::SolverAdapterConfig to_adapter_config() const;
};

/**
 * @struct FrontierConfig
 * @brief Efficient frontier sweep
 */
struct FrontierConfig {
    model::RiskMeasure risk_measure = model::RiskMeasure::VARIANCE;
    double tail_probability = model::DEFAULT_TAIL_PROBABILITY;
    int num_points = 25;
    bool equality_target = false;

    static FrontierConfig from_json(const nlohmann::json& j);
};

/**
 * @struct EngineConfig
 * @brief Complete configuration (all sections)
 *
 * Missing sections keep their defaults. The backtest optimization mode
 * follows the optimizer section unless the backtest section sets its own.
 */
struct EngineConfig {
    DataConfig data;
    PortfolioConfig portfolio;
    OptimizerConfig optimizer;
    SolverConfig solver;
    backtest::BacktestConfig backtest;
    FrontierConfig frontier;

    /**
     * @throws ValidationError on malformed values, including JSON type errors
     */
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     * @throws ValidationError on malformed values
     */
    static EngineConfig load_from_file(const std::string& config_path);
};

} // namespace data
} // namespace convexfolio

#endif // CONVEXFOLIO_ENGINE_CONFIG_HPP
