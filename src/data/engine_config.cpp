// SPDX-License-Identifier: MIT
/**
 * @file engine_config.cpp
 * @brief Implementation of the configuration sections
 */

#include "data/engine_config.hpp"
#include "data/data_loader.hpp"
#include "model/errors.hpp"
#include "util/string_utils.hpp"

namespace convexfolio
{
    namespace data
    {

        namespace
        {
            std::string required_type(const nlohmann::json &j, const std::string &what)
            {
                if (!j.is_object() || !j.contains("type"))
                {
                    throw ValidationError(what + " entry without a 'type': " + j.dump());
                }
                return util::to_lower(j.at("type").get<std::string>());
            }
        } // namespace

        // =============================================
        // Section from_json Methods
        // =============================================

        DataConfig DataConfig::from_json(const nlohmann::json &j)
        {
            DataConfig config;
            config.returns_file = j.value("returns_file", "");
            config.start_date = j.value("start_date", "");
            config.end_date = j.value("end_date", "");
            return config;
        }

        model::Constraint PortfolioConfig::parse_constraint(const nlohmann::json &j)
        {
            const std::string type = required_type(j, "Constraint");

            if (type == "full_investment")
            {
                return model::FullInvestment{};
            }
            if (type == "long_only")
            {
                return model::LongOnly{};
            }
            if (type == "box")
            {
                model::Box box;
                box.min_weight = j.value("min", box.min_weight);
                box.max_weight = j.value("max", box.max_weight);
                box.assets = j.value("assets", std::vector<std::string>{});
                return box;
            }
            if (type == "group")
            {
                if (!j.contains("assets"))
                {
                    throw ValidationError("Group constraint without 'assets': " + j.dump());
                }
                model::Group group;
                group.name = j.value("name", "");
                group.assets = j.at("assets").get<std::vector<std::string>>();
                group.min_weight = j.value("min", group.min_weight);
                group.max_weight = j.value("max", group.max_weight);
                return group;
            }
            if (type == "return_target")
            {
                if (!j.contains("target"))
                {
                    throw ValidationError("return_target constraint without 'target': " + j.dump());
                }
                model::ReturnTarget target;
                target.target = j.at("target").get<double>();
                target.equality = j.value("equality", false);
                return target;
            }

            throw ValidationError("Unknown constraint type: " + j.at("type").get<std::string>());
        }

        model::Objective PortfolioConfig::parse_objective(const nlohmann::json &j)
        {
            const std::string type = required_type(j, "Objective");

            if (type == "mean_return" || type == "mean" || type == "return")
            {
                return model::MeanReturn{j.value("weight", 1.0)};
            }

            // parse_risk_measure rejects anything else with the original tag
            const model::RiskMeasure measure = model::parse_risk_measure(j.at("type").get<std::string>());
            const double p = j.value("p", j.value("tail_probability", model::DEFAULT_TAIL_PROBABILITY));
            return model::make_risk_objective(measure, p, j.value("risk_aversion", 1.0));
        }

        PortfolioConfig PortfolioConfig::from_json(const nlohmann::json &j)
        {
            PortfolioConfig config;
            config.assets = j.value("assets", std::vector<std::string>{});
            config.risk_free_rate = j.value("risk_free_rate", 0.0);
            config.solver = j.value("solver", std::string(model::PortfolioSpec::AUTO_SOLVER));

            if (j.contains("constraints"))
            {
                for (const auto &item : j.at("constraints"))
                {
                    config.constraints.push_back(parse_constraint(item));
                }
            }
            if (j.contains("objectives"))
            {
                for (const auto &item : j.at("objectives"))
                {
                    config.objectives.push_back(parse_objective(item));
                }
            }
            return config;
        }

        model::PortfolioSpec PortfolioConfig::to_spec(const std::vector<std::string> &universe) const
        {
            const std::vector<std::string> &names = assets.empty() ? universe : assets;
            model::PortfolioSpec spec = model::PortfolioSpec(names)
                                            .with_solver(solver)
                                            .with_risk_free_rate(risk_free_rate);
            for (const auto &constraint : constraints)
            {
                spec = spec.with_constraint(constraint);
            }
            for (const auto &objective : objectives)
            {
                spec = spec.with_objective(objective);
            }
            spec.validate();
            return spec;
        }

        OptimizerConfig OptimizerConfig::from_json(const nlohmann::json &j)
        {
            OptimizerConfig config;
            if (j.contains("mode"))
            {
                config.mode = optimizer::parse_optimization_mode(j.at("mode").get<std::string>());
            }
            config.dense_covariance_threshold = j.value("dense_covariance_threshold", config.dense_covariance_threshold);
            if (config.dense_covariance_threshold < 1)
            {
                throw ValidationError("dense_covariance_threshold must be positive");
            }
            return config;
        }

        optimizer::BuilderOptions OptimizerConfig::to_builder_options() const
        {
            optimizer::BuilderOptions options;
            options.dense_covariance_threshold = dense_covariance_threshold;
            return options;
        }

        SolverConfig SolverConfig::from_json(const nlohmann::json &j)
        {
            SolverConfig config;
            if (j.contains("defaults"))
            {
                const auto &defaults = j.at("defaults");
                config.defaults.lp = defaults.value("lp", config.defaults.lp);
                config.defaults.qp = defaults.value("qp", config.defaults.qp);
                config.defaults.socp = defaults.value("socp", config.defaults.socp);
            }

            config.options.max_iterations = j.value("max_iterations", config.options.max_iterations);
            config.options.tolerance = j.value("tolerance", config.options.tolerance);
            config.options.time_limit_seconds = j.value("time_limit_seconds", config.options.time_limit_seconds);
            config.options.verbose = j.value("verbose", config.options.verbose);
            config.fallback_backend = j.value("fallback_backend", "");

            if (config.options.max_iterations < 1)
            {
                throw ValidationError("max_iterations must be positive");
            }
            if (!(config.options.tolerance > 0.0))
            {
                throw ValidationError("tolerance must be positive");
            }
            if (config.options.time_limit_seconds < 0.0)
            {
                throw ValidationError("time_limit_seconds must be non-negative");
            }
            return config;
        }

        optimizer::SolverAdapterConfig SolverConfig::to_adapter_config() const
        {
            optimizer::SolverAdapterConfig config;
            config.defaults = defaults;
            config.options = options;
            config.fallback_backend = fallback_backend;
            return config;
        }

        FrontierConfig FrontierConfig::from_json(const nlohmann::json &j)
        {
            FrontierConfig config;
            if (j.contains("risk_measure"))
            {
                config.risk_measure = model::parse_risk_measure(j.at("risk_measure").get<std::string>());
            }
            config.tail_probability = model::effective_tail_probability(
                j.value("p", j.value("tail_probability", config.tail_probability)));
            config.num_points = j.value("num_points", config.num_points);
            config.equality_target = j.value("equality_target", config.equality_target);
            if (config.num_points < 2)
            {
                throw ValidationError("frontier num_points must be at least 2");
            }
            return config;
        }

        // =============================================
        // Complete Configuration
        // =============================================

        EngineConfig EngineConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw ValidationError("Configuration root must be a JSON object");
            }

            EngineConfig config;
            try
            {
                if (j.contains("data"))
                {
                    config.data = DataConfig::from_json(j.at("data"));
                }
                if (j.contains("portfolio"))
                {
                    config.portfolio = PortfolioConfig::from_json(j.at("portfolio"));
                }
                if (j.contains("optimizer"))
                {
                    config.optimizer = OptimizerConfig::from_json(j.at("optimizer"));
                }
                if (j.contains("solver"))
                {
                    config.solver = SolverConfig::from_json(j.at("solver"));
                }

                config.backtest.mode = config.optimizer.mode;
                if (j.contains("backtest"))
                {
                    nlohmann::json section = j.at("backtest");
                    if (!section.contains("mode"))
                    {
                        section["mode"] = optimizer::to_string(config.optimizer.mode);
                    }
                    config.backtest = backtest::BacktestConfig::from_json(section);
                }

                if (j.contains("frontier"))
                {
                    config.frontier = FrontierConfig::from_json(j.at("frontier"));
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw ValidationError("Invalid configuration value: " + std::string(e.what()));
            }

            return config;
        }

        EngineConfig EngineConfig::load_from_file(const std::string &config_path)
        {
            return from_json(DataLoader::load_json(config_path));
        }

    } // namespace data
} // namespace convexfolio
