// SPDX-License-Identifier: MIT
/**
 * @file main.cpp
 * @brief Main entry point for convexfolio
 *
 * Command-line application that loads a configuration and a return matrix,
 * then runs a single optimization, a walk-forward backtest or an efficient
 * frontier sweep and writes the results.
 */

#include "data/data_loader.hpp"
#include "data/engine_config.hpp"
#include "optimizer/portfolio_optimizer.hpp"
#include "optimizer/efficient_frontier.hpp"
#include "backtest/backtest_driver.hpp"
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace convexfolio;

/**
 * @brief Print usage information
 */
void print_usage(const char *program_name)
{
    std::cout << "convexfolio v1.0.0\n"
              << "Usage: " << program_name << " [OPTIONS]\n\n"
              << "Options:\n"
              << "  --config PATH         Path to configuration JSON file (required)\n"
              << "  --returns PATH        Return CSV (overrides data.returns_file)\n"
              << "  --mode MODE           optimize | backtest | frontier (default: optimize)\n"
              << "  --output PATH         Path to output directory (default: results/)\n"
              << "  --verbose             Enable verbose logging\n"
              << "  --help, -h            Show this help message\n"
              << "\nExample:\n"
              << "  " << program_name << " --config config/portfolio.json --mode backtest --verbose\n"
              << std::endl;
}

/**
 * @brief Print banner
 */
void print_banner()
{
    std::cout << "\n"
              << "================================================================\n"
              << "       convexfolio v1.0.0                                       \n"
              << "       Convex portfolio optimization and backtesting           \n"
              << "================================================================\n"
              << std::endl;
}

/**
 * @brief Parse command-line arguments
 */
struct CommandLineArgs
{
    std::string config_path;
    std::string returns_path;
    std::string mode = "optimize";
    std::string output_dir = "results";
    bool verbose = false;
    bool show_help = false;

    static CommandLineArgs parse(int argc, char *argv[])
    {
        CommandLineArgs args;

        for (int i = 1; i < argc; ++i)
        {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h")
            {
                args.show_help = true;
            }
            else if (arg == "--config" && i + 1 < argc)
            {
                args.config_path = argv[++i];
            }
            else if (arg == "--returns" && i + 1 < argc)
            {
                args.returns_path = argv[++i];
            }
            else if (arg == "--mode" && i + 1 < argc)
            {
                args.mode = argv[++i];
            }
            else if (arg == "--output" && i + 1 < argc)
            {
                args.output_dir = argv[++i];
            }
            else if (arg == "--verbose")
            {
                args.verbose = true;
            }
            else
            {
                std::cerr << "Warning: Unknown argument: " << arg << std::endl;
            }
        }

        return args;
    }

    bool is_valid() const
    {
        return !show_help && !config_path.empty() &&
               (mode == "optimize" || mode == "backtest" || mode == "frontier");
    }
};

/**
 * @brief Write a JSON document to a file
 */
void write_json(const std::string &filepath, const nlohmann::json &j)
{
    std::ofstream file(filepath);
    if (!file.is_open())
    {
        throw std::runtime_error("Could not open file for writing: " + filepath);
    }
    file << j.dump(2) << "\n";
}

/**
 * @brief Main execution function
 */
int run(const CommandLineArgs &args)
{
    auto start_time = std::chrono::high_resolution_clock::now();

    try
    {
        // ====================================================================
        // 1. Load Configuration
        // ====================================================================
        std::cout << "[1/3] Loading configuration..." << std::endl;

        auto config = data::EngineConfig::load_from_file(args.config_path);
        if (args.verbose)
        {
            config.solver.options.verbose = true;
            config.backtest.verbose = true;
        }

        const std::string returns_file = args.returns_path.empty() ? config.data.returns_file
                                                                   : args.returns_path;
        if (returns_file.empty())
        {
            throw ValidationError("No returns file: set data.returns_file or pass --returns");
        }

        // ====================================================================
        // 2. Load Return Data
        // ====================================================================
        std::cout << "[2/3] Loading returns..." << std::endl;

        auto sample = data::DataLoader::load_returns_csv(returns_file, config.portfolio.assets);
        sample = data::DataLoader::filter_dates(sample, config.data.start_date, config.data.end_date);

        std::cout << "  - Loaded " << sample.num_observations() << " observations, "
                  << sample.num_assets() << " assets" << std::endl;

        const model::PortfolioSpec spec = config.portfolio.to_spec(sample.assets());

        if (args.verbose)
        {
            std::cout << "  - Constraints: " << spec.constraints().size() << "\n";
            for (const auto &constraint : spec.constraints())
            {
                std::cout << "      " << model::constraint_name(constraint) << "\n";
            }
            std::cout << "  - Objectives: " << spec.objectives().size() << "\n";
            for (const auto &objective : spec.objectives())
            {
                std::cout << "      " << model::objective_name(objective) << "\n";
            }
            std::cout << "  - Mode: " << optimizer::to_string(config.optimizer.mode) << "\n";
        }

        optimizer::PortfolioOptimizer portfolio_optimizer(config.solver.to_adapter_config(),
                                                          config.optimizer.to_builder_options());
        std::filesystem::create_directories(args.output_dir);

        // ====================================================================
        // 3. Run Requested Operation
        // ====================================================================
        if (args.mode == "optimize")
        {
            std::cout << "[3/3] Running portfolio optimization..." << std::endl;

            auto result = portfolio_optimizer.optimize(spec, sample, config.optimizer.mode);
            result.print_summary();

            const std::string output_file = args.output_dir + "/optimization.json";
            write_json(output_file, result.to_json(spec.assets()));
            std::cout << "  Result exported to: " << output_file << "\n";
        }
        else if (args.mode == "backtest")
        {
            std::cout << "[3/3] Running backtest..." << std::endl;

            backtest::BacktestDriver driver(spec, sample, config.backtest, portfolio_optimizer);
            auto result = driver.run();
            result.print_summary();

            const std::string weights_file = args.output_dir + "/backtest_weights.csv";
            result.export_weights_csv(weights_file);
            write_json(args.output_dir + "/backtest.json", result.to_json());
            std::cout << "  Weights exported to: " << weights_file << "\n";
        }
        else
        {
            std::cout << "[3/3] Computing efficient frontier..." << std::endl;

            optimizer::EfficientFrontier frontier(portfolio_optimizer);
            frontier.set_num_points(config.frontier.num_points);
            frontier.set_equality_target(config.frontier.equality_target);

            auto result = frontier.compute(spec, sample, config.frontier.risk_measure,
                                           config.frontier.tail_probability);
            result.print_summary();

            const std::string frontier_file = args.output_dir + "/efficient_frontier.csv";
            result.export_to_csv(frontier_file);
            std::cout << "  Frontier data exported to: " << frontier_file << "\n";
        }

        // ====================================================================
        // Summary
        // ====================================================================
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            end_time - start_time)
                            .count();

        std::cout << "\n================================================================\n";
        std::cout << "Completed successfully in " << duration << " ms\n";
        std::cout << "================================================================\n"
                  << std::endl;

        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "\nError: " << e.what() << std::endl;
        return 1;
    }
}

/**
 * @brief Main function
 */
int main(int argc, char *argv[])
{
    auto args = CommandLineArgs::parse(argc, argv);

    if (args.show_help || !args.is_valid())
    {
        print_banner();
        print_usage(argv[0]);
        return args.show_help ? 0 : 1;
    }

    print_banner();

    return run(args);
}
