// SPDX-License-Identifier: MIT

#include "backtest/backtest_driver.hpp"
#include "model/errors.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <limits>

namespace convexfolio
{
    namespace backtest
    {

        using namespace convexfolio::optimizer;

        // ------------------------- Enums ----------------------------------------
        std::string to_string(FailurePolicy policy)
        {
            switch (policy)
            {
            case FailurePolicy::HOLD_PREVIOUS:
                return "hold_previous";
            case FailurePolicy::MARK_UNDEFINED:
                return "mark_undefined";
            case FailurePolicy::ABORT:
                return "abort";
            }
            return "unknown";
        }

        FailurePolicy parse_failure_policy(const std::string &tag)
        {
            const std::string s = util::to_lower(tag);
            if (s == "hold_previous" || s == "hold")
                return FailurePolicy::HOLD_PREVIOUS;
            if (s == "mark_undefined" || s == "undefined" || s == "nan")
                return FailurePolicy::MARK_UNDEFINED;
            if (s == "abort")
                return FailurePolicy::ABORT;
            throw ValidationError("Invalid failure policy: " + tag);
        }

        std::string to_string(DriverState state)
        {
            switch (state)
            {
            case DriverState::ACCUMULATING:
                return "accumulating";
            case DriverState::REBALANCING:
                return "rebalancing";
            case DriverState::EXHAUSTED:
                return "exhausted";
            }
            return "unknown";
        }

        // ------------------------- BacktestConfig -------------------------------
        size_t BacktestConfig::required_observations() const
        {
            const size_t window = is_rolling() ? rolling_window : training_length;
            return std::max(window, min_observations);
        }

        void BacktestConfig::validate() const
        {
            if (is_rolling() && rolling_window < 2)
            {
                throw ValidationError("rolling_window must be at least 2, got " + std::to_string(rolling_window));
            }
            if (!is_rolling() && training_length < 2)
            {
                throw ValidationError("training_length must be at least 2, got " + std::to_string(training_length));
            }
            if (min_observations < 2)
            {
                throw ValidationError("min_observations must be at least 2, got " + std::to_string(min_observations));
            }
            if (max_workers < 1)
            {
                throw ValidationError("max_workers must be at least 1");
            }
        }

        BacktestConfig BacktestConfig::from_json(const nlohmann::json &j)
        {
            BacktestConfig cfg;
            if (j.contains("rebalance_frequency"))
            {
                cfg.rebalance = RebalanceConfig::from_string(j.at("rebalance_frequency").get<std::string>());
            }
            cfg.training_length = j.value("training_length", cfg.training_length);
            cfg.rolling_window = j.value("rolling_window", cfg.rolling_window);
            cfg.min_observations = std::max<size_t>(2, j.value("min_observations", cfg.min_observations));
            if (j.contains("failure_policy"))
            {
                cfg.failure_policy = parse_failure_policy(j.at("failure_policy").get<std::string>());
            }
            if (j.contains("mode"))
            {
                cfg.mode = parse_optimization_mode(j.at("mode").get<std::string>());
            }
            cfg.solver = j.value("solver", cfg.solver);
            cfg.max_workers = j.value("max_workers", cfg.max_workers);
            cfg.verbose = j.value("verbose", cfg.verbose);
            cfg.validate();
            return cfg;
        }

        // ------------------------- BacktestDriver -------------------------------
        BacktestDriver::BacktestDriver(const model::PortfolioSpec &spec,
                                       const model::ReturnSample &sample,
                                       const BacktestConfig &config,
                                       const PortfolioOptimizer &optimizer)
            : spec_(spec),
              sample_(sample),
              config_(config),
              optimizer_(optimizer),
              cursor_(0),
              state_(DriverState::ACCUMULATING)
        {
            config_.validate();
            spec_.validate();
            ProblemBuilder::check_objectives(spec_, config_.mode);

            if (sample_.assets() != spec_.assets())
            {
                throw ValidationError("Return sample columns do not match the specification's asset universe");
            }

            schedule_ = RebalanceScheduler(config_.rebalance).schedule(sample_.dates());
            result_.assets = spec_.assets();
            finish_if_exhausted();
        }

        std::pair<size_t, size_t> BacktestDriver::window_bounds(size_t row) const
        {
            if (config_.is_rolling())
            {
                const size_t begin = row >= config_.rolling_window ? row - config_.rolling_window : 0;
                return {begin, row};
            }
            return {0, row};
        }

        bool BacktestDriver::has_full_window(size_t row) const
        {
            const auto bounds = window_bounds(row);
            return bounds.second - bounds.first >= config_.required_observations();
        }

        OptimizationResult BacktestDriver::solve_window(size_t row) const
        {
            const auto bounds = window_bounds(row);
            const model::ReturnSample window = sample_.slice(bounds.first, bounds.second);
            return optimizer_.optimize(spec_, window, config_.mode, config_.solver);
        }

        void BacktestDriver::advance(size_t row, const std::function<OptimizationResult()> &produce)
        {
            const std::string &date = sample_.dates()[row];

            if (!has_full_window(row))
            {
                result_.skipped_dates.push_back(date);
                if (config_.verbose)
                {
                    std::cerr << "Warning: Skipping rebalance on " << date
                              << " - insufficient return observations\n";
                }
                return;
            }

            state_ = DriverState::REBALANCING;

            BacktestEntry entry;
            entry.date = date;
            entry.row = row;
            entry.window_begin = window_bounds(row).first;
            entry.window_end = row;

            try
            {
                entry.result = produce();
                last_good_weights_ = entry.result.weights;

                if (config_.verbose)
                {
                    std::cout << "Rebalanced on " << date << " using " << entry.result.solver_name
                              << " (" << entry.result.iterations << " iterations)\n";
                }
            }
            catch (const SolveError &e)
            {
                if (config_.failure_policy == FailurePolicy::ABORT)
                {
                    throw;
                }

                ++result_.failure_count;
                entry.failed = true;
                entry.result.status = e.status();
                entry.result.solver_name = e.solver_name();
                entry.result.message = e.what();

                const auto n = static_cast<Eigen::Index>(spec_.num_assets());
                if (config_.failure_policy == FailurePolicy::HOLD_PREVIOUS && last_good_weights_.size() == n)
                {
                    entry.result.weights = last_good_weights_;
                }
                else
                {
                    entry.result.weights = Eigen::VectorXd::Constant(n, std::numeric_limits<double>::quiet_NaN());
                }

                std::cerr << "Warning: Optimization failed on " << date << ": " << e.what() << "\n";
            }

            result_.entries.push_back(entry);
        }

        void BacktestDriver::finish_if_exhausted()
        {
            if (cursor_ >= schedule_.size())
            {
                state_ = DriverState::EXHAUSTED;
                result_.complete = true;
                result_.message = std::to_string(result_.entries.size()) + " rebalances, " +
                                  std::to_string(result_.skipped_dates.size()) + " skipped, " +
                                  std::to_string(result_.failure_count) + " failed";
            }
        }

        bool BacktestDriver::step()
        {
            if (state_ == DriverState::EXHAUSTED)
            {
                return false;
            }

            const size_t row = schedule_[cursor_++];
            advance(row, [this, row]()
                    { return solve_window(row); });
            finish_if_exhausted();
            return true;
        }

        BacktestResult BacktestDriver::run()
        {
            if (config_.max_workers <= 1)
            {
                while (step())
                {
                }
                return result_;
            }

            while (state_ != DriverState::EXHAUSTED)
            {
                // Next batch: enough scheduled rows to keep max_workers solves in flight
                size_t end = cursor_;
                size_t solvable = 0;
                while (end < schedule_.size() && solvable < config_.max_workers)
                {
                    if (has_full_window(schedule_[end]))
                    {
                        ++solvable;
                    }
                    ++end;
                }

                std::vector<std::future<OptimizationResult>> pending(end - cursor_);
                for (size_t k = cursor_; k < end; ++k)
                {
                    const size_t row = schedule_[k];
                    if (has_full_window(row))
                    {
                        pending[k - cursor_] = std::async(std::launch::async, [this, row]()
                                                          { return solve_window(row); });
                    }
                }

                // Ordered merge; the failure policy sees entries chronologically
                const size_t begin = cursor_;
                for (size_t k = begin; k < end; ++k)
                {
                    auto &future = pending[k - begin];
                    ++cursor_;
                    advance(schedule_[k], [&future]()
                            { return future.get(); });
                }
                finish_if_exhausted();
            }

            return result_;
        }

    } // namespace backtest
} // namespace convexfolio
