// SPDX-License-Identifier: MIT

#include "backtest/backtest_result.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace convexfolio
{
    namespace backtest
    {

        Eigen::VectorXd BacktestResult::weights_at(const std::string &date) const
        {
            Eigen::VectorXd held = Eigen::VectorXd::Constant(
                static_cast<Eigen::Index>(assets.size()), std::numeric_limits<double>::quiet_NaN());

            // ISO dates order lexicographically
            for (const auto &entry : entries)
            {
                if (entry.date > date)
                {
                    break;
                }
                held = entry.result.weights;
            }
            return held;
        }

        Eigen::MatrixXd BacktestResult::held_weights(const std::vector<std::string> &dates) const
        {
            Eigen::MatrixXd held(static_cast<Eigen::Index>(dates.size()),
                                 static_cast<Eigen::Index>(assets.size()));
            for (size_t i = 0; i < dates.size(); ++i)
            {
                held.row(static_cast<Eigen::Index>(i)) = weights_at(dates[i]).transpose();
            }
            return held;
        }

        void BacktestResult::print_summary() const
        {
            std::cout << "\n=== Backtest Summary ===\n";
            std::cout << "Complete: " << (complete ? "yes" : "no") << "\n";
            if (!message.empty())
            {
                std::cout << "Message: " << message << "\n";
            }
            std::cout << "Rebalances: " << entries.size() << "\n";
            std::cout << "Skipped dates: " << skipped_dates.size() << "\n";
            std::cout << "Failures: " << failure_count << "\n";

            if (!entries.empty())
            {
                std::cout << "Period: " << entries.front().date << " to " << entries.back().date << "\n";
                std::cout << std::string(50, '-') << "\n";

                std::cout << std::left << std::setw(12) << "Date";
                for (const auto &asset : assets)
                {
                    std::cout << std::right << std::setw(10) << asset;
                }
                std::cout << "  Status\n";

                for (const auto &entry : entries)
                {
                    std::cout << std::left << std::setw(12) << entry.date << std::right
                              << std::fixed << std::setprecision(4);
                    for (Eigen::Index i = 0; i < entry.result.weights.size(); ++i)
                    {
                        std::cout << std::setw(10) << entry.result.weights(i);
                    }
                    std::cout << "  " << to_string(entry.result.status) << "\n";
                }
            }

            std::cout << "========================\n"
                      << std::endl;
        }

        void BacktestResult::export_weights_csv(const std::string &filepath) const
        {
            std::ofstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file for writing: " + filepath);
            }

            file << "date,status";
            for (const auto &asset : assets)
            {
                file << "," << asset;
            }
            file << "\n";

            for (const auto &entry : entries)
            {
                file << entry.date << "," << to_string(entry.result.status);
                for (Eigen::Index i = 0; i < entry.result.weights.size(); ++i)
                {
                    file << ",";
                    const double w = entry.result.weights(i);
                    // Undefined weights are left empty
                    if (std::isfinite(w))
                    {
                        file << std::setprecision(10) << w;
                    }
                }
                file << "\n";
            }

            file.close();
        }

        nlohmann::json BacktestResult::to_json() const
        {
            nlohmann::json j;
            j["assets"] = assets;
            j["complete"] = complete;
            j["failure_count"] = failure_count;
            j["skipped_dates"] = skipped_dates;

            nlohmann::json rows = nlohmann::json::array();
            for (const auto &entry : entries)
            {
                nlohmann::json row = entry.result.to_json(assets);
                row["date"] = entry.date;
                row["window_begin"] = entry.window_begin;
                row["window_end"] = entry.window_end;
                row["failed"] = entry.failed;
                rows.push_back(row);
            }
            j["entries"] = rows;
            return j;
        }

    } // namespace backtest
} // namespace convexfolio
