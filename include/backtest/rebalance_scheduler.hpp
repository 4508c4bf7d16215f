// SPDX-License-Identifier: MIT
#pragma once

#include <string>
#include <stdexcept>
#include <vector>
#include <nlohmann/json.hpp>

namespace convexfolio {
namespace backtest {

enum class RebalanceFrequency {
    EVERY_PERIOD,
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    ANNUALLY
};

std::string to_string(RebalanceFrequency frequency);

struct RebalanceConfig {
    RebalanceFrequency frequency = RebalanceFrequency::MONTHLY;

    static RebalanceConfig from_json(const nlohmann::json& j);
    static RebalanceConfig from_string(const std::string& freq_str);
    static RebalanceFrequency parse_frequency(const std::string& freq_str);
};

/**
 * @brief Turns a dated sample into the rows on which to rebalance.
 *
 * EVERY_PERIOD triggers on every observation. Calendar frequencies trigger
 * on the first observation of each calendar week (Monday-based), month,
 * quarter or year; the first observation of the sample always opens a new
 * period. Dates are ISO "YYYY-MM-DD".
 */
class RebalanceScheduler {
public:
    explicit RebalanceScheduler(const RebalanceConfig& config);
    ~RebalanceScheduler() = default;

    /// Row indices (ascending) on which a rebalance is due.
    std::vector<size_t> schedule(const std::vector<std::string>& dates) const;

    /// Whether `date` falls in a different calendar period than `previous_date`.
    bool is_calendar_trigger(const std::string& previous_date, const std::string& date) const;

    const RebalanceConfig& config() const { return config_; }

    static bool is_valid_date(const std::string& date);

private:
    RebalanceConfig config_;

    long long period_key(const std::string& date) const;
    static int extract_year(const std::string& date);
    static int extract_month(const std::string& date);
    static int extract_day(const std::string& date);
    static long long days_since_epoch(const std::string& date);
};

} // namespace backtest
} // namespace convexfolio
