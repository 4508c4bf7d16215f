// SPDX-License-Identifier: MIT
#include "backtest/rebalance_scheduler.hpp"
#include "model/errors.hpp"
#include "util/string_utils.hpp"

#include <cctype>

namespace convexfolio {
namespace backtest {

std::string to_string(RebalanceFrequency frequency) {
    switch (frequency) {
        case RebalanceFrequency::EVERY_PERIOD: return "every_period";
        case RebalanceFrequency::WEEKLY: return "weekly";
        case RebalanceFrequency::MONTHLY: return "monthly";
        case RebalanceFrequency::QUARTERLY: return "quarterly";
        case RebalanceFrequency::ANNUALLY: return "annually";
    }
    return "unknown";
}

RebalanceConfig RebalanceConfig::from_json(const nlohmann::json& j) {
    RebalanceConfig cfg;
    if (j.contains("frequency")) {
        cfg.frequency = parse_frequency(j.at("frequency").get<std::string>());
    }
    return cfg;
}

RebalanceConfig RebalanceConfig::from_string(const std::string& freq_str) {
    RebalanceConfig cfg;
    cfg.frequency = parse_frequency(freq_str);
    return cfg;
}

RebalanceFrequency RebalanceConfig::parse_frequency(const std::string& freq_str) {
    auto s = util::to_lower(freq_str);
    if (s == "every_period" || s == "period" || s == "daily" || s == "d") return RebalanceFrequency::EVERY_PERIOD;
    if (s == "weekly" || s == "w") return RebalanceFrequency::WEEKLY;
    if (s == "monthly" || s == "m") return RebalanceFrequency::MONTHLY;
    if (s == "quarterly" || s == "q") return RebalanceFrequency::QUARTERLY;
    if (s == "annually" || s == "annual" || s == "y" || s == "yearly") return RebalanceFrequency::ANNUALLY;
    throw ValidationError("Invalid rebalance frequency: " + freq_str);
}

RebalanceScheduler::RebalanceScheduler(const RebalanceConfig& config)
    : config_(config) {}

std::vector<size_t> RebalanceScheduler::schedule(const std::vector<std::string>& dates) const {
    std::vector<size_t> rows;
    for (size_t r = 0; r < dates.size(); ++r) {
        if (!is_valid_date(dates[r]))
            throw ValidationError("Malformed date '" + dates[r] + "', expected YYYY-MM-DD");
        if (r == 0 || is_calendar_trigger(dates[r - 1], dates[r])) rows.push_back(r);
    }
    return rows;
}

bool RebalanceScheduler::is_calendar_trigger(const std::string& previous_date,
                                             const std::string& date) const {
    if (config_.frequency == RebalanceFrequency::EVERY_PERIOD) return true;
    return period_key(date) != period_key(previous_date);
}

bool RebalanceScheduler::is_valid_date(const std::string& date) {
    if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;
    for (size_t i = 0; i < date.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(date[i]))) return false;
    }
    int month = extract_month(date);
    int day = extract_day(date);
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

long long RebalanceScheduler::period_key(const std::string& date) const {
    int year = extract_year(date);
    int month = extract_month(date);

    switch (config_.frequency) {
        case RebalanceFrequency::EVERY_PERIOD:
            return days_since_epoch(date);
        case RebalanceFrequency::WEEKLY: {
            // 1970-01-01 was a Thursday; shift so weeks start on Monday
            long long days = days_since_epoch(date) + 3;
            return days >= 0 ? days / 7 : (days - 6) / 7;
        }
        case RebalanceFrequency::MONTHLY:
            return static_cast<long long>(year) * 12 + (month - 1);
        case RebalanceFrequency::QUARTERLY:
            return static_cast<long long>(year) * 4 + (month - 1) / 3;
        case RebalanceFrequency::ANNUALLY:
            return year;
    }
    return 0;
}

int RebalanceScheduler::extract_year(const std::string& date) {
    return std::stoi(date.substr(0,4));
}

int RebalanceScheduler::extract_month(const std::string& date) {
    return std::stoi(date.substr(5,2));
}

int RebalanceScheduler::extract_day(const std::string& date) {
    return std::stoi(date.substr(8,2));
}

long long RebalanceScheduler::days_since_epoch(const std::string& date) {
    // Proleptic Gregorian day count, independent of the local time zone
    long long y = extract_year(date);
    long long m = extract_month(date);
    long long d = extract_day(date);
    y -= m <= 2 ? 1 : 0;
    long long era = (y >= 0 ? y : y - 399) / 400;
    long long yoe = y - era * 400;
    long long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

} // namespace backtest
} // namespace convexfolio
