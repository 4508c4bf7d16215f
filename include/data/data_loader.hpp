// SPDX-License-Identifier: MIT
/**
 * @file data_loader.hpp
 * @brief Return-matrix CSV reader and JSON file loading
 *
 * The engine consumes an already-aligned return matrix; this loader only
 * parses it. Resampling, price-to-return conversion and calendar alignment
 * happen upstream.
 *
 * Wide CSV format:
 *
 *     date,SPY,TLT,GLD
 *     2024-01-02,0.0012,-0.0031,0.0004
 *     ...
 */

#ifndef CONVEXFOLIO_DATA_LOADER_HPP
#define CONVEXFOLIO_DATA_LOADER_HPP

#include "model/return_sample.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace convexfolio {
namespace data {

class DataLoader {
public:
    DataLoader() = default;

    ~DataLoader() = default;

    // ========================================================================
    // CSV Loading Methods
    // ========================================================================

    /**
     * @brief Load a wide-format return CSV
     *
     * @param filepath Path to CSV file
     * @param assets Columns to load, in this order (empty = all, file order)
     * @return Return sample; blank or non-numeric cells become NaN
     *
     * @throws std::runtime_error if the file cannot be read
     * @throws ValidationError on a missing date header, malformed or
     *         non-increasing dates, or requested assets absent from the file
     */
    static model::ReturnSample load_returns_csv(const std::string& filepath,
                                                const std::vector<std::string>& assets = {});

    /**
     * @brief Restrict a sample to start_date <= date <= end_date
     *
     * Empty bounds are open. Dates compare lexicographically (ISO format).
     */
    static model::ReturnSample filter_dates(const model::ReturnSample& sample,
                                            const std::string& start_date,
                                            const std::string& end_date);

    // ========================================================================
    // Configuration Loading
    // ========================================================================

    /**
     * @brief Load JSON from file
     * @throws std::runtime_error if the file cannot be opened or parsed
     */
    static nlohmann::json load_json(const std::string& filepath);

private:
    // ========================
    // Private Helper Methods
    // ========================

    static std::vector<std::string> parse_csv_line(const std::string& line);

    static bool is_valid_date_format(const std::string& date);

    static std::string trim(const std::string& str);

    static double safe_stod(const std::string& str);
};

} // namespace data
} // namespace convexfolio

#endif // CONVEXFOLIO_DATA_LOADER_HPP
