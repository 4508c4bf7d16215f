// SPDX-License-Identifier: MIT
/**
 * @file data_loader.cpp
 * @brief Implementation of DataLoader
 */

#include "data/data_loader.hpp"
#include "model/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace convexfolio
{
    namespace data
    {

        // ===========================
        // CSV Loading - Wide Format
        // ===========================

        model::ReturnSample DataLoader::load_returns_csv(const std::string &filepath,
                                                         const std::vector<std::string> &assets)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open file: " + filepath);
            }

            std::string line;
            std::vector<std::string> all_assets;
            std::vector<std::string> dates;
            std::vector<std::vector<double>> return_rows;

            // Read header line
            if (!std::getline(file, line))
            {
                throw std::runtime_error("Empty CSV file: " + filepath);
            }

            auto header = parse_csv_line(line);
            if (header.empty() || trim(header[0]) != "date")
            {
                throw ValidationError("CSV must start with 'date' column: " + filepath);
            }

            for (size_t i = 1; i < header.size(); ++i)
            {
                all_assets.push_back(trim(header[i]));
            }

            // Determine which columns to load
            std::vector<size_t> column_indices;
            std::vector<std::string> selected_assets;

            if (assets.empty())
            {
                for (size_t i = 0; i < all_assets.size(); ++i)
                {
                    column_indices.push_back(i);
                    selected_assets.push_back(all_assets[i]);
                }
            }
            else
            {
                for (const auto &asset : assets)
                {
                    auto it = std::find(all_assets.begin(), all_assets.end(), asset);
                    if (it == all_assets.end())
                    {
                        throw ValidationError("Asset '" + asset + "' not found in " + filepath);
                    }
                    column_indices.push_back(static_cast<size_t>(std::distance(all_assets.begin(), it)));
                    selected_assets.push_back(asset);
                }
            }

            if (selected_assets.empty())
            {
                throw ValidationError("No asset columns in " + filepath);
            }

            // Read data rows
            size_t line_number = 1;
            while (std::getline(file, line))
            {
                ++line_number;
                if (trim(line).empty())
                    continue;

                auto fields = parse_csv_line(line);
                std::string date = trim(fields[0]);
                if (!is_valid_date_format(date))
                {
                    throw ValidationError("Malformed date '" + date + "' on line " +
                                          std::to_string(line_number) + " of " + filepath);
                }

                dates.push_back(date);

                std::vector<double> row;
                row.reserve(column_indices.size());
                for (size_t idx : column_indices)
                {
                    if (idx + 1 < fields.size())
                    {
                        row.push_back(safe_stod(fields[idx + 1]));
                    }
                    else
                    {
                        row.push_back(std::numeric_limits<double>::quiet_NaN());
                    }
                }

                return_rows.push_back(row);
            }

            file.close();

            if (dates.empty())
            {
                throw ValidationError("No return observations in " + filepath);
            }

            // Convert to Eigen matrix
            Eigen::MatrixXd returns(static_cast<Eigen::Index>(dates.size()),
                                    static_cast<Eigen::Index>(selected_assets.size()));
            for (size_t i = 0; i < dates.size(); ++i)
            {
                for (size_t j = 0; j < selected_assets.size(); ++j)
                {
                    returns(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = return_rows[i][j];
                }
            }

            return model::ReturnSample(returns, dates, selected_assets);
        }

        model::ReturnSample DataLoader::filter_dates(const model::ReturnSample &sample,
                                                     const std::string &start_date,
                                                     const std::string &end_date)
        {
            const auto &dates = sample.dates();
            auto first = start_date.empty()
                             ? dates.begin()
                             : std::lower_bound(dates.begin(), dates.end(), start_date);
            auto last = end_date.empty()
                            ? dates.end()
                            : std::upper_bound(dates.begin(), dates.end(), end_date);
            if (last < first)
            {
                last = first;
            }

            return sample.slice(static_cast<size_t>(first - dates.begin()),
                                static_cast<size_t>(last - dates.begin()));
        }

        // ================
        // JSON Loading
        // ================

        nlohmann::json DataLoader::load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            file.close();
            return j;
        }

        // ===========================
        // Private Helper Methods
        // ===========================

        std::vector<std::string> DataLoader::parse_csv_line(const std::string &line)
        {
            std::vector<std::string> tokens;
            std::string token;
            bool in_quotes = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    in_quotes = !in_quotes;
                }
                else if (c == ',' && !in_quotes)
                {
                    tokens.push_back(token);
                    token.clear();
                }
                else
                {
                    token += c;
                }
            }

            tokens.push_back(token);
            return tokens;
        }

        bool DataLoader::is_valid_date_format(const std::string &date)
        {
            if (date.length() != 10)
                return false;
            if (date[4] != '-' || date[7] != '-')
                return false;

            for (size_t i = 0; i < date.length(); ++i)
            {
                if (i == 4 || i == 7)
                    continue;
                if (!std::isdigit(static_cast<unsigned char>(date[i])))
                    return false;
            }

            const int month = std::stoi(date.substr(5, 2));
            const int day = std::stoi(date.substr(8, 2));
            return month >= 1 && month <= 12 && day >= 1 && day <= 31;
        }

        std::string DataLoader::trim(const std::string &str)
        {
            size_t first = str.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
                return "";

            size_t last = str.find_last_not_of(" \t\r\n");
            return str.substr(first, last - first + 1);
        }

        double DataLoader::safe_stod(const std::string &str)
        {
            const std::string trimmed = trim(str);
            if (trimmed.empty())
            {
                return std::numeric_limits<double>::quiet_NaN();
            }

            // strtod accepts "nan"/"inf" and reports where parsing stopped
            const char *begin = trimmed.c_str();
            char *end = nullptr;
            const double value = std::strtod(begin, &end);
            if (end == begin || *end != '\0')
            {
                return std::numeric_limits<double>::quiet_NaN();
            }
            return value;
        }

    } // namespace data
} // namespace convexfolio
