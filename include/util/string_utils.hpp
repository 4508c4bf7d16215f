// SPDX-License-Identifier: MIT
/**
 * @file string_utils.hpp
 * @brief String helpers shared by the tag parsers
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace convexfolio
{
    namespace util
    {

        /// ASCII lower-case copy; tag comparisons are case-insensitive
        inline std::string to_lower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

    } // namespace util
} // namespace convexfolio
