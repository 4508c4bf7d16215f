// SPDX-License-Identifier: MIT
/*
 * @file return_sample.hpp
 * @brief Dated multi-asset return matrix.
 *
 * Stores observed returns as an Eigen matrix (observations x assets) with
 * an ISO date per row and an identifier per column. Windows are cut with
 * slice(), which copies the rows so a window never aliases its parent.
 */

#pragma once

#include <Eigen/Dense>
#include <optional>
#include <string>
#include <vector>

namespace convexfolio
{
    namespace model
    {

        /**
         * @class ReturnSample
         * @brief Container for a T x n return sample.
         *
         * @note Dates are "YYYY-MM-DD" strings and must be strictly increasing.
         * @note Missing observations are represented as NaN; a window that
         *       contains them cannot be solved (see require_finite()).
         */
        class ReturnSample
        {
        public:
            /**
             * @brief Constructor with data.
             * @param returns Return matrix (observations x assets).
             * @param dates One date per row.
             * @param assets One identifier per column.
             * @throws ValidationError on dimension mismatch, unordered dates
             *         or duplicate asset identifiers.
             */
            ReturnSample(const Eigen::MatrixXd &returns,
                         const std::vector<std::string> &dates,
                         const std::vector<std::string> &assets);

            const Eigen::MatrixXd &returns() const { return returns_; }
            const std::vector<std::string> &dates() const { return dates_; }
            const std::vector<std::string> &assets() const { return assets_; }

            size_t num_observations() const { return static_cast<size_t>(returns_.rows()); }
            size_t num_assets() const { return static_cast<size_t>(returns_.cols()); }

            /**
             * @brief Rows [begin, end) as a new sample.
             * @throws ValidationError if the range is out of bounds.
             */
            ReturnSample slice(size_t begin, size_t end) const;

            /**
             * @brief Columns reordered to match an asset list.
             * @throws ValidationError if an asset is missing from the sample.
             */
            ReturnSample select(const std::vector<std::string> &assets) const;

            /**
             * @brief Column-wise sample mean (n x 1).
             */
            Eigen::VectorXd mean() const;

            /**
             * @brief Row index of a date, empty if absent.
             */
            std::optional<size_t> index_of(const std::string &date) const;

            bool all_finite() const { return returns_.allFinite(); }

            /**
             * @brief Reject NaN/Inf values.
             * @throws ValidationError naming the first offending date and asset.
             */
            void require_finite() const;

        private:
            Eigen::MatrixXd returns_;
            std::vector<std::string> dates_;
            std::vector<std::string> assets_;
        };

    } // namespace model
} // namespace convexfolio
