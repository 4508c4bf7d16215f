// SPDX-License-Identifier: MIT
/**
 * @file return_sample.cpp
 * @brief Implementation of the dated return container
 */

#include "model/return_sample.hpp"
#include "model/errors.hpp"

#include <algorithm>
#include <cmath>
#include <set>

namespace convexfolio
{
    namespace model
    {

        ReturnSample::ReturnSample(const Eigen::MatrixXd &returns,
                                   const std::vector<std::string> &dates,
                                   const std::vector<std::string> &assets)
            : returns_(returns), dates_(dates), assets_(assets)
        {
            if (static_cast<size_t>(returns_.rows()) != dates_.size())
            {
                throw ValidationError(
                    "Return rows (" + std::to_string(returns_.rows()) +
                    ") do not match number of dates (" + std::to_string(dates_.size()) + ")");
            }

            if (static_cast<size_t>(returns_.cols()) != assets_.size())
            {
                throw ValidationError(
                    "Return columns (" + std::to_string(returns_.cols()) +
                    ") do not match number of assets (" + std::to_string(assets_.size()) + ")");
            }

            std::set<std::string> unique(assets_.begin(), assets_.end());
            if (unique.size() != assets_.size())
            {
                throw ValidationError("Return sample contains duplicate asset identifiers");
            }

            for (size_t i = 1; i < dates_.size(); ++i)
            {
                if (!(dates_[i - 1] < dates_[i]))
                {
                    throw ValidationError(
                        "Dates must be strictly increasing: " + dates_[i - 1] +
                        " followed by " + dates_[i]);
                }
            }
        }

        ReturnSample ReturnSample::slice(size_t begin, size_t end) const
        {
            if (begin > end || end > num_observations())
            {
                throw ValidationError(
                    "Invalid slice [" + std::to_string(begin) + ", " + std::to_string(end) +
                    ") of sample with " + std::to_string(num_observations()) + " observations");
            }

            const Eigen::Index rows = static_cast<Eigen::Index>(end - begin);
            Eigen::MatrixXd block = returns_.middleRows(static_cast<Eigen::Index>(begin), rows);
            std::vector<std::string> dates(dates_.begin() + static_cast<std::ptrdiff_t>(begin),
                                           dates_.begin() + static_cast<std::ptrdiff_t>(end));
            return ReturnSample(block, dates, assets_);
        }

        ReturnSample ReturnSample::select(const std::vector<std::string> &assets) const
        {
            Eigen::MatrixXd selected(returns_.rows(), static_cast<Eigen::Index>(assets.size()));
            for (size_t j = 0; j < assets.size(); ++j)
            {
                auto it = std::find(assets_.begin(), assets_.end(), assets[j]);
                if (it == assets_.end())
                {
                    throw ValidationError("Asset not found in return sample: " + assets[j]);
                }
                selected.col(static_cast<Eigen::Index>(j)) =
                    returns_.col(static_cast<Eigen::Index>(it - assets_.begin()));
            }
            return ReturnSample(selected, dates_, assets);
        }

        Eigen::VectorXd ReturnSample::mean() const
        {
            if (returns_.rows() == 0)
            {
                throw ValidationError("Cannot compute mean of an empty return sample");
            }
            return returns_.colwise().mean().transpose();
        }

        std::optional<size_t> ReturnSample::index_of(const std::string &date) const
        {
            auto it = std::lower_bound(dates_.begin(), dates_.end(), date);
            if (it == dates_.end() || *it != date)
            {
                return std::nullopt;
            }
            return static_cast<size_t>(it - dates_.begin());
        }

        void ReturnSample::require_finite() const
        {
            for (Eigen::Index i = 0; i < returns_.rows(); ++i)
            {
                for (Eigen::Index j = 0; j < returns_.cols(); ++j)
                {
                    if (!std::isfinite(returns_(i, j)))
                    {
                        throw ValidationError(
                            "Missing or non-finite return on " + dates_[static_cast<size_t>(i)] +
                            " for asset " + assets_[static_cast<size_t>(j)]);
                    }
                }
            }
        }

    } // namespace model
} // namespace convexfolio
