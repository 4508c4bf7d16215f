// SPDX-License-Identifier: MIT
/**
 * @file sample_covariance.cpp
 * @brief Implementation of sample covariance estimator
 */

#include "risk/sample_covariance.hpp"
#include <cmath>

namespace convexfolio
{
    namespace risk
    {

        SampleCovariance::SampleCovariance(bool bias_correction) : bias_correction_(bias_correction)
        {
        }

        double SampleCovariance::normalization(Eigen::Index n_obs) const
        {
            // Bessel's correction divides by (n-1), maximum likelihood by n
            return bias_correction_ ? static_cast<double>(n_obs - 1)
                                    : static_cast<double>(n_obs);
        }

        Eigen::MatrixXd SampleCovariance::estimate_covariance(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            Eigen::RowVectorXd means = returns.colwise().mean();
            Eigen::MatrixXd centered = returns.rowwise() - means;

            Eigen::MatrixXd covariance = (centered.transpose() * centered);
            covariance /= normalization(returns.rows());

            // Exact symmetry for downstream eigenvalue computations
            return ensure_symmetric(covariance);
        }

        Eigen::MatrixXd SampleCovariance::estimate_factor(const Eigen::MatrixXd &returns) const
        {
            validate_returns(returns);

            Eigen::RowVectorXd means = returns.colwise().mean();
            Eigen::MatrixXd centered = returns.rowwise() - means;
            return centered / std::sqrt(normalization(returns.rows()));
        }

        std::string SampleCovariance::get_name() const
        {
            return "SampleCovariance";
        }

    } // namespace risk
} // namespace convexfolio
