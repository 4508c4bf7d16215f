// SPDX-License-Identifier: MIT
/**
 * @file risk_model.hpp
 * @brief Covariance estimator interface used by the problem builder
 *
 * An estimator turns a T x N return window into either the dense
 * covariance Sigma or a factor F with Sigma = F^T F. The builder picks
 * the form per solve; estimators only have to agree on Sigma.
 */

#pragma once

#include <Eigen/Dense>
#include <string>

namespace convexfolio
{
    namespace risk
    {

        /**
         * @class RiskModel
         * @brief Abstract covariance estimator
         *
         * Usage Example:
         * @code
         * std::unique_ptr<RiskModel> model = std::make_unique<SampleCovariance>();
         * Eigen::MatrixXd sigma = model->estimate_covariance(window.returns());
         * Eigen::MatrixXd F = model->estimate_factor(window.returns());
         * @endcode
         */
        class RiskModel
        {
        public:
            virtual ~RiskModel() = default;

            /**
             * @brief Symmetric N x N covariance of a return window
             * @throws std::invalid_argument if the window is unusable
             */
            virtual Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const = 0;

            /**
             * @brief Factor F (k x N) with F^T F equal to the covariance
             *
             * Must not form the N x N matrix; large universes rely on it.
             */
            virtual Eigen::MatrixXd estimate_factor(
                const Eigen::MatrixXd &returns) const = 0;

            virtual std::string get_name() const = 0;

        protected:
            /// @throws std::invalid_argument if empty, under two rows, or non-finite
            static void validate_returns(const Eigen::MatrixXd &returns);

            /// (M + M^T) / 2
            static Eigen::MatrixXd ensure_symmetric(const Eigen::MatrixXd &matrix);
        };

    } // namespace risk
} // namespace convexfolio
