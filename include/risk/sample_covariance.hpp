// SPDX-License-Identifier: MIT
/**
 * @file sample_covariance.hpp
 * @brief Sample covariance of a return window, dense or factorized
 *
 * With X the T x N window and Xc = X - 1 mean(X):
 *
 *     Sigma = Xc^T Xc / (T - 1)
 *     F     = Xc / sqrt(T - 1),   Sigma = F^T F
 *
 * The problem builder uses Sigma directly for small universes and F for
 * the factorized variance rows (y = F w, minimize y^T y) when N is large
 * or N >= T, where Sigma is singular anyway.
 */

#pragma once

#include "risk_model.hpp"

namespace convexfolio
{
    namespace risk
    {

        /**
         * @class SampleCovariance
         * @brief Bessel-corrected (optionally biased) sample covariance
         *
         * Stateless apart from the correction flag; one instance can serve
         * concurrent backtest windows.
         */
        class SampleCovariance : public RiskModel
        {
        public:
            /// @param bias_correction Divide by T - 1 (true) or T (false)
            explicit SampleCovariance(bool bias_correction = true);

            ~SampleCovariance() override = default;

            /**
             * @brief Dense N x N covariance of the window
             * @throws std::invalid_argument for fewer than two observations
             *         or non-finite returns
             */
            Eigen::MatrixXd estimate_covariance(
                const Eigen::MatrixXd &returns) const override;

            /**
             * @brief T x N factor: the centered window scaled by the normalization
             *
             * Never forms the N x N matrix.
             */
            Eigen::MatrixXd estimate_factor(
                const Eigen::MatrixXd &returns) const override;

            std::string get_name() const override;

            bool uses_bias_correction() const { return bias_correction_; }

        private:
            bool bias_correction_;

            double normalization(Eigen::Index n_obs) const;
        };

    } // namespace risk
} // namespace convexfolio
