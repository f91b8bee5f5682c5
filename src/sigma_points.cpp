/**
 * @file sigma_points.cpp
 * @brief Implementation of scaled sigma points and the unscented transform.
 */

#include "sigma_points.hpp"

namespace prognostics {

MerweScaledSigmaPoints::MerweScaledSigmaPoints(int n, double alpha, double beta, double kappa)
    : n_(n), alpha_(alpha), beta_(beta), kappa_(kappa) {
    if (n_ <= 0) {
        throw ConfigurationError("sigma point dimension must be positive");
    }
    lambda_ = alpha_ * alpha_ * (n_ + kappa_) - n_;
    const double scale = n_ + lambda_;
    if (!(scale > 0)) {
        throw ConfigurationError(
            "sigma point scaling n + lambda must be positive (n=" + std::to_string(n_) +
            ", alpha=" + std::to_string(alpha_) + ", kappa=" + std::to_string(kappa_) + ")");
    }

    const int num = num_points();
    Wm_ = Eigen::VectorXd::Constant(num, 0.5 / scale);
    Wc_ = Wm_;
    Wm_(0) = lambda_ / scale;
    Wc_(0) = lambda_ / scale + (1.0 - alpha_ * alpha_ + beta_);
}

Eigen::MatrixXd MerweScaledSigmaPoints::generate(const Eigen::VectorXd& mean,
                                                 const Eigen::MatrixXd& covariance) const {
    if (mean.size() != n_ || covariance.rows() != n_ || covariance.cols() != n_) {
        throw std::invalid_argument(
            "sigma point input must have dimension " + std::to_string(n_));
    }

    Eigen::LLT<Eigen::MatrixXd> llt((n_ + lambda_) * covariance);
    if (llt.info() != Eigen::Success) {
        throw NumericalError("sigma points: covariance is not positive definite");
    }
    Eigen::MatrixXd L = llt.matrixL();

    Eigen::MatrixXd points(n_, num_points());
    points.col(0) = mean;
    for (int k = 0; k < n_; ++k) {
        points.col(k + 1) = mean + L.col(k);
        points.col(n_ + k + 1) = mean - L.col(k);
    }
    return points;
}

UnscentedMoments unscented_transform(const Eigen::MatrixXd& points,
                                     const Eigen::VectorXd& mean_weights,
                                     const Eigen::VectorXd& cov_weights,
                                     const Eigen::MatrixXd* noise_cov) {
    UnscentedMoments result;
    result.mean = points * mean_weights;

    Eigen::MatrixXd centered = points.colwise() - result.mean;
    result.covariance = centered * cov_weights.asDiagonal() * centered.transpose();
    if (noise_cov != nullptr) {
        result.covariance += *noise_cov;
    }
    return result;
}

Eigen::MatrixXd unscented_cross_covariance(const Eigen::MatrixXd& points_x,
                                           const Eigen::VectorXd& mean_x,
                                           const Eigen::MatrixXd& points_z,
                                           const Eigen::VectorXd& mean_z,
                                           const Eigen::VectorXd& cov_weights) {
    Eigen::MatrixXd dx = points_x.colwise() - mean_x;
    Eigen::MatrixXd dz = points_z.colwise() - mean_z;
    return dx * cov_weights.asDiagonal() * dz.transpose();
}

}  // namespace prognostics
