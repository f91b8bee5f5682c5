/**
 * @file sigma_points.hpp
 * @brief Scaled sigma points and the unscented transform.
 *
 * Van der Merwe's scaled sigma points:
 *     lambda = alpha^2 (n + kappa) - n
 *     X_0 = mu,  X_i = mu +/- [sqrt((n + lambda) P)]_i
 *     Wm_0 = lambda / (n + lambda)
 *     Wc_0 = Wm_0 + (1 - alpha^2 + beta)
 *     Wm_i = Wc_i = 1 / (2 (n + lambda))
 */

#ifndef PROGNOSTICS_SIGMA_POINTS_HPP
#define PROGNOSTICS_SIGMA_POINTS_HPP

#include "types.hpp"

namespace prognostics {

/**
 * @brief Mean and covariance recovered by the unscented transform.
 */
struct UnscentedMoments {
    Eigen::VectorXd mean;
    Eigen::MatrixXd covariance;
};

/**
 * @brief Generator of 2n+1 scaled sigma points.
 */
class MerweScaledSigmaPoints {
public:
    /**
     * @param n State dimension
     * @param alpha Spread of the points around the mean
     * @param beta Prior knowledge of the distribution (2 is optimal for Gaussians)
     * @param kappa Secondary scaling parameter
     * @throws ConfigurationError if n <= 0 or n + lambda <= 0
     */
    MerweScaledSigmaPoints(int n, double alpha = 1.0, double beta = 0.0, double kappa = -1.0);

    /// State dimension
    int dim() const { return n_; }

    /// Number of sigma points (2n + 1)
    int num_points() const { return 2 * n_ + 1; }

    /// Scaling parameter lambda
    double lambda() const { return lambda_; }

    /// Weights for the mean
    const Eigen::VectorXd& mean_weights() const { return Wm_; }

    /// Weights for the covariance
    const Eigen::VectorXd& cov_weights() const { return Wc_; }

    /**
     * @brief Generate sigma points, one per column.
     *
     * @param mean Mean vector (n)
     * @param covariance Covariance matrix (n x n)
     * @return n x (2n + 1) matrix of sigma points
     * @throws NumericalError if (n + lambda) * covariance is not positive definite
     */
    Eigen::MatrixXd generate(const Eigen::VectorXd& mean,
                             const Eigen::MatrixXd& covariance) const;

private:
    int n_;
    double alpha_;
    double beta_;
    double kappa_;
    double lambda_;
    Eigen::VectorXd Wm_;
    Eigen::VectorXd Wc_;
};

/**
 * @brief Recombine propagated sigma points into a mean and covariance.
 *
 * @param points d x (2n + 1) propagated sigma points, one per column
 * @param mean_weights Weights for the mean
 * @param cov_weights Weights for the covariance
 * @param noise_cov Optional additive noise covariance (d x d)
 * @return Weighted mean and covariance
 */
UnscentedMoments unscented_transform(const Eigen::MatrixXd& points,
                                     const Eigen::VectorXd& mean_weights,
                                     const Eigen::VectorXd& cov_weights,
                                     const Eigen::MatrixXd* noise_cov = nullptr);

/**
 * @brief Cross covariance between two propagated sigma point sets.
 */
Eigen::MatrixXd unscented_cross_covariance(const Eigen::MatrixXd& points_x,
                                           const Eigen::VectorXd& mean_x,
                                           const Eigen::MatrixXd& points_z,
                                           const Eigen::VectorXd& mean_z,
                                           const Eigen::VectorXd& cov_weights);

}  // namespace prognostics

#endif  // PROGNOSTICS_SIGMA_POINTS_HPP
