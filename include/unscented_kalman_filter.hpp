/**
 * @file unscented_kalman_filter.hpp
 * @brief Unscented Kalman filter for nonlinear models.
 *
 * Sigma points are propagated through the noise-free model; process and
 * measurement noise enter only through Q and R.
 */

#ifndef PROGNOSTICS_UNSCENTED_KALMAN_FILTER_HPP
#define PROGNOSTICS_UNSCENTED_KALMAN_FILTER_HPP

#include "sigma_points.hpp"
#include "state_estimator.hpp"

namespace prognostics {

class UnscentedKalmanFilter : public StateEstimator {
public:
    /**
     * @param model Model used for propagation and measurement
     * @param x0 Initial belief; a ScalarData belief starts with P = Q / 10
     * @param config Filter parameters
     * @throws ConfigurationError on invalid parameters or a missing state
     */
    UnscentedKalmanFilter(std::shared_ptr<const PrognosticsModel> model,
                          const UncertainData& x0,
                          UnscentedKalmanFilterConfig config = UnscentedKalmanFilterConfig());

    /// Current belief as a MultivariateNormalDist
    std::unique_ptr<UncertainData> x() const override;

    /// State mean in model order
    const Eigen::VectorXd& mean() const { return x_; }

    /// State covariance in model order
    const Eigen::MatrixXd& covariance() const { return P_; }

    /// Normalized innovation squared of the last correction
    double last_nis() const { return last_nis_; }

protected:
    void propagate(const Eigen::VectorXd& u, const std::vector<double>& steps) override;
    void correct(const Eigen::VectorXd& z) override;
    void save_belief() override;
    void restore_belief() override;

private:
    UnscentedKalmanFilterConfig config_;
    MerweScaledSigmaPoints points_;
    Eigen::VectorXd x_;
    Eigen::MatrixXd P_;
    Eigen::VectorXd saved_x_;
    Eigen::MatrixXd saved_P_;
    Eigen::MatrixXd sigmas_f_;   ///< Sigma points after the last propagation
    double last_nis_ = 0.0;
};

}  // namespace prognostics

#endif  // PROGNOSTICS_UNSCENTED_KALMAN_FILTER_HPP
