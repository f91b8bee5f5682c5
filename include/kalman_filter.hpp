/**
 * @file kalman_filter.hpp
 * @brief Linear Kalman filter for LinearModel.
 *
 * Each sub-step discretizes the continuous model:
 *     F = I + A dt,  B' = [B | E] dt,  u' = [u; 1]
 *     x = F x + B' u'
 *     P = alpha^2 F P F^T + Q
 * Correction with H = C:
 *     y = z - D - C x,  S = C P C^T + R,  K = P C^T S^-1
 *     x = x + K y
 *     P = (I - K C) P (I - K C)^T + K R K^T
 */

#ifndef PROGNOSTICS_KALMAN_FILTER_HPP
#define PROGNOSTICS_KALMAN_FILTER_HPP

#include "state_estimator.hpp"

namespace prognostics {

class KalmanFilter : public StateEstimator {
public:
    /**
     * @param model Must be a LinearModel
     * @param x0 Initial belief; a ScalarData belief starts with P = Q / 10
     * @param config Filter parameters
     * @throws ConfigurationError if the model is not linear or a state is missing
     */
    KalmanFilter(std::shared_ptr<const PrognosticsModel> model,
                 const UncertainData& x0,
                 KalmanFilterConfig config = KalmanFilterConfig());

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
    const LinearModel* linear_;
    KalmanFilterConfig config_;
    Eigen::VectorXd x_;
    Eigen::MatrixXd P_;
    Eigen::VectorXd saved_x_;
    Eigen::MatrixXd saved_P_;
    double last_nis_ = 0.0;
};

}  // namespace prognostics

#endif  // PROGNOSTICS_KALMAN_FILTER_HPP
