/**
 * @file unscented_kalman_filter.cpp
 * @brief Unscented Kalman filter implementation.
 */

#include "unscented_kalman_filter.hpp"
#include "logging.hpp"

namespace prognostics {

UnscentedKalmanFilter::UnscentedKalmanFilter(std::shared_ptr<const PrognosticsModel> model,
                                             const UncertainData& x0,
                                             UnscentedKalmanFilterConfig config)
    : StateEstimator(model, x0, config),
      config_(std::move(config)),
      points_(model_->n_states(), config_.alpha, config_.beta, config_.kappa) {
    config_.validate();
    const int n = model_->n_states();
    const int p = model_->n_outputs();

    if (config_.Q.size() == 0) {
        config_.Q = 1e-3 * Eigen::MatrixXd::Identity(n, n);
    }
    if (config_.R.size() == 0) {
        config_.R = 1e-3 * Eigen::MatrixXd::Identity(p, p);
    }
    if (config_.Q.rows() != n) {
        throw ConfigurationError("Q must be " + std::to_string(n) + "x" + std::to_string(n));
    }
    if (config_.R.rows() != p) {
        throw ConfigurationError("R must be " + std::to_string(p) + "x" + std::to_string(p));
    }

    x_ = initial_state_mean(*model_, x0);
    if (dynamic_cast<const ScalarData*>(&x0) != nullptr) {
        PROGNOSTICS_LOG_WARN("UnscentedKalmanFilter: deterministic initial state, using P = Q / 10. "
                             "Pass an uncertain belief to set the initial covariance.");
        P_ = config_.Q / 10.0;
    } else {
        P_ = initial_state_cov(*model_, x0);
    }
}

std::unique_ptr<UncertainData> UnscentedKalmanFilter::x() const {
    return std::make_unique<MultivariateNormalDist>(model_->states(), x_, P_);
}

void UnscentedKalmanFilter::propagate(const Eigen::VectorXd& u,
                                      const std::vector<double>& steps) {
    for (double dt : steps) {
        Eigen::MatrixXd sigmas = points_.generate(x_, P_);
        sigmas_f_.resize(sigmas.rows(), sigmas.cols());
        for (Eigen::Index i = 0; i < sigmas.cols(); ++i) {
            sigmas_f_.col(i) = model_->next_state(sigmas.col(i), u, dt);
        }
        UnscentedMoments moments = unscented_transform(
            sigmas_f_, points_.mean_weights(), points_.cov_weights(), &config_.Q);
        x_ = moments.mean;
        P_ = moments.covariance;
    }
}

void UnscentedKalmanFilter::correct(const Eigen::VectorXd& z) {
    // Measurement sigma points from the propagated state points
    Eigen::MatrixXd sigmas_h(model_->n_outputs(), sigmas_f_.cols());
    for (Eigen::Index i = 0; i < sigmas_f_.cols(); ++i) {
        sigmas_h.col(i) = model_->output(sigmas_f_.col(i));
    }
    UnscentedMoments predicted = unscented_transform(
        sigmas_h, points_.mean_weights(), points_.cov_weights(), &config_.R);

    const Eigen::MatrixXd& S = predicted.covariance;
    Eigen::FullPivLU<Eigen::MatrixXd> lu(S);
    if (!lu.isInvertible()) {
        throw NumericalError("UnscentedKalmanFilter: innovation covariance is singular");
    }
    Eigen::MatrixXd S_inv = lu.inverse();

    Eigen::MatrixXd Pxz = unscented_cross_covariance(
        sigmas_f_, x_, sigmas_h, predicted.mean, points_.cov_weights());
    Eigen::MatrixXd K = Pxz * S_inv;

    Eigen::VectorXd innovation = z - predicted.mean;
    x_ = x_ + K * innovation;
    P_ = P_ - K * S * K.transpose();

    last_nis_ = innovation.dot(S_inv * innovation);
}

void UnscentedKalmanFilter::save_belief() {
    saved_x_ = x_;
    saved_P_ = P_;
}

void UnscentedKalmanFilter::restore_belief() {
    x_ = saved_x_;
    P_ = saved_P_;
}

}  // namespace prognostics
