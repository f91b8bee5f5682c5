/**
 * @file kalman_filter.cpp
 * @brief Linear Kalman filter implementation.
 */

#include "kalman_filter.hpp"
#include "logging.hpp"

namespace prognostics {

namespace {

const LinearModel* require_linear(const std::shared_ptr<const PrognosticsModel>& model) {
    const auto* linear = dynamic_cast<const LinearModel*>(model.get());
    if (linear == nullptr) {
        throw ConfigurationError(
            "KalmanFilter only supports linear models (derived from LinearModel)");
    }
    return linear;
}

}  // namespace

KalmanFilter::KalmanFilter(std::shared_ptr<const PrognosticsModel> model,
                           const UncertainData& x0,
                           KalmanFilterConfig config)
    : StateEstimator(model, x0, config),
      linear_(require_linear(model)),
      config_(std::move(config)) {
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
        PROGNOSTICS_LOG_WARN("KalmanFilter: deterministic initial state, using P = Q / 10. "
                             "Pass an uncertain belief to set the initial covariance.");
        P_ = config_.Q / 10.0;
    } else {
        P_ = initial_state_cov(*model_, x0);
    }
}

std::unique_ptr<UncertainData> KalmanFilter::x() const {
    return std::make_unique<MultivariateNormalDist>(model_->states(), x_, P_);
}

void KalmanFilter::propagate(const Eigen::VectorXd& u, const std::vector<double>& steps) {
    const int n = model_->n_states();
    const int m = model_->n_inputs();
    const Eigen::MatrixXd I = Eigen::MatrixXd::Identity(n, n);

    // Input extended by a trailing 1 so that E acts as a constant input
    Eigen::VectorXd u_ext(m + 1);
    u_ext.head(m) = u;
    u_ext(m) = 1.0;

    Eigen::MatrixXd B_ext(n, m + 1);
    B_ext.leftCols(m) = linear_->B();
    B_ext.col(m) = linear_->E();

    const double alpha_sq = config_.alpha * config_.alpha;
    for (double dt : steps) {
        Eigen::MatrixXd F = I + linear_->A() * dt;
        x_ = F * x_ + (B_ext * dt) * u_ext;
        P_ = alpha_sq * F * P_ * F.transpose() + config_.Q;
    }
}

void KalmanFilter::correct(const Eigen::VectorXd& z) {
    const Eigen::MatrixXd& H = linear_->C();
    const Eigen::MatrixXd& R = config_.R;

    // Innovation covariance: S = H * P * H^T + R
    Eigen::MatrixXd S = H * P_ * H.transpose() + R;
    Eigen::FullPivLU<Eigen::MatrixXd> lu(S);
    if (!lu.isInvertible()) {
        throw NumericalError("KalmanFilter: innovation covariance is singular");
    }
    Eigen::MatrixXd S_inv = lu.inverse();

    // Kalman gain: K = P * H^T * S^(-1)
    Eigen::MatrixXd K = P_ * H.transpose() * S_inv;

    // Innovation: y = z - D - H x
    Eigen::VectorXd innovation = z - linear_->D() - H * x_;
    x_ = x_ + K * innovation;

    // Joseph form: P = (I - K H) P (I - K H)^T + K R K^T
    Eigen::MatrixXd I_KH = Eigen::MatrixXd::Identity(P_.rows(), P_.cols()) - K * H;
    P_ = I_KH * P_ * I_KH.transpose() + K * R * K.transpose();

    last_nis_ = innovation.dot(S_inv * innovation);
}

void KalmanFilter::save_belief() {
    saved_x_ = x_;
    saved_P_ = P_;
}

void KalmanFilter::restore_belief() {
    x_ = saved_x_;
    P_ = saved_P_;
}

}  // namespace prognostics
