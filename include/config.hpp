/**
 * @file config.hpp
 * @brief Configuration for state estimators and predictors.
 *
 * Provides a clean interface for all tuning parameters. Noise matrices left
 * empty are filled with defaults sized to the model when the estimator or
 * predictor is constructed.
 */

#ifndef PROGNOSTICS_CONFIG_HPP
#define PROGNOSTICS_CONFIG_HPP

#include "types.hpp"
#include <cmath>

namespace prognostics {

namespace detail {

inline void check_square(const Eigen::MatrixXd& m, const char* name) {
    if (m.size() != 0 && m.rows() != m.cols()) {
        throw ConfigurationError(std::string(name) + " must be square");
    }
}

inline void check_positive(double value, const char* name) {
    if (!(value > 0)) {
        throw ConfigurationError(
            std::string(name) + " must be positive, was " + std::to_string(value));
    }
}

}  // namespace detail

// =============================================================================
// State estimators
// =============================================================================

/**
 * @brief Parameters common to every state estimator.
 */
struct EstimatorConfig {
    double t0 = -1e-10;   ///< Initial estimator time [s]
    double dt = std::numeric_limits<double>::infinity();  ///< Maximum prediction sub-step [s]

    void validate() const {
        if (!std::isfinite(t0)) {
            throw ConfigurationError("t0 must be finite");
        }
        detail::check_positive(dt, "dt");
    }
};

/**
 * @brief Kalman filter parameters.
 */
struct KalmanFilterConfig : EstimatorConfig {
    double alpha = 1.0;   ///< Fading memory factor (> 1 discounts old data)
    Eigen::MatrixXd Q;    ///< Process noise covariance (default 1e-3 I)
    Eigen::MatrixXd R;    ///< Measurement noise covariance (default 1e-3 I)

    KalmanFilterConfig() { dt = 1.0; }

    void validate() const {
        EstimatorConfig::validate();
        detail::check_positive(alpha, "alpha");
        detail::check_square(Q, "Q");
        detail::check_square(R, "R");
    }
};

/**
 * @brief Unscented Kalman filter parameters.
 *
 * The defaults (alpha=1, beta=0, kappa=-1) need at least two states.
 */
struct UnscentedKalmanFilterConfig : EstimatorConfig {
    double alpha = 1.0;   ///< Sigma point spread
    double beta = 0.0;    ///< Prior distribution knowledge
    double kappa = -1.0;  ///< Secondary scaling
    Eigen::MatrixXd Q;    ///< Process noise covariance (default 1e-3 I)
    Eigen::MatrixXd R;    ///< Measurement noise covariance (default 1e-3 I)

    void validate() const {
        EstimatorConfig::validate();
        detail::check_positive(alpha, "alpha");
        detail::check_square(Q, "Q");
        detail::check_square(R, "R");
    }
};

/**
 * @brief Particle filter parameters.
 */
struct ParticleFilterConfig : EstimatorConfig {
    std::optional<size_t> num_particles;   ///< Default 100, or the size of a Samples belief
    Eigen::VectorXd measurement_noise;     ///< Likelihood std per output (default 0)
    std::optional<unsigned int> seed;      ///< Generator seed (random if unset)

    void validate() const {
        EstimatorConfig::validate();
        if (num_particles.has_value() && *num_particles == 0) {
            throw ConfigurationError("num_particles must be positive");
        }
        for (Eigen::Index i = 0; i < measurement_noise.size(); ++i) {
            if (measurement_noise(i) < 0) {
                throw ConfigurationError("measurement_noise must be non-negative");
            }
        }
    }
};

// =============================================================================
// Predictors
// =============================================================================

/**
 * @brief Parameters common to both predictors.
 */
struct PredictorConfig {
    double t0 = 0.0;                  ///< Prediction start time [s]
    double dt = 1.0;                  ///< Integration step [s]
    double horizon = std::numeric_limits<double>::infinity();   ///< Duration from t0 [s]
    double save_freq = std::numeric_limits<double>::infinity(); ///< Save period from t0 [s]
    std::vector<double> save_pts;     ///< Additional save times [s]
    std::optional<KeyList> events;    ///< Requested events (all model events if unset)
    EventStrategy event_strategy = EventStrategy::ALL;  ///< Handling of remaining events

    void validate() const {
        if (!std::isfinite(t0)) {
            throw ConfigurationError("t0 must be finite");
        }
        detail::check_positive(dt, "dt");
        detail::check_positive(horizon, "horizon");
        detail::check_positive(save_freq, "save_freq");
        if (events.has_value() && events->empty() && !std::isfinite(horizon)) {
            throw ConfigurationError(
                "an empty event list requires a finite horizon");
        }
    }
};

/**
 * @brief Monte Carlo predictor parameters.
 */
struct MonteCarloConfig : PredictorConfig {
    std::optional<size_t> n_samples;    ///< Default 100, or the size of a Samples state
    bool constant_noise = false;        ///< Draw process noise once per realization
    std::optional<unsigned int> seed;   ///< Generator seed (random if unset)

    void validate() const {
        PredictorConfig::validate();
        if (n_samples.has_value() && *n_samples == 0) {
            throw ConfigurationError("n_samples must be positive");
        }
    }
};

/**
 * @brief Unscented transform predictor parameters.
 */
struct UTPredictorConfig : PredictorConfig {
    double alpha = 1.0;   ///< Sigma point spread
    double beta = 0.0;    ///< Prior distribution knowledge
    double kappa = -1.0;  ///< Secondary scaling
    Eigen::MatrixXd Q;    ///< Process noise covariance (default 1e-8 I)

    UTPredictorConfig() {
        dt = 0.5;
        horizon = 1e99;
        save_freq = 1e99;
    }

    void validate() const {
        PredictorConfig::validate();
        detail::check_positive(alpha, "alpha");
        detail::check_square(Q, "Q");
        if (event_strategy != EventStrategy::ALL) {
            throw ConfigurationError(
                "UnscentedTransformPredictor only supports event_strategy 'all', got '" +
                to_string(event_strategy) + "'");
        }
    }
};

}  // namespace prognostics

#endif  // PROGNOSTICS_CONFIG_HPP
