/**
 * @file state_estimator.hpp
 * @brief Base class for Bayesian state estimators.
 *
 * estimate(t, u, z) splits (t - clock) into sub-steps no larger than the
 * configured dt, propagates the belief through the model once per sub-step,
 * then corrects it with the measured output z.
 */

#ifndef PROGNOSTICS_STATE_ESTIMATOR_HPP
#define PROGNOSTICS_STATE_ESTIMATOR_HPP

#include "config.hpp"
#include "model.hpp"
#include "uncertain_data.hpp"

namespace prognostics {

class StateEstimator {
public:
    /**
     * @param model Model used for propagation and measurement
     * @param x0 Initial belief, must cover every model state
     * @param config Common estimator parameters
     * @throws ConfigurationError on a null model, invalid config or missing state key
     */
    StateEstimator(std::shared_ptr<const PrognosticsModel> model,
                   const UncertainData& x0,
                   const EstimatorConfig& config);
    virtual ~StateEstimator() = default;

    /**
     * @brief Update the belief with a new measurement.
     *
     * @param t Measurement time, strictly greater than the current clock [s]
     * @param u Measured input (model input order)
     * @param z Measured output (model output order)
     * @param dt Optional maximum sub-step overriding the configured one [s]
     * @throws OrderingError if t is not after the current clock
     * @throws NumericalError if the correction step is singular
     *
     * The belief and the clock are left unchanged when any step throws.
     */
    void estimate(double t, const Eigen::VectorXd& u, const Eigen::VectorXd& z,
                  std::optional<double> dt = std::nullopt);

    /// Same as estimate() with name -> value maps
    void estimate(double t, const NamedValues& u, const NamedValues& z,
                  std::optional<double> dt = std::nullopt);

    /// Current belief over the model states
    virtual std::unique_ptr<UncertainData> x() const = 0;

    /// Estimator clock [s]
    double t() const { return t_; }

    /// Model used by this estimator
    const PrognosticsModel& model() const { return *model_; }

protected:
    /// Propagate the belief over consecutive sub-steps
    virtual void propagate(const Eigen::VectorXd& u, const std::vector<double>& steps) = 0;

    /// Correct the belief with a measured output
    virtual void correct(const Eigen::VectorXd& z) = 0;

    /// Copy the current belief so that a failed estimate can be undone
    virtual void save_belief() = 0;

    /// Return to the belief copied by the last save_belief()
    virtual void restore_belief() = 0;

    /**
     * @brief Sub-step sizes covering (t - clock).
     *
     * Every step is at most dt_max and the last one lands exactly on t.
     */
    std::vector<double> sub_steps(double t, double dt_max) const;

    std::shared_ptr<const PrognosticsModel> model_;
    double t_;
    double dt_;
};

/**
 * @brief Mean of an initial belief in model state order.
 *
 * @throws ConfigurationError naming a state missing from the belief
 */
Eigen::VectorXd initial_state_mean(const PrognosticsModel& model, const UncertainData& x0);

/**
 * @brief Covariance of an initial belief in model state order.
 *
 * @throws ConfigurationError naming a state missing from the belief
 */
Eigen::MatrixXd initial_state_cov(const PrognosticsModel& model, const UncertainData& x0);

}  // namespace prognostics

#endif  // PROGNOSTICS_STATE_ESTIMATOR_HPP
