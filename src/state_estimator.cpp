/**
 * @file state_estimator.cpp
 * @brief Implementation of the common estimation step.
 */

#include "state_estimator.hpp"
#include <sstream>
#include <stdexcept>

namespace prognostics {

namespace {

void check_states_present(const PrognosticsModel& model, const UncertainData& x0) {
    require_keys(x0.keys(), model.states(), "initial state");
}

}  // namespace

StateEstimator::StateEstimator(std::shared_ptr<const PrognosticsModel> model,
                               const UncertainData& x0,
                               const EstimatorConfig& config)
    : model_(std::move(model)), t_(config.t0), dt_(config.dt) {
    if (!model_) {
        throw ConfigurationError("state estimator requires a model");
    }
    config.validate();
    check_states_present(*model_, x0);
}

void StateEstimator::estimate(double t, const Eigen::VectorXd& u, const Eigen::VectorXd& z,
                              std::optional<double> dt) {
    if (!(t > t_)) {
        std::ostringstream msg;
        msg << "estimation time must increase: t=" << t << " is not after " << t_;
        throw OrderingError(msg.str());
    }
    if (u.size() != model_->n_inputs()) {
        throw std::invalid_argument(
            "input has " + std::to_string(u.size()) + " values, model has " +
            std::to_string(model_->n_inputs()) + " inputs");
    }
    if (z.size() != model_->n_outputs()) {
        throw std::invalid_argument(
            "output has " + std::to_string(z.size()) + " values, model has " +
            std::to_string(model_->n_outputs()) + " outputs");
    }
    double dt_max = dt.value_or(dt_);
    if (!(dt_max > 0)) {
        throw ConfigurationError("dt must be positive, was " + std::to_string(dt_max));
    }

    save_belief();
    try {
        propagate(u, sub_steps(t, dt_max));
        correct(z);
    } catch (const std::exception&) {
        restore_belief();
        throw;
    }
    t_ = t;
}

void StateEstimator::estimate(double t, const NamedValues& u, const NamedValues& z,
                              std::optional<double> dt) {
    estimate(t, from_named(model_->inputs(), u), from_named(model_->outputs(), z), dt);
}

std::vector<double> StateEstimator::sub_steps(double t, double dt_max) const {
    const double span = t - t_;
    std::vector<double> steps;
    double remaining = span;
    while (remaining > kTimeTolerance) {
        double step = std::min(dt_max, remaining);
        steps.push_back(step);
        remaining -= step;
    }
    if (steps.empty()) {
        steps.push_back(span);
    } else {
        // Fold rounding residue into the last step so it ends on t
        steps.back() += remaining;
    }
    return steps;
}

Eigen::VectorXd initial_state_mean(const PrognosticsModel& model, const UncertainData& x0) {
    check_states_present(model, x0);
    return mean_in_order(x0, model.states());
}

Eigen::MatrixXd initial_state_cov(const PrognosticsModel& model, const UncertainData& x0) {
    check_states_present(model, x0);
    return cov_in_order(x0, model.states());
}

}  // namespace prognostics
