/**
 * @file unscented_transform_predictor.cpp
 * @brief Unscented transform predictor implementation.
 */

#include "unscented_transform_predictor.hpp"
#include "logging.hpp"
#include <algorithm>

namespace prognostics {

UnscentedTransformPredictor::UnscentedTransformPredictor(
    std::shared_ptr<const PrognosticsModel> model, UTPredictorConfig config)
    : Predictor(std::move(model)), config_(std::move(config)) {
    config_.validate();
    // Rejects parameters that cannot produce sigma points for this model
    const MerweScaledSigmaPoints points(model_->n_states(), config_.alpha, config_.beta,
                                        config_.kappa);
    static_cast<void>(points);
}

PredictionResult UnscentedTransformPredictor::predict(const UncertainData& state,
                                                      const LoadFunction& load) {
    return predict(state, load, config_);
}

PredictionResult UnscentedTransformPredictor::predict(const UncertainData& state,
                                                      const LoadFunction& load,
                                                      const UTPredictorConfig& config) {
    config.validate();
    if (dynamic_cast<const ScalarData*>(&state) != nullptr) {
        throw ConfigurationError(
            "UnscentedTransformPredictor requires an uncertain state, got ScalarData");
    }
    check_state(state);
    auto events = resolve_events(config);
    const KeyList& names = events.first;
    const std::vector<int>& event_ids = events.second;

    const int n = model_->n_states();
    const MerweScaledSigmaPoints points(n, config.alpha, config.beta, config.kappa);
    const Eigen::MatrixXd Q = config.Q.size() == 0
                                  ? Eigen::MatrixXd(1e-8 * Eigen::MatrixXd::Identity(n, n))
                                  : config.Q;
    if (Q.rows() != n) {
        throw ConfigurationError("Q must be " + std::to_string(n) + "x" + std::to_string(n));
    }

    Eigen::VectorXd x = mean_in_order(state, model_->states());
    Eigen::MatrixXd P = cov_in_order(state, model_->states());

    const Eigen::Index n_points = points.num_points();
    const Eigen::Index n_events = static_cast<Eigen::Index>(names.size());
    Eigen::MatrixXd toe = Eigen::MatrixXd::Constant(n_events, n_points, absent_value());
    // Frozen state per (event, point); column index e * n_points + i
    Eigen::MatrixXd frozen(n, n_events * n_points);

    std::vector<double> save_pts = config.save_pts;
    std::sort(save_pts.begin(), save_pts.end());
    size_t next_pt = 0;
    while (next_pt < save_pts.size() && save_pts[next_pt] <= config.t0 + kTimeTolerance) {
        ++next_pt;
    }

    std::vector<double> times;
    std::vector<std::shared_ptr<const UncertainData>> inputs;
    std::vector<std::shared_ptr<const UncertainData>> states;

    double t = config.t0;
    Eigen::VectorXd u = load(t, &x);
    auto save = [&]() {
        times.push_back(t);
        inputs.push_back(std::make_shared<ScalarData>(model_->inputs(), u));
        states.push_back(std::make_shared<MultivariateNormalDist>(model_->states(), x, P));
    };
    save();

    const double t_end = config.t0 + config.horizon;
    double save_index = 1.0;
    size_t steps = 0;
    while (t < t_end - kTimeTolerance) {
        const double step = std::min(config.dt, t_end - t);
        t += step;
        u = load(t, &x);

        // Unscented prediction through the noise-free model
        Eigen::MatrixXd sigmas = points.generate(x, P);
        for (Eigen::Index i = 0; i < n_points; ++i) {
            sigmas.col(i) = model_->apply_limits(model_->next_state(sigmas.col(i), u, step));
        }
        UnscentedMoments moments =
            unscented_transform(sigmas, points.mean_weights(), points.cov_weights(), &Q);
        x = moments.mean;
        P = moments.covariance;
        ++steps;

        bool do_save = false;
        while (t >= config.t0 + save_index * config.save_freq - kTimeTolerance) {
            do_save = true;
            save_index += 1.0;
        }
        while (next_pt < save_pts.size() && t >= save_pts[next_pt] - kTimeTolerance) {
            do_save = true;
            ++next_pt;
        }
        if (do_save) {
            save();
        }

        if (n_events == 0) {
            continue;
        }

        // Record the first time each point meets each event
        Eigen::MatrixXd check = points.generate(x, P);
        bool all_met = true;
        for (Eigen::Index i = 0; i < n_points; ++i) {
            const std::vector<bool> met = model_->threshold_met(check.col(i));
            for (Eigen::Index e = 0; e < n_events; ++e) {
                if (!met[static_cast<size_t>(event_ids[static_cast<size_t>(e)])]) {
                    all_met = false;
                } else if (is_absent(toe(e, i))) {
                    toe(e, i) = t;
                    frozen.col(e * n_points + i) = check.col(i);
                }
            }
        }
        if (all_met) {
            break;
        }
    }

    if (times.back() != t) {
        save();
    }

    PredictionResult result;
    result.times = times;
    result.inputs = std::make_shared<Prediction>(times, std::move(inputs));
    result.states = std::make_shared<Prediction>(times, std::move(states));

    std::shared_ptr<const PrognosticsModel> model = model_;
    result.outputs = std::make_shared<LazyUTPrediction>(
        *result.states,
        [model](const Eigen::VectorXd& s) { return model->output(s); },
        model_->outputs(), points);
    result.event_states = std::make_shared<LazyUTPrediction>(
        *result.states,
        [model](const Eigen::VectorXd& s) { return model->event_state(s); },
        model_->events(), points);

    // Unresolved points leave NaN in the moments of that event
    UnscentedMoments toe_moments =
        unscented_transform(toe, points.mean_weights(), points.cov_weights());
    result.time_of_event = std::make_unique<MultivariateNormalDist>(
        names, toe_moments.mean, toe_moments.covariance);

    for (Eigen::Index e = 0; e < n_events; ++e) {
        const std::string& name = names[static_cast<size_t>(e)];
        if (toe.row(e).hasNaN()) {
            result.final_state[name] = nullptr;
            continue;
        }
        UnscentedMoments fs = unscented_transform(frozen.middleCols(e * n_points, n_points),
                                                  points.mean_weights(), points.cov_weights());
        result.final_state[name] =
            std::make_shared<MultivariateNormalDist>(model_->states(), fs.mean, fs.covariance);
    }

    PROGNOSTICS_LOG_DEBUG("UnscentedTransformPredictor: " << steps << " steps to t=" << t
                          << ", " << times.size() << " saved points");
    return result;
}

}  // namespace prognostics
