/**
 * @file example_prognostics.cpp
 * @brief Example of a full prognostics loop on an object thrown upwards.
 *
 * This example shows how to:
 * 1. Define a model
 * 2. Track its state from noisy measurements with an unscented Kalman filter
 * 3. Predict the time of impact with Monte Carlo and the unscented transform
 * 4. Score the predictions with the profile metrics
 */

#include <iostream>
#include <iomanip>
#include <cmath>
#include <algorithm>

#include "unscented_kalman_filter.hpp"
#include "monte_carlo.hpp"
#include "unscented_transform_predictor.hpp"
#include "metrics.hpp"
#include "logging.hpp"

using namespace prognostics;

namespace {

/// Object thrown up at 40 m/s from 1.83 m: states (x, v), output x
class ThrownObject : public LinearModel {
public:
    ThrownObject()
        : LinearModel({"x", "v"}, {}, {"x"}, {"falling", "impact"},
                      (Eigen::MatrixXd(2, 2) << 0, 1, 0, 0).finished(),
                      Eigen::MatrixXd(),
                      (Eigen::MatrixXd(1, 2) << 1, 0).finished(),
                      Eigen::VectorXd(),
                      Eigen::Vector2d(0.0, -9.81)) {}

    Eigen::VectorXd initialize(const Eigen::VectorXd* = nullptr,
                               const Eigen::VectorXd* = nullptr) const override {
        return Eigen::Vector2d(1.83, 40.0);
    }

    std::vector<bool> threshold_met(const Eigen::VectorXd& x) const override {
        return {x(1) < 0, x(0) <= 0};
    }

    Eigen::VectorXd event_state(const Eigen::VectorXd& x) const override {
        const double x_max = x(0) + x(1) * x(1) / (9.81 * 2.0);
        return Eigen::Vector2d(std::max(x(1) / 40.0, 0.0),
                               x(1) < 0 ? std::max(x(0) / x_max, 0.0) : 1.0);
    }
};

void print_toe(const std::string& name, const UncertainData& toe) {
    const Eigen::VectorXd mean = toe.mean();
    const Eigen::MatrixXd cov = toe.cov();
    std::cout << "  " << name << ":" << std::endl;
    for (size_t i = 0; i < toe.keys().size(); ++i) {
        const Eigen::Index ii = static_cast<Eigen::Index>(i);
        std::cout << "    " << std::setw(8) << toe.keys()[i] << "  mean "
                  << std::setw(7) << mean(ii) << " s   std "
                  << std::sqrt(std::max(cov(ii, ii), 0.0)) << " s" << std::endl;
    }
}

}  // namespace

int main() {
    set_log_level(LogLevel::WARN);
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "=== Prognostics Example: Thrown Object ===" << std::endl;
    std::cout << std::endl;

    // Step 1: Model with process and measurement noise
    auto model = std::make_shared<ThrownObject>();
    model->set_process_noise(0.05);
    model->set_measurement_noise(0.2);

    // Step 2: Estimator started from a rough guess
    UnscentedKalmanFilterConfig ukf_config;
    ukf_config.dt = 0.1;
    ukf_config.R = Eigen::MatrixXd::Identity(1, 1) * 0.04;
    ScalarData guess({"x", "v"}, Eigen::Vector2d(1.75, 35.0));
    UnscentedKalmanFilter filter(model, guess, ukf_config);

    std::mt19937 rng(42);
    const Eigen::VectorXd no_input(0);
    const double truth_impact = 8.1974;  // noise-free impact time
    Eigen::VectorXd x = model->initialize();

    // Step 3: Track the throw and predict the impact every second
    MonteCarloConfig mc_config;
    mc_config.dt = 0.01;
    mc_config.n_samples = 200;
    mc_config.seed = 7;
    mc_config.events = KeyList{"impact"};
    MonteCarlo mc(model, mc_config);

    UTPredictorConfig ut_config;
    ut_config.dt = 0.01;
    ut_config.events = KeyList{"impact"};
    UnscentedTransformPredictor ut(model, ut_config);

    LoadFunction load = [](double, const Eigen::VectorXd*) { return Eigen::VectorXd(0); };

    ToEPredictionProfile profile;
    const double dt = 0.1;
    for (int step = 1; step <= 60; ++step) {
        const double t = step * dt;
        x = model->apply_process_noise(model->next_state(x, no_input, dt), dt, rng);
        const Eigen::VectorXd z = model->apply_measurement_noise(model->output(x), rng);
        filter.estimate(t, no_input, z);

        if (step % 10 != 0) {
            continue;
        }
        std::unique_ptr<UncertainData> belief = filter.x();
        MonteCarloConfig now = mc_config;
        now.t0 = t;
        PredictionResult result = mc.predict(*belief, load, now);
        profile.add_prediction(t, std::move(result.time_of_event));

        std::cout << "t = " << t << " s   estimate x = " << filter.mean()(0)
                  << " m, v = " << filter.mean()(1) << " m/s" << std::endl;
    }
    std::cout << std::endl;

    // Step 4: Compare both predictors at the last estimate
    std::unique_ptr<UncertainData> belief = filter.x();
    UTPredictorConfig ut_now = ut_config;
    ut_now.t0 = filter.t();
    PredictionResult ut_result = ut.predict(*belief, load, ut_now);
    MonteCarloConfig mc_now = mc_config;
    mc_now.t0 = filter.t();
    PredictionResult mc_result = mc.predict(*belief, load, mc_now);

    std::cout << "Predicted time of impact from t = " << filter.t() << " s:" << std::endl;
    print_toe("Monte Carlo", *mc_result.time_of_event);
    print_toe("Unscented transform", *ut_result.time_of_event);
    std::cout << "  Noise-free impact: " << truth_impact << " s" << std::endl;
    std::cout << std::endl;

    // Step 5: Profile metrics against the noise-free impact time
    const NamedValues gt{{"impact", truth_impact}};
    std::cout << "Profile metrics (" << profile.size() << " predictions):" << std::endl;
    const NamedValues cra = profile.cumulative_relative_accuracy(gt);
    std::cout << "  Cumulative relative accuracy: " << cra.at("impact") << std::endl;
    const NamedValues mono = profile.monotonicity();
    std::cout << "  Monotonicity: " << mono.at("impact") << std::endl;
    const std::map<std::string, bool> al = profile.alpha_lambda(gt, 3.0, 0.2, 0.5);
    if (!al.empty()) {
        std::cout << "  Alpha-lambda (lambda 3 s, alpha 0.2, beta 0.5): "
                  << (al.at("impact") ? "pass" : "fail") << std::endl;
    }

    const NamedValues p = prob_success(*mc_result.time_of_event, 8.0);
    std::cout << "  Probability of no impact before 8 s: " << p.at("impact") << std::endl;

    return 0;
}
