/**
 * @file test_core.cpp
 * @brief Unit tests for the prognostics data model and building blocks.
 *
 * Covers key handling, UncertainData variants, text round-trip, loading
 * functions, sigma points and model simulation.
 * Uses a simple test framework for portability.
 */

#include <iostream>
#include <cmath>
#include <cassert>
#include <stdexcept>

#include "types.hpp"
#include "config.hpp"
#include "logging.hpp"
#include "uncertain_data.hpp"
#include "loading.hpp"
#include "sigma_points.hpp"
#include "model.hpp"
#include "test_models.hpp"

using namespace prognostics;

// Simple test macros
#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "..." << std::flush; \
    try { \
        test_##name(); \
        std::cout << " PASSED" << std::endl; \
        passed++; \
    } catch (const std::exception& e) { \
        std::cout << " FAILED: " << e.what() << std::endl; \
        failed++; \
    } \
} while(0)

#define ASSERT_TRUE(cond) do { \
    if (!(cond)) throw std::runtime_error("Assertion failed: " #cond); \
} while(0)

#define ASSERT_FALSE(cond) ASSERT_TRUE(!(cond))

#define ASSERT_NEAR(a, b, tol) do { \
    if (std::abs((a) - (b)) > (tol)) { \
        throw std::runtime_error("Assertion failed: abs(" #a " - " #b ") <= " #tol); \
    } \
} while(0)

#define ASSERT_EQ(a, b) ASSERT_TRUE((a) == (b))

#define ASSERT_THROWS(expr, type) do { \
    bool threw = false; \
    try { expr; } catch (const type&) { threw = true; } \
    if (!threw) throw std::runtime_error("Expected " #type " from " #expr); \
} while(0)

// =============================================================================
// Test Types
// =============================================================================

TEST(named_values_conversion) {
    KeyList keys = {"a", "b"};
    Eigen::Vector2d v(1.0, 2.0);
    NamedValues named = to_named(keys, v);
    ASSERT_NEAR(named.at("a"), 1.0, 1e-12);
    ASSERT_NEAR(named.at("b"), 2.0, 1e-12);

    Eigen::VectorXd back = from_named({"b", "a"}, named);
    ASSERT_NEAR(back(0), 2.0, 1e-12);
    ASSERT_NEAR(back(1), 1.0, 1e-12);

    ASSERT_THROWS(from_named({"c"}, named), KeyError);
    ASSERT_THROWS(index_of(keys, "c"), KeyError);
}

TEST(key_mapping_reorders) {
    std::vector<int> mapping = key_mapping({"v", "x"}, {"x", "v"});
    ASSERT_EQ(mapping.size(), 2u);
    ASSERT_EQ(mapping[0], 1);
    ASSERT_EQ(mapping[1], 0);
}

TEST(event_strategy_parsing) {
    ASSERT_TRUE(parse_event_strategy("all") == EventStrategy::ALL);
    ASSERT_TRUE(parse_event_strategy("first") == EventStrategy::FIRST);
    ASSERT_EQ(to_string(EventStrategy::FIRST), std::string("first"));
    ASSERT_THROWS(parse_event_strategy("any"), ConfigurationError);
}

TEST(absent_value) {
    ASSERT_TRUE(is_absent(absent_value()));
    ASSERT_FALSE(is_absent(0.0));
}

// =============================================================================
// Test Config
// =============================================================================

TEST(config_validation) {
    MonteCarloConfig config;
    config.validate();  // Should not throw

    config.dt = 0.0;
    ASSERT_THROWS(config.validate(), ConfigurationError);

    config.dt = 0.1;
    config.events = KeyList();
    ASSERT_THROWS(config.validate(), ConfigurationError);  // no events and no horizon

    config.horizon = 10.0;
    config.validate();

    UTPredictorConfig ut;
    ut.validate();
    ut.event_strategy = EventStrategy::FIRST;
    ASSERT_THROWS(ut.validate(), ConfigurationError);

    KalmanFilterConfig kf;
    kf.Q = Eigen::MatrixXd::Zero(2, 3);
    ASSERT_THROWS(kf.validate(), ConfigurationError);
}

TEST(log_level_roundtrip) {
    LogLevel previous = get_log_level();
    set_log_level(LogLevel::ERROR);
    ASSERT_TRUE(get_log_level() == LogLevel::ERROR);
    ASSERT_FALSE(log_enabled(LogLevel::WARN));
    ASSERT_TRUE(log_enabled(LogLevel::ERROR));
    set_log_level(previous);
}

// =============================================================================
// Test UncertainData
// =============================================================================

TEST(scalar_data_statistics) {
    ScalarData data({"a", "b"}, Eigen::Vector2d(1.0, 2.0));
    ASSERT_NEAR(data.mean()(0), 1.0, 1e-12);
    ASSERT_NEAR(data.median()(1), 2.0, 1e-12);
    ASSERT_NEAR(data.cov().norm(), 0.0, 1e-12);

    std::mt19937 rng(1);
    Samples drawn = data.sample(5, &rng);
    ASSERT_EQ(drawn.size(), 5u);
    for (size_t i = 0; i < drawn.size(); ++i) {
        ASSERT_NEAR(drawn[i](0), 1.0, 1e-12);
        ASSERT_NEAR(drawn[i](1), 2.0, 1e-12);
    }
    ASSERT_THROWS(data.sample(0), std::invalid_argument);
}

TEST(scalar_data_bounds) {
    ScalarData data(NamedValues{{"a", 1.0}, {"b", 5.0}});
    NamedValues pib = data.percentage_in_bounds(Bounds(0.0, 2.0));
    ASSERT_NEAR(pib.at("a"), 1.0, 1e-12);
    ASSERT_NEAR(pib.at("b"), 0.0, 1e-12);

    ASSERT_THROWS(data.percentage_in_bounds(BoundsMap{{"a", Bounds(0, 1)}}), KeyError);
}

TEST(samples_mean_and_cov) {
    Samples s({"a", "b"});
    s.push_back(Eigen::Vector2d(1.0, 2.0));
    s.push_back(Eigen::Vector2d(3.0, 6.0));
    s.push_back(Eigen::Vector2d(5.0, 10.0));

    Eigen::VectorXd m = s.mean();
    ASSERT_NEAR(m(0), 3.0, 1e-12);
    ASSERT_NEAR(m(1), 6.0, 1e-12);

    // Unbiased covariance
    Eigen::MatrixXd c = s.cov();
    ASSERT_NEAR(c(0, 0), 4.0, 1e-12);
    ASSERT_NEAR(c(0, 1), 8.0, 1e-12);
    ASSERT_NEAR(c(1, 1), 16.0, 1e-12);

    // Geometric median is the middle point here
    Eigen::VectorXd med = s.median();
    ASSERT_NEAR(med(0), 3.0, 1e-12);

    ASSERT_THROWS(s.push_back(Eigen::VectorXd::Zero(3)), std::invalid_argument);
}

TEST(samples_absent_values) {
    LogLevel previous = get_log_level();
    set_log_level(LogLevel::NONE);

    Samples s({"a", "b"});
    s.push_back(Eigen::Vector2d(1.0, 4.0));
    s.push_back(Eigen::Vector2d(3.0, absent_value()));
    s.push_absent();

    ASSERT_FALSE(s.is_complete(1));
    Eigen::VectorXd m = s.mean();
    ASSERT_NEAR(m(0), 2.0, 1e-12);
    ASSERT_NEAR(m(1), 4.0, 1e-12);

    std::vector<std::optional<double>> a = s.key("a");
    ASSERT_EQ(a.size(), 3u);
    ASSERT_TRUE(a[0].has_value());
    ASSERT_FALSE(a[2].has_value());

    // Absent counts as outside the bounds
    NamedValues pib = s.percentage_in_bounds(Bounds(0.0, 10.0));
    ASSERT_NEAR(pib.at("b"), 1.0 / 3.0, 1e-12);

    set_log_level(previous);
}

TEST(samples_empty) {
    Samples s({"a"});
    ASSERT_TRUE(s.empty());
    ASSERT_THROWS(s.mean(), EmptyDistributionError);
    ASSERT_THROWS(s.sample(3), EmptyDistributionError);
}

TEST(samples_resample_from_pool) {
    Samples s({"a"});
    for (int i = 0; i < 4; ++i) {
        s.push_back(Eigen::VectorXd::Constant(1, static_cast<double>(i)));
    }
    std::mt19937 rng(7);
    Samples drawn = s.sample(50, &rng);
    ASSERT_EQ(drawn.size(), 50u);
    for (size_t i = 0; i < drawn.size(); ++i) {
        double v = drawn[i](0);
        ASSERT_TRUE(v == 0.0 || v == 1.0 || v == 2.0 || v == 3.0);
    }
}

TEST(seeded_sampling_is_deterministic) {
    Eigen::Matrix2d cov;
    cov << 1.0, 0.2, 0.2, 2.0;
    MultivariateNormalDist dist({"a", "b"}, Eigen::Vector2d(1.0, -1.0), cov);

    std::mt19937 rng1(42), rng2(42), rng3(43);
    Samples s1 = dist.sample(10, &rng1);
    Samples s2 = dist.sample(10, &rng2);
    Samples s3 = dist.sample(10, &rng3);
    ASSERT_NEAR((s1.to_matrix() - s2.to_matrix()).norm(), 0.0, 1e-15);
    ASSERT_TRUE((s1.to_matrix() - s3.to_matrix()).norm() > 1e-6);
}

TEST(multivariate_normal_sampling) {
    Eigen::Matrix2d cov;
    cov << 0.1, 0.01, 0.01, 0.1;
    MultivariateNormalDist dist({"x", "v"}, Eigen::Vector2d(1.83, 40.0), cov);

    std::mt19937 rng(3);
    Samples s = dist.sample(20000, &rng);
    Eigen::VectorXd m = s.mean();
    Eigen::MatrixXd c = s.cov();
    ASSERT_NEAR(m(0), 1.83, 0.02);
    ASSERT_NEAR(m(1), 40.0, 0.02);
    ASSERT_NEAR(c(0, 0), 0.1, 0.01);
    ASSERT_NEAR(c(0, 1), 0.01, 0.01);

    ASSERT_THROWS(MultivariateNormalDist({"x"}, Eigen::Vector2d(0, 0), cov),
                  std::invalid_argument);
}

TEST(multivariate_normal_nan_keys_are_absent) {
    Eigen::Matrix2d cov;
    cov << 1.0, absent_value(), absent_value(), absent_value();
    MultivariateNormalDist dist({"a", "b"}, Eigen::Vector2d(5.0, absent_value()), cov);

    std::mt19937 rng(11);
    Samples s = dist.sample(10, &rng);
    for (size_t i = 0; i < s.size(); ++i) {
        ASSERT_FALSE(is_absent(s[i](0)));
        ASSERT_TRUE(is_absent(s[i](1)));
    }
}

TEST(relative_accuracy) {
    ScalarData data(NamedValues{{"a", 9.0}});
    NamedValues ra = data.relative_accuracy({{"a", 10.0}});
    ASSERT_NEAR(ra.at("a"), 0.9, 1e-12);
    ASSERT_THROWS(data.relative_accuracy({{"b", 10.0}}), KeyError);
    ASSERT_THROWS(data.relative_accuracy({{"a", 0.0}}), NumericalError);
}

TEST(shifted_offsets_every_value) {
    Samples s({"a"});
    s.push_back(Eigen::VectorXd::Constant(1, 2.0));
    s.push_back(Eigen::VectorXd::Constant(1, 4.0));
    std::unique_ptr<UncertainData> shifted = s.shifted(-1.0);
    ASSERT_NEAR(shifted->mean()(0), 2.0, 1e-12);
    ASSERT_EQ(shifted->type_name(), s.type_name());
}

TEST(ordered_mean_and_cov) {
    Eigen::Matrix2d cov;
    cov << 1.0, 0.5, 0.5, 2.0;
    MultivariateNormalDist dist({"v", "x"}, Eigen::Vector2d(10.0, 2.0), cov);
    Eigen::VectorXd m = mean_in_order(dist, {"x", "v"});
    Eigen::MatrixXd c = cov_in_order(dist, {"x", "v"});
    ASSERT_NEAR(m(0), 2.0, 1e-12);
    ASSERT_NEAR(c(0, 0), 2.0, 1e-12);
    ASSERT_NEAR(c(1, 1), 1.0, 1e-12);
    ASSERT_NEAR(c(0, 1), 0.5, 1e-12);
    ASSERT_THROWS(mean_in_order(dist, {"y"}), KeyError);
}

// =============================================================================
// Test Text Round-Trip
// =============================================================================

TEST(serialize_scalar) {
    ScalarData data({"a", "b"}, Eigen::Vector2d(0.1, -3.7e12));
    std::unique_ptr<UncertainData> back = deserialize(serialize(data));
    ASSERT_EQ(back->type_name(), data.type_name());
    ASSERT_TRUE(back->keys() == data.keys());
    ASSERT_TRUE(back->mean() == data.mean());
}

TEST(serialize_samples_with_absent) {
    Samples data({"a"});
    data.push_back(Eigen::VectorXd::Constant(1, 1.0 / 3.0));
    data.push_absent();
    std::unique_ptr<UncertainData> back = deserialize(serialize(data));
    const auto* samples = dynamic_cast<const Samples*>(back.get());
    ASSERT_TRUE(samples != nullptr);
    ASSERT_EQ(samples->size(), 2u);
    ASSERT_TRUE((*samples)[0](0) == 1.0 / 3.0);
    ASSERT_TRUE(is_absent((*samples)[1](0)));
}

TEST(serialize_multivariate_normal) {
    Eigen::Matrix2d cov;
    cov << 0.1, 0.01, 0.01, 0.3;
    MultivariateNormalDist data({"x", "v"}, Eigen::Vector2d(1.83, 40.0), cov);
    std::unique_ptr<UncertainData> back = deserialize(serialize(data));
    ASSERT_EQ(back->type_name(), data.type_name());
    ASSERT_TRUE(back->mean() == data.mean());
    ASSERT_TRUE(back->cov() == data.cov());
}

TEST(deserialize_rejects_garbage) {
    ASSERT_THROWS(deserialize(""), std::invalid_argument);
    ASSERT_THROWS(deserialize("NotAType\nkeys a\n"), std::invalid_argument);
}

// =============================================================================
// Test Loading
// =============================================================================

TEST(piecewise_load) {
    PiecewiseLoad load({10.0, 20.0},
                       {Eigen::VectorXd::Constant(1, 1.0), Eigen::VectorXd::Constant(1, 2.0),
                        Eigen::VectorXd::Constant(1, 3.0)});
    ASSERT_NEAR(load(5.0)(0), 1.0, 1e-12);
    ASSERT_NEAR(load(15.0)(0), 2.0, 1e-12);
    ASSERT_NEAR(load(25.0)(0), 3.0, 1e-12);

    PiecewiseLoad bounded({10.0}, {Eigen::VectorXd::Constant(1, 1.0)});
    ASSERT_THROWS(bounded(11.0), std::out_of_range);
}

TEST(gaussian_noise_load_seeded) {
    LoadFunction base = constant_load(Eigen::VectorXd::Constant(2, 5.0));
    GaussianNoiseLoad a(base, 0.5, 10u);
    GaussianNoiseLoad b(base, 0.5, 10u);
    GaussianNoiseLoad c(base, 0.5, 11u);

    Eigen::VectorXd va = a(1.0);
    Eigen::VectorXd vb = b(1.0);
    Eigen::VectorXd vc = c(1.0);
    ASSERT_TRUE(va == vb);
    ASSERT_FALSE(va == vc);
    ASSERT_TRUE((va.array() != 5.0).all());
}

TEST(gaussian_noise_load_copies_share_generator) {
    LoadFunction base = constant_load(Eigen::VectorXd::Constant(1, 0.0));
    GaussianNoiseLoad noisy(base, 1.0, 10u);
    GaussianNoiseLoad reference(base, 1.0, 10u);
    const double first = reference(1.0)(0);
    const double second = reference(1.0)(0);

    // Each conversion copies the functor; the noise sequence must still advance
    LoadFunction call_a = noisy;
    LoadFunction call_b = noisy;
    ASSERT_NEAR(call_a(1.0, nullptr)(0), first, 1e-15);
    ASSERT_NEAR(call_b(1.0, nullptr)(0), second, 1e-15);
}

// =============================================================================
// Test Sigma Points
// =============================================================================

TEST(sigma_point_weights) {
    MerweScaledSigmaPoints points(2, 1.0, 0.0, -1.0);
    ASSERT_EQ(points.num_points(), 5);
    ASSERT_NEAR(points.mean_weights().sum(), 1.0, 1e-12);
    ASSERT_NEAR(points.lambda(), -1.0, 1e-12);

    // n + lambda must be positive
    ASSERT_THROWS(MerweScaledSigmaPoints(1, 1.0, 0.0, -1.0), ConfigurationError);
}

TEST(unscented_transform_recovers_moments) {
    MerweScaledSigmaPoints points(2, 1.0, 2.0, 0.0);
    Eigen::Vector2d mean(1.0, -2.0);
    Eigen::Matrix2d cov;
    cov << 2.0, 0.3, 0.3, 1.0;

    Eigen::MatrixXd sigmas = points.generate(mean, cov);
    ASSERT_EQ(sigmas.cols(), 5);
    UnscentedMoments m = unscented_transform(sigmas, points.mean_weights(),
                                             points.cov_weights());
    ASSERT_NEAR((m.mean - mean).norm(), 0.0, 1e-10);
    // beta only adds to the centre point, which has zero deviation
    ASSERT_NEAR((m.covariance - cov).norm(), 0.0, 1e-10);

    Eigen::Matrix2d bad;
    bad << 1.0, 2.0, 2.0, 1.0;
    ASSERT_THROWS(points.generate(mean, bad), NumericalError);
}

// =============================================================================
// Test Model Simulation
// =============================================================================

TEST(simulate_to_impact) {
    testing::ThrownObject model;
    SimulationConfig config;
    config.dt = 0.01;
    config.events = KeyList{"impact"};
    config.apply_noise = false;

    std::mt19937 rng(0);
    SimulationResult result = model.simulate_to_threshold(
        constant_load(Eigen::VectorXd()), model.initialize(), config, &rng);

    ASSERT_EQ(result.size(), 2u);  // start and end only
    ASSERT_NEAR(result.times.back(), testing::analytic_impact_time(),
                0.01 * testing::analytic_impact_time());
    ASSERT_TRUE(result.states.back()(0) <= 0.0);
}

TEST(simulate_saves_on_grid) {
    testing::ThrownObject model;
    SimulationConfig config;
    config.dt = 0.1;
    config.horizon = 1.0;
    config.save_freq = 0.25;
    config.save_pts = {0.55};
    config.events = KeyList();
    config.apply_noise = false;

    SimulationResult result = model.simulate_to_threshold(
        constant_load(Eigen::VectorXd()), model.initialize(), config);

    // 0, 0.3 (first step past 0.25), 0.5, 0.6, 0.8, 1.0
    ASSERT_NEAR(result.times.front(), 0.0, 1e-12);
    ASSERT_NEAR(result.times.back(), 1.0, 1e-9);
    ASSERT_EQ(result.size(), 6u);
}

TEST(simulate_rejects_unknown_event) {
    testing::ThrownObject model;
    SimulationConfig config;
    config.events = KeyList{"landing"};
    ASSERT_THROWS(model.simulate_to_threshold(constant_load(Eigen::VectorXd()),
                                              model.initialize(), config),
                  ConfigurationError);

    config.events = KeyList();
    ASSERT_THROWS(model.simulate_to_threshold(constant_load(Eigen::VectorXd()),
                                              model.initialize(), config),
                  ConfigurationError);
}

TEST(constant_noise_applied_every_step) {
    testing::GrowthModel model;
    SimulationConfig config;
    config.dt = 1.0;
    config.horizon = 3.0;
    config.events = KeyList();
    config.constant_noise = Eigen::Vector2d(0.5, 0.0);

    LoadFunction load = constant_load(Eigen::VectorXd::Constant(1, 1.0));
    SimulationResult result = model.simulate_to_threshold(load, model.initialize(), config);
    // x grows by rate * u * dt + 0.5 each step
    ASSERT_NEAR(result.states.back()(0), 4.5, 1e-12);

    config.constant_noise = Eigen::VectorXd::Constant(3, 0.5);
    ASSERT_THROWS(model.simulate_to_threshold(load, model.initialize(), config),
                  std::invalid_argument);
}

int main() {
    int passed = 0;
    int failed = 0;

    std::cout << "Running prognostics core tests...\n" << std::endl;

    // Types tests
    RUN_TEST(named_values_conversion);
    RUN_TEST(key_mapping_reorders);
    RUN_TEST(event_strategy_parsing);
    RUN_TEST(absent_value);

    // Config and logging tests
    RUN_TEST(config_validation);
    RUN_TEST(log_level_roundtrip);

    // UncertainData tests
    RUN_TEST(scalar_data_statistics);
    RUN_TEST(scalar_data_bounds);
    RUN_TEST(samples_mean_and_cov);
    RUN_TEST(samples_absent_values);
    RUN_TEST(samples_empty);
    RUN_TEST(samples_resample_from_pool);
    RUN_TEST(seeded_sampling_is_deterministic);
    RUN_TEST(multivariate_normal_sampling);
    RUN_TEST(multivariate_normal_nan_keys_are_absent);
    RUN_TEST(relative_accuracy);
    RUN_TEST(shifted_offsets_every_value);
    RUN_TEST(ordered_mean_and_cov);

    // Text round-trip tests
    RUN_TEST(serialize_scalar);
    RUN_TEST(serialize_samples_with_absent);
    RUN_TEST(serialize_multivariate_normal);
    RUN_TEST(deserialize_rejects_garbage);

    // Loading tests
    RUN_TEST(piecewise_load);
    RUN_TEST(gaussian_noise_load_seeded);
    RUN_TEST(gaussian_noise_load_copies_share_generator);

    // Sigma point tests
    RUN_TEST(sigma_point_weights);
    RUN_TEST(unscented_transform_recovers_moments);

    // Model tests
    RUN_TEST(simulate_to_impact);
    RUN_TEST(simulate_saves_on_grid);
    RUN_TEST(simulate_rejects_unknown_event);
    RUN_TEST(constant_noise_applied_every_step);

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;

    return failed > 0 ? 1 : 0;
}
