/**
 * @file test_metrics.cpp
 * @brief Tests for distribution metrics and time-of-event profile metrics.
 */

#include <iostream>
#include <cmath>
#include <cassert>
#include <stdexcept>
#include <iterator>

#include "metrics.hpp"
#include "logging.hpp"

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
// Helpers
// =============================================================================

static std::shared_ptr<const UncertainData> toe(double impact) {
    return std::make_shared<ScalarData>(KeyList{"impact"}, Eigen::VectorXd::Constant(1, impact));
}

static std::shared_ptr<const UncertainData> toe(double impact, double falling) {
    return std::make_shared<ScalarData>(KeyList{"impact", "falling"},
                                        Eigen::Vector2d(impact, falling));
}

// =============================================================================
// Test Distribution Metrics
// =============================================================================

TEST(sequence_metrics) {
    std::vector<std::optional<double>> values;
    for (int i = 10; i >= 1; --i) {
        values.push_back(static_cast<double>(i));
    }
    DistributionMetrics m = calc_metrics(values, 5.0);

    ASSERT_NEAR(m.min, 1.0, 1e-12);
    ASSERT_NEAR(m.max, 10.0, 1e-12);
    ASSERT_NEAR(m.mean, 5.5, 1e-12);
    ASSERT_NEAR(m.median, 6.0, 1e-12);
    ASSERT_NEAR(m.std, std::sqrt(8.25), 1e-12);
    ASSERT_EQ(m.number_of_samples, 10u);

    ASSERT_TRUE(m.percentiles.at("10").has_value());
    ASSERT_NEAR(*m.percentiles.at("10"), 2.0, 1e-12);
    ASSERT_NEAR(*m.percentiles.at("25"), 3.0, 1e-12);
    ASSERT_NEAR(*m.percentiles.at("75"), 8.0, 1e-12);
    ASSERT_FALSE(m.percentiles.at("1").has_value());
    ASSERT_FALSE(m.percentiles.at("0.01").has_value());

    ASSERT_NEAR(*m.mean_absolute_error, 2.5, 1e-12);
    ASSERT_NEAR(*m.mean_absolute_percentage_error, 0.5, 1e-12);
    ASSERT_NEAR(*m.relative_accuracy, 0.9, 1e-12);
    ASSERT_NEAR(*m.ground_truth_percentile, 50.0, 1e-12);
}

TEST(sequence_metrics_without_ground_truth) {
    std::vector<std::optional<double>> values = {1.0, 2.0, 3.0};
    DistributionMetrics m = calc_metrics(values);
    ASSERT_FALSE(m.mean_absolute_error.has_value());
    ASSERT_FALSE(m.ground_truth_percentile.has_value());
    ASSERT_NEAR(m.mean_absolute_deviation, 2.0 / 3.0, 1e-12);
}

TEST(sequence_metrics_skip_absent) {
    LogLevel previous = get_log_level();
    set_log_level(LogLevel::ERROR);

    std::vector<std::optional<double>> values = {1.0, std::nullopt, 3.0, absent_value()};
    DistributionMetrics m = calc_metrics(values);
    ASSERT_EQ(m.number_of_samples, 2u);
    ASSERT_NEAR(m.mean, 2.0, 1e-12);

    std::vector<std::optional<double>> none(2, std::nullopt);
    ASSERT_THROWS(calc_metrics(none), EmptyDistributionError);
    set_log_level(previous);
}

TEST(square_errors_skip_absent) {
    std::vector<std::optional<double>> values = {8.0, std::nullopt, 11.0, absent_value()};
    ASSERT_NEAR(mean_square_error(values, 10.0), 2.5, 1e-12);
    ASSERT_NEAR(root_mean_square_error(values, 10.0), std::sqrt(2.5), 1e-12);

    std::vector<std::optional<double>> exact = {10.0, 10.0};
    ASSERT_NEAR(root_mean_square_error(exact, 10.0), 0.0, 1e-12);

    std::vector<std::optional<double>> none(3, std::nullopt);
    ASSERT_THROWS(mean_square_error(none, 10.0), EmptyDistributionError);
    ASSERT_THROWS(root_mean_square_error(none, 10.0), EmptyDistributionError);
}

TEST(distribution_metrics_use_own_mean) {
    Eigen::Matrix2d cov;
    cov << 1.0, 0.0, 0.0, 4.0;
    MultivariateNormalDist dist({"a", "b"}, Eigen::Vector2d(10.0, 20.0), cov);

    std::mt19937 rng(17);
    std::map<std::string, DistributionMetrics> m = calc_metrics(dist, nullptr, 10000, &rng);
    ASSERT_EQ(m.size(), 2u);
    ASSERT_NEAR(m.at("a").mean, 10.0, 1e-12);
    ASSERT_NEAR(m.at("b").median, 20.0, 1e-12);
    ASSERT_NEAR(*m.at("b").percentiles.at("50"), 20.0, 1e-12);
    ASSERT_NEAR(m.at("b").std, 2.0, 0.1);
    ASSERT_EQ(m.at("a").number_of_samples, 10000u);
    ASSERT_TRUE(m.at("a").percentiles.at("0.01").has_value());
}

TEST(samples_metrics_with_ground_truth) {
    Samples s({"impact"});
    s.push_back(Eigen::VectorXd::Constant(1, 9.0));
    s.push_back(Eigen::VectorXd::Constant(1, 11.0));

    NamedValues gt{{"impact", 10.0}};
    std::map<std::string, DistributionMetrics> m = s.metrics(&gt);
    ASSERT_NEAR(m.at("impact").mean, 10.0, 1e-12);
    ASSERT_NEAR(*m.at("impact").relative_accuracy, 1.0, 1e-12);
    ASSERT_NEAR(*m.at("impact").mean_absolute_error, 1.0, 1e-12);

    NamedValues wrong{{"falling", 3.0}};
    ASSERT_THROWS(s.metrics(&wrong), KeyError);

    Samples empty({"impact"});
    ASSERT_THROWS(calc_metrics(empty), EmptyDistributionError);
}

TEST(probability_of_success) {
    Samples s({"impact"});
    s.push_back(Eigen::VectorXd::Constant(1, 1.0));
    s.push_back(Eigen::VectorXd::Constant(1, 2.0));
    s.push_back(Eigen::VectorXd::Constant(1, 3.0));
    s.push_absent();

    NamedValues p = prob_success(s, 2.5);
    // 3.0 and the unresolved sample succeed
    ASSERT_NEAR(p.at("impact"), 0.5, 1e-12);

    std::vector<std::optional<double>> times = {1.0, 5.0};
    ASSERT_NEAR(prob_success(times, 0.0), 1.0, 1e-12);
    ASSERT_NEAR(prob_success(times, 10.0), 0.0, 1e-12);
}

// =============================================================================
// Test Profile Metrics
// =============================================================================

TEST(profile_iterates_in_time_order) {
    ToEPredictionProfile profile;
    profile.add_prediction(5.0, toe(8.0));
    profile.add_prediction(1.0, toe(8.0));
    profile.add_prediction(3.0, toe(8.0));
    ASSERT_EQ(profile.size(), 3u);
    ASSERT_NEAR(profile.begin()->first, 1.0, 1e-12);
    ASSERT_NEAR(std::prev(profile.end())->first, 5.0, 1e-12);

    ASSERT_THROWS(profile.add_prediction(6.0, nullptr), std::invalid_argument);
}

TEST(alpha_lambda_exact_prediction) {
    ToEPredictionProfile profile;
    profile.add_prediction(0.0, toe(8.0));
    profile.add_prediction(2.0, toe(8.0));
    profile.add_prediction(4.0, toe(9.5));

    NamedValues gt{{"impact", 8.0}};
    std::map<std::string, bool> at_two = profile.alpha_lambda(gt, 1.5, 0.2, 0.5);
    ASSERT_TRUE(at_two.at("impact"));

    // First prediction at or after 3 is the biased one made at 4
    std::map<std::string, bool> at_four = alpha_lambda(profile, gt, 3.0, 0.2, 0.5);
    ASSERT_FALSE(at_four.at("impact"));

    ASSERT_TRUE(alpha_lambda(profile, gt, 10.0, 0.2, 0.5).empty());
}

TEST(alpha_lambda_seeded_gaussian) {
    // About half of N(100, 74.1^2) lies in [50, 150], so the verdict hinges on sampling
    ToEPredictionProfile profile;
    profile.add_prediction(0.0, std::make_shared<MultivariateNormalDist>(
        KeyList{"impact"}, Eigen::VectorXd::Constant(1, 100.0),
        Eigen::MatrixXd::Constant(1, 1, 74.1 * 74.1)));
    NamedValues gt{{"impact", 100.0}};

    std::mt19937 reference_rng(21);
    const bool reference =
        profile.alpha_lambda(gt, 0.0, 0.5, 0.5, 1000, &reference_rng).at("impact");
    for (int i = 0; i < 10; ++i) {
        std::mt19937 rng(21);
        ASSERT_EQ(profile.alpha_lambda(gt, 0.0, 0.5, 0.5, 1000, &rng).at("impact"), reference);
        std::mt19937 free_rng(21);
        ASSERT_EQ(alpha_lambda(profile, gt, 0.0, 0.5, 0.5, 1000, &free_rng).at("impact"),
                  reference);
    }

    // A tight distribution passes regardless of the draw
    ToEPredictionProfile tight;
    tight.add_prediction(0.0, std::make_shared<MultivariateNormalDist>(
        KeyList{"impact"}, Eigen::VectorXd::Constant(1, 100.0),
        Eigen::MatrixXd::Constant(1, 1, 1.0)));
    std::mt19937 rng(3);
    ASSERT_TRUE(tight.alpha_lambda(gt, 0.0, 0.5, 0.5, 1000, &rng).at("impact"));
}

TEST(prognostic_horizon_first_met) {
    ToEPredictionProfile profile;
    profile.add_prediction(0.0, toe(14.0, 3.0));
    profile.add_prediction(2.0, toe(10.5, 9.0));
    profile.add_prediction(4.0, toe(10.0, 9.0));

    // Time to event within 20 percent of the true time to event
    HorizonCriterion criteria = [](const UncertainData& tte, const NamedValues& gt_tte) {
        std::map<std::string, bool> met;
        NamedValues mean = tte.mean_map();
        for (const auto& gt : gt_tte) {
            met[gt.first] = std::abs(mean.at(gt.first) - gt.second) <= 0.2 * gt.second;
        }
        return met;
    };

    NamedValues gt{{"impact", 10.0}, {"falling", 4.0}};
    std::map<std::string, std::optional<double>> ph = prognostic_horizon(profile, criteria, gt);
    ASSERT_TRUE(ph.at("impact").has_value());
    ASSERT_NEAR(*ph.at("impact"), 8.0, 1e-12);
    // falling is 25 percent off at t = 0 and further off afterwards
    ASSERT_FALSE(ph.at("falling").has_value());
}

TEST(cumulative_relative_accuracy) {
    ToEPredictionProfile profile;
    profile.add_prediction(0.0, toe(9.0));
    profile.add_prediction(1.0, toe(11.0));
    NamedValues cra = profile.cumulative_relative_accuracy({{"impact", 10.0}});
    ASSERT_NEAR(cra.at("impact"), 0.9, 1e-12);
}

TEST(monotonicity_of_sequences) {
    std::vector<double> increasing;
    for (int i = 0; i < 10; ++i) increasing.push_back(i * i);
    ASSERT_NEAR(monotonicity(increasing), 1.0, 1e-12);

    std::vector<double> decreasing = {5.0, 4.0, 1.0};
    ASSERT_NEAR(monotonicity(decreasing), 1.0, 1e-12);

    // Odd length: ten steps, five up and five down
    std::vector<double> alternating;
    for (int i = 0; i < 11; ++i) alternating.push_back(i % 2);
    ASSERT_NEAR(monotonicity(alternating), 0.0, 1e-12);

    ASSERT_THROWS(monotonicity(std::vector<double>{1.0}), std::invalid_argument);
}

TEST(monotonicity_of_profile) {
    ToEPredictionProfile profile;
    for (int t = 0; t < 5; ++t) {
        profile.add_prediction(t, toe(10.0));
    }
    // Time to event shrinks steadily
    NamedValues mono = profile.monotonicity();
    ASSERT_NEAR(mono.at("impact"), 1.0, 1e-12);
}

int main() {
    int passed = 0;
    int failed = 0;

    std::cout << "Running prognostics metrics tests...\n" << std::endl;

    // Distribution metrics tests
    RUN_TEST(sequence_metrics);
    RUN_TEST(sequence_metrics_without_ground_truth);
    RUN_TEST(sequence_metrics_skip_absent);
    RUN_TEST(square_errors_skip_absent);
    RUN_TEST(distribution_metrics_use_own_mean);
    RUN_TEST(samples_metrics_with_ground_truth);
    RUN_TEST(probability_of_success);

    // Profile metrics tests
    RUN_TEST(profile_iterates_in_time_order);
    RUN_TEST(alpha_lambda_exact_prediction);
    RUN_TEST(alpha_lambda_seeded_gaussian);
    RUN_TEST(prognostic_horizon_first_met);
    RUN_TEST(cumulative_relative_accuracy);
    RUN_TEST(monotonicity_of_sequences);
    RUN_TEST(monotonicity_of_profile);

    std::cout << "\n========================================" << std::endl;
    std::cout << "Results: " << passed << " passed, " << failed << " failed" << std::endl;

    return failed > 0 ? 1 : 0;
}
