/**
 * @file metrics.hpp
 * @brief Distribution metrics and time-of-event profile metrics.
 */

#ifndef PROGNOSTICS_METRICS_HPP
#define PROGNOSTICS_METRICS_HPP

#include "prediction.hpp"

namespace prognostics {

// =============================================================================
// Distribution metrics
// =============================================================================

/**
 * @brief Summary statistics of a sequence of values.
 *
 * Absent entries (std::nullopt or NaN) are ignored, with a warning.
 *
 * @param values Values of one key
 * @param ground_truth Optional true value for the error metrics
 * @throws EmptyDistributionError if no value is present
 */
DistributionMetrics calc_metrics(const std::vector<std::optional<double>>& values,
                                 std::optional<double> ground_truth = std::nullopt);

/**
 * @brief Mean of (value - ground_truth)^2 over the present values.
 * @throws EmptyDistributionError if no value is present
 */
double mean_square_error(const std::vector<std::optional<double>>& values, double ground_truth);

/// Square root of mean_square_error()
double root_mean_square_error(const std::vector<std::optional<double>>& values,
                              double ground_truth);

/**
 * @brief Summary statistics for every key of a distribution.
 *
 * Samples are used directly; other distributions are sampled n_samples
 * times. Mean and median are replaced by the distribution's own.
 *
 * @param data Distribution
 * @param ground_truth Optional true value per key
 * @param n_samples Samples drawn for non-sample distributions
 * @param rng Random generator used for sampling
 * @throws KeyError if a ground truth is given but lacks a key
 * @throws EmptyDistributionError if the distribution holds no samples
 */
std::map<std::string, DistributionMetrics> calc_metrics(const UncertainData& data,
                                                        const NamedValues* ground_truth = nullptr,
                                                        size_t n_samples = 10000,
                                                        std::mt19937* rng = nullptr);

/// Fraction of times-of-event that are absent or later than time
double prob_success(const std::vector<std::optional<double>>& toe, double time);

/**
 * @brief Probability that each event has not occurred by time.
 *
 * Absent (unresolved) times count as success.
 */
NamedValues prob_success(const UncertainData& toe, double time,
                         size_t n_samples = 10000,
                         std::mt19937* rng = nullptr);

// =============================================================================
// Profile metrics
// =============================================================================

/**
 * @brief Alpha-lambda metric.
 *
 * Uses the first prediction made at or after lambda. An event passes when at
 * least beta of its ToE distribution lies within gt +/- alpha (gt - t_pred).
 * Distributions without a closed form are sampled n_samples times with rng,
 * so a seeded generator gives a reproducible verdict.
 *
 * @return Pass/fail per event; empty if no prediction was made at or after lambda
 * @throws KeyError if the ground truth lacks an event
 */
std::map<std::string, bool> alpha_lambda(const ToEPredictionProfile& profile,
                                         const NamedValues& ground_truth,
                                         double lambda, double alpha, double beta,
                                         size_t n_samples = 1000,
                                         std::mt19937* rng = nullptr);

/**
 * @brief Prognostic horizon gt - t_pred of the first prediction meeting the criteria.
 *
 * The criteria receive the time-to-event distribution (toe - t_pred) and the
 * true time to event per event.
 *
 * @return Horizon per ground-truth event, std::nullopt if never met
 */
std::map<std::string, std::optional<double>> prognostic_horizon(
    const ToEPredictionProfile& profile, const HorizonCriterion& criteria,
    const NamedValues& ground_truth);

/// Mean relative accuracy per event over every prediction of the profile
NamedValues cumulative_relative_accuracy(const ToEPredictionProfile& profile,
                                         const NamedValues& ground_truth);

/**
 * @brief |sum sign(v[i+1] - v[i])| / (N - 1).
 * @throws std::invalid_argument with fewer than two values
 */
double monotonicity(const std::vector<double>& values);

/// Monotonicity of the mean time to event (mean - t_pred) per event
NamedValues monotonicity(const ToEPredictionProfile& profile);

}  // namespace prognostics

#endif  // PROGNOSTICS_METRICS_HPP
