/**
 * @file prediction.cpp
 * @brief Prediction containers.
 */

#include "prediction.hpp"
#include "metrics.hpp"

namespace prognostics {

// =============================================================================
// Prediction
// =============================================================================

Prediction::Prediction(std::vector<double> times,
                       std::vector<std::shared_ptr<const UncertainData>> snapshots)
    : times_(std::move(times)), snapshots_(std::move(snapshots)) {
    if (times_.size() != snapshots_.size()) {
        throw std::invalid_argument("Prediction: " + std::to_string(times_.size()) +
                                    " times but " + std::to_string(snapshots_.size()) +
                                    " snapshots");
    }
}

std::shared_ptr<const UncertainData> Prediction::snapshot(size_t i) const {
    if (i >= snapshots_.size()) {
        throw std::out_of_range("Prediction: index " + std::to_string(i) +
                                " out of range (size " + std::to_string(size()) + ")");
    }
    return snapshots_[i];
}

std::shared_ptr<const UncertainData> Prediction::snapshot_at(double t) const {
    for (size_t i = 0; i < times_.size(); ++i) {
        if (std::abs(times_[i] - t) <= kTimeTolerance) {
            return snapshot(i);
        }
    }
    throw std::out_of_range("Prediction: no snapshot at t = " + std::to_string(t));
}

std::vector<NamedValues> Prediction::means() const {
    std::vector<NamedValues> result;
    result.reserve(size());
    for (size_t i = 0; i < size(); ++i) {
        result.push_back(snapshot(i)->mean_map());
    }
    return result;
}

NamedValues Prediction::monotonicity() const {
    if (size() < 2) {
        throw std::invalid_argument("monotonicity requires at least two snapshots");
    }
    std::vector<NamedValues> m = means();
    NamedValues result;
    for (const auto& key : snapshot(0)->keys()) {
        std::vector<double> series;
        series.reserve(m.size());
        for (const auto& values : m) {
            series.push_back(values.at(key));
        }
        result[key] = prognostics::monotonicity(series);
    }
    return result;
}

// =============================================================================
// LazyUTPrediction
// =============================================================================

LazyUTPrediction::LazyUTPrediction(const Prediction& states, Transform transform,
                                   KeyList keys, MerweScaledSigmaPoints points)
    : transform_(std::move(transform)), keys_(std::move(keys)), points_(std::move(points)) {
    times_ = states.times();
    state_snapshots_.reserve(states.size());
    for (size_t i = 0; i < states.size(); ++i) {
        state_snapshots_.push_back(states.snapshot(i));
    }
    snapshots_.assign(times_.size(), nullptr);
}

std::shared_ptr<const UncertainData> LazyUTPrediction::snapshot(size_t i) const {
    if (i >= times_.size()) {
        throw std::out_of_range("Prediction: index " + std::to_string(i) +
                                " out of range (size " + std::to_string(size()) + ")");
    }
    if (!snapshots_[i]) {
        const UncertainData& state = *state_snapshots_[i];
        Eigen::MatrixXd sigmas = points_.generate(state.mean(), state.cov());

        Eigen::MatrixXd transformed(static_cast<Eigen::Index>(keys_.size()), sigmas.cols());
        for (Eigen::Index j = 0; j < sigmas.cols(); ++j) {
            transformed.col(j) = transform_(sigmas.col(j));
        }
        UnscentedMoments moments = unscented_transform(
            transformed, points_.mean_weights(), points_.cov_weights());
        snapshots_[i] = std::make_shared<MultivariateNormalDist>(
            keys_, moments.mean, moments.covariance);
    }
    return snapshots_[i];
}

// =============================================================================
// ToEPredictionProfile
// =============================================================================

void ToEPredictionProfile::add_prediction(double t, std::shared_ptr<const UncertainData> toe) {
    if (!toe) {
        throw std::invalid_argument("ToEPredictionProfile: null prediction at t = " +
                                    std::to_string(t));
    }
    predictions_[t] = std::move(toe);
}

std::map<std::string, bool> ToEPredictionProfile::alpha_lambda(const NamedValues& ground_truth,
                                                               double lambda, double alpha,
                                                               double beta, size_t n_samples,
                                                               std::mt19937* rng) const {
    return prognostics::alpha_lambda(*this, ground_truth, lambda, alpha, beta, n_samples, rng);
}

std::map<std::string, std::optional<double>> ToEPredictionProfile::prognostic_horizon(
    const HorizonCriterion& criteria, const NamedValues& ground_truth) const {
    return prognostics::prognostic_horizon(*this, criteria, ground_truth);
}

NamedValues ToEPredictionProfile::cumulative_relative_accuracy(
    const NamedValues& ground_truth) const {
    return prognostics::cumulative_relative_accuracy(*this, ground_truth);
}

NamedValues ToEPredictionProfile::monotonicity() const {
    return prognostics::monotonicity(*this);
}

}  // namespace prognostics
