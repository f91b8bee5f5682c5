/**
 * @file metrics.cpp
 * @brief Metric implementations.
 */

#include "metrics.hpp"
#include "logging.hpp"
#include <algorithm>
#include <numeric>

namespace prognostics {

namespace {

/// Value at index floor(n / divisor), present only when n >= min_count
std::optional<double> percentile_at(const std::vector<double>& sorted, size_t index,
                                    size_t min_count) {
    if (sorted.size() < min_count) {
        return std::nullopt;
    }
    return sorted[index];
}

/// Percentile rank of score ("rank" convention: ties share the average rank)
double percentile_of_score(const std::vector<double>& sorted, double score) {
    const auto left = std::lower_bound(sorted.begin(), sorted.end(), score) - sorted.begin();
    const auto right = std::upper_bound(sorted.begin(), sorted.end(), score) - sorted.begin();
    const double n = static_cast<double>(sorted.size());
    return static_cast<double>(left + right + (right > left ? 1 : 0)) * 50.0 / n;
}

/// Samples view of a distribution, drawing only when it is not already one
Samples as_samples(const UncertainData& data, size_t n_samples, std::mt19937* rng) {
    if (const auto* samples = dynamic_cast<const Samples*>(&data)) {
        return *samples;
    }
    return data.sample(n_samples, rng);
}

}  // namespace

// =============================================================================
// Distribution metrics
// =============================================================================

DistributionMetrics calc_metrics(const std::vector<std::optional<double>>& values,
                                 std::optional<double> ground_truth) {
    std::vector<double> data;
    data.reserve(values.size());
    for (const auto& v : values) {
        if (v.has_value() && !is_absent(*v)) {
            data.push_back(*v);
        }
    }
    if (data.empty()) {
        throw EmptyDistributionError("calc_metrics: every value is absent");
    }
    if (data.size() < values.size()) {
        PROGNOSTICS_LOG_WARN("calc_metrics: " << values.size() - data.size()
                             << " absent values ignored, metrics may be biased");
    }
    std::sort(data.begin(), data.end());

    const size_t n = data.size();
    const double count = static_cast<double>(n);
    const double mean = std::accumulate(data.begin(), data.end(), 0.0) / count;
    const double median = data[n / 2];

    DistributionMetrics m;
    m.min = data.front();
    m.max = data.back();
    m.mean = mean;
    m.median = median;
    m.number_of_samples = n;

    m.percentiles["0.01"] = percentile_at(data, n / 10000, 10000);
    m.percentiles["0.1"] = percentile_at(data, n / 1000, 1000);
    m.percentiles["1"] = percentile_at(data, n / 100, 100);
    m.percentiles["10"] = percentile_at(data, n / 10, 10);
    m.percentiles["25"] = percentile_at(data, n / 4, 4);
    m.percentiles["50"] = median;
    m.percentiles["75"] = percentile_at(data, 3 * n / 4, 4);

    double sq = 0.0;
    double dev_median = 0.0;
    double dev_mean = 0.0;
    for (double x : data) {
        sq += (x - mean) * (x - mean);
        dev_median += std::abs(x - median);
        dev_mean += std::abs(x - mean);
    }
    m.std = std::sqrt(sq / count);
    m.median_absolute_deviation = dev_median / count;
    m.mean_absolute_deviation = dev_mean / count;

    if (ground_truth.has_value()) {
        const double gt = *ground_truth;
        double abs_err = 0.0;
        for (double x : data) {
            abs_err += std::abs(x - gt);
        }
        m.mean_absolute_error = abs_err / count;
        m.mean_absolute_percentage_error = *m.mean_absolute_error / gt;
        m.relative_accuracy = 1.0 - std::abs(gt - mean) / gt;
        m.ground_truth_percentile = percentile_of_score(data, gt);
    }
    return m;
}

double mean_square_error(const std::vector<std::optional<double>>& values, double ground_truth) {
    double sum = 0.0;
    size_t count = 0;
    for (const auto& v : values) {
        if (v.has_value() && !is_absent(*v)) {
            sum += (*v - ground_truth) * (*v - ground_truth);
            ++count;
        }
    }
    if (count == 0) {
        throw EmptyDistributionError("mean_square_error: every value is absent");
    }
    return sum / static_cast<double>(count);
}

double root_mean_square_error(const std::vector<std::optional<double>>& values,
                              double ground_truth) {
    return std::sqrt(mean_square_error(values, ground_truth));
}

std::map<std::string, DistributionMetrics> calc_metrics(const UncertainData& data,
                                                        const NamedValues* ground_truth,
                                                        size_t n_samples,
                                                        std::mt19937* rng) {
    Samples samples = as_samples(data, n_samples, rng);
    if (samples.empty()) {
        throw EmptyDistributionError("calc_metrics: distribution holds no samples");
    }

    const Eigen::VectorXd mean = data.mean();
    const Eigen::VectorXd median = data.median();

    std::map<std::string, DistributionMetrics> result;
    for (size_t i = 0; i < data.keys().size(); ++i) {
        const std::string& key = data.keys()[i];
        std::optional<double> gt;
        if (ground_truth != nullptr) {
            auto it = ground_truth->find(key);
            if (it == ground_truth->end()) {
                throw KeyError("ground truth missing key '" + key + "'");
            }
            gt = it->second;
        }

        DistributionMetrics m = calc_metrics(samples.key(key), gt);
        const Eigen::Index ii = static_cast<Eigen::Index>(i);
        m.mean = mean(ii);
        m.median = median(ii);
        m.percentiles["50"] = median(ii);
        result.emplace(key, std::move(m));
    }
    return result;
}

double prob_success(const std::vector<std::optional<double>>& toe, double time) {
    if (toe.empty()) {
        throw EmptyDistributionError("prob_success: time of event is empty");
    }
    size_t success = 0;
    for (const auto& t : toe) {
        if (!t.has_value() || is_absent(*t) || *t > time) {
            ++success;
        }
    }
    return static_cast<double>(success) / static_cast<double>(toe.size());
}

NamedValues prob_success(const UncertainData& toe, double time, size_t n_samples,
                         std::mt19937* rng) {
    Samples samples = as_samples(toe, n_samples, rng);
    NamedValues result;
    for (const auto& key : toe.keys()) {
        result[key] = prob_success(samples.key(key), time);
    }
    return result;
}

// =============================================================================
// Profile metrics
// =============================================================================

std::map<std::string, bool> alpha_lambda(const ToEPredictionProfile& profile,
                                         const NamedValues& ground_truth,
                                         double lambda, double alpha, double beta,
                                         size_t n_samples, std::mt19937* rng) {
    for (const auto& entry : profile) {
        const double t_pred = entry.first;
        if (t_pred < lambda) {
            continue;
        }
        const UncertainData& toe = *entry.second;

        BoundsMap bounds;
        for (const auto& gt : ground_truth) {
            const double half_width = alpha * (gt.second - t_pred);
            bounds[gt.first] = Bounds(gt.second - half_width, gt.second + half_width);
        }
        NamedValues inside = toe.percentage_in_bounds(bounds, n_samples, rng);

        std::map<std::string, bool> result;
        for (const auto& key : toe.keys()) {
            result[key] = inside.at(key) >= beta;
        }
        PROGNOSTICS_LOG_DEBUG("alpha_lambda evaluated at t = " << t_pred);
        return result;
    }
    return {};
}

std::map<std::string, std::optional<double>> prognostic_horizon(
    const ToEPredictionProfile& profile, const HorizonCriterion& criteria,
    const NamedValues& ground_truth) {
    std::map<std::string, std::optional<double>> result;
    for (const auto& gt : ground_truth) {
        result[gt.first] = std::nullopt;
    }

    for (const auto& entry : profile) {
        const double t_pred = entry.first;
        std::unique_ptr<UncertainData> tte = entry.second->shifted(-t_pred);

        NamedValues gt_tte;
        for (const auto& gt : ground_truth) {
            gt_tte[gt.first] = gt.second - t_pred;
        }

        for (const auto& met : criteria(*tte, gt_tte)) {
            auto it = result.find(met.first);
            if (it == result.end()) {
                throw KeyError("criteria returned event '" + met.first +
                               "' with no ground truth");
            }
            if (!met.second || it->second.has_value()) {
                continue;
            }
            const double horizon = ground_truth.at(met.first) - t_pred;
            if (horizon > 0) {
                it->second = horizon;
            }
            const bool all_resolved = std::all_of(
                result.begin(), result.end(),
                [](const std::pair<const std::string, std::optional<double>>& r) {
                    return r.second.has_value();
                });
            if (all_resolved) {
                return result;
            }
        }
    }
    return result;
}

NamedValues cumulative_relative_accuracy(const ToEPredictionProfile& profile,
                                         const NamedValues& ground_truth) {
    NamedValues sums;
    for (const auto& entry : profile) {
        for (const auto& ra : entry.second->relative_accuracy(ground_truth)) {
            sums[ra.first] += ra.second;
        }
    }
    const double n = static_cast<double>(profile.size());
    for (auto& s : sums) {
        s.second /= n;
    }
    return sums;
}

double monotonicity(const std::vector<double>& values) {
    if (values.size() < 2) {
        throw std::invalid_argument("monotonicity requires at least two values, got " +
                                    std::to_string(values.size()));
    }
    double sign_sum = 0.0;
    for (size_t i = 0; i + 1 < values.size(); ++i) {
        const double diff = values[i + 1] - values[i];
        sign_sum += static_cast<double>((diff > 0) - (diff < 0));
    }
    return std::abs(sign_sum / static_cast<double>(values.size() - 1));
}

NamedValues monotonicity(const ToEPredictionProfile& profile) {
    std::map<std::string, std::vector<double>> by_event;
    for (const auto& entry : profile) {
        for (const auto& m : entry.second->mean_map()) {
            by_event[m.first].push_back(m.second - entry.first);
        }
    }
    NamedValues result;
    for (const auto& series : by_event) {
        result[series.first] = monotonicity(series.second);
    }
    return result;
}

}  // namespace prognostics
