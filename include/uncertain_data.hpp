/**
 * @file uncertain_data.hpp
 * @brief Distributions over labeled numeric vectors.
 *
 * UncertainData is the common belief representation passed between state
 * estimators, predictors and metrics. Three variants are provided:
 * - ScalarData: a single deterministic vector
 * - Samples: an unweighted empirical distribution
 * - MultivariateNormalDist: a parametric Gaussian
 */

#ifndef PROGNOSTICS_UNCERTAIN_DATA_HPP
#define PROGNOSTICS_UNCERTAIN_DATA_HPP

#include "types.hpp"
#include <random>

namespace prognostics {

class Samples;

/// Open interval (lower, upper) used by percentage_in_bounds
using Bounds = std::pair<double, double>;

/// Per-key bounds
using BoundsMap = std::map<std::string, Bounds>;

/**
 * @brief Summary statistics of one key of a distribution.
 *
 * Percentiles are keyed "0.01", "0.1", "1", "10", "25", "50", "75" and are
 * empty when the sample count is too small to resolve them.
 */
struct DistributionMetrics {
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
    double median = 0.0;
    double std = 0.0;                        ///< Population standard deviation
    double median_absolute_deviation = 0.0;
    double mean_absolute_deviation = 0.0;
    size_t number_of_samples = 0;            ///< Present (non-absent) samples used
    std::map<std::string, std::optional<double>> percentiles;

    // Only set when a ground truth is supplied
    std::optional<double> mean_absolute_error;
    std::optional<double> mean_absolute_percentage_error;
    std::optional<double> relative_accuracy;
    std::optional<double> ground_truth_percentile;
};

// =============================================================================
// UncertainData (abstract)
// =============================================================================

/**
 * @brief Distribution over a vector labeled by an ordered key list.
 *
 * All vectors and matrices returned are ordered by keys(). The covariance is
 * square with dimension keys().size().
 */
class UncertainData {
public:
    explicit UncertainData(KeyList keys) : keys_(std::move(keys)) {}
    virtual ~UncertainData() = default;

    /// Ordered key list
    const KeyList& keys() const { return keys_; }

    /// Number of keys
    size_t dim() const { return keys_.size(); }

    /// True if the key is part of this distribution
    bool contains(const std::string& key) const;

    /**
     * @brief Draw samples from the distribution.
     *
     * @param n Number of samples (must be positive)
     * @param rng Random generator (a randomly seeded local one if nullptr)
     * @return Samples with n entries
     */
    Samples sample(size_t n, std::mt19937* rng = nullptr) const;

    /// Mean in key order
    virtual Eigen::VectorXd mean() const = 0;

    /// Median in key order
    virtual Eigen::VectorXd median() const = 0;

    /// Covariance matrix in key order
    virtual Eigen::MatrixXd cov() const = 0;

    /// Mean as a name -> value map
    NamedValues mean_map() const { return to_named(keys_, mean()); }

    /// Median as a name -> value map
    NamedValues median_map() const { return to_named(keys_, median()); }

    /**
     * @brief Fraction of the distribution strictly inside per-key bounds.
     *
     * @param bounds Bounds for every key of this distribution
     * @param n_samples Samples drawn when no closed form is available
     * @param rng Random generator used for sampling
     * @throws KeyError if a key has no bounds
     */
    NamedValues percentage_in_bounds(const BoundsMap& bounds,
                                     size_t n_samples = 1000,
                                     std::mt19937* rng = nullptr) const;

    /// Same bounds applied to every key
    NamedValues percentage_in_bounds(const Bounds& bounds,
                                     size_t n_samples = 1000,
                                     std::mt19937* rng = nullptr) const;

    /**
     * @brief Relative accuracy 1 - |gt - mean| / gt for every key.
     *
     * @throws KeyError if ground truth lacks a key
     * @throws NumericalError if a ground truth value is zero
     */
    NamedValues relative_accuracy(const NamedValues& ground_truth) const;

    /**
     * @brief Summary statistics for every key.
     *
     * Non-sample distributions are sampled n_samples times first.
     */
    std::map<std::string, DistributionMetrics> metrics(
        const NamedValues* ground_truth = nullptr,
        size_t n_samples = 10000,
        std::mt19937* rng = nullptr) const;

    /// Copy with every value offset by a constant
    virtual std::unique_ptr<UncertainData> shifted(double offset) const = 0;

    /// Polymorphic deep copy
    virtual std::unique_ptr<UncertainData> clone() const = 0;

    /// Variant name used by the text format
    virtual std::string type_name() const = 0;

protected:
    /// Draw n > 0 samples
    virtual Samples do_sample(size_t n, std::mt19937& rng) const = 0;

    /// Percentage in bounds, default implementation samples and counts
    virtual NamedValues do_percentage_in_bounds(const BoundsMap& bounds,
                                                size_t n_samples,
                                                std::mt19937& rng) const;

    KeyList keys_;
};

// =============================================================================
// ScalarData
// =============================================================================

/**
 * @brief Degenerate distribution at a single point.
 */
class ScalarData : public UncertainData {
public:
    ScalarData(KeyList keys, Eigen::VectorXd value);

    /// Build from a name -> value map, keys in map order
    explicit ScalarData(const NamedValues& values);

    Eigen::VectorXd mean() const override { return value_; }
    Eigen::VectorXd median() const override { return value_; }
    Eigen::MatrixXd cov() const override;

    std::unique_ptr<UncertainData> shifted(double offset) const override;
    std::unique_ptr<UncertainData> clone() const override;
    std::string type_name() const override { return "ScalarData"; }

protected:
    Samples do_sample(size_t n, std::mt19937& rng) const override;
    NamedValues do_percentage_in_bounds(const BoundsMap& bounds,
                                        size_t n_samples,
                                        std::mt19937& rng) const override;

private:
    Eigen::VectorXd value_;
};

// =============================================================================
// Samples
// =============================================================================

/**
 * @brief Unweighted empirical distribution.
 *
 * Absent values are stored as NaN. Statistics skip them and log a warning.
 * The median is the geometric median over complete entries, which is O(n^2)
 * and becomes slow for several thousand samples.
 */
class Samples : public UncertainData {
public:
    explicit Samples(KeyList keys);
    Samples(KeyList keys, std::vector<Eigen::VectorXd> data);

    /**
     * @brief Create from a matrix with one sample per row.
     *
     * @param keys Key list (one per column)
     * @param matrix N x d matrix of samples
     */
    Samples(KeyList keys, const Eigen::MatrixXd& matrix);

    /// Number of stored entries
    size_t size() const { return data_.size(); }

    /// Check if there are no entries
    bool empty() const { return data_.empty(); }

    const Eigen::VectorXd& operator[](size_t i) const { return data_[i]; }
    Eigen::VectorXd& operator[](size_t i) { return data_[i]; }

    /// Bounds-checked entry access
    const Eigen::VectorXd& at(size_t i) const;

    /// Append a sample (size must match the key count)
    void push_back(const Eigen::VectorXd& sample);

    /// Append an entry with every value absent
    void push_absent();

    /// Stored entries
    const std::vector<Eigen::VectorXd>& data() const { return data_; }

    std::vector<Eigen::VectorXd>::const_iterator begin() const { return data_.begin(); }
    std::vector<Eigen::VectorXd>::const_iterator end() const { return data_.end(); }

    /// Values of one key, std::nullopt where absent
    std::vector<std::optional<double>> key(const std::string& name) const;

    /// N x d matrix of stored entries
    Eigen::MatrixXd to_matrix() const;

    /// True if entry i has no absent value
    bool is_complete(size_t i) const;

    Eigen::VectorXd mean() const override;
    Eigen::VectorXd median() const override;
    Eigen::MatrixXd cov() const override;

    std::unique_ptr<UncertainData> shifted(double offset) const override;
    std::unique_ptr<UncertainData> clone() const override;
    std::string type_name() const override { return "Samples"; }

protected:
    Samples do_sample(size_t n, std::mt19937& rng) const override;
    NamedValues do_percentage_in_bounds(const BoundsMap& bounds,
                                        size_t n_samples,
                                        std::mt19937& rng) const override;

private:
    void check_sample_size(const Eigen::VectorXd& sample) const;

    std::vector<Eigen::VectorXd> data_;
};

// =============================================================================
// MultivariateNormalDist
// =============================================================================

/**
 * @brief Multivariate normal distribution N(mean, covariance).
 */
class MultivariateNormalDist : public UncertainData {
public:
    /**
     * @throws std::invalid_argument if mean or covariance size differs from the key count
     */
    MultivariateNormalDist(KeyList keys, Eigen::VectorXd mean, Eigen::MatrixXd covariance);

    Eigen::VectorXd mean() const override { return mean_; }
    Eigen::VectorXd median() const override { return mean_; }
    Eigen::MatrixXd cov() const override { return covariance_; }

    std::unique_ptr<UncertainData> shifted(double offset) const override;
    std::unique_ptr<UncertainData> clone() const override;
    std::string type_name() const override { return "MultivariateNormalDist"; }

protected:
    Samples do_sample(size_t n, std::mt19937& rng) const override;

private:
    Eigen::VectorXd mean_;
    Eigen::MatrixXd covariance_;
};

// =============================================================================
// Helpers
// =============================================================================

/**
 * @brief Mean of a belief reordered to the given keys.
 *
 * @throws KeyError if a key is missing from the belief
 */
Eigen::VectorXd mean_in_order(const UncertainData& data, const KeyList& keys);

/**
 * @brief Covariance of a belief reordered to the given keys.
 *
 * @throws KeyError if a key is missing from the belief
 */
Eigen::MatrixXd cov_in_order(const UncertainData& data, const KeyList& keys);

/**
 * @brief Serialize a distribution to a line-oriented text form.
 *
 * Values are written as hexadecimal floating point, so deserialize()
 * reproduces them exactly.
 */
std::string serialize(const UncertainData& data);

/**
 * @brief Parse the text form written by serialize().
 *
 * @throws std::invalid_argument on malformed input
 */
std::unique_ptr<UncertainData> deserialize(const std::string& text);

}  // namespace prognostics

#endif  // PROGNOSTICS_UNCERTAIN_DATA_HPP
