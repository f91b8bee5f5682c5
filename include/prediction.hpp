/**
 * @file prediction.hpp
 * @brief Time-indexed predicted distributions and predictor results.
 */

#ifndef PROGNOSTICS_PREDICTION_HPP
#define PROGNOSTICS_PREDICTION_HPP

#include "sigma_points.hpp"
#include "uncertain_data.hpp"
#include <functional>

namespace prognostics {

/**
 * @brief Sequence of distributions, one per saved time point.
 */
class Prediction {
public:
    Prediction() = default;

    /**
     * @param times Saved time points [s]
     * @param snapshots Distribution at each time point
     * @throws std::invalid_argument if the sizes differ
     */
    Prediction(std::vector<double> times,
               std::vector<std::shared_ptr<const UncertainData>> snapshots);
    virtual ~Prediction() = default;

    const std::vector<double>& times() const { return times_; }
    size_t size() const { return times_.size(); }
    bool empty() const { return times_.empty(); }

    /**
     * @brief Distribution at index i.
     * @throws std::out_of_range if i >= size()
     */
    virtual std::shared_ptr<const UncertainData> snapshot(size_t i) const;

    /**
     * @brief Distribution at time t (matched within kTimeTolerance).
     * @throws std::out_of_range if no saved point has that time
     */
    std::shared_ptr<const UncertainData> snapshot_at(double t) const;

    /// Mean of every snapshot
    std::vector<NamedValues> means() const;

    /**
     * @brief Per key |sum sign(m[i+1] - m[i])| / (N - 1) over the snapshot means.
     * @throws std::invalid_argument with fewer than two snapshots
     */
    NamedValues monotonicity() const;

protected:
    std::vector<double> times_;
    mutable std::vector<std::shared_ptr<const UncertainData>> snapshots_;
};

/**
 * @brief Prediction whose snapshots are unscented transforms of state snapshots.
 *
 * Each snapshot is computed the first time it is read and then cached.
 */
class LazyUTPrediction : public Prediction {
public:
    /// Maps a state (model order) to the transformed quantity
    using Transform = std::function<Eigen::VectorXd(const Eigen::VectorXd&)>;

    /**
     * @param states State prediction with MultivariateNormalDist snapshots
     * @param transform Function applied to every sigma point
     * @param keys Keys of the transformed quantity
     * @param points Sigma point parameters matching the state dimension
     */
    LazyUTPrediction(const Prediction& states, Transform transform, KeyList keys,
                     MerweScaledSigmaPoints points);

    std::shared_ptr<const UncertainData> snapshot(size_t i) const override;

private:
    std::vector<std::shared_ptr<const UncertainData>> state_snapshots_;
    Transform transform_;
    KeyList keys_;
    MerweScaledSigmaPoints points_;
};

/**
 * @brief Everything a predictor returns for one call.
 */
struct PredictionResult {
    std::vector<double> times;                  ///< Saved time points [s]
    std::shared_ptr<Prediction> inputs;         ///< Input distribution per time
    std::shared_ptr<Prediction> states;         ///< State distribution per time
    std::shared_ptr<Prediction> outputs;        ///< Output distribution per time
    std::shared_ptr<Prediction> event_states;   ///< Event state distribution per time
    std::unique_ptr<UncertainData> time_of_event;  ///< Over the requested events
    /// State at each requested event; null when the event was never resolved
    std::map<std::string, std::shared_ptr<const UncertainData>> final_state;
};

// =============================================================================
// ToEPredictionProfile
// =============================================================================

class ToEPredictionProfile;

/// Per-event pass/fail decision of a prognostic horizon criterion
using HorizonCriterion =
    std::function<std::map<std::string, bool>(const UncertainData&, const NamedValues&)>;

/**
 * @brief Time-of-event predictions keyed by the time they were made.
 *
 * Iteration is in increasing prediction time.
 */
class ToEPredictionProfile {
public:
    using Container = std::map<double, std::shared_ptr<const UncertainData>>;
    using const_iterator = Container::const_iterator;

    /// Add (or replace) the prediction made at time t
    void add_prediction(double t, std::shared_ptr<const UncertainData> toe);

    size_t size() const { return predictions_.size(); }
    bool empty() const { return predictions_.empty(); }
    const_iterator begin() const { return predictions_.begin(); }
    const_iterator end() const { return predictions_.end(); }

    /// See prognostics::alpha_lambda
    std::map<std::string, bool> alpha_lambda(const NamedValues& ground_truth, double lambda,
                                             double alpha, double beta,
                                             size_t n_samples = 1000,
                                             std::mt19937* rng = nullptr) const;

    /// See prognostics::prognostic_horizon
    std::map<std::string, std::optional<double>> prognostic_horizon(
        const HorizonCriterion& criteria, const NamedValues& ground_truth) const;

    /// See prognostics::cumulative_relative_accuracy
    NamedValues cumulative_relative_accuracy(const NamedValues& ground_truth) const;

    /// See prognostics::monotonicity
    NamedValues monotonicity() const;

private:
    Container predictions_;
};

}  // namespace prognostics

#endif  // PROGNOSTICS_PREDICTION_HPP
