/**
 * @file monte_carlo.cpp
 * @brief Monte Carlo predictor implementation.
 */

#include "monte_carlo.hpp"
#include "logging.hpp"
#include <algorithm>

namespace prognostics {

namespace {

constexpr size_t kDefaultNumSamples = 100;

/// One simulated realization
struct Realization {
    SimulationResult trajectory;
    Eigen::VectorXd time_of_event;                    ///< Per requested event, absent if unresolved
    std::vector<std::optional<Eigen::VectorXd>> final_state;  ///< Per requested event
};

void append(SimulationResult& dst, const SimulationResult& src) {
    dst.times.insert(dst.times.end(), src.times.begin(), src.times.end());
    dst.inputs.insert(dst.inputs.end(), src.inputs.begin(), src.inputs.end());
    dst.states.insert(dst.states.end(), src.states.begin(), src.states.end());
    dst.outputs.insert(dst.outputs.end(), src.outputs.begin(), src.outputs.end());
    dst.event_states.insert(dst.event_states.end(), src.event_states.begin(),
                            src.event_states.end());
}

/// Samples across realizations at every index of the longest trajectory
std::shared_ptr<Prediction> merge(
    const std::vector<double>& times, const std::vector<Realization>& realizations,
    const KeyList& keys,
    const std::vector<Eigen::VectorXd> SimulationResult::*member) {
    std::vector<std::shared_ptr<const UncertainData>> snapshots;
    snapshots.reserve(times.size());
    for (size_t i = 0; i < times.size(); ++i) {
        auto snapshot = std::make_shared<Samples>(keys);
        for (const auto& r : realizations) {
            const std::vector<Eigen::VectorXd>& values = r.trajectory.*member;
            if (i < values.size()) {
                snapshot->push_back(values[i]);
            } else {
                snapshot->push_absent();
            }
        }
        snapshots.push_back(std::move(snapshot));
    }
    return std::make_shared<Prediction>(times, std::move(snapshots));
}

}  // namespace

MonteCarlo::MonteCarlo(std::shared_ptr<const PrognosticsModel> model, MonteCarloConfig config)
    : Predictor(std::move(model)), config_(std::move(config)) {
    config_.validate();
    if (config_.seed.has_value()) {
        rng_ = std::mt19937(*config_.seed);
    } else {
        std::random_device rd;
        rng_ = std::mt19937(rd());
    }
}

PredictionResult MonteCarlo::predict(const UncertainData& state, const LoadFunction& load) {
    return predict(state, load, config_);
}

PredictionResult MonteCarlo::predict(const UncertainData& state, const LoadFunction& load,
                                     const MonteCarloConfig& config) {
    config.validate();
    auto events = resolve_events(config);
    const KeyList& names = events.first;
    const std::vector<int>& event_ids = events.second;
    if (config.seed.has_value()) {
        rng_.seed(*config.seed);
    }

    check_state(state);

    // Initial samples in model state order
    const auto* samples = dynamic_cast<const Samples*>(&state);
    const size_t n = config.n_samples.value_or(
        samples != nullptr ? samples->size() : kDefaultNumSamples);
    if (n == 0) {
        throw ConfigurationError("state holds no samples");
    }
    const std::vector<int> mapping = key_mapping(state.keys(), model_->states());
    const Samples source = (samples != nullptr && samples->size() == n)
                               ? *samples
                               : state.sample(n, &rng_);

    SimulationConfig sim;
    sim.dt = config.dt;
    sim.save_freq = config.save_freq;
    sim.save_origin = config.t0;
    sim.save_pts = config.save_pts;

    const Eigen::VectorXd zero_state = Eigen::VectorXd::Zero(model_->n_states());
    std::vector<Realization> realizations;
    realizations.reserve(n);

    for (size_t j = 0; j < n; ++j) {
        Eigen::VectorXd x(model_->n_states());
        for (size_t i = 0; i < mapping.size(); ++i) {
            x(static_cast<Eigen::Index>(i)) = source[j](mapping[i]);
        }
        if (x.hasNaN()) {
            throw ConfigurationError("state sample " + std::to_string(j) +
                                     " contains absent values");
        }

        // Drawn once and reused for every step of this realization
        if (config.constant_noise) {
            sim.constant_noise = model_->apply_process_noise(zero_state, 1.0, rng_);
        } else {
            sim.constant_noise.reset();
        }

        Realization r;
        r.time_of_event = Eigen::VectorXd::Constant(
            static_cast<Eigen::Index>(names.size()), absent_value());
        r.final_state.assign(names.size(), std::nullopt);

        if (names.empty()) {
            sim.t0 = config.t0;
            sim.horizon = config.horizon;
            sim.events = KeyList();
            r.trajectory = model_->simulate_to_threshold(load, x, sim, &rng_);
            realizations.push_back(std::move(r));
            continue;
        }

        // Positions into names of the events still to be reached, in declared order
        std::vector<size_t> remaining(names.size());
        for (size_t k = 0; k < names.size(); ++k) remaining[k] = k;

        double t_now = config.t0;
        while (!remaining.empty()) {
            KeyList remaining_names;
            for (size_t k : remaining) remaining_names.push_back(names[k]);

            sim.t0 = t_now;
            sim.horizon = std::max(0.0, config.horizon - (t_now - config.t0));
            sim.events = remaining_names;
            append(r.trajectory, model_->simulate_to_threshold(load, x, sim, &rng_));

            const Eigen::VectorXd& x_end = r.trajectory.states.back();
            const std::vector<bool> met = model_->threshold_met(x_end);
            auto hit = std::find_if(remaining.begin(), remaining.end(), [&](size_t k) {
                return met[static_cast<size_t>(event_ids[k])];
            });
            if (hit == remaining.end()) {
                break;  // horizon reached
            }

            const size_t k = *hit;
            r.time_of_event(static_cast<Eigen::Index>(k)) = r.trajectory.times.back();
            r.final_state[k] = x_end;

            if (config.event_strategy == EventStrategy::ALL) {
                remaining.erase(hit);
            } else {
                remaining.clear();
            }

            // The next segment starts from this point and saves it again
            if (!remaining.empty()) {
                t_now = r.trajectory.times.back();
                x = x_end;
                r.trajectory.pop_back();
            }
        }
        realizations.push_back(std::move(r));
    }

    // Longest trajectory defines the time grid
    std::vector<double> times;
    for (const auto& r : realizations) {
        if (r.trajectory.times.size() > times.size()) {
            times = r.trajectory.times;
        }
    }

    PredictionResult result;
    result.times = times;
    result.inputs = merge(times, realizations, model_->inputs(), &SimulationResult::inputs);
    result.states = merge(times, realizations, model_->states(), &SimulationResult::states);
    result.outputs = merge(times, realizations, model_->outputs(), &SimulationResult::outputs);
    result.event_states =
        merge(times, realizations, model_->events(), &SimulationResult::event_states);

    auto toe = std::make_unique<Samples>(names);
    for (const auto& r : realizations) {
        toe->push_back(r.time_of_event);
    }
    result.time_of_event = std::move(toe);

    for (size_t k = 0; k < names.size(); ++k) {
        auto final_state = std::make_shared<Samples>(model_->states());
        bool any_resolved = false;
        for (const auto& r : realizations) {
            if (r.final_state[k].has_value()) {
                final_state->push_back(*r.final_state[k]);
                any_resolved = true;
            } else {
                final_state->push_absent();
            }
        }
        result.final_state[names[k]] =
            any_resolved ? std::shared_ptr<const UncertainData>(std::move(final_state)) : nullptr;
    }

    PROGNOSTICS_LOG_DEBUG("MonteCarlo: " << n << " samples, " << times.size()
                          << " saved points");
    return result;
}

}  // namespace prognostics
