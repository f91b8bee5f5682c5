/**
 * @file predictor.cpp
 * @brief Predictor base implementation.
 */

#include "predictor.hpp"

namespace prognostics {

Predictor::Predictor(std::shared_ptr<const PrognosticsModel> model)
    : model_(std::move(model)) {
    if (!model_) {
        throw ConfigurationError("predictor requires a model");
    }
}

std::pair<KeyList, std::vector<int>> Predictor::resolve_events(
    const PredictorConfig& config) const {
    KeyList names = config.events.value_or(model_->events());
    if (names.empty() && !std::isfinite(config.horizon)) {
        throw ConfigurationError("predicting with no events requires a finite horizon");
    }
    std::vector<int> indices = model_->event_indices(names);
    return {std::move(names), std::move(indices)};
}

void Predictor::check_state(const UncertainData& state) const {
    require_keys(state.keys(), model_->states(), "prediction state");
}

}  // namespace prognostics
