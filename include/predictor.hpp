/**
 * @file predictor.hpp
 * @brief Predictor interface.
 */

#ifndef PROGNOSTICS_PREDICTOR_HPP
#define PROGNOSTICS_PREDICTOR_HPP

#include "config.hpp"
#include "model.hpp"
#include "prediction.hpp"

namespace prognostics {

/**
 * @brief Propagates a state distribution forward to the requested events.
 */
class Predictor {
public:
    /// @throws ConfigurationError if model is null
    explicit Predictor(std::shared_ptr<const PrognosticsModel> model);
    virtual ~Predictor() = default;

    /**
     * @brief Predict with the configuration given at construction.
     *
     * @param state Current state distribution (keys are model states)
     * @param load Future loading function
     */
    virtual PredictionResult predict(const UncertainData& state, const LoadFunction& load) = 0;

    const PrognosticsModel& model() const { return *model_; }

protected:
    /**
     * @brief Requested events as names and model indices.
     *
     * @throws ConfigurationError for unknown events or an empty list without a finite horizon
     */
    std::pair<KeyList, std::vector<int>> resolve_events(const PredictorConfig& config) const;

    /// @throws ConfigurationError naming a model state missing from state
    void check_state(const UncertainData& state) const;

    std::shared_ptr<const PrognosticsModel> model_;
};

}  // namespace prognostics

#endif  // PROGNOSTICS_PREDICTOR_HPP
