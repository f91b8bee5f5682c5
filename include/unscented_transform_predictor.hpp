/**
 * @file unscented_transform_predictor.hpp
 * @brief Predictor propagating a Gaussian state through sigma points.
 *
 * The state mean and covariance are advanced with the unscented transform.
 * After every step each sigma point is checked against the requested
 * events; the time at which a point first meets an event is recorded, and
 * the time of event distribution is the unscented transform of those times.
 */

#ifndef PROGNOSTICS_UNSCENTED_TRANSFORM_PREDICTOR_HPP
#define PROGNOSTICS_UNSCENTED_TRANSFORM_PREDICTOR_HPP

#include "predictor.hpp"

namespace prognostics {

class UnscentedTransformPredictor : public Predictor {
public:
    /**
     * @param model Model to propagate (at least two states with the default sigma parameters)
     * @param config Default prediction parameters
     * @throws ConfigurationError on invalid parameters
     */
    explicit UnscentedTransformPredictor(std::shared_ptr<const PrognosticsModel> model,
                                         UTPredictorConfig config = UTPredictorConfig());

    PredictionResult predict(const UncertainData& state, const LoadFunction& load) override;

    /**
     * @brief Predict with per-call parameters.
     *
     * @throws ConfigurationError for a ScalarData state, unknown events or
     *         a strategy other than EventStrategy::ALL
     * @throws NumericalError if the propagated covariance loses definiteness
     */
    PredictionResult predict(const UncertainData& state, const LoadFunction& load,
                             const UTPredictorConfig& config);

    const UTPredictorConfig& config() const { return config_; }

private:
    UTPredictorConfig config_;
};

}  // namespace prognostics

#endif  // PROGNOSTICS_UNSCENTED_TRANSFORM_PREDICTOR_HPP
