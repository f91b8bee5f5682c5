/**
 * @file monte_carlo.hpp
 * @brief Monte Carlo predictor.
 *
 * Every sample of the state distribution is simulated forward until the
 * requested events are reached or the horizon elapses. The results are
 * unweighted Samples at each saved time point.
 */

#ifndef PROGNOSTICS_MONTE_CARLO_HPP
#define PROGNOSTICS_MONTE_CARLO_HPP

#include "predictor.hpp"
#include <random>

namespace prognostics {

class MonteCarlo : public Predictor {
public:
    /**
     * @param model Model to simulate
     * @param config Default prediction parameters
     * @throws ConfigurationError on invalid parameters
     */
    explicit MonteCarlo(std::shared_ptr<const PrognosticsModel> model,
                        MonteCarloConfig config = MonteCarloConfig());

    PredictionResult predict(const UncertainData& state, const LoadFunction& load) override;

    /**
     * @brief Predict with per-call parameters.
     *
     * A seed in config reseeds the predictor's generator before the call.
     *
     * @throws ConfigurationError on invalid parameters or unknown events
     * @throws KeyError if state lacks a model state
     */
    PredictionResult predict(const UncertainData& state, const LoadFunction& load,
                             const MonteCarloConfig& config);

    const MonteCarloConfig& config() const { return config_; }

private:
    MonteCarloConfig config_;
    std::mt19937 rng_;
};

}  // namespace prognostics

#endif  // PROGNOSTICS_MONTE_CARLO_HPP
