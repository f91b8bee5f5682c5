/**
 * @file particle_filter.hpp
 * @brief Sampling importance resampling particle filter.
 */

#ifndef PROGNOSTICS_PARTICLE_FILTER_HPP
#define PROGNOSTICS_PARTICLE_FILTER_HPP

#include "state_estimator.hpp"
#include <random>

namespace prognostics {

class ParticlePropagator;

/**
 * @brief Particle filter with residual resampling.
 *
 * Particles are stored one per column. The propagation strategy (batched
 * for vectorized models, particle-by-particle otherwise) is fixed when the
 * filter is constructed.
 */
class ParticleFilter : public StateEstimator {
public:
    /**
     * @param model Model used for propagation and measurement
     * @param x0 Initial belief; Samples are used directly when their size matches
     * @param config Filter parameters
     * @throws ConfigurationError on invalid parameters or a missing state
     */
    ParticleFilter(std::shared_ptr<const PrognosticsModel> model,
                   const UncertainData& x0,
                   ParticleFilterConfig config = ParticleFilterConfig());
    ~ParticleFilter() override;

    /// Current particles as Samples over the model states
    std::unique_ptr<UncertainData> x() const override;

    /// Particle matrix (n_states x num_particles)
    const Eigen::MatrixXd& particles() const { return particles_; }

    /// Number of particles
    size_t num_particles() const { return static_cast<size_t>(particles_.cols()); }

    /// True if particles are propagated as one batch
    bool uses_batch_propagation() const;

protected:
    void propagate(const Eigen::VectorXd& u, const std::vector<double>& steps) override;
    void correct(const Eigen::VectorXd& z) override;
    void save_belief() override;
    void restore_belief() override;

private:
    ParticleFilterConfig config_;
    Eigen::MatrixXd particles_;
    Eigen::MatrixXd saved_particles_;
    std::unique_ptr<ParticlePropagator> propagator_;
    std::mt19937 rng_;
};

/**
 * @brief Normalized importance weights from summed Gaussian log-likelihoods.
 *
 * @param predicted Predicted outputs (n_outputs x N)
 * @param z Measured output
 * @param noise_std Standard deviation per output (0 requires an exact match)
 * @return Weights summing to one
 * @throws NumericalError if every particle has zero likelihood
 */
Eigen::VectorXd likelihood_weights(const Eigen::MatrixXd& predicted,
                                   const Eigen::VectorXd& z,
                                   const Eigen::VectorXd& noise_std);

/**
 * @brief Residual resampling.
 *
 * Keeps floor(N w_i) copies of each particle and draws the remainder
 * multinomially from the residual weights.
 *
 * @param weights Normalized weights
 * @param rng Random generator
 * @return N indices into the particle set
 */
std::vector<size_t> residual_resample(const Eigen::VectorXd& weights, std::mt19937& rng);

}  // namespace prognostics

#endif  // PROGNOSTICS_PARTICLE_FILTER_HPP
