/**
 * @file particle_filter.cpp
 * @brief Particle filter implementation.
 */

#include "particle_filter.hpp"
#include "logging.hpp"
#include <algorithm>

namespace prognostics {

namespace {

constexpr size_t kDefaultNumParticles = 100;

}  // namespace

// =============================================================================
// Propagation strategies
// =============================================================================

/**
 * @brief Moves every particle forward over a sequence of sub-steps.
 */
class ParticlePropagator {
public:
    virtual ~ParticlePropagator() = default;
    virtual bool batched() const = 0;
    virtual void propagate(const PrognosticsModel& model, Eigen::MatrixXd& particles,
                           const Eigen::VectorXd& u, const std::vector<double>& steps,
                           std::mt19937& rng) const = 0;
};

namespace {

/// All particles advance together through the model's batched transition
class BatchPropagator : public ParticlePropagator {
public:
    bool batched() const override { return true; }

    void propagate(const PrognosticsModel& model, Eigen::MatrixXd& particles,
                   const Eigen::VectorXd& u, const std::vector<double>& steps,
                   std::mt19937& rng) const override {
        for (double dt : steps) {
            particles = model.next_state_batch(particles, u, dt);
            for (Eigen::Index j = 0; j < particles.cols(); ++j) {
                particles.col(j) = model.apply_limits(
                    model.apply_process_noise(particles.col(j), dt, rng));
            }
        }
    }
};

/// Each particle is sub-stepped independently
class SequentialPropagator : public ParticlePropagator {
public:
    bool batched() const override { return false; }

    void propagate(const PrognosticsModel& model, Eigen::MatrixXd& particles,
                   const Eigen::VectorXd& u, const std::vector<double>& steps,
                   std::mt19937& rng) const override {
        for (Eigen::Index j = 0; j < particles.cols(); ++j) {
            Eigen::VectorXd x = particles.col(j);
            for (double dt : steps) {
                x = model.next_state(x, u, dt);
                x = model.apply_limits(model.apply_process_noise(x, dt, rng));
            }
            particles.col(j) = x;
        }
    }
};

}  // namespace

// =============================================================================
// ParticleFilter
// =============================================================================

ParticleFilter::ParticleFilter(std::shared_ptr<const PrognosticsModel> model,
                               const UncertainData& x0,
                               ParticleFilterConfig config)
    : StateEstimator(model, x0, config), config_(std::move(config)) {
    config_.validate();

    if (config_.seed.has_value()) {
        rng_ = std::mt19937(*config_.seed);
    } else {
        std::random_device rd;
        rng_ = std::mt19937(rd());
    }

    const int p = model_->n_outputs();
    if (config_.measurement_noise.size() == 0) {
        config_.measurement_noise = Eigen::VectorXd::Zero(p);
    } else if (config_.measurement_noise.size() != p) {
        throw ConfigurationError(
            "measurement_noise must have " + std::to_string(p) + " values (one per output)");
    }

    // Initial particles in model state order
    const auto* samples = dynamic_cast<const Samples*>(&x0);
    size_t n = config_.num_particles.value_or(
        samples != nullptr ? samples->size() : kDefaultNumParticles);
    if (n == 0) {
        throw ConfigurationError("initial Samples belief is empty");
    }

    std::vector<int> mapping = key_mapping(x0.keys(), model_->states());
    Samples source = (samples != nullptr && samples->size() == n)
                         ? *samples
                         : x0.sample(n, &rng_);

    particles_.resize(model_->n_states(), static_cast<Eigen::Index>(n));
    for (size_t j = 0; j < n; ++j) {
        if (!source.is_complete(j)) {
            throw ConfigurationError("initial particles contain absent values");
        }
        for (size_t i = 0; i < mapping.size(); ++i) {
            particles_(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                source[j](mapping[i]);
        }
    }

    if (model_->is_vectorized()) {
        propagator_ = std::make_unique<BatchPropagator>();
    } else {
        propagator_ = std::make_unique<SequentialPropagator>();
    }
}

ParticleFilter::~ParticleFilter() = default;

bool ParticleFilter::uses_batch_propagation() const {
    return propagator_->batched();
}

std::unique_ptr<UncertainData> ParticleFilter::x() const {
    return std::make_unique<Samples>(model_->states(), Eigen::MatrixXd(particles_.transpose()));
}

void ParticleFilter::propagate(const Eigen::VectorXd& u, const std::vector<double>& steps) {
    propagator_->propagate(*model_, particles_, u, steps, rng_);
}

void ParticleFilter::correct(const Eigen::VectorXd& z) {
    Eigen::MatrixXd predicted = model_->output_batch(particles_);
    Eigen::VectorXd weights = likelihood_weights(predicted, z, config_.measurement_noise);

    std::vector<size_t> indices = residual_resample(weights, rng_);
    Eigen::MatrixXd resampled(particles_.rows(), particles_.cols());
    for (size_t j = 0; j < indices.size(); ++j) {
        resampled.col(static_cast<Eigen::Index>(j)) =
            particles_.col(static_cast<Eigen::Index>(indices[j]));
    }
    particles_ = std::move(resampled);

    PROGNOSTICS_LOG_DEBUG("ParticleFilter: effective sample size "
                          << 1.0 / weights.squaredNorm() << " of " << weights.size());
}

void ParticleFilter::save_belief() {
    saved_particles_ = particles_;
}

void ParticleFilter::restore_belief() {
    particles_ = saved_particles_;
}

// =============================================================================
// Weighting and resampling
// =============================================================================

Eigen::VectorXd likelihood_weights(const Eigen::MatrixXd& predicted,
                                   const Eigen::VectorXd& z,
                                   const Eigen::VectorXd& noise_std) {
    const Eigen::Index n = predicted.cols();
    const double log_sqrt_2pi = 0.5 * std::log(2.0 * M_PI);

    // Sum of per-channel log-likelihoods (channels assumed independent)
    Eigen::VectorXd log_w = Eigen::VectorXd::Zero(n);
    for (Eigen::Index k = 0; k < predicted.rows(); ++k) {
        const double sigma = noise_std(k);
        for (Eigen::Index j = 0; j < n; ++j) {
            const double diff = z(k) - predicted(k, j);
            if (sigma > 0) {
                const double r = diff / sigma;
                log_w(j) += -0.5 * r * r - std::log(sigma) - log_sqrt_2pi;
            } else if (diff != 0.0) {
                log_w(j) = -std::numeric_limits<double>::infinity();
            }
        }
    }

    const double max_log_w = log_w.maxCoeff();
    if (!std::isfinite(max_log_w)) {
        throw NumericalError("ParticleFilter: every particle has zero likelihood");
    }
    Eigen::VectorXd weights = (log_w.array() - max_log_w).exp().matrix();
    return weights / weights.sum();
}

std::vector<size_t> residual_resample(const Eigen::VectorXd& weights, std::mt19937& rng) {
    const size_t n = static_cast<size_t>(weights.size());
    std::vector<size_t> indices;
    indices.reserve(n);

    // Deterministic copies: floor(N * w_i)
    Eigen::VectorXd scaled = weights * static_cast<double>(n);
    Eigen::VectorXd residual(weights.size());
    for (size_t i = 0; i < n; ++i) {
        const Eigen::Index ii = static_cast<Eigen::Index>(i);
        const double copies = std::floor(scaled(ii));
        for (int c = 0; c < static_cast<int>(copies) && indices.size() < n; ++c) {
            indices.push_back(i);
        }
        residual(ii) = scaled(ii) - copies;
    }

    // Multinomial draws for the remaining slots from the residual weights
    const double residual_sum = residual.sum();
    if (indices.size() < n && residual_sum > 0) {
        std::vector<double> cumulative(n);
        double running = 0.0;
        for (size_t i = 0; i < n; ++i) {
            running += residual(static_cast<Eigen::Index>(i)) / residual_sum;
            cumulative[i] = running;
        }
        cumulative.back() = 1.0;

        std::uniform_real_distribution<double> uniform(0.0, 1.0);
        while (indices.size() < n) {
            auto it = std::lower_bound(cumulative.begin(), cumulative.end(), uniform(rng));
            indices.push_back(static_cast<size_t>(std::distance(cumulative.begin(), it)));
        }
    }
    // Rounding can leave a slot unfilled when every residual is zero
    while (indices.size() < n) {
        indices.push_back(indices.empty() ? 0 : indices.back());
    }
    return indices;
}

}  // namespace prognostics
