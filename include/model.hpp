/**
 * @file model.hpp
 * @brief Prognostics model contract and the threshold-aware simulation loop.
 *
 * Models operate on Eigen vectors ordered by their declared key lists:
 *     x_{k+1} = next_state(x_k, u_k, dt)
 *     z_k     = output(x_k)
 *     es_k    = event_state(x_k)   (1 = far from event, 0 = event occurred)
 *
 * Batched forms take a (n_states x n_particles) matrix, one state per column.
 */

#ifndef PROGNOSTICS_MODEL_HPP
#define PROGNOSTICS_MODEL_HPP

#include "types.hpp"
#include <random>

namespace prognostics {

/**
 * @brief Options for PrognosticsModel::simulate_to_threshold.
 */
struct SimulationConfig {
    double t0 = 0.0;                  ///< Start time [s]
    double dt = 1.0;                  ///< Maximum integration step [s]
    double horizon = std::numeric_limits<double>::infinity();   ///< Duration from t0 [s]
    double save_freq = std::numeric_limits<double>::infinity(); ///< Save period [s]
    std::optional<double> save_origin; ///< Origin of the save_freq grid (t0 if unset)
    std::vector<double> save_pts;     ///< Additional save times [s]
    std::optional<KeyList> events;    ///< Events to stop at (all model events if unset)
    bool apply_noise = true;          ///< Apply process noise each step
    std::optional<Eigen::VectorXd> constant_noise;  ///< Fixed process noise rate for this call only

    /// Validate configuration parameters
    void validate() const {
        if (!(dt > 0)) {
            throw ConfigurationError("dt must be positive, was " + std::to_string(dt));
        }
        if (!(save_freq > 0)) {
            throw ConfigurationError("save_freq must be positive, was " + std::to_string(save_freq));
        }
        if (!(horizon >= 0)) {
            throw ConfigurationError("horizon must be non-negative, was " + std::to_string(horizon));
        }
    }
};

// =============================================================================
// PrognosticsModel
// =============================================================================

/**
 * @brief Abstract dynamic system consumed by estimators and predictors.
 *
 * Subclasses declare their key lists at construction and implement the
 * noise-free state transition, output and event-state equations. Noise is
 * applied by the callers through apply_process_noise / apply_measurement_noise.
 */
class PrognosticsModel {
public:
    PrognosticsModel(KeyList states, KeyList inputs, KeyList outputs, KeyList events);
    virtual ~PrognosticsModel() = default;

    const KeyList& states() const { return states_; }
    const KeyList& inputs() const { return inputs_; }
    const KeyList& outputs() const { return outputs_; }
    const KeyList& events() const { return events_; }

    int n_states() const { return static_cast<int>(states_.size()); }
    int n_inputs() const { return static_cast<int>(inputs_.size()); }
    int n_outputs() const { return static_cast<int>(outputs_.size()); }
    int n_events() const { return static_cast<int>(events_.size()); }

    /**
     * @brief Initial state.
     *
     * @param u Optional initial input
     * @param z Optional initial output
     */
    virtual Eigen::VectorXd initialize(const Eigen::VectorXd* u = nullptr,
                                       const Eigen::VectorXd* z = nullptr) const = 0;

    /// Noise-free state transition over dt
    virtual Eigen::VectorXd next_state(const Eigen::VectorXd& x,
                                       const Eigen::VectorXd& u,
                                       double dt) const = 0;

    /// Noise-free output
    virtual Eigen::VectorXd output(const Eigen::VectorXd& x) const = 0;

    /// Event state per event in [0, 1]
    virtual Eigen::VectorXd event_state(const Eigen::VectorXd& x) const = 0;

    /// Whether each event threshold is met (default: event_state <= 0)
    virtual std::vector<bool> threshold_met(const Eigen::VectorXd& x) const;

    /// Clamp the state to its physical limits (default: unchanged)
    virtual Eigen::VectorXd apply_limits(const Eigen::VectorXd& x) const { return x; }

    /// True if next_state_batch / output_batch are natively vectorized
    virtual bool is_vectorized() const { return false; }

    /// State transition for every column of X
    virtual Eigen::MatrixXd next_state_batch(const Eigen::MatrixXd& X,
                                             const Eigen::VectorXd& u,
                                             double dt) const;

    /// Output for every column of X
    virtual Eigen::MatrixXd output_batch(const Eigen::MatrixXd& X) const;

    /// x + dt * N(0, process_noise)
    Eigen::VectorXd apply_process_noise(const Eigen::VectorXd& x, double dt,
                                        std::mt19937& rng) const;

    /// z + N(0, measurement_noise)
    Eigen::VectorXd apply_measurement_noise(const Eigen::VectorXd& z,
                                            std::mt19937& rng) const;

    /// Process noise standard deviation per state
    const Eigen::VectorXd& process_noise() const { return process_noise_; }

    /// Measurement noise standard deviation per output
    const Eigen::VectorXd& measurement_noise() const { return measurement_noise_; }

    void set_process_noise(const Eigen::VectorXd& std_dev);
    void set_process_noise(double std_dev);
    void set_measurement_noise(const Eigen::VectorXd& std_dev);
    void set_measurement_noise(double std_dev);

    /**
     * @brief Indices of the given event names.
     *
     * @throws ConfigurationError naming the first unknown event
     */
    std::vector<int> event_indices(const KeyList& names) const;

    /**
     * @brief Simulate until a requested event threshold is met or the horizon elapses.
     *
     * Saves the start point, every save_freq multiple from save_origin, every
     * save_pts entry, and always the final point. The last step is shortened
     * so the horizon is never overshot.
     *
     * @param load Future loading function
     * @param x0 Initial state
     * @param config Simulation options
     * @param rng Generator for process noise (a randomly seeded local one if nullptr)
     * @return Saved trajectory
     * @throws ConfigurationError for unknown events or no events without a finite horizon
     */
    SimulationResult simulate_to_threshold(const LoadFunction& load,
                                           const Eigen::VectorXd& x0,
                                           const SimulationConfig& config,
                                           std::mt19937* rng = nullptr) const;

protected:
    KeyList states_;
    KeyList inputs_;
    KeyList outputs_;
    KeyList events_;
    Eigen::VectorXd process_noise_;      ///< Standard deviation per state
    Eigen::VectorXd measurement_noise_;  ///< Standard deviation per output
};

// =============================================================================
// LinearModel
// =============================================================================

/**
 * @brief Linear state-space model.
 *
 *     dx/dt = A x + B u + E
 *     z     = C x + D
 *     es    = F x + G   (when F is given)
 *
 * Required by the Kalman filter.
 */
class LinearModel : public PrognosticsModel {
public:
    /**
     * @param A State matrix (n_states x n_states)
     * @param B Input matrix (n_states x n_inputs), may be empty when there are no inputs
     * @param C Output matrix (n_outputs x n_states)
     * @param D Output offset (n_outputs), zeros if empty
     * @param E State offset (n_states), zeros if empty
     * @param F Event-state matrix (n_events x n_states), optional
     * @param G Event-state offset (n_events), zeros if empty
     * @throws std::invalid_argument on any dimension mismatch
     */
    LinearModel(KeyList states, KeyList inputs, KeyList outputs, KeyList events,
                const Eigen::MatrixXd& A, const Eigen::MatrixXd& B,
                const Eigen::MatrixXd& C, const Eigen::VectorXd& D = Eigen::VectorXd(),
                const Eigen::VectorXd& E = Eigen::VectorXd(),
                const Eigen::MatrixXd& F = Eigen::MatrixXd(),
                const Eigen::VectorXd& G = Eigen::VectorXd());

    const Eigen::MatrixXd& A() const { return A_; }
    const Eigen::MatrixXd& B() const { return B_; }
    const Eigen::MatrixXd& C() const { return C_; }
    const Eigen::VectorXd& D() const { return D_; }
    const Eigen::VectorXd& E() const { return E_; }

    Eigen::VectorXd next_state(const Eigen::VectorXd& x, const Eigen::VectorXd& u,
                               double dt) const override;
    Eigen::VectorXd output(const Eigen::VectorXd& x) const override;

    /// F x + G; subclasses without F must override
    Eigen::VectorXd event_state(const Eigen::VectorXd& x) const override;

    bool is_vectorized() const override { return true; }
    Eigen::MatrixXd next_state_batch(const Eigen::MatrixXd& X, const Eigen::VectorXd& u,
                                     double dt) const override;
    Eigen::MatrixXd output_batch(const Eigen::MatrixXd& X) const override;

private:
    Eigen::MatrixXd A_;
    Eigen::MatrixXd B_;
    Eigen::MatrixXd C_;
    Eigen::VectorXd D_;
    Eigen::VectorXd E_;
    Eigen::MatrixXd F_;
    Eigen::VectorXd G_;
};

}  // namespace prognostics

#endif  // PROGNOSTICS_MODEL_HPP
