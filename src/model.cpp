/**
 * @file model.cpp
 * @brief Implementation of the model base classes and simulate_to_threshold.
 */

#include "model.hpp"
#include "logging.hpp"
#include <algorithm>

namespace prognostics {

namespace {

void check_shape(const Eigen::MatrixXd& m, Eigen::Index rows, Eigen::Index cols,
                 const char* name) {
    if (m.rows() != rows || m.cols() != cols) {
        throw std::invalid_argument(
            std::string("matrix ") + name + " must be " + std::to_string(rows) + "x" +
            std::to_string(cols) + ", was " + std::to_string(m.rows()) + "x" +
            std::to_string(m.cols()));
    }
}

Eigen::VectorXd zeros_if_empty(const Eigen::VectorXd& v, Eigen::Index n, const char* name) {
    if (v.size() == 0) {
        return Eigen::VectorXd::Zero(n);
    }
    if (v.size() != n) {
        throw std::invalid_argument(
            std::string("vector ") + name + " must have " + std::to_string(n) +
            " elements, was " + std::to_string(v.size()));
    }
    return v;
}

}  // namespace

// =============================================================================
// PrognosticsModel
// =============================================================================

PrognosticsModel::PrognosticsModel(KeyList states, KeyList inputs, KeyList outputs,
                                   KeyList events)
    : states_(std::move(states)),
      inputs_(std::move(inputs)),
      outputs_(std::move(outputs)),
      events_(std::move(events)),
      process_noise_(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(states_.size()))),
      measurement_noise_(Eigen::VectorXd::Zero(static_cast<Eigen::Index>(outputs_.size()))) {}

std::vector<bool> PrognosticsModel::threshold_met(const Eigen::VectorXd& x) const {
    Eigen::VectorXd es = event_state(x);
    std::vector<bool> met(static_cast<size_t>(es.size()));
    for (Eigen::Index i = 0; i < es.size(); ++i) {
        met[static_cast<size_t>(i)] = es(i) <= 0.0;
    }
    return met;
}

Eigen::MatrixXd PrognosticsModel::next_state_batch(const Eigen::MatrixXd& X,
                                                   const Eigen::VectorXd& u,
                                                   double dt) const {
    Eigen::MatrixXd result(X.rows(), X.cols());
    for (Eigen::Index j = 0; j < X.cols(); ++j) {
        result.col(j) = next_state(X.col(j), u, dt);
    }
    return result;
}

Eigen::MatrixXd PrognosticsModel::output_batch(const Eigen::MatrixXd& X) const {
    Eigen::MatrixXd result(n_outputs(), X.cols());
    for (Eigen::Index j = 0; j < X.cols(); ++j) {
        result.col(j) = output(X.col(j));
    }
    return result;
}

Eigen::VectorXd PrognosticsModel::apply_process_noise(const Eigen::VectorXd& x, double dt,
                                                      std::mt19937& rng) const {
    Eigen::VectorXd result = x;
    std::normal_distribution<double> normal(0.0, 1.0);
    for (Eigen::Index i = 0; i < result.size(); ++i) {
        if (process_noise_(i) > 0) {
            result(i) += dt * process_noise_(i) * normal(rng);
        }
    }
    return result;
}

Eigen::VectorXd PrognosticsModel::apply_measurement_noise(const Eigen::VectorXd& z,
                                                          std::mt19937& rng) const {
    Eigen::VectorXd result = z;
    std::normal_distribution<double> normal(0.0, 1.0);
    for (Eigen::Index i = 0; i < result.size(); ++i) {
        if (measurement_noise_(i) > 0) {
            result(i) += measurement_noise_(i) * normal(rng);
        }
    }
    return result;
}

void PrognosticsModel::set_process_noise(const Eigen::VectorXd& std_dev) {
    if (std_dev.size() != n_states()) {
        throw std::invalid_argument("process noise must have one value per state");
    }
    process_noise_ = std_dev;
}

void PrognosticsModel::set_process_noise(double std_dev) {
    process_noise_ = Eigen::VectorXd::Constant(n_states(), std_dev);
}

void PrognosticsModel::set_measurement_noise(const Eigen::VectorXd& std_dev) {
    if (std_dev.size() != n_outputs()) {
        throw std::invalid_argument("measurement noise must have one value per output");
    }
    measurement_noise_ = std_dev;
}

void PrognosticsModel::set_measurement_noise(double std_dev) {
    measurement_noise_ = Eigen::VectorXd::Constant(n_outputs(), std_dev);
}

std::vector<int> PrognosticsModel::event_indices(const KeyList& names) const {
    std::vector<int> indices;
    indices.reserve(names.size());
    for (const auto& name : names) {
        auto it = std::find(events_.begin(), events_.end(), name);
        if (it == events_.end()) {
            throw ConfigurationError("unknown event '" + name + "'");
        }
        indices.push_back(static_cast<int>(std::distance(events_.begin(), it)));
    }
    return indices;
}

SimulationResult PrognosticsModel::simulate_to_threshold(const LoadFunction& load,
                                                         const Eigen::VectorXd& x0,
                                                         const SimulationConfig& config,
                                                         std::mt19937* rng) const {
    config.validate();
    if (x0.size() != n_states()) {
        throw std::invalid_argument(
            "initial state has " + std::to_string(x0.size()) + " values, model has " +
            std::to_string(n_states()) + " states");
    }

    std::vector<int> event_ids;
    if (config.events.has_value()) {
        event_ids = event_indices(*config.events);
    } else {
        for (int i = 0; i < n_events(); ++i) event_ids.push_back(i);
    }
    if (event_ids.empty() && !std::isfinite(config.horizon)) {
        throw ConfigurationError("simulating with no events requires a finite horizon");
    }
    if (config.constant_noise.has_value() && config.constant_noise->size() != n_states()) {
        throw std::invalid_argument("constant noise must have one value per state");
    }

    std::mt19937 local_rng;
    if (rng == nullptr) {
        std::random_device rd;
        local_rng = std::mt19937(rd());
        rng = &local_rng;
    }

    std::vector<double> save_pts = config.save_pts;
    std::sort(save_pts.begin(), save_pts.end());
    size_t next_pt = 0;
    while (next_pt < save_pts.size() && save_pts[next_pt] <= config.t0 + kTimeTolerance) {
        ++next_pt;
    }

    SimulationResult result;
    auto save = [&](double time, const Eigen::VectorXd& u, const Eigen::VectorXd& state) {
        result.times.push_back(time);
        result.inputs.push_back(u);
        result.states.push_back(state);
        result.outputs.push_back(output(state));
        result.event_states.push_back(event_state(state));
    };

    auto requested_threshold_met = [&](const Eigen::VectorXd& state) {
        if (event_ids.empty()) return false;
        std::vector<bool> met = threshold_met(state);
        for (int id : event_ids) {
            if (met[static_cast<size_t>(id)]) return true;
        }
        return false;
    };

    const double t_end = config.t0 + config.horizon;
    double t = config.t0;
    Eigen::VectorXd x = x0;
    Eigen::VectorXd u = load(t, &x);
    save(t, u, x);

    // First grid point strictly after t0
    const double origin = config.save_origin.value_or(config.t0);
    double save_index = 1.0;
    if (std::isfinite(config.save_freq)) {
        save_index = std::floor((config.t0 - origin) / config.save_freq + kTimeTolerance) + 1.0;
    }
    size_t steps = 0;
    while (!requested_threshold_met(x) && t < t_end - kTimeTolerance) {
        double step = std::min(config.dt, t_end - t);
        u = load(t + step, &x);
        x = next_state(x, u, step);
        if (config.apply_noise) {
            if (config.constant_noise.has_value()) {
                x += step * (*config.constant_noise);
            } else {
                x = apply_process_noise(x, step, *rng);
            }
        }
        x = apply_limits(x);
        t += step;
        ++steps;

        bool do_save = false;
        while (t >= origin + save_index * config.save_freq - kTimeTolerance) {
            do_save = true;
            save_index += 1.0;
        }
        while (next_pt < save_pts.size() && t >= save_pts[next_pt] - kTimeTolerance) {
            do_save = true;
            ++next_pt;
        }
        if (do_save) {
            save(t, u, x);
        }
    }

    if (result.times.back() != t) {
        save(t, u, x);
    }

    PROGNOSTICS_LOG_DEBUG("simulate_to_threshold: " << steps << " steps from t=" << config.t0
                          << " to t=" << t);
    return result;
}

// =============================================================================
// LinearModel
// =============================================================================

LinearModel::LinearModel(KeyList states, KeyList inputs, KeyList outputs, KeyList events,
                         const Eigen::MatrixXd& A, const Eigen::MatrixXd& B,
                         const Eigen::MatrixXd& C, const Eigen::VectorXd& D,
                         const Eigen::VectorXd& E, const Eigen::MatrixXd& F,
                         const Eigen::VectorXd& G)
    : PrognosticsModel(std::move(states), std::move(inputs), std::move(outputs),
                       std::move(events)),
      A_(A), C_(C) {
    const Eigen::Index n = n_states();
    const Eigen::Index m = n_inputs();
    const Eigen::Index p = n_outputs();

    check_shape(A_, n, n, "A");
    B_ = (B.size() == 0) ? Eigen::MatrixXd::Zero(n, m) : B;
    check_shape(B_, n, m, "B");
    check_shape(C_, p, n, "C");
    D_ = zeros_if_empty(D, p, "D");
    E_ = zeros_if_empty(E, n, "E");

    if (F.size() != 0) {
        check_shape(F, n_events(), n, "F");
        F_ = F;
        G_ = zeros_if_empty(G, n_events(), "G");
    }
}

Eigen::VectorXd LinearModel::next_state(const Eigen::VectorXd& x, const Eigen::VectorXd& u,
                                        double dt) const {
    Eigen::VectorXd dx = A_ * x + E_;
    if (B_.cols() > 0) {
        dx += B_ * u;
    }
    return x + dx * dt;
}

Eigen::VectorXd LinearModel::output(const Eigen::VectorXd& x) const {
    return C_ * x + D_;
}

Eigen::VectorXd LinearModel::event_state(const Eigen::VectorXd& x) const {
    if (F_.size() == 0) {
        throw std::logic_error("LinearModel without F matrix must override event_state");
    }
    return F_ * x + G_;
}

Eigen::MatrixXd LinearModel::next_state_batch(const Eigen::MatrixXd& X,
                                              const Eigen::VectorXd& u,
                                              double dt) const {
    Eigen::VectorXd offset = E_;
    if (B_.cols() > 0) {
        offset += B_ * u;
    }
    Eigen::MatrixXd dX = A_ * X;
    dX.colwise() += offset;
    return X + dX * dt;
}

Eigen::MatrixXd LinearModel::output_batch(const Eigen::MatrixXd& X) const {
    Eigen::MatrixXd Z = C_ * X;
    Z.colwise() += D_;
    return Z;
}

}  // namespace prognostics
