/**
 * @file test_models.hpp
 * @brief Small models shared by the test programs.
 */

#ifndef PROGNOSTICS_TEST_MODELS_HPP
#define PROGNOSTICS_TEST_MODELS_HPP

#include "model.hpp"
#include <algorithm>
#include <cmath>

namespace prognostics {
namespace testing {

/**
 * @brief Object thrown straight up: states (x, v), output x.
 *
 * Events: "falling" (v < 0) and "impact" (x <= 0).
 */
class ThrownObject : public LinearModel {
public:
    static constexpr double kThrowerHeight = 1.83;
    static constexpr double kThrowingSpeed = 40.0;
    static constexpr double kGravity = -9.81;

    /// @param full_state Measure both x and v instead of x only
    explicit ThrownObject(bool full_state = false)
        : LinearModel({"x", "v"}, {},
                      full_state ? KeyList{"x", "v"} : KeyList{"x"},
                      {"falling", "impact"},
                      (Eigen::MatrixXd(2, 2) << 0, 1, 0, 0).finished(),
                      Eigen::MatrixXd(),
                      full_state ? Eigen::MatrixXd(Eigen::MatrixXd::Identity(2, 2))
                                 : Eigen::MatrixXd((Eigen::MatrixXd(1, 2) << 1, 0).finished()),
                      Eigen::VectorXd(),
                      (Eigen::VectorXd(2) << 0, kGravity).finished()) {}

    Eigen::VectorXd initialize(const Eigen::VectorXd* = nullptr,
                               const Eigen::VectorXd* = nullptr) const override {
        return (Eigen::VectorXd(2) << kThrowerHeight, kThrowingSpeed).finished();
    }

    std::vector<bool> threshold_met(const Eigen::VectorXd& x) const override {
        return {x(1) < 0, x(0) <= 0};
    }

    Eigen::VectorXd event_state(const Eigen::VectorXd& x) const override {
        const double x_max = x(0) + x(1) * x(1) / (-kGravity * 2.0);
        Eigen::VectorXd es(2);
        es(0) = std::max(x(1) / kThrowingSpeed, 0.0);
        es(1) = x(1) < 0 ? std::max(x(0) / x_max, 0.0) : 1.0;
        return es;
    }
};

/// Impact time of the noise-free throw: root of h + v t + g t^2 / 2 = 0
inline double analytic_impact_time() {
    const double a = 0.5 * ThrownObject::kGravity;
    const double b = ThrownObject::kThrowingSpeed;
    const double c = ThrownObject::kThrowerHeight;
    return (-b - std::sqrt(b * b - 4.0 * a * c)) / (2.0 * a);
}

/**
 * @brief Non-linear, non-vectorized model with one state growing at rate u.
 *
 * Event "full" is reached when x >= 10; output is x squared.
 */
class GrowthModel : public PrognosticsModel {
public:
    GrowthModel() : PrognosticsModel({"x", "rate"}, {"u"}, {"x2"}, {"full"}) {}

    Eigen::VectorXd initialize(const Eigen::VectorXd* = nullptr,
                               const Eigen::VectorXd* = nullptr) const override {
        return (Eigen::VectorXd(2) << 0.0, 1.0).finished();
    }

    Eigen::VectorXd next_state(const Eigen::VectorXd& x, const Eigen::VectorXd& u,
                               double dt) const override {
        Eigen::VectorXd next = x;
        next(0) += x(1) * u(0) * dt;
        return next;
    }

    Eigen::VectorXd output(const Eigen::VectorXd& x) const override {
        return Eigen::VectorXd::Constant(1, x(0) * x(0));
    }

    Eigen::VectorXd event_state(const Eigen::VectorXd& x) const override {
        return Eigen::VectorXd::Constant(1, 1.0 - x(0) / 10.0);
    }
};

}  // namespace testing
}  // namespace prognostics

#endif  // PROGNOSTICS_TEST_MODELS_HPP
