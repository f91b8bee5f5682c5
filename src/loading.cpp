/**
 * @file loading.cpp
 * @brief Implementation of loading helpers.
 */

#include "loading.hpp"

namespace prognostics {

LoadFunction constant_load(const Eigen::VectorXd& value) {
    return [value](double, const Eigen::VectorXd*) { return value; };
}

PiecewiseLoad::PiecewiseLoad(std::vector<double> times, std::vector<Eigen::VectorXd> values)
    : times_(std::move(times)), values_(std::move(values)) {
    if (values_.size() != times_.size() && values_.size() != times_.size() + 1) {
        throw std::invalid_argument(
            "piecewise load needs the same number of values as times, or one more");
    }
    for (size_t i = 1; i < times_.size(); ++i) {
        if (!(times_[i] > times_[i - 1])) {
            throw std::invalid_argument("piecewise load times must be strictly increasing");
        }
    }
    for (size_t i = 1; i < values_.size(); ++i) {
        if (values_[i].size() != values_[0].size()) {
            throw std::invalid_argument("piecewise load values must all have the same size");
        }
    }
}

Eigen::VectorXd PiecewiseLoad::operator()(double t, const Eigen::VectorXd* /*x*/) const {
    for (size_t i = 0; i < times_.size(); ++i) {
        if (t < times_[i]) {
            return values_[i];
        }
    }
    if (values_.size() > times_.size()) {
        return values_.back();
    }
    throw std::out_of_range(
        "time " + std::to_string(t) + " is past the last piecewise load segment");
}

GaussianNoiseLoad::GaussianNoiseLoad(LoadFunction fcn, double std_dev,
                                     std::optional<unsigned int> seed,
                                     double std_slope, double t0)
    : fcn_(std::move(fcn)), std_dev_(std_dev), std_slope_(std_slope), t0_(t0) {
    if (seed.has_value()) {
        rng_ = std::make_shared<std::mt19937>(*seed);
    } else {
        std::random_device rd;
        rng_ = std::make_shared<std::mt19937>(rd());
    }
}

Eigen::VectorXd GaussianNoiseLoad::operator()(double t, const Eigen::VectorXd* x) const {
    Eigen::VectorXd u = fcn_(t, x);
    double std_dev = (t > t0_) ? std_dev_ + std_slope_ * (t - t0_) : std_dev_;
    std::normal_distribution<double> normal(0.0, 1.0);
    for (Eigen::Index i = 0; i < u.size(); ++i) {
        u(i) += std_dev * normal(*rng_);
    }
    return u;
}

}  // namespace prognostics
