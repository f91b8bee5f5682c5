/**
 * @file loading.hpp
 * @brief Future loading helpers usable as LoadFunction.
 */

#ifndef PROGNOSTICS_LOADING_HPP
#define PROGNOSTICS_LOADING_HPP

#include "types.hpp"
#include <random>

namespace prognostics {

/// Loading function that always returns the same input
LoadFunction constant_load(const Eigen::VectorXd& value);

/**
 * @brief Piecewise-constant loading.
 *
 * values[i] applies while t < times[i]. With one value more than times, the
 * last value applies for every later time.
 */
class PiecewiseLoad {
public:
    /**
     * @param times Strictly increasing switch times [s]
     * @param values One input vector per segment (times.size() or times.size() + 1)
     * @throws std::invalid_argument on inconsistent sizes
     */
    PiecewiseLoad(std::vector<double> times, std::vector<Eigen::VectorXd> values);

    /**
     * @throws std::out_of_range if t is past the last time and no default value exists
     */
    Eigen::VectorXd operator()(double t, const Eigen::VectorXd* x = nullptr) const;

private:
    std::vector<double> times_;
    std::vector<Eigen::VectorXd> values_;
};

/**
 * @brief Adds Gaussian noise to every element of a wrapped loading function.
 *
 * The standard deviation is std + std_slope * (t - t0) after t0, std before.
 * A fixed seed makes the noise sequence reproducible. Copies, including the
 * ones made when converting to a LoadFunction, share one generator and so
 * continue a single noise sequence.
 */
class GaussianNoiseLoad {
public:
    GaussianNoiseLoad(LoadFunction fcn, double std_dev,
                      std::optional<unsigned int> seed = std::nullopt,
                      double std_slope = 0.0, double t0 = 0.0);

    Eigen::VectorXd operator()(double t, const Eigen::VectorXd* x = nullptr) const;

private:
    LoadFunction fcn_;
    double std_dev_;
    double std_slope_;
    double t0_;
    std::shared_ptr<std::mt19937> rng_;
};

}  // namespace prognostics

#endif  // PROGNOSTICS_LOADING_HPP
