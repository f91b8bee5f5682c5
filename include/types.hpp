/**
 * @file types.hpp
 * @brief Core data structures for the prognostics engine.
 *
 * - Section 1: Key lists and labeled vectors
 * - Section 2: Errors
 * - Section 3: Loading and simulation records
 */

#ifndef PROGNOSTICS_TYPES_HPP
#define PROGNOSTICS_TYPES_HPP

#include <Eigen/Dense>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <limits>
#include <stdexcept>
#include <cmath>

namespace prognostics {

// =============================================================================
// Section 1: Key lists and labeled vectors
// =============================================================================

/// Ordered list of names (states, inputs, outputs or events)
using KeyList = std::vector<std::string>;

/// Name to value map used at the user-facing boundary
using NamedValues = std::map<std::string, double>;

/// Tolerance used when comparing simulation times
constexpr double kTimeTolerance = 1e-9;

/// Marker for an absent value (unresolved event, realization that ended early)
inline double absent_value() {
    return std::numeric_limits<double>::quiet_NaN();
}

/// True if the value marks an absent entry
inline bool is_absent(double value) {
    return std::isnan(value);
}

// =============================================================================
// Section 2: Errors
// =============================================================================

/// A key or event name is missing from a map, belief or ground truth
class KeyError : public std::out_of_range {
public:
    explicit KeyError(const std::string& what) : std::out_of_range(what) {}
};

/// Invalid configuration, detected before any simulation or estimation starts
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

/// Estimation time did not strictly increase
class OrderingError : public std::logic_error {
public:
    explicit OrderingError(const std::string& what) : std::logic_error(what) {}
};

/// Singular covariance, failed factorisation or division by zero
class NumericalError : public std::runtime_error {
public:
    explicit NumericalError(const std::string& what) : std::runtime_error(what) {}
};

/// Statistics or sampling requested from a distribution with no values
class EmptyDistributionError : public std::runtime_error {
public:
    explicit EmptyDistributionError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief Position of a name in a key list.
 *
 * @throws KeyError if the name is not in the list
 */
int index_of(const KeyList& keys, const std::string& name);

/// Convert a vector ordered by keys to a name -> value map
NamedValues to_named(const KeyList& keys, const Eigen::VectorXd& values);

/**
 * @brief Convert a name -> value map to a vector ordered by keys.
 *
 * @throws KeyError naming the first key missing from the map
 */
Eigen::VectorXd from_named(const KeyList& keys, const NamedValues& values);

/**
 * @brief Indices that map `target` keys into `source` order.
 *
 * result[i] is the position of target[i] in source.
 *
 * @throws KeyError if a target key is missing from source
 */
std::vector<int> key_mapping(const KeyList& source, const KeyList& target);

/**
 * @brief Check that every required key is available.
 *
 * @param what Description of the checked data, used in the message
 * @throws ConfigurationError naming the first missing key
 */
void require_keys(const KeyList& available, const KeyList& required, const std::string& what);

// =============================================================================
// Section 3: Loading and simulation records
// =============================================================================

/**
 * @brief Future loading function u(t, x).
 *
 * The state pointer is null when no state estimate is available.
 */
using LoadFunction = std::function<Eigen::VectorXd(double t, const Eigen::VectorXd* x)>;

/**
 * @brief Saved trajectory from one simulation run.
 *
 * All vectors share the index of `times`.
 */
struct SimulationResult {
    std::vector<double> times;                 ///< Saved time points [s]
    std::vector<Eigen::VectorXd> inputs;       ///< Input at each saved point
    std::vector<Eigen::VectorXd> states;       ///< State at each saved point
    std::vector<Eigen::VectorXd> outputs;      ///< Output at each saved point
    std::vector<Eigen::VectorXd> event_states; ///< Event state at each saved point

    size_t size() const { return times.size(); }
    bool empty() const { return times.empty(); }

    /// Remove the last saved point from every sequence
    void pop_back() {
        times.pop_back();
        inputs.pop_back();
        states.pop_back();
        outputs.pop_back();
        event_states.pop_back();
    }
};

/// How a predictor treats the remaining events once one has been reached
enum class EventStrategy {
    ALL,    ///< Keep simulating until every requested event is resolved
    FIRST   ///< Stop at the first requested event
};

/**
 * @brief Parse "all" or "first".
 *
 * @throws ConfigurationError for any other string
 */
EventStrategy parse_event_strategy(const std::string& name);

/// Name of an event strategy
std::string to_string(EventStrategy strategy);

}  // namespace prognostics

#endif  // PROGNOSTICS_TYPES_HPP
