/**
 * @file types.cpp
 * @brief Key lookups and small helpers shared by all modules.
 */

#include "types.hpp"
#include <algorithm>

namespace prognostics {

int index_of(const KeyList& keys, const std::string& name) {
    auto it = std::find(keys.begin(), keys.end(), name);
    if (it == keys.end()) {
        throw KeyError("key not found: '" + name + "'");
    }
    return static_cast<int>(std::distance(keys.begin(), it));
}

NamedValues to_named(const KeyList& keys, const Eigen::VectorXd& values) {
    if (static_cast<size_t>(values.size()) != keys.size()) {
        throw std::invalid_argument(
            "value count " + std::to_string(values.size()) +
            " does not match key count " + std::to_string(keys.size()));
    }
    NamedValues result;
    for (size_t i = 0; i < keys.size(); ++i) {
        result[keys[i]] = values(static_cast<Eigen::Index>(i));
    }
    return result;
}

Eigen::VectorXd from_named(const KeyList& keys, const NamedValues& values) {
    Eigen::VectorXd result(static_cast<Eigen::Index>(keys.size()));
    for (size_t i = 0; i < keys.size(); ++i) {
        auto it = values.find(keys[i]);
        if (it == values.end()) {
            throw KeyError("missing key: '" + keys[i] + "'");
        }
        result(static_cast<Eigen::Index>(i)) = it->second;
    }
    return result;
}

std::vector<int> key_mapping(const KeyList& source, const KeyList& target) {
    std::vector<int> mapping;
    mapping.reserve(target.size());
    for (const auto& key : target) {
        mapping.push_back(index_of(source, key));
    }
    return mapping;
}

void require_keys(const KeyList& available, const KeyList& required, const std::string& what) {
    for (const auto& key : required) {
        if (std::find(available.begin(), available.end(), key) == available.end()) {
            throw ConfigurationError(what + " missing state '" + key + "'");
        }
    }
}

EventStrategy parse_event_strategy(const std::string& name) {
    if (name == "all") return EventStrategy::ALL;
    if (name == "first") return EventStrategy::FIRST;
    throw ConfigurationError(
        "invalid event_strategy '" + name + "', expected 'all' or 'first'");
}

std::string to_string(EventStrategy strategy) {
    switch (strategy) {
        case EventStrategy::ALL: return "all";
        case EventStrategy::FIRST: return "first";
    }
    return "unknown";
}

}  // namespace prognostics
