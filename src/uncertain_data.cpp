/**
 * @file uncertain_data.cpp
 * @brief Implementation of the UncertainData family.
 */

#include "uncertain_data.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace prognostics {

namespace {

std::mt19937& resolve_rng(std::mt19937* rng, std::mt19937& local_rng) {
    if (rng != nullptr) {
        return *rng;
    }
    std::random_device rd;
    local_rng = std::mt19937(rd());
    return local_rng;
}

/// Indices of keys whose mean and covariance entries are all finite
std::vector<Eigen::Index> finite_indices(const Eigen::VectorXd& mean,
                                         const Eigen::MatrixXd& covariance) {
    std::vector<Eigen::Index> candidates;
    for (Eigen::Index i = 0; i < mean.size(); ++i) {
        if (std::isfinite(mean(i)) && std::isfinite(covariance(i, i))) {
            candidates.push_back(i);
        }
    }
    std::vector<Eigen::Index> result;
    for (Eigen::Index i : candidates) {
        bool row_finite = true;
        for (Eigen::Index j : candidates) {
            if (!std::isfinite(covariance(i, j))) {
                row_finite = false;
                break;
            }
        }
        if (row_finite) {
            result.push_back(i);
        }
    }
    return result;
}

/// Lower factor L with L L^T = covariance, tolerating semi-definite input
Eigen::MatrixXd covariance_factor(const Eigen::MatrixXd& covariance) {
    Eigen::LLT<Eigen::MatrixXd> llt(covariance);
    if (llt.info() == Eigen::Success) {
        return llt.matrixL();
    }
    Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> solver(covariance);
    if (solver.info() != Eigen::Success) {
        throw NumericalError("covariance factorisation failed");
    }
    Eigen::VectorXd root = solver.eigenvalues().cwiseMax(0.0).cwiseSqrt();
    return solver.eigenvectors() * root.asDiagonal();
}

void check_serializable_keys(const KeyList& keys) {
    for (const auto& key : keys) {
        if (key.empty() || key.find_first_of(" \t\r\n") != std::string::npos) {
            throw std::invalid_argument("key '" + key + "' cannot be serialized");
        }
    }
}

void write_values(std::ostream& out, const char* tag, const Eigen::VectorXd& values) {
    out << tag;
    for (Eigen::Index i = 0; i < values.size(); ++i) {
        out << ' ' << values(i);
    }
    out << '\n';
}

std::vector<std::string> split_tokens(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

double parse_double(const std::string& token) {
    char* end = nullptr;
    double value = std::strtod(token.c_str(), &end);
    if (end == token.c_str() || *end != '\0') {
        throw std::invalid_argument("invalid number '" + token + "'");
    }
    return value;
}

/// Parse a "<tag> v1 v2 ..." line with exactly n values
Eigen::VectorXd parse_values(const std::string& line, const std::string& tag, size_t n) {
    std::vector<std::string> tokens = split_tokens(line);
    if (tokens.empty() || tokens[0] != tag) {
        throw std::invalid_argument("expected '" + tag + "' line, got '" + line + "'");
    }
    if (tokens.size() != n + 1) {
        throw std::invalid_argument(
            "'" + tag + "' line has " + std::to_string(tokens.size() - 1) +
            " values, expected " + std::to_string(n));
    }
    Eigen::VectorXd values(static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        values(static_cast<Eigen::Index>(i)) = parse_double(tokens[i + 1]);
    }
    return values;
}

std::string next_line(std::istream& in) {
    std::string line;
    if (!std::getline(in, line)) {
        throw std::invalid_argument("unexpected end of serialized data");
    }
    return line;
}

}  // namespace

// =============================================================================
// UncertainData
// =============================================================================

bool UncertainData::contains(const std::string& key) const {
    return std::find(keys_.begin(), keys_.end(), key) != keys_.end();
}

Samples UncertainData::sample(size_t n, std::mt19937* rng) const {
    if (n == 0) {
        throw std::invalid_argument("number of samples must be positive");
    }
    std::mt19937 local_rng;
    return do_sample(n, resolve_rng(rng, local_rng));
}

NamedValues UncertainData::percentage_in_bounds(const BoundsMap& bounds,
                                                size_t n_samples,
                                                std::mt19937* rng) const {
    for (const auto& key : keys_) {
        if (bounds.find(key) == bounds.end()) {
            throw KeyError("no bounds given for key '" + key + "'");
        }
    }
    std::mt19937 local_rng;
    return do_percentage_in_bounds(bounds, n_samples, resolve_rng(rng, local_rng));
}

NamedValues UncertainData::percentage_in_bounds(const Bounds& bounds,
                                                size_t n_samples,
                                                std::mt19937* rng) const {
    BoundsMap per_key;
    for (const auto& key : keys_) {
        per_key[key] = bounds;
    }
    return percentage_in_bounds(per_key, n_samples, rng);
}

NamedValues UncertainData::do_percentage_in_bounds(const BoundsMap& bounds,
                                                   size_t n_samples,
                                                   std::mt19937& rng) const {
    Samples drawn = sample(n_samples, &rng);
    return drawn.percentage_in_bounds(bounds, n_samples, &rng);
}

NamedValues UncertainData::relative_accuracy(const NamedValues& ground_truth) const {
    Eigen::VectorXd m = mean();
    NamedValues result;
    for (size_t i = 0; i < keys_.size(); ++i) {
        auto it = ground_truth.find(keys_[i]);
        if (it == ground_truth.end()) {
            throw KeyError("ground truth missing key '" + keys_[i] + "'");
        }
        double gt = it->second;
        if (gt == 0.0) {
            throw NumericalError(
                "relative accuracy undefined: ground truth for '" + keys_[i] + "' is zero");
        }
        result[keys_[i]] = 1.0 - std::abs(gt - m(static_cast<Eigen::Index>(i))) / gt;
    }
    return result;
}

std::map<std::string, DistributionMetrics> UncertainData::metrics(
    const NamedValues* ground_truth,
    size_t n_samples,
    std::mt19937* rng) const {
    return calc_metrics(*this, ground_truth, n_samples, rng);
}

// =============================================================================
// ScalarData
// =============================================================================

ScalarData::ScalarData(KeyList keys, Eigen::VectorXd value)
    : UncertainData(std::move(keys)), value_(std::move(value)) {
    if (static_cast<size_t>(value_.size()) != keys_.size()) {
        throw std::invalid_argument(
            "ScalarData value size " + std::to_string(value_.size()) +
            " does not match key count " + std::to_string(keys_.size()));
    }
}

ScalarData::ScalarData(const NamedValues& values)
    : UncertainData(KeyList()), value_(static_cast<Eigen::Index>(values.size())) {
    Eigen::Index i = 0;
    for (const auto& [key, value] : values) {
        keys_.push_back(key);
        value_(i++) = value;
    }
}

Eigen::MatrixXd ScalarData::cov() const {
    return Eigen::MatrixXd::Zero(value_.size(), value_.size());
}

std::unique_ptr<UncertainData> ScalarData::shifted(double offset) const {
    Eigen::VectorXd value = (value_.array() + offset).matrix();
    return std::make_unique<ScalarData>(keys_, value);
}

std::unique_ptr<UncertainData> ScalarData::clone() const {
    return std::make_unique<ScalarData>(*this);
}

Samples ScalarData::do_sample(size_t n, std::mt19937& /*rng*/) const {
    return Samples(keys_, std::vector<Eigen::VectorXd>(n, value_));
}

NamedValues ScalarData::do_percentage_in_bounds(const BoundsMap& bounds,
                                                size_t /*n_samples*/,
                                                std::mt19937& /*rng*/) const {
    NamedValues result;
    for (size_t i = 0; i < keys_.size(); ++i) {
        const Bounds& b = bounds.at(keys_[i]);
        double v = value_(static_cast<Eigen::Index>(i));
        result[keys_[i]] = (v > b.first && v < b.second) ? 1.0 : 0.0;
    }
    return result;
}

// =============================================================================
// Samples
// =============================================================================

Samples::Samples(KeyList keys) : UncertainData(std::move(keys)) {}

Samples::Samples(KeyList keys, std::vector<Eigen::VectorXd> data)
    : UncertainData(std::move(keys)), data_(std::move(data)) {
    for (const auto& sample : data_) {
        check_sample_size(sample);
    }
}

Samples::Samples(KeyList keys, const Eigen::MatrixXd& matrix)
    : UncertainData(std::move(keys)) {
    if (static_cast<size_t>(matrix.cols()) != keys_.size()) {
        throw std::invalid_argument(
            "sample matrix has " + std::to_string(matrix.cols()) +
            " columns, expected " + std::to_string(keys_.size()));
    }
    data_.reserve(static_cast<size_t>(matrix.rows()));
    for (Eigen::Index i = 0; i < matrix.rows(); ++i) {
        data_.push_back(matrix.row(i).transpose());
    }
}

void Samples::check_sample_size(const Eigen::VectorXd& sample) const {
    if (static_cast<size_t>(sample.size()) != keys_.size()) {
        throw std::invalid_argument(
            "sample size " + std::to_string(sample.size()) +
            " does not match key count " + std::to_string(keys_.size()));
    }
}

const Eigen::VectorXd& Samples::at(size_t i) const {
    if (i >= data_.size()) {
        throw std::out_of_range(
            "sample index " + std::to_string(i) + " out of range (size " +
            std::to_string(data_.size()) + ")");
    }
    return data_[i];
}

void Samples::push_back(const Eigen::VectorXd& sample) {
    check_sample_size(sample);
    data_.push_back(sample);
}

void Samples::push_absent() {
    data_.push_back(Eigen::VectorXd::Constant(
        static_cast<Eigen::Index>(keys_.size()), absent_value()));
}

std::vector<std::optional<double>> Samples::key(const std::string& name) const {
    Eigen::Index index = index_of(keys_, name);
    std::vector<std::optional<double>> values;
    values.reserve(data_.size());
    for (const auto& sample : data_) {
        if (is_absent(sample(index))) {
            values.push_back(std::nullopt);
        } else {
            values.push_back(sample(index));
        }
    }
    return values;
}

Eigen::MatrixXd Samples::to_matrix() const {
    Eigen::MatrixXd matrix(static_cast<Eigen::Index>(data_.size()),
                           static_cast<Eigen::Index>(keys_.size()));
    for (size_t i = 0; i < data_.size(); ++i) {
        matrix.row(static_cast<Eigen::Index>(i)) = data_[i].transpose();
    }
    return matrix;
}

bool Samples::is_complete(size_t i) const {
    return !data_.at(i).hasNaN();
}

Eigen::VectorXd Samples::mean() const {
    if (data_.empty()) {
        throw EmptyDistributionError("mean of empty Samples");
    }
    const Eigen::Index d = static_cast<Eigen::Index>(keys_.size());
    Eigen::VectorXd sum = Eigen::VectorXd::Zero(d);
    Eigen::VectorXd count = Eigen::VectorXd::Zero(d);
    for (const auto& sample : data_) {
        for (Eigen::Index j = 0; j < d; ++j) {
            if (!is_absent(sample(j))) {
                sum(j) += sample(j);
                count(j) += 1.0;
            }
        }
    }
    Eigen::VectorXd result(d);
    bool skipped = false;
    for (Eigen::Index j = 0; j < d; ++j) {
        if (count(j) < static_cast<double>(data_.size())) {
            skipped = true;
        }
        result(j) = count(j) > 0 ? sum(j) / count(j) : absent_value();
    }
    if (skipped) {
        PROGNOSTICS_LOG_WARN("Samples::mean: some values were absent, mean uses present values only");
    }
    return result;
}

Eigen::VectorXd Samples::median() const {
    if (data_.empty()) {
        throw EmptyDistributionError("median of empty Samples");
    }
    std::vector<size_t> complete;
    for (size_t i = 0; i < data_.size(); ++i) {
        if (is_complete(i)) complete.push_back(i);
    }
    if (complete.empty()) {
        throw EmptyDistributionError("median of Samples with no complete entries");
    }
    if (complete.size() < data_.size()) {
        PROGNOSTICS_LOG_WARN("Samples::median: entries with absent values were skipped");
    }

    // Geometric median: stored point with the least total squared distance
    size_t best = complete.front();
    double best_total = std::numeric_limits<double>::infinity();
    for (size_t i : complete) {
        double total = 0.0;
        for (size_t j : complete) {
            total += (data_[i] - data_[j]).squaredNorm();
        }
        if (total < best_total) {
            best_total = total;
            best = i;
        }
    }
    return data_[best];
}

Eigen::MatrixXd Samples::cov() const {
    if (data_.empty()) {
        throw EmptyDistributionError("covariance of empty Samples");
    }
    std::vector<size_t> complete;
    for (size_t i = 0; i < data_.size(); ++i) {
        if (is_complete(i)) complete.push_back(i);
    }
    if (complete.empty()) {
        throw EmptyDistributionError("covariance of Samples with no complete entries");
    }
    if (complete.size() < data_.size()) {
        PROGNOSTICS_LOG_WARN("Samples::cov: entries with absent values were skipped");
    }

    const Eigen::Index d = static_cast<Eigen::Index>(keys_.size());
    if (complete.size() == 1) {
        return Eigen::MatrixXd::Zero(d, d);
    }

    Eigen::VectorXd m = Eigen::VectorXd::Zero(d);
    for (size_t i : complete) m += data_[i];
    m /= static_cast<double>(complete.size());

    Eigen::MatrixXd result = Eigen::MatrixXd::Zero(d, d);
    for (size_t i : complete) {
        Eigen::VectorXd diff = data_[i] - m;
        result += diff * diff.transpose();
    }
    return result / static_cast<double>(complete.size() - 1);
}

std::unique_ptr<UncertainData> Samples::shifted(double offset) const {
    auto result = std::make_unique<Samples>(keys_);
    result->data_.reserve(data_.size());
    for (const auto& sample : data_) {
        result->data_.push_back((sample.array() + offset).matrix());
    }
    return result;
}

std::unique_ptr<UncertainData> Samples::clone() const {
    return std::make_unique<Samples>(*this);
}

Samples Samples::do_sample(size_t n, std::mt19937& rng) const {
    if (data_.empty()) {
        throw EmptyDistributionError("cannot sample from an empty distribution");
    }
    std::uniform_int_distribution<size_t> pick(0, data_.size() - 1);
    Samples result(keys_);
    result.data_.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        result.data_.push_back(data_[pick(rng)]);
    }
    return result;
}

NamedValues Samples::do_percentage_in_bounds(const BoundsMap& bounds,
                                             size_t /*n_samples*/,
                                             std::mt19937& /*rng*/) const {
    if (data_.empty()) {
        throw EmptyDistributionError("percentage_in_bounds of empty Samples");
    }
    NamedValues result;
    for (size_t j = 0; j < keys_.size(); ++j) {
        const Bounds& b = bounds.at(keys_[j]);
        size_t inside = 0;
        for (const auto& sample : data_) {
            double v = sample(static_cast<Eigen::Index>(j));
            // Absent values compare false and count as outside
            if (v > b.first && v < b.second) {
                ++inside;
            }
        }
        result[keys_[j]] = static_cast<double>(inside) / static_cast<double>(data_.size());
    }
    return result;
}

// =============================================================================
// MultivariateNormalDist
// =============================================================================

MultivariateNormalDist::MultivariateNormalDist(KeyList keys,
                                               Eigen::VectorXd mean,
                                               Eigen::MatrixXd covariance)
    : UncertainData(std::move(keys)),
      mean_(std::move(mean)),
      covariance_(std::move(covariance)) {
    const Eigen::Index d = static_cast<Eigen::Index>(keys_.size());
    if (mean_.size() != d) {
        throw std::invalid_argument(
            "mean size " + std::to_string(mean_.size()) +
            " does not match key count " + std::to_string(d));
    }
    if (covariance_.rows() != d || covariance_.cols() != d) {
        throw std::invalid_argument(
            "covariance must be " + std::to_string(d) + "x" + std::to_string(d));
    }
}

std::unique_ptr<UncertainData> MultivariateNormalDist::shifted(double offset) const {
    Eigen::VectorXd mean = (mean_.array() + offset).matrix();
    return std::make_unique<MultivariateNormalDist>(keys_, mean, covariance_);
}

std::unique_ptr<UncertainData> MultivariateNormalDist::clone() const {
    return std::make_unique<MultivariateNormalDist>(*this);
}

Samples MultivariateNormalDist::do_sample(size_t n, std::mt19937& rng) const {
    // Keys with non-finite moments (e.g. an unresolved time of event) stay absent
    std::vector<Eigen::Index> finite = finite_indices(mean_, covariance_);
    const Eigen::Index k = static_cast<Eigen::Index>(finite.size());

    Eigen::VectorXd sub_mean(k);
    Eigen::MatrixXd sub_cov(k, k);
    for (Eigen::Index i = 0; i < k; ++i) {
        sub_mean(i) = mean_(finite[i]);
        for (Eigen::Index j = 0; j < k; ++j) {
            sub_cov(i, j) = covariance_(finite[i], finite[j]);
        }
    }
    Eigen::MatrixXd factor = k > 0 ? covariance_factor(sub_cov) : Eigen::MatrixXd();

    std::normal_distribution<double> normal(0.0, 1.0);
    Samples result(keys_);
    for (size_t s = 0; s < n; ++s) {
        Eigen::VectorXd z(k);
        for (Eigen::Index i = 0; i < k; ++i) {
            z(i) = normal(rng);
        }
        Eigen::VectorXd draw = Eigen::VectorXd::Constant(mean_.size(), absent_value());
        if (k > 0) {
            Eigen::VectorXd value = sub_mean + factor * z;
            for (Eigen::Index i = 0; i < k; ++i) {
                draw(finite[i]) = value(i);
            }
        }
        result.push_back(draw);
    }
    return result;
}

// =============================================================================
// Helpers
// =============================================================================

Eigen::VectorXd mean_in_order(const UncertainData& data, const KeyList& keys) {
    std::vector<int> mapping = key_mapping(data.keys(), keys);
    Eigen::VectorXd m = data.mean();
    Eigen::VectorXd result(static_cast<Eigen::Index>(keys.size()));
    for (size_t i = 0; i < mapping.size(); ++i) {
        result(static_cast<Eigen::Index>(i)) = m(mapping[i]);
    }
    return result;
}

Eigen::MatrixXd cov_in_order(const UncertainData& data, const KeyList& keys) {
    std::vector<int> mapping = key_mapping(data.keys(), keys);
    Eigen::MatrixXd c = data.cov();
    const Eigen::Index n = static_cast<Eigen::Index>(keys.size());
    Eigen::MatrixXd result(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            result(i, j) = c(mapping[i], mapping[j]);
        }
    }
    return result;
}

std::string serialize(const UncertainData& data) {
    check_serializable_keys(data.keys());

    std::ostringstream out;
    out << std::hexfloat;
    out << data.type_name() << '\n';
    out << "keys";
    for (const auto& key : data.keys()) {
        out << ' ' << key;
    }
    out << '\n';

    if (const auto* samples = dynamic_cast<const Samples*>(&data)) {
        out << "size " << std::dec << samples->size() << std::hexfloat << '\n';
        for (const auto& sample : *samples) {
            write_values(out, "sample", sample);
        }
    } else if (dynamic_cast<const MultivariateNormalDist*>(&data) != nullptr) {
        write_values(out, "mean", data.mean());
        Eigen::MatrixXd c = data.cov();
        for (Eigen::Index i = 0; i < c.rows(); ++i) {
            write_values(out, "row", c.row(i).transpose());
        }
    } else if (dynamic_cast<const ScalarData*>(&data) != nullptr) {
        write_values(out, "value", data.mean());
    } else {
        throw std::invalid_argument("cannot serialize type " + data.type_name());
    }
    return out.str();
}

std::unique_ptr<UncertainData> deserialize(const std::string& text) {
    std::istringstream in(text);
    std::string type = next_line(in);

    std::vector<std::string> key_tokens = split_tokens(next_line(in));
    if (key_tokens.empty() || key_tokens[0] != "keys") {
        throw std::invalid_argument("expected 'keys' line");
    }
    KeyList keys(key_tokens.begin() + 1, key_tokens.end());
    const size_t d = keys.size();

    if (type == "ScalarData") {
        return std::make_unique<ScalarData>(keys, parse_values(next_line(in), "value", d));
    }
    if (type == "MultivariateNormalDist") {
        Eigen::VectorXd mean = parse_values(next_line(in), "mean", d);
        Eigen::MatrixXd covariance(static_cast<Eigen::Index>(d), static_cast<Eigen::Index>(d));
        for (size_t i = 0; i < d; ++i) {
            covariance.row(static_cast<Eigen::Index>(i)) =
                parse_values(next_line(in), "row", d).transpose();
        }
        return std::make_unique<MultivariateNormalDist>(keys, mean, covariance);
    }
    if (type == "Samples") {
        std::vector<std::string> size_tokens = split_tokens(next_line(in));
        if (size_tokens.size() != 2 || size_tokens[0] != "size") {
            throw std::invalid_argument("expected 'size' line");
        }
        size_t n = 0;
        try {
            n = static_cast<size_t>(std::stoul(size_tokens[1]));
        } catch (const std::exception&) {
            throw std::invalid_argument("invalid sample count '" + size_tokens[1] + "'");
        }
        auto result = std::make_unique<Samples>(keys);
        for (size_t i = 0; i < n; ++i) {
            result->push_back(parse_values(next_line(in), "sample", d));
        }
        return result;
    }
    throw std::invalid_argument("unknown distribution type '" + type + "'");
}

}  // namespace prognostics
