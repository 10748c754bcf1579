#include "montecarlo/gacha_config.hpp"
#include "montecarlo/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <set>
#include <sstream>

namespace gacha::mc {

// ── Helpers ──

static double weight_sum(const std::vector<double>& weights) {
    double sum = 0.0;
    for (double w : weights) sum += w;
    return sum;
}

static void check_weight_sum(double sum, const std::string& what) {
    if (std::fabs(sum - 1.0) > GachaConfig::kWeightTolerance) {
        std::ostringstream ss;
        ss << std::setprecision(12) << what << " weights sum to " << sum
           << ", expected 1.0";
        throw ConfigurationError(ss.str());
    }
}

std::string threshold_label(double fraction) {
    std::ostringstream ss;
    ss << std::setprecision(6) << fraction * 100.0 << '%';
    return ss.str();
}

// ══════════════════════════════════════════════════════════════════
//  Validation
// ══════════════════════════════════════════════════════════════════

void GachaConfig::validate() const {
    // ── Items ──
    if (items.empty()) {
        throw ConfigurationError("item list is empty");
    }
    std::set<std::string> seen;
    for (const auto& name : items) {
        if (name.empty()) throw ConfigurationError("item name is empty");
        if (name == kDefaultPatience) {
            throw ConfigurationError("item name '" + name + "' is reserved");
        }
        if (!seen.insert(name).second) {
            throw ConfigurationError("duplicate item '" + name + "'");
        }
    }

    if (capsules_per_item <= 0) {
        throw ConfigurationError("capsules_per_item must be positive, got " +
                                 std::to_string(capsules_per_item));
    }
    for (const auto& [name, count] : capsule_counts) {
        if (!seen.count(name)) {
            throw ConfigurationError("capsule_counts names unknown item '" + name + "'");
        }
        if (count < 0) {
            throw ConfigurationError("capsule count for '" + name +
                                     "' is negative");
        }
    }
    // initial_total() throws if the sum does not fit in an int.
    if (initial_total() <= 0) {
        throw ConfigurationError("machine starts with no capsules");
    }

    // ── Desire ──
    double desire_sum = 0.0;
    for (const auto& [name, w] : item_desire) {
        if (!seen.count(name)) {
            throw ConfigurationError("item_desire names unknown item '" + name + "'");
        }
        if (!(w >= 0.0)) {
            throw ConfigurationError("item_desire weight for '" + name +
                                     "' is negative");
        }
        desire_sum += w;
    }
    check_weight_sum(desire_sum, "item_desire");

    // ── Patience ──
    if (!patience.count(kDefaultPatience)) {
        throw ConfigurationError("patience has no \"Default\" distribution");
    }
    for (const auto& [key, dist] : patience) {
        if (key != kDefaultPatience && !seen.count(key)) {
            throw ConfigurationError("patience names unknown item '" + key + "'");
        }
        if (dist.max_pulls.empty() || dist.max_pulls.size() != dist.weights.size()) {
            throw ConfigurationError("patience distribution '" + key +
                                     "' is empty or malformed");
        }
        for (size_t i = 0; i < dist.max_pulls.size(); i++) {
            if (dist.max_pulls[i] <= 0) {
                throw ConfigurationError("patience distribution '" + key +
                                         "' has a non-positive pull limit");
            }
            if (!(dist.weights[i] >= 0.0)) {
                throw ConfigurationError("patience distribution '" + key +
                                         "' has a negative weight");
            }
        }
        check_weight_sum(weight_sum(dist.weights), "patience '" + key + "'");
    }

    if (num_lifetimes <= 0) {
        throw ConfigurationError("num_lifetimes must be positive, got " +
                                 std::to_string(num_lifetimes));
    }

    // ── Thresholds ──
    if (snapshot_thresholds.empty()) {
        throw ConfigurationError("snapshot_thresholds is empty");
    }
    std::set<std::string> labels;
    for (double f : snapshot_thresholds) {
        if (!(f >= 0.0 && f <= 1.0)) {
            throw ConfigurationError("snapshot threshold " + std::to_string(f) +
                                     " is outside [0, 1]");
        }
        if (!labels.insert(threshold_label(f)).second) {
            throw ConfigurationError("duplicate snapshot threshold " +
                                     threshold_label(f));
        }
    }

    for (const auto& sel : significance_tests) {
        if (!labels.count(sel.threshold)) {
            throw ConfigurationError("significance test names unknown threshold '" +
                                     sel.threshold + "'");
        }
        if (!seen.count(sel.item)) {
            throw ConfigurationError("significance test names unknown item '" +
                                     sel.item + "'");
        }
    }
}

// ══════════════════════════════════════════════════════════════════
//  Derived views
// ══════════════════════════════════════════════════════════════════

ItemId GachaConfig::item_index(const std::string& name) const {
    auto it = std::find(items.begin(), items.end(), name);
    if (it == items.end()) {
        throw ConfigurationError("unknown item '" + name + "'");
    }
    return static_cast<ItemId>(it - items.begin());
}

std::vector<int> GachaConfig::initial_counts() const {
    std::vector<int> counts(items.size(), capsules_per_item);
    for (size_t i = 0; i < items.size(); i++) {
        auto it = capsule_counts.find(items[i]);
        if (it != capsule_counts.end()) counts[i] = it->second;
    }
    return counts;
}

int GachaConfig::initial_total() const {
    long long total = 0;
    for (int c : initial_counts()) total += c;
    if (total > std::numeric_limits<int>::max()) {
        throw ConfigurationError("total capsule count " + std::to_string(total) +
                                 " exceeds " +
                                 std::to_string(std::numeric_limits<int>::max()));
    }
    return static_cast<int>(total);
}

std::vector<SnapshotThreshold> GachaConfig::thresholds() const {
    const int total = initial_total();

    std::vector<SnapshotThreshold> out;
    out.reserve(snapshot_thresholds.size());
    for (double f : snapshot_thresholds) {
        SnapshotThreshold t;
        t.label = threshold_label(f);
        t.fraction = f;
        t.boundary = static_cast<int>(total * f);
        out.push_back(std::move(t));
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const SnapshotThreshold& a, const SnapshotThreshold& b) {
                         return a.fraction > b.fraction;
                     });
    return out;
}

std::vector<double> GachaConfig::desire_weights() const {
    std::vector<double> weights(items.size(), 0.0);
    for (size_t i = 0; i < items.size(); i++) {
        auto it = item_desire.find(items[i]);
        if (it != item_desire.end()) weights[i] = it->second;
    }
    return weights;
}

const PatienceDistribution& GachaConfig::patience_for(ItemId item) const {
    auto it = patience.find(items.at(item));
    if (it != patience.end()) return it->second;

    auto def = patience.find(kDefaultPatience);
    if (def == patience.end()) {
        throw ConfigurationError("patience has no \"Default\" distribution");
    }
    return def->second;
}

double GachaConfig::baseline_rate(ItemId item) const {
    const int total = initial_total();
    if (total <= 0) return 0.0;
    return static_cast<double>(initial_counts().at(item)) / total;
}

std::vector<SignificanceSelection> GachaConfig::resolved_significance_tests() const {
    if (!significance_tests.empty()) return significance_tests;

    std::vector<SignificanceSelection> out;
    for (const auto& t : thresholds()) {
        if (t.boundary <= 0) continue;
        for (const auto& name : items) {
            out.push_back({t.label, name});
        }
    }
    return out;
}

} // namespace gacha::mc
