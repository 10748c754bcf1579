/**
 * GachaConfig — Immutable machine and customer configuration.
 *
 * Built once (normally by ConfigLoader), validated, then passed by const
 * reference into every engine component. Item identifiers are resolved to
 * dense indices (ItemId) so downstream state can be plain vectors sized at
 * construction.
 */

#ifndef GACHA_MC_GACHA_CONFIG_HPP
#define GACHA_MC_GACHA_CONFIG_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace gacha::mc {

using ItemId = std::size_t;

struct PatienceDistribution {
    std::vector<int> max_pulls;     // candidate pull limits
    std::vector<double> weights;    // same length, sums to 1
};

struct SnapshotThreshold {
    std::string label;              // "75%"
    double fraction = 0.0;
    int boundary = 0;               // floor(initial_total * fraction)
};

struct SignificanceSelection {
    std::string threshold;          // threshold label
    std::string item;
};

struct GachaConfig {
    static constexpr const char* kDefaultPatience = "Default";
    static constexpr double kWeightTolerance = 1e-9;

    std::vector<std::string> items;
    int capsules_per_item = 50;
    std::map<std::string, int> capsule_counts;      // per-item overrides, may be 0

    std::map<std::string, double> item_desire;      // missing item = weight 0
    std::map<std::string, PatienceDistribution> patience;

    int num_lifetimes = 10000;
    std::vector<double> snapshot_thresholds{1.0, 0.75, 0.5, 0.25, 0.0};
    int base_seed = 42;

    // Empty = every item at every threshold with a positive boundary.
    std::vector<SignificanceSelection> significance_tests;

    /**
     * Check every invariant. Throws ConfigurationError on the first
     * violation; never modifies the config.
     */
    void validate() const;

    size_t item_count() const { return items.size(); }

    /** Index of an item name. Throws ConfigurationError if unknown. */
    ItemId item_index(const std::string& name) const;

    std::vector<int> initial_counts() const;

    /** Sum of initial_counts(). Throws ConfigurationError above INT_MAX. */
    int initial_total() const;

    /** Thresholds with absolute boundaries, largest fraction first. */
    std::vector<SnapshotThreshold> thresholds() const;

    /** Desire weights indexed by ItemId. */
    std::vector<double> desire_weights() const;

    /** Patience distribution for an item, or the "Default" one. */
    const PatienceDistribution& patience_for(ItemId item) const;

    /** Item's nominal share of the initial inventory. */
    double baseline_rate(ItemId item) const;

    /** Explicit selections, or the default set when none are given. */
    std::vector<SignificanceSelection> resolved_significance_tests() const;
};

/** Percentage label for a threshold fraction: 0.75 -> "75%". */
std::string threshold_label(double fraction);

} // namespace gacha::mc

#endif // GACHA_MC_GACHA_CONFIG_HPP
