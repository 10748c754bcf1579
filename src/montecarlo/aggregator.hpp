/**
 * Aggregator — Running totals across many independent lifetimes.
 *
 * Shape (items x thresholds) is fixed at construction from the config, so
 * every accumulator is a plain vector. add_result() and merge() only ever
 * add; finalize() divides into a separate AggregateSummary and leaves the
 * totals untouched.
 *
 * Not thread-safe. Parallel batches give each worker its own Aggregator and
 * merge them afterwards.
 */

#ifndef GACHA_MC_AGGREGATOR_HPP
#define GACHA_MC_AGGREGATOR_HPP

#include "gacha_config.hpp"
#include "mc_results.hpp"
#include <string>
#include <vector>

namespace gacha::mc {

struct AggregateSummary {
    int run_count = 0;
    std::vector<std::string> items;
    std::vector<SnapshotThreshold> thresholds;

    std::vector<std::vector<double>> mean_counts;       // [threshold][item]

    std::vector<long long> successes;                   // [item]
    std::vector<long long> failures;
    std::vector<double> success_rate;                   // 0 if item never sought
    std::vector<double> mean_success_pulls;             // 0 if no successes
    std::vector<double> mean_failure_pulls;             // 0 if no failures

    std::vector<double> mean_depletion_pull;            // +inf if never depleted

    // Successful sessions by pull count; index 0 unused.
    std::vector<long long> success_pull_histogram;

    // One share per lifetime, unmodified: [threshold][item][run].
    std::vector<std::vector<std::vector<double>>> rate_samples;

    /** Index of a threshold label, or -1. */
    int threshold_index(const std::string& label) const;

    /** Index of an item name, or -1. */
    int item_index(const std::string& name) const;

    /** Sum of mean counts at a threshold. */
    double mean_total(size_t threshold) const;
};

class Aggregator {
public:
    explicit Aggregator(const GachaConfig& config);

    /**
     * Fold one lifetime into the totals.
     * @throws std::invalid_argument if the result's shape does not match
     */
    void add_result(const LifetimeResult& result);

    /**
     * Add another aggregator's totals. Rate samples are appended after this
     * aggregator's own, so merging chunks in run order reproduces a
     * sequential run.
     */
    void merge(const Aggregator& other);

    /**
     * Per-run means and rates.
     * @throws InsufficientDataError if run_count == 0
     */
    AggregateSummary finalize(int run_count) const;

    int runs_added() const { return runs_added_; }
    size_t item_count() const { return items_.size(); }
    size_t threshold_count() const { return thresholds_.size(); }

    long long snapshot_sum(size_t threshold, ItemId item) const {
        return snapshot_sums_.at(threshold).at(item);
    }
    const std::vector<double>& rate_samples(size_t threshold, ItemId item) const {
        return rate_samples_.at(threshold).at(item);
    }
    long long successes(ItemId item) const { return successes_.at(item); }
    long long failures(ItemId item) const { return failures_.at(item); }
    long long depletion_pull_sum(ItemId item) const { return depletion_sums_.at(item); }
    long long depletion_count(ItemId item) const { return depletion_counts_.at(item); }
    const std::vector<long long>& success_pull_histogram() const { return success_by_pull_; }

    /** Field-by-field equality of every accumulated total. */
    bool operator==(const Aggregator& other) const;
    bool operator!=(const Aggregator& other) const { return !(*this == other); }

private:
    std::vector<std::string> items_;
    std::vector<SnapshotThreshold> thresholds_;
    int runs_added_ = 0;

    std::vector<std::vector<long long>> snapshot_sums_;
    std::vector<std::vector<std::vector<double>>> rate_samples_;

    std::vector<long long> successes_;
    std::vector<long long> failures_;
    std::vector<long long> success_pulls_;
    std::vector<long long> failure_pulls_;
    std::vector<long long> success_by_pull_;

    std::vector<long long> depletion_sums_;
    std::vector<long long> depletion_counts_;
};

} // namespace gacha::mc

#endif // GACHA_MC_AGGREGATOR_HPP
