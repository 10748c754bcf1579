#include "montecarlo/aggregator.hpp"
#include "montecarlo/errors.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace gacha::mc {

// ── AggregateSummary lookups ──

int AggregateSummary::threshold_index(const std::string& label) const {
    for (size_t t = 0; t < thresholds.size(); t++) {
        if (thresholds[t].label == label) return static_cast<int>(t);
    }
    return -1;
}

int AggregateSummary::item_index(const std::string& name) const {
    auto it = std::find(items.begin(), items.end(), name);
    return it == items.end() ? -1 : static_cast<int>(it - items.begin());
}

double AggregateSummary::mean_total(size_t threshold) const {
    double total = 0.0;
    for (double c : mean_counts.at(threshold)) total += c;
    return total;
}

// ══════════════════════════════════════════════════════════════════
//  Aggregator
// ══════════════════════════════════════════════════════════════════

Aggregator::Aggregator(const GachaConfig& config)
    : items_(config.items),
      thresholds_(config.thresholds()) {
    const size_t n_items = items_.size();
    const size_t n_thresholds = thresholds_.size();

    snapshot_sums_.assign(n_thresholds, std::vector<long long>(n_items, 0));
    rate_samples_.assign(n_thresholds, std::vector<std::vector<double>>(n_items));

    successes_.assign(n_items, 0);
    failures_.assign(n_items, 0);
    success_pulls_.assign(n_items, 0);
    failure_pulls_.assign(n_items, 0);

    depletion_sums_.assign(n_items, 0);
    depletion_counts_.assign(n_items, 0);
}

void Aggregator::add_result(const LifetimeResult& result) {
    const size_t n_items = items_.size();
    if (result.snapshots.size() != thresholds_.size() ||
        result.depletion.size() != n_items) {
        throw std::invalid_argument("Aggregator: lifetime result shape mismatch");
    }
    for (const auto& snap : result.snapshots) {
        if (snap.counts.size() != n_items) {
            throw std::invalid_argument("Aggregator: snapshot " + snap.label +
                                        " has wrong item count");
        }
    }
    for (const auto& outcome : result.outcomes) {
        if (outcome.desired_item >= n_items) {
            throw std::invalid_argument("Aggregator: outcome names unknown item");
        }
    }

    runs_added_++;

    // ── Snapshots ──
    for (size_t t = 0; t < thresholds_.size(); t++) {
        const Snapshot& snap = result.snapshots[t];
        long long total = 0;
        for (int c : snap.counts) total += c;

        for (size_t i = 0; i < n_items; i++) {
            snapshot_sums_[t][i] += snap.counts[i];
            double rate = total > 0 ? static_cast<double>(snap.counts[i]) / total : 0.0;
            rate_samples_[t][i].push_back(rate);
        }
    }

    // ── Session outcomes ──
    for (const auto& outcome : result.outcomes) {
        const ItemId item = outcome.desired_item;
        if (outcome.succeeded) {
            successes_[item]++;
            success_pulls_[item] += outcome.pulls_taken;

            const size_t pos = static_cast<size_t>(outcome.pulls_taken);
            if (success_by_pull_.size() <= pos) success_by_pull_.resize(pos + 1, 0);
            success_by_pull_[pos]++;
        } else {
            failures_[item]++;
            failure_pulls_[item] += outcome.pulls_taken;
        }
    }

    // ── Depletion points ──
    for (size_t i = 0; i < n_items; i++) {
        if (result.depletion[i] < 0) continue;
        depletion_sums_[i] += result.depletion[i];
        depletion_counts_[i]++;
    }
}

void Aggregator::merge(const Aggregator& other) {
    if (other.items_.size() != items_.size() ||
        other.thresholds_.size() != thresholds_.size()) {
        throw std::invalid_argument("Aggregator: cannot merge different shapes");
    }

    runs_added_ += other.runs_added_;

    for (size_t t = 0; t < thresholds_.size(); t++) {
        for (size_t i = 0; i < items_.size(); i++) {
            snapshot_sums_[t][i] += other.snapshot_sums_[t][i];
            auto& dst = rate_samples_[t][i];
            const auto& src = other.rate_samples_[t][i];
            dst.insert(dst.end(), src.begin(), src.end());
        }
    }

    for (size_t i = 0; i < items_.size(); i++) {
        successes_[i] += other.successes_[i];
        failures_[i] += other.failures_[i];
        success_pulls_[i] += other.success_pulls_[i];
        failure_pulls_[i] += other.failure_pulls_[i];
        depletion_sums_[i] += other.depletion_sums_[i];
        depletion_counts_[i] += other.depletion_counts_[i];
    }

    if (success_by_pull_.size() < other.success_by_pull_.size()) {
        success_by_pull_.resize(other.success_by_pull_.size(), 0);
    }
    for (size_t p = 0; p < other.success_by_pull_.size(); p++) {
        success_by_pull_[p] += other.success_by_pull_[p];
    }
}

static double safe_mean(long long sum, long long count) {
    return count > 0 ? static_cast<double>(sum) / static_cast<double>(count) : 0.0;
}

AggregateSummary Aggregator::finalize(int run_count) const {
    if (run_count <= 0) {
        throw InsufficientDataError("cannot finalize " + std::to_string(run_count) +
                                    " runs");
    }

    const size_t n_items = items_.size();
    AggregateSummary s;
    s.run_count = run_count;
    s.items = items_;
    s.thresholds = thresholds_;

    s.mean_counts.assign(thresholds_.size(), std::vector<double>(n_items, 0.0));
    for (size_t t = 0; t < thresholds_.size(); t++) {
        for (size_t i = 0; i < n_items; i++) {
            s.mean_counts[t][i] = static_cast<double>(snapshot_sums_[t][i]) / run_count;
        }
    }

    s.successes = successes_;
    s.failures = failures_;
    s.success_rate.resize(n_items);
    s.mean_success_pulls.resize(n_items);
    s.mean_failure_pulls.resize(n_items);
    s.mean_depletion_pull.resize(n_items);

    for (size_t i = 0; i < n_items; i++) {
        s.success_rate[i] = safe_mean(successes_[i], successes_[i] + failures_[i]);
        s.mean_success_pulls[i] = safe_mean(success_pulls_[i], successes_[i]);
        s.mean_failure_pulls[i] = safe_mean(failure_pulls_[i], failures_[i]);
        s.mean_depletion_pull[i] = depletion_counts_[i] > 0
            ? static_cast<double>(depletion_sums_[i]) / depletion_counts_[i]
            : std::numeric_limits<double>::infinity();
    }

    s.success_pull_histogram = success_by_pull_;
    s.rate_samples = rate_samples_;
    return s;
}

bool Aggregator::operator==(const Aggregator& other) const {
    // Trailing zero buckets in the histogram carry no information.
    auto trimmed = [](std::vector<long long> h) {
        while (!h.empty() && h.back() == 0) h.pop_back();
        return h;
    };

    return items_ == other.items_
        && runs_added_ == other.runs_added_
        && snapshot_sums_ == other.snapshot_sums_
        && rate_samples_ == other.rate_samples_
        && successes_ == other.successes_
        && failures_ == other.failures_
        && success_pulls_ == other.success_pulls_
        && failure_pulls_ == other.failure_pulls_
        && trimmed(success_by_pull_) == trimmed(other.success_by_pull_)
        && depletion_sums_ == other.depletion_sums_
        && depletion_counts_ == other.depletion_counts_;
}

} // namespace gacha::mc
