/**
 * MCRunner — Batch Monte Carlo orchestrator.
 *
 * Runs N independent machine lifetimes, lifetime i seeded with
 * base_seed + i, and folds each into an Aggregator. With more than one
 * thread the run range is cut into contiguous chunks, each worker fills its
 * own Aggregator, and the chunks are merged in run order, so the totals are
 * identical to a single-threaded batch with the same seed.
 */

#ifndef GACHA_MC_MC_RUNNER_HPP
#define GACHA_MC_MC_RUNNER_HPP

#include "aggregator.hpp"
#include "gacha_config.hpp"
#include "lifetime_simulator.hpp"
#include <cstdint>
#include <functional>

namespace gacha::mc {

struct RunOptions {
    int num_runs = 0;           // <= 0: use config.num_lifetimes
    int base_seed = 0;
    bool override_seed = false; // false: use config.base_seed
    int threads = 1;
    bool verbose = false;
};

class MCRunner {
public:
    // May be called from worker threads, but never concurrently.
    using ProgressCallback = std::function<void(int completed, int total)>;

    MCRunner(const GachaConfig& config, const RunOptions& options);

    /**
     * Run every lifetime and return the filled aggregator.
     * Exceptions from any lifetime propagate after all workers stop.
     */
    Aggregator run(const ProgressCallback& on_progress = nullptr) const;

    int num_runs() const { return num_runs_; }
    int base_seed() const { return base_seed_; }

    /** Seed used for lifetime run_index. */
    int32_t seed_for(int run_index) const;

private:
    GachaConfig config_;
    RunOptions options_;
    int num_runs_;
    int base_seed_;
    LifetimeSimulator simulator_;

    /** Runs [begin, end) into agg. */
    void run_range(int begin, int end, Aggregator& agg,
                   const std::function<void()>& on_done) const;
};

} // namespace gacha::mc

#endif // GACHA_MC_MC_RUNNER_HPP
