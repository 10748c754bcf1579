/**
 * LifetimeSimulator — One machine from full to empty.
 *
 * Feeds customer sessions into a fresh Inventory until it is empty. All
 * measurements are taken per draw, not per session:
 *
 *   - a global pull counter advances on every draw;
 *   - the first time an item's count hits zero, the counter is recorded as
 *     its depletion point;
 *   - each threshold is snapshotted at the exact draw that first brings the
 *     total to or below its boundary.
 *
 * Session boundaries play no part in any measurement.
 */

#ifndef GACHA_MC_LIFETIME_SIMULATOR_HPP
#define GACHA_MC_LIFETIME_SIMULATOR_HPP

#include "customer_model.hpp"
#include "gacha_config.hpp"
#include "inventory.hpp"
#include "mc_results.hpp"
#include "sim_rng.hpp"
#include <functional>
#include <vector>

namespace gacha::mc {

class LifetimeSimulator {
public:
    using DrawObserver =
        std::function<void(int pull_index, ItemId drawn, const Inventory& inventory)>;

    explicit LifetimeSimulator(const GachaConfig& config);

    /**
     * Run one lifetime. The observer, if given, sees every draw after the
     * lifetime's own bookkeeping for that draw is done.
     * @throws std::logic_error if the finished lifetime misses a snapshot
     *         or depletion point
     */
    LifetimeResult run(RandomSource& rng, const DrawObserver& observer = nullptr) const;

    const std::vector<SnapshotThreshold>& thresholds() const { return thresholds_; }
    const std::vector<int>& initial_counts() const { return initial_counts_; }

private:
    std::vector<int> initial_counts_;
    std::vector<SnapshotThreshold> thresholds_;
    CustomerBehaviorModel model_;
};

} // namespace gacha::mc

#endif // GACHA_MC_LIFETIME_SIMULATOR_HPP
