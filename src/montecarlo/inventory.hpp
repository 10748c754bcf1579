/**
 * Inventory — Remaining capsules in one machine.
 *
 * A draw removes one physical capsule chosen uniformly from everything
 * still inside, i.e. item i is drawn with probability count_i / total.
 * Items at zero have zero weight.
 */

#ifndef GACHA_MC_INVENTORY_HPP
#define GACHA_MC_INVENTORY_HPP

#include "gacha_config.hpp"
#include "sim_rng.hpp"
#include <vector>

namespace gacha::mc {

class Inventory {
public:
    /** @throws std::invalid_argument on a negative count or a total above INT_MAX */
    explicit Inventory(std::vector<int> initial_counts);

    /**
     * Remove one capsule and return its item.
     * @throws EmptyInventoryError if nothing remains
     */
    ItemId draw(RandomSource& rng);

    int total_remaining() const { return total_; }
    int remaining(ItemId item) const { return counts_.at(item); }
    bool empty() const { return total_ == 0; }
    size_t item_count() const { return counts_.size(); }

    /** Copy of the per-item counts, indexed by ItemId. */
    std::vector<int> snapshot() const { return counts_; }

private:
    std::vector<int> counts_;
    int total_ = 0;
};

} // namespace gacha::mc

#endif // GACHA_MC_INVENTORY_HPP
