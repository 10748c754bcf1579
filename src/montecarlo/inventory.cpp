#include "montecarlo/inventory.hpp"
#include "montecarlo/errors.hpp"
#include <limits>
#include <stdexcept>

namespace gacha::mc {

Inventory::Inventory(std::vector<int> initial_counts)
    : counts_(std::move(initial_counts)) {
    long long total = 0;
    for (int c : counts_) {
        if (c < 0) throw std::invalid_argument("Inventory: negative capsule count");
        total += c;
    }
    if (total > std::numeric_limits<int>::max()) {
        throw std::invalid_argument("Inventory: capsule total does not fit in int");
    }
    total_ = static_cast<int>(total);
}

ItemId Inventory::draw(RandomSource& rng) {
    if (total_ <= 0) throw EmptyInventoryError();

    // Pick one physical capsule, then find the item whose run contains it.
    int unit = static_cast<int>(rng.index_below(static_cast<size_t>(total_)));
    for (size_t i = 0; i < counts_.size(); i++) {
        if (unit < counts_[i]) {
            counts_[i]--;
            total_--;
            return static_cast<ItemId>(i);
        }
        unit -= counts_[i];
    }

    // Unreachable while total_ matches the sum of counts_.
    throw std::logic_error("Inventory: capsule total out of sync with counts");
}

} // namespace gacha::mc
