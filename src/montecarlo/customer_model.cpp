#include "montecarlo/customer_model.hpp"
#include <stdexcept>

namespace gacha::mc {

CustomerBehaviorModel::CustomerBehaviorModel(const GachaConfig& config)
    : desire_(config.desire_weights()) {
    patience_.reserve(config.item_count());
    for (ItemId i = 0; i < config.item_count(); i++) {
        patience_.push_back(config.patience_for(i));
    }
}

size_t CustomerBehaviorModel::sample_categorical(const std::vector<double>& weights,
                                                 RandomSource& rng) {
    double u = rng.random();
    double acc = 0.0;
    bool found = false;
    size_t last = 0;

    for (size_t i = 0; i < weights.size(); i++) {
        if (weights[i] <= 0.0) continue;
        acc += weights[i];
        last = i;
        found = true;
        if (u < acc) return i;
    }

    // Rounding left u just above the cumulative sum.
    if (!found) throw std::invalid_argument("sample_categorical: no positive weight");
    return last;
}

ItemId CustomerBehaviorModel::choose_desired_item(RandomSource& rng) const {
    return static_cast<ItemId>(sample_categorical(desire_, rng));
}

int CustomerBehaviorModel::choose_patience(ItemId desired_item, RandomSource& rng) const {
    const auto& dist = patience_.at(desired_item);
    return dist.max_pulls[sample_categorical(dist.weights, rng)];
}

} // namespace gacha::mc
