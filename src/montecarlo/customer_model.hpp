/**
 * CustomerBehaviorModel — What a customer wants and how long they keep pulling.
 *
 * Pure categorical sampling over the validated desire and patience
 * distributions. Holds no per-lifetime state, so one instance can be shared
 * by every lifetime (and every worker thread) of a batch.
 */

#ifndef GACHA_MC_CUSTOMER_MODEL_HPP
#define GACHA_MC_CUSTOMER_MODEL_HPP

#include "gacha_config.hpp"
#include "sim_rng.hpp"
#include <vector>

namespace gacha::mc {

class CustomerBehaviorModel {
public:
    explicit CustomerBehaviorModel(const GachaConfig& config);

    ItemId choose_desired_item(RandomSource& rng) const;

    /** Max pulls for this session, from the item's (or Default) distribution. */
    int choose_patience(ItemId desired_item, RandomSource& rng) const;

    /**
     * Index drawn with probability weights[i]. Zero weights are never
     * chosen; weights are assumed to sum to 1 and are not renormalized.
     */
    static size_t sample_categorical(const std::vector<double>& weights,
                                     RandomSource& rng);

private:
    std::vector<double> desire_;
    std::vector<PatienceDistribution> patience_;   // indexed by ItemId
};

} // namespace gacha::mc

#endif // GACHA_MC_CUSTOMER_MODEL_HPP
