/**
 * MCResults — Per-lifetime result data.
 *
 * Everything one machine lifetime produces. Built by LifetimeSimulator,
 * read by Aggregator, never mutated after it is returned.
 */

#ifndef GACHA_MC_MC_RESULTS_HPP
#define GACHA_MC_MC_RESULTS_HPP

#include "gacha_config.hpp"
#include <string>
#include <vector>

namespace gacha::mc {

struct SessionOutcome {
    ItemId desired_item = 0;
    bool succeeded = false;
    int pulls_taken = 0;
};

struct Snapshot {
    std::string label;          // threshold label, e.g. "25%"
    int boundary = 0;           // threshold in absolute capsules
    int pull_index = 0;         // global pull at capture, 0 = before any draw
    int total = 0;              // capsules remaining at capture
    std::vector<int> counts;    // indexed by ItemId
};

struct LifetimeResult {
    // One per threshold, same order as GachaConfig::thresholds().
    std::vector<Snapshot> snapshots;
    std::vector<SessionOutcome> outcomes;
    // Pull index at which each item first hit zero; 0 for items that start empty.
    std::vector<int> depletion;
    int total_pulls = 0;
};

} // namespace gacha::mc

#endif // GACHA_MC_MC_RESULTS_HPP
