#include "montecarlo/lifetime_simulator.hpp"
#include "montecarlo/session_simulator.hpp"
#include <stdexcept>

namespace gacha::mc {

static constexpr int NOT_DEPLETED = -1;

LifetimeSimulator::LifetimeSimulator(const GachaConfig& config)
    : initial_counts_(config.initial_counts()),
      thresholds_(config.thresholds()),
      model_(config) {}

LifetimeResult LifetimeSimulator::run(RandomSource& rng,
                                      const DrawObserver& observer) const {
    Inventory inventory(initial_counts_);

    LifetimeResult result;
    result.snapshots.resize(thresholds_.size());
    result.depletion.assign(initial_counts_.size(), NOT_DEPLETED);
    std::vector<bool> captured(thresholds_.size(), false);
    int pull = 0;

    // Items that start empty are depleted before the first pull.
    for (size_t i = 0; i < initial_counts_.size(); i++) {
        if (initial_counts_[i] == 0) result.depletion[i] = 0;
    }

    auto capture_crossed = [&](const Inventory& inv) {
        const int remaining = inv.total_remaining();
        for (size_t t = 0; t < thresholds_.size(); t++) {
            if (captured[t] || remaining > thresholds_[t].boundary) continue;

            Snapshot& snap = result.snapshots[t];
            snap.label = thresholds_[t].label;
            snap.boundary = thresholds_[t].boundary;
            snap.pull_index = pull;
            snap.total = remaining;
            snap.counts = inv.snapshot();
            captured[t] = true;
        }
    };

    SessionSimulator::DrawCallback on_draw = [&](ItemId drawn, const Inventory& inv) {
        pull++;
        if (inv.remaining(drawn) == 0 && result.depletion[drawn] == NOT_DEPLETED) {
            result.depletion[drawn] = pull;
        }
        capture_crossed(inv);
        if (observer) observer(pull, drawn, inv);
    };

    // Full-machine state (100%) before any draw.
    capture_crossed(inventory);

    while (!inventory.empty()) {
        ItemId desired = model_.choose_desired_item(rng);
        int max_pulls = model_.choose_patience(desired, rng);
        result.outcomes.push_back(
            SessionSimulator::run_session(inventory, desired, max_pulls, rng, on_draw));
    }
    result.total_pulls = pull;

    for (size_t t = 0; t < thresholds_.size(); t++) {
        if (!captured[t]) {
            throw std::logic_error("lifetime ended without snapshot " +
                                   thresholds_[t].label);
        }
    }
    for (int d : result.depletion) {
        if (d == NOT_DEPLETED) {
            throw std::logic_error("lifetime ended with an undepleted item");
        }
    }

    return result;
}

} // namespace gacha::mc
