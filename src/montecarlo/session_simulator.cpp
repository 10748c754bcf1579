#include "montecarlo/session_simulator.hpp"

namespace gacha::mc {

SessionOutcome SessionSimulator::run_session(Inventory& inventory, ItemId desired_item,
                                             int max_pulls, RandomSource& rng,
                                             const DrawCallback& on_draw) {
    SessionOutcome outcome;
    outcome.desired_item = desired_item;

    while (outcome.pulls_taken < max_pulls && !inventory.empty()) {
        ItemId drawn = inventory.draw(rng);
        outcome.pulls_taken++;

        if (on_draw) on_draw(drawn, inventory);

        if (drawn == desired_item) {
            outcome.succeeded = true;
            break;
        }
    }

    return outcome;
}

} // namespace gacha::mc
