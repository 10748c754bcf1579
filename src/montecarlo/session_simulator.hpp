/**
 * SessionSimulator — One customer pulling until they get their item or give up.
 */

#ifndef GACHA_MC_SESSION_SIMULATOR_HPP
#define GACHA_MC_SESSION_SIMULATOR_HPP

#include "inventory.hpp"
#include "mc_results.hpp"
#include "sim_rng.hpp"
#include <functional>

namespace gacha::mc {

class SessionSimulator {
public:
    // Invoked after every draw with the drawn item; the inventory is already
    // decremented.
    using DrawCallback = std::function<void(ItemId drawn, const Inventory& inventory)>;

    /**
     * Draw until the desired item appears, max_pulls draws have been made,
     * or the inventory runs dry. Success iff the last draw matched.
     */
    static SessionOutcome run_session(Inventory& inventory, ItemId desired_item,
                                      int max_pulls, RandomSource& rng,
                                      const DrawCallback& on_draw = nullptr);
};

} // namespace gacha::mc

#endif // GACHA_MC_SESSION_SIMULATOR_HPP
