/**
 * ConfigLoader — Parse machine configuration JSON into a validated GachaConfig.
 *
 * Format:
 *   {
 *     "items": ["Cat Keychain", "Rare Gold Cat"],
 *     "capsules_per_item": 50,
 *     "capsule_counts": {"Rare Gold Cat": 10},          (optional)
 *     "item_desire": {"Rare Gold Cat": 1.0},
 *     "patience": {"Default": {"10000000": 1.0}},
 *     "num_lifetimes": 10000,
 *     "snapshot_thresholds": [1.0, 0.75, 0.5, 0.25, 0.0], (optional)
 *     "seed": 42,                                        (optional)
 *     "significance_tests": [{"threshold": "25%", "item": "Rare Gold Cat"}]
 *   }
 */

#ifndef GACHA_MC_CONFIG_LOADER_HPP
#define GACHA_MC_CONFIG_LOADER_HPP

#include "gacha_config.hpp"
#include "io/json_reader.hpp"
#include <string>

namespace gacha::mc {

class ConfigLoader {
public:
    /**
     * Build and validate a config from parsed JSON.
     * @throws ConfigurationError on missing fields, wrong types or any
     *         failed invariant
     */
    static GachaConfig parse(const gacha::JsonValue& root);

    /** Read a JSON file and parse it. */
    static GachaConfig load_file(const std::string& path);

    /** Parse one patience distribution object: {"<max pulls>": weight, ...}. */
    static PatienceDistribution parse_patience(const std::string& key,
                                               const gacha::JsonValue& dist);
};

} // namespace gacha::mc

#endif // GACHA_MC_CONFIG_LOADER_HPP
