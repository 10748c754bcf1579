#include "montecarlo/config_loader.hpp"
#include "montecarlo/errors.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace gacha::mc {

// ── Field helpers: wrap JSON type errors with the field path ──

static const gacha::JsonValue& require(const gacha::JsonValue& obj, const std::string& key) {
    if (!obj.has(key)) throw ConfigurationError("missing field '" + key + "'");
    return obj[key];
}

static int field_int(const gacha::JsonValue& v, const std::string& path) {
    try {
        return v.as_int();
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
}

static double field_number(const gacha::JsonValue& v, const std::string& path) {
    try {
        return v.as_number();
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
}

static const std::string& field_string(const gacha::JsonValue& v, const std::string& path) {
    try {
        return v.as_string();
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(path + ": " + e.what());
    }
}

static void expect_object(const gacha::JsonValue& v, const std::string& path) {
    if (!v.is_object()) {
        throw ConfigurationError(path + ": expected object, got " + v.type_name());
    }
}

static void expect_array(const gacha::JsonValue& v, const std::string& path) {
    if (!v.is_array()) {
        throw ConfigurationError(path + ": expected array, got " + v.type_name());
    }
}

// ══════════════════════════════════════════════════════════════════
//  Public API
// ══════════════════════════════════════════════════════════════════

PatienceDistribution ConfigLoader::parse_patience(const std::string& key,
                                                  const gacha::JsonValue& dist) {
    const std::string path = "patience." + key;
    expect_object(dist, path);

    PatienceDistribution out;
    for (const auto& [pulls_str, weight] : dist.members()) {
        // Plain decimal digits only: no sign, no whitespace.
        bool digits = !pulls_str.empty();
        for (char c : pulls_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) digits = false;
        }
        errno = 0;
        long pulls = digits ? std::strtol(pulls_str.c_str(), nullptr, 10) : 0;
        if (!digits || errno == ERANGE || pulls > INT_MAX) {
            throw ConfigurationError(path + ": pull limit '" + pulls_str +
                                     "' is not a non-negative integer");
        }
        out.max_pulls.push_back(static_cast<int>(pulls));
        out.weights.push_back(field_number(weight, path + "." + pulls_str));
    }
    return out;
}

GachaConfig ConfigLoader::parse(const gacha::JsonValue& root) {
    expect_object(root, "config");
    GachaConfig config;

    // ── Machine contents ──
    const auto& items = require(root, "items");
    expect_array(items, "items");
    for (size_t i = 0; i < items.size(); i++) {
        config.items.push_back(field_string(items[i], "items[" + std::to_string(i) + "]"));
    }

    config.capsules_per_item = field_int(require(root, "capsules_per_item"),
                                         "capsules_per_item");

    if (root.has("capsule_counts")) {
        const auto& counts = root["capsule_counts"];
        expect_object(counts, "capsule_counts");
        for (const auto& [name, count] : counts.members()) {
            config.capsule_counts[name] = field_int(count, "capsule_counts." + name);
        }
    }

    // ── Customer behavior ──
    const auto& desire = require(root, "item_desire");
    expect_object(desire, "item_desire");
    for (const auto& [name, weight] : desire.members()) {
        config.item_desire[name] = field_number(weight, "item_desire." + name);
    }

    const auto& patience = require(root, "patience");
    expect_object(patience, "patience");
    for (const auto& [key, dist] : patience.members()) {
        config.patience[key] = parse_patience(key, dist);
    }

    // ── Run control ──
    config.num_lifetimes = field_int(require(root, "num_lifetimes"), "num_lifetimes");

    if (root.has("snapshot_thresholds")) {
        const auto& thresholds = root["snapshot_thresholds"];
        expect_array(thresholds, "snapshot_thresholds");
        config.snapshot_thresholds.clear();
        for (size_t i = 0; i < thresholds.size(); i++) {
            config.snapshot_thresholds.push_back(field_number(
                thresholds[i], "snapshot_thresholds[" + std::to_string(i) + "]"));
        }
    }

    if (root.has("seed")) {
        config.base_seed = field_int(root["seed"], "seed");
    }

    if (root.has("significance_tests")) {
        const auto& tests = root["significance_tests"];
        expect_array(tests, "significance_tests");
        for (size_t i = 0; i < tests.size(); i++) {
            const std::string path = "significance_tests[" + std::to_string(i) + "]";
            expect_object(tests[i], path);
            SignificanceSelection sel;
            sel.threshold = field_string(require(tests[i], "threshold"), path + ".threshold");
            sel.item = field_string(require(tests[i], "item"), path + ".item");
            config.significance_tests.push_back(std::move(sel));
        }
    }

    config.validate();
    return config;
}

GachaConfig ConfigLoader::load_file(const std::string& path) {
    gacha::JsonValue root;
    try {
        root = gacha::JsonReader::parse_file(path);
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }
    return parse(root);
}

} // namespace gacha::mc
