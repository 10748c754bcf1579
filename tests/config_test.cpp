/*
Configuration loading and validation tests.
*/
#include "montecarlo/config_loader.hpp"
#include "montecarlo/errors.hpp"
#include "io/json_reader.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using gacha::mc::ConfigLoader;
using gacha::mc::ConfigurationError;
using gacha::mc::GachaConfig;

static const char* kValidJson = R"({
  "items": ["Cat", "Dog", "Rare"],
  "capsules_per_item": 20,
  "capsule_counts": {"Rare": 5},
  "item_desire": {"Cat": 0.25, "Dog": 0.25, "Rare": 0.5},
  "patience": {
    "Rare": {"3": 0.5, "10": 0.5},
    "Default": {"1": 1.0}
  },
  "num_lifetimes": 200,
  "snapshot_thresholds": [0.0, 0.5, 1.0, 0.125],
  "seed": 99,
  "significance_tests": [{"threshold": "50%", "item": "Rare"}]
})";

static GachaConfig parse(const std::string& json)
{
    return ConfigLoader::parse(gacha::JsonReader::parse(json));
}

static std::string replace(std::string s, const std::string& from, const std::string& to)
{
    size_t pos = s.find(from);
    if (pos != std::string::npos) s.replace(pos, from.size(), to);
    return s;
}

static int test_valid_config_loads()
{
    GachaConfig cfg = parse(kValidJson);
    EXPECT(cfg.item_count() == 3, "three items");
    EXPECT(cfg.items[2] == "Rare", "item order kept");
    EXPECT(cfg.initial_counts() == std::vector<int>({20, 20, 5}), "override applied");
    EXPECT(cfg.initial_total() == 45, "initial total");
    EXPECT(cfg.num_lifetimes == 200, "lifetimes");
    EXPECT(cfg.base_seed == 99, "seed");
    EXPECT(cfg.patience_for(cfg.item_index("Rare")).max_pulls.size() == 2, "item patience");
    EXPECT(cfg.patience_for(cfg.item_index("Cat")).max_pulls[0] == 1, "default patience");
    EXPECT(gacha_test::near(cfg.baseline_rate(cfg.item_index("Rare")), 5.0 / 45.0, 1e-15),
           "baseline is nominal share");
    return 0;
}

static int test_thresholds_sorted_with_boundaries()
{
    GachaConfig cfg = parse(kValidJson);
    auto th = cfg.thresholds();
    EXPECT(th.size() == 4, "four thresholds");
    EXPECT(th[0].label == "100%" && th[0].boundary == 45, "100% first");
    EXPECT(th[1].label == "50%" && th[1].boundary == 22, "50% floors 22.5");
    EXPECT(th[2].label == "12.5%" && th[2].boundary == 5, "12.5% label and boundary");
    EXPECT(th[3].label == "0%" && th[3].boundary == 0, "0% last");
    return 0;
}

static int test_validation_is_idempotent()
{
    GachaConfig cfg = parse(kValidJson);
    cfg.validate();
    cfg.validate();
    GachaConfig defaults = gacha_test::rare_hunter_config();
    defaults.validate();
    defaults.validate();
    return 0;
}

static int test_defaults_when_optional_fields_absent()
{
    GachaConfig cfg = parse(R"({
      "items": ["A", "B"], "capsules_per_item": 4,
      "item_desire": {"A": 1.0},
      "patience": {"Default": {"2": 1.0}},
      "num_lifetimes": 3
    })");
    EXPECT(cfg.snapshot_thresholds.size() == 5, "default thresholds");
    EXPECT(cfg.base_seed == 42, "default seed");
    EXPECT(cfg.desire_weights()[1] == 0.0, "unlisted item has zero desire");

    auto tests = cfg.resolved_significance_tests();
    // 100%, 75%, 50%, 25% have positive boundaries (8, 6, 4, 2); 0% does not.
    EXPECT(tests.size() == 8, "default significance set");
    return 0;
}

static int test_weights_must_sum_to_one()
{
    std::string bad = replace(kValidJson, "\"Rare\": 0.5}", "\"Rare\": 0.4}");
    EXPECT_THROWS(parse(bad), ConfigurationError, "desire weights sum to 0.9");

    bad = replace(kValidJson, "\"10\": 0.5", "\"10\": 0.6");
    EXPECT_THROWS(parse(bad), ConfigurationError, "patience weights sum to 1.1");

    GachaConfig cfg = parse(kValidJson);
    cfg.item_desire["Cat"] = 0.25 + 1e-12;
    cfg.validate();   // within tolerance
    return 0;
}

static int test_structural_errors()
{
    EXPECT_THROWS(parse(replace(kValidJson, "[\"Cat\", \"Dog\", \"Rare\"]", "[]")),
                  ConfigurationError, "empty item list");
    EXPECT_THROWS(parse(replace(kValidJson, "[\"Cat\", \"Dog\", \"Rare\"]",
                                "[\"Cat\", \"Cat\", \"Rare\"]")),
                  ConfigurationError, "duplicate item");
    EXPECT_THROWS(parse(replace(kValidJson, "\"capsules_per_item\": 20", "\"capsules_per_item\": 0")),
                  ConfigurationError, "zero capsules");
    EXPECT_THROWS(parse(replace(kValidJson, "\"capsules_per_item\": 20", "\"capsules_per_item\": 2.5")),
                  ConfigurationError, "fractional capsules");
    EXPECT_THROWS(parse(replace(kValidJson, "\"Default\"", "\"Fallback\"")),
                  ConfigurationError, "missing Default patience");
    EXPECT_THROWS(parse(replace(kValidJson, "{\"Rare\": 5}", "{\"Rare\": -1}")),
                  ConfigurationError, "negative override");
    EXPECT_THROWS(parse(replace(kValidJson, "\"Dog\": 0.25", "\"Wolf\": 0.25")),
                  ConfigurationError, "desire for unknown item");
    EXPECT_THROWS(parse(replace(kValidJson, "\"num_lifetimes\": 200", "\"num_lifetimes\": 0")),
                  ConfigurationError, "zero lifetimes");
    EXPECT_THROWS(parse(replace(kValidJson, "[0.0, 0.5", "[1.5, 0.5")),
                  ConfigurationError, "threshold above 1");
    EXPECT_THROWS(parse(replace(kValidJson, "[0.0, 0.5", "[0.5, 0.5")),
                  ConfigurationError, "duplicate threshold");
    EXPECT_THROWS(parse(replace(kValidJson, "{\"1\": 1.0}", "{\"one\": 1.0}")),
                  ConfigurationError, "non-integer pull limit");
    EXPECT_THROWS(parse(replace(kValidJson, "{\"1\": 1.0}", "{\"0\": 1.0}")),
                  ConfigurationError, "zero pull limit");
    EXPECT_THROWS(parse(replace(kValidJson, "{\"1\": 1.0}", "{\" 1\": 1.0}")),
                  ConfigurationError, "pull limit with leading space");
    EXPECT_THROWS(parse(replace(kValidJson, "{\"1\": 1.0}", "{\"+1\": 1.0}")),
                  ConfigurationError, "pull limit with explicit sign");
    EXPECT_THROWS(parse(replace(kValidJson, "{\"1\": 1.0}", "{\"-1\": 1.0}")),
                  ConfigurationError, "negative pull limit");
    EXPECT_THROWS(parse(replace(kValidJson, "{\"1\": 1.0}", "{\"99999999999\": 1.0}")),
                  ConfigurationError, "pull limit beyond int");
    EXPECT_THROWS(parse(replace(kValidJson, "\"threshold\": \"50%\"", "\"threshold\": \"60%\"")),
                  ConfigurationError, "significance test on unknown threshold");
    EXPECT_THROWS(parse(replace(kValidJson, "\"capsules_per_item\": 20,", "")),
                  ConfigurationError, "missing required field");
    return 0;
}

static int test_duplicate_keys_rejected()
{
    // Duplicates are reported, never merged.
    std::string dup = replace(kValidJson, "\"Dog\": 0.25,", "\"Dog\": 0.25, \"Dog\": 0.25,");
    EXPECT_THROWS(parse(dup), std::runtime_error, "duplicate item_desire key");

    dup = replace(kValidJson, "\"Default\": {\"1\": 1.0}",
                  "\"Default\": {\"1\": 1.0}, \"Rare\": {\"5\": 1.0}");
    EXPECT_THROWS(parse(dup), std::runtime_error, "duplicate patience key");

    dup = replace(kValidJson, "{\"3\": 0.5, \"10\": 0.5}", "{\"3\": 0.5, \"3\": 0.5}");
    EXPECT_THROWS(parse(dup), std::runtime_error, "duplicate pull limit");
    return 0;
}

static int test_duplicate_keys_rejected_on_load()
{
    const std::string path = "config_test_duplicate.json";
    {
        std::ofstream out(path);
        out << replace(kValidJson, "\"Dog\": 0.25,", "\"Dog\": 0.25, \"Dog\": 0.25,");
    }
    bool threw = false;
    try {
        ConfigLoader::load_file(path);
    } catch (const ConfigurationError& e) {
        threw = std::string(e.what()).find("Duplicate key 'Dog'") != std::string::npos;
    }
    std::remove(path.c_str());
    EXPECT(threw, "duplicate key reported as a configuration error");
    return 0;
}

static int test_all_empty_machine_rejected()
{
    GachaConfig cfg = gacha_test::uniform_config(2, 3, 1);
    cfg.capsule_counts["Item0"] = 0;
    cfg.capsule_counts["Item1"] = 0;
    EXPECT_THROWS(cfg.validate(), ConfigurationError, "no capsules at all");

    cfg.capsule_counts["Item1"] = 1;
    cfg.validate();   // one empty item is allowed
    return 0;
}

static int test_total_capsule_count_must_fit_in_int()
{
    // 3 x 1e9 and 5 x 1e9 both exceed INT_MAX.
    for (int n_items : {3, 5}) {
        GachaConfig cfg = gacha_test::uniform_config(n_items, 1000000000, 1);
        bool threw = false;
        try {
            cfg.validate();
        } catch (const ConfigurationError& e) {
            threw = std::string(e.what()).find("exceeds") != std::string::npos;
        }
        EXPECT(threw, "oversized machine rejected with the overflow message");
        EXPECT_THROWS(cfg.initial_total(), ConfigurationError, "initial_total is checked");
        EXPECT_THROWS(cfg.thresholds(), ConfigurationError, "thresholds use the checked total");
    }

    // 2 x 1e9 fits.
    GachaConfig cfg = gacha_test::uniform_config(2, 1000000000, 1);
    cfg.validate();
    EXPECT(cfg.initial_total() == 2000000000, "largest machine keeps its exact total");
    EXPECT(cfg.thresholds()[3].boundary == 500000000, "25% boundary from the exact total");

    EXPECT_THROWS(parse(replace(kValidJson, "\"capsules_per_item\": 20",
                                "\"capsules_per_item\": 1100000000")),
                  ConfigurationError, "oversized machine rejected on load");
    return 0;
}

static int test_shipped_configs_load()
{
    const std::string dir = std::string(GACHA_SOURCE_DIR) + "/config/";
    GachaConfig def = ConfigLoader::load_file(dir + "default.json");
    EXPECT(def.initial_total() == 250, "default machine holds 250 capsules");
    GachaConfig mixed = ConfigLoader::load_file(dir + "mixed_demand.json");
    EXPECT(mixed.initial_total() == 210, "mixed machine holds 210 capsules");
    EXPECT_THROWS(ConfigLoader::load_file(dir + "does_not_exist.json"),
                  ConfigurationError, "missing file");
    return 0;
}

int main(void)
{
    RUN_TEST(test_valid_config_loads);
    RUN_TEST(test_thresholds_sorted_with_boundaries);
    RUN_TEST(test_validation_is_idempotent);
    RUN_TEST(test_defaults_when_optional_fields_absent);
    RUN_TEST(test_weights_must_sum_to_one);
    RUN_TEST(test_structural_errors);
    RUN_TEST(test_duplicate_keys_rejected);
    RUN_TEST(test_duplicate_keys_rejected_on_load);
    RUN_TEST(test_all_empty_machine_rejected);
    RUN_TEST(test_total_capsule_count_must_fit_in_int);
    RUN_TEST(test_shipped_configs_load);
    std::printf("config_test: OK\n");
    return 0;
}
