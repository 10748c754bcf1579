/*
Report tests: significance selection, text sections, JSON round trip.
*/
#include "montecarlo/report.hpp"
#include "montecarlo/mc_runner.hpp"
#include "io/json_reader.hpp"
#include "test_support.hpp"

#include <limits>
#include <sstream>
#include <string>
#include <vector>

using gacha::JsonReader;
using gacha::JsonValue;
using gacha::mc::AggregateSummary;
using gacha::mc::GachaConfig;
using gacha::mc::MCRunner;
using gacha::mc::RunOptions;
using gacha::mc::SignificanceReport;

static AggregateSummary run_batch(const GachaConfig& cfg)
{
    MCRunner runner(cfg, RunOptions{});
    return runner.run().finalize(runner.num_runs());
}

static bool contains(const std::string& text, const std::string& needle)
{
    return text.find(needle) != std::string::npos;
}

static int test_default_selection_covers_nonempty_thresholds()
{
    GachaConfig cfg = gacha_test::uniform_config(5, 10, 3);
    cfg.num_lifetimes = 30;
    AggregateSummary s = run_batch(cfg);

    std::vector<SignificanceReport> tests = gacha::mc::run_significance_tests(cfg, s);
    // 100%, 75%, 50%, 25% for each of 5 items; 0% has boundary 0.
    EXPECT(tests.size() == 20, "every item at every non-empty threshold");
    for (const auto& rep : tests) {
        EXPECT(rep.selection.threshold != "0%", "0% skipped");
        EXPECT(rep.has_result, "30 samples is enough");
        EXPECT(rep.result.sample_count == 30, "one sample per lifetime");
        EXPECT(gacha_test::near(rep.result.baseline, 0.2, 1e-12), "uniform baseline");
    }

    // Full machine: every sample is exactly the baseline share.
    const SignificanceReport& full = tests.front();
    EXPECT(full.selection.threshold == "100%", "thresholds in descending order");
    EXPECT(full.result.degenerate && full.result.p_value == 1.0, "full machine is degenerate");
    return 0;
}

static int test_explicit_selection_and_unknown_names()
{
    GachaConfig cfg = gacha_test::rare_hunter_config();
    cfg.num_lifetimes = 25;
    cfg.significance_tests = {{"25%", "Rare Gold Cat"}, {"33%", "Rare Gold Cat"},
                              {"25%", "Unicorn"}};
    AggregateSummary s = run_batch(cfg);

    std::vector<SignificanceReport> tests = gacha::mc::run_significance_tests(cfg, s);
    EXPECT(tests.size() == 3, "only the configured tests");
    EXPECT(tests[0].has_result, "rare item at 25% tested");
    EXPECT(tests[0].result.sample_count == 25, "one sample per lifetime");
    EXPECT(gacha_test::near(tests[0].result.baseline, 0.2, 1e-12), "initial share baseline");
    EXPECT(!tests[1].has_result && !tests[1].message.empty(), "unknown threshold reported");
    EXPECT(!tests[2].has_result && !tests[2].message.empty(), "unknown item reported");
    return 0;
}

static int test_single_run_is_insufficient()
{
    GachaConfig cfg = gacha_test::uniform_config(3, 4, 2);
    cfg.num_lifetimes = 1;
    AggregateSummary s = run_batch(cfg);

    std::vector<SignificanceReport> tests = gacha::mc::run_significance_tests(cfg, s);
    EXPECT(!tests.empty(), "tests still listed");
    for (const auto& rep : tests) {
        EXPECT(!rep.has_result, "no result from one sample");
        EXPECT(contains(rep.message, "Insufficient data"), "reason recorded");
    }

    std::ostringstream out;
    gacha::mc::write_text_report(s, tests, out);
    EXPECT(contains(out.str(), "Not enough data to perform significance test."),
           "text report says why");
    return 0;
}

static int test_text_report_sections()
{
    GachaConfig cfg = gacha_test::rare_hunter_config();
    cfg.num_lifetimes = 20;
    cfg.significance_tests = {{"25%", "Rare Gold Cat"}};
    AggregateSummary s = run_batch(cfg);
    s.mean_depletion_pull[0] = std::numeric_limits<double>::infinity();
    s.mean_counts[s.threshold_index("25%")] = {1.0, 2.0, 3.0, 9.0, 0.5};
    std::vector<SignificanceReport> tests = gacha::mc::run_significance_tests(cfg, s);

    std::ostringstream out;
    gacha::mc::write_text_report(s, tests, out);
    const std::string text = out.str();

    EXPECT(contains(text, "COMPREHENSIVE GACHAPON ANALYSIS (20 SIMULATIONS)"), "title");
    EXPECT(contains(text, "--- Part 1: Machine State at Depletion Snapshots ---"), "part 1");
    EXPECT(contains(text, "When machine is ~25% FULL"), "25% block");
    EXPECT(contains(text, "--- Part 2: Customer Sessions ---"), "part 2");
    EXPECT(contains(text, "Mean pulls until sold out:"), "depletion block");
    EXPECT(contains(text, "never observed"), "infinite depletion mean");
    EXPECT(contains(text, "--- Part 3: Statistical Significance Analysis ---"), "part 3");
    EXPECT(contains(text, "Hypothesis Test for 'Rare Gold Cat' at '25%' Fullness:"), "test block");
    EXPECT(contains(text, "- Conclusion: Since p"), "conclusion");
    EXPECT(contains(text, "--- END OF REPORT ---"), "footer");

    size_t block = text.find("When machine is ~25% FULL");
    size_t first_item = text.find("    - ", block);
    EXPECT(text.compare(first_item + 6, 15, "Hamster Sticker") == 0, "largest average first");
    size_t next_block = text.find("When machine is ~0% FULL");
    size_t last_item = text.rfind("    - ", next_block);
    EXPECT(text.compare(last_item + 6, 13, "Rare Gold Cat") == 0, "smallest average last");
    return 0;
}

static int test_json_report_round_trip()
{
    GachaConfig cfg = gacha_test::uniform_config(3, 4, 2);
    cfg.num_lifetimes = 10;
    AggregateSummary s = run_batch(cfg);
    s.mean_depletion_pull[1] = std::numeric_limits<double>::infinity();
    std::vector<SignificanceReport> tests = gacha::mc::run_significance_tests(cfg, s);

    std::ostringstream plain;
    gacha::mc::write_results_json(s, tests, 1234, false, plain);
    JsonValue root = JsonReader::parse(plain.str());

    EXPECT(root["config"]["numRuns"].as_int() == 10, "run count");
    EXPECT(root["config"]["baseSeed"].as_int() == 1234, "seed");

    const JsonValue& snaps = root["snapshots"];
    EXPECT(snaps.size() == 5, "one entry per threshold");
    EXPECT(snaps[0]["label"].as_string() == "100%", "first label");
    EXPECT(snaps[0]["boundary"].as_int() == 12, "full boundary");
    EXPECT(gacha_test::near(snaps[0]["items"]["Item0"]["meanCount"].as_number(), 4.0, 1e-12),
           "full-machine mean count");
    EXPECT(!snaps[2]["items"]["Item0"].has("rateSamples"), "samples omitted by default");

    const JsonValue& items = root["items"];
    EXPECT(items.size() == 3, "one entry per item");
    EXPECT(items[1]["meanDepletionPull"].is_null(), "infinite mean written as null");
    EXPECT(items[0]["meanDepletionPull"].is_number(), "finite mean written as number");

    EXPECT(root["significance"].size() == tests.size(), "one entry per test");
    const JsonValue& first = root["significance"][0];
    EXPECT(first["threshold"].as_string() == "100%" && first["error"].is_null(), "test entry");
    EXPECT(first["degenerate"].as_bool(), "full machine degenerate");

    std::ostringstream full;
    gacha::mc::write_results_json(s, tests, 1234, true, full);
    JsonValue with = JsonReader::parse(full.str());
    EXPECT(with["snapshots"][2]["items"]["Item0"]["rateSamples"].size() == 10,
           "one sample per lifetime when requested");
    return 0;
}

int main(void)
{
    RUN_TEST(test_default_selection_covers_nonempty_thresholds);
    RUN_TEST(test_explicit_selection_and_unknown_names);
    RUN_TEST(test_single_run_is_insufficient);
    RUN_TEST(test_text_report_sections);
    RUN_TEST(test_json_report_round_trip);
    std::printf("report_test: OK\n");
    return 0;
}
