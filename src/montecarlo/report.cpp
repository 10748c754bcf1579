#include "montecarlo/report.hpp"
#include "montecarlo/errors.hpp"
#include "io/json_writer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>

namespace gacha::mc {

std::vector<SignificanceReport> run_significance_tests(const GachaConfig& config,
                                                       const AggregateSummary& summary) {
    std::vector<SignificanceReport> out;

    for (const auto& sel : config.resolved_significance_tests()) {
        SignificanceReport rep;
        rep.selection = sel;

        int t = summary.threshold_index(sel.threshold);
        int i = summary.item_index(sel.item);
        if (t < 0 || i < 0) {
            rep.message = "unknown threshold or item";
            out.push_back(std::move(rep));
            continue;
        }

        const double baseline = config.baseline_rate(static_cast<ItemId>(i));
        try {
            rep.result = SignificanceAnalyzer::test_rate(summary.rate_samples[t][i], baseline);
            rep.has_result = true;
        } catch (const InsufficientDataError& e) {
            rep.result.baseline = baseline;
            rep.message = e.what();
        }
        out.push_back(std::move(rep));
    }
    return out;
}

// ══════════════════════════════════════════════════════════════════
//  Text report
// ══════════════════════════════════════════════════════════════════

static std::string percent(double fraction, int precision = 2) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << fraction * 100.0 << '%';
    return ss.str();
}

static void write_snapshots(const AggregateSummary& s, std::ostream& out) {
    out << "\n--- Part 1: Machine State at Depletion Snapshots ---\n";

    for (size_t t = 0; t < s.thresholds.size(); t++) {
        const double total = s.mean_total(t);
        out << "\n  When machine is ~" << s.thresholds[t].label << " FULL (Avg. "
            << std::fixed << std::setprecision(2) << total << " capsules):\n";

        std::vector<size_t> order(s.items.size());
        std::iota(order.begin(), order.end(), 0);
        std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
            return s.mean_counts[t][a] > s.mean_counts[t][b];
        });

        for (size_t i : order) {
            const double avg = s.mean_counts[t][i];
            const double rate = total > 0 ? avg / total : 0.0;
            out << "    - " << std::left << std::setw(18) << s.items[i] << std::right
                << ": " << std::setw(6) << std::fixed << std::setprecision(2) << avg
                << " avg. units | Rate: " << percent(rate) << "\n";
        }
    }
}

static void write_sessions(const AggregateSummary& s, std::ostream& out) {
    out << "\n--- Part 2: Customer Sessions ---\n\n";
    out << "    " << std::left << std::setw(18) << "Desired item" << std::right
        << std::setw(10) << "Sessions" << std::setw(10) << "Success"
        << std::setw(12) << "Avg pulls" << std::setw(12) << "Avg fails" << "\n";

    for (size_t i = 0; i < s.items.size(); i++) {
        const long long sessions = s.successes[i] + s.failures[i];
        if (sessions == 0) continue;
        out << "    " << std::left << std::setw(18) << s.items[i] << std::right
            << std::setw(10) << sessions
            << std::setw(10) << percent(s.success_rate[i], 1)
            << std::setw(12) << std::fixed << std::setprecision(2) << s.mean_success_pulls[i]
            << std::setw(12) << s.mean_failure_pulls[i] << "\n";
    }

    out << "\n  Mean pulls until sold out:\n";
    for (size_t i = 0; i < s.items.size(); i++) {
        out << "    - " << std::left << std::setw(18) << s.items[i] << std::right << ": ";
        if (std::isfinite(s.mean_depletion_pull[i])) {
            out << std::fixed << std::setprecision(2) << s.mean_depletion_pull[i] << "\n";
        } else {
            out << "never observed\n";
        }
    }
}

static void write_significance(const std::vector<SignificanceReport>& tests,
                               std::ostream& out) {
    out << "\n--- Part 3: Statistical Significance Analysis ---\n";

    for (const auto& rep : tests) {
        out << "\n  Hypothesis Test for '" << rep.selection.item << "' at '"
            << rep.selection.threshold << "' Fullness:\n";

        if (!rep.has_result) {
            out << "    Not enough data to perform significance test.\n";
            continue;
        }

        const TTestResult& r = rep.result;
        out << "    - Null Hypothesis (H0): The true average rate is equal to the baseline of "
            << percent(r.baseline) << ".\n"
            << "    - Observed Mean Rate: " << percent(r.observed_mean, 4) << "\n"
            << "    - t-statistic: " << std::setprecision(4) << std::defaultfloat
            << r.t_statistic << " (df=" << r.degrees_of_freedom << ")\n"
            << "    - p-value: " << std::setprecision(4) << r.p_value << "\n";
        if (r.degenerate) {
            out << "    - Note: all samples identical, p-value set without the t distribution.\n";
        }

        const double alpha = SignificanceAnalyzer::kAlpha;
        if (r.rejects_null(alpha)) {
            out << "    - Conclusion: Since p < " << alpha << ", we reject the null hypothesis.\n";
        } else {
            out << "    - Conclusion: Since p >= " << alpha
                << ", we fail to reject the null hypothesis.\n"
                << "      The difference from the baseline is NOT statistically significant.\n";
        }
    }
}

void write_text_report(const AggregateSummary& summary,
                       const std::vector<SignificanceReport>& tests,
                       std::ostream& out) {
    const std::string rule(70, '=');
    out << "\n" << rule << "\n"
        << "    COMPREHENSIVE GACHAPON ANALYSIS (" << summary.run_count << " SIMULATIONS)\n"
        << rule << "\n";

    write_snapshots(summary, out);
    write_sessions(summary, out);
    write_significance(tests, out);

    out << "\n" << rule << "\n--- END OF REPORT ---\n" << rule << "\n";
    out << std::defaultfloat;
}

// ══════════════════════════════════════════════════════════════════
//  JSON report
// ══════════════════════════════════════════════════════════════════

void write_results_json(const AggregateSummary& s,
                        const std::vector<SignificanceReport>& tests,
                        int base_seed, bool include_samples,
                        std::ostream& out) {
    gacha::JsonWriter w(out);

    w.begin_object();

    // ── config ──
    w.key("config").begin_object();
    w.kv("numRuns", s.run_count);
    w.kv("baseSeed", base_seed);
    w.end_object();

    // ── snapshots ──
    w.key("snapshots").begin_array();
    for (size_t t = 0; t < s.thresholds.size(); t++) {
        w.begin_object();
        w.kv("label", s.thresholds[t].label);
        w.kv("fraction", s.thresholds[t].fraction);
        w.kv("boundary", s.thresholds[t].boundary);
        w.kv("meanTotal", s.mean_total(t));

        w.key("items").begin_object();
        for (size_t i = 0; i < s.items.size(); i++) {
            w.key(s.items[i]).begin_object();
            w.kv("meanCount", s.mean_counts[t][i]);
            if (include_samples) w.kv("rateSamples", s.rate_samples[t][i]);
            w.end_object();
        }
        w.end_object();

        w.end_object();
    }
    w.end_array();

    // ── per-item session and depletion stats ──
    w.key("items").begin_array();
    for (size_t i = 0; i < s.items.size(); i++) {
        w.begin_object();
        w.kv("name", s.items[i]);
        w.kv("successes", s.successes[i]);
        w.kv("failures", s.failures[i]);
        w.kv("successRate", s.success_rate[i]);
        w.kv("meanSuccessPulls", s.mean_success_pulls[i]);
        w.kv("meanFailurePulls", s.mean_failure_pulls[i]);
        // null when the item was never observed to sell out
        w.kv("meanDepletionPull", s.mean_depletion_pull[i]);
        w.end_object();
    }
    w.end_array();

    w.kv("successPullHistogram", s.success_pull_histogram);

    // ── significance ──
    w.key("significance").begin_array();
    for (const auto& rep : tests) {
        w.begin_object();
        w.kv("threshold", rep.selection.threshold);
        w.kv("item", rep.selection.item);
        if (rep.has_result) {
            const TTestResult& r = rep.result;
            w.kv("baseline", r.baseline);
            w.kv("observedMean", r.observed_mean);
            w.kv("tStatistic", r.t_statistic);
            w.kv("pValue", r.p_value);
            w.kv("degreesOfFreedom", r.degrees_of_freedom);
            w.kv("samples", r.sample_count);
            w.kv("degenerate", r.degenerate);
            w.kv("rejectsNull", r.rejects_null(SignificanceAnalyzer::kAlpha));
            w.key("error").null_value();
        } else {
            w.kv("error", rep.message);
        }
        w.end_object();
    }
    w.end_array();

    w.end_object();
    out << '\n';
}

} // namespace gacha::mc
