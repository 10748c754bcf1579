/**
 * Report — Text and JSON rendering of a finalized batch.
 *
 * The engine performs no I/O; everything printed or serialized goes
 * through here.
 */

#ifndef GACHA_MC_REPORT_HPP
#define GACHA_MC_REPORT_HPP

#include "aggregator.hpp"
#include "gacha_config.hpp"
#include "significance.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace gacha::mc {

struct SignificanceReport {
    SignificanceSelection selection;
    bool has_result = false;    // false: not enough data, see message
    TTestResult result;
    std::string message;
};

/**
 * Run the configured (threshold, item) t-tests against each item's
 * baseline share. Insufficient data is recorded, not thrown.
 */
std::vector<SignificanceReport> run_significance_tests(const GachaConfig& config,
                                                       const AggregateSummary& summary);

/** Human-readable report. */
void write_text_report(const AggregateSummary& summary,
                       const std::vector<SignificanceReport>& tests,
                       std::ostream& out);

/**
 * JSON report:
 * { "config": {...}, "snapshots": [...], "items": [...],
 *   "successPullHistogram": [...], "significance": [...] }
 * Raw rate samples are included only when include_samples is set.
 */
void write_results_json(const AggregateSummary& summary,
                        const std::vector<SignificanceReport>& tests,
                        int base_seed, bool include_samples,
                        std::ostream& out);

} // namespace gacha::mc

#endif // GACHA_MC_REPORT_HPP
