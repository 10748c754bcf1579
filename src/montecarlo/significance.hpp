/**
 * SignificanceAnalyzer — One-sample two-sided Student t-test.
 *
 * Tests whether the mean of per-lifetime rate samples differs from a
 * baseline share. The Student t tail comes from Boost.Math.
 */

#ifndef GACHA_MC_SIGNIFICANCE_HPP
#define GACHA_MC_SIGNIFICANCE_HPP

#include <vector>

namespace gacha::mc {

struct TTestResult {
    double t_statistic = 0.0;
    double p_value = 1.0;
    double observed_mean = 0.0;
    double baseline = 0.0;
    int degrees_of_freedom = 0;
    int sample_count = 0;
    // Zero sample variance: t and p are set by rule, not by the t distribution.
    bool degenerate = false;

    bool rejects_null(double alpha) const { return p_value < alpha; }
};

class SignificanceAnalyzer {
public:
    static constexpr double kAlpha = 0.05;

    /**
     * One-sample t-test of mean(samples) against baseline.
     *
     * All samples identical: t = 0, p = 1 when they equal the baseline,
     * otherwise t = +/-inf, p = 0. Both flagged degenerate.
     *
     * @throws InsufficientDataError if fewer than 2 samples
     */
    static TTestResult test_rate(const std::vector<double>& samples, double baseline);
};

} // namespace gacha::mc

#endif // GACHA_MC_SIGNIFICANCE_HPP
