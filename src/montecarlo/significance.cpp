#include "montecarlo/significance.hpp"
#include "montecarlo/errors.hpp"
#include <boost/math/distributions/students_t.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace gacha::mc {

static constexpr double EQUAL_TOLERANCE = 1e-12;

TTestResult SignificanceAnalyzer::test_rate(const std::vector<double>& samples,
                                            double baseline) {
    const size_t n = samples.size();
    if (n < 2) {
        throw InsufficientDataError("t-test needs at least 2 samples, got " +
                                    std::to_string(n));
    }

    TTestResult r;
    r.baseline = baseline;
    r.sample_count = static_cast<int>(n);
    r.degrees_of_freedom = static_cast<int>(n - 1);

    double sum = 0.0;
    for (double x : samples) sum += x;
    r.observed_mean = sum / static_cast<double>(n);

    // Identical samples: decided by comparison with the baseline, since the
    // computed variance may not come out exactly zero.
    auto [lo, hi] = std::minmax_element(samples.begin(), samples.end());
    if (*lo == *hi) {
        r.degenerate = true;
        r.observed_mean = *lo;
        double diff = *lo - baseline;
        if (std::fabs(diff) <= EQUAL_TOLERANCE * std::max(1.0, std::fabs(baseline))) {
            r.t_statistic = 0.0;
            r.p_value = 1.0;
        } else {
            r.t_statistic = diff > 0 ? std::numeric_limits<double>::infinity()
                                     : -std::numeric_limits<double>::infinity();
            r.p_value = 0.0;
        }
        return r;
    }

    double ss = 0.0;
    for (double x : samples) {
        double d = x - r.observed_mean;
        ss += d * d;
    }
    const double variance = ss / static_cast<double>(n - 1);
    const double std_err = std::sqrt(variance / static_cast<double>(n));

    r.t_statistic = (r.observed_mean - baseline) / std_err;

    boost::math::students_t dist(static_cast<double>(r.degrees_of_freedom));
    r.p_value = 2.0 * boost::math::cdf(boost::math::complement(dist, std::fabs(r.t_statistic)));
    r.p_value = std::min(1.0, r.p_value);
    return r;
}

} // namespace gacha::mc
