#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/memory.hpp"
#include "vsp/core/grid.hpp"
#include "vsp/core/sort.hpp"
#include "vsp/core/vectorize.hpp"
#include "vsp/math/stats.hpp"
#include "vsp/math/mwu.hpp"
#include "vsp/kernel/stats.hpp"
#include "vsp/threading/parallel_for.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// =============================================================================
// FILE: vsp/kernel/temporal.hpp
// BRIEF: Change between time-aligned grids and trend tests on value series
// =============================================================================

namespace vsp::kernel::temporal {

namespace config {
    constexpr Size PARALLEL_ROW_THRESHOLD = 64;
}

// =============================================================================
// Result Types
// =============================================================================

struct DiffResult {
    RealGrid diff;              // b - a, NaN unless valid in both
    MaskGrid increase_strong;   // diff > threshold
    MaskGrid decrease_strong;   // diff < -threshold
    MaskGrid no_change;         // |diff| <= threshold
    Real threshold = 0;         // CHANGE_STD_FACTOR * std(diff)
    stats::Summary summary;     // over valid diff cells
    Size n_increase = 0;
    Size n_decrease = 0;
    Size n_no_change = 0;
    Real pct_increase = 0;      // percent of valid diff cells
    Real pct_decrease = 0;
    Real pct_no_change = 0;
};

struct Comparison {
    Size n_a;
    Size n_b;
    Real mean_a;
    Real mean_b;
    Real mean_diff;                     // mean_b - mean_a
    std::optional<Real> pct_diff;       // relative to mean_a
    Real ks_statistic;
    Real ks_p_value;
    std::optional<Real> t_statistic;    // pooled-variance Student t
    std::optional<Real> t_p_value;
    Real mwu_statistic;                 // U of the first sample
    Real mwu_p_value;
    bool differ;                        // ks_p_value < SIGNIFICANCE_LEVEL
};

enum class Direction : std::int32_t {
    NoTrend = 0,
    Increasing = 1,
    Decreasing = 2
};

inline const char* direction_name(Direction d) noexcept {
    switch (d) {
        case Direction::NoTrend: return "none";
        case Direction::Increasing: return "increasing";
        case Direction::Decreasing: return "decreasing";
    }
    VSP_UNREACHABLE();
}

struct LinearTrend {
    Real slope;
    Real intercept;
    Real r_squared;
    Real p_value;
    Real std_err;
    bool significant;
    Direction direction;
    Real total_change;                  // slope * (t_last - t_first)
    std::optional<Real> pct_change;     // total_change relative to |intercept|
    Size n;
    Real span;                          // t_last - t_first
};

struct MannKendall {
    Real s;
    std::optional<Real> tau;            // tau-b against the time index
    Real z_score;
    Real p_value;
    bool exact;                         // p from the exact distribution of S
    bool significant;
    Direction direction;
    Size n;
};

struct StepChange {
    Real t_start;
    Real t_end;
    Real days;
    Real value_start;
    Real value_end;
    Real change;                        // value_end - value_start
    Real rate_per_day;
    std::optional<Real> pct_change;     // relative to |value_start|
};

struct PeriodStats {
    Size n;
    Real mean;
    Real median;
    Real std_dev;                       // sample (n - 1)
    Real min;
    Real max;
    double sum_sq_dev;
};

struct PeriodComparison {
    Real t_split;
    PeriodStats before;                 // t < t_split
    PeriodStats after;                  // t >= t_split
    Real change;                        // after.mean - before.mean
    std::optional<Real> pct_change;     // relative to |before.mean|
    std::optional<Real> t_statistic;    // pooled t, before against after
    std::optional<Real> p_value;
    bool significant;
};

enum class ChangeType : std::int32_t {
    Deterioration = 0,   // rising, then falling
    Improvement = 1,     // falling, then rising
    Acceleration = 2,    // same sign, steeper after
    Deceleration = 3     // same sign, flatter after
};

inline const char* change_type_name(ChangeType c) noexcept {
    switch (c) {
        case ChangeType::Deterioration: return "deterioration";
        case ChangeType::Improvement: return "improvement";
        case ChangeType::Acceleration: return "acceleration";
        case ChangeType::Deceleration: return "deceleration";
    }
    VSP_UNREACHABLE();
}

struct Breakpoint {
    Size index;                         // first point of the second segment
    Real t_break;
    LinearTrend before;
    LinearTrend after;
    Real r_squared_total;
    ChangeType change;
};

// =============================================================================
// Difference Grids
// =============================================================================

namespace detail {

inline void check_same_shape(GridView<const Real> a, GridView<const Real> b, const char* what) {
    VSP_CHECK_DIM(a.rows == b.rows && a.cols == b.cols,
                  std::string(what) + ": grids must have the same shape");
}

inline RealGrid subtract(GridView<const Real> a, GridView<const Real> b) {
    RealGrid diff(a.rows, a.cols);
    auto out = diff.view();
    threading::parallel_for(Size(0), static_cast<Size>(a.rows), [&](size_t r) {
        const auto ra = a.row(static_cast<Index>(r));
        const auto rb = b.row(static_cast<Index>(r));
        auto ro = out.row(static_cast<Index>(r));
        for (Size c = 0; c < ra.len; ++c) {
            ro[c] = (is_valid(ra[c]) && is_valid(rb[c])) ? rb[c] - ra[c] : MISSING;
        }
    }, config::PARALLEL_ROW_THRESHOLD);
    return diff;
}

} // namespace detail

// No result when no cell is valid in both grids
inline std::optional<DiffResult> difference(GridView<const Real> a, GridView<const Real> b) {
    detail::check_same_shape(a, b, "difference");

    DiffResult r{detail::subtract(a, b),
                 MaskGrid(a.rows, a.cols, Byte(0)),
                 MaskGrid(a.rows, a.cols, Byte(0)),
                 MaskGrid(a.rows, a.cols, Byte(0))};

    r.summary = stats::describe(r.diff.cview());
    if (!r.summary.available()) return std::nullopt;

    r.threshold = static_cast<Real>(analysis::CHANGE_STD_FACTOR) * *r.summary.std_dev;

    const Size n = r.diff.size();
    const Real* d = r.diff.data();
    for (Size i = 0; i < n; ++i) {
        const Real v = d[i];
        if (!is_valid(v)) continue;
        if (v > r.threshold) {
            r.increase_strong.data()[i] = 1;
            ++r.n_increase;
        } else if (v < -r.threshold) {
            r.decrease_strong.data()[i] = 1;
            ++r.n_decrease;
        } else {
            r.no_change.data()[i] = 1;
            ++r.n_no_change;
        }
    }

    const auto n_valid = static_cast<Real>(r.summary.n);
    r.pct_increase = static_cast<Real>(r.n_increase) / n_valid * Real(100);
    r.pct_decrease = static_cast<Real>(r.n_decrease) / n_valid * Real(100);
    r.pct_no_change = static_cast<Real>(r.n_no_change) / n_valid * Real(100);
    return r;
}

// (b - a) / days; zero days yields an all-zero grid
inline RealGrid velocity(GridView<const Real> a, GridView<const Real> b, Real days) {
    detail::check_same_shape(a, b, "velocity");
    VSP_CHECK_ARG(std::isfinite(days), "velocity: days must be finite");

    if (days == Real(0)) {
        return RealGrid(a.rows, a.cols, Real(0));
    }

    RealGrid v = detail::subtract(a, b);
    const Real inv = Real(1) / days;
    const Size n = v.size();
    Real* p = v.data();
    for (Size i = 0; i < n; ++i) {
        p[i] *= inv;   // NaN stays NaN
    }
    return v;
}

// =============================================================================
// Distribution Comparison
// =============================================================================

namespace detail {

// sup |F_a - F_b| over the pooled sample
inline double ks_statistic(Array<const Real> a, Array<const Real> b) {
    const auto na = static_cast<double>(a.len);
    const auto nb = static_cast<double>(b.len);
    Size i = 0;
    Size j = 0;
    double d = 0.0;
    while (i < a.len && j < b.len) {
        const Real x = std::min(a[i], b[j]);
        while (i < a.len && a[i] <= x) ++i;
        while (j < b.len && b[j] <= x) ++j;
        d = std::max(d, std::abs(static_cast<double>(i) / na - static_cast<double>(j) / nb));
    }
    return d;
}

// Rank sum of `a` in the pooled sample (average ranks for ties) and the tie
// term sum(t^3 - t)
inline void rank_sum(Array<const Real> a, Array<const Real> b, double& r_a, double& tie_sum) {
    r_a = 0.0;
    tie_sum = 0.0;
    Size i = 0;
    Size j = 0;
    Size rank = 0;   // ranks consumed so far
    while (i < a.len || j < b.len) {
        Real x;
        if (j >= b.len || (i < a.len && a[i] <= b[j])) {
            x = a[i];
        } else {
            x = b[j];
        }
        Size ca = 0;
        Size cb = 0;
        while (i < a.len && a[i] == x) { ++i; ++ca; }
        while (j < b.len && b[j] == x) { ++j; ++cb; }
        const Size t = ca + cb;
        const double avg = static_cast<double>(rank) + (static_cast<double>(t) + 1.0) * 0.5;
        r_a += avg * static_cast<double>(ca);
        const auto td = static_cast<double>(t);
        tie_sum += td * td * td - td;
        rank += t;
    }
}

struct TTest {
    double t;
    double p_value;
};

// Two-sample Student t with pooled variance, t = (mean_a - mean_b) / se.
// No result when the pooled variance is zero.
inline std::optional<TTest> pooled_t_test(double mean_a, double ss_a, double na,
                                          double mean_b, double ss_b, double nb) {
    const double df = na + nb - 2.0;
    const double se = std::sqrt((ss_a + ss_b) / df * (1.0 / na + 1.0 / nb));
    if (!(se > 0.0)) return std::nullopt;
    const double t = (mean_a - mean_b) / se;
    return TTest{t, math::t_two_sided(t, df)};
}

} // namespace detail

// No result unless both grids hold at least 2 valid cells
inline std::optional<Comparison> compare_distributions(GridView<const Real> a, GridView<const Real> b) {
    const auto sa = stats::sorted_valid(a);
    const auto sb = stats::sorted_valid(b);
    if (sa.size() < 2 || sb.size() < 2) return std::nullopt;

    const auto xa = sa.array();
    const auto xb = sb.array();
    const auto na = static_cast<double>(xa.len);
    const auto nb = static_cast<double>(xb.len);

    Comparison c{};
    c.n_a = xa.len;
    c.n_b = xb.len;
    const double mean_a = vectorize::sum(xa) / na;
    const double mean_b = vectorize::sum(xb) / nb;
    c.mean_a = static_cast<Real>(mean_a);
    c.mean_b = static_cast<Real>(mean_b);
    c.mean_diff = static_cast<Real>(mean_b - mean_a);
    if (mean_a != 0.0) {
        c.pct_diff = static_cast<Real>((mean_b - mean_a) / mean_a * 100.0);
    }

    // Kolmogorov-Smirnov, asymptotic
    const double d = detail::ks_statistic(xa, xb);
    const double en = std::sqrt(na * nb / (na + nb));
    c.ks_statistic = static_cast<Real>(d);
    c.ks_p_value = static_cast<Real>(math::kolmogorov_sf((en + 0.12 + 0.11 / en) * d));

    // Student t, pooled variance
    const double ss_a = vectorize::sum_squared_dev(xa, c.mean_a);
    const double ss_b = vectorize::sum_squared_dev(xb, c.mean_b);
    if (const auto tt = detail::pooled_t_test(mean_a, ss_a, na, mean_b, ss_b, nb)) {
        c.t_statistic = static_cast<Real>(tt->t);
        c.t_p_value = static_cast<Real>(tt->p_value);
    }

    // Mann-Whitney U, normal approximation
    double r_a = 0.0;
    double tie_sum = 0.0;
    detail::rank_sum(xa, xb, r_a, tie_sum);
    const double u = r_a - na * (na + 1.0) * 0.5;
    c.mwu_statistic = static_cast<Real>(u);
    c.mwu_p_value = static_cast<Real>(math::mwu::p_value_two_sided(u, na, nb, tie_sum));

    c.differ = c.ks_p_value < analysis::SIGNIFICANCE_LEVEL;
    return c;
}

// =============================================================================
// Trend Tests
// =============================================================================

namespace detail {

inline Direction classify(bool significant, double slope) noexcept {
    if (!significant) return Direction::NoTrend;
    if (slope > 0.0) return Direction::Increasing;
    if (slope < 0.0) return Direction::Decreasing;
    return Direction::NoTrend;
}


// Pairs with both members finite, in input order
struct Series {
    std::vector<double> t;
    std::vector<double> y;

    [[nodiscard]] Size size() const noexcept { return t.size(); }
};

inline Series finite_pairs(Array<const Real> t, Array<const Real> y, const char* what) {
    VSP_CHECK_DIM(t.len == y.len, std::string(what) + ": t and y must have the same length");
    Series s;
    s.t.reserve(t.len);
    s.y.reserve(t.len);
    for (Size i = 0; i < t.len; ++i) {
        if (is_valid(t[i]) && is_valid(y[i])) {
            s.t.push_back(t[i]);
            s.y.push_back(y[i]);
        }
    }
    return s;
}

// Ordinary least squares over n points
inline std::optional<LinearTrend> fit_line(const double* ts, const double* ys, Size n) {
    if (n < 2) return std::nullopt;

    const auto nd = static_cast<double>(n);
    double mt = 0.0;
    double my = 0.0;
    for (Size i = 0; i < n; ++i) {
        mt += ts[i];
        my += ys[i];
    }
    mt /= nd;
    my /= nd;

    double sxx = 0.0;
    double syy = 0.0;
    double sxy = 0.0;
    for (Size i = 0; i < n; ++i) {
        const double dt = ts[i] - mt;
        const double dy = ys[i] - my;
        sxx += dt * dt;
        syy += dy * dy;
        sxy += dt * dy;
    }
    if (sxx == 0.0) return std::nullopt;

    const double slope = sxy / sxx;
    const double intercept = my - slope * mt;
    double r = (syy == 0.0) ? 0.0 : sxy / std::sqrt(sxx * syy);
    r = std::clamp(r, -1.0, 1.0);

    double p = 0.0;
    double std_err = 0.0;
    if (n == 2) {
        p = (ys[0] == ys[1]) ? 1.0 : 0.0;
    } else {
        const double df = nd - 2.0;
        std_err = std::sqrt((1.0 - r * r) * syy / sxx / df);
        const double one_minus = (1.0 - r) * (1.0 + r);
        if (one_minus <= 0.0) {
            p = 0.0;
        } else {
            p = math::t_two_sided(r * std::sqrt(df / one_minus), df);
        }
    }

    const double span = ts[n - 1] - ts[0];

    LinearTrend out{};
    out.slope = static_cast<Real>(slope);
    out.intercept = static_cast<Real>(intercept);
    out.r_squared = static_cast<Real>(r * r);
    out.p_value = static_cast<Real>(p);
    out.std_err = static_cast<Real>(std_err);
    out.significant = p < analysis::SIGNIFICANCE_LEVEL;
    out.direction = classify(out.significant, slope);
    out.span = static_cast<Real>(span);
    out.total_change = static_cast<Real>(slope * span);
    if (intercept != 0.0) {
        out.pct_change = static_cast<Real>(slope * span / std::abs(intercept) * 100.0);
    }
    out.n = n;
    return out;
}

} // namespace detail

// Least-squares fit of y against t (day offsets, in time order). Pairs with a
// non-finite member are skipped. No result for fewer than 2 points or when
// every t is identical.
inline std::optional<LinearTrend> linear_trend(Array<const Real> t, Array<const Real> y) {
    const auto s = detail::finite_pairs(t, y, "linear_trend");
    return detail::fit_line(s.t.data(), s.y.data(), s.size());
}

// Mann-Kendall monotonic trend test over a series in time order. Non-finite
// values are skipped. No result for fewer than 3 points. Without ties the
// p-value is exact up to KENDALL_EXACT_MAX_N points, normal beyond.
inline std::optional<MannKendall> mann_kendall(Array<const Real> y) {
    std::vector<double> v;
    v.reserve(y.len);
    for (Size i = 0; i < y.len; ++i) {
        if (is_valid(y[i])) v.push_back(y[i]);
    }

    const Size n = v.size();
    if (n < 3) return std::nullopt;

    double s = 0.0;
    for (Size i = 0; i + 1 < n; ++i) {
        for (Size j = i + 1; j < n; ++j) {
            if (v[j] > v[i]) s += 1.0;
            else if (v[j] < v[i]) s -= 1.0;
        }
    }

    // Tie groups of the values
    std::vector<double> sorted(v);
    std::sort(sorted.begin(), sorted.end());
    double tie_var = 0.0;
    double tie_pairs = 0.0;
    for (Size i = 0; i < n;) {
        Size k = i;
        while (k < n && sorted[k] == sorted[i]) ++k;
        const auto t = static_cast<double>(k - i);
        tie_var += t * (t - 1.0) * (2.0 * t + 5.0);
        tie_pairs += t * (t - 1.0) * 0.5;
        i = k;
    }

    const auto nd = static_cast<double>(n);
    const double var = (nd * (nd - 1.0) * (2.0 * nd + 5.0) - tie_var) / 18.0;

    MannKendall out{};
    out.s = static_cast<Real>(s);
    out.n = n;

    const double n0 = nd * (nd - 1.0) * 0.5;
    const double tau_den = std::sqrt(n0 * (n0 - tie_pairs));
    if (tau_den > 0.0) {
        out.tau = static_cast<Real>(s / tau_den);
    }

    double z = 0.0;
    double p = 1.0;
    if (var > 0.0) {
        z = s / std::sqrt(var);
        p = math::normal_two_sided(z);
    }

    // Untied short series use the exact null distribution of S
    const auto discordant = static_cast<std::size_t>((n0 - s) * 0.5);
    const std::size_t c = std::min(discordant, static_cast<std::size_t>(n0) - discordant);
    if (tie_pairs == 0.0 && (n <= analysis::KENDALL_EXACT_MAX_N || c <= 1)) {
        p = math::kendall_exact_two_sided(n, c);
        out.exact = true;
    }
    out.z_score = static_cast<Real>(z);
    out.p_value = static_cast<Real>(p);
    out.significant = p < analysis::SIGNIFICANCE_LEVEL;
    out.direction = detail::classify(out.significant, s);
    return out;
}

// =============================================================================
// Series Segmentation
// =============================================================================

// Change between consecutive observations. Steps with a non-finite value or
// a non-positive gap are skipped.
inline std::vector<StepChange> step_changes(Array<const Real> t, Array<const Real> y) {
    VSP_CHECK_DIM(t.len == y.len, "step_changes: t and y must have the same length");
    std::vector<StepChange> steps;
    for (Size i = 1; i < t.len; ++i) {
        const Real days = t[i] - t[i - 1];
        if (!(days > Real(0)) || !is_valid(y[i]) || !is_valid(y[i - 1])) continue;

        StepChange st{};
        st.t_start = t[i - 1];
        st.t_end = t[i];
        st.days = days;
        st.value_start = y[i - 1];
        st.value_end = y[i];
        st.change = y[i] - y[i - 1];
        st.rate_per_day = st.change / days;
        if (y[i - 1] != Real(0)) {
            st.pct_change = st.change / std::abs(y[i - 1]) * Real(100);
        }
        steps.push_back(st);
    }
    return steps;
}

namespace detail {

inline PeriodStats period_stats(std::vector<double> v) {
    PeriodStats ps{};
    ps.n = v.size();
    const auto nd = static_cast<double>(v.size());
    std::sort(v.begin(), v.end());
    double mean = 0.0;
    for (double x : v) mean += x;
    mean /= nd;
    double ss = 0.0;
    for (double x : v) ss += (x - mean) * (x - mean);
    const Size mid = v.size() / 2;
    const double median = (v.size() % 2 == 1) ? v[mid] : 0.5 * (v[mid - 1] + v[mid]);

    ps.mean = static_cast<Real>(mean);
    ps.median = static_cast<Real>(median);
    ps.std_dev = static_cast<Real>(std::sqrt(ss / (nd - 1.0)));
    ps.min = static_cast<Real>(v.front());
    ps.max = static_cast<Real>(v.back());
    ps.sum_sq_dev = ss;
    return ps;
}

} // namespace detail

// Splits the series at t_split (t < t_split before, t >= t_split after) and
// tests the difference of the period means. Without t_split the time of the
// middle point is used. No result for fewer than 4 points or fewer than 2 on
// either side.
inline std::optional<PeriodComparison> compare_periods(Array<const Real> t, Array<const Real> y,
                                                       std::optional<Real> t_split = std::nullopt) {
    const auto s = detail::finite_pairs(t, y, "compare_periods");
    const Size n = s.size();
    if (n < 4) return std::nullopt;
    VSP_CHECK_ARG(!t_split || std::isfinite(*t_split), "compare_periods: split time must be finite");

    const double cut = t_split ? static_cast<double>(*t_split) : s.t[n / 2];
    std::vector<double> before;
    std::vector<double> after;
    for (Size i = 0; i < n; ++i) {
        (s.t[i] < cut ? before : after).push_back(s.y[i]);
    }
    if (before.size() < 2 || after.size() < 2) return std::nullopt;

    PeriodComparison c{};
    c.t_split = static_cast<Real>(cut);
    c.before = detail::period_stats(std::move(before));
    c.after = detail::period_stats(std::move(after));

    const double m1 = c.before.mean;
    const double m2 = c.after.mean;
    c.change = static_cast<Real>(m2 - m1);
    if (m1 != 0.0) {
        c.pct_change = static_cast<Real>((m2 - m1) / std::abs(m1) * 100.0);
    }

    if (const auto tt = detail::pooled_t_test(m1, c.before.sum_sq_dev, static_cast<double>(c.before.n),
                                              m2, c.after.sum_sq_dev, static_cast<double>(c.after.n))) {
        c.t_statistic = static_cast<Real>(tt->t);
        c.p_value = static_cast<Real>(tt->p_value);
        c.significant = tt->p_value < analysis::SIGNIFICANCE_LEVEL;
    }
    return c;
}

// Split that maximises the summed r^2 of separate line fits on each side.
// Candidate splits keep at least BREAKPOINT_MARGIN points on either side; the
// earliest split wins ties. No result for fewer than BREAKPOINT_MIN_POINTS
// points or when no split admits two fits.
inline std::optional<Breakpoint> detect_breakpoint(Array<const Real> t, Array<const Real> y) {
    const auto s = detail::finite_pairs(t, y, "detect_breakpoint");
    const Size n = s.size();
    if (n < analysis::BREAKPOINT_MIN_POINTS) return std::nullopt;

    std::optional<Breakpoint> best;
    for (Size i = analysis::BREAKPOINT_MARGIN; i + analysis::BREAKPOINT_MARGIN < n; ++i) {
        const auto first = detail::fit_line(s.t.data(), s.y.data(), i);
        const auto second = detail::fit_line(s.t.data() + i, s.y.data() + i, n - i);
        if (!first || !second) continue;

        const Real total = first->r_squared + second->r_squared;
        if (best && !(total > best->r_squared_total)) continue;

        best = Breakpoint{i, static_cast<Real>(s.t[i]), *first, *second, total, ChangeType::Deceleration};
    }
    if (!best) return std::nullopt;

    const Real s1 = best->before.slope;
    const Real s2 = best->after.slope;
    if (s1 > 0 && s2 < 0) {
        best->change = ChangeType::Deterioration;
    } else if (s1 < 0 && s2 > 0) {
        best->change = ChangeType::Improvement;
    } else if (std::abs(s2) > std::abs(s1)) {
        best->change = ChangeType::Acceleration;
    } else {
        best->change = ChangeType::Deceleration;
    }
    return best;
}

} // namespace vsp::kernel::temporal
