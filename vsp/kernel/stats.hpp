#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/memory.hpp"
#include "vsp/core/grid.hpp"
#include "vsp/core/vectorize.hpp"
#include "vsp/core/sort.hpp"

#include <cmath>
#include <optional>
#include <vector>

// =============================================================================
// FILE: vsp/kernel/stats.hpp
// BRIEF: Descriptive statistics over the valid cells of a grid
// =============================================================================

namespace vsp::kernel::stats {

// =============================================================================
// Result Types
// =============================================================================

struct Summary {
    Size n = 0;
    std::optional<Real> mean;
    std::optional<Real> median;
    std::optional<Real> std_dev;  // population standard deviation
    std::optional<Real> min;
    std::optional<Real> max;
    std::optional<Real> range;
    std::optional<Real> cv;       // std / mean, unavailable when mean == 0
    std::optional<Real> p05;
    std::optional<Real> p25;
    std::optional<Real> p75;
    std::optional<Real> p95;

    [[nodiscard]] bool available() const noexcept { return n > 0; }
};

enum class Heterogeneity : std::int32_t {
    Homogeneous = 0,
    Moderate = 1,
    Heterogeneous = 2,
    VeryHeterogeneous = 3,
    Unknown = 4
};

struct Advanced {
    Summary summary;
    Real variance;
    std::optional<Real> skewness;     // biased (Fisher-Pearson), unavailable for zero variance
    std::optional<Real> kurtosis;     // biased excess kurtosis, unavailable for zero variance
    Real iqr;
    Real mad;                         // median(|x - median|)
    std::optional<Real> cv_percent;   // 100 * std / |mean|
};

struct HeterogeneityResult {
    std::optional<Real> cv_percent;
    std::optional<Real> iqr_normalized;   // (p75 - p25) / median
    Heterogeneity level;
};

struct ZoneStats {
    Index label;
    Size n_cells;       // all cells carrying the label, valid or not
    Summary summary;    // over the valid ones
};

// =============================================================================
// Order Statistics
// =============================================================================

// Linear interpolation between closest ranks (numpy's default). q in [0, 100].
inline Real percentile_sorted(Array<const Real> sorted, Real q) {
    VSP_ASSERT(sorted.len > 0, "percentile_sorted: empty input");
    if (sorted.len == 1) return sorted[0];

    const Real pos = q / Real(100) * static_cast<Real>(sorted.len - 1);
    const auto lo = static_cast<Size>(std::floor(pos));
    if (lo + 1 >= sorted.len) return sorted[sorted.len - 1];

    const Real frac = pos - static_cast<Real>(lo);
    return sorted[lo] + frac * (sorted[lo + 1] - sorted[lo]);
}

inline Real median_sorted(Array<const Real> sorted) {
    return percentile_sorted(sorted, Real(50));
}

// Valid values of the grid, sorted ascending
inline memory::AlignedBuffer<Real> sorted_valid(GridView<const Real> grid) {
    auto values = gather_valid_values(grid);
    vsp::sort::sort(values.array());
    return values;
}

// =============================================================================
// Summary
// =============================================================================

// Summary of an already sorted set of finite values
inline Summary summarize_sorted(Array<const Real> sorted) {
    Summary s;
    s.n = sorted.len;
    if (s.n == 0) return s;

    const Real n = static_cast<Real>(s.n);
    const Real mean = vectorize::sum(sorted) / n;
    const Real sd = std::sqrt(vectorize::sum_squared_dev(sorted, mean) / n);
    const auto [lo, hi] = vectorize::minmax(sorted);

    s.mean = mean;
    s.std_dev = sd;
    s.min = lo;
    s.max = hi;
    s.range = hi - lo;
    if (mean != Real(0)) {
        s.cv = sd / mean;
    }
    s.median = median_sorted(sorted);
    s.p05 = percentile_sorted(sorted, Real(5));
    s.p25 = percentile_sorted(sorted, Real(25));
    s.p75 = percentile_sorted(sorted, Real(75));
    s.p95 = percentile_sorted(sorted, Real(95));
    return s;
}

// Never throws on data: no valid cells yields n == 0 with every field empty
inline Summary describe(GridView<const Real> grid) {
    const auto sorted = sorted_valid(grid);
    return summarize_sorted(sorted.array());
}

// =============================================================================
// Advanced Statistics
// =============================================================================

inline Heterogeneity classify_heterogeneity(std::optional<Real> cv_percent) noexcept {
    if (!cv_percent) return Heterogeneity::Unknown;
    const Real cv = *cv_percent;
    if (cv < Real(analysis::CV_HOMOGENEOUS)) return Heterogeneity::Homogeneous;
    if (cv < Real(analysis::CV_MODERATE)) return Heterogeneity::Moderate;
    if (cv < Real(analysis::CV_HETEROGENEOUS)) return Heterogeneity::Heterogeneous;
    return Heterogeneity::VeryHeterogeneous;
}

inline const char* heterogeneity_name(Heterogeneity h) noexcept {
    switch (h) {
        case Heterogeneity::Homogeneous: return "homogeneous";
        case Heterogeneity::Moderate: return "moderately heterogeneous";
        case Heterogeneity::Heterogeneous: return "heterogeneous";
        case Heterogeneity::VeryHeterogeneous: return "very heterogeneous";
        case Heterogeneity::Unknown: return "unknown";
    }
    VSP_UNREACHABLE();
}

namespace detail {

inline std::optional<Real> cv_percent(const Summary& s) {
    if (!s.mean || *s.mean == Real(0)) return std::nullopt;
    return *s.std_dev / std::abs(*s.mean) * Real(100);
}

} // namespace detail

inline std::optional<Advanced> advanced(GridView<const Real> grid) {
    const auto sorted = sorted_valid(grid);
    const auto values = sorted.array();
    if (values.len == 0) return std::nullopt;

    Advanced a;
    a.summary = summarize_sorted(values);

    const Real n = static_cast<Real>(values.len);
    const Real mean = *a.summary.mean;

    Real m2 = 0, m3 = 0, m4 = 0;
    for (Size i = 0; i < values.len; ++i) {
        const Real d = values[i] - mean;
        const Real d2 = d * d;
        m2 += d2;
        m3 += d2 * d;
        m4 += d2 * d2;
    }
    m2 /= n;
    m3 /= n;
    m4 /= n;

    a.variance = m2;
    if (m2 > Real(0)) {
        a.skewness = m3 / std::pow(m2, Real(1.5));
        a.kurtosis = m4 / (m2 * m2) - Real(3);
    }
    a.iqr = *a.summary.p75 - *a.summary.p25;

    const Real med = *a.summary.median;
    memory::AlignedBuffer<Real> dev(values.len);
    for (Size i = 0; i < values.len; ++i) {
        dev[i] = std::abs(values[i] - med);
    }
    vsp::sort::sort(dev.array());
    a.mad = median_sorted(dev.array());

    a.cv_percent = detail::cv_percent(a.summary);
    return a;
}

inline std::optional<HeterogeneityResult> heterogeneity(GridView<const Real> grid) {
    const auto sorted = sorted_valid(grid);
    if (sorted.size() == 0) return std::nullopt;

    const Summary s = summarize_sorted(sorted.array());

    HeterogeneityResult h;
    h.cv_percent = detail::cv_percent(s);
    if (*s.median != Real(0)) {
        h.iqr_normalized = (*s.p75 - *s.p25) / *s.median;
    }
    h.level = classify_heterogeneity(h.cv_percent);
    return h;
}

// =============================================================================
// Outlier Masks
// =============================================================================

// |x - mean| / std > threshold. Empty mask when std == 0 or no valid cells.
inline MaskGrid outliers_zscore(GridView<const Real> grid,
                                Real threshold = Real(analysis::ZSCORE_OUTLIER_THRESHOLD)) {
    MaskGrid mask(grid.rows, grid.cols, Byte(0));
    const Summary s = describe(grid);
    if (!s.available() || *s.std_dev == Real(0)) return mask;

    const Real mean = *s.mean;
    const Real sd = *s.std_dev;
    const Size n = grid.size();
    for (Size i = 0; i < n; ++i) {
        const Real v = grid.ptr[i];
        if (is_valid(v) && std::abs((v - mean) / sd) > threshold) {
            mask.data()[i] = 1;
        }
    }
    return mask;
}

// Outside [p25 - factor * iqr, p75 + factor * iqr]
inline MaskGrid outliers_iqr(GridView<const Real> grid,
                             Real factor = Real(analysis::IQR_OUTLIER_FACTOR)) {
    MaskGrid mask(grid.rows, grid.cols, Byte(0));
    const auto sorted = sorted_valid(grid);
    if (sorted.size() == 0) return mask;

    const Real q1 = percentile_sorted(sorted.array(), Real(25));
    const Real q3 = percentile_sorted(sorted.array(), Real(75));
    const Real iqr = q3 - q1;
    const Real lower = q1 - factor * iqr;
    const Real upper = q3 + factor * iqr;

    const Size n = grid.size();
    for (Size i = 0; i < n; ++i) {
        const Real v = grid.ptr[i];
        if (is_valid(v) && (v < lower || v > upper)) {
            mask.data()[i] = 1;
        }
    }
    return mask;
}

// =============================================================================
// Zonal Statistics
// =============================================================================

// Summary per positive label. Label 0 (and negatives) mean "no zone". Zones
// are returned in ascending label order; labels that never occur are skipped.
inline std::vector<ZoneStats> zonal_statistics(GridView<const Real> values,
                                               GridView<const Index> labels) {
    VSP_CHECK_DIM(values.rows == labels.rows && values.cols == labels.cols,
                  "zonal_statistics: values and labels must have the same shape");

    const Size n = values.size();
    Index max_label = 0;
    for (Size i = 0; i < n; ++i) {
        if (labels.ptr[i] > max_label) max_label = labels.ptr[i];
    }

    std::vector<ZoneStats> zones;
    if (max_label == 0) return zones;

    const auto n_labels = static_cast<Size>(max_label) + 1;
    std::vector<Size> total(n_labels, 0);
    std::vector<Size> offsets(n_labels + 1, 0);

    for (Size i = 0; i < n; ++i) {
        const Index l = labels.ptr[i];
        if (l <= 0) continue;
        ++total[static_cast<Size>(l)];
        if (is_valid(values.ptr[i])) ++offsets[static_cast<Size>(l) + 1];
    }
    for (Size l = 0; l < n_labels; ++l) {
        offsets[l + 1] += offsets[l];
    }

    // Bucket valid values by label
    memory::AlignedBuffer<Real> bucketed(offsets[n_labels]);
    std::vector<Size> cursor(offsets.begin(), offsets.end() - 1);
    for (Size i = 0; i < n; ++i) {
        const Index l = labels.ptr[i];
        if (l <= 0 || !is_valid(values.ptr[i])) continue;
        bucketed[cursor[static_cast<Size>(l)]++] = values.ptr[i];
    }

    for (Size l = 1; l < n_labels; ++l) {
        if (total[l] == 0) continue;
        auto slice = bucketed.array().subspan(offsets[l], offsets[l + 1] - offsets[l]);
        vsp::sort::sort(slice);
        zones.push_back(ZoneStats{static_cast<Index>(l), total[l],
                                  summarize_sorted(Array<const Real>(slice))});
    }
    return zones;
}

} // namespace vsp::kernel::stats
