#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/grid.hpp"
#include "vsp/kernel/stats.hpp"

#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// =============================================================================
// FILE: vsp/kernel/hotspot.hpp
// BRIEF: Hotspot / coldspot classification under global threshold policies
// =============================================================================

namespace vsp::kernel::hotspot {

// =============================================================================
// Threshold Policies
// =============================================================================

enum class Method : std::int32_t {
    ZScore = 0,      // |z| against global mean / std
    Percentile = 1,  // above the (100 - t)-th, below the t-th percentile
    IQR = 2          // outside [Q1 - t * IQR, Q3 + t * IQR]
};

inline Method parse_method(std::string_view name) {
    if (name == "zscore") return Method::ZScore;
    if (name == "percentile") return Method::Percentile;
    if (name == "iqr") return Method::IQR;
    throw ValueError("hotspot: unknown method '" + std::string(name) +
                     "' (expected zscore, percentile or iqr)");
}

// =============================================================================
// Result
// =============================================================================

struct HotspotResult {
    MaskGrid hotspots;
    MaskGrid coldspots;
    Size n_hotspots = 0;
    Size n_coldspots = 0;
    Size n_valid = 0;
    Real pct_hotspots = 0;    // percent of valid cells
    Real pct_coldspots = 0;
    std::optional<Real> mean_hotspots;
    std::optional<Real> mean_coldspots;
};

namespace detail {

// Strict bounds: hot where v > upper, cold where v < lower
struct Bounds {
    Real lower;
    Real upper;
    bool flag_any;
};

inline Bounds compute_bounds(Array<const Real> sorted, Method method, Real threshold) {
    switch (method) {
        case Method::ZScore: {
            const auto s = stats::summarize_sorted(sorted);
            const Real sd = *s.std_dev;
            if (sd == Real(0)) {
                return {Real(0), Real(0), false};
            }
            return {*s.mean - threshold * sd, *s.mean + threshold * sd, true};
        }
        case Method::Percentile: {
            return {stats::percentile_sorted(sorted, threshold),
                    stats::percentile_sorted(sorted, Real(100) - threshold), true};
        }
        case Method::IQR: {
            const Real q1 = stats::percentile_sorted(sorted, Real(25));
            const Real q3 = stats::percentile_sorted(sorted, Real(75));
            const Real iqr = q3 - q1;
            return {q1 - threshold * iqr, q3 + threshold * iqr, true};
        }
    }
    VSP_UNREACHABLE();
}

} // namespace detail

// =============================================================================
// Detection
// =============================================================================

// No result when the grid has no valid cells. Missing cells are never
// flagged; the two masks are disjoint.
inline std::optional<HotspotResult> detect(GridView<const Real> grid,
                                           Method method,
                                           Real threshold) {
    VSP_CHECK_ARG(std::isfinite(threshold), "hotspot: threshold must be finite");
    if (method == Method::Percentile) {
        VSP_CHECK_RANGE(threshold, Real(0), Real(100),
                        "hotspot: percentile threshold must lie in [0, 100]");
    }

    const auto sorted = stats::sorted_valid(grid);
    if (sorted.size() == 0) return std::nullopt;

    const auto bounds = detail::compute_bounds(sorted.array(), method, threshold);

    HotspotResult r{MaskGrid(grid.rows, grid.cols, Byte(0)),
                    MaskGrid(grid.rows, grid.cols, Byte(0))};
    r.n_valid = sorted.size();

    if (bounds.flag_any) {
        Real sum_hot = 0;
        Real sum_cold = 0;
        const Size n = grid.size();
        for (Size i = 0; i < n; ++i) {
            const Real v = grid.ptr[i];
            if (!is_valid(v)) continue;
            if (v > bounds.upper) {
                r.hotspots.data()[i] = 1;
                ++r.n_hotspots;
                sum_hot += v;
            } else if (v < bounds.lower) {
                r.coldspots.data()[i] = 1;
                ++r.n_coldspots;
                sum_cold += v;
            }
        }
        if (r.n_hotspots > 0) r.mean_hotspots = sum_hot / static_cast<Real>(r.n_hotspots);
        if (r.n_coldspots > 0) r.mean_coldspots = sum_cold / static_cast<Real>(r.n_coldspots);
    }

    const Real total = static_cast<Real>(r.n_valid);
    r.pct_hotspots = static_cast<Real>(r.n_hotspots) / total * Real(100);
    r.pct_coldspots = static_cast<Real>(r.n_coldspots) / total * Real(100);
    return r;
}

inline std::optional<HotspotResult> detect(GridView<const Real> grid,
                                           std::string_view method,
                                           Real threshold) {
    return detect(grid, parse_method(method), threshold);
}

} // namespace vsp::kernel::hotspot
