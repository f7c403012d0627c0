// =============================================================================
// FILE: vsp/kernel/hotspot.h
// BRIEF: API reference for hotspot / coldspot classification
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"

#include <optional>
#include <string_view>

namespace vsp::kernel::hotspot {

/* -----------------------------------------------------------------------------
 * ENUM: Method
 * -----------------------------------------------------------------------------
 * VALUES:
 *     ZScore     - hot: z > t, cold: z < -t (global mean / std)
 *     Percentile - hot: v > P(100 - t), cold: v < P(t), t in [0, 100]
 *     IQR        - hot: v > Q3 + t * IQR, cold: v < Q1 - t * IQR
 * -------------------------------------------------------------------------- */
enum class Method : std::int32_t {
    ZScore = 0,
    Percentile = 1,
    IQR = 2
};

/* -----------------------------------------------------------------------------
 * FUNCTION: parse_method
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     "zscore", "percentile" or "iqr" to Method; anything else is a
 *     ValueError.
 * -------------------------------------------------------------------------- */
Method parse_method(std::string_view name);

/* -----------------------------------------------------------------------------
 * FUNCTION: detect
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Hotspot and coldspot masks with counts, percentages and mean values.
 *
 * PARAMETERS:
 *     grid      [in] Input grid
 *     method    [in] Threshold policy (enum or name)
 *     threshold [in] Policy parameter, finite
 *
 * PRECONDITIONS:
 *     - threshold finite (ValueError); Percentile requires [0, 100] (RangeError)
 *
 * POSTCONDITIONS:
 *     - Empty optional when the grid has no valid cells
 *     - hotspots and coldspots are disjoint and false on missing cells
 *     - ZScore with zero standard deviation flags nothing
 *     - A single valid cell is never flagged
 *     - mean_hotspots / mean_coldspots empty for an empty mask
 *
 * COMPLEXITY:
 *     Time:  O(n log n) (sorting for percentiles)
 *     Space: O(n)
 * -------------------------------------------------------------------------- */
std::optional<HotspotResult> detect(GridView<const Real> grid, Method method, Real threshold);
std::optional<HotspotResult> detect(GridView<const Real> grid, std::string_view method, Real threshold);

} // namespace vsp::kernel::hotspot
