// =============================================================================
// FILE: vsp/kernel/stats.h
// BRIEF: API reference for descriptive and zonal grid statistics
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"

#include <optional>
#include <vector>

namespace vsp::kernel::stats {

/* -----------------------------------------------------------------------------
 * STRUCT: Summary
 * -----------------------------------------------------------------------------
 * FIELDS:
 *     n        - Number of valid (finite) cells
 *     mean     - Arithmetic mean
 *     median   - 50th percentile
 *     std_dev  - Population standard deviation (ddof = 0)
 *     min, max - Extremes; range = max - min
 *     cv       - std_dev / mean, empty when mean == 0
 *     p05..p95 - Percentiles, linear interpolation between closest ranks
 *
 * Every optional is empty when n == 0.
 * -------------------------------------------------------------------------- */
struct Summary;

/* -----------------------------------------------------------------------------
 * FUNCTION: describe
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Descriptive statistics over the valid cells of a grid.
 *
 * PARAMETERS:
 *     grid [in] Row-major grid, NaN / +-inf mark missing cells
 *
 * POSTCONDITIONS:
 *     - n = number of finite cells
 *     - n == 0 yields a record with every statistic unavailable
 *
 * ALGORITHM:
 *     1. Gather finite values
 *     2. VQSort ascending
 *     3. SIMD sum, squared deviation and minmax; percentiles by rank
 *
 * COMPLEXITY:
 *     Time:  O(n log n)
 *     Space: O(n)
 *
 * THREAD SAFETY:
 *     Safe - no shared state
 * -------------------------------------------------------------------------- */
Summary describe(GridView<const Real> grid);

/* -----------------------------------------------------------------------------
 * FUNCTION: advanced
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Summary plus variance, skewness, excess kurtosis, IQR, MAD and CV%.
 *
 * POSTCONDITIONS:
 *     - Empty optional when the grid has no valid cells
 *     - skewness / kurtosis are the biased moment estimators, unavailable
 *       for zero variance
 *     - mad = median(|x - median|)
 *     - cv_percent = 100 * std / |mean|, unavailable when mean == 0
 * -------------------------------------------------------------------------- */
std::optional<Advanced> advanced(GridView<const Real> grid);

/* -----------------------------------------------------------------------------
 * FUNCTION: heterogeneity
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Classifies spatial heterogeneity by CV%: < 10 homogeneous, < 20
 *     moderate, < 30 heterogeneous, otherwise very heterogeneous. Unknown when
 *     CV is unavailable. iqr_normalized = (p75 - p25) / median.
 * -------------------------------------------------------------------------- */
std::optional<HeterogeneityResult> heterogeneity(GridView<const Real> grid);

/* -----------------------------------------------------------------------------
 * FUNCTION: outliers_zscore / outliers_iqr
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Outlier masks: |z| > threshold (default 2), or outside
 *     [Q1 - factor * IQR, Q3 + factor * IQR] (default factor 1.5).
 *
 * POSTCONDITIONS:
 *     - Missing cells are never flagged
 *     - Zero standard deviation flags nothing
 * -------------------------------------------------------------------------- */
MaskGrid outliers_zscore(GridView<const Real> grid, Real threshold);
MaskGrid outliers_iqr(GridView<const Real> grid, Real factor);

/* -----------------------------------------------------------------------------
 * FUNCTION: zonal_statistics
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Summary of the valid cells of every positive zone label.
 *
 * PARAMETERS:
 *     values [in] Value grid
 *     labels [in] Zone grid of the same shape; 0 and negatives mean no zone
 *
 * PRECONDITIONS:
 *     - Same shape, otherwise DimensionError
 *
 * POSTCONDITIONS:
 *     - One entry per label present, ascending
 *     - n_cells counts every cell of the zone, summary.n only valid ones
 *
 * ALGORITHM:
 *     Counting sort of valid values into label buckets, then one sorted
 *     summary per bucket.
 *
 * COMPLEXITY:
 *     Time:  O(n + sum_z n_z log n_z)
 *     Space: O(n + max_label)
 * -------------------------------------------------------------------------- */
std::vector<ZoneStats> zonal_statistics(GridView<const Real> values,
                                        GridView<const Index> labels);

} // namespace vsp::kernel::stats
