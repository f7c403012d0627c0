// =============================================================================
// FILE: vsp/kernel/temporal.h
// BRIEF: API reference for temporal change analysis
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"

#include <optional>
#include <vector>

namespace vsp::kernel::temporal {

/* -----------------------------------------------------------------------------
 * FUNCTION: difference
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     diff = b - a with three disjoint change classes.
 *
 * PARAMETERS:
 *     a [in] Earlier grid
 *     b [in] Later grid, same shape (DimensionError otherwise)
 *
 * POSTCONDITIONS:
 *     - Empty optional when no cell is valid in both
 *     - threshold = 0.5 * std(diff)
 *     - increase_strong: diff > threshold, decrease_strong: diff < -threshold,
 *       no_change: |diff| <= threshold; together exactly the valid diff cells
 *     - Percentages relative to the valid diff cells
 * -------------------------------------------------------------------------- */
std::optional<DiffResult> difference(GridView<const Real> a, GridView<const Real> b);

/* -----------------------------------------------------------------------------
 * FUNCTION: velocity
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     (b - a) / days per cell. days == 0 returns zeros of the input shape.
 * -------------------------------------------------------------------------- */
RealGrid velocity(GridView<const Real> a, GridView<const Real> b, Real days);

/* -----------------------------------------------------------------------------
 * FUNCTION: compare_distributions
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Two-sample comparison of the valid values of two grids.
 *
 * POSTCONDITIONS:
 *     - Empty optional unless each grid has >= 2 valid cells
 *     - pct_diff = (mean_b - mean_a) / mean_a * 100, empty when mean_a == 0
 *     - KS: asymptotic Kolmogorov p with lambda = (en + 0.12 + 0.11 / en) * D
 *     - t: pooled variance, n_a + n_b - 2 dof; empty for zero variance
 *     - MWU: U of the first sample, normal approximation with tie and
 *       continuity corrections
 *     - differ = ks_p_value < 0.05
 * -------------------------------------------------------------------------- */
std::optional<Comparison> compare_distributions(GridView<const Real> a, GridView<const Real> b);

/* -----------------------------------------------------------------------------
 * FUNCTION: linear_trend
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Least-squares trend of a value series against day offsets.
 *
 * PARAMETERS:
 *     t [in] Day offsets in time order
 *     y [in] Values, same length (DimensionError otherwise)
 *
 * POSTCONDITIONS:
 *     - Pairs with a non-finite member are dropped
 *     - Empty optional for < 2 points or identical t
 *     - n == 2: p = 0 (1 when values are equal), std_err = 0
 *     - total_change = slope * (t_last - t_first); pct_change relative to
 *       |intercept|, empty when intercept == 0
 *     - direction NoTrend unless p < 0.05
 *
 * NUMERICAL NOTES:
 *     p from the Student t distribution with n - 2 dof through the
 *     regularized incomplete beta function.
 * -------------------------------------------------------------------------- */
std::optional<LinearTrend> linear_trend(Array<const Real> t, Array<const Real> y);

/* -----------------------------------------------------------------------------
 * FUNCTION: mann_kendall
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Mann-Kendall monotonic trend test.
 *
 * POSTCONDITIONS:
 *     - Empty optional for < 3 finite values
 *     - S = sum_{i<j} sign(y_j - y_i)
 *     - var = (n(n-1)(2n+5) - sum t(t-1)(2t+5)) / 18 over tie groups
 *     - z = S / sqrt(var) (0 when var == 0)
 *     - Without ties and n <= 33 (or at most one discordant pair) p is exact:
 *       permutations with <= min(discordant, concordant) inversions, doubled
 *     - Otherwise two-sided normal p
 *     - tau is tau-b against the time index, empty when all values tie
 *
 * COMPLEXITY:
 *     Time:  O(n^2)
 *     Space: O(n)
 * -------------------------------------------------------------------------- */
std::optional<MannKendall> mann_kendall(Array<const Real> y);

/* -----------------------------------------------------------------------------
 * FUNCTION: step_changes
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Change between consecutive observations.
 *
 * POSTCONDITIONS:
 *     - One entry per i >= 1 with t[i] > t[i-1] and both values finite
 *     - rate_per_day = change / days
 *     - pct_change relative to |value_start|, empty when value_start == 0
 * -------------------------------------------------------------------------- */
std::vector<StepChange> step_changes(Array<const Real> t, Array<const Real> y);

/* -----------------------------------------------------------------------------
 * FUNCTION: compare_periods
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Splits a series in two periods and tests the difference of their means.
 *
 * PARAMETERS:
 *     t       [in] Day offsets in time order
 *     y       [in] Values, same length (DimensionError otherwise)
 *     t_split [in] Start of the second period; default t of the middle point
 *
 * POSTCONDITIONS:
 *     - Pairs with a non-finite member are dropped
 *     - Empty optional for < 4 points or < 2 points in either period
 *     - Period std is the sample deviation (n - 1)
 *     - t: pooled variance, empty for zero variance; significant = p < 0.05
 * -------------------------------------------------------------------------- */
std::optional<PeriodComparison> compare_periods(Array<const Real> t, Array<const Real> y,
                                                std::optional<Real> t_split);

/* -----------------------------------------------------------------------------
 * FUNCTION: detect_breakpoint
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Best two-segment linear fit.
 *
 * ALGORITHM:
 *     For each split i in [3, n - 3) fit [0, i) and [i, n) separately and
 *     keep the first split with the largest r2_before + r2_after.
 *
 * POSTCONDITIONS:
 *     - Empty optional for < 6 finite pairs
 *     - change: Deterioration (+ then -), Improvement (- then +), otherwise
 *       Acceleration when |slope_after| > |slope_before|, else Deceleration
 *
 * COMPLEXITY:
 *     Time:  O(n^2)
 * -------------------------------------------------------------------------- */
std::optional<Breakpoint> detect_breakpoint(Array<const Real> t, Array<const Real> y);

} // namespace vsp::kernel::temporal
