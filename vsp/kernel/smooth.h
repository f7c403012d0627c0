// =============================================================================
// FILE: vsp/kernel/smooth.h
// BRIEF: API reference for NaN-aware Gaussian smoothing
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"

namespace vsp::kernel::smooth {

namespace config {
    constexpr Size PARALLEL_ROW_THRESHOLD = 32;
}

/* -----------------------------------------------------------------------------
 * FUNCTION: gaussian_filter
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Separable Gaussian smoothing that leaves missing cells missing.
 *
 * PARAMETERS:
 *     grid  [in] Input grid
 *     sigma [in] Standard deviation in cells, > 0
 *
 * PRECONDITIONS:
 *     - sigma finite and positive, otherwise ValueError
 *
 * POSTCONDITIONS:
 *     - Same shape as input; missing cells of the input are NaN
 *     - A grid without valid cells is returned unchanged (a warning is logged)
 *
 * ALGORITHM:
 *     1. Fill missing cells with the median of the valid ones
 *     2. Row pass then column pass, radius = int(4 * sigma + 0.5),
 *        half-sample symmetric boundary
 *     3. Restore NaN at the originally missing cells
 *
 * COMPLEXITY:
 *     Time:  O(rows * cols * radius)
 *     Space: O(rows * cols)
 *
 * THREAD SAFETY:
 *     Safe - rows processed in parallel, each writes its own row
 * -------------------------------------------------------------------------- */
RealGrid gaussian_filter(GridView<const Real> grid, Real sigma);

// Truncation radius used by gaussian_filter
Index kernel_radius(Real sigma) noexcept;

} // namespace vsp::kernel::smooth
