// =============================================================================
// FILE: vsp/kernel/regions.h
// BRIEF: API reference for connected-component labeling
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"

namespace vsp::kernel::regions {

/* -----------------------------------------------------------------------------
 * FUNCTION: label
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Labels the connected components of the true cells of a mask.
 *
 * PARAMETERS:
 *     mask         [in] Boolean grid, nonzero = in mask
 *     connectivity [in] Four (default) or Eight
 *
 * POSTCONDITIONS:
 *     - labels: 0 outside the mask, 1..n_regions inside
 *     - Each positive label is one connected component
 *     - Region sizes sum to the number of true cells
 *     - Centroids are mean (row, col) indices of each component
 *     - An empty mask gives n_regions = 0 and empty size summaries
 *
 * ALGORITHM:
 *     Two-pass union-find:
 *         1. Raster scan; merge with W, N (and NW, NE for Eight)
 *         2. Map roots to dense labels in raster order of first cell,
 *            accumulating sizes and coordinate sums
 *
 * COMPLEXITY:
 *     Time:  O(n * alpha(n))
 *     Space: O(n)
 *
 * THREAD SAFETY:
 *     Safe - no shared state
 * -------------------------------------------------------------------------- */
RegionResult label(GridView<const Byte> mask, Connectivity connectivity = Connectivity::Four);

} // namespace vsp::kernel::regions
