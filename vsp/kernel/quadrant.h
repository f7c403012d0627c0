// =============================================================================
// FILE: vsp/kernel/quadrant.h
// BRIEF: API reference for rectangular tiling
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"

namespace vsp::kernel::quadrant {

/* -----------------------------------------------------------------------------
 * FUNCTION: partition
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Splits the grid into n_rows x n_cols tiles with per-tile statistics.
 *
 * PRECONDITIONS:
 *     - n_rows >= 1, n_cols >= 1 (ValueError)
 *
 * POSTCONDITIONS:
 *     - Tile extent is total / parts; the last tile row / column takes the
 *       remainder, so the tiling is exhaustive and disjoint
 *     - Tiles with no valid cell have summary.n == 0 and nothing else
 *     - tiles are row-major, named "i-j"
 * -------------------------------------------------------------------------- */
QuadrantResult partition(GridView<const Real> grid, Index n_rows = 2, Index n_cols = 2);

// Zone id i * n_cols + j + 1 for every cell of tile (i, j)
LabelGrid zone_map(const QuadrantResult& result);

} // namespace vsp::kernel::quadrant
