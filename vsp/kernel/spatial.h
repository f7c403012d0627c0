// =============================================================================
// FILE: vsp/kernel/spatial.h
// BRIEF: API reference for global spatial autocorrelation
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"

#include <optional>
#include <string_view>

namespace vsp::kernel::spatial {

namespace config {
    constexpr Size PARALLEL_ROW_THRESHOLD = 16;
}

/* -----------------------------------------------------------------------------
 * ENUM: Neighborhood
 * -----------------------------------------------------------------------------
 * VALUES:
 *     Queen - 8 neighbours, diagonals included
 *     Rook  - 4 orthogonal neighbours
 * -------------------------------------------------------------------------- */
enum class Neighborhood : std::int32_t {
    Queen = 0,
    Rook = 1
};

/* -----------------------------------------------------------------------------
 * ENUM: Autocorrelation
 * -----------------------------------------------------------------------------
 * VALUES:
 *     Random    - p >= 0.05
 *     Clustered - p < 0.05 and I > E[I]
 *     Dispersed - p < 0.05 and I < E[I]
 * -------------------------------------------------------------------------- */
enum class Autocorrelation : std::int32_t {
    Random = 0,
    Clustered = 1,
    Dispersed = 2
};

/* -----------------------------------------------------------------------------
 * FUNCTION: moran
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Global Moran's I with binary contiguity weights over the grid.
 *
 * PARAMETERS:
 *     grid         [in] Input grid
 *     neighborhood [in] Queen (default) or Rook, or its name
 *
 * POSTCONDITIONS:
 *     - Empty optional when W == 0 (no valid neighbour pair) or the
 *       denominator is 0 (constant surface)
 *     - n_pairs counts ordered pairs: each adjacency contributes twice
 *     - expected_i = -1 / (N - 1)
 *
 * ALGORITHM:
 *     1. d = value - mean over valid cells
 *     2. For every valid cell: den += d^2; for every in-bounds valid
 *        neighbour from the 3x3 offset table: num += d * d', W += 1
 *     3. I = (N / W) * (num / den)
 *     4. z = (I - E[I]) / sqrt(1 / (N - 1)), p = 2 * (1 - Phi(|z|))
 *
 * COMPLEXITY:
 *     Time:  O(rows * cols * |neighborhood|)
 *     Space: O(rows * cols)
 *
 * THREAD SAFETY:
 *     Safe - rows in parallel, per-thread accumulators from WorkspacePool
 *
 * NUMERICAL NOTES:
 *     The variance is the simplified 1 / (N - 1), not the randomization
 *     variance. Partial sums are reduced in thread-rank order, so results
 *     agree across thread counts to rounding.
 * -------------------------------------------------------------------------- */
std::optional<MoranResult> moran(GridView<const Real> grid, Neighborhood neighborhood);
std::optional<MoranResult> moran(GridView<const Real> grid, std::string_view neighborhood);

} // namespace vsp::kernel::spatial
