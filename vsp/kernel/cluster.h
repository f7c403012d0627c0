// =============================================================================
// FILE: vsp/kernel/cluster.h
// BRIEF: API reference for spatial clustering (K-means, DBSCAN)
// NOTE: Documentation only - do not include in builds
// =============================================================================
#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"

#include <optional>

namespace vsp::kernel::cluster {

// =============================================================================
// Configuration Constants
// =============================================================================

namespace config {
    constexpr Size MAX_FEATURES = 3;
    constexpr Size PARALLEL_POINT_THRESHOLD = 4096;
    constexpr Index NOISE = -1;
}

/* -----------------------------------------------------------------------------
 * FUNCTION: build_features
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Standardized feature matrix of the valid cells.
 *
 * PARAMETERS:
 *     grid           [in] Input grid
 *     include_coords [in] Add col / cols and row / rows to the value
 *
 * POSTCONDITIONS:
 *     - n_points = valid cells, raster order; n_features = 1 or 3
 *     - Each column has zero mean and unit population variance; a constant
 *       column is only centred
 * -------------------------------------------------------------------------- */
Features build_features(GridView<const Real> grid, bool include_coords);

/* -----------------------------------------------------------------------------
 * FUNCTION: kmeans
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Lloyd's K-means on standardized features, ids ordered by mean value.
 *
 * PARAMETERS:
 *     grid   [in] Input grid
 *     params [in] k, include_coords, n_init, max_iter, tol, seed
 *
 * PRECONDITIONS:
 *     - k >= 1, n_init >= 1, max_iter >= 1, tol >= 0 (ValueError)
 *
 * POSTCONDITIONS:
 *     - Empty optional when fewer valid cells than k
 *     - assignment: id in [0, k) per valid cell, NaN elsewhere
 *     - zones: id + 1 per valid cell, 0 elsewhere
 *     - clusters[c].mean strictly follows id order (ties keep fit order)
 *     - Pixel counts sum to n_valid; no cluster is empty
 *     - inertia and centroids are in standardized feature space
 *
 * ALGORITHM:
 *     For each of n_init runs (one LCG stream seeded by `seed`):
 *         1. k-means++ seeding (D^2 sampling)
 *         2. Lloyd iterations until the squared centre shift is at most
 *            tol * mean feature variance, or max_iter
 *         3. Empty clusters take the point farthest from its centre
 *     Keep the run with the lowest inertia, then relabel by ascending mean
 *     raw value.
 *
 * COMPLEXITY:
 *     Time:  O(n_init * max_iter * n * k * d)
 *     Space: O(n * d)
 *
 * THREAD SAFETY:
 *     Safe - assignment step parallel over points; deterministic for a seed
 * -------------------------------------------------------------------------- */
std::optional<KMeansResult> kmeans(GridView<const Real> grid, const KMeansParams& params);

/* -----------------------------------------------------------------------------
 * FUNCTION: dbscan
 * -----------------------------------------------------------------------------
 * SUMMARY:
 *     Density-based clustering on standardized features.
 *
 * PARAMETERS:
 *     grid   [in] Input grid
 *     params [in] eps, min_samples, include_coords
 *
 * PRECONDITIONS:
 *     - eps > 0 and finite, min_samples >= 1 (ValueError)
 *
 * POSTCONDITIONS:
 *     - Empty optional when fewer valid cells than min_samples
 *     - assignment: cluster id, -1 for noise, NaN for missing cells
 *     - Neighbourhoods are closed balls (distance <= eps) including the point
 *     - Ids follow discovery order over raster-ordered cells
 *     - n_clusters excludes noise
 *
 * ALGORITHM:
 *     1. Bucket points into eps-sized cubes (sorted keys)
 *     2. Core points: |N_eps(p)| >= min_samples, counted in parallel
 *     3. Expand each unvisited core point depth-first; border points join
 *        the first cluster that reaches them
 *
 * COMPLEXITY:
 *     Time:  O(n log n + n * avg_neighbors)
 *     Space: O(n)
 * -------------------------------------------------------------------------- */
std::optional<DBSCANResult> dbscan(GridView<const Real> grid, const DBSCANParams& params);

} // namespace vsp::kernel::cluster
