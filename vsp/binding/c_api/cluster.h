#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/cluster.h
// BRIEF: C API for spatial clustering (K-means, DBSCAN)
// =============================================================================

#include "vsp/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct vsp_cluster_stats_t {
    vsp_index_t cluster;
    vsp_size_t n_pixels;
    vsp_real_t percentage;
    vsp_real_t mean;
    vsp_real_t std;
    vsp_real_t min;
    vsp_real_t max;
} vsp_cluster_stats_t;

typedef struct vsp_kmeans_params_t {
    vsp_index_t k;
    vsp_bool_t include_coords;
    vsp_index_t n_init;
    vsp_index_t max_iter;
    vsp_real_t tol;
    uint64_t seed;
} vsp_kmeans_params_t;

typedef struct vsp_kmeans_summary_t {
    vsp_bool_t available;       // VSP_FALSE when valid cells < k
    vsp_index_t n_clusters;
    vsp_size_t n_valid;
    vsp_real_t inertia;
    vsp_index_t n_iter;
} vsp_kmeans_summary_t;

typedef struct vsp_dbscan_summary_t {
    vsp_bool_t available;       // VSP_FALSE when valid cells < min_samples
    vsp_index_t n_clusters;
    vsp_size_t n_noise;
    vsp_real_t noise_percentage;
    vsp_size_t n_valid;
} vsp_dbscan_summary_t;

// k = 3, include_coords, n_init = 10, max_iter = 300, tol = 1e-4, seed = 42
vsp_error_t vsp_kmeans_default_params(vsp_kmeans_params_t* params);

// assignment: cluster id per valid cell, NaN elsewhere (rows * cols).
// zones: id + 1, 0 elsewhere; may be NULL.
// stats: k entries ordered by id, may be NULL.
vsp_error_t vsp_cluster_kmeans(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    const vsp_kmeans_params_t* params,
    vsp_real_t* assignment,
    vsp_index_t* zones,
    vsp_cluster_stats_t* stats,
    vsp_kmeans_summary_t* summary
);

// assignment: id, -1 for noise, NaN for missing cells. stats may be NULL,
// otherwise it must hold n_clusters entries (VSP_ERROR_RANGE_ERROR if short).
vsp_error_t vsp_cluster_dbscan(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_real_t eps,
    vsp_index_t min_samples,
    vsp_bool_t include_coords,
    vsp_real_t* assignment,
    vsp_index_t* zones,
    vsp_cluster_stats_t* stats,
    vsp_size_t capacity,
    vsp_dbscan_summary_t* summary
);

#ifdef __cplusplus
}
#endif
