// =============================================================================
// FILE: vsp/binding/c_api/cluster.cpp
// BRIEF: C API implementation for spatial clustering
// =============================================================================

#include "vsp/binding/c_api/cluster.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/kernel/cluster.hpp"

#include <vector>

using namespace vsp;
using namespace vsp::binding;

namespace {

void export_stats(const std::vector<kernel::cluster::ClusterStats>& src, vsp_cluster_stats_t* dst) {
    for (Size i = 0; i < src.size(); ++i) {
        const auto& c = src[i];
        dst[i] = vsp_cluster_stats_t{c.cluster, c.n_pixels, c.percentage,
                                     c.mean, c.std_dev, c.min, c.max};
    }
}

void clear_assignment(vsp_real_t* assignment, vsp_index_t* zones, Size n) {
    memory::fill(Array<Real>(assignment, n), MISSING);
    if (zones != nullptr) {
        memory::zero(Array<Index>(zones, n));
    }
}

} // anonymous namespace

extern "C" {

VSP_EXPORT vsp_error_t vsp_kmeans_default_params(vsp_kmeans_params_t* params) {
    VSP_C_API_CHECK_NULL(params, "Params is null");
    const kernel::cluster::KMeansParams d;
    params->k = d.k;
    params->include_coords = to_bool(d.include_coords);
    params->n_init = d.n_init;
    params->max_iter = d.max_iter;
    params->tol = d.tol;
    params->seed = d.seed;
    VSP_C_API_RETURN_OK;
}

VSP_EXPORT vsp_error_t vsp_cluster_kmeans(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const vsp_kmeans_params_t* params,
    vsp_real_t* assignment,
    vsp_index_t* zones,
    vsp_cluster_stats_t* stats,
    vsp_kmeans_summary_t* summary) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(params, "Params is null");
    VSP_C_API_CHECK_NULL(assignment, "Output assignment grid is null");
    VSP_C_API_CHECK_NULL(summary, "Output summary is null");

    VSP_C_API_TRY
        kernel::cluster::KMeansParams p;
        p.k = params->k;
        p.include_coords = params->include_coords != VSP_FALSE;
        p.n_init = params->n_init;
        p.max_iter = params->max_iter;
        p.tol = params->tol;
        p.seed = params->seed;

        const auto result = kernel::cluster::kmeans(grid_view(grid, rows, cols), p);
        if (!result) {
            clear_assignment(assignment, zones, grid_size(rows, cols));
            *summary = vsp_kmeans_summary_t{};
            summary->available = VSP_FALSE;
            summary->inertia = std::numeric_limits<vsp_real_t>::quiet_NaN();
            VSP_C_API_RETURN_OK;
        }

        export_grid(result->assignment, assignment);
        if (zones != nullptr) {
            export_grid(result->zones, zones);
        }
        if (stats != nullptr) {
            export_stats(result->clusters, stats);
        }
        summary->available = VSP_TRUE;
        summary->n_clusters = result->n_clusters;
        summary->n_valid = result->n_valid;
        summary->inertia = result->inertia;
        summary->n_iter = result->n_iter;
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_cluster_dbscan(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const vsp_real_t eps,
    const vsp_index_t min_samples,
    const vsp_bool_t include_coords,
    vsp_real_t* assignment,
    vsp_index_t* zones,
    vsp_cluster_stats_t* stats,
    const vsp_size_t capacity,
    vsp_dbscan_summary_t* summary) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(assignment, "Output assignment grid is null");
    VSP_C_API_CHECK_NULL(summary, "Output summary is null");

    VSP_C_API_TRY
        kernel::cluster::DBSCANParams p;
        p.eps = eps;
        p.min_samples = min_samples;
        p.include_coords = include_coords != VSP_FALSE;

        const auto result = kernel::cluster::dbscan(grid_view(grid, rows, cols), p);
        if (!result) {
            clear_assignment(assignment, zones, grid_size(rows, cols));
            *summary = vsp_dbscan_summary_t{};
            summary->available = VSP_FALSE;
            summary->noise_percentage = std::numeric_limits<vsp_real_t>::quiet_NaN();
            VSP_C_API_RETURN_OK;
        }

        export_grid(result->assignment, assignment);
        if (zones != nullptr) {
            export_grid(result->zones, zones);
        }
        summary->available = VSP_TRUE;
        summary->n_clusters = result->n_clusters;
        summary->n_noise = result->n_noise;
        summary->noise_percentage = result->noise_percentage;
        summary->n_valid = result->n_valid;
        if (stats != nullptr) {
            VSP_C_API_CHECK(capacity >= result->clusters.size(), VSP_ERROR_RANGE_ERROR,
                            "Cluster stats capacity is smaller than the number of clusters");
            export_stats(result->clusters, stats);
        }
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

} // extern "C"
