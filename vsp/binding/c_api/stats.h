#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/stats.h
// BRIEF: C API for descriptive, zonal and outlier statistics
// =============================================================================

#include "vsp/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// Heterogeneity classes
#define VSP_HETEROGENEITY_HOMOGENEOUS 0
#define VSP_HETEROGENEITY_MODERATE 1
#define VSP_HETEROGENEITY_HETEROGENEOUS 2
#define VSP_HETEROGENEITY_VERY_HETEROGENEOUS 3
#define VSP_HETEROGENEITY_UNKNOWN 4

typedef struct vsp_advanced_stats_t {
    vsp_summary_t summary;
    vsp_bool_t available;
    vsp_real_t variance;
    vsp_real_t skewness;        // NaN for zero variance
    vsp_real_t kurtosis;        // excess, NaN for zero variance
    vsp_real_t iqr;
    vsp_real_t mad;
    vsp_real_t cv_percent;      // NaN when the mean is 0
} vsp_advanced_stats_t;

typedef struct vsp_heterogeneity_t {
    vsp_bool_t available;
    vsp_real_t cv_percent;
    vsp_real_t iqr_normalized;
    int32_t level;              // VSP_HETEROGENEITY_*
} vsp_heterogeneity_t;

typedef struct vsp_zone_stats_t {
    vsp_index_t label;
    vsp_size_t n_cells;
    vsp_summary_t summary;
} vsp_zone_stats_t;

// Descriptive statistics over valid cells; never fails on data
vsp_error_t vsp_stats_describe(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_summary_t* out
);

vsp_error_t vsp_stats_advanced(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_advanced_stats_t* out
);

vsp_error_t vsp_stats_heterogeneity(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_heterogeneity_t* out
);

// |z| > threshold
vsp_error_t vsp_stats_outliers_zscore(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_real_t threshold,
    vsp_mask_t* mask,
    vsp_size_t* n_outliers
);

// Outside [Q1 - factor * IQR, Q3 + factor * IQR]
vsp_error_t vsp_stats_outliers_iqr(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_real_t factor,
    vsp_mask_t* mask,
    vsp_size_t* n_outliers
);

// Per positive label of `labels`. n_zones receives the number of zones found;
// zones may be NULL to query it. VSP_ERROR_RANGE_ERROR if capacity is short.
vsp_error_t vsp_stats_zonal(
    const vsp_real_t* grid,
    const vsp_index_t* labels,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_zone_stats_t* zones,
    vsp_size_t capacity,
    vsp_size_t* n_zones
);

// Label of a VSP_HETEROGENEITY_* code; NULL for unknown codes
const char* vsp_heterogeneity_name(int32_t heterogeneity);

#ifdef __cplusplus
}
#endif
