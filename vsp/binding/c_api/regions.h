#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/regions.h
// BRIEF: C API for connected-region labeling
// =============================================================================

#include "vsp/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct vsp_region_t {
    vsp_index_t label;
    vsp_size_t size;
    vsp_real_t centroid_row;
    vsp_real_t centroid_col;
} vsp_region_t;

// connectivity: 4 or 8. labels receives 0 outside the mask and 1..n inside.
// regions may be NULL; otherwise it must hold n_regions entries
// (VSP_ERROR_RANGE_ERROR if capacity is short).
vsp_error_t vsp_regions_label(
    const vsp_mask_t* mask,
    vsp_index_t rows,
    vsp_index_t cols,
    int32_t connectivity,
    vsp_index_t* labels,
    vsp_region_t* regions,
    vsp_size_t capacity,
    vsp_size_t* n_regions
);

#ifdef __cplusplus
}
#endif
