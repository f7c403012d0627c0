#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/hotspot.h
// BRIEF: C API for hotspot / coldspot classification
// =============================================================================

#include "vsp/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct vsp_hotspot_summary_t {
    vsp_bool_t available;       // VSP_FALSE when the grid has no valid cell
    vsp_size_t n_valid;
    vsp_size_t n_hotspots;
    vsp_size_t n_coldspots;
    vsp_real_t pct_hotspots;
    vsp_real_t pct_coldspots;
    vsp_real_t mean_hotspots;   // NaN for an empty mask
    vsp_real_t mean_coldspots;
} vsp_hotspot_summary_t;

// method: "zscore", "percentile" or "iqr" (VSP_ERROR_INVALID_ARGUMENT otherwise).
// Masks are zeroed when no result is available.
vsp_error_t vsp_hotspot_detect(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    const char* method,
    vsp_real_t threshold,
    vsp_mask_t* hotspots,
    vsp_mask_t* coldspots,
    vsp_hotspot_summary_t* summary
);

#ifdef __cplusplus
}
#endif
