#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/spatial.h
// BRIEF: C API for global spatial autocorrelation (Moran's I)
// =============================================================================

#include "vsp/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

#define VSP_AUTOCORRELATION_RANDOM 0
#define VSP_AUTOCORRELATION_CLUSTERED 1
#define VSP_AUTOCORRELATION_DISPERSED 2

typedef struct vsp_moran_t {
    vsp_bool_t available;       // VSP_FALSE for no neighbour pair or a constant grid
    vsp_real_t moran_i;
    vsp_real_t expected_i;
    vsp_real_t z_score;
    vsp_real_t p_value;
    vsp_size_t n_valid;
    vsp_size_t n_pairs;
    int32_t pattern;            // VSP_AUTOCORRELATION_*
    vsp_bool_t significant;
} vsp_moran_t;

// neighborhood: "queen" or "rook"
vsp_error_t vsp_spatial_moran(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    const char* neighborhood,
    vsp_moran_t* out
);

// Label of a VSP_AUTOCORRELATION_* code; NULL for unknown codes
const char* vsp_autocorrelation_name(int32_t pattern);

#ifdef __cplusplus
}
#endif
