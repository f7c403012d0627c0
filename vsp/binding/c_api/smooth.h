#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/smooth.h
// BRIEF: C API for NaN-aware Gaussian smoothing
// =============================================================================

#include "vsp/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

// out receives rows * cols values; missing input cells stay NaN
vsp_error_t vsp_smooth_gaussian(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_real_t sigma,
    vsp_real_t* out
);

#ifdef __cplusplus
}
#endif
