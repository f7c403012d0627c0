#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/core/core.h
// BRIEF: C ABI for the vsp-core spatial statistics engine
// =============================================================================
//
// CONVENTIONS:
//   - Grids are caller-owned, row-major vsp_real_t buffers of rows * cols;
//     NaN marks a missing cell
//   - Output grids and records are caller-allocated
//   - Every function returns vsp_error_t; details via vsp_get_last_error()
//   - "No result" is not an error: records carry available = VSP_FALSE and
//     unavailable values are NaN
// =============================================================================

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stddef.h>

// =============================================================================
// Version Information
// =============================================================================

#define VSP_C_API_VERSION_MAJOR 1
#define VSP_C_API_VERSION_MINOR 0
#define VSP_C_API_VERSION_PATCH 0

// Runtime version string (e.g. "1.0.0")
const char* vsp_get_version(void);

// Build configuration (e.g. "float64+int64+avx2+openmp")
const char* vsp_get_build_config(void);

// =============================================================================
// Basic Value Types (Must Match C++ vsp::Real and vsp::Index)
// =============================================================================

#if defined(VSP_PRECISION) && (VSP_PRECISION == 0)
typedef float vsp_real_t;
#define VSP_REAL_TYPE_NAME "float32"
#else
typedef double vsp_real_t;
#define VSP_REAL_TYPE_NAME "float64"
#endif

#if defined(VSP_INDEX_PRECISION) && (VSP_INDEX_PRECISION == 0)
typedef int16_t vsp_index_t;
#define VSP_INDEX_TYPE_NAME "int16"
#elif defined(VSP_INDEX_PRECISION) && (VSP_INDEX_PRECISION == 1)
typedef int32_t vsp_index_t;
#define VSP_INDEX_TYPE_NAME "int32"
#else
typedef int64_t vsp_index_t;
#define VSP_INDEX_TYPE_NAME "int64"
#endif

typedef size_t vsp_size_t;

typedef int vsp_bool_t;
#define VSP_TRUE 1
#define VSP_FALSE 0

// Boolean grids (hotspot, change and outlier masks): 0 or 1 per cell
typedef uint8_t vsp_mask_t;

// =============================================================================
// Error Handling
// =============================================================================

// Error codes (stable across versions, matches vsp::ErrorCode)
typedef int32_t vsp_error_t;

#define VSP_OK 0

// General errors (1-9)
#define VSP_ERROR_UNKNOWN 1
#define VSP_ERROR_INTERNAL 2
#define VSP_ERROR_OUT_OF_MEMORY 3
#define VSP_ERROR_NULL_POINTER 4

// Argument errors (10-19)
#define VSP_ERROR_INVALID_ARGUMENT 10
#define VSP_ERROR_DIMENSION_MISMATCH 11
#define VSP_ERROR_RANGE_ERROR 13

// Message of the last error on this thread, "No error" if none
const char* vsp_get_last_error(void);

// Code of the last error on this thread, VSP_OK if none
vsp_error_t vsp_get_last_error_code(void);

void vsp_clear_error(void);

vsp_bool_t vsp_is_ok(vsp_error_t code);
vsp_bool_t vsp_is_error(vsp_error_t code);

// =============================================================================
// Runtime Configuration
// =============================================================================

// 0 selects the hardware concurrency
vsp_error_t vsp_set_num_threads(vsp_size_t n);
vsp_size_t vsp_get_num_threads(void);

// 0: silent, 1: warnings, 2: info
vsp_error_t vsp_set_log_level(int32_t level);

// =============================================================================
// Shared Records
// =============================================================================

// Descriptive statistics over valid cells. available == VSP_FALSE when n == 0;
// every value is then NaN. cv is NaN when the mean is 0.
typedef struct vsp_summary_t {
    vsp_size_t n;
    vsp_bool_t available;
    vsp_real_t mean;
    vsp_real_t median;
    vsp_real_t std;
    vsp_real_t min;
    vsp_real_t max;
    vsp_real_t range;
    vsp_real_t cv;
    vsp_real_t p05;
    vsp_real_t p25;
    vsp_real_t p75;
    vsp_real_t p95;
} vsp_summary_t;

#ifdef __cplusplus
}
#endif
