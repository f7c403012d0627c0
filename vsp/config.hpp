#pragma once

#include <cstdint>

// =============================================================================
// FILE: vsp/config.hpp
// BRIEF: VSP Core Configuration Header
// =============================================================================

// =============================================================================
// HWY Scalar-Only Control
// =============================================================================

#ifdef VSP_ONLY_SCALAR
    #ifndef HWY_COMPILE_ONLY_SCALAR
        #define HWY_COMPILE_ONLY_SCALAR
    #endif
#endif

// =============================================================================
// Platform Detection
// =============================================================================

#if defined(_WIN32) || defined(_WIN64)
    #define VSP_OS_WINDOWS
#elif defined(__APPLE__) || defined(__MACH__)
    #define VSP_OS_MAC
#elif defined(__linux__) || defined(__linux)
    #define VSP_OS_LINUX
#else
    #define VSP_OS_UNKNOWN
#endif

// =============================================================================
// Threading Backend Selection
// =============================================================================

// Auto-select backend based on platform if none specified
#if !defined(VSP_BACKEND_SERIAL) && !defined(VSP_BACKEND_TBB) && \
    !defined(VSP_BACKEND_OPENMP) && !defined(VSP_BACKEND_BS)
    #if defined(VSP_OS_MAC)
        // macOS: BS::thread_pool unless VSP_MAC_USE_OPENMP is set
        #if defined(VSP_MAC_USE_OPENMP)
            #define VSP_BACKEND_OPENMP
        #else
            #define VSP_BACKEND_BS
        #endif
    #elif defined(VSP_OS_WINDOWS) || defined(VSP_OS_LINUX)
        #define VSP_BACKEND_OPENMP
    #else
        #define VSP_BACKEND_BS
    #endif
#endif

#if (defined(VSP_BACKEND_SERIAL) && (defined(VSP_BACKEND_TBB) || defined(VSP_BACKEND_OPENMP) || defined(VSP_BACKEND_BS))) || \
    (defined(VSP_BACKEND_TBB) && (defined(VSP_BACKEND_OPENMP) || defined(VSP_BACKEND_BS))) || \
    (defined(VSP_BACKEND_OPENMP) && defined(VSP_BACKEND_BS))
    #error "VSP Configuration Error: Multiple threading backends defined! " \
           "Please define only one backend."
#endif

#if defined(VSP_OS_MAC) && defined(VSP_BACKEND_OPENMP)
    #pragma GCC warning "VSP_WARNING: OpenMP enabled on macOS. " \
                        "Ensure 'libomp' is installed and linker flags are correct."
#endif

// =============================================================================
// Feature Flags (Public API)
// =============================================================================

#if defined(VSP_BACKEND_OPENMP)
    #define VSP_USE_OPENMP 1
#elif defined(VSP_BACKEND_TBB)
    #define VSP_USE_TBB 1
#elif defined(VSP_BACKEND_BS)
    #define VSP_USE_BS 1
#elif defined(VSP_BACKEND_SERIAL)
    #define VSP_USE_SERIAL 1
#endif

// =============================================================================
// Precision Control
// =============================================================================

// Floating-point precision selection
// 0: float32
// 1: float64 (default, grids arrive as IEEE doubles)
#ifndef VSP_PRECISION
    #define VSP_PRECISION 1
#endif

#if VSP_PRECISION == 0
    #define VSP_USE_FLOAT32
#elif VSP_PRECISION == 1
    #define VSP_USE_FLOAT64
#else
    #error "VSP Configuration Error: Invalid VSP_PRECISION value. " \
           "Must be 0 (f32) or 1 (f64)."
#endif

// =============================================================================
// Index Precision Control
// =============================================================================

// 0: int16 - Max 32K cells
// 1: int32 - Max 2B cells
// 2: int64 - (default)
#ifndef VSP_INDEX_PRECISION
    #define VSP_INDEX_PRECISION 2
#endif

#if VSP_INDEX_PRECISION == 0
    #define VSP_USE_INT16
#elif VSP_INDEX_PRECISION == 1
    #define VSP_USE_INT32
#elif VSP_INDEX_PRECISION == 2
    #define VSP_USE_INT64
#else
    #error "VSP Configuration Error: Invalid VSP_INDEX_PRECISION value. " \
           "Must be 0 (int16), 1 (int32), or 2 (int64)."
#endif

// =============================================================================
// Logging
// =============================================================================

// 0: silent, 1: warnings (default), 2: info
#ifndef VSP_LOG_LEVEL
    #define VSP_LOG_LEVEL 1
#endif

// =============================================================================
// Memory Configuration
// =============================================================================

#include <cstddef>

namespace vsp::memory {
    inline constexpr std::size_t DEFAULT_ALIGNMENT = 64;  // AVX-512
    inline constexpr std::size_t CACHE_LINE_SIZE = 64;
}

// =============================================================================
// Analysis Defaults
// =============================================================================

namespace vsp::analysis {
    inline constexpr double SIGNIFICANCE_LEVEL = 0.05;

    // Outlier policies
    inline constexpr double IQR_OUTLIER_FACTOR = 1.5;
    inline constexpr double ZSCORE_OUTLIER_THRESHOLD = 2.0;

    // Temporal change classification: threshold = factor * std(diff)
    inline constexpr double CHANGE_STD_FACTOR = 0.5;

    // Mann-Kendall: exact p-value for untied series up to this length
    inline constexpr std::size_t KENDALL_EXACT_MAX_N = 33;

    // Breakpoint search: both segments keep at least MARGIN points
    inline constexpr std::size_t BREAKPOINT_MIN_POINTS = 6;
    inline constexpr std::size_t BREAKPOINT_MARGIN = 3;

    // Gaussian kernel radius = int(truncate * sigma + 0.5)
    inline constexpr double GAUSSIAN_TRUNCATE = 4.0;

    // Heterogeneity classes on CV (percent)
    inline constexpr double CV_HOMOGENEOUS = 10.0;
    inline constexpr double CV_MODERATE = 20.0;
    inline constexpr double CV_HETEROGENEOUS = 30.0;

    // K-means
    inline constexpr std::int32_t KMEANS_N_INIT = 10;
    inline constexpr std::int32_t KMEANS_MAX_ITER = 300;
    inline constexpr double KMEANS_TOL = 1e-4;
    inline constexpr std::uint64_t KMEANS_SEED = 42;
}
