#pragma once

#include "vsp/config.hpp"
#include <cstdint>
#include <cstdlib>

// =============================================================================
// FILE: vsp/core/macros.hpp
// BRIEF: Cross-platform compiler abstractions and optimization hints
// =============================================================================

// =============================================================================
// SECTION 1: Branch Prediction Hints
// =============================================================================

#if defined(__clang__) || defined(__GNUC__)
    #define VSP_LIKELY(x)   (__builtin_expect(!!(x), 1))
    #define VSP_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
    #define VSP_LIKELY(x)   (x)
    #define VSP_UNLIKELY(x) (x)
#endif

// =============================================================================
// SECTION 2: Function Inlining & Visibility
// =============================================================================

#if defined(_MSC_VER)
    #define VSP_FORCE_INLINE __forceinline
    #define VSP_RESTRICT __restrict
    #define VSP_EXPORT __declspec(dllexport)
#else
    #define VSP_FORCE_INLINE inline __attribute__((always_inline))
    #define VSP_RESTRICT __restrict__
    #define VSP_EXPORT __attribute__((visibility("default")))
#endif

// =============================================================================
// SECTION 3: Alignment & Optimizer Hints
// =============================================================================

#define VSP_ALIGNMENT 64  // 64-byte alignment for AVX-512

#if defined(__clang__) || defined(__GNUC__)
    #define VSP_UNREACHABLE() __builtin_unreachable()
#elif defined(_MSC_VER)
    #define VSP_UNREACHABLE() __assume(0)
#else
    #define VSP_UNREACHABLE() ((void)0)
#endif
