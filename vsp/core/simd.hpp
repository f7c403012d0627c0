#pragma once

#include "vsp/core/type.hpp"

// =============================================================================
// Highway Configuration
// =============================================================================

#if defined(VSP_ONLY_SCALAR) && !defined(HWY_COMPILE_ONLY_SCALAR)
    #define HWY_COMPILE_ONLY_SCALAR
#endif

#define HWY_DISABLED_TARGETS_LOG

#include <hwy/highway.h>
#include <hwy/contrib/math/math-inl.h>

// =============================================================================
// FILE: vsp/core/simd.hpp
// BRIEF: VSP SIMD Wrapper (Google Highway)
// =============================================================================

namespace vsp::simd {

    // Import Highway functions into vsp::simd namespace
    using namespace hwy::HWY_NAMESPACE;

    using RealTag = ScalableTag<vsp::Real>;
    using IndexTag = ScalableTag<vsp::Index>;

    template <typename T>
    using SimdTagFor = std::conditional_t<
        std::is_same_v<T, Real>, RealTag,
        std::conditional_t<std::is_same_v<T, Index>, IndexTag,
            ScalableTag<T>>>;

} // namespace vsp::simd
