#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/simd.hpp"

#include <utility>
#include <cmath>

// =============================================================================
// FILE: vsp/core/vectorize.hpp
// BRIEF: SIMD reductions over contiguous value arrays
// =============================================================================

// All loads are unaligned: inputs are views into caller-owned grids.

namespace vsp::vectorize {

// =============================================================================
// 1. Reduction Operations
// =============================================================================

template <typename T>
VSP_FORCE_INLINE T sum(Array<const T> span) {
    namespace s = vsp::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    if (N == 0) return T(0);

    auto sum0 = s::Zero(d);
    auto sum1 = s::Zero(d);
    auto sum2 = s::Zero(d);
    auto sum3 = s::Zero(d);

    size_t i = 0;

    for (; i + 4 * lanes <= N; i += 4 * lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
        sum1 = s::Add(sum1, s::LoadU(d, span.ptr + i + lanes));
        sum2 = s::Add(sum2, s::LoadU(d, span.ptr + i + 2 * lanes));
        sum3 = s::Add(sum3, s::LoadU(d, span.ptr + i + 3 * lanes));
    }

    sum0 = s::Add(sum0, sum1);
    sum2 = s::Add(sum2, sum3);
    sum0 = s::Add(sum0, sum2);

    for (; i + lanes <= N; i += lanes) {
        sum0 = s::Add(sum0, s::LoadU(d, span.ptr + i));
    }

    T result = s::GetLane(s::SumOfLanes(d, sum0));

    for (; i < N; ++i) {
        result += span[i];
    }

    return result;
}

// Sum of squared deviations from a given center: sum((x - c)^2)
template <typename T>
VSP_FORCE_INLINE T sum_squared_dev(Array<const T> span, T center) {
    namespace s = vsp::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    if (N == 0) return T(0);

    const auto vc = s::Set(d, center);
    auto acc0 = s::Zero(d);
    auto acc1 = s::Zero(d);

    size_t i = 0;

    for (; i + 2 * lanes <= N; i += 2 * lanes) {
        auto v0 = s::Sub(s::LoadU(d, span.ptr + i), vc);
        auto v1 = s::Sub(s::LoadU(d, span.ptr + i + lanes), vc);
        acc0 = s::MulAdd(v0, v0, acc0);
        acc1 = s::MulAdd(v1, v1, acc1);
    }

    acc0 = s::Add(acc0, acc1);

    for (; i + lanes <= N; i += lanes) {
        auto v = s::Sub(s::LoadU(d, span.ptr + i), vc);
        acc0 = s::MulAdd(v, v, acc0);
    }

    T result = s::GetLane(s::SumOfLanes(d, acc0));

    for (; i < N; ++i) {
        const T dv = span[i] - center;
        result += dv * dv;
    }

    return result;
}

// =============================================================================
// 2. Min/Max Operations
// =============================================================================

template <typename T>
VSP_FORCE_INLINE std::pair<T, T> minmax(Array<const T> span) {
    VSP_ASSERT(span.len > 0, "minmax: Empty span");

    namespace s = vsp::simd;
    using SimdTag = s::SimdTagFor<T>;
    const SimdTag d;
    const size_t N = span.len;
    const size_t lanes = s::Lanes(d);

    T min_val = span[0];
    T max_val = span[0];

    if (N >= lanes) {
        auto v_min = s::LoadU(d, span.ptr);
        auto v_max = v_min;

        size_t i = lanes;
        for (; i + lanes <= N; i += lanes) {
            auto v_data = s::LoadU(d, span.ptr + i);
            v_min = s::Min(v_min, v_data);
            v_max = s::Max(v_max, v_data);
        }

        min_val = s::GetLane(s::MinOfLanes(d, v_min));
        max_val = s::GetLane(s::MaxOfLanes(d, v_max));

        for (; i < N; ++i) {
            if (span[i] < min_val) min_val = span[i];
            if (span[i] > max_val) max_val = span[i];
        }
    } else {
        for (size_t i = 1; i < N; ++i) {
            if (span[i] < min_val) min_val = span[i];
            if (span[i] > max_val) max_val = span[i];
        }
    }

    return {min_val, max_val};
}

} // namespace vsp::vectorize
