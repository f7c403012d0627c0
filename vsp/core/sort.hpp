#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/simd.hpp"

#include <hwy/contrib/sort/vqsort-inl.h>

#include <algorithm>
#include <concepts>

// =============================================================================
// FILE: vsp/core/sort.hpp
// BRIEF: Sorting via Google Highway VQSort
// =============================================================================

namespace vsp::sort {

template <typename T>
concept TotallyOrdered = std::totally_ordered<T>;

// Inputs must not contain NaN; callers sort gathered valid values only.
template <TotallyOrdered T>
VSP_FORCE_INLINE void sort(Array<T> data) {
    if (data.len < 2) return;
    hwy::HWY_NAMESPACE::VQSortStatic(data.ptr, data.len, hwy::SortAscending());
}

} // namespace vsp::sort
