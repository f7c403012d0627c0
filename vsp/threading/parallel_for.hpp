#pragma once

#include "vsp/config.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/threading/scheduler.hpp"

#include <cstddef>
#include <utility>
#include <type_traits>
#include <vector>
#include <future>

// =============================================================================
// FILE: vsp/threading/parallel_for.hpp
// BRIEF: Backend-independent parallel loop
// =============================================================================

#if defined(VSP_USE_TBB)
    #include <tbb/parallel_for.h>
    #include <tbb/blocked_range.h>
    #include <tbb/task_arena.h>
#elif defined(VSP_USE_OPENMP)
    #include <omp.h>
#endif

namespace vsp::threading {

namespace detail {

template <typename Func>
VSP_FORCE_INLINE void invoke_body(Func& func, size_t i, size_t rank) {
    if constexpr (std::is_invocable_v<Func, size_t, size_t>) {
        func(i, rank);
    } else {
        func(i);
    }
}

template <typename Func>
inline void serial_for(size_t start, size_t end, Func& func) {
    for (size_t i = start; i < end; ++i) {
        invoke_body(func, i, 0);
    }
}

} // namespace detail

// Runs func over [start, end). func takes (i) or (i, thread_rank); the rank
// is below Scheduler::get_num_threads() and indexes per-thread workspaces.
// Ranges shorter than min_parallel run on the calling thread.
template <typename Func>
inline void parallel_for(size_t start, size_t end, Func&& func, size_t min_parallel = 1) {
    if (VSP_UNLIKELY(start >= end)) {
        return;
    }

    if (end - start < min_parallel || Scheduler::get_num_threads() == 1) {
        detail::serial_for(start, end, func);
        return;
    }

#if defined(VSP_USE_SERIAL)
    detail::serial_for(start, end, func);

#elif defined(VSP_USE_OPENMP)
    if (omp_in_parallel()) {
        detail::serial_for(start, end, func);
    } else {
        const auto first = static_cast<std::ptrdiff_t>(start);
        const auto last = static_cast<std::ptrdiff_t>(end);
        #pragma omp parallel for schedule(static)
        for (std::ptrdiff_t i = first; i < last; ++i) {
            detail::invoke_body(func, static_cast<size_t>(i),
                                static_cast<size_t>(omp_get_thread_num()));
        }
    }

#elif defined(VSP_USE_TBB)
    tbb::parallel_for(tbb::blocked_range<size_t>(start, end),
        [&](const tbb::blocked_range<size_t>& r) {
            const auto rank = static_cast<size_t>(tbb::this_task_arena::current_thread_index());
            for (size_t i = r.begin(); i != r.end(); ++i) {
                detail::invoke_body(func, i, rank);
            }
        });

#elif defined(VSP_USE_BS)
    auto& pool = detail::get_global_pool();
    const size_t num_threads = pool.get_thread_count();
    const size_t chunk_size = (end - start + num_threads - 1) / num_threads;

    std::vector<std::future<void>> futures;
    futures.reserve(num_threads);

    size_t rank = 0;
    for (size_t chunk_start = start; chunk_start < end; chunk_start += chunk_size) {
        const size_t chunk_end = (chunk_start + chunk_size < end) ? (chunk_start + chunk_size) : end;
        const size_t chunk_rank = rank++;
        futures.push_back(pool.submit([&func, chunk_start, chunk_end, chunk_rank]() {
            for (size_t i = chunk_start; i < chunk_end; ++i) {
                detail::invoke_body(func, i, chunk_rank);
            }
        }));
    }

    for (auto& future : futures) {
        future.get();
    }

#else
    detail::serial_for(start, end, func);
#endif
}

} // namespace vsp::threading
