#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/memory.hpp"

#include <cstring>

// =============================================================================
// FILE: vsp/threading/workspace.hpp
// BRIEF: Per-thread scratch buffers for parallel reductions
// =============================================================================

namespace vsp::threading {

// One contiguous allocation, one slot of `capacity` elements per thread rank.
// Slots are padded to a cache line so concurrent accumulators do not share one.
template <typename T>
class WorkspacePool {
public:
    WorkspacePool() = default;

    void init(size_t n_threads, size_t capacity) {
        n_threads_ = n_threads;
        capacity_ = capacity;
        const size_t per_line = memory::CACHE_LINE_SIZE / sizeof(T);
        stride_ = per_line > 0 ? ((capacity + per_line - 1) / per_line) * per_line : capacity;
        data_ = memory::aligned_alloc_or_throw<T>(n_threads_ * stride_, VSP_ALIGNMENT);
    }

    WorkspacePool(const WorkspacePool&) = delete;
    WorkspacePool& operator=(const WorkspacePool&) = delete;
    WorkspacePool(WorkspacePool&&) noexcept = default;
    WorkspacePool& operator=(WorkspacePool&&) noexcept = default;
    ~WorkspacePool() = default;

    VSP_FORCE_INLINE T* get(size_t thread_rank) noexcept {
        return data_.get() + thread_rank * stride_;
    }

    VSP_FORCE_INLINE const T* get(size_t thread_rank) const noexcept {
        return data_.get() + thread_rank * stride_;
    }

    VSP_FORCE_INLINE Array<T> span(size_t thread_rank) noexcept {
        return Array<T>(get(thread_rank), capacity_);
    }

    VSP_FORCE_INLINE void zero(size_t thread_rank) noexcept {
        std::memset(get(thread_rank), 0, capacity_ * sizeof(T));
    }

    void zero_all() noexcept {
        if (data_) {
            std::memset(data_.get(), 0, n_threads_ * stride_ * sizeof(T));
        }
    }

    // Element-wise sum of every thread slot, in rank order
    void reduce_into(Array<T> out) const noexcept {
        for (size_t j = 0; j < capacity_ && j < out.len; ++j) {
            T acc = T(0);
            for (size_t t = 0; t < n_threads_; ++t) {
                acc += get(t)[j];
            }
            out[j] = acc;
        }
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t n_threads() const noexcept { return n_threads_; }

private:
    memory::AlignedPtr<T> data_{nullptr, memory::AlignedDeleter<T>()};
    size_t n_threads_ = 0;
    size_t capacity_ = 0;
    size_t stride_ = 0;
};

} // namespace vsp::threading
