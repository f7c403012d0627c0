#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include <cstring>
#include <cstdlib>
#include <new>
#include <utility>
#include <memory>
#include <algorithm>

// =============================================================================
// FILE: vsp/core/memory.hpp
// BRIEF: Low-level aligned memory primitives
// =============================================================================

namespace vsp::memory {

// =============================================================================
// Aligned Memory Allocation
// =============================================================================

template <typename T>
struct AlignedDeleter {
    std::size_t alignment_;

    explicit AlignedDeleter(std::size_t alignment = DEFAULT_ALIGNMENT) noexcept
        : alignment_(alignment) {}

    void operator()(T* ptr) const noexcept {
        if (VSP_UNLIKELY(!ptr)) return;

        if constexpr (std::is_arithmetic_v<T>) {
            operator delete[](ptr, std::align_val_t(alignment_));
        } else {
#if defined(_WIN32) || defined(_WIN64)
            _aligned_free(ptr);
#else
            std::free(ptr);
#endif
        }
    }
};

template <typename T>
using AlignedPtr = std::unique_ptr<T[], AlignedDeleter<T>>;  // NOLINT(modernize-avoid-c-arrays)

// Value-initialized aligned array. Returns an empty pointer for count == 0
// or when the allocation fails.
template <typename T>
VSP_FORCE_INLINE auto aligned_alloc(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> AlignedPtr<T> {
    static_assert(std::is_trivially_constructible_v<T>,
                  "aligned_alloc: Type must be trivially constructible");

    if (VSP_UNLIKELY(count == 0)) {
        return AlignedPtr<T>(nullptr, AlignedDeleter<T>(alignment));
    }

    T* raw_ptr = nullptr;

    if constexpr (std::is_arithmetic_v<T>) {
        raw_ptr = new (std::align_val_t(alignment), std::nothrow) T[count]();
    } else {
        const std::size_t byte_size = count * sizeof(T);
        void* ptr = nullptr;
#if defined(_WIN32) || defined(_WIN64)
        ptr = _aligned_malloc(byte_size, alignment);
#else
        if (VSP_UNLIKELY(posix_memalign(&ptr, alignment, byte_size) != 0)) {
            ptr = nullptr;
        }
#endif
        if (VSP_LIKELY(ptr)) {
            raw_ptr = static_cast<T*>(ptr);
            for (Size i = 0; i < count; ++i) {
                new (raw_ptr + i) T();
            }
        }
    }

    return AlignedPtr<T>(raw_ptr, AlignedDeleter<T>(alignment));
}

// Throwing variant for buffers the caller cannot proceed without
template <typename T>
auto aligned_alloc_or_throw(Size count, std::size_t alignment = DEFAULT_ALIGNMENT) -> AlignedPtr<T> {
    auto ptr = aligned_alloc<T>(count, alignment);
    if (VSP_UNLIKELY(count > 0 && !ptr)) {
        throw OutOfMemoryError("aligned_alloc: failed to allocate " +
                               std::to_string(count * sizeof(T)) + " bytes");
    }
    return ptr;
}

// RAII aligned buffer with an Array view
template <typename T>
struct AlignedBuffer {
    explicit AlignedBuffer(Size count, std::size_t alignment = DEFAULT_ALIGNMENT)
        : ptr_(aligned_alloc_or_throw<T>(count, alignment)), count_(count) {}

    ~AlignedBuffer() = default;

    AlignedBuffer(const AlignedBuffer&) = delete;
    auto operator=(const AlignedBuffer&) -> AlignedBuffer& = delete;

    AlignedBuffer(AlignedBuffer&&) noexcept = default;
    auto operator=(AlignedBuffer&&) noexcept -> AlignedBuffer& = default;

    [[nodiscard]] auto array() noexcept -> Array<T> {
        return Array<T>(ptr_.get(), count_);
    }

    [[nodiscard]] auto array() const noexcept -> Array<const T> {
        return Array<const T>(ptr_.get(), count_);
    }

    auto get() noexcept -> T* { return ptr_.get(); }
    auto get() const noexcept -> const T* { return ptr_.get(); }

    [[nodiscard]] auto size() const noexcept -> Size { return count_; }

    auto operator[](Size i) noexcept -> T& { return ptr_[i]; }
    auto operator[](Size i) const noexcept -> const T& { return ptr_[i]; }

private:
    AlignedPtr<T> ptr_;
    Size count_;
};

// =============================================================================
// Initialization (Fill / Zero)
// =============================================================================

template <typename T>
VSP_FORCE_INLINE void fill(Array<T> arr, T value) {
    if (VSP_UNLIKELY(arr.size() == 0)) return;

    if constexpr (std::is_trivially_copyable_v<T> && sizeof(T) == 1) {
        std::memset(arr.data(), static_cast<unsigned char>(value), arr.size());
    } else {
        std::fill(arr.begin(), arr.end(), value);
    }
}

template <typename T>
VSP_FORCE_INLINE void zero(Array<T> arr) {
    if (VSP_UNLIKELY(arr.size() == 0)) return;
    std::memset(arr.data(), 0, arr.size() * sizeof(T));
}

// =============================================================================
// Data Movement
// =============================================================================

template <typename T>
VSP_FORCE_INLINE void copy_fast(Array<const T> src, Array<T> dst) {
    VSP_ASSERT(src.size() == dst.size(), "copy_fast: Size mismatch");
    if (VSP_UNLIKELY(src.size() == 0)) return;
    std::memcpy(dst.data(), src.data(), src.size() * sizeof(T));
}

} // namespace vsp::memory
