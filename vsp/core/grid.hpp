#pragma once

#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/memory.hpp"

#include <cmath>
#include <limits>
#include <utility>

// =============================================================================
// FILE: vsp/core/grid.hpp
// BRIEF: Row-major 2D grid views and owning grids with NaN-as-missing cells
// =============================================================================

namespace vsp {

// =============================================================================
// SECTION 1: Missing-Value Convention
// =============================================================================

inline constexpr Real MISSING = std::numeric_limits<Real>::quiet_NaN();

// A cell carries data iff its value is finite (NaN and +/-inf are missing)
VSP_FORCE_INLINE bool is_valid(Real v) noexcept {
    return std::isfinite(v);
}

// =============================================================================
// SECTION 2: Grid View
// =============================================================================

// Non-owning row-major view, rows * cols contiguous elements
template <typename T>
struct GridView {
    T* ptr;
    Index rows;
    Index cols;

    constexpr GridView() noexcept : ptr(nullptr), rows(0), cols(0) {}
    constexpr GridView(T* p, Index r, Index c) noexcept : ptr(p), rows(r), cols(c) {}

    template <typename U>
        requires (std::is_const_v<T> && std::is_same_v<std::remove_const_t<T>, U>)
    constexpr GridView(const GridView<U>& other) noexcept
        : ptr(other.ptr), rows(other.rows), cols(other.cols) {}

    VSP_FORCE_INLINE auto operator()(Index r, Index c) const noexcept -> T& {
#if !defined(NDEBUG)
        assert(r >= 0 && r < rows && c >= 0 && c < cols && "GridView index out of bounds");
#endif
        return ptr[r * cols + c];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    [[nodiscard]] VSP_FORCE_INLINE auto size() const noexcept -> Size {
        return static_cast<Size>(rows) * static_cast<Size>(cols);
    }

    [[nodiscard]] VSP_FORCE_INLINE auto empty() const noexcept -> bool { return size() == 0; }

    [[nodiscard]] VSP_FORCE_INLINE auto flat() const noexcept -> Array<T> {
        return Array<T>(ptr, size());
    }

    [[nodiscard]] VSP_FORCE_INLINE auto row(Index r) const noexcept -> Array<T> {
        return Array<T>(ptr + r * cols, static_cast<Size>(cols));  // NOLINT
    }
};

// =============================================================================
// SECTION 3: Owning Grid
// =============================================================================

template <typename T>
class Grid {
public:
    Grid() = default;

    Grid(Index rows, Index cols)
        : rows_(rows), cols_(cols)
    {
        VSP_CHECK_ARG(rows >= 0 && cols >= 0, "Grid: negative dimensions");
        data_ = memory::aligned_alloc_or_throw<T>(size());
    }

    Grid(Index rows, Index cols, T value)
        : Grid(rows, cols)
    {
        memory::fill(view().flat(), value);
    }

    Grid(Grid&&) noexcept = default;
    auto operator=(Grid&&) noexcept -> Grid& = default;

    Grid(const Grid&) = delete;
    auto operator=(const Grid&) -> Grid& = delete;

    ~Grid() = default;

    [[nodiscard]] static auto copy_of(GridView<const T> src) -> Grid {
        Grid out(src.rows, src.cols);
        memory::copy_fast(src.flat(), out.view().flat());
        return out;
    }

    [[nodiscard]] auto view() noexcept -> GridView<T> { return {data_.get(), rows_, cols_}; }
    [[nodiscard]] auto view() const noexcept -> GridView<const T> { return {data_.get(), rows_, cols_}; }
    [[nodiscard]] auto cview() const noexcept -> GridView<const T> { return {data_.get(), rows_, cols_}; }

    VSP_FORCE_INLINE auto operator()(Index r, Index c) noexcept -> T& {
        return data_[static_cast<Size>(r * cols_ + c)];
    }
    VSP_FORCE_INLINE auto operator()(Index r, Index c) const noexcept -> const T& {
        return data_[static_cast<Size>(r * cols_ + c)];
    }

    [[nodiscard]] auto data() noexcept -> T* { return data_.get(); }
    [[nodiscard]] auto data() const noexcept -> const T* { return data_.get(); }

    [[nodiscard]] Index rows() const noexcept { return rows_; }
    [[nodiscard]] Index cols() const noexcept { return cols_; }
    [[nodiscard]] Size size() const noexcept {
        return static_cast<Size>(rows_) * static_cast<Size>(cols_);
    }

private:
    memory::AlignedPtr<T> data_{nullptr, memory::AlignedDeleter<T>()};
    Index rows_ = 0;
    Index cols_ = 0;
};

using RealGrid = Grid<Real>;
using MaskGrid = Grid<Byte>;
using LabelGrid = Grid<Index>;

// =============================================================================
// SECTION 4: Validity Helpers
// =============================================================================

inline Size count_valid(GridView<const Real> grid) noexcept {
    const Size n = grid.size();
    Size count = 0;
    for (Size i = 0; i < n; ++i) {
        count += is_valid(grid.ptr[i]) ? 1 : 0;
    }
    return count;
}

inline Size count_true(GridView<const Byte> mask) noexcept {
    const Size n = mask.size();
    Size count = 0;
    for (Size i = 0; i < n; ++i) {
        count += mask.ptr[i] != 0 ? 1 : 0;
    }
    return count;
}

// Valid values in row-major order, with their flat cell positions
struct ValidCells {
    memory::AlignedBuffer<Real> values;
    memory::AlignedBuffer<Index> positions;

    explicit ValidCells(Size n) : values(n), positions(n) {}

    [[nodiscard]] Size size() const noexcept { return values.size(); }
};

inline ValidCells gather_valid(GridView<const Real> grid) {
    ValidCells cells(count_valid(grid));
    const Size n = grid.size();
    Size k = 0;
    for (Size i = 0; i < n; ++i) {
        const Real v = grid.ptr[i];
        if (is_valid(v)) {
            cells.values[k] = v;
            cells.positions[k] = static_cast<Index>(i);
            ++k;
        }
    }
    return cells;
}

inline memory::AlignedBuffer<Real> gather_valid_values(GridView<const Real> grid) {
    memory::AlignedBuffer<Real> out(count_valid(grid));
    const Size n = grid.size();
    Size k = 0;
    for (Size i = 0; i < n; ++i) {
        if (is_valid(grid.ptr[i])) {
            out[k++] = grid.ptr[i];
        }
    }
    return out;
}

} // namespace vsp
