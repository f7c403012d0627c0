#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/core/internal.hpp
// BRIEF: Internal helpers for the C API binding layer
// =============================================================================
//
// WARNING: This header is INTERNAL to the C API binding layer
// NOT part of the public API - do not include from user code
// =============================================================================

#include "vsp/binding/c_api/core/core.h"
#include "vsp/core/error.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/grid.hpp"
#include "vsp/kernel/stats.hpp"

#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>

static_assert(std::is_same_v<vsp_real_t, vsp::Real>,
              "vsp_real_t must match vsp::Real (check VSP_PRECISION)");
static_assert(std::is_same_v<vsp_index_t, vsp::Index>,
              "vsp_index_t must match vsp::Index (check VSP_INDEX_PRECISION)");
static_assert(std::is_same_v<vsp_mask_t, vsp::Byte>,
              "vsp_mask_t must match vsp::Byte");

namespace vsp::binding {

// =============================================================================
// Thread-Local Error State Management
// =============================================================================

void set_last_error(vsp_error_t code, const char* message) noexcept;
void set_last_error(vsp_error_t code, std::string_view message) noexcept;

void clear_last_error() noexcept;

[[nodiscard]] auto get_last_error_message() noexcept -> const char*;
[[nodiscard]] auto get_last_error_code() noexcept -> vsp_error_t;

// Convert the active C++ exception to a C error code.
// Must be called from within a catch block.
[[nodiscard]] auto handle_exception() noexcept -> vsp_error_t;

// =============================================================================
// Grid and Record Conversion
// =============================================================================

VSP_FORCE_INLINE auto grid_view(const vsp_real_t* data, vsp_index_t rows, vsp_index_t cols) noexcept
    -> GridView<const Real> {
    return GridView<const Real>{data, rows, cols};
}

VSP_FORCE_INLINE auto grid_size(vsp_index_t rows, vsp_index_t cols) noexcept -> Size {
    return static_cast<Size>(rows) * static_cast<Size>(cols);
}

VSP_FORCE_INLINE auto value_or_nan(const std::optional<Real>& v) noexcept -> vsp_real_t {
    return v ? *v : std::numeric_limits<vsp_real_t>::quiet_NaN();
}

VSP_FORCE_INLINE auto to_bool(bool b) noexcept -> vsp_bool_t {
    return b ? VSP_TRUE : VSP_FALSE;
}

inline void fill_summary(const kernel::stats::Summary& s, vsp_summary_t* out) noexcept {
    out->n = s.n;
    out->available = to_bool(s.available());
    out->mean = value_or_nan(s.mean);
    out->median = value_or_nan(s.median);
    out->std = value_or_nan(s.std_dev);
    out->min = value_or_nan(s.min);
    out->max = value_or_nan(s.max);
    out->range = value_or_nan(s.range);
    out->cv = value_or_nan(s.cv);
    out->p05 = value_or_nan(s.p05);
    out->p25 = value_or_nan(s.p25);
    out->p75 = value_or_nan(s.p75);
    out->p95 = value_or_nan(s.p95);
}

// Copy an owning grid into a caller buffer of the same size
template <typename T>
inline void export_grid(const Grid<T>& src, T* dst) {
    memory::copy_fast(Array<const T>(src.data(), src.size()), Array<T>(dst, src.size()));
}

// =============================================================================
// Convenience Macros for Error Handling
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define VSP_C_API_CHECK_NULL(ptr, msg) \
    do { \
        if (VSP_UNLIKELY((ptr) == nullptr)) { \
            vsp::binding::set_last_error(VSP_ERROR_NULL_POINTER, (msg)); \
            return VSP_ERROR_NULL_POINTER; \
        } \
    } while(0)

#define VSP_C_API_CHECK(cond, code, msg) \
    do { \
        if (VSP_UNLIKELY(!(cond))) { \
            vsp::binding::set_last_error((code), (msg)); \
            return (code); \
        } \
    } while(0)

// Grid arguments: non-null data and non-negative shape
#define VSP_C_API_CHECK_GRID(ptr, rows, cols) \
    do { \
        VSP_C_API_CHECK_NULL(ptr, "Grid data is null"); \
        VSP_C_API_CHECK((rows) >= 0 && (cols) >= 0, VSP_ERROR_INVALID_ARGUMENT, \
                        "Grid dimensions must be non-negative"); \
    } while(0)

#define VSP_C_API_TRY try {

#define VSP_C_API_CATCH \
    } catch (...) { \
        return vsp::binding::handle_exception(); \
    }

#define VSP_C_API_RETURN_OK \
    do { \
        vsp::binding::clear_last_error(); \
        return VSP_OK; \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace vsp::binding
