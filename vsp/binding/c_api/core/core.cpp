// =============================================================================
// FILE: vsp/binding/c_api/core/core.cpp
// BRIEF: Core C API implementation with thread-safe error handling
// =============================================================================

#include "vsp/binding/c_api/core/core.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/log.hpp"
#include "vsp/threading/scheduler.hpp"

#include <algorithm>
#include <array>
#include <cstring>
#include <exception>
#include <new>
#include <stdexcept>
#include <string_view>

namespace vsp::binding {

// =============================================================================
// Thread-Local Error State
// =============================================================================

namespace {

constexpr std::size_t ERROR_MESSAGE_BUFFER_SIZE = 512;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local vsp_error_t g_last_error_code = VSP_OK;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
thread_local std::array<char, ERROR_MESSAGE_BUFFER_SIZE> g_last_error_message = {};

} // anonymous namespace

void set_last_error(vsp_error_t code, const char* message) noexcept {
    g_last_error_code = code;

    if (VSP_LIKELY(message != nullptr)) {
        std::strncpy(g_last_error_message.data(), message, ERROR_MESSAGE_BUFFER_SIZE - 1);
        g_last_error_message[ERROR_MESSAGE_BUFFER_SIZE - 1] = '\0';
    } else {
        g_last_error_message[0] = '\0';
    }
}

void set_last_error(vsp_error_t code, std::string_view message) noexcept {
    g_last_error_code = code;

    const auto copy_len = std::min(message.size(), ERROR_MESSAGE_BUFFER_SIZE - 1);
    std::memcpy(g_last_error_message.data(), message.data(), copy_len);
    g_last_error_message[copy_len] = '\0';
}

void clear_last_error() noexcept {
    g_last_error_code = VSP_OK;
    g_last_error_message[0] = '\0';
}

auto get_last_error_message() noexcept -> const char* {
    if (VSP_LIKELY(g_last_error_message[0] != '\0')) {
        return g_last_error_message.data();
    }
    return "No error";
}

auto get_last_error_code() noexcept -> vsp_error_t {
    return g_last_error_code;
}

// =============================================================================
// Exception to Error Code Conversion
// =============================================================================

// Most specific first so a base class never shadows a derived one
[[nodiscard]] auto handle_exception() noexcept -> vsp_error_t {
    try {
        throw;
    }
    catch (const DimensionError& e) {
        set_last_error(VSP_ERROR_DIMENSION_MISMATCH, e.what());
        return VSP_ERROR_DIMENSION_MISMATCH;
    }
    catch (const RangeError& e) {
        set_last_error(VSP_ERROR_RANGE_ERROR, e.what());
        return VSP_ERROR_RANGE_ERROR;
    }
    catch (const ValueError& e) {
        set_last_error(VSP_ERROR_INVALID_ARGUMENT, e.what());
        return VSP_ERROR_INVALID_ARGUMENT;
    }
    catch (const OutOfMemoryError& e) {
        set_last_error(VSP_ERROR_OUT_OF_MEMORY, e.what());
        return VSP_ERROR_OUT_OF_MEMORY;
    }
    catch (const InternalError& e) {
        set_last_error(VSP_ERROR_INTERNAL, e.what());
        return VSP_ERROR_INTERNAL;
    }
    catch (const Exception& e) {
        set_last_error(VSP_ERROR_UNKNOWN, e.what());
        return VSP_ERROR_UNKNOWN;
    }
    catch (const std::bad_alloc&) {
        set_last_error(VSP_ERROR_OUT_OF_MEMORY, "Memory allocation failed (std::bad_alloc)");
        return VSP_ERROR_OUT_OF_MEMORY;
    }
    catch (const std::out_of_range& e) {
        set_last_error(VSP_ERROR_RANGE_ERROR, e.what());
        return VSP_ERROR_RANGE_ERROR;
    }
    catch (const std::logic_error& e) {
        set_last_error(VSP_ERROR_INVALID_ARGUMENT, e.what());
        return VSP_ERROR_INVALID_ARGUMENT;
    }
    catch (const std::exception& e) {
        set_last_error(VSP_ERROR_UNKNOWN, e.what());
        return VSP_ERROR_UNKNOWN;
    }
    catch (...) {
        set_last_error(VSP_ERROR_UNKNOWN, "Unknown exception (not derived from std::exception)");
        return VSP_ERROR_UNKNOWN;
    }
}

} // namespace vsp::binding

// =============================================================================
// C API Implementation
// =============================================================================

extern "C" {

VSP_EXPORT const char* vsp_get_version(void) {
    return "0.1.0";
}

VSP_EXPORT const char* vsp_get_build_config(void) {
    static const char* config_str =
        VSP_REAL_TYPE_NAME "+" VSP_INDEX_TYPE_NAME
#if defined(__AVX512F__)
        "+avx512"
#elif defined(__AVX2__)
        "+avx2"
#elif defined(__AVX__)
        "+avx"
#elif defined(__SSE4_2__)
        "+sse4.2"
#elif defined(__SSE2__)
        "+sse2"
#elif defined(__ARM_NEON)
        "+neon"
#else
        "+scalar"
#endif
#if defined(VSP_USE_OPENMP)
        "+openmp"
#elif defined(VSP_USE_TBB)
        "+tbb"
#elif defined(VSP_USE_BS)
        "+bs"
#else
        "+serial"
#endif
        ;
    return config_str;
}

VSP_EXPORT const char* vsp_get_last_error(void) {
    return vsp::binding::get_last_error_message();
}

VSP_EXPORT vsp_error_t vsp_get_last_error_code(void) {
    return vsp::binding::get_last_error_code();
}

VSP_EXPORT void vsp_clear_error(void) {
    vsp::binding::clear_last_error();
}

VSP_EXPORT vsp_bool_t vsp_is_ok(vsp_error_t code) {
    return (code == VSP_OK) ? VSP_TRUE : VSP_FALSE;
}

VSP_EXPORT vsp_bool_t vsp_is_error(vsp_error_t code) {
    return (code != VSP_OK) ? VSP_TRUE : VSP_FALSE;
}

VSP_EXPORT vsp_error_t vsp_set_num_threads(vsp_size_t n) {
    VSP_C_API_TRY
        vsp::threading::Scheduler::set_num_threads(n);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_size_t vsp_get_num_threads(void) {
    return vsp::threading::Scheduler::get_num_threads();
}

VSP_EXPORT vsp_error_t vsp_set_log_level(int32_t level) {
    VSP_C_API_CHECK(level >= 0 && level <= 2, VSP_ERROR_INVALID_ARGUMENT,
                    "Log level must be 0 (silent), 1 (warnings) or 2 (info)");
    vsp::log::set_level(static_cast<vsp::log::Level>(level));
    VSP_C_API_RETURN_OK;
}

} // extern "C"
