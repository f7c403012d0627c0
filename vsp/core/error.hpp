#pragma once

#include "vsp/core/macros.hpp"
#include <exception>
#include <string>
#include <utility>
#include <cstdint>

// =============================================================================
// FILE: vsp/core/error.hpp
// BRIEF: Exceptions raised by grid kernels and their C-ABI error codes
// =============================================================================
//
// Data conditions (no valid cells, constant surface, too few points) are not
// errors: kernels return std::nullopt or an unavailable field for those.
// Exceptions are reserved for caller mistakes and broken invariants.
//
// =============================================================================

namespace vsp {

// Values are shared with the VSP_ERROR_* defines in binding/c_api/core/core.h
enum class ErrorCode : std::int32_t {
    OK = 0,

    UNKNOWN = 1,
    INTERNAL_ERROR = 2,
    OUT_OF_MEMORY = 3,
    NULL_POINTER = 4,          // raised by the C layer only

    INVALID_ARGUMENT = 10,     // bad parameter or unknown method name
    DIMENSION_MISMATCH = 11,   // paired grids or series of different shape
    RANGE_ERROR = 13,          // parameter outside its admissible interval
};

class VSP_EXPORT Exception : public std::exception {
public:
    explicit Exception(ErrorCode code, std::string msg)
        : code_(code), msg_(std::move(msg)) {}

    [[nodiscard]] auto what() const noexcept -> const char* override {
        return msg_.c_str();
    }

    [[nodiscard]] auto code() const noexcept -> ErrorCode {
        return code_;
    }

private:
    ErrorCode code_;
    std::string msg_;
};

// Aligned allocation failed
class OutOfMemoryError : public Exception {
public:
    explicit OutOfMemoryError(const std::string& msg = "Out of memory")
        : Exception(ErrorCode::OUT_OF_MEMORY, msg) {}
};

// A kernel invariant did not hold; always a bug in vsp
class InternalError : public Exception {
public:
    explicit InternalError(const std::string& msg)
        : Exception(ErrorCode::INTERNAL_ERROR, "Internal VSP Error: " + msg) {}
};

class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg)
        : Exception(ErrorCode::INVALID_ARGUMENT, msg) {}

protected:
    ValueError(ErrorCode code, std::string msg)
        : Exception(code, std::move(msg)) {}
};

class DimensionError : public ValueError {
public:
    explicit DimensionError(const std::string& msg)
        : ValueError(ErrorCode::DIMENSION_MISMATCH, msg) {}
};

class RangeError : public ValueError {
public:
    explicit RangeError(const std::string& msg)
        : ValueError(ErrorCode::RANGE_ERROR, msg) {}
};

// =============================================================================
// Helper Macros
// =============================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

// Internal invariant (active in all builds)
#define VSP_ASSERT(condition, msg) \
    do { \
        if (VSP_UNLIKELY(!(condition))) { \
            throw vsp::InternalError(std::string(msg) + " (" + __FILE__ + ":" + std::to_string(__LINE__) + ")"); \
        } \
    } while(0)

#define VSP_CHECK_ARG(condition, msg) \
    do { \
        if (VSP_UNLIKELY(!(condition))) { \
            throw vsp::ValueError(msg); \
        } \
    } while(0)

#define VSP_CHECK_DIM(condition, msg) \
    do { \
        if (VSP_UNLIKELY(!(condition))) { \
            throw vsp::DimensionError(msg); \
        } \
    } while(0)

// Closed interval [min_val, max_val]; NaN fails
#define VSP_CHECK_RANGE(value, min_val, max_val, msg) \
    do { \
        if (VSP_UNLIKELY(!((value) >= (min_val) && (value) <= (max_val)))) { \
            throw vsp::RangeError(msg); \
        } \
    } while(0)

// NOLINTEND(cppcoreguidelines-macro-usage)

} // namespace vsp
