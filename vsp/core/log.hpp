#pragma once

#include "vsp/config.hpp"
#include "vsp/core/macros.hpp"

#include <atomic>
#include <cstdio>

// =============================================================================
// FILE: vsp/core/log.hpp
// BRIEF: Minimal stderr diagnostics for recoverable conditions
// =============================================================================

namespace vsp::log {

enum class Level : int {
    Silent = 0,
    Warning = 1,
    Info = 2
};

namespace detail {
    inline std::atomic<int>& level_ref() noexcept {
        static std::atomic<int> level{VSP_LOG_LEVEL};
        return level;
    }
}

inline void set_level(Level level) noexcept {
    detail::level_ref().store(static_cast<int>(level), std::memory_order_relaxed);
}

[[nodiscard]] inline bool enabled(Level level) noexcept {
    return detail::level_ref().load(std::memory_order_relaxed) >= static_cast<int>(level);
}

} // namespace vsp::log

// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define VSP_LOG_WARN(...) \
    do { \
        if (vsp::log::enabled(vsp::log::Level::Warning)) { \
            std::fprintf(stderr, "WARNING: " __VA_ARGS__); \
            std::fputc('\n', stderr); \
        } \
    } while(0)

#define VSP_LOG_INFO(...) \
    do { \
        if (vsp::log::enabled(vsp::log::Level::Info)) { \
            std::fprintf(stderr, "INFO: " __VA_ARGS__); \
            std::fputc('\n', stderr); \
        } \
    } while(0)
// NOLINTEND(cppcoreguidelines-macro-usage)
