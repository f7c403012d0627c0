#pragma once

#include <memory>
#include <thread>
#include <cstddef>

#include "vsp/config.hpp"
#include "vsp/core/macros.hpp"

// =============================================================================
// FILE: vsp/threading/scheduler.hpp
// BRIEF: Thread count control across threading backends
// =============================================================================

#if defined(VSP_USE_BS)
    #include "BS_thread_pool.hpp"
#elif defined(VSP_USE_OPENMP)
    #include <omp.h>
#elif defined(VSP_USE_TBB)
    #include <tbb/global_control.h>
#endif

namespace vsp::threading {

namespace detail {
#if defined(VSP_USE_BS)
    // Process-wide pool, never destroyed
    inline BS::thread_pool& get_global_pool() {
        static BS::thread_pool pool;
        return pool;
    }
#endif

#if defined(VSP_USE_TBB)
    inline std::unique_ptr<tbb::global_control>& tbb_control() {
        static std::unique_ptr<tbb::global_control> gc;
        return gc;
    }
#endif
}

class Scheduler {
public:
    static constexpr size_t MAX_THREADS = 1024;

    // At least 1 even when detection fails
    VSP_FORCE_INLINE static size_t hardware_concurrency() noexcept {
        const size_t hw = std::thread::hardware_concurrency();
        return (hw > 0) ? hw : 1;
    }

    // n == 0 selects hardware_concurrency(). Expensive on the BS backend
    // (the pool is rebuilt), do not call from inner loops.
    static void set_num_threads(size_t n) {
        if (n == 0) {
            n = hardware_concurrency();
        }
        if (n > MAX_THREADS) {
            n = MAX_THREADS;
        }

#if defined(VSP_USE_SERIAL)
        (void)n;
#elif defined(VSP_USE_OPENMP)
        omp_set_num_threads(static_cast<int>(n));
#elif defined(VSP_USE_BS)
        detail::get_global_pool().reset(n);
#elif defined(VSP_USE_TBB)
        detail::tbb_control() = std::make_unique<tbb::global_control>(
            tbb::global_control::max_allowed_parallelism, static_cast<int>(n));
#else
        (void)n;
#endif
    }

    static size_t get_num_threads() noexcept {
#if defined(VSP_USE_SERIAL)
        return 1;
#elif defined(VSP_USE_OPENMP)
        const int n = omp_get_max_threads();
        return (n > 0) ? static_cast<size_t>(n) : 1;
#elif defined(VSP_USE_BS)
        const size_t n = detail::get_global_pool().get_thread_count();
        return (n > 0) ? n : 1;
#elif defined(VSP_USE_TBB)
        const auto n = tbb::global_control::active_value(tbb::global_control::max_allowed_parallelism);
        return (n > 0) ? static_cast<size_t>(n) : 1;
#else
        return 1;
#endif
    }

    static const char* backend_name() noexcept {
#if defined(VSP_USE_SERIAL)
        return "serial";
#elif defined(VSP_USE_OPENMP)
        return "openmp";
#elif defined(VSP_USE_BS)
        return "bs";
#elif defined(VSP_USE_TBB)
        return "tbb";
#else
        return "unknown";
#endif
    }

    static void init(size_t n = 0) {
        set_num_threads(n);
    }
};

} // namespace vsp::threading
