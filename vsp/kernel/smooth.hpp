#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/memory.hpp"
#include "vsp/core/grid.hpp"
#include "vsp/core/log.hpp"
#include "vsp/kernel/stats.hpp"
#include "vsp/threading/parallel_for.hpp"

#include <cmath>
#include <vector>

// =============================================================================
// FILE: vsp/kernel/smooth.hpp
// BRIEF: NaN-aware separable Gaussian smoothing
// =============================================================================

namespace vsp::kernel::smooth {

namespace config {
    constexpr Size PARALLEL_ROW_THRESHOLD = 32;
}

namespace detail {

// Half-sample symmetric boundary: (d c b a | a b c d | d c b a)
VSP_FORCE_INLINE Index reflect_index(Index i, Index n) noexcept {
    if (n == 1) return 0;
    const Index period = 2 * n;
    Index m = i % period;
    if (m < 0) m += period;
    return (m < n) ? m : (period - 1 - m);
}

// Normalized weights for offsets -radius..radius
inline std::vector<Real> gaussian_weights(Real sigma, Index radius) {
    std::vector<Real> w(static_cast<Size>(2 * radius + 1));
    const Real inv_two_var = Real(-0.5) / (sigma * sigma);
    Real total = 0;
    for (Index k = -radius; k <= radius; ++k) {
        const Real v = std::exp(inv_two_var * static_cast<Real>(k * k));
        w[static_cast<Size>(k + radius)] = v;
        total += v;
    }
    for (auto& v : w) v /= total;
    return w;
}

} // namespace detail

inline Index kernel_radius(Real sigma) noexcept {
    return static_cast<Index>(Real(analysis::GAUSSIAN_TRUNCATE) * sigma + Real(0.5));
}

// Fills missing cells with the median of the valid ones, convolves with a
// truncated Gaussian (radius = int(4 sigma + 0.5)) and puts the missing cells back.
inline RealGrid gaussian_filter(GridView<const Real> grid, Real sigma) {
    VSP_CHECK_ARG(std::isfinite(sigma) && sigma > Real(0),
                  "gaussian_filter: sigma must be a positive finite number");

    const auto sorted = stats::sorted_valid(grid);
    if (sorted.size() == 0) {
        VSP_LOG_WARN("gaussian_filter: grid has no valid cells, returned unchanged");
        return RealGrid::copy_of(grid);
    }

    const Real fill_value = stats::median_sorted(sorted.array());
    const Index rows = grid.rows;
    const Index cols = grid.cols;

    RealGrid filled(rows, cols);
    const Size n = grid.size();
    for (Size i = 0; i < n; ++i) {
        const Real v = grid.ptr[i];
        filled.data()[i] = is_valid(v) ? v : fill_value;
    }

    const Index radius = kernel_radius(sigma);
    const auto w = detail::gaussian_weights(sigma, radius);

    // Pass 1: along columns of each row
    RealGrid tmp(rows, cols);
    threading::parallel_for(Size(0), static_cast<Size>(rows), [&](size_t r) {
        const auto row = static_cast<Index>(r);
        const Real* src = filled.data() + row * cols;
        Real* dst = tmp.data() + row * cols;
        for (Index c = 0; c < cols; ++c) {
            Real acc = 0;
            for (Index k = -radius; k <= radius; ++k) {
                acc += w[static_cast<Size>(k + radius)] * src[detail::reflect_index(c + k, cols)];
            }
            dst[c] = acc;
        }
    }, config::PARALLEL_ROW_THRESHOLD);

    // Pass 2: along rows, then restore missing cells
    RealGrid out(rows, cols);
    threading::parallel_for(Size(0), static_cast<Size>(rows), [&](size_t r) {
        const auto row = static_cast<Index>(r);
        Real* dst = out.data() + row * cols;
        for (Index c = 0; c < cols; ++c) {
            if (!is_valid(grid(row, c))) {
                dst[c] = MISSING;
                continue;
            }
            Real acc = 0;
            for (Index k = -radius; k <= radius; ++k) {
                acc += w[static_cast<Size>(k + radius)] * tmp(detail::reflect_index(row + k, rows), c);
            }
            dst[c] = acc;
        }
    }, config::PARALLEL_ROW_THRESHOLD);

    return out;
}

} // namespace vsp::kernel::smooth
