#pragma once

#include "vsp/core/macros.hpp"
#include "vsp/math/stats.hpp"

#include <cmath>

// =============================================================================
// FILE: vsp/math/mwu.hpp
// BRIEF: Mann-Whitney U moments and normal-approximation p-values
// =============================================================================

// tie_sum is sum(t^3 - t) over groups of tied values in the pooled sample.

namespace vsp::math::mwu {

namespace detail {

VSP_FORCE_INLINE void moments(
    double n1, double n2, double tie_sum,
    double& mu, double& sd
) {
    const double N = n1 + n2;
    mu = 0.5 * n1 * n2;

    const double denom = N * (N - 1.0);

    double var;
    if (denom > 0.0) {
        var = (n1 * n2 / 12.0) * (N + 1.0 - tie_sum / denom);
    } else {
        var = (n1 * n2 / 12.0) * (N + 1.0);
    }

    if (var < 0.0) var = 0.0;

    sd = std::sqrt(var);
}

} // namespace detail

VSP_FORCE_INLINE double p_value_two_sided(
    double U, double n1, double n2, double tie_sum = 0.0, double cc = 0.5
) {
    double mu, sd;
    detail::moments(n1, n2, tie_sum, mu, sd);

    if (sd <= 0.0) {
        return 1.0;
    }

    double diff = std::abs(U - mu) - cc;
    if (diff < 0.0) diff = 0.0;

    const double p = 2.0 * vsp::math::normal_sf(diff / sd);
    return p > 1.0 ? 1.0 : p;
}

} // namespace vsp::math::mwu
