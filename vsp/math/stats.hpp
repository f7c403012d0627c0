#pragma once

#include "vsp/core/macros.hpp"

#include <cmath>
#include <cstddef>
#include <limits>
#include <vector>

// =============================================================================
// FILE: vsp/math/stats.hpp
// BRIEF: Distribution functions for significance tests (full double precision)
// =============================================================================

namespace vsp::math {

// =============================================================================
// Normal Distribution
// =============================================================================

VSP_FORCE_INLINE double normal_sf(double z) {
    return 0.5 * std::erfc(z * 0.7071067811865475);
}

// P(|Z| >= |z|), clamped to [0, 1]
VSP_FORCE_INLINE double normal_two_sided(double z) {
    const double p = 2.0 * normal_sf(std::abs(z));
    return p > 1.0 ? 1.0 : p;
}

// =============================================================================
// Regularized Incomplete Beta
// =============================================================================

namespace detail {

constexpr int BETACF_MAX_ITER = 300;
constexpr double BETACF_EPS = 1e-15;
constexpr double BETACF_FPMIN = 1e-300;

// Lentz continued fraction for I_x(a, b)
inline double betacf(double a, double b, double x) {
    const double qab = a + b;
    const double qap = a + 1.0;
    const double qam = a - 1.0;

    double c = 1.0;
    double d = 1.0 - qab * x / qap;
    if (std::abs(d) < BETACF_FPMIN) d = BETACF_FPMIN;
    d = 1.0 / d;
    double h = d;

    for (int m = 1; m <= BETACF_MAX_ITER; ++m) {
        const double m2 = 2.0 * m;

        double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < BETACF_FPMIN) d = BETACF_FPMIN;
        c = 1.0 + aa / c;
        if (std::abs(c) < BETACF_FPMIN) c = BETACF_FPMIN;
        d = 1.0 / d;
        h *= d * c;

        aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
        d = 1.0 + aa * d;
        if (std::abs(d) < BETACF_FPMIN) d = BETACF_FPMIN;
        c = 1.0 + aa / c;
        if (std::abs(c) < BETACF_FPMIN) c = BETACF_FPMIN;
        d = 1.0 / d;
        const double del = d * c;
        h *= del;

        if (std::abs(del - 1.0) < BETACF_EPS) break;
    }
    return h;
}

} // namespace detail

inline double incomplete_beta(double a, double b, double x) {
    if (x <= 0.0) return 0.0;
    if (x >= 1.0) return 1.0;

    const double log_front = std::lgamma(a + b) - std::lgamma(a) - std::lgamma(b)
                           + a * std::log(x) + b * std::log1p(-x);
    const double front = std::exp(log_front);

    // Use the symmetry relation where the continued fraction converges fast
    if (x < (a + 1.0) / (a + b + 2.0)) {
        return front * detail::betacf(a, b, x) / a;
    }
    return 1.0 - front * detail::betacf(b, a, 1.0 - x) / b;
}

// =============================================================================
// Student t Distribution
// =============================================================================

// P(|T| >= |t|) for T ~ t(df)
inline double t_two_sided(double t, double df) {
    if (std::isnan(t) || !(df > 0.0)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    if (std::isinf(t)) {
        return 0.0;
    }
    const double x = df / (df + t * t);
    const double p = incomplete_beta(0.5 * df, 0.5, x);
    return p > 1.0 ? 1.0 : (p < 0.0 ? 0.0 : p);
}

// =============================================================================
// Kendall Statistic (exact, no ties)
// =============================================================================

// Two-sided P for n untied points with c = min(discordant, concordant) pairs.
// Counts permutations of n with at most c inversions.
inline double kendall_exact_two_sided(std::size_t n, std::size_t c) {
    const std::size_t total = n * (n - 1) / 2;
    if (n <= 2 || 2 * c >= total) return 1.0;

    double factorial = 1.0;
    for (std::size_t k = 2; k <= n; ++k) factorial *= static_cast<double>(k);
    if (c == 0) return 2.0 / factorial;
    if (c == 1) return 2.0 * static_cast<double>(n) / factorial;

    // counts[k] = permutations of j elements with k inversions, k <= c
    std::vector<double> counts(c + 1, 0.0);
    counts[0] = 1.0;
    counts[1] = 1.0;
    for (std::size_t j = 3; j <= n; ++j) {
        for (std::size_t k = 1; k <= c; ++k) counts[k] += counts[k - 1];
        for (std::size_t k = c; k >= j; --k) counts[k] -= counts[k - j];
    }

    double tail = 0.0;
    for (double v : counts) tail += v;
    const double p = 2.0 * tail / factorial;
    return p > 1.0 ? 1.0 : p;
}

// =============================================================================
// Kolmogorov Distribution
// =============================================================================

// Q_KS(lambda) = 2 * sum_{k>=1} (-1)^(k-1) exp(-2 k^2 lambda^2)
inline double kolmogorov_sf(double lambda) {
    if (lambda < 0.2) {
        return 1.0;
    }

    constexpr int MAX_TERMS = 100;
    constexpr double EPS = 1e-12;

    const double a2 = -2.0 * lambda * lambda;
    double sum = 0.0;
    double sign = 1.0;
    double prev_term = 0.0;

    for (int k = 1; k <= MAX_TERMS; ++k) {
        const double term = sign * 2.0 * std::exp(a2 * k * k);
        sum += term;
        if (std::abs(term) <= EPS * std::abs(prev_term) || std::abs(term) <= EPS * sum) {
            break;
        }
        sign = -sign;
        prev_term = term;
    }

    if (sum < 0.0) return 0.0;
    if (sum > 1.0) return 1.0;
    return sum;
}

} // namespace vsp::math
