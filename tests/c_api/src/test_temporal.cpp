// =============================================================================
// VSP Core - Temporal Change Analysis Tests
// =============================================================================
//
// Complete test coverage for vsp/binding/c_api/temporal.h
//
// Functions tested:
//   - vsp_temporal_difference
//   - vsp_temporal_velocity
//   - vsp_temporal_compare
//   - vsp_temporal_linear_trend
//   - vsp_temporal_mann_kendall
//   - vsp_temporal_step_changes
//   - vsp_temporal_compare_periods
//   - vsp_temporal_breakpoint
//   - vsp_trend_name / vsp_change_type_name
//   - vsp::kernel::temporal shape checks (C++ API)
//
// Reference implementation: oracle::ols (Eigen QR) for the trend slope
//
// =============================================================================

#include "test.hpp"

#include "vsp/kernel/temporal.hpp"

using namespace vsp::test;
using precision::Tolerance;
using precision::approx_equal;

namespace {

struct Diff {
    vsp_error_t err;
    GridData diff;
    MaskData inc;
    MaskData dec;
    MaskData same;
    vsp_diff_summary_t summary;
};

Diff difference(const GridData& a, const GridData& b, vsp_index_t rows, vsp_index_t cols) {
    Diff d{VSP_OK, GridData(a.size()), MaskData(a.size(), 7), MaskData(a.size(), 7),
           MaskData(a.size(), 7), {}};
    d.err = vsp_temporal_difference(a.data(), b.data(), rows, cols, d.diff.data(),
                                    d.inc.data(), d.dec.data(), d.same.data(), &d.summary);
    return d;
}

} // anonymous namespace

VSP_TEST_BEGIN

// =============================================================================
// Difference
// =============================================================================

VSP_TEST_SUITE(difference)

VSP_TEST_CASE(identical_grids_no_change) {
    Random rng(81);
    auto a = random_grid(6, 6, 0.0, 1.0, 0.0, rng);
    auto d = difference(a, a, 6, 6);
    VSP_ASSERT_EQ(d.err, VSP_OK);
    VSP_ASSERT_EQ(d.summary.available, VSP_TRUE);
    VSP_ASSERT_NEAR(0.0, d.summary.threshold, 0.0);
    VSP_ASSERT_EQ(d.summary.n_no_change, static_cast<vsp_size_t>(36));
    VSP_ASSERT_EQ(d.summary.n_increase, static_cast<vsp_size_t>(0));
    VSP_ASSERT_EQ(d.summary.n_decrease, static_cast<vsp_size_t>(0));
    VSP_ASSERT_NEAR(100.0, d.summary.pct_no_change, 1e-12);
    for (auto v : d.diff) {
        VSP_ASSERT_NEAR(0.0, v, 0.0);
    }
}

VSP_TEST_CASE(strong_change_classes) {
    GridData a(10, 0.5);
    GridData b = {-2.5, -0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 0.5, 1.5, 3.5};
    // b - a = {-3, -1, 0 x6, 1, 3}: mean 0, std sqrt(2), threshold sqrt(2) / 2
    auto d = difference(a, b, 2, 5);
    VSP_ASSERT_EQ(d.err, VSP_OK);
    VSP_ASSERT_NEAR(std::sqrt(2.0) * 0.5, d.summary.threshold, 1e-12);
    VSP_ASSERT_NEAR(0.0, d.summary.diff.mean, 1e-12);
    VSP_ASSERT_EQ(d.summary.n_increase, static_cast<vsp_size_t>(2));
    VSP_ASSERT_EQ(d.summary.n_decrease, static_cast<vsp_size_t>(2));
    VSP_ASSERT_EQ(d.summary.n_no_change, static_cast<vsp_size_t>(6));
    VSP_ASSERT_NEAR(20.0, d.summary.pct_increase, 1e-12);
    VSP_ASSERT_EQ(d.inc[9], static_cast<vsp_mask_t>(1));
    VSP_ASSERT_EQ(d.dec[0], static_cast<vsp_mask_t>(1));
    VSP_ASSERT_EQ(d.same[4], static_cast<vsp_mask_t>(1));
    VSP_ASSERT_NEAR(3.0, d.diff[9], 1e-12);
}

VSP_TEST_CASE(masks_partition_valid_cells) {
    Random rng(83);
    auto a = random_grid(15, 15, 0.0, 1.0, 0.1, rng);
    auto b = random_grid(15, 15, 0.0, 1.0, 0.1, rng);
    auto d = difference(a, b, 15, 15);
    VSP_ASSERT_EQ(d.err, VSP_OK);

    vsp_size_t valid = 0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const bool both = std::isfinite(a[i]) && std::isfinite(b[i]);
        const int flags = d.inc[i] + d.dec[i] + d.same[i];
        if (both) {
            ++valid;
            VSP_ASSERT_EQ(flags, 1);
            VSP_ASSERT_NEAR(b[i] - a[i], d.diff[i], 1e-15);
        } else {
            VSP_ASSERT_EQ(flags, 0);
            VSP_ASSERT_NAN(d.diff[i]);
        }
    }
    VSP_ASSERT_EQ(valid, d.summary.diff.n);
    VSP_ASSERT_EQ(valid, d.summary.n_increase + d.summary.n_decrease + d.summary.n_no_change);
}

VSP_TEST_CASE(no_overlap_is_unavailable) {
    GridData a = {1.0, NaN, 2.0, NaN};
    GridData b = {NaN, 1.0, NaN, 2.0};
    auto d = difference(a, b, 2, 2);
    VSP_ASSERT_EQ(d.err, VSP_OK);
    VSP_ASSERT_EQ(d.summary.available, VSP_FALSE);
    for (std::size_t i = 0; i < 4; ++i) {
        VSP_ASSERT_NAN(d.diff[i]);
        VSP_ASSERT_EQ(d.same[i], static_cast<vsp_mask_t>(0));
    }
}

VSP_TEST_CASE(optional_outputs) {
    GridData a(4, 0.1), b(4, 0.3);
    vsp_diff_summary_t summary;
    VSP_ASSERT_EQ(vsp_temporal_difference(a.data(), b.data(), 2, 2, nullptr, nullptr, nullptr,
                                          nullptr, &summary), VSP_OK);
    VSP_ASSERT_NEAR(0.2, summary.diff.mean, 1e-12);
    VSP_ASSERT_EQ(vsp_temporal_difference(a.data(), nullptr, 2, 2, nullptr, nullptr, nullptr,
                                          nullptr, &summary), VSP_ERROR_NULL_POINTER);
}

VSP_TEST_SUITE_END

// =============================================================================
// Velocity
// =============================================================================

VSP_TEST_SUITE(velocity)

VSP_TEST_CASE(rate_per_day) {
    GridData a = {0.2, 0.4, NaN, 0.6};
    GridData b = {0.5, 0.1, 0.3, 0.6};
    GridData out(4);
    VSP_ASSERT_EQ(vsp_temporal_velocity(a.data(), b.data(), 2, 2, 10.0, out.data()), VSP_OK);
    VSP_ASSERT_NEAR(0.03, out[0], 1e-12);
    VSP_ASSERT_NEAR(-0.03, out[1], 1e-12);
    VSP_ASSERT_NAN(out[2]);
    VSP_ASSERT_NEAR(0.0, out[3], 1e-15);
}

VSP_TEST_CASE(zero_days_gives_zeros) {
    GridData a = {0.2, 0.4, NaN, 0.6};
    GridData b = {0.5, 0.1, 0.3, 0.9};
    GridData out(4, 1.0);
    VSP_ASSERT_EQ(vsp_temporal_velocity(a.data(), b.data(), 2, 2, 0.0, out.data()), VSP_OK);
    for (auto v : out) {
        VSP_ASSERT_EQ(static_cast<vsp_real_t>(0), v);
    }
}

VSP_TEST_CASE(non_finite_days) {
    GridData a(4, 0.1), b(4, 0.2), out(4);
    VSP_ASSERT_EQ(vsp_temporal_velocity(a.data(), b.data(), 2, 2, NaN, out.data()),
                  VSP_ERROR_INVALID_ARGUMENT);
    VSP_ASSERT_EQ(vsp_temporal_velocity(a.data(), b.data(), 2, 2,
                                        std::numeric_limits<vsp_real_t>::infinity(), out.data()),
                  VSP_ERROR_INVALID_ARGUMENT);
}

VSP_TEST_SUITE_END

// =============================================================================
// Distribution Comparison
// =============================================================================

VSP_TEST_SUITE(compare)

VSP_TEST_CASE(identical_samples) {
    auto a = fixture::sequence_4x4();
    vsp_comparison_t c;
    VSP_ASSERT_EQ(vsp_temporal_compare(a.data(), 4, 4, a.data(), 4, 4, &c), VSP_OK);
    VSP_ASSERT_EQ(c.available, VSP_TRUE);
    VSP_ASSERT_NEAR(0.0, c.mean_diff, 0.0);
    VSP_ASSERT_NEAR(0.0, c.pct_diff, 0.0);
    VSP_ASSERT_NEAR(0.0, c.ks_statistic, 0.0);
    VSP_ASSERT_NEAR(1.0, c.ks_p_value, 1e-12);
    VSP_ASSERT_NEAR(0.0, c.t_statistic, 0.0);
    VSP_ASSERT_NEAR(1.0, c.t_p_value, 1e-9);
    VSP_ASSERT_NEAR(128.0, c.mwu_statistic, 1e-12);
    VSP_ASSERT_NEAR(1.0, c.mwu_p_value, 1e-12);
    VSP_ASSERT_EQ(c.differ, VSP_FALSE);
}

VSP_TEST_CASE(shifted_distributions_differ) {
    Random rng(89);
    auto a = normal_grid(20, 20, 0.3, 0.1, rng);
    auto b = normal_grid(15, 25, 0.6, 0.1, rng);
    vsp_comparison_t c;
    VSP_ASSERT_EQ(vsp_temporal_compare(a.data(), 20, 20, b.data(), 15, 25, &c), VSP_OK);

    VSP_ASSERT_EQ(c.n_a, static_cast<vsp_size_t>(400));
    VSP_ASSERT_EQ(c.n_b, static_cast<vsp_size_t>(375));
    VSP_ASSERT_NEAR(0.3, c.mean_diff, 0.05);
    VSP_ASSERT_NEAR(100.0, c.pct_diff, 20.0);
    VSP_ASSERT_GT(c.ks_statistic, 0.7);
    VSP_ASSERT_LT(c.ks_p_value, 1e-6);
    VSP_ASSERT_LT(c.t_statistic, 0.0);
    VSP_ASSERT_LT(c.t_p_value, 1e-6);
    VSP_ASSERT_LT(c.mwu_p_value, 1e-6);
    VSP_ASSERT_EQ(c.differ, VSP_TRUE);
}

VSP_TEST_CASE(same_distribution_not_flagged) {
    Random rng(97);
    auto a = normal_grid(30, 30, 0.5, 0.1, rng);
    auto b = normal_grid(30, 30, 0.5, 0.1, rng);
    vsp_comparison_t c;
    VSP_ASSERT_EQ(vsp_temporal_compare(a.data(), 30, 30, b.data(), 30, 30, &c), VSP_OK);
    VSP_ASSERT_LT(c.ks_statistic, 0.1);
    VSP_ASSERT_GT(c.ks_p_value, 0.001);
    VSP_ASSERT_GT(c.mwu_p_value, 0.001);
}

VSP_TEST_CASE(constant_samples_have_no_t) {
    auto a = constant_grid(3, 3, 0.4);
    auto b = constant_grid(3, 3, 0.4);
    vsp_comparison_t c;
    VSP_ASSERT_EQ(vsp_temporal_compare(a.data(), 3, 3, b.data(), 3, 3, &c), VSP_OK);
    VSP_ASSERT_EQ(c.available, VSP_TRUE);
    VSP_ASSERT_NAN(c.t_statistic);
    VSP_ASSERT_NAN(c.t_p_value);
    VSP_ASSERT_NEAR(1.0, c.mwu_p_value, 1e-12);
}

VSP_TEST_CASE(zero_reference_mean) {
    GridData a = {-1.0, 1.0, -1.0, 1.0};
    GridData b = {0.0, 1.0, 2.0, 3.0};
    vsp_comparison_t c;
    VSP_ASSERT_EQ(vsp_temporal_compare(a.data(), 2, 2, b.data(), 2, 2, &c), VSP_OK);
    VSP_ASSERT_NAN(c.pct_diff);
    VSP_ASSERT_NEAR(1.5, c.mean_diff, 1e-12);
}

VSP_TEST_CASE(too_few_valid_cells) {
    auto a = fixture::single_valid_5x5();
    auto b = fixture::sequence_4x4();
    vsp_comparison_t c;
    VSP_ASSERT_EQ(vsp_temporal_compare(a.data(), 5, 5, b.data(), 4, 4, &c), VSP_OK);
    VSP_ASSERT_EQ(c.available, VSP_FALSE);
    VSP_ASSERT_EQ(c.n_a, static_cast<vsp_size_t>(1));
    VSP_ASSERT_EQ(c.n_b, static_cast<vsp_size_t>(16));
    VSP_ASSERT_NAN(c.ks_p_value);
}

VSP_TEST_SUITE_END

// =============================================================================
// Linear Trend
// =============================================================================

VSP_TEST_SUITE(linear_trend)

VSP_TEST_CASE(exact_line) {
    GridData t(10), y(10);
    for (std::size_t i = 0; i < 10; ++i) {
        t[i] = static_cast<vsp_real_t>(i);
        y[i] = static_cast<vsp_real_t>(2.0 + 0.5 * static_cast<double>(i));
    }
    vsp_linear_trend_t r;
    VSP_ASSERT_EQ(vsp_temporal_linear_trend(t.data(), y.data(), 10, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_TRUE);
    VSP_ASSERT_NEAR(0.5, r.slope, 1e-12);
    VSP_ASSERT_NEAR(2.0, r.intercept, 1e-12);
    VSP_ASSERT_NEAR(1.0, r.r_squared, 1e-12);
    VSP_ASSERT_NEAR(0.0, r.p_value, 1e-12);
    VSP_ASSERT_EQ(r.significant, VSP_TRUE);
    VSP_ASSERT_EQ(r.direction, VSP_TREND_INCREASING);
    VSP_ASSERT_NEAR(9.0, r.span, 0.0);
    VSP_ASSERT_NEAR(4.5, r.total_change, 1e-12);
    VSP_ASSERT_NEAR(225.0, r.pct_change, 1e-9);
    VSP_ASSERT_EQ(r.n, static_cast<vsp_size_t>(10));
}

VSP_TEST_CASE(total_change_spans_first_to_last) {
    // Offsets need not start at day 0
    GridData t = {100, 110, 130, 160};
    GridData y = {1.3, 1.4, 1.6, 1.9};
    vsp_linear_trend_t r;
    VSP_ASSERT_EQ(vsp_temporal_linear_trend(t.data(), y.data(), 4, &r), VSP_OK);
    VSP_ASSERT_NEAR(0.01, r.slope, 1e-12);
    VSP_ASSERT_NEAR(60.0, r.span, 0.0);
    VSP_ASSERT_NEAR(0.6, r.total_change, 1e-12);
    VSP_ASSERT_NEAR(0.3, r.intercept, 1e-10);
    VSP_ASSERT_NEAR(200.0, r.pct_change, 1e-8);
}

VSP_TEST_CASE(noisy_decline_matches_ols) {
    Random rng(101);
    std::vector<double> t, y;
    GridData tv, yv;
    for (int i = 0; i < 40; ++i) {
        const double day = 8.0 * i;
        const double value = 0.8 - 0.001 * day + rng.normal(0.0, 0.02);
        t.push_back(day);
        y.push_back(value);
        tv.push_back(static_cast<vsp_real_t>(day));
        yv.push_back(static_cast<vsp_real_t>(value));
    }
    vsp_linear_trend_t r;
    VSP_ASSERT_EQ(vsp_temporal_linear_trend(tv.data(), yv.data(), tv.size(), &r), VSP_OK);

    const auto [slope, intercept] = oracle::ols(t, y);
    VSP_ASSERT_TRUE(approx_equal(slope, r.slope, Tolerance::relaxed()));
    VSP_ASSERT_TRUE(approx_equal(intercept, r.intercept, Tolerance::relaxed()));
    VSP_ASSERT_GT(r.std_err, 0.0);
    VSP_ASSERT_LT(r.p_value, 0.05);
    VSP_ASSERT_EQ(r.direction, VSP_TREND_DECREASING);
}

VSP_TEST_CASE(flat_series_no_trend) {
    GridData t = {0, 1, 2, 3, 4};
    GridData y = {0.5, 0.5, 0.5, 0.5, 0.5};
    vsp_linear_trend_t r;
    VSP_ASSERT_EQ(vsp_temporal_linear_trend(t.data(), y.data(), 5, &r), VSP_OK);
    VSP_ASSERT_NEAR(0.0, r.slope, 0.0);
    VSP_ASSERT_NEAR(0.0, r.r_squared, 0.0);
    VSP_ASSERT_EQ(r.significant, VSP_FALSE);
    VSP_ASSERT_EQ(r.direction, VSP_TREND_NONE);
}

VSP_TEST_CASE(missing_pairs_skipped) {
    GridData t = {0, 1, NaN, 3, 4};
    GridData y = {1, 2, 100, NaN, 5};
    vsp_linear_trend_t r;
    VSP_ASSERT_EQ(vsp_temporal_linear_trend(t.data(), y.data(), 5, &r), VSP_OK);
    VSP_ASSERT_EQ(r.n, static_cast<vsp_size_t>(3));
    VSP_ASSERT_NEAR(1.0, r.slope, 1e-12);
    VSP_ASSERT_NEAR(4.0, r.span, 0.0);
}

VSP_TEST_CASE(degenerate_inputs) {
    GridData t = {3, 3, 3};
    GridData y = {1, 2, 3};
    vsp_linear_trend_t r;
    VSP_ASSERT_EQ(vsp_temporal_linear_trend(t.data(), y.data(), 3, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_FALSE);
    VSP_ASSERT_NAN(r.slope);

    VSP_ASSERT_EQ(vsp_temporal_linear_trend(t.data(), y.data(), 1, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_FALSE);
    VSP_ASSERT_EQ(vsp_temporal_linear_trend(nullptr, y.data(), 3, &r), VSP_ERROR_NULL_POINTER);
}

VSP_TEST_SUITE_END

// =============================================================================
// Mann-Kendall
// =============================================================================

VSP_TEST_SUITE(mann_kendall)

VSP_TEST_CASE(monotonic_increase) {
    auto y = sequence_grid(1, 10);
    vsp_mann_kendall_t r;
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_TRUE);
    VSP_ASSERT_NEAR(45.0, r.s, 0.0);
    VSP_ASSERT_NEAR(1.0, r.tau, 1e-12);
    VSP_ASSERT_NEAR(45.0 / std::sqrt(125.0), r.z_score, 1e-10);
    VSP_ASSERT_LT(r.p_value, 0.001);
    VSP_ASSERT_EQ(r.direction, VSP_TREND_INCREASING);
}

VSP_TEST_CASE(monotonic_decrease_with_missing) {
    GridData y = {9, 8, NaN, 7, 6, 5, 4, NaN, 3, 2, 1};
    vsp_mann_kendall_t r;
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), &r), VSP_OK);
    VSP_ASSERT_EQ(r.n, static_cast<vsp_size_t>(9));
    VSP_ASSERT_NEAR(-36.0, r.s, 0.0);
    VSP_ASSERT_NEAR(-1.0, r.tau, 1e-12);
    VSP_ASSERT_EQ(r.significant, VSP_TRUE);
    VSP_ASSERT_EQ(r.direction, VSP_TREND_DECREASING);
}

VSP_TEST_CASE(ties_reduce_variance) {
    GridData y = {1, 1, 2, 2, 3, 3};
    vsp_mann_kendall_t r;
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), &r), VSP_OK);
    // S = 12; var = (6*5*17 - 3 * 2*1*9) / 18 = 27.33
    VSP_ASSERT_NEAR(12.0, r.s, 0.0);
    VSP_ASSERT_NEAR(12.0 / std::sqrt((510.0 - 54.0) / 18.0), r.z_score, 1e-10);
    VSP_ASSERT_NEAR(12.0 / std::sqrt(15.0 * 12.0), r.tau, 1e-12);
}

VSP_TEST_CASE(constant_series) {
    GridData y(6, 0.4);
    vsp_mann_kendall_t r;
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), &r), VSP_OK);
    VSP_ASSERT_NEAR(0.0, r.s, 0.0);
    VSP_ASSERT_NAN(r.tau);
    VSP_ASSERT_NEAR(1.0, r.p_value, 0.0);
    VSP_ASSERT_EQ(r.direction, VSP_TREND_NONE);
}

VSP_TEST_CASE(exact_p_without_ties) {
    GridData y = {1, 2, 3, 4, 5};
    vsp_mann_kendall_t r;
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), &r), VSP_OK);
    VSP_ASSERT_EQ(r.exact, VSP_TRUE);
    // Only the identity and its reverse reach |S| = 10 among 5! orderings
    VSP_ASSERT_NEAR(2.0 / 120.0, r.p_value, 1e-14);
    VSP_ASSERT_NEAR(10.0 / std::sqrt(50.0 / 3.0), r.z_score, 1e-10);
    VSP_ASSERT_EQ(r.significant, VSP_TRUE);

    // One discordant pair: 1 + 5 orderings per tail
    GridData swapped = {1, 3, 2, 4, 5, 6};
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(swapped.data(), swapped.size(), &r), VSP_OK);
    VSP_ASSERT_EQ(r.exact, VSP_TRUE);
    VSP_ASSERT_NEAR(13.0, r.s, 0.0);
    VSP_ASSERT_NEAR(12.0 / 720.0, r.p_value, 1e-14);
}

VSP_TEST_CASE(exact_matches_permutation_count) {
    GridData y = {2, 1, 4, 3, 6, 5};
    vsp_mann_kendall_t r;
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), &r), VSP_OK);
    // S = 15 - 2 * 3; orderings of 6 with <= 3 inversions: 1 + 5 + 14 + 29
    VSP_ASSERT_NEAR(9.0, r.s, 0.0);
    VSP_ASSERT_NEAR(2.0 * 49.0 / 720.0, r.p_value, 1e-14);
    VSP_ASSERT_EQ(r.significant, VSP_FALSE);
    VSP_ASSERT_EQ(r.direction, VSP_TREND_NONE);
}

VSP_TEST_CASE(ties_use_normal_approximation) {
    GridData y = {1, 1, 2, 3, 4};
    vsp_mann_kendall_t r;
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), &r), VSP_OK);
    VSP_ASSERT_EQ(r.exact, VSP_FALSE);
    VSP_ASSERT_TRUE(approx_equal(vsp::math::normal_two_sided(r.z_score), r.p_value, Tolerance::normal()));

    // Long untied series leave the exact table
    GridData noisy(40);
    for (std::size_t i = 0; i < noisy.size(); ++i) {
        noisy[i] = static_cast<double>(i) + ((i % 3 == 0) ? 2.5 : 0.0);
    }
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(noisy.data(), noisy.size(), &r), VSP_OK);
    VSP_ASSERT_EQ(r.exact, VSP_FALSE);
}

VSP_TEST_CASE(too_short) {
    GridData y = {0.1, 0.2};
    vsp_mann_kendall_t r;
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_FALSE);
    VSP_ASSERT_EQ(vsp_temporal_mann_kendall(y.data(), y.size(), nullptr), VSP_ERROR_NULL_POINTER);
}

VSP_TEST_SUITE_END

// =============================================================================
// Step Changes
// =============================================================================

VSP_TEST_SUITE(step_changes)

VSP_TEST_CASE(consecutive_steps) {
    GridData t = {0, 10, 10, 30, 45, 60};
    GridData y = {0.0, 0.2, 0.4, 0.5, NaN, 0.8};
    vsp_size_t count = 99;
    VSP_ASSERT_EQ(vsp_temporal_step_changes(t.data(), y.data(), 6, nullptr, 0, &count), VSP_OK);
    // Zero gap and both steps touching the NaN are skipped
    VSP_ASSERT_EQ(count, static_cast<vsp_size_t>(2));

    std::vector<vsp_step_change_t> steps(count);
    VSP_ASSERT_EQ(vsp_temporal_step_changes(t.data(), y.data(), 6, steps.data(), count, &count), VSP_OK);

    VSP_ASSERT_NEAR(0.0, steps[0].t_start, 0.0);
    VSP_ASSERT_NEAR(10.0, steps[0].days, 0.0);
    VSP_ASSERT_NEAR(0.2, steps[0].change, 1e-15);
    VSP_ASSERT_NEAR(0.02, steps[0].rate_per_day, 1e-15);
    VSP_ASSERT_NAN(steps[0].pct_change);

    VSP_ASSERT_NEAR(10.0, steps[1].t_start, 0.0);
    VSP_ASSERT_NEAR(30.0, steps[1].t_end, 0.0);
    VSP_ASSERT_NEAR(0.4, steps[1].value_start, 0.0);
    VSP_ASSERT_NEAR(0.5, steps[1].value_end, 0.0);
    VSP_ASSERT_NEAR(0.005, steps[1].rate_per_day, 1e-12);
    VSP_ASSERT_NEAR(25.0, steps[1].pct_change, 1e-10);
}

VSP_TEST_CASE(capacity_and_errors) {
    GridData t = {0, 1, 2};
    GridData y = {1, 2, 4};
    std::vector<vsp_step_change_t> steps(1);
    vsp_size_t count = 0;
    VSP_ASSERT_EQ(vsp_temporal_step_changes(t.data(), y.data(), 3, steps.data(), 1, &count),
                  VSP_ERROR_RANGE_ERROR);
    VSP_ASSERT_EQ(count, static_cast<vsp_size_t>(2));
    VSP_ASSERT_EQ(vsp_temporal_step_changes(t.data(), y.data(), 3, steps.data(), 1, nullptr),
                  VSP_ERROR_NULL_POINTER);

    VSP_ASSERT_EQ(vsp_temporal_step_changes(t.data(), y.data(), 1, nullptr, 0, &count), VSP_OK);
    VSP_ASSERT_EQ(count, static_cast<vsp_size_t>(0));
}

VSP_TEST_SUITE_END

// =============================================================================
// Period Comparison
// =============================================================================

VSP_TEST_SUITE(compare_periods)

VSP_TEST_CASE(default_split_at_middle_point) {
    GridData t = {0, 1, 2, 3, 4, 5};
    GridData y = {1, 2, 3, 5, 6, 7};
    vsp_period_comparison_t r;
    VSP_ASSERT_EQ(vsp_temporal_compare_periods(t.data(), y.data(), 6, NaN, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_TRUE);
    VSP_ASSERT_NEAR(3.0, r.t_split, 0.0);
    VSP_ASSERT_EQ(r.before.n, static_cast<vsp_size_t>(3));
    VSP_ASSERT_EQ(r.after.n, static_cast<vsp_size_t>(3));
    VSP_ASSERT_NEAR(2.0, r.before.mean, 1e-14);
    VSP_ASSERT_NEAR(6.0, r.after.median, 1e-14);
    VSP_ASSERT_NEAR(1.0, r.before.std, 1e-14);
    VSP_ASSERT_NEAR(5.0, r.after.min, 0.0);
    VSP_ASSERT_NEAR(7.0, r.after.max, 0.0);
    VSP_ASSERT_NEAR(4.0, r.change, 1e-14);
    VSP_ASSERT_NEAR(200.0, r.pct_change, 1e-10);
    // se = sqrt(4 / 4 * (2 / 3)); dof 4 has a closed form
    const double tt = -4.0 / std::sqrt(2.0 / 3.0);
    VSP_ASSERT_NEAR(tt, r.t_statistic, 1e-10);
    const double p = 1.0 - std::abs(tt) * (6.0 + tt * tt) / std::pow(4.0 + tt * tt, 1.5);
    VSP_ASSERT_NEAR(p, r.p_value, 1e-8);
    VSP_ASSERT_EQ(r.significant, VSP_TRUE);
}

VSP_TEST_CASE(explicit_split) {
    GridData t = {0, 1, 2, 3, 4, 5};
    GridData y = {1, 2, 3, 5, 6, 7};
    vsp_period_comparison_t r;
    VSP_ASSERT_EQ(vsp_temporal_compare_periods(t.data(), y.data(), 6, 1.5, &r), VSP_OK);
    VSP_ASSERT_EQ(r.before.n, static_cast<vsp_size_t>(2));
    VSP_ASSERT_EQ(r.after.n, static_cast<vsp_size_t>(4));
    VSP_ASSERT_NEAR(5.5, r.after.median, 1e-14);
    VSP_ASSERT_NEAR(std::sqrt(35.0 / 12.0), r.after.std, 1e-12);
    VSP_ASSERT_NEAR(-2.847473987257497, r.t_statistic, 1e-9);
    VSP_ASSERT_NEAR(0.0465144639799, r.p_value, 1e-6);
    VSP_ASSERT_EQ(r.significant, VSP_TRUE);

    // A split that leaves one point before
    VSP_ASSERT_EQ(vsp_temporal_compare_periods(t.data(), y.data(), 6, 0.5, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_FALSE);
    VSP_ASSERT_NEAR(0.5, r.t_split, 0.0);
}

VSP_TEST_CASE(constant_periods_have_no_t) {
    GridData t = {0, 1, 2, 3};
    GridData y = {1, 1, 2, 2};
    vsp_period_comparison_t r;
    VSP_ASSERT_EQ(vsp_temporal_compare_periods(t.data(), y.data(), 4, NaN, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_TRUE);
    VSP_ASSERT_NEAR(100.0, r.pct_change, 1e-12);
    VSP_ASSERT_NAN(r.t_statistic);
    VSP_ASSERT_NAN(r.p_value);
    VSP_ASSERT_EQ(r.significant, VSP_FALSE);
}

VSP_TEST_CASE(too_few_points) {
    GridData t = {0, 1, 2, 3, 4};
    GridData y = {1, NaN, 2, 3, NaN};
    vsp_period_comparison_t r;
    VSP_ASSERT_EQ(vsp_temporal_compare_periods(t.data(), y.data(), 5, NaN, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_FALSE);
    VSP_ASSERT_NAN(r.change);

    const double inf = std::numeric_limits<double>::infinity();
    VSP_ASSERT_EQ(vsp_temporal_compare_periods(t.data(), y.data(), 5, inf, &r),
                  VSP_ERROR_INVALID_ARGUMENT);
    VSP_ASSERT_EQ(vsp_temporal_compare_periods(t.data(), y.data(), 5, NaN, nullptr),
                  VSP_ERROR_NULL_POINTER);
}

VSP_TEST_SUITE_END

// =============================================================================
// Breakpoint
// =============================================================================

VSP_TEST_SUITE(breakpoint)

VSP_TEST_CASE(rise_then_fall) {
    GridData t = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    GridData y = {0, 1, 2, 3, 4, 5, 2, 1, 0, -1};
    vsp_breakpoint_t r;
    VSP_ASSERT_EQ(vsp_temporal_breakpoint(t.data(), y.data(), 10, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_TRUE);
    VSP_ASSERT_EQ(r.index, static_cast<vsp_size_t>(6));
    VSP_ASSERT_NEAR(6.0, r.t_break, 0.0);
    VSP_ASSERT_NEAR(2.0, r.r_squared_total, 1e-12);
    VSP_ASSERT_NEAR(1.0, r.before.slope, 1e-12);
    VSP_ASSERT_NEAR(-1.0, r.after.slope, 1e-12);
    VSP_ASSERT_EQ(r.before.n, static_cast<vsp_size_t>(6));
    VSP_ASSERT_EQ(r.after.n, static_cast<vsp_size_t>(4));
    VSP_ASSERT_EQ(r.change, VSP_CHANGE_DETERIORATION);
}

VSP_TEST_CASE(change_types) {
    GridData t = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    vsp_breakpoint_t r;

    GridData fall_rise = {0, -1, -2, -3, -4, -5, -2, -1, 0, 1};
    VSP_ASSERT_EQ(vsp_temporal_breakpoint(t.data(), fall_rise.data(), 10, &r), VSP_OK);
    VSP_ASSERT_EQ(r.change, VSP_CHANGE_IMPROVEMENT);

    GridData steeper = {0, 1, 2, 3, 4, 5, 9, 12, 15, 18};
    VSP_ASSERT_EQ(vsp_temporal_breakpoint(t.data(), steeper.data(), 10, &r), VSP_OK);
    VSP_ASSERT_EQ(r.index, static_cast<vsp_size_t>(6));
    VSP_ASSERT_NEAR(3.0, r.after.slope, 1e-12);
    VSP_ASSERT_EQ(r.change, VSP_CHANGE_ACCELERATION);

    GridData flatter = {0, 3, 6, 9, 12, 15, 17, 18, 19, 20};
    VSP_ASSERT_EQ(vsp_temporal_breakpoint(t.data(), flatter.data(), 10, &r), VSP_OK);
    VSP_ASSERT_EQ(r.index, static_cast<vsp_size_t>(6));
    VSP_ASSERT_EQ(r.change, VSP_CHANGE_DECELERATION);
}

VSP_TEST_CASE(missing_values_dropped) {
    GridData t = {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    GridData y = {NaN, 0, 1, 2, 3, 4, 5, 2, 1, 0, -1};
    vsp_breakpoint_t r;
    VSP_ASSERT_EQ(vsp_temporal_breakpoint(t.data(), y.data(), 11, &r), VSP_OK);
    // Index counts finite pairs only
    VSP_ASSERT_EQ(r.index, static_cast<vsp_size_t>(6));
    VSP_ASSERT_NEAR(7.0, r.t_break, 0.0);
}

VSP_TEST_CASE(too_short) {
    GridData t = {0, 1, 2, 3, 4, 5};
    GridData y = {0, 1, NaN, 3, 2, 1};
    vsp_breakpoint_t r;
    VSP_ASSERT_EQ(vsp_temporal_breakpoint(t.data(), y.data(), 6, &r), VSP_OK);
    VSP_ASSERT_EQ(r.available, VSP_FALSE);
    VSP_ASSERT_EQ(r.before.available, VSP_FALSE);
    VSP_ASSERT_EQ(r.change, -1);
    VSP_ASSERT_NAN(r.t_break);
    VSP_ASSERT_EQ(vsp_temporal_breakpoint(t.data(), nullptr, 6, &r), VSP_ERROR_NULL_POINTER);
}

VSP_TEST_SUITE_END

// =============================================================================
// Labels
// =============================================================================

VSP_TEST_SUITE(labels)

VSP_TEST_CASE(trend_and_change_names) {
    VSP_ASSERT_NOT_NULL(vsp_trend_name(VSP_TREND_INCREASING));
    VSP_ASSERT_EQ(std::string("increasing"), std::string(vsp_trend_name(VSP_TREND_INCREASING)));
    VSP_ASSERT_EQ(std::string("none"), std::string(vsp_trend_name(VSP_TREND_NONE)));
    VSP_ASSERT_EQ(std::string("decreasing"), std::string(vsp_trend_name(VSP_TREND_DECREASING)));
    VSP_ASSERT_TRUE(vsp_trend_name(3) == nullptr);
    VSP_ASSERT_TRUE(vsp_trend_name(-1) == nullptr);

    VSP_ASSERT_EQ(std::string("deterioration"), std::string(vsp_change_type_name(VSP_CHANGE_DETERIORATION)));
    VSP_ASSERT_EQ(std::string("improvement"), std::string(vsp_change_type_name(VSP_CHANGE_IMPROVEMENT)));
    VSP_ASSERT_EQ(std::string("acceleration"), std::string(vsp_change_type_name(VSP_CHANGE_ACCELERATION)));
    VSP_ASSERT_EQ(std::string("deceleration"), std::string(vsp_change_type_name(VSP_CHANGE_DECELERATION)));
    VSP_ASSERT_TRUE(vsp_change_type_name(4) == nullptr);
}

VSP_TEST_SUITE_END

// =============================================================================
// C++ API Shape Checks
// =============================================================================

VSP_TEST_SUITE(shape_checks)

VSP_TEST_CASE(mismatched_shapes_throw) {
    auto a = sequence_grid(2, 3);
    auto b = sequence_grid(3, 2);
    const vsp::GridView<const vsp::Real> va(a.data(), 2, 3);
    const vsp::GridView<const vsp::Real> vb(b.data(), 3, 2);
    VSP_ASSERT_THROWS(vsp::kernel::temporal::difference(va, vb), vsp::DimensionError);
    VSP_ASSERT_THROWS(vsp::kernel::temporal::velocity(va, vb, vsp::Real(5)), vsp::DimensionError);

    const vsp::Array<const vsp::Real> t(a.data(), 6);
    const vsp::Array<const vsp::Real> y(b.data(), 5);
    VSP_ASSERT_THROWS(vsp::kernel::temporal::linear_trend(t, y), vsp::DimensionError);
    VSP_ASSERT_THROWS(vsp::kernel::temporal::step_changes(t, y), vsp::DimensionError);
    VSP_ASSERT_THROWS(vsp::kernel::temporal::compare_periods(t, y), vsp::DimensionError);
    VSP_ASSERT_THROWS(vsp::kernel::temporal::detect_breakpoint(t, y), vsp::DimensionError);
}

VSP_TEST_SUITE_END

VSP_TEST_END

VSP_TEST_MAIN()
