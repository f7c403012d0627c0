// =============================================================================
// VSP Core - Grid Statistics Tests
// =============================================================================
//
// Complete test coverage for vsp/binding/c_api/stats.h
//
// Functions tested:
//   - vsp_stats_describe
//   - vsp_stats_advanced
//   - vsp_stats_heterogeneity
//   - vsp_heterogeneity_name
//   - vsp_stats_outliers_zscore
//   - vsp_stats_outliers_iqr
//   - vsp_stats_zonal
//
// Reference implementation: oracle::mean / std_dev / percentile (Eigen)
// Statistics are population moments over finite cells; percentiles use
// linear interpolation.
//
// =============================================================================

#include "test.hpp"

using namespace vsp::test;
using precision::Tolerance;
using precision::approx_equal;

VSP_TEST_BEGIN

// =============================================================================
// Describe
// =============================================================================

VSP_TEST_SUITE(describe)

VSP_TEST_CASE(sequence_4x4) {
    auto grid = fixture::sequence_4x4();
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 4, 4, &s), VSP_OK);

    VSP_ASSERT_EQ(s.n, static_cast<vsp_size_t>(16));
    VSP_ASSERT_EQ(s.available, VSP_TRUE);
    VSP_ASSERT_NEAR(8.5, s.mean, 1e-12);
    VSP_ASSERT_NEAR(8.5, s.median, 1e-12);
    VSP_ASSERT_NEAR(1.0, s.min, 0.0);
    VSP_ASSERT_NEAR(16.0, s.max, 0.0);
    VSP_ASSERT_NEAR(15.0, s.range, 1e-12);
    VSP_ASSERT_NEAR(std::sqrt(255.0 / 12.0), s.std, 1e-12);
    VSP_ASSERT_NEAR(4.75, s.p25, 1e-12);
    VSP_ASSERT_NEAR(12.25, s.p75, 1e-12);
    VSP_ASSERT_NEAR(s.std / s.mean, s.cv, 1e-12);
}

VSP_TEST_CASE(matches_oracle_with_missing_cells) {
    Random rng(7);
    auto grid = random_grid(30, 25, -0.2, 0.9, 0.15, rng);
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 30, 25, &s), VSP_OK);

    VSP_ASSERT_EQ(s.n, static_cast<vsp_size_t>(finite_values(grid).size()));
    VSP_ASSERT_TRUE(approx_equal(oracle::mean(grid), s.mean, Tolerance::relaxed()));
    VSP_ASSERT_TRUE(approx_equal(oracle::std_dev(grid), s.std, Tolerance::relaxed()));
    VSP_ASSERT_TRUE(approx_equal(oracle::percentile(grid, 5), s.p05, Tolerance::relaxed()));
    VSP_ASSERT_TRUE(approx_equal(oracle::percentile(grid, 95), s.p95, Tolerance::relaxed()));
    VSP_ASSERT_LE(s.min, s.p05);
    VSP_ASSERT_LE(s.p05, s.p25);
    VSP_ASSERT_LE(s.p25, s.median);
    VSP_ASSERT_LE(s.median, s.p75);
    VSP_ASSERT_LE(s.p75, s.p95);
    VSP_ASSERT_LE(s.p95, s.max);
}

VSP_TEST_CASE(single_valid_cell) {
    auto grid = fixture::single_valid_5x5();
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 5, 5, &s), VSP_OK);
    VSP_ASSERT_EQ(s.n, static_cast<vsp_size_t>(1));
    VSP_ASSERT_NEAR(7.0, s.mean, 0.0);
    VSP_ASSERT_NEAR(0.0, s.std, 0.0);
    VSP_ASSERT_NEAR(7.0, s.median, 0.0);
    VSP_ASSERT_NEAR(0.0, s.range, 0.0);
}

VSP_TEST_CASE(all_missing_is_unavailable) {
    auto grid = missing_grid(3, 4);
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 3, 4, &s), VSP_OK);
    VSP_ASSERT_EQ(s.n, static_cast<vsp_size_t>(0));
    VSP_ASSERT_EQ(s.available, VSP_FALSE);
    VSP_ASSERT_NAN(s.mean);
    VSP_ASSERT_NAN(s.std);
    VSP_ASSERT_NAN(s.p95);
}

VSP_TEST_CASE(infinities_are_missing) {
    GridData grid = {1.0, std::numeric_limits<vsp_real_t>::infinity(), 3.0,
                     -std::numeric_limits<vsp_real_t>::infinity()};
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 2, 2, &s), VSP_OK);
    VSP_ASSERT_EQ(s.n, static_cast<vsp_size_t>(2));
    VSP_ASSERT_NEAR(2.0, s.mean, 1e-12);
}

VSP_TEST_CASE(zero_mean_has_no_cv) {
    GridData grid = {-1.0, 1.0, -2.0, 2.0};
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 2, 2, &s), VSP_OK);
    VSP_ASSERT_NEAR(0.0, s.mean, 1e-12);
    VSP_ASSERT_NAN(s.cv);
}

VSP_TEST_CASE(empty_grid) {
    GridData grid(1);
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 0, 0, &s), VSP_OK);
    VSP_ASSERT_EQ(s.available, VSP_FALSE);
}

VSP_TEST_CASE(null_output) {
    auto grid = fixture::sequence_4x4();
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 4, 4, nullptr), VSP_ERROR_NULL_POINTER);
}

VSP_TEST_SUITE_END

// =============================================================================
// Advanced Statistics
// =============================================================================

VSP_TEST_SUITE(advanced)

VSP_TEST_CASE(sequence_moments) {
    auto grid = fixture::sequence_4x4();
    vsp_advanced_stats_t a;
    VSP_ASSERT_EQ(vsp_stats_advanced(grid.data(), 4, 4, &a), VSP_OK);

    VSP_ASSERT_EQ(a.available, VSP_TRUE);
    VSP_ASSERT_NEAR(255.0 / 12.0, a.variance, 1e-10);
    VSP_ASSERT_NEAR(0.0, a.skewness, 1e-12);
    // Excess kurtosis of a discrete uniform on n points: -6(n^2+1) / (5(n^2-1))
    VSP_ASSERT_NEAR(-6.0 * 257.0 / (5.0 * 255.0), a.kurtosis, 1e-10);
    VSP_ASSERT_NEAR(7.5, a.iqr, 1e-12);
    VSP_ASSERT_NEAR(4.0, a.mad, 1e-12);
    VSP_ASSERT_NEAR(a.summary.std / 8.5 * 100.0, a.cv_percent, 1e-10);
}

VSP_TEST_CASE(right_skewed) {
    GridData grid = {1, 1, 1, 1, 1, 1, 1, 1, 10};
    vsp_advanced_stats_t a;
    VSP_ASSERT_EQ(vsp_stats_advanced(grid.data(), 3, 3, &a), VSP_OK);
    VSP_ASSERT_GT(a.skewness, 0.0);
    VSP_ASSERT_GT(a.kurtosis, 0.0);
    VSP_ASSERT_NEAR(0.0, a.mad, 0.0);
}

VSP_TEST_CASE(constant_has_no_shape_moments) {
    auto grid = constant_grid(3, 3, 0.4);
    vsp_advanced_stats_t a;
    VSP_ASSERT_EQ(vsp_stats_advanced(grid.data(), 3, 3, &a), VSP_OK);
    VSP_ASSERT_EQ(a.available, VSP_TRUE);
    VSP_ASSERT_NEAR(0.0, a.variance, 1e-15);
    VSP_ASSERT_NAN(a.skewness);
    VSP_ASSERT_NAN(a.kurtosis);
}

VSP_TEST_CASE(all_missing) {
    auto grid = missing_grid(2, 2);
    vsp_advanced_stats_t a;
    VSP_ASSERT_EQ(vsp_stats_advanced(grid.data(), 2, 2, &a), VSP_OK);
    VSP_ASSERT_EQ(a.available, VSP_FALSE);
    VSP_ASSERT_EQ(a.summary.available, VSP_FALSE);
    VSP_ASSERT_NAN(a.variance);
}

VSP_TEST_SUITE_END

// =============================================================================
// Heterogeneity
// =============================================================================

VSP_TEST_SUITE(heterogeneity)

VSP_TEST_CASE(constant_is_homogeneous) {
    auto grid = constant_grid(4, 4, 0.6);
    vsp_heterogeneity_t h;
    VSP_ASSERT_EQ(vsp_stats_heterogeneity(grid.data(), 4, 4, &h), VSP_OK);
    VSP_ASSERT_EQ(h.available, VSP_TRUE);
    VSP_ASSERT_NEAR(0.0, h.cv_percent, 1e-12);
    VSP_ASSERT_NEAR(0.0, h.iqr_normalized, 1e-12);
    VSP_ASSERT_EQ(h.level, VSP_HETEROGENEITY_HOMOGENEOUS);
}

VSP_TEST_CASE(sequence_is_very_heterogeneous) {
    auto grid = fixture::sequence_4x4();
    vsp_heterogeneity_t h;
    VSP_ASSERT_EQ(vsp_stats_heterogeneity(grid.data(), 4, 4, &h), VSP_OK);
    VSP_ASSERT_NEAR(std::sqrt(255.0 / 12.0) / 8.5 * 100.0, h.cv_percent, 1e-10);
    VSP_ASSERT_NEAR(7.5 / 8.5, h.iqr_normalized, 1e-12);
    VSP_ASSERT_EQ(h.level, VSP_HETEROGENEITY_VERY_HETEROGENEOUS);
}

VSP_TEST_CASE(level_names) {
    auto grid = fixture::sequence_4x4();
    vsp_heterogeneity_t h;
    VSP_ASSERT_EQ(vsp_stats_heterogeneity(grid.data(), 4, 4, &h), VSP_OK);
    VSP_ASSERT_NOT_NULL(vsp_heterogeneity_name(h.level));
    VSP_ASSERT_EQ(std::string("very heterogeneous"), std::string(vsp_heterogeneity_name(h.level)));

    VSP_ASSERT_EQ(std::string("homogeneous"), std::string(vsp_heterogeneity_name(VSP_HETEROGENEITY_HOMOGENEOUS)));
    VSP_ASSERT_EQ(std::string("moderately heterogeneous"),
                  std::string(vsp_heterogeneity_name(VSP_HETEROGENEITY_MODERATE)));
    VSP_ASSERT_EQ(std::string("unknown"), std::string(vsp_heterogeneity_name(VSP_HETEROGENEITY_UNKNOWN)));
    VSP_ASSERT_TRUE(vsp_heterogeneity_name(5) == nullptr);
}

VSP_TEST_CASE(classification_bands) {
    // mean 1, population std 0.15 -> CV 15%
    GridData moderate = {0.85, 1.15, 0.85, 1.15};
    vsp_heterogeneity_t h;
    VSP_ASSERT_EQ(vsp_stats_heterogeneity(moderate.data(), 2, 2, &h), VSP_OK);
    VSP_ASSERT_EQ(h.level, VSP_HETEROGENEITY_MODERATE);

    // CV 25%
    GridData hetero = {0.75, 1.25, 0.75, 1.25};
    VSP_ASSERT_EQ(vsp_stats_heterogeneity(hetero.data(), 2, 2, &h), VSP_OK);
    VSP_ASSERT_EQ(h.level, VSP_HETEROGENEITY_HETEROGENEOUS);
}

VSP_TEST_CASE(zero_mean_is_unknown) {
    GridData grid = {-1.0, 1.0, -1.0, 1.0};
    vsp_heterogeneity_t h;
    VSP_ASSERT_EQ(vsp_stats_heterogeneity(grid.data(), 2, 2, &h), VSP_OK);
    VSP_ASSERT_EQ(h.available, VSP_TRUE);
    VSP_ASSERT_NAN(h.cv_percent);
    VSP_ASSERT_EQ(h.level, VSP_HETEROGENEITY_UNKNOWN);
}

VSP_TEST_CASE(all_missing) {
    auto grid = missing_grid(2, 3);
    vsp_heterogeneity_t h;
    VSP_ASSERT_EQ(vsp_stats_heterogeneity(grid.data(), 2, 3, &h), VSP_OK);
    VSP_ASSERT_EQ(h.available, VSP_FALSE);
    VSP_ASSERT_EQ(h.level, VSP_HETEROGENEITY_UNKNOWN);
}

VSP_TEST_SUITE_END

// =============================================================================
// Outliers
// =============================================================================

VSP_TEST_SUITE(outliers)

VSP_TEST_CASE(zscore_flags_spike) {
    GridData grid(20, 0.0);
    grid[13] = 100.0;
    MaskData mask(20, 9);
    vsp_size_t n = 0;
    VSP_ASSERT_EQ(vsp_stats_outliers_zscore(grid.data(), 4, 5, 2.0, mask.data(), &n), VSP_OK);
    VSP_ASSERT_EQ(n, static_cast<vsp_size_t>(1));
    VSP_ASSERT_EQ(mask[13], static_cast<vsp_mask_t>(1));
    VSP_ASSERT_EQ(oracle::count_set(mask), static_cast<std::size_t>(1));
}

VSP_TEST_CASE(iqr_flags_spike) {
    GridData grid(20, 0.0);
    grid[0] = -50.0;
    MaskData mask(20);
    vsp_size_t n = 0;
    VSP_ASSERT_EQ(vsp_stats_outliers_iqr(grid.data(), 4, 5, 1.5, mask.data(), &n), VSP_OK);
    VSP_ASSERT_EQ(n, static_cast<vsp_size_t>(1));
    VSP_ASSERT_EQ(mask[0], static_cast<vsp_mask_t>(1));
}

VSP_TEST_CASE(missing_never_flagged) {
    Random rng(11);
    auto grid = random_grid(15, 15, 0.0, 1.0, 0.3, rng);
    grid[4] = 50.0;
    MaskData zmask(grid.size()), imask(grid.size());
    VSP_ASSERT_EQ(vsp_stats_outliers_zscore(grid.data(), 15, 15, 2.0, zmask.data(), nullptr), VSP_OK);
    VSP_ASSERT_EQ(vsp_stats_outliers_iqr(grid.data(), 15, 15, 1.5, imask.data(), nullptr), VSP_OK);
    for (std::size_t i = 0; i < grid.size(); ++i) {
        if (!std::isfinite(grid[i])) {
            VSP_ASSERT_EQ(zmask[i], static_cast<vsp_mask_t>(0));
            VSP_ASSERT_EQ(imask[i], static_cast<vsp_mask_t>(0));
        }
    }
    VSP_ASSERT_EQ(zmask[4], static_cast<vsp_mask_t>(1));
}

VSP_TEST_CASE(constant_grid_has_none) {
    auto grid = constant_grid(3, 3, 2.0);
    MaskData mask(9, 1);
    vsp_size_t n = 99;
    VSP_ASSERT_EQ(vsp_stats_outliers_zscore(grid.data(), 3, 3, 2.0, mask.data(), &n), VSP_OK);
    VSP_ASSERT_EQ(n, static_cast<vsp_size_t>(0));
    VSP_ASSERT_EQ(oracle::count_set(mask), static_cast<std::size_t>(0));
}

VSP_TEST_CASE(null_mask) {
    auto grid = constant_grid(3, 3, 2.0);
    VSP_ASSERT_EQ(vsp_stats_outliers_iqr(grid.data(), 3, 3, 1.5, nullptr, nullptr),
                  VSP_ERROR_NULL_POINTER);
}

VSP_TEST_SUITE_END

// =============================================================================
// Zonal Statistics
// =============================================================================

VSP_TEST_SUITE(zonal)

// 4x4 sequence, left half zone 1, right half zone 2, (0,0) unlabeled,
// (3,3) missing
static void make_zones(GridData& grid, LabelData& labels) {
    grid = fixture::sequence_4x4();
    grid[15] = NaN;
    labels.assign(16, 0);
    for (vsp_index_t r = 0; r < 4; ++r) {
        for (vsp_index_t c = 0; c < 4; ++c) {
            labels[static_cast<std::size_t>(r * 4 + c)] = (c < 2) ? 1 : 2;
        }
    }
    labels[0] = 0;
}

VSP_TEST_CASE(per_zone_summary) {
    GridData grid;
    LabelData labels;
    make_zones(grid, labels);

    std::vector<vsp_zone_stats_t> zones(4);
    vsp_size_t n_zones = 0;
    VSP_ASSERT_EQ(vsp_stats_zonal(grid.data(), labels.data(), 4, 4,
                                  zones.data(), zones.size(), &n_zones), VSP_OK);
    VSP_ASSERT_EQ(n_zones, static_cast<vsp_size_t>(2));

    VSP_ASSERT_EQ(zones[0].label, static_cast<vsp_index_t>(1));
    VSP_ASSERT_EQ(zones[0].n_cells, static_cast<vsp_size_t>(7));
    VSP_ASSERT_EQ(zones[0].summary.n, static_cast<vsp_size_t>(7));
    VSP_ASSERT_NEAR(59.0 / 7.0, zones[0].summary.mean, 1e-12);

    VSP_ASSERT_EQ(zones[1].label, static_cast<vsp_index_t>(2));
    VSP_ASSERT_EQ(zones[1].n_cells, static_cast<vsp_size_t>(8));
    VSP_ASSERT_EQ(zones[1].summary.n, static_cast<vsp_size_t>(7));
    VSP_ASSERT_NEAR(60.0 / 7.0, zones[1].summary.mean, 1e-12);
    VSP_ASSERT_NEAR(15.0, zones[1].summary.max, 0.0);
}

VSP_TEST_CASE(count_only_query) {
    GridData grid;
    LabelData labels;
    make_zones(grid, labels);
    vsp_size_t n_zones = 0;
    VSP_ASSERT_EQ(vsp_stats_zonal(grid.data(), labels.data(), 4, 4, nullptr, 0, &n_zones), VSP_OK);
    VSP_ASSERT_EQ(n_zones, static_cast<vsp_size_t>(2));
}

VSP_TEST_CASE(capacity_too_small) {
    GridData grid;
    LabelData labels;
    make_zones(grid, labels);
    vsp_zone_stats_t one;
    vsp_size_t n_zones = 0;
    VSP_ASSERT_EQ(vsp_stats_zonal(grid.data(), labels.data(), 4, 4, &one, 1, &n_zones),
                  VSP_ERROR_RANGE_ERROR);
}

VSP_TEST_CASE(zone_without_valid_cells) {
    GridData grid = {NaN, NaN, 1.0, 2.0};
    LabelData labels = {3, 3, 1, 1};
    std::vector<vsp_zone_stats_t> zones(2);
    vsp_size_t n_zones = 0;
    VSP_ASSERT_EQ(vsp_stats_zonal(grid.data(), labels.data(), 2, 2,
                                  zones.data(), zones.size(), &n_zones), VSP_OK);
    VSP_ASSERT_EQ(n_zones, static_cast<vsp_size_t>(2));
    VSP_ASSERT_EQ(zones[1].label, static_cast<vsp_index_t>(3));
    VSP_ASSERT_EQ(zones[1].n_cells, static_cast<vsp_size_t>(2));
    VSP_ASSERT_EQ(zones[1].summary.available, VSP_FALSE);
}

VSP_TEST_SUITE_END

VSP_TEST_END

VSP_TEST_MAIN()
