// =============================================================================
// FILE: vsp/binding/c_api/stats.cpp
// BRIEF: C API implementation for grid statistics
// =============================================================================

#include "vsp/binding/c_api/stats.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/kernel/stats.hpp"

using namespace vsp;
using namespace vsp::binding;

namespace {

void export_outliers(const MaskGrid& mask, vsp_mask_t* out, vsp_size_t* n_outliers) {
    export_grid(mask, out);
    if (n_outliers != nullptr) {
        *n_outliers = count_true(mask.cview());
    }
}

} // anonymous namespace

extern "C" {

VSP_EXPORT vsp_error_t vsp_stats_describe(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    vsp_summary_t* out) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(out, "Output summary is null");

    VSP_C_API_TRY
        fill_summary(kernel::stats::describe(grid_view(grid, rows, cols)), out);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_stats_advanced(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    vsp_advanced_stats_t* out) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(out, "Output record is null");

    VSP_C_API_TRY
        const auto r = kernel::stats::advanced(grid_view(grid, rows, cols));
        const Real nan = std::numeric_limits<Real>::quiet_NaN();
        if (!r) {
            fill_summary(kernel::stats::Summary{}, &out->summary);
            out->available = VSP_FALSE;
            out->variance = out->skewness = out->kurtosis = nan;
            out->iqr = out->mad = out->cv_percent = nan;
            VSP_C_API_RETURN_OK;
        }
        fill_summary(r->summary, &out->summary);
        out->available = VSP_TRUE;
        out->variance = r->variance;
        out->skewness = value_or_nan(r->skewness);
        out->kurtosis = value_or_nan(r->kurtosis);
        out->iqr = r->iqr;
        out->mad = r->mad;
        out->cv_percent = value_or_nan(r->cv_percent);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_stats_heterogeneity(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    vsp_heterogeneity_t* out) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(out, "Output record is null");

    VSP_C_API_TRY
        const auto r = kernel::stats::heterogeneity(grid_view(grid, rows, cols));
        out->available = to_bool(r.has_value());
        if (!r) {
            out->cv_percent = std::numeric_limits<Real>::quiet_NaN();
            out->iqr_normalized = std::numeric_limits<Real>::quiet_NaN();
            out->level = VSP_HETEROGENEITY_UNKNOWN;
            VSP_C_API_RETURN_OK;
        }
        out->cv_percent = value_or_nan(r->cv_percent);
        out->iqr_normalized = value_or_nan(r->iqr_normalized);
        out->level = static_cast<int32_t>(r->level);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_stats_outliers_zscore(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const vsp_real_t threshold,
    vsp_mask_t* mask,
    vsp_size_t* n_outliers) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(mask, "Output mask is null");

    VSP_C_API_TRY
        export_outliers(kernel::stats::outliers_zscore(grid_view(grid, rows, cols), threshold),
                        mask, n_outliers);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_stats_outliers_iqr(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const vsp_real_t factor,
    vsp_mask_t* mask,
    vsp_size_t* n_outliers) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(mask, "Output mask is null");

    VSP_C_API_TRY
        export_outliers(kernel::stats::outliers_iqr(grid_view(grid, rows, cols), factor),
                        mask, n_outliers);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_stats_zonal(
    const vsp_real_t* grid,
    const vsp_index_t* labels,
    const vsp_index_t rows,
    const vsp_index_t cols,
    vsp_zone_stats_t* zones,
    const vsp_size_t capacity,
    vsp_size_t* n_zones) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(labels, "Label grid is null");
    VSP_C_API_CHECK_NULL(n_zones, "Output zone count is null");

    VSP_C_API_TRY
        const auto result = kernel::stats::zonal_statistics(
            grid_view(grid, rows, cols), GridView<const Index>(labels, rows, cols));
        *n_zones = result.size();
        if (zones == nullptr) {
            VSP_C_API_RETURN_OK;
        }
        VSP_C_API_CHECK(capacity >= result.size(), VSP_ERROR_RANGE_ERROR,
                        "Zone buffer capacity is smaller than the number of zones");
        for (Size i = 0; i < result.size(); ++i) {
            zones[i].label = result[i].label;
            zones[i].n_cells = result[i].n_cells;
            fill_summary(result[i].summary, &zones[i].summary);
        }
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT const char* vsp_heterogeneity_name(const int32_t heterogeneity) {
    if (heterogeneity < VSP_HETEROGENEITY_HOMOGENEOUS || heterogeneity > VSP_HETEROGENEITY_UNKNOWN) {
        return nullptr;
    }
    return kernel::stats::heterogeneity_name(static_cast<kernel::stats::Heterogeneity>(heterogeneity));
}

} // extern "C"
