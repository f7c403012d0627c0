// =============================================================================
// FILE: vsp/binding/c_api/temporal.cpp
// BRIEF: C API implementation for temporal change analysis
// =============================================================================

#include "vsp/binding/c_api/temporal.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/kernel/temporal.hpp"

#include <cmath>
#include <cstring>
#include <optional>

using namespace vsp;
using namespace vsp::binding;

namespace {

constexpr vsp_real_t NAN_VALUE = std::numeric_limits<vsp_real_t>::quiet_NaN();

template <typename T>
void export_optional(const Grid<T>& src, T* dst) {
    if (dst != nullptr) {
        export_grid(src, dst);
    }
}

void fill_trend(const std::optional<kernel::temporal::LinearTrend>& r, vsp_linear_trend_t* out) noexcept {
    if (!r) {
        *out = vsp_linear_trend_t{};
        out->available = VSP_FALSE;
        out->slope = out->intercept = out->r_squared = NAN_VALUE;
        out->p_value = out->std_err = NAN_VALUE;
        out->total_change = out->pct_change = out->span = NAN_VALUE;
        out->direction = VSP_TREND_NONE;
        return;
    }

    out->available = VSP_TRUE;
    out->slope = r->slope;
    out->intercept = r->intercept;
    out->r_squared = r->r_squared;
    out->p_value = r->p_value;
    out->std_err = r->std_err;
    out->significant = to_bool(r->significant);
    out->direction = static_cast<int32_t>(r->direction);
    out->total_change = r->total_change;
    out->pct_change = value_or_nan(r->pct_change);
    out->n = r->n;
    out->span = r->span;
}

void fill_period(const kernel::temporal::PeriodStats& p, vsp_period_stats_t* out) noexcept {
    out->n = p.n;
    out->mean = p.mean;
    out->median = p.median;
    out->std = p.std_dev;
    out->min = p.min;
    out->max = p.max;
}

} // anonymous namespace

extern "C" {

VSP_EXPORT vsp_error_t vsp_temporal_difference(
    const vsp_real_t* a,
    const vsp_real_t* b,
    const vsp_index_t rows,
    const vsp_index_t cols,
    vsp_real_t* diff,
    vsp_mask_t* increase_strong,
    vsp_mask_t* decrease_strong,
    vsp_mask_t* no_change,
    vsp_diff_summary_t* summary) {

    VSP_C_API_CHECK_GRID(a, rows, cols);
    VSP_C_API_CHECK_NULL(b, "Second grid is null");
    VSP_C_API_CHECK_NULL(summary, "Output summary is null");

    VSP_C_API_TRY
        const auto r = kernel::temporal::difference(grid_view(a, rows, cols), grid_view(b, rows, cols));
        const Size n = grid_size(rows, cols);

        if (!r) {
            if (diff != nullptr) memory::fill(Array<Real>(diff, n), MISSING);
            if (increase_strong != nullptr) std::memset(increase_strong, 0, n);
            if (decrease_strong != nullptr) std::memset(decrease_strong, 0, n);
            if (no_change != nullptr) std::memset(no_change, 0, n);
            *summary = vsp_diff_summary_t{};
            summary->available = VSP_FALSE;
            summary->threshold = NAN_VALUE;
            fill_summary(kernel::stats::Summary{}, &summary->diff);
            summary->pct_increase = summary->pct_decrease = summary->pct_no_change = NAN_VALUE;
            VSP_C_API_RETURN_OK;
        }

        export_optional(r->diff, diff);
        export_optional(r->increase_strong, increase_strong);
        export_optional(r->decrease_strong, decrease_strong);
        export_optional(r->no_change, no_change);

        summary->available = VSP_TRUE;
        summary->threshold = r->threshold;
        fill_summary(r->summary, &summary->diff);
        summary->n_increase = r->n_increase;
        summary->n_decrease = r->n_decrease;
        summary->n_no_change = r->n_no_change;
        summary->pct_increase = r->pct_increase;
        summary->pct_decrease = r->pct_decrease;
        summary->pct_no_change = r->pct_no_change;
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_temporal_velocity(
    const vsp_real_t* a,
    const vsp_real_t* b,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const vsp_real_t days,
    vsp_real_t* out) {

    VSP_C_API_CHECK_GRID(a, rows, cols);
    VSP_C_API_CHECK_NULL(b, "Second grid is null");
    VSP_C_API_CHECK_NULL(out, "Output grid is null");

    VSP_C_API_TRY
        export_grid(kernel::temporal::velocity(grid_view(a, rows, cols), grid_view(b, rows, cols), days),
                    out);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_temporal_compare(
    const vsp_real_t* a,
    const vsp_index_t rows_a,
    const vsp_index_t cols_a,
    const vsp_real_t* b,
    const vsp_index_t rows_b,
    const vsp_index_t cols_b,
    vsp_comparison_t* out) {

    VSP_C_API_CHECK_GRID(a, rows_a, cols_a);
    VSP_C_API_CHECK_GRID(b, rows_b, cols_b);
    VSP_C_API_CHECK_NULL(out, "Output record is null");

    VSP_C_API_TRY
        const auto c = kernel::temporal::compare_distributions(grid_view(a, rows_a, cols_a),
                                                               grid_view(b, rows_b, cols_b));
        if (!c) {
            *out = vsp_comparison_t{};
            out->available = VSP_FALSE;
            out->n_a = count_valid(grid_view(a, rows_a, cols_a));
            out->n_b = count_valid(grid_view(b, rows_b, cols_b));
            out->mean_a = out->mean_b = out->mean_diff = out->pct_diff = NAN_VALUE;
            out->ks_statistic = out->ks_p_value = NAN_VALUE;
            out->t_statistic = out->t_p_value = NAN_VALUE;
            out->mwu_statistic = out->mwu_p_value = NAN_VALUE;
            VSP_C_API_RETURN_OK;
        }

        out->available = VSP_TRUE;
        out->n_a = c->n_a;
        out->n_b = c->n_b;
        out->mean_a = c->mean_a;
        out->mean_b = c->mean_b;
        out->mean_diff = c->mean_diff;
        out->pct_diff = value_or_nan(c->pct_diff);
        out->ks_statistic = c->ks_statistic;
        out->ks_p_value = c->ks_p_value;
        out->t_statistic = value_or_nan(c->t_statistic);
        out->t_p_value = value_or_nan(c->t_p_value);
        out->mwu_statistic = c->mwu_statistic;
        out->mwu_p_value = c->mwu_p_value;
        out->differ = to_bool(c->differ);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_temporal_linear_trend(
    const vsp_real_t* t,
    const vsp_real_t* y,
    const vsp_size_t n,
    vsp_linear_trend_t* out) {

    VSP_C_API_CHECK_NULL(t, "Time array is null");
    VSP_C_API_CHECK_NULL(y, "Value array is null");
    VSP_C_API_CHECK_NULL(out, "Output record is null");

    VSP_C_API_TRY
        fill_trend(kernel::temporal::linear_trend(Array<const Real>(t, n), Array<const Real>(y, n)), out);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_temporal_mann_kendall(
    const vsp_real_t* y,
    const vsp_size_t n,
    vsp_mann_kendall_t* out) {

    VSP_C_API_CHECK_NULL(y, "Value array is null");
    VSP_C_API_CHECK_NULL(out, "Output record is null");

    VSP_C_API_TRY
        const auto r = kernel::temporal::mann_kendall(Array<const Real>(y, n));
        if (!r) {
            *out = vsp_mann_kendall_t{};
            out->available = VSP_FALSE;
            out->s = out->tau = out->z_score = out->p_value = NAN_VALUE;
            out->direction = VSP_TREND_NONE;
            VSP_C_API_RETURN_OK;
        }

        out->available = VSP_TRUE;
        out->s = r->s;
        out->tau = value_or_nan(r->tau);
        out->z_score = r->z_score;
        out->p_value = r->p_value;
        out->exact = to_bool(r->exact);
        out->significant = to_bool(r->significant);
        out->direction = static_cast<int32_t>(r->direction);
        out->n = r->n;
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_temporal_step_changes(
    const vsp_real_t* t,
    const vsp_real_t* y,
    const vsp_size_t n,
    vsp_step_change_t* steps,
    const vsp_size_t capacity,
    vsp_size_t* n_steps) {

    VSP_C_API_CHECK_NULL(t, "Time array is null");
    VSP_C_API_CHECK_NULL(y, "Value array is null");
    VSP_C_API_CHECK_NULL(n_steps, "Output step count is null");

    VSP_C_API_TRY
        const auto result = kernel::temporal::step_changes(Array<const Real>(t, n), Array<const Real>(y, n));

        *n_steps = result.size();
        if (steps == nullptr) {
            VSP_C_API_RETURN_OK;
        }
        VSP_C_API_CHECK(capacity >= result.size(), VSP_ERROR_RANGE_ERROR,
                        "Step buffer capacity is smaller than the number of steps");
        for (Size i = 0; i < result.size(); ++i) {
            const auto& st = result[i];
            steps[i] = vsp_step_change_t{st.t_start, st.t_end, st.days, st.value_start, st.value_end,
                                         st.change, st.rate_per_day, value_or_nan(st.pct_change)};
        }
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_temporal_compare_periods(
    const vsp_real_t* t,
    const vsp_real_t* y,
    const vsp_size_t n,
    const vsp_real_t t_split,
    vsp_period_comparison_t* out) {

    VSP_C_API_CHECK_NULL(t, "Time array is null");
    VSP_C_API_CHECK_NULL(y, "Value array is null");
    VSP_C_API_CHECK_NULL(out, "Output record is null");
    VSP_C_API_CHECK(!std::isinf(t_split), VSP_ERROR_INVALID_ARGUMENT, "Split time must be finite or NaN");

    VSP_C_API_TRY
        std::optional<Real> split;
        if (!std::isnan(t_split)) {
            split = t_split;
        }
        const auto r = kernel::temporal::compare_periods(Array<const Real>(t, n), Array<const Real>(y, n), split);

        *out = vsp_period_comparison_t{};
        if (!r) {
            out->available = VSP_FALSE;
            out->t_split = split ? *split : NAN_VALUE;
            out->change = out->pct_change = out->t_statistic = out->p_value = NAN_VALUE;
            VSP_C_API_RETURN_OK;
        }

        out->available = VSP_TRUE;
        out->t_split = r->t_split;
        fill_period(r->before, &out->before);
        fill_period(r->after, &out->after);
        out->change = r->change;
        out->pct_change = value_or_nan(r->pct_change);
        out->t_statistic = value_or_nan(r->t_statistic);
        out->p_value = value_or_nan(r->p_value);
        out->significant = to_bool(r->significant);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT vsp_error_t vsp_temporal_breakpoint(
    const vsp_real_t* t,
    const vsp_real_t* y,
    const vsp_size_t n,
    vsp_breakpoint_t* out) {

    VSP_C_API_CHECK_NULL(t, "Time array is null");
    VSP_C_API_CHECK_NULL(y, "Value array is null");
    VSP_C_API_CHECK_NULL(out, "Output record is null");

    VSP_C_API_TRY
        const auto r = kernel::temporal::detect_breakpoint(Array<const Real>(t, n), Array<const Real>(y, n));

        *out = vsp_breakpoint_t{};
        if (!r) {
            out->available = VSP_FALSE;
            out->t_break = out->r_squared_total = NAN_VALUE;
            fill_trend(std::nullopt, &out->before);
            fill_trend(std::nullopt, &out->after);
            out->change = -1;
            VSP_C_API_RETURN_OK;
        }

        out->available = VSP_TRUE;
        out->index = r->index;
        out->t_break = r->t_break;
        fill_trend(r->before, &out->before);
        fill_trend(r->after, &out->after);
        out->r_squared_total = r->r_squared_total;
        out->change = static_cast<int32_t>(r->change);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT const char* vsp_trend_name(const int32_t direction) {
    if (direction < VSP_TREND_NONE || direction > VSP_TREND_DECREASING) {
        return nullptr;
    }
    return kernel::temporal::direction_name(static_cast<kernel::temporal::Direction>(direction));
}

VSP_EXPORT const char* vsp_change_type_name(const int32_t change) {
    if (change < VSP_CHANGE_DETERIORATION || change > VSP_CHANGE_DECELERATION) {
        return nullptr;
    }
    return kernel::temporal::change_type_name(static_cast<kernel::temporal::ChangeType>(change));
}

} // extern "C"
