#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/temporal.h
// BRIEF: C API for temporal change analysis and trend tests
// =============================================================================

#include "vsp/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

#define VSP_TREND_NONE 0
#define VSP_TREND_INCREASING 1
#define VSP_TREND_DECREASING 2

#define VSP_CHANGE_DETERIORATION 0
#define VSP_CHANGE_IMPROVEMENT 1
#define VSP_CHANGE_ACCELERATION 2
#define VSP_CHANGE_DECELERATION 3

typedef struct vsp_diff_summary_t {
    vsp_bool_t available;       // VSP_FALSE when no cell is valid in both grids
    vsp_real_t threshold;
    vsp_summary_t diff;
    vsp_size_t n_increase;
    vsp_size_t n_decrease;
    vsp_size_t n_no_change;
    vsp_real_t pct_increase;
    vsp_real_t pct_decrease;
    vsp_real_t pct_no_change;
} vsp_diff_summary_t;

typedef struct vsp_comparison_t {
    vsp_bool_t available;       // VSP_FALSE unless both grids have >= 2 valid cells
    vsp_size_t n_a;
    vsp_size_t n_b;
    vsp_real_t mean_a;
    vsp_real_t mean_b;
    vsp_real_t mean_diff;
    vsp_real_t pct_diff;        // NaN when mean_a == 0
    vsp_real_t ks_statistic;
    vsp_real_t ks_p_value;
    vsp_real_t t_statistic;     // NaN for zero pooled variance
    vsp_real_t t_p_value;
    vsp_real_t mwu_statistic;
    vsp_real_t mwu_p_value;
    vsp_bool_t differ;
} vsp_comparison_t;

typedef struct vsp_linear_trend_t {
    vsp_bool_t available;
    vsp_real_t slope;
    vsp_real_t intercept;
    vsp_real_t r_squared;
    vsp_real_t p_value;
    vsp_real_t std_err;
    vsp_bool_t significant;
    int32_t direction;          // VSP_TREND_*
    vsp_real_t total_change;
    vsp_real_t pct_change;      // NaN when intercept == 0
    vsp_size_t n;
    vsp_real_t span;
} vsp_linear_trend_t;

typedef struct vsp_mann_kendall_t {
    vsp_bool_t available;
    vsp_real_t s;
    vsp_real_t tau;             // NaN when every value ties
    vsp_real_t z_score;
    vsp_real_t p_value;
    vsp_bool_t exact;           // p_value from the exact distribution of S
    vsp_bool_t significant;
    int32_t direction;          // VSP_TREND_*
    vsp_size_t n;
} vsp_mann_kendall_t;

typedef struct vsp_step_change_t {
    vsp_real_t t_start;
    vsp_real_t t_end;
    vsp_real_t days;
    vsp_real_t value_start;
    vsp_real_t value_end;
    vsp_real_t change;
    vsp_real_t rate_per_day;
    vsp_real_t pct_change;      // NaN when value_start == 0
} vsp_step_change_t;

typedef struct vsp_period_stats_t {
    vsp_size_t n;
    vsp_real_t mean;
    vsp_real_t median;
    vsp_real_t std;             // sample standard deviation
    vsp_real_t min;
    vsp_real_t max;
} vsp_period_stats_t;

typedef struct vsp_period_comparison_t {
    vsp_bool_t available;       // VSP_FALSE unless both periods hold >= 2 points
    vsp_real_t t_split;
    vsp_period_stats_t before;  // t < t_split
    vsp_period_stats_t after;   // t >= t_split
    vsp_real_t change;          // after.mean - before.mean
    vsp_real_t pct_change;      // NaN when before.mean == 0
    vsp_real_t t_statistic;     // NaN for zero pooled variance
    vsp_real_t p_value;
    vsp_bool_t significant;
} vsp_period_comparison_t;

typedef struct vsp_breakpoint_t {
    vsp_bool_t available;       // VSP_FALSE for fewer than 6 valid points
    vsp_size_t index;           // first valid point of the second segment
    vsp_real_t t_break;
    vsp_linear_trend_t before;
    vsp_linear_trend_t after;
    vsp_real_t r_squared_total;
    int32_t change;             // VSP_CHANGE_*, -1 when unavailable
} vsp_breakpoint_t;

// diff = b - a. Any of diff / increase / decrease / no_change may be NULL.
vsp_error_t vsp_temporal_difference(
    const vsp_real_t* a,
    const vsp_real_t* b,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_real_t* diff,
    vsp_mask_t* increase_strong,
    vsp_mask_t* decrease_strong,
    vsp_mask_t* no_change,
    vsp_diff_summary_t* summary
);

// (b - a) / days; days == 0 writes zeros
vsp_error_t vsp_temporal_velocity(
    const vsp_real_t* a,
    const vsp_real_t* b,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_real_t days,
    vsp_real_t* out
);

// The two grids may differ in shape
vsp_error_t vsp_temporal_compare(
    const vsp_real_t* a,
    vsp_index_t rows_a,
    vsp_index_t cols_a,
    const vsp_real_t* b,
    vsp_index_t rows_b,
    vsp_index_t cols_b,
    vsp_comparison_t* out
);

vsp_error_t vsp_temporal_linear_trend(
    const vsp_real_t* t,
    const vsp_real_t* y,
    vsp_size_t n,
    vsp_linear_trend_t* out
);

vsp_error_t vsp_temporal_mann_kendall(
    const vsp_real_t* y,
    vsp_size_t n,
    vsp_mann_kendall_t* out
);

// One entry per consecutive pair with finite values and t increasing.
// steps may be NULL; otherwise it must hold n_steps entries
// (VSP_ERROR_RANGE_ERROR if capacity is short).
vsp_error_t vsp_temporal_step_changes(
    const vsp_real_t* t,
    const vsp_real_t* y,
    vsp_size_t n,
    vsp_step_change_t* steps,
    vsp_size_t capacity,
    vsp_size_t* n_steps
);

// t_split NaN splits at the time of the middle valid point
vsp_error_t vsp_temporal_compare_periods(
    const vsp_real_t* t,
    const vsp_real_t* y,
    vsp_size_t n,
    vsp_real_t t_split,
    vsp_period_comparison_t* out
);

vsp_error_t vsp_temporal_breakpoint(
    const vsp_real_t* t,
    const vsp_real_t* y,
    vsp_size_t n,
    vsp_breakpoint_t* out
);

// Label of a VSP_TREND_* / VSP_CHANGE_* code; NULL for unknown codes
const char* vsp_trend_name(int32_t direction);
const char* vsp_change_type_name(int32_t change);

#ifdef __cplusplus
}
#endif
