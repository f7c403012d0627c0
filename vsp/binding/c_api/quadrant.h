#pragma once

// =============================================================================
// FILE: vsp/binding/c_api/quadrant.h
// BRIEF: C API for rectangular tiling with per-tile statistics
// =============================================================================

#include "vsp/binding/c_api/core/core.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct vsp_tile_stats_t {
    vsp_index_t tile_row;
    vsp_index_t tile_col;
    vsp_index_t row_begin;      // [row_begin, row_end)
    vsp_index_t row_end;
    vsp_index_t col_begin;      // [col_begin, col_end)
    vsp_index_t col_end;
    vsp_size_t n_cells;
    vsp_summary_t summary;      // summary.n == 0 for a tile without valid cells
} vsp_tile_stats_t;

// tiles receives n_rows * n_cols entries in row-major tile order.
// zones (may be NULL) receives i * n_cols + j + 1 for every cell of tile (i, j).
vsp_error_t vsp_quadrant_partition(
    const vsp_real_t* grid,
    vsp_index_t rows,
    vsp_index_t cols,
    vsp_index_t n_rows,
    vsp_index_t n_cols,
    vsp_tile_stats_t* tiles,
    vsp_index_t* zones
);

#ifdef __cplusplus
}
#endif
