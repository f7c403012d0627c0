// =============================================================================
// FILE: vsp/binding/c_api/quadrant.cpp
// BRIEF: C API implementation for quadrant partitioning
// =============================================================================

#include "vsp/binding/c_api/quadrant.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/kernel/quadrant.hpp"

using namespace vsp;
using namespace vsp::binding;

extern "C" {

VSP_EXPORT vsp_error_t vsp_quadrant_partition(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const vsp_index_t n_rows,
    const vsp_index_t n_cols,
    vsp_tile_stats_t* tiles,
    vsp_index_t* zones) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(tiles, "Output tile array is null");

    VSP_C_API_TRY
        const auto result = kernel::quadrant::partition(grid_view(grid, rows, cols), n_rows, n_cols);

        for (Size i = 0; i < result.tiles.size(); ++i) {
            const auto& t = result.tiles[i];
            auto& out = tiles[i];
            out.tile_row = t.tile_row;
            out.tile_col = t.tile_col;
            out.row_begin = t.row_begin;
            out.row_end = t.row_end;
            out.col_begin = t.col_begin;
            out.col_end = t.col_end;
            out.n_cells = t.n_cells;
            fill_summary(t.summary, &out.summary);
        }

        if (zones != nullptr) {
            export_grid(kernel::quadrant::zone_map(result), zones);
        }
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

} // extern "C"
