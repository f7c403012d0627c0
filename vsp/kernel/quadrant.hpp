#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/memory.hpp"
#include "vsp/core/grid.hpp"
#include "vsp/core/sort.hpp"
#include "vsp/kernel/stats.hpp"

#include <string>
#include <vector>

// =============================================================================
// FILE: vsp/kernel/quadrant.hpp
// BRIEF: Rectangular tiling of a grid with per-tile statistics
// =============================================================================

namespace vsp::kernel::quadrant {

struct TileStats {
    Index tile_row;
    Index tile_col;
    Index row_begin;        // [row_begin, row_end)
    Index row_end;
    Index col_begin;        // [col_begin, col_end)
    Index col_end;
    Size n_cells;           // all cells in the tile
    stats::Summary summary; // over valid cells; summary.n == 0 for an empty tile

    [[nodiscard]] std::string name() const {
        return std::to_string(tile_row) + "-" + std::to_string(tile_col);
    }
};

struct QuadrantResult {
    Index grid_rows = 0;
    Index grid_cols = 0;
    Index n_rows = 0;
    Index n_cols = 0;
    std::vector<TileStats> tiles;   // row-major over tiles
};

namespace detail {

// Tile extent: base = total / parts, the last tile absorbs the remainder
VSP_FORCE_INLINE void tile_extent(Index total, Index parts, Index i, Index& begin, Index& end) noexcept {
    const Index base = total / parts;
    begin = i * base;
    end = (i == parts - 1) ? total : (i + 1) * base;
}

} // namespace detail

// Zone id of tile (i, j): i * n_cols + j + 1
VSP_FORCE_INLINE Index tile_zone(Index tile_row, Index tile_col, Index n_cols) noexcept {
    return tile_row * n_cols + tile_col + 1;
}

inline QuadrantResult partition(GridView<const Real> grid, Index n_rows = 2, Index n_cols = 2) {
    VSP_CHECK_ARG(n_rows >= 1 && n_cols >= 1, "quadrant: tile counts must be >= 1");

    QuadrantResult result;
    result.grid_rows = grid.rows;
    result.grid_cols = grid.cols;
    result.n_rows = n_rows;
    result.n_cols = n_cols;
    result.tiles.reserve(static_cast<Size>(n_rows) * static_cast<Size>(n_cols));

    memory::AlignedBuffer<Real> scratch(grid.size());

    for (Index i = 0; i < n_rows; ++i) {
        Index r0, r1;
        detail::tile_extent(grid.rows, n_rows, i, r0, r1);

        for (Index j = 0; j < n_cols; ++j) {
            Index c0, c1;
            detail::tile_extent(grid.cols, n_cols, j, c0, c1);

            Size k = 0;
            for (Index r = r0; r < r1; ++r) {
                for (Index c = c0; c < c1; ++c) {
                    const Real v = grid(r, c);
                    if (is_valid(v)) scratch[k++] = v;
                }
            }
            auto values = scratch.array().subspan(0, k);
            vsp::sort::sort(values);

            TileStats t{};
            t.tile_row = i;
            t.tile_col = j;
            t.row_begin = r0;
            t.row_end = r1;
            t.col_begin = c0;
            t.col_end = c1;
            t.n_cells = static_cast<Size>(r1 - r0) * static_cast<Size>(c1 - c0);
            t.summary = stats::summarize_sorted(Array<const Real>(values));
            result.tiles.push_back(std::move(t));
        }
    }
    return result;
}

// Labeled-zone view of the tiling: every cell carries its tile's zone id
inline LabelGrid zone_map(const QuadrantResult& result) {
    LabelGrid zones(result.grid_rows, result.grid_cols, Index(0));
    for (const auto& t : result.tiles) {
        const Index z = tile_zone(t.tile_row, t.tile_col, result.n_cols);
        for (Index r = t.row_begin; r < t.row_end; ++r) {
            for (Index c = t.col_begin; c < t.col_end; ++c) {
                zones(r, c) = z;
            }
        }
    }
    return zones;
}

} // namespace vsp::kernel::quadrant
