#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/memory.hpp"
#include "vsp/core/grid.hpp"

#include <cstdint>
#include <optional>
#include <vector>

// =============================================================================
// FILE: vsp/kernel/regions.hpp
// BRIEF: Connected-component labeling of boolean masks
// =============================================================================

namespace vsp::kernel::regions {

enum class Connectivity : std::int32_t {
    Four = 4,    // orthogonal neighbours (rook)
    Eight = 8    // orthogonal and diagonal neighbours (queen)
};

struct Region {
    Index label;
    Size size;
    Real centroid_row;
    Real centroid_col;
};

struct RegionResult {
    LabelGrid labels;              // 0 outside the mask, 1..n_regions inside
    Size n_regions = 0;
    std::vector<Region> regions;   // ordered by label
    std::optional<Real> mean_size;
    std::optional<Size> max_size;
    std::optional<Size> min_size;
};

namespace detail {

constexpr Index NO_LABEL = -1;

// Union-find over provisional labels: full path compression, union by rank
class UnionFind {
public:
    explicit UnionFind(Size capacity)
        : parent_(memory::aligned_alloc_or_throw<Index>(capacity)),
          rank_(memory::aligned_alloc_or_throw<Byte>(capacity)),
          size_(0) {}

    Index make_set() noexcept {
        const auto id = static_cast<Index>(size_++);
        parent_[static_cast<Size>(id)] = id;
        rank_[static_cast<Size>(id)] = 0;
        return id;
    }

    VSP_FORCE_INLINE Index find(Index x) noexcept {
        Index root = x;
        while (parent_[static_cast<Size>(root)] != root) {
            root = parent_[static_cast<Size>(root)];
        }
        while (parent_[static_cast<Size>(x)] != root) {
            const Index next = parent_[static_cast<Size>(x)];
            parent_[static_cast<Size>(x)] = root;
            x = next;
        }
        return root;
    }

    VSP_FORCE_INLINE void unite(Index x, Index y) noexcept {
        Index rx = find(x);
        Index ry = find(y);
        if (rx == ry) return;

        auto& rank_x = rank_[static_cast<Size>(rx)];
        auto& rank_y = rank_[static_cast<Size>(ry)];
        if (rank_x < rank_y) {
            parent_[static_cast<Size>(rx)] = ry;
        } else if (rank_x > rank_y) {
            parent_[static_cast<Size>(ry)] = rx;
        } else {
            parent_[static_cast<Size>(ry)] = rx;
            ++rank_x;
        }
    }

    [[nodiscard]] Size size() const noexcept { return size_; }

private:
    memory::AlignedPtr<Index> parent_;
    memory::AlignedPtr<Byte> rank_;
    Size size_;
};

} // namespace detail

// Two-pass labeling. Final labels follow the raster order of each
// component's first cell.
inline RegionResult label(GridView<const Byte> mask,
                          Connectivity connectivity = Connectivity::Four) {
    const Index rows = mask.rows;
    const Index cols = mask.cols;

    RegionResult result{LabelGrid(rows, cols, Index(0))};
    const Size n = mask.size();
    if (n == 0) return result;

    LabelGrid& labels = result.labels;
    detail::UnionFind uf(n);
    const bool diagonal = connectivity == Connectivity::Eight;

    // Pass 1: provisional labels from already visited neighbours
    // (west, north, and for 8-connectivity north-west / north-east).
    for (Index r = 0; r < rows; ++r) {
        for (Index c = 0; c < cols; ++c) {
            if (mask(r, c) == 0) {
                labels(r, c) = detail::NO_LABEL;
                continue;
            }

            Index current = detail::NO_LABEL;
            auto join = [&](Index rr, Index cc) {
                if (rr < 0 || cc < 0 || cc >= cols) return;
                const Index l = labels(rr, cc);
                if (l == detail::NO_LABEL) return;
                if (current == detail::NO_LABEL) {
                    current = l;
                } else {
                    uf.unite(current, l);
                }
            };

            join(r, c - 1);
            join(r - 1, c);
            if (diagonal) {
                join(r - 1, c - 1);
                join(r - 1, c + 1);
            }

            labels(r, c) = (current == detail::NO_LABEL) ? uf.make_set() : current;
        }
    }

    // Pass 2: resolve roots to dense labels and accumulate region moments
    std::vector<Index> root_to_label(uf.size(), detail::NO_LABEL);
    std::vector<Size> sizes;
    std::vector<double> sum_rows;
    std::vector<double> sum_cols;

    for (Index r = 0; r < rows; ++r) {
        for (Index c = 0; c < cols; ++c) {
            Index& cell = labels(r, c);
            if (cell == detail::NO_LABEL) {
                cell = 0;
                continue;
            }
            const Index root = uf.find(cell);
            Index& final_label = root_to_label[static_cast<Size>(root)];
            if (final_label == detail::NO_LABEL) {
                sizes.push_back(0);
                sum_rows.push_back(0.0);
                sum_cols.push_back(0.0);
                final_label = static_cast<Index>(sizes.size());
            }
            cell = final_label;
            const auto k = static_cast<Size>(final_label - 1);
            ++sizes[k];
            sum_rows[k] += static_cast<double>(r);
            sum_cols[k] += static_cast<double>(c);
        }
    }

    result.n_regions = sizes.size();
    result.regions.reserve(sizes.size());
    Size total = 0;
    for (Size k = 0; k < sizes.size(); ++k) {
        const auto sz = static_cast<double>(sizes[k]);
        result.regions.push_back(Region{
            static_cast<Index>(k + 1),
            sizes[k],
            static_cast<Real>(sum_rows[k] / sz),
            static_cast<Real>(sum_cols[k] / sz)
        });
        total += sizes[k];
        if (!result.max_size || sizes[k] > *result.max_size) result.max_size = sizes[k];
        if (!result.min_size || sizes[k] < *result.min_size) result.min_size = sizes[k];
    }
    if (result.n_regions > 0) {
        result.mean_size = static_cast<Real>(total) / static_cast<Real>(result.n_regions);
    }
    return result;
}

} // namespace vsp::kernel::regions
