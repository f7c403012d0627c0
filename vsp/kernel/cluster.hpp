#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/memory.hpp"
#include "vsp/core/grid.hpp"
#include "vsp/core/log.hpp"
#include "vsp/threading/parallel_for.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <numeric>
#include <optional>
#include <vector>

// =============================================================================
// FILE: vsp/kernel/cluster.hpp
// BRIEF: Spatial clustering of valid cells (K-means, DBSCAN)
// =============================================================================

namespace vsp::kernel::cluster {

namespace config {
    constexpr Size MAX_FEATURES = 3;
    constexpr Size PARALLEL_POINT_THRESHOLD = 4096;
    constexpr Index NOISE = -1;
    constexpr Real MAX_CELL_KEY = Real(4503599627370496.0);  // 2^52
}

// =============================================================================
// Result Types
// =============================================================================

struct ClusterStats {
    Index cluster;
    Size n_pixels;
    Real percentage;     // of valid cells
    Real mean;
    Real std_dev;
    Real min;
    Real max;
};

struct KMeansParams {
    Index k = 3;
    bool include_coords = true;
    Index n_init = analysis::KMEANS_N_INIT;
    Index max_iter = analysis::KMEANS_MAX_ITER;
    Real tol = Real(analysis::KMEANS_TOL);
    std::uint64_t seed = analysis::KMEANS_SEED;
};

struct KMeansResult {
    RealGrid assignment;              // cluster id per valid cell, NaN elsewhere
    LabelGrid zones;                  // cluster id + 1, 0 for missing cells
    Index n_clusters = 0;
    Size n_valid = 0;
    std::vector<ClusterStats> clusters;
    Real inertia = 0;                 // in standardized feature space
    Size n_features = 0;
    std::vector<Real> centroids;      // n_clusters x n_features, standardized
    Index n_iter = 0;
};

struct DBSCANParams {
    Real eps = Real(0.5);
    Index min_samples = 5;
    bool include_coords = true;
};

struct DBSCANResult {
    RealGrid assignment;              // cluster id, -1 for noise, NaN for missing cells
    LabelGrid zones;                  // cluster id + 1, 0 for noise and missing cells
    Index n_clusters = 0;             // noise excluded
    Size n_noise = 0;
    Real noise_percentage = 0;
    Size n_valid = 0;
    std::vector<ClusterStats> clusters;
};

// =============================================================================
// Feature Construction
// =============================================================================

// Row-major [n_points x n_features] matrix of standardized features for the
// valid cells: [value] or [value, col / cols, row / rows].
struct Features {
    ValidCells cells;
    memory::AlignedBuffer<Real> data;
    Size n_points;
    Size n_features;

    [[nodiscard]] const Real* point(Size i) const noexcept {
        return data.get() + i * n_features;
    }
};

namespace detail {

// 64-bit LCG (Knuth MMIX constants); 53-bit mantissa for next_real
struct LCG {
    std::uint64_t state;

    explicit LCG(std::uint64_t seed) : state(seed) {}

    std::uint64_t next() {
        state = state * 6364136223846793005ULL + 1442695040888963407ULL;
        return state;
    }

    Real next_real() {
        return static_cast<Real>(next() >> 11) * Real(1.1102230246251565e-16);
    }

    Size next_index(Size max_val) {
        return static_cast<Size>((next() >> 17) % max_val);
    }
};

VSP_FORCE_INLINE Real sq_dist(const Real* VSP_RESTRICT a, const Real* VSP_RESTRICT b, Size d) noexcept {
    Real acc = 0;
    for (Size j = 0; j < d; ++j) {
        const Real t = a[j] - b[j];
        acc += t * t;
    }
    return acc;
}

// Zero-mean, unit-variance columns; a constant column keeps scale 1
inline void standardize_columns(Real* data, Size n, Size d) {
    for (Size j = 0; j < d; ++j) {
        double mean = 0.0;
        for (Size i = 0; i < n; ++i) mean += data[i * d + j];
        mean /= static_cast<double>(n);

        double var = 0.0;
        for (Size i = 0; i < n; ++i) {
            const double t = data[i * d + j] - mean;
            var += t * t;
        }
        var /= static_cast<double>(n);

        const double scale = var > 0.0 ? std::sqrt(var) : 1.0;
        for (Size i = 0; i < n; ++i) {
            data[i * d + j] = static_cast<Real>((data[i * d + j] - mean) / scale);
        }
    }
}

inline std::vector<ClusterStats> summarize_clusters(
    Array<const Real> values,
    const std::vector<Index>& labels,
    Index n_clusters,
    Size n_valid
) {
    const auto k = static_cast<Size>(n_clusters);
    std::vector<Size> count(k, 0);
    std::vector<double> sum(k, 0.0);
    std::vector<Real> lo(k, std::numeric_limits<Real>::infinity());
    std::vector<Real> hi(k, -std::numeric_limits<Real>::infinity());

    for (Size i = 0; i < values.len; ++i) {
        if (labels[i] < 0) continue;
        const auto c = static_cast<Size>(labels[i]);
        ++count[c];
        sum[c] += values[i];
        lo[c] = std::min(lo[c], values[i]);
        hi[c] = std::max(hi[c], values[i]);
    }

    std::vector<double> ss(k, 0.0);
    for (Size i = 0; i < values.len; ++i) {
        if (labels[i] < 0) continue;
        const auto c = static_cast<Size>(labels[i]);
        const double t = values[i] - sum[c] / static_cast<double>(count[c]);
        ss[c] += t * t;
    }

    std::vector<ClusterStats> out;
    out.reserve(k);
    for (Size c = 0; c < k; ++c) {
        if (count[c] == 0) continue;
        const auto cnt = static_cast<double>(count[c]);
        out.push_back(ClusterStats{
            static_cast<Index>(c),
            count[c],
            static_cast<Real>(cnt / static_cast<double>(n_valid) * 100.0),
            static_cast<Real>(sum[c] / cnt),
            static_cast<Real>(std::sqrt(ss[c] / cnt)),
            lo[c],
            hi[c]
        });
    }
    return out;
}

// Scatter per-point labels back onto the grid
inline void scatter_labels(const Features& f, const std::vector<Index>& labels,
                           RealGrid& assignment, LabelGrid& zones) {
    for (Size i = 0; i < f.n_points; ++i) {
        const auto pos = static_cast<Size>(f.cells.positions[i]);
        assignment.data()[pos] = static_cast<Real>(labels[i]);
        zones.data()[pos] = labels[i] >= 0 ? labels[i] + 1 : 0;
    }
}

} // namespace detail

inline Features build_features(GridView<const Real> grid, bool include_coords) {
    Features f{gather_valid(grid), memory::AlignedBuffer<Real>(0), 0, include_coords ? Size(3) : Size(1)};
    f.n_points = f.cells.size();
    f.data = memory::AlignedBuffer<Real>(f.n_points * f.n_features);
    if (f.n_points == 0) return f;

    const Real inv_cols = Real(1) / static_cast<Real>(grid.cols);
    const Real inv_rows = Real(1) / static_cast<Real>(grid.rows);

    for (Size i = 0; i < f.n_points; ++i) {
        Real* p = f.data.get() + i * f.n_features;
        p[0] = f.cells.values[i];
        if (include_coords) {
            const Index pos = f.cells.positions[i];
            p[1] = static_cast<Real>(pos % grid.cols) * inv_cols;
            p[2] = static_cast<Real>(pos / grid.cols) * inv_rows;
        }
    }

    detail::standardize_columns(f.data.get(), f.n_points, f.n_features);
    return f;
}

// =============================================================================
// K-means
// =============================================================================

namespace detail {

struct KMeansRun {
    std::vector<Real> centers;
    std::vector<Index> labels;
    Real inertia;
    Index n_iter;
};

inline void kmeanspp_init(const Features& f, Size k, LCG& rng, std::vector<Real>& centers) {
    const Size n = f.n_points;
    const Size d = f.n_features;
    centers.assign(k * d, Real(0));

    Size first = rng.next_index(n);
    std::copy_n(f.point(first), d, centers.begin());

    std::vector<Real> closest(n);
    for (Size i = 0; i < n; ++i) {
        closest[i] = sq_dist(f.point(i), centers.data(), d);
    }

    for (Size c = 1; c < k; ++c) {
        double total = 0.0;
        for (Size i = 0; i < n; ++i) total += closest[i];

        Size chosen = 0;
        if (total <= 0.0) {
            chosen = rng.next_index(n);
        } else {
            const double target = static_cast<double>(rng.next_real()) * total;
            double acc = 0.0;
            chosen = n - 1;
            for (Size i = 0; i < n; ++i) {
                acc += closest[i];
                if (acc > target) {
                    chosen = i;
                    break;
                }
            }
        }

        Real* center = centers.data() + c * d;
        std::copy_n(f.point(chosen), d, center);
        for (Size i = 0; i < n; ++i) {
            closest[i] = std::min(closest[i], sq_dist(f.point(i), center, d));
        }
    }
}

inline void assign_points(const Features& f, const std::vector<Real>& centers, Size k,
                          std::vector<Index>& labels, std::vector<Real>& dist2) {
    const Size d = f.n_features;
    threading::parallel_for(Size(0), f.n_points, [&](size_t i) {
        const Real* p = f.point(i);
        Real best = std::numeric_limits<Real>::infinity();
        Index best_c = 0;
        for (Size c = 0; c < k; ++c) {
            const Real dc = sq_dist(p, centers.data() + c * d, d);
            if (dc < best) {
                best = dc;
                best_c = static_cast<Index>(c);
            }
        }
        labels[i] = best_c;
        dist2[i] = best;
    }, config::PARALLEL_POINT_THRESHOLD);
}

// Moves the point farthest from its centroid (taken from a cluster with more
// than one member) into each empty cluster. Requires n_points >= k.
inline void fill_empty_clusters(const Features& f, std::vector<Real>& centers,
                                std::vector<Index>& labels, std::vector<Real>& dist2,
                                std::vector<Size>& counts) {
    const Size d = f.n_features;
    for (Size c = 0; c < counts.size(); ++c) {
        if (counts[c] != 0) continue;

        Size pick = f.n_points;
        Real far = -Real(1);
        for (Size i = 0; i < f.n_points; ++i) {
            if (counts[static_cast<Size>(labels[i])] > 1 && dist2[i] > far) {
                far = dist2[i];
                pick = i;
            }
        }
        VSP_ASSERT(pick < f.n_points, "kmeans: no point available to refill an empty cluster");

        VSP_LOG_INFO("kmeans: cluster %zu became empty, reseeded from point %zu", c, pick);
        --counts[static_cast<Size>(labels[pick])];
        labels[pick] = static_cast<Index>(c);
        counts[c] = 1;
        dist2[pick] = 0;
        std::copy_n(f.point(pick), d, centers.begin() + static_cast<std::ptrdiff_t>(c * d));
    }
}

inline std::vector<Size> count_members(const std::vector<Index>& labels, Size k) {
    std::vector<Size> counts(k, 0);
    for (Index l : labels) ++counts[static_cast<Size>(l)];
    return counts;
}

inline KMeansRun lloyd(const Features& f, Size k, const KMeansParams& params, LCG& rng) {
    const Size n = f.n_points;
    const Size d = f.n_features;

    KMeansRun run;
    kmeanspp_init(f, k, rng, run.centers);
    run.labels.assign(n, 0);
    std::vector<Real> dist2(n, Real(0));
    std::vector<double> sums(k * d);

    // Shift tolerance relative to the mean feature variance
    double mean_var = 0.0;
    for (Size j = 0; j < d; ++j) {
        double m = 0.0;
        double s2 = 0.0;
        for (Size i = 0; i < n; ++i) m += f.point(i)[j];
        m /= static_cast<double>(n);
        for (Size i = 0; i < n; ++i) {
            const double t = f.point(i)[j] - m;
            s2 += t * t;
        }
        mean_var += s2 / static_cast<double>(n);
    }
    const double tol = static_cast<double>(params.tol) * mean_var / static_cast<double>(d);

    bool converged = false;
    run.n_iter = 0;
    while (run.n_iter < params.max_iter) {
        ++run.n_iter;
        assign_points(f, run.centers, k, run.labels, dist2);

        auto counts = count_members(run.labels, k);
        fill_empty_clusters(f, run.centers, run.labels, dist2, counts);

        std::fill(sums.begin(), sums.end(), 0.0);
        for (Size i = 0; i < n; ++i) {
            const auto c = static_cast<Size>(run.labels[i]);
            const Real* p = f.point(i);
            for (Size j = 0; j < d; ++j) sums[c * d + j] += p[j];
        }

        double shift = 0.0;
        for (Size c = 0; c < k; ++c) {
            const auto cnt = static_cast<double>(counts[c]);
            for (Size j = 0; j < d; ++j) {
                const auto updated = static_cast<Real>(sums[c * d + j] / cnt);
                const double delta = updated - run.centers[c * d + j];
                shift += delta * delta;
                run.centers[c * d + j] = updated;
            }
        }

        if (shift <= tol) {
            converged = true;
            break;
        }
    }

    if (!converged) {
        VSP_LOG_INFO("kmeans: stopped after max_iter=%lld without converging",
                     static_cast<long long>(params.max_iter));
    }

    // Final assignment against the final centers
    assign_points(f, run.centers, k, run.labels, dist2);
    auto counts = count_members(run.labels, k);
    fill_empty_clusters(f, run.centers, run.labels, dist2, counts);

    double inertia = 0.0;
    for (Size i = 0; i < n; ++i) inertia += dist2[i];
    run.inertia = static_cast<Real>(inertia);
    return run;
}

} // namespace detail

// No result when fewer valid cells than k. Cluster ids are ordered by
// ascending mean raw value.
inline std::optional<KMeansResult> kmeans(GridView<const Real> grid, const KMeansParams& params) {
    VSP_CHECK_ARG(params.k >= 1, "kmeans: k must be >= 1");
    VSP_CHECK_ARG(params.n_init >= 1, "kmeans: n_init must be >= 1");
    VSP_CHECK_ARG(params.max_iter >= 1, "kmeans: max_iter must be >= 1");
    VSP_CHECK_ARG(params.tol >= Real(0), "kmeans: tol must be non-negative");

    const auto k = static_cast<Size>(params.k);
    const Features f = build_features(grid, params.include_coords);
    if (f.n_points < k || f.n_points == 0) return std::nullopt;

    detail::LCG rng(params.seed);
    detail::KMeansRun best;
    bool have_best = false;
    for (Index run = 0; run < params.n_init; ++run) {
        auto candidate = detail::lloyd(f, k, params, rng);
        if (!have_best || candidate.inertia < best.inertia) {
            best = std::move(candidate);
            have_best = true;
        }
    }

    // Relabel by ascending mean raw value (ties keep the fitted order)
    std::vector<double> mean(k, 0.0);
    std::vector<Size> count(k, 0);
    for (Size i = 0; i < f.n_points; ++i) {
        const auto c = static_cast<Size>(best.labels[i]);
        mean[c] += f.cells.values[i];
        ++count[c];
    }
    for (Size c = 0; c < k; ++c) mean[c] /= static_cast<double>(count[c]);

    std::vector<Size> order(k);
    std::iota(order.begin(), order.end(), Size(0));
    std::stable_sort(order.begin(), order.end(),
                     [&](Size a, Size b) { return mean[a] < mean[b]; });

    std::vector<Index> remap(k);
    for (Size rank = 0; rank < k; ++rank) remap[order[rank]] = static_cast<Index>(rank);
    for (auto& l : best.labels) l = remap[static_cast<Size>(l)];

    KMeansResult r{RealGrid(grid.rows, grid.cols, MISSING), LabelGrid(grid.rows, grid.cols, Index(0))};
    r.n_clusters = params.k;
    r.n_valid = f.n_points;
    r.n_features = f.n_features;
    r.inertia = best.inertia;
    r.n_iter = best.n_iter;
    r.centroids.resize(k * f.n_features);
    for (Size rank = 0; rank < k; ++rank) {
        std::copy_n(best.centers.begin() + static_cast<std::ptrdiff_t>(order[rank] * f.n_features),
                    f.n_features,
                    r.centroids.begin() + static_cast<std::ptrdiff_t>(rank * f.n_features));
    }

    detail::scatter_labels(f, best.labels, r.assignment, r.zones);
    r.clusters = detail::summarize_clusters(f.cells.values.array(), best.labels, params.k, f.n_points);
    return r;
}

// =============================================================================
// DBSCAN
// =============================================================================

namespace detail {

using CellKey = std::array<std::int64_t, config::MAX_FEATURES>;

// Points bucketed into eps-sized cubes, sorted by cube key. Falls back to a
// linear scan when coordinates / eps would not fit the integer key.
class NeighborIndex {
public:
    NeighborIndex(const Features& f, Real eps)
        : f_(f), eps_(eps), eps2_(eps * eps), keys_(f.n_points), order_(f.n_points)
    {
        std::iota(order_.begin(), order_.end(), Size(0));
        Real max_abs = Real(0);
        for (Size i = 0; i < f.n_points * f.n_features; ++i) {
            max_abs = std::max(max_abs, std::abs(f.data.get()[i]));
        }
        const Real extent = max_abs / eps_;
        if (!std::isfinite(extent) || extent > config::MAX_CELL_KEY) {
            brute_force_ = true;
            return;
        }
        for (Size i = 0; i < f.n_points; ++i) {
            keys_[i] = key_of(f.point(i));
        }
        std::sort(order_.begin(), order_.end(), [&](Size a, Size b) {
            return keys_[a] < keys_[b] || (keys_[a] == keys_[b] && a < b);
        });
        sorted_keys_.reserve(f.n_points);
        for (Size i : order_) sorted_keys_.push_back(keys_[i]);
    }

    // Calls fn(j) for every point j with distance <= eps to point i (i included)
    template <typename Fn>
    void for_each_neighbor(Size i, Fn&& fn) const {
        const Real* p = f_.point(i);
        const Size d = f_.n_features;
        if (brute_force_) {
            for (Size j = 0; j < f_.n_points; ++j) {
                if (sq_dist(p, f_.point(j), d) <= eps2_) {
                    fn(j);
                }
            }
            return;
        }

        const CellKey base = keys_[i];
        const int span_y = d > 1 ? 1 : 0;
        const int span_z = d > 2 ? 1 : 0;

        for (int dx = -1; dx <= 1; ++dx) {
            for (int dy = -span_y; dy <= span_y; ++dy) {
                for (int dz = -span_z; dz <= span_z; ++dz) {
                    CellKey key = base;
                    key[0] += dx;
                    key[1] += dy;
                    key[2] += dz;
                    auto range = std::equal_range(sorted_keys_.begin(), sorted_keys_.end(), key);
                    const auto lo = static_cast<Size>(range.first - sorted_keys_.begin());
                    const auto hi = static_cast<Size>(range.second - sorted_keys_.begin());
                    for (Size s = lo; s < hi; ++s) {
                        const Size j = order_[s];
                        if (sq_dist(p, f_.point(j), d) <= eps2_) {
                            fn(j);
                        }
                    }
                }
            }
        }
    }

private:
    CellKey key_of(const Real* p) const noexcept {
        CellKey key{0, 0, 0};
        for (Size j = 0; j < f_.n_features; ++j) {
            key[j] = static_cast<std::int64_t>(std::floor(p[j] / eps_));
        }
        return key;
    }

    const Features& f_;
    Real eps_;
    Real eps2_;
    std::vector<CellKey> keys_;
    std::vector<Size> order_;
    std::vector<CellKey> sorted_keys_;
    bool brute_force_ = false;
};

} // namespace detail

// No result when fewer valid cells than min_samples. Cluster ids follow
// discovery order over raster-ordered cells and are not reordered.
inline std::optional<DBSCANResult> dbscan(GridView<const Real> grid, const DBSCANParams& params) {
    VSP_CHECK_ARG(std::isfinite(params.eps) && params.eps > Real(0), "dbscan: eps must be > 0");
    VSP_CHECK_ARG(params.min_samples >= 1, "dbscan: min_samples must be >= 1");

    const Features f = build_features(grid, params.include_coords);
    const Size n = f.n_points;
    if (n == 0 || n < static_cast<Size>(params.min_samples)) return std::nullopt;

    const detail::NeighborIndex index(f, params.eps);
    const auto min_samples = static_cast<Size>(params.min_samples);

    // Core points: neighbourhood (self included) of at least min_samples
    std::vector<Byte> core(n, 0);
    threading::parallel_for(Size(0), n, [&](size_t i) {
        Size count = 0;
        index.for_each_neighbor(i, [&](Size) { ++count; });
        core[i] = count >= min_samples ? 1 : 0;
    }, config::PARALLEL_POINT_THRESHOLD);

    std::vector<Index> labels(n, config::NOISE);
    std::vector<Byte> visited(n, 0);
    std::vector<Size> frontier;
    Index n_clusters = 0;

    for (Size seed = 0; seed < n; ++seed) {
        if (visited[seed] || !core[seed]) continue;

        const Index id = n_clusters++;
        visited[seed] = 1;
        labels[seed] = id;
        frontier.assign(1, seed);

        while (!frontier.empty()) {
            const Size p = frontier.back();
            frontier.pop_back();
            index.for_each_neighbor(p, [&](Size q) {
                if (labels[q] == config::NOISE) {
                    labels[q] = id;
                }
                if (!visited[q] && core[q]) {
                    visited[q] = 1;
                    labels[q] = id;
                    frontier.push_back(q);
                }
            });
        }
    }

    DBSCANResult r{RealGrid(grid.rows, grid.cols, MISSING), LabelGrid(grid.rows, grid.cols, Index(0))};
    r.n_clusters = n_clusters;
    r.n_valid = n;
    for (Index l : labels) {
        if (l == config::NOISE) ++r.n_noise;
    }
    r.noise_percentage = static_cast<Real>(r.n_noise) / static_cast<Real>(n) * Real(100);

    detail::scatter_labels(f, labels, r.assignment, r.zones);
    r.clusters = detail::summarize_clusters(f.cells.values.array(), labels, n_clusters, n);
    return r;
}

} // namespace vsp::kernel::cluster
