#pragma once

#include "vsp/config.hpp"
#include "vsp/core/type.hpp"
#include "vsp/core/macros.hpp"
#include "vsp/core/error.hpp"
#include "vsp/core/grid.hpp"
#include "vsp/core/vectorize.hpp"
#include "vsp/math/stats.hpp"
#include "vsp/threading/parallel_for.hpp"
#include "vsp/threading/scheduler.hpp"
#include "vsp/threading/workspace.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// =============================================================================
// FILE: vsp/kernel/spatial.hpp
// BRIEF: Global spatial autocorrelation (Moran's I) over grid adjacency
// =============================================================================

namespace vsp::kernel::spatial {

namespace config {
    constexpr Size PARALLEL_ROW_THRESHOLD = 16;
}

// =============================================================================
// Neighborhood Structures
// =============================================================================

enum class Neighborhood : std::int32_t {
    Queen = 0,   // 8 neighbours, diagonals included
    Rook = 1     // 4 orthogonal neighbours
};

inline Neighborhood parse_neighborhood(std::string_view name) {
    if (name == "queen") return Neighborhood::Queen;
    if (name == "rook") return Neighborhood::Rook;
    throw ValueError("moran: unknown neighborhood '" + std::string(name) +
                     "' (expected queen or rook)");
}

enum class Autocorrelation : std::int32_t {
    Random = 0,
    Clustered = 1,   // significant, I > E[I]
    Dispersed = 2    // significant, I < E[I]
};

inline const char* autocorrelation_name(Autocorrelation a) noexcept {
    switch (a) {
        case Autocorrelation::Random: return "random";
        case Autocorrelation::Clustered: return "clustered";
        case Autocorrelation::Dispersed: return "dispersed";
    }
    VSP_UNREACHABLE();
}

struct MoranResult {
    Real moran_i;
    Real expected_i;
    Real z_score;
    Real p_value;
    Size n_valid;
    Size n_pairs;            // ordered neighbour pairs (W)
    Autocorrelation pattern;
    bool significant;
};

namespace detail {

// 3x3 structuring element, centre excluded
struct Offset {
    int dr;
    int dc;
};

constexpr std::array<Offset, 8> QUEEN_OFFSETS{{
    {-1, -1}, {-1, 0}, {-1, 1},
    { 0, -1},          { 0, 1},
    { 1, -1}, { 1, 0}, { 1, 1}
}};

constexpr std::array<Offset, 4> ROOK_OFFSETS{{
    {-1, 0}, {0, -1}, {0, 1}, {1, 0}
}};

// Per-thread accumulator slots
enum Slot : Size {
    NUMERATOR = 0,
    DENOMINATOR = 1,
    PAIRS = 2,
    N_SLOTS = 3
};

template <typename Offsets>
inline void accumulate_row(GridView<const Real> dev, Index r, const Offsets& offsets, double* acc) {
    const Index rows = dev.rows;
    const Index cols = dev.cols;
    double num = 0.0;
    double den = 0.0;
    double pairs = 0.0;

    for (Index c = 0; c < cols; ++c) {
        const Real d = dev(r, c);
        if (!is_valid(d)) continue;
        den += static_cast<double>(d) * d;

        for (const auto& o : offsets) {
            const Index rr = r + o.dr;
            const Index cc = c + o.dc;
            if (rr < 0 || rr >= rows || cc < 0 || cc >= cols) continue;
            const Real dn = dev(rr, cc);
            if (!is_valid(dn)) continue;
            num += static_cast<double>(d) * dn;
            pairs += 1.0;
        }
    }

    acc[NUMERATOR] += num;
    acc[DENOMINATOR] += den;
    acc[PAIRS] += pairs;
}

} // namespace detail

// No result when there are no valid neighbour pairs or the surface is
// constant. Uses the simplified variance 1 / (N - 1).
inline std::optional<MoranResult> moran(GridView<const Real> grid,
                                        Neighborhood neighborhood = Neighborhood::Queen) {
    const auto values = gather_valid_values(grid);
    const Size n = values.size();
    if (n < 2) return std::nullopt;

    const Real mean = vectorize::sum(values.array()) / static_cast<Real>(n);

    RealGrid dev(grid.rows, grid.cols);
    const Size total = grid.size();
    for (Size i = 0; i < total; ++i) {
        const Real v = grid.ptr[i];
        dev.data()[i] = is_valid(v) ? v - mean : MISSING;
    }
    const auto dview = dev.cview();

    const size_t n_threads = std::max(threading::Scheduler::get_num_threads(),
                                      threading::Scheduler::hardware_concurrency());
    threading::WorkspacePool<double> acc;
    acc.init(n_threads, detail::N_SLOTS);
    acc.zero_all();

    threading::parallel_for(Size(0), static_cast<Size>(grid.rows), [&](size_t r, size_t rank) {
        if (neighborhood == Neighborhood::Queen) {
            detail::accumulate_row(dview, static_cast<Index>(r), detail::QUEEN_OFFSETS, acc.get(rank));
        } else {
            detail::accumulate_row(dview, static_cast<Index>(r), detail::ROOK_OFFSETS, acc.get(rank));
        }
    }, config::PARALLEL_ROW_THRESHOLD);

    std::array<double, detail::N_SLOTS> totals{};
    acc.reduce_into(Array<double>(totals.data(), totals.size()));

    const double numerator = totals[detail::NUMERATOR];
    const double denominator = totals[detail::DENOMINATOR];
    const double w = totals[detail::PAIRS];
    if (w == 0.0 || denominator == 0.0) return std::nullopt;

    const auto N = static_cast<double>(n);
    const double I = (N / w) * (numerator / denominator);
    const double expected = -1.0 / (N - 1.0);
    const double z = (I - expected) / std::sqrt(1.0 / (N - 1.0));
    const double p = math::normal_two_sided(z);

    MoranResult r{};
    r.moran_i = static_cast<Real>(I);
    r.expected_i = static_cast<Real>(expected);
    r.z_score = static_cast<Real>(z);
    r.p_value = static_cast<Real>(p);
    r.n_valid = n;
    r.n_pairs = static_cast<Size>(w);
    r.significant = p < analysis::SIGNIFICANCE_LEVEL;
    if (!r.significant) {
        r.pattern = Autocorrelation::Random;
    } else if (I > expected) {
        r.pattern = Autocorrelation::Clustered;
    } else if (I < expected) {
        r.pattern = Autocorrelation::Dispersed;
    } else {
        r.pattern = Autocorrelation::Random;
    }
    return r;
}

inline std::optional<MoranResult> moran(GridView<const Real> grid, std::string_view neighborhood) {
    return moran(grid, parse_neighborhood(neighborhood));
}

} // namespace vsp::kernel::spatial
