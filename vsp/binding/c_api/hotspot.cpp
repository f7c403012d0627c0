// =============================================================================
// FILE: vsp/binding/c_api/hotspot.cpp
// BRIEF: C API implementation for hotspot detection
// =============================================================================

#include "vsp/binding/c_api/hotspot.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/kernel/hotspot.hpp"

#include <cstring>

using namespace vsp;
using namespace vsp::binding;

extern "C" {

VSP_EXPORT vsp_error_t vsp_hotspot_detect(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const char* method,
    const vsp_real_t threshold,
    vsp_mask_t* hotspots,
    vsp_mask_t* coldspots,
    vsp_hotspot_summary_t* summary) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(method, "Method name is null");
    VSP_C_API_CHECK_NULL(hotspots, "Output hotspot mask is null");
    VSP_C_API_CHECK_NULL(coldspots, "Output coldspot mask is null");
    VSP_C_API_CHECK_NULL(summary, "Output summary is null");

    VSP_C_API_TRY
        const auto result = kernel::hotspot::detect(grid_view(grid, rows, cols), method, threshold);
        const Size n = grid_size(rows, cols);

        if (!result) {
            std::memset(hotspots, 0, n);
            std::memset(coldspots, 0, n);
            *summary = vsp_hotspot_summary_t{};
            summary->available = VSP_FALSE;
            summary->mean_hotspots = std::numeric_limits<vsp_real_t>::quiet_NaN();
            summary->mean_coldspots = std::numeric_limits<vsp_real_t>::quiet_NaN();
            VSP_C_API_RETURN_OK;
        }

        export_grid(result->hotspots, hotspots);
        export_grid(result->coldspots, coldspots);
        summary->available = VSP_TRUE;
        summary->n_valid = result->n_valid;
        summary->n_hotspots = result->n_hotspots;
        summary->n_coldspots = result->n_coldspots;
        summary->pct_hotspots = result->pct_hotspots;
        summary->pct_coldspots = result->pct_coldspots;
        summary->mean_hotspots = value_or_nan(result->mean_hotspots);
        summary->mean_coldspots = value_or_nan(result->mean_coldspots);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

} // extern "C"
