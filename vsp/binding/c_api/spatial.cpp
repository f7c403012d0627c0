// =============================================================================
// FILE: vsp/binding/c_api/spatial.cpp
// BRIEF: C API implementation for Moran's I
// =============================================================================

#include "vsp/binding/c_api/spatial.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/kernel/spatial.hpp"

using namespace vsp;
using namespace vsp::binding;

extern "C" {

VSP_EXPORT vsp_error_t vsp_spatial_moran(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const char* neighborhood,
    vsp_moran_t* out) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(neighborhood, "Neighborhood name is null");
    VSP_C_API_CHECK_NULL(out, "Output record is null");

    VSP_C_API_TRY
        const auto r = kernel::spatial::moran(grid_view(grid, rows, cols), neighborhood);
        if (!r) {
            const vsp_real_t nan = std::numeric_limits<vsp_real_t>::quiet_NaN();
            *out = vsp_moran_t{VSP_FALSE, nan, nan, nan, nan, 0, 0,
                               VSP_AUTOCORRELATION_RANDOM, VSP_FALSE};
            out->n_valid = count_valid(grid_view(grid, rows, cols));
            VSP_C_API_RETURN_OK;
        }
        *out = vsp_moran_t{VSP_TRUE, r->moran_i, r->expected_i, r->z_score, r->p_value,
                           r->n_valid, r->n_pairs, static_cast<int32_t>(r->pattern),
                           to_bool(r->significant)};
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

VSP_EXPORT const char* vsp_autocorrelation_name(const int32_t pattern) {
    if (pattern < VSP_AUTOCORRELATION_RANDOM || pattern > VSP_AUTOCORRELATION_DISPERSED) {
        return nullptr;
    }
    return kernel::spatial::autocorrelation_name(static_cast<kernel::spatial::Autocorrelation>(pattern));
}

} // extern "C"
