// =============================================================================
// FILE: vsp/binding/c_api/smooth.cpp
// BRIEF: C API implementation for Gaussian smoothing
// =============================================================================

#include "vsp/binding/c_api/smooth.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/kernel/smooth.hpp"

using namespace vsp;
using namespace vsp::binding;

extern "C" {

VSP_EXPORT vsp_error_t vsp_smooth_gaussian(
    const vsp_real_t* grid,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const vsp_real_t sigma,
    vsp_real_t* out) {

    VSP_C_API_CHECK_GRID(grid, rows, cols);
    VSP_C_API_CHECK_NULL(out, "Output grid is null");

    VSP_C_API_TRY
        const auto smoothed = kernel::smooth::gaussian_filter(grid_view(grid, rows, cols), sigma);
        export_grid(smoothed, out);
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

} // extern "C"
