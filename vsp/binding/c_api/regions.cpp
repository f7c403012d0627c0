// =============================================================================
// FILE: vsp/binding/c_api/regions.cpp
// BRIEF: C API implementation for connected-region labeling
// =============================================================================

#include "vsp/binding/c_api/regions.h"
#include "vsp/binding/c_api/core/internal.hpp"
#include "vsp/kernel/regions.hpp"

using namespace vsp;
using namespace vsp::binding;

extern "C" {

VSP_EXPORT vsp_error_t vsp_regions_label(
    const vsp_mask_t* mask,
    const vsp_index_t rows,
    const vsp_index_t cols,
    const int32_t connectivity,
    vsp_index_t* labels,
    vsp_region_t* regions,
    const vsp_size_t capacity,
    vsp_size_t* n_regions) {

    VSP_C_API_CHECK_GRID(mask, rows, cols);
    VSP_C_API_CHECK_NULL(labels, "Output label grid is null");
    VSP_C_API_CHECK_NULL(n_regions, "Output region count is null");
    VSP_C_API_CHECK(connectivity == 4 || connectivity == 8, VSP_ERROR_INVALID_ARGUMENT,
                    "Connectivity must be 4 or 8");

    VSP_C_API_TRY
        const auto conn = connectivity == 8 ? kernel::regions::Connectivity::Eight
                                            : kernel::regions::Connectivity::Four;
        const auto result = kernel::regions::label(GridView<const Byte>(mask, rows, cols), conn);

        export_grid(result.labels, labels);
        *n_regions = result.n_regions;
        if (regions == nullptr) {
            VSP_C_API_RETURN_OK;
        }
        VSP_C_API_CHECK(capacity >= result.n_regions, VSP_ERROR_RANGE_ERROR,
                        "Region buffer capacity is smaller than the number of regions");
        for (Size i = 0; i < result.n_regions; ++i) {
            const auto& r = result.regions[i];
            regions[i] = vsp_region_t{r.label, r.size, r.centroid_row, r.centroid_col};
        }
        VSP_C_API_RETURN_OK;
    VSP_C_API_CATCH
}

} // extern "C"
