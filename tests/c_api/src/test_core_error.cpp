// =============================================================================
// VSP Core - Error Handling and Runtime Configuration Tests
// =============================================================================
//
// Tests the error reporting system and runtime switches defined in core.h.
//
// Functions tested:
//   - vsp_get_version / vsp_get_build_config
//   - vsp_get_last_error / vsp_get_last_error_code / vsp_clear_error
//   - vsp_is_ok / vsp_is_error
//   - vsp_set_num_threads / vsp_get_num_threads
//   - vsp_set_log_level
//   - vsp::Exception hierarchy and its mapping onto VSP_ERROR_* codes
//
// =============================================================================

#include "test.hpp"
#include "vsp/core/error.hpp"

#include <cmath>
#include <cstring>
#include <string>

using namespace vsp::test;

VSP_TEST_BEGIN

// =============================================================================
// Version Information
// =============================================================================

VSP_TEST_UNIT(version_info_exists) {
    const char* version = vsp_get_version();
    VSP_ASSERT_NOT_NULL(version);
    VSP_ASSERT_TRUE(version[0] != '\0');
}

VSP_TEST_UNIT(build_config_names_real_type) {
    const char* config = vsp_get_build_config();
    VSP_ASSERT_NOT_NULL(config);
    VSP_ASSERT_TRUE(std::strstr(config, VSP_REAL_TYPE_NAME) != nullptr);
}

// =============================================================================
// Error Codes
// =============================================================================

VSP_TEST_UNIT(error_codes_defined) {
    VSP_ASSERT_EQ(VSP_OK, 0);
    VSP_ASSERT_EQ(VSP_ERROR_NULL_POINTER, 4);
    VSP_ASSERT_EQ(VSP_ERROR_INVALID_ARGUMENT, 10);
    VSP_ASSERT_EQ(VSP_ERROR_DIMENSION_MISMATCH, 11);
    VSP_ASSERT_EQ(VSP_ERROR_RANGE_ERROR, 13);

    VSP_ASSERT_EQ(vsp_is_ok(VSP_OK), VSP_TRUE);
    VSP_ASSERT_EQ(vsp_is_error(VSP_OK), VSP_FALSE);
    VSP_ASSERT_EQ(vsp_is_error(VSP_ERROR_RANGE_ERROR), VSP_TRUE);
}

VSP_TEST_UNIT(exception_codes_match_c_codes) {
    VSP_ASSERT_EQ(static_cast<vsp_error_t>(vsp::ValueError("x").code()), VSP_ERROR_INVALID_ARGUMENT);
    VSP_ASSERT_EQ(static_cast<vsp_error_t>(vsp::DimensionError("x").code()), VSP_ERROR_DIMENSION_MISMATCH);
    VSP_ASSERT_EQ(static_cast<vsp_error_t>(vsp::RangeError("x").code()), VSP_ERROR_RANGE_ERROR);
    VSP_ASSERT_EQ(static_cast<vsp_error_t>(vsp::OutOfMemoryError().code()), VSP_ERROR_OUT_OF_MEMORY);
    VSP_ASSERT_EQ(static_cast<vsp_error_t>(vsp::InternalError("x").code()), VSP_ERROR_INTERNAL);
    VSP_ASSERT_EQ(static_cast<vsp_error_t>(vsp::ErrorCode::NULL_POINTER), VSP_ERROR_NULL_POINTER);
    VSP_ASSERT_EQ(static_cast<vsp_error_t>(vsp::ErrorCode::UNKNOWN), VSP_ERROR_UNKNOWN);
}

VSP_TEST_UNIT(check_macros_throw_their_types) {
    VSP_ASSERT_THROWS(VSP_CHECK_ARG(false, "bad"), vsp::ValueError);
    VSP_ASSERT_THROWS(VSP_CHECK_DIM(false, "shape"), vsp::DimensionError);
    VSP_ASSERT_THROWS(VSP_CHECK_RANGE(std::nan(""), 0.0, 1.0, "nan"), vsp::RangeError);
    VSP_ASSERT_THROWS(VSP_CHECK_RANGE(1.5, 0.0, 1.0, "high"), vsp::RangeError);
    VSP_ASSERT_NO_THROW(VSP_CHECK_RANGE(1.0, 0.0, 1.0, "edge"));
    VSP_ASSERT_THROWS(VSP_ASSERT(false, "invariant"), vsp::InternalError);
}

VSP_TEST_UNIT(error_initial_state) {
    vsp_clear_error();
    VSP_ASSERT_EQ(vsp_get_last_error_code(), VSP_OK);
    VSP_ASSERT_EQ(std::string(vsp_get_last_error()), std::string("No error"));
}

VSP_TEST_UNIT(error_after_null_grid) {
    vsp_clear_error();
    vsp_summary_t s;
    const vsp_error_t err = vsp_stats_describe(nullptr, 3, 3, &s);
    VSP_ASSERT_EQ(err, VSP_ERROR_NULL_POINTER);
    VSP_ASSERT_EQ(vsp_get_last_error_code(), VSP_ERROR_NULL_POINTER);
    VSP_ASSERT_TRUE(std::strlen(vsp_get_last_error()) > 0);
}

VSP_TEST_UNIT(error_after_negative_shape) {
    auto grid = sequence_grid(2, 2);
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), -1, 2, &s), VSP_ERROR_INVALID_ARGUMENT);
}

VSP_TEST_UNIT(error_cleared_by_success) {
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(nullptr, 1, 1, &s), VSP_ERROR_NULL_POINTER);

    auto grid = sequence_grid(2, 2);
    VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 2, 2, &s), VSP_OK);
    VSP_ASSERT_EQ(vsp_get_last_error_code(), VSP_OK);
}

VSP_TEST_UNIT(error_message_from_kernel_exception) {
    auto grid = sequence_grid(3, 3);
    MaskData hot(9), cold(9);
    vsp_hotspot_summary_t summary;
    const vsp_error_t err = vsp_hotspot_detect(grid.data(), 3, 3, "median", 1.0,
                                               hot.data(), cold.data(), &summary);
    VSP_ASSERT_EQ(err, VSP_ERROR_INVALID_ARGUMENT);
    const std::string msg = vsp_get_last_error();
    VSP_ASSERT_TRUE(msg.find("median") != std::string::npos);
}

VSP_TEST_UNIT(clear_error_resets_state) {
    vsp_summary_t s;
    VSP_ASSERT_EQ(vsp_stats_describe(nullptr, 1, 1, &s), VSP_ERROR_NULL_POINTER);
    vsp_clear_error();
    VSP_ASSERT_EQ(vsp_get_last_error_code(), VSP_OK);
}

// =============================================================================
// Runtime Configuration
// =============================================================================

VSP_TEST_UNIT(num_threads_positive) {
    VSP_ASSERT_EQ(vsp_set_num_threads(2), VSP_OK);
    VSP_ASSERT_GE(vsp_get_num_threads(), static_cast<vsp_size_t>(1));
    VSP_ASSERT_EQ(vsp_set_num_threads(0), VSP_OK);
    VSP_ASSERT_GE(vsp_get_num_threads(), static_cast<vsp_size_t>(1));
}

VSP_TEST_UNIT(log_level_validated) {
    VSP_ASSERT_EQ(vsp_set_log_level(0), VSP_OK);
    VSP_ASSERT_EQ(vsp_set_log_level(2), VSP_OK);
    VSP_ASSERT_EQ(vsp_set_log_level(1), VSP_OK);
    VSP_ASSERT_EQ(vsp_set_log_level(3), VSP_ERROR_INVALID_ARGUMENT);
    VSP_ASSERT_EQ(vsp_set_log_level(-1), VSP_ERROR_INVALID_ARGUMENT);
}

VSP_TEST_END

VSP_TEST_MAIN()
