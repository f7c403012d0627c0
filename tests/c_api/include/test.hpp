#pragma once

// =============================================================================
// VSP Core - C API Test Framework (Master Include)
// =============================================================================
//
// Single include for all test utilities.
//
// Components:
//   - core.hpp      : Test registration, runner, assertions, reporters
//   - precision.hpp : Tolerance presets and approximate comparison
//   - data.hpp      : Random and structured grid generators
//   - oracle.hpp    : Eigen reference implementations
//
// Usage:
//   #include "test.hpp"
//
//   VSP_TEST_BEGIN
//
//   VSP_TEST_UNIT(describe_sequence) {
//       auto grid = vsp::test::fixture::sequence_4x4();
//       vsp_summary_t s;
//       VSP_ASSERT_EQ(vsp_stats_describe(grid.data(), 4, 4, &s), VSP_OK);
//       VSP_ASSERT_NEAR(8.5, s.mean, 1e-12);
//   }
//
//   VSP_TEST_END
//   VSP_TEST_MAIN()
//
// =============================================================================

// Core testing framework
#include "core.hpp"

// Numerical comparison
#include "precision.hpp"

// Test data generators
#include "data.hpp"

// Eigen reference implementation
#include "oracle.hpp"

// Library C API
#include "vsp/binding/c_api/core/core.h"
#include "vsp/binding/c_api/stats.h"
#include "vsp/binding/c_api/smooth.h"
#include "vsp/binding/c_api/hotspot.h"
#include "vsp/binding/c_api/regions.h"
#include "vsp/binding/c_api/cluster.h"
#include "vsp/binding/c_api/spatial.h"
#include "vsp/binding/c_api/quadrant.h"
#include "vsp/binding/c_api/temporal.h"
