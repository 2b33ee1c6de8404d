/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <cfloat>

namespace nflow {

/**
 * \defgroup common_defines Common constants and definitions
 * @{
 */

/**
 * Lower bound applied to per-channel standard deviations before taking their
 * log when seeding `ActNorm` from data.
 */
constexpr double kActNormEpsilon = 1e-6;

/**
 * Largest 1-norm condition number a mixing weight may have before its
 * inverse is considered numerically unreliable.
 */
constexpr double kMaxConditionNumber = 1.0 / FLT_EPSILON;

/**
 * One-way lifecycle of data-seeded parameters.
 */
enum class InitState {
  /// Parameters hold their construction-time placeholders
  UNINITIALIZED = 0,
  /// Parameters have been seeded from data; never reset
  INITIALIZED = 1,
};

/** @} */

} // namespace nflow
