/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "flashlight/fl/autograd/Variable.h"
#include "nflow/autograd/Functions.h"
#include "nflow/common/Defines.h"

namespace nflow {

/**
 * Factorizes a square matrix that is about to be inverted and refuses to
 * return a factorization whose inverse cannot be trusted.
 *
 * Throws `SingularMatrixError` if the LU factorization of `matrix` has a zero
 * pivot, if the inverse contains NaN or Inf, or if the 1-norm condition
 * number exceeds `maxConditionNumber`.
 */
detail::LUFactorization checkedFactorize(
    const fl::Variable& matrix,
    double maxConditionNumber = kMaxConditionNumber);

/**
 * Differentiable inverse of a square matrix, with the checks of
 * `checkedFactorize`.
 */
fl::Variable checkedInverse(
    const fl::Variable& matrix,
    double maxConditionNumber = kMaxConditionNumber);

} // namespace nflow
