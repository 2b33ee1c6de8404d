/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/nn/Utils.h"

#include <cmath>
#include <sstream>
#include <string>

#include "flashlight/fl/tensor/TensorBase.h"
#include "nflow/common/Exception.h"
#include "nflow/common/Utils.h"

namespace nflow {

detail::LUFactorization checkedFactorize(
    const fl::Variable& matrix,
    double maxConditionNumber /* = kMaxConditionNumber */) {
  NFLOW_CHECK_ARG(
      isSquareMatrix(matrix.shape()),
      "checkedFactorize: expected a square matrix, got " << matrix.shape());

  auto lu = detail::luFactorize(matrix.tensor());
  if (lu.hasZeroPivot) {
    throw SingularMatrixError(
        "matrix of size " + std::to_string(lu.size) +
        " is singular: LU factorization has a zero pivot");
  }
  if (fl::isInvalidArray(lu.inverse)) {
    throw SingularMatrixError("matrix inverse contains NaN or Inf values");
  }

  double cond = detail::conditionNumber(lu);
  if (!std::isfinite(cond) || cond > maxConditionNumber) {
    std::ostringstream ss;
    ss << "matrix is ill-conditioned: 1-norm condition number " << cond
       << " exceeds " << maxConditionNumber;
    throw SingularMatrixError(ss.str());
  }
  return lu;
}

fl::Variable checkedInverse(
    const fl::Variable& matrix,
    double maxConditionNumber /* = kMaxConditionNumber */) {
  return inverse(matrix, checkedFactorize(matrix, maxConditionNumber));
}

} // namespace nflow
