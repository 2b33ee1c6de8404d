/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/common/Utils.h"

#include <stdexcept>
#include <vector>

namespace nflow {

Eigen::MatrixXd toEigenMatrix(const fl::Tensor& matrix) {
  if (matrix.ndim() > 2) {
    throw std::invalid_argument(
        "toEigenMatrix: expected at most 2 dimensions, got " +
        matrix.shape().toString());
  }
  const fl::Dim rows = matrix.ndim() > 0 ? matrix.dim(0) : 1;
  const fl::Dim cols = matrix.ndim() > 1 ? matrix.dim(1) : 1;
  auto values = matrix.astype(fl::dtype::f64).toHostVector<double>();
  // flashlight tensors and Eigen matrices are both column-major
  return Eigen::Map<Eigen::MatrixXd>(values.data(), rows, cols);
}

fl::Tensor fromEigenMatrix(
    const Eigen::MatrixXd& matrix,
    fl::dtype type /* = fl::dtype::f32 */) {
  std::vector<double> values(matrix.data(), matrix.data() + matrix.size());
  return fl::Tensor::fromVector(
             {static_cast<fl::Dim>(matrix.rows()),
              static_cast<fl::Dim>(matrix.cols())},
             values)
      .astype(type);
}

bool isSquareMatrix(const fl::Shape& shape) {
  return shape.ndim() == 2 && shape.dim(0) == shape.dim(1) &&
      shape.dim(0) > 0;
}

} // namespace nflow
