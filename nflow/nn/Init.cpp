/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/nn/Init.h"

#include <stdexcept>

#include <Eigen/QR>

#include "flashlight/fl/tensor/Random.h"
#include "nflow/common/Utils.h"

namespace nflow {

namespace detail {

fl::Tensor orthogonal(int size, fl::dtype type /* = fl::dtype::f32 */) {
  if (size <= 0) {
    throw std::invalid_argument("orthogonal: size must be positive");
  }
  auto gaussian = toEigenMatrix(fl::randn({size, size}, fl::dtype::f64));
  Eigen::HouseholderQR<Eigen::MatrixXd> qr(gaussian);
  Eigen::MatrixXd q = qr.householderQ();
  // Flip each column of Q by the sign of the matching diagonal entry of R.
  Eigen::VectorXd signs = qr.matrixQR().diagonal().unaryExpr(
      [](double r) { return r < 0 ? -1.0 : 1.0; });
  return fromEigenMatrix(q * signs.asDiagonal(), type);
}

} // namespace detail

fl::Variable orthogonal(
    int size,
    fl::dtype type /* = fl::dtype::f32 */,
    bool calcGrad /* = true */) {
  return fl::Variable(detail::orthogonal(size, type), calcGrad);
}

} // namespace nflow
