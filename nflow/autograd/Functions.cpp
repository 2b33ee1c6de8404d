/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/autograd/Functions.h"

#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <Eigen/LU>

#include "flashlight/fl/autograd/Functions.h"
#include "nflow/common/Utils.h"

namespace nflow {

namespace detail {

LUFactorization luFactorize(const fl::Tensor& matrix) {
  if (!isSquareMatrix(matrix.shape())) {
    throw std::invalid_argument(
        "luFactorize: expected a square matrix, got " +
        matrix.shape().toString());
  }
  auto a = toEigenMatrix(matrix);
  Eigen::PartialPivLU<Eigen::MatrixXd> lu(a);

  LUFactorization result;
  result.size = matrix.dim(0);
  result.norm1 = a.cwiseAbs().colwise().sum().maxCoeff();

  auto pivots = lu.matrixLU().diagonal().cwiseAbs();
  if ((pivots.array() == 0.0).any()) {
    result.hasZeroPivot = true;
    result.logAbsDet = -std::numeric_limits<double>::infinity();
    return result;
  }
  result.logAbsDet = pivots.array().log().sum();
  result.inverse = fromEigenMatrix(lu.inverse(), matrix.type());
  return result;
}

double conditionNumber(const LUFactorization& lu) {
  if (lu.hasZeroPivot) {
    return std::numeric_limits<double>::infinity();
  }
  auto inv = toEigenMatrix(lu.inverse);
  return lu.norm1 * inv.cwiseAbs().colwise().sum().maxCoeff();
}

} // namespace detail

fl::Variable inverse(const fl::Variable& input) {
  return inverse(input, detail::luFactorize(input.tensor()));
}

fl::Variable inverse(
    const fl::Variable& input,
    const detail::LUFactorization& lu) {
  if (lu.hasZeroPivot) {
    throw std::invalid_argument("inverse: matrix has a zero pivot");
  }
  auto result = lu.inverse;
  auto gradFunc =
      [result](std::vector<fl::Variable>& inputs, const fl::Variable& grad) {
        // d(A^-1) = -A^-1 dA A^-1
        auto g = -fl::matmul(
            fl::matmul(
                result,
                grad.tensor(),
                fl::MatrixProperty::Transpose,
                fl::MatrixProperty::None),
            result,
            fl::MatrixProperty::None,
            fl::MatrixProperty::Transpose);
        inputs[0].addGrad(fl::Variable(g, false));
      };
  return fl::Variable(result, {input.withoutData()}, gradFunc);
}

fl::Variable logAbsDet(const fl::Variable& input) {
  return logAbsDet(input, detail::luFactorize(input.tensor()));
}

fl::Variable logAbsDet(
    const fl::Variable& input,
    const detail::LUFactorization& lu) {
  auto result = fl::full({1}, lu.logAbsDet, input.type());
  auto invT = lu.hasZeroPivot ? fl::Tensor() : fl::transpose(lu.inverse);
  auto gradFunc =
      [invT](std::vector<fl::Variable>& inputs, const fl::Variable& grad) {
        if (invT.isEmpty()) {
          throw std::invalid_argument(
              "logAbsDet: gradient is undefined for a singular matrix");
        }
        inputs[0].addGrad(fl::Variable(
            invT * fl::detail::tileAs(grad.tensor(), invT.shape()), false));
      };
  return fl::Variable(result, {input.withoutData()}, gradFunc);
}

fl::Variable channelMix(const fl::Variable& input, const fl::Variable& weight) {
  const auto& idims = input.shape();
  if (!isSquareMatrix(weight.shape())) {
    throw std::invalid_argument(
        "channelMix: weight must be a square matrix, got " +
        weight.shape().toString());
  }
  if (idims.ndim() != 4 || weight.dim(1) != idims[2]) {
    std::stringstream ss;
    ss << "channelMix: weight mixes " << weight.dim(1)
       << " channels but input " << idims << " is not a [W, H, "
       << weight.dim(1) << ", N] grid";
    throw std::invalid_argument(ss.str());
  }
  auto mixing = weight.type() == input.type() ? weight
                                              : weight.astype(input.type());
  // [W, H, C, N] -> [C, W * H * N], one column per position
  auto columns = fl::moddims(
      fl::reorder(input, {2, 0, 1, 3}),
      {idims[2], idims[0] * idims[1] * idims[3]});
  auto mixed = fl::matmul(mixing, columns);
  return fl::reorder(
      fl::moddims(mixed, {idims[2], idims[0], idims[1], idims[3]}),
      {1, 2, 0, 3});
}

fl::Variable affineChannel(
    const fl::Variable& input,
    const fl::Variable& shift,
    const fl::Variable& logScale,
    bool reverse /* = false */) {
  if (input.ndim() != 4) {
    throw std::invalid_argument(
        "affineChannel: expected a [W, H, C, N] input, got " +
        input.shape().toString());
  }
  auto channels = input.dim(2);
  if (shift.elements() != channels || logScale.elements() != channels) {
    std::stringstream ss;
    ss << "affineChannel: parameters hold " << shift.elements() << " and "
       << logScale.elements() << " values but input " << input.shape()
       << " has " << channels << " channels";
    throw std::invalid_argument(ss.str());
  }
  fl::Shape paramDims({1, 1, channels, 1});
  auto offset = fl::tileAs(fl::moddims(shift, paramDims), input);
  auto scale = fl::tileAs(fl::exp(fl::moddims(logScale, paramDims)), input);
  if (offset.type() != input.type()) {
    offset = offset.astype(input.type());
    scale = scale.astype(input.type());
  }
  if (!reverse) {
    return scale * (input + offset);
  }
  return input / scale - offset;
}

fl::Dim spatialSize(const fl::Variable& input) {
  return input.dim(0) * input.dim(1);
}

} // namespace nflow
