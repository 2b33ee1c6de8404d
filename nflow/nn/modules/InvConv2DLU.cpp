/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/nn/modules/InvConv2DLU.h"

#include <sstream>

#include <Eigen/LU>
#include <glog/logging.h>

#include "flashlight/fl/autograd/Functions.h"
#include "flashlight/fl/nn/Init.h"
#include "nflow/autograd/Functions.h"
#include "nflow/common/Exception.h"
#include "nflow/common/Utils.h"
#include "nflow/nn/Init.h"
#include "nflow/nn/Utils.h"

namespace nflow {

namespace {

fl::Tensor strictUpperMask(int size) {
  return fl::triu(fl::full({size, size}, 1.0, fl::dtype::f32)) -
      fl::identity(size, fl::dtype::f32);
}

} // namespace

InvConv2DLU::InvConv2DLU(int channels, double maxConditionNumber)
    : channels_(channels), maxConditionNumber_(maxConditionNumber) {
  NFLOW_CHECK_ARG(channels > 0, "InvConv2DLU: channels must be positive");
  initialize();
}

InvConv2DLU::InvConv2DLU(const InvConv2DLU& other)
    : FlowModule(other.copyParams()),
      channels_(other.channels_),
      maxConditionNumber_(other.maxConditionNumber_),
      permutation_(other.permutation_.copy()),
      signs_(other.signs_.copy()) {
  train_ = other.train_;
}

InvConv2DLU& InvConv2DLU::operator=(const InvConv2DLU& other) {
  params_ = other.copyParams();
  train_ = other.train_;
  channels_ = other.channels_;
  maxConditionNumber_ = other.maxConditionNumber_;
  permutation_ = other.permutation_.copy();
  signs_ = other.signs_.copy();
  return *this;
}

void InvConv2DLU::initialize() {
  auto q = toEigenMatrix(detail::orthogonal(channels_, fl::dtype::f64));

  // P q == L U with L unit lower-triangular, so q == P^T L U.
  Eigen::PartialPivLU<Eigen::MatrixXd> lu(q);
  const Eigen::MatrixXd& packed = lu.matrixLU();
  Eigen::MatrixXd lower = packed.triangularView<Eigen::StrictlyLower>();
  Eigen::MatrixXd upper = packed.triangularView<Eigen::StrictlyUpper>();
  Eigen::VectorXd diagonal = packed.diagonal();
  Eigen::VectorXd signs =
      diagonal.unaryExpr([](double d) { return d < 0 ? -1.0 : 1.0; });
  Eigen::MatrixXd permutation = lu.permutationP().transpose() *
      Eigen::MatrixXd::Identity(channels_, channels_);

  permutation_ = fromEigenMatrix(permutation);
  signs_ = fromEigenMatrix(signs);
  params_ = {
      fl::Variable(fromEigenMatrix(lower), true),
      fl::Variable(fromEigenMatrix(upper), true),
      fl::Variable(
          fromEigenMatrix(diagonal.cwiseAbs().array().log().matrix()), true)};
}

fl::Variable InvConv2DLU::weight() const {
  auto eye = fl::identity(channels_, fl::dtype::f32);
  auto upperMask = strictUpperMask(channels_);

  auto l = params_[0] * fl::noGrad(fl::transpose(upperMask)) + fl::noGrad(eye);
  auto scale = fl::noGrad(signs_) * fl::exp(params_[2]);
  auto u = params_[1] * fl::noGrad(upperMask) +
      fl::noGrad(eye) * fl::tile(fl::transpose(scale), {channels_, 1});
  return fl::matmul(fl::noGrad(permutation_), fl::matmul(l, u));
}

FlowOutput InvConv2DLU::apply(
    const fl::Variable& input,
    const fl::Variable& logdet,
    bool reverse) {
  checkInput(input, channels_, "InvConv2DLU");
  auto mixing = weight();
  if (reverse) {
    try {
      mixing = checkedInverse(mixing, maxConditionNumber_);
    } catch (const SingularMatrixError& err) {
      LOG(ERROR) << "InvConv2DLU: cannot invert the assembled " << channels_
                 << "x" << channels_ << " weight: " << err.what();
      throw;
    }
  }
  return {channelMix(input, mixing),
          accumulateLogDet(logdet, logDeterminant(input), reverse)};
}

fl::Variable InvConv2DLU::logDeterminant(const fl::Variable& input) const {
  return static_cast<double>(spatialSize(input)) * fl::sum(params_[2], {0});
}

int InvConv2DLU::channels() const {
  return channels_;
}

std::unique_ptr<fl::Module> InvConv2DLU::clone() const {
  return std::make_unique<InvConv2DLU>(*this);
}

std::string InvConv2DLU::prettyString() const {
  std::ostringstream ss;
  ss << "InvConv2DLU (" << channels_ << "->" << channels_ << ")";
  return ss.str();
}

} // namespace nflow
