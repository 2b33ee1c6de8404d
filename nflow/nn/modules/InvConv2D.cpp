/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/nn/modules/InvConv2D.h"

#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

#include "flashlight/fl/autograd/Functions.h"
#include "nflow/autograd/Functions.h"
#include "nflow/common/Exception.h"
#include "nflow/common/Utils.h"
#include "nflow/nn/Init.h"
#include "nflow/nn/Utils.h"

namespace nflow {

InvConv2D::InvConv2D(int channels, double maxConditionNumber)
    : channels_(channels), maxConditionNumber_(maxConditionNumber) {
  NFLOW_CHECK_ARG(channels > 0, "InvConv2D: channels must be positive");
  initialize();
}

InvConv2D::InvConv2D(const fl::Variable& weight, double maxConditionNumber)
    : FlowModule({weight}), maxConditionNumber_(maxConditionNumber) {
  NFLOW_CHECK_ARG(
      isSquareMatrix(weight.shape()),
      "InvConv2D: weight must be a square matrix, got " << weight.shape());
  channels_ = static_cast<int>(weight.dim(0));
}

InvConv2D::InvConv2D(const InvConv2D& other)
    : FlowModule(other.copyParams()),
      channels_(other.channels_),
      maxConditionNumber_(other.maxConditionNumber_) {
  train_ = other.train_;
}

InvConv2D& InvConv2D::operator=(const InvConv2D& other) {
  params_ = other.copyParams();
  train_ = other.train_;
  channels_ = other.channels_;
  maxConditionNumber_ = other.maxConditionNumber_;
  return *this;
}

void InvConv2D::initialize() {
  params_ = {orthogonal(channels_, fl::dtype::f32, true)};
}

FlowOutput InvConv2D::apply(
    const fl::Variable& input,
    const fl::Variable& logdet,
    bool reverse) {
  checkInput(input, channels_, "InvConv2D");
  const auto& weight = params_[0];

  fl::Variable mixing, dlogdet;
  if (reverse) {
    detail::LUFactorization lu;
    try {
      lu = checkedFactorize(weight, maxConditionNumber_);
    } catch (const SingularMatrixError& err) {
      LOG(ERROR) << "InvConv2D: cannot invert the " << channels_ << "x"
                 << channels_ << " mixing weight: " << err.what();
      throw;
    }
    mixing = inverse(weight, lu);
    dlogdet = static_cast<double>(spatialSize(input)) * logAbsDet(weight, lu);
  } else {
    mixing = weight;
    dlogdet = logDeterminant(input);
  }

  VLOG(2) << "InvConv2D " << (reverse ? "reverse" : "forward")
          << " dlogdet=" << dlogdet.tensor().asScalar<double>();
  return {channelMix(input, mixing),
          accumulateLogDet(logdet, dlogdet, reverse)};
}

fl::Variable InvConv2D::logDeterminant(const fl::Variable& input) const {
  return static_cast<double>(spatialSize(input)) * logAbsDet(params_[0]);
}

int InvConv2D::channels() const {
  return channels_;
}

std::unique_ptr<fl::Module> InvConv2D::clone() const {
  return std::make_unique<InvConv2D>(*this);
}

std::string InvConv2D::prettyString() const {
  std::ostringstream ss;
  ss << "InvConv2D (" << channels_ << "->" << channels_ << ")";
  return ss.str();
}

} // namespace nflow
