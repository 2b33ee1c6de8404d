/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/nn/modules/FlowModule.h"

#include <sstream>
#include <stdexcept>

#include "flashlight/fl/autograd/Functions.h"

namespace nflow {

FlowModule::FlowModule() = default;

FlowModule::FlowModule(const std::vector<fl::Variable>& params)
    : fl::Module(params) {}

FlowOutput FlowModule::forward(
    const fl::Variable& input,
    const fl::Variable& logdet) {
  return apply(input, logdet, false);
}

FlowOutput FlowModule::forward(const FlowOutput& state) {
  return apply(state.output, state.logdet, false);
}

FlowOutput FlowModule::reverse(
    const fl::Variable& input,
    const fl::Variable& logdet) {
  return apply(input, logdet, true);
}

FlowOutput FlowModule::reverse(const FlowOutput& state) {
  return apply(state.output, state.logdet, true);
}

std::vector<fl::Variable> FlowModule::forward(
    const std::vector<fl::Variable>& inputs) {
  if (inputs.empty() || inputs.size() > 2) {
    throw std::invalid_argument(
        "FlowModule expects {input} or {input, logdet}");
  }
  auto result =
      apply(inputs[0], inputs.size() == 2 ? inputs[1] : fl::Variable(), false);
  return {result.output, result.logdet};
}

fl::Variable FlowModule::accumulateLogDet(
    const fl::Variable& logdet,
    const fl::Variable& dlogdet,
    bool reverse) {
  if (logdet.isEmpty()) {
    return reverse ? fl::negate(dlogdet) : dlogdet;
  }
  auto delta = fl::tileAs(dlogdet, logdet);
  if (delta.type() != logdet.type()) {
    delta = delta.astype(logdet.type());
  }
  return reverse ? logdet - delta : logdet + delta;
}

void FlowModule::checkInput(
    const fl::Variable& input,
    fl::Dim channels,
    const char* owner) {
  if (input.isEmpty()) {
    throw std::invalid_argument(std::string(owner) + ": empty input");
  }
  if (input.ndim() != 4 || input.dim(2) != channels) {
    std::ostringstream ss;
    ss << owner << ": expected a [W, H, " << channels
       << ", N] input, got " << input.shape();
    throw std::invalid_argument(ss.str());
  }
}

} // namespace nflow
