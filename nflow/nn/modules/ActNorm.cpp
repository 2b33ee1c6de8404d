/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/nn/modules/ActNorm.h"

#include <sstream>

#include <glog/logging.h>

#include "flashlight/fl/autograd/Functions.h"
#include "flashlight/fl/nn/Init.h"
#include "nflow/autograd/Functions.h"
#include "nflow/common/Exception.h"

namespace nflow {

ActNorm::ActNorm(int channels, double epsilon /* = kActNormEpsilon */)
    : channels_(channels), epsilon_(epsilon) {
  NFLOW_CHECK_ARG(channels > 0, "ActNorm: channels must be positive");
  NFLOW_CHECK_ARG(epsilon > 0, "ActNorm: epsilon must be positive");
  initialize();
}

ActNorm::ActNorm(const ActNorm& other)
    : channels_(other.channels_), epsilon_(other.epsilon_) {
  std::lock_guard<std::mutex> lock(other.initMutex_);
  params_ = other.copyParams();
  state_ = other.state_;
  train_ = other.train_;
}

ActNorm& ActNorm::operator=(const ActNorm& other) {
  if (this == &other) {
    return *this;
  }
  std::scoped_lock lock(initMutex_, other.initMutex_);
  params_ = other.copyParams();
  train_ = other.train_;
  channels_ = other.channels_;
  epsilon_ = other.epsilon_;
  state_ = other.state_;
  return *this;
}

void ActNorm::initialize() {
  fl::Shape paramDims({1, 1, channels_, 1});
  params_ = {
      fl::constant(0.0, paramDims, fl::dtype::f32, true),
      fl::constant(0.0, paramDims, fl::dtype::f32, true)};
}

void ActNorm::seedFromBatch(const fl::Tensor& input) {
  const auto& idims = input.shape();
  // [W, H, C, N] -> [C, W * H * N]
  auto reordered = fl::transpose(input, {2, 0, 1, 3});
  if (!reordered.isContiguous()) {
    reordered = reordered.asContiguousTensor();
  }
  auto columns =
      fl::reshape(reordered, {idims[2], idims[0] * idims[1] * idims[3]});
  auto mu = fl::mean(columns, {1}, /* keepDims = */ true);
  auto centered = columns - fl::tile(mu, {1, columns.dim(1)});
  auto sigma = fl::sqrt(fl::mean(centered * centered, {1}, true));

  fl::Shape paramDims({1, 1, channels_, 1});
  params_[0].tensor() = fl::reshape(-mu, paramDims).astype(params_[0].type());
  params_[1].tensor() =
      fl::reshape(-fl::log(fl::maximum(sigma, epsilon_)), paramDims)
          .astype(params_[1].type());

  LOG(INFO) << "ActNorm: seeded " << channels_ << " channels from a batch of "
            << idims[3] << " (" << idims[0] << "x" << idims[1] << ")";
  auto degenerate = sigma < epsilon_;
  if (fl::any(degenerate).asScalar<bool>()) {
    VLOG(1) << "ActNorm: " << fl::countNonzero(degenerate).asScalar<int>()
            << " channel(s) had a standard deviation below " << epsilon_;
  }
}

FlowOutput ActNorm::apply(
    const fl::Variable& input,
    const fl::Variable& logdet,
    bool reverse) {
  checkInput(input, channels_, "ActNorm");

  std::unique_lock<std::mutex> lock(initMutex_);
  if (state_ == InitState::UNINITIALIZED && !reverse) {
    seedFromBatch(input.tensor());
    state_ = InitState::INITIALIZED;
  }
  if (state_ == InitState::INITIALIZED) {
    // Parameters are no longer written from here on.
    lock.unlock();
  } else {
    LOG(WARNING) << "ActNorm: reverse pass before any forward pass; "
                 << "applying unseeded (identity) parameters";
  }

  auto output = affineChannel(input, params_[0], params_[1], reverse);
  return {output, accumulateLogDet(logdet, logDeterminant(input), reverse)};
}

fl::Variable ActNorm::logDeterminant(const fl::Variable& input) const {
  return static_cast<double>(spatialSize(input)) *
      fl::moddims(fl::sum(params_[1], {2}), {1});
}

bool ActNorm::isInitialized() const {
  std::lock_guard<std::mutex> lock(initMutex_);
  return state_ == InitState::INITIALIZED;
}

void ActNorm::setInitialized() {
  std::lock_guard<std::mutex> lock(initMutex_);
  state_ = InitState::INITIALIZED;
}

fl::Variable ActNorm::shift() const {
  return params_[0];
}

fl::Variable ActNorm::logScale() const {
  return params_[1];
}

int ActNorm::channels() const {
  return channels_;
}

std::unique_ptr<fl::Module> ActNorm::clone() const {
  return std::make_unique<ActNorm>(*this);
}

std::string ActNorm::prettyString() const {
  std::ostringstream ss;
  ss << "ActNorm (" << channels_ << " channels, "
     << (isInitialized() ? "initialized" : "uninitialized") << ")";
  return ss.str();
}

} // namespace nflow
