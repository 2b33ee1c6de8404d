/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include "nflow/nn/modules/FlowSequential.h"

#include <sstream>

#include <glog/logging.h>

namespace nflow {

FlowSequential::FlowSequential() = default;

FlowSequential::FlowSequential(const FlowSequential& other) {
  train_ = other.train_;
  for (auto& mod : other.modules_) {
    add(std::shared_ptr<FlowModule>(
        static_cast<FlowModule*>(mod->clone().release())));
  }
}

FlowSequential& FlowSequential::operator=(const FlowSequential& other) {
  if (this == &other) {
    return *this;
  }
  train_ = other.train_;
  clear();
  for (auto& mod : other.modules_) {
    add(std::shared_ptr<FlowModule>(
        static_cast<FlowModule*>(mod->clone().release())));
  }
  return *this;
}

FlowModulePtr FlowSequential::module(int id) const {
  if (id < 0 || id >= static_cast<int>(modules_.size())) {
    throw std::out_of_range("FlowSequential module index out of range");
  }
  return modules_[id];
}

std::vector<FlowModulePtr> FlowSequential::modules() const {
  return modules_;
}

void FlowSequential::clear() {
  childParamIdx_.clear();
  modules_.clear();
  params_.clear();
}

FlowOutput FlowSequential::apply(
    const fl::Variable& input,
    const fl::Variable& logdet,
    bool reverse) {
  VLOG(1) << "FlowSequential: " << (reverse ? "reverse" : "forward")
          << " pass through " << modules_.size() << " modules";
  FlowOutput state{input, logdet};
  if (!reverse) {
    for (auto& module : modules_) {
      state = module->apply(state.output, state.logdet, false);
    }
  } else {
    for (auto it = modules_.rbegin(); it != modules_.rend(); ++it) {
      state = (*it)->apply(state.output, state.logdet, true);
    }
  }
  return state;
}

void FlowSequential::train() {
  train_ = true;
  for (auto& module : modules_) {
    module->train();
  }
}

void FlowSequential::eval() {
  train_ = false;
  for (auto& module : modules_) {
    module->eval();
  }
}

void FlowSequential::setParams(const fl::Variable& var, int position) {
  fl::Module::setParams(var, position);
  auto indices = childParamIdx_.find(position);
  if (indices != childParamIdx_.end()) {
    int midx, pidx;
    std::tie(midx, pidx) = indices->second;
    modules_[midx]->setParams(var, pidx);
  }
}

std::unique_ptr<fl::Module> FlowSequential::clone() const {
  return std::make_unique<FlowSequential>(*this);
}

std::string FlowSequential::prettyString() const {
  std::ostringstream ss;
  ss << "FlowSequential";
  ss << " [input";
  for (size_t i = 0; i < modules_.size(); ++i) {
    ss << " -> (" << i << ")";
  }
  ss << " -> output]";
  for (size_t i = 0; i < modules_.size(); ++i) {
    ss << "\n\t(" << i << "): " << modules_[i]->prettyString();
  }
  return ss.str();
}

} // namespace nflow
