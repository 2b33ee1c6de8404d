/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <memory>
#include <stdexcept>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <cereal/types/tuple.hpp>
#include <cereal/types/unordered_map.hpp>

#include "nflow/nn/modules/FlowModule.h"

namespace nflow {

typedef std::shared_ptr<FlowModule> FlowModulePtr;

/**
 * A chain of `FlowModule`s forming one invertible transform.
 *
 * The forward direction runs the children in insertion order, threading
 * the log-determinant accumulator through each of them. The reverse
 * direction runs them in the opposite order, each in reverse, so that
 * `reverse(forward(x))` recovers `x` and returns the accumulator to its
 * starting value.
 *
 * Parameters of the children are exposed in order through `params()`, and
 * `setParams()` forwards replacements to the owning child.
 *
 * \code
 *   FlowSequential step;
 *   step.add(ActNorm(8));
 *   step.add(InvConv2D(8));
 *   auto z = step.forward(x);             // {output, logdet}
 *   auto xr = step.reverse(z);            // xr.output ~= x
 * \endcode
 */
class FlowSequential : public FlowModule {
 private:
  // param index -> {module index, module param index}
  std::unordered_map<int, std::tuple<int, int>> childParamIdx_;

  FL_SAVE_LOAD_WITH_BASE(FlowModule, modules_, childParamIdx_)

 protected:
  std::vector<FlowModulePtr> modules_;

 public:
  FlowSequential();

  FlowSequential(const FlowSequential& other);

  FlowSequential& operator=(const FlowSequential& other);

  FlowSequential(FlowSequential&& other) = default;

  FlowSequential& operator=(FlowSequential&& other) = default;

  template <typename T>
  void add(T&& module) {
    static_assert(
        !std::is_lvalue_reference_v<T>,
        "add() can only accept rvalues. Use std::move().");
    add(std::make_shared<std::decay_t<T>>(std::forward<T>(module)));
  }

  template <typename T>
  void add(std::shared_ptr<T> module) {
    static_assert(
        std::is_base_of_v<FlowModule, T>,
        "FlowSequential only holds FlowModules");
    if (!module) {
      throw std::invalid_argument("can't add null Module to FlowSequential");
    }
    for (int i = 0; i < module->numParamTensors(); i++) {
      childParamIdx_[params_.size()] =
          std::make_tuple(static_cast<int>(modules_.size()), i);
      params_.push_back(module->param(i));
    }
    modules_.emplace_back(std::move(module));
  }

  FlowModulePtr module(int id) const;

  std::vector<FlowModulePtr> modules() const;

  void clear();

  FlowOutput apply(
      const fl::Variable& input,
      const fl::Variable& logdet,
      bool reverse) override;

  void train() override;

  void eval() override;

  void setParams(const fl::Variable& var, int position) override;

  std::unique_ptr<fl::Module> clone() const override;

  std::string prettyString() const override;
};

} // namespace nflow

CEREAL_REGISTER_TYPE(nflow::FlowSequential)
