/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <vector>

#include "flashlight/fl/nn/modules/Module.h"

namespace nflow {

/**
 * Result of one bidirectional flow pass: the transformed feature grid and
 * the updated log-determinant accumulator.
 */
struct FlowOutput {
  fl::Variable output;
  fl::Variable logdet;
};

/**
 * An invertible `fl::Module` that also reports the log-determinant of its
 * Jacobian.
 *
 * Every pass takes a `[W, H, C, N]` feature grid together with a running
 * log-determinant owned by the caller, and returns the transformed grid with
 * the accumulator advanced by this module's contribution: added in the
 * forward (density evaluation) direction, subtracted in the reverse
 * (sampling) direction. The accumulator may be a one-element Variable, one
 * value per batch element, or empty, which starts it at zero. Modules never
 * keep the accumulator beyond a call.
 *
 * \code
 *   auto actnorm = ActNorm(16);
 *   auto conv = InvConv2D(16);
 *   auto fwd = conv.forward(actnorm.forward(x).output, ...);
 *   auto z = conv.forward(actnorm.forward(x));   // chained, see FlowSequential
 *   auto xr = actnorm.reverse(conv.reverse(z.output, z.logdet));
 * \endcode
 */
class FlowModule : public fl::Module {
 public:
  /**
   * Runs the transform in the requested direction.
   *
   * @param input a `[W, H, C, N]` feature grid
   * @param logdet the running log-determinant; may be empty
   * @param reverse `false` for density evaluation, `true` for sampling
   */
  virtual FlowOutput apply(
      const fl::Variable& input,
      const fl::Variable& logdet,
      bool reverse) = 0;

  /**
   * Same as `apply(input, logdet, false)`.
   */
  FlowOutput forward(
      const fl::Variable& input,
      const fl::Variable& logdet = {});

  FlowOutput forward(const FlowOutput& state);

  /**
   * Same as `apply(input, logdet, true)`.
   */
  FlowOutput reverse(
      const fl::Variable& input,
      const fl::Variable& logdet = {});

  FlowOutput reverse(const FlowOutput& state);

  /**
   * Forward direction through the generic `Module` interface.
   *
   * @param inputs `{input}` or `{input, logdet}`
   * @return `{output, logdet}`
   */
  std::vector<fl::Variable> forward(
      const std::vector<fl::Variable>& inputs) override;

  virtual ~FlowModule() = default;

 protected:
  FlowModule();

  explicit FlowModule(const std::vector<fl::Variable>& params);

  /**
   * Returns `logdet + dlogdet` (or `logdet - dlogdet` when `reverse`), with
   * the one-element `dlogdet` broadcast to the accumulator's shape. An empty
   * accumulator is treated as zero.
   */
  static fl::Variable accumulateLogDet(
      const fl::Variable& logdet,
      const fl::Variable& dlogdet,
      bool reverse);

  /**
   * Throws `std::invalid_argument` unless `input` is a 4D feature grid with
   * `channels` channels.
   */
  static void
  checkInput(const fl::Variable& input, fl::Dim channels, const char* owner);

 private:
  FL_SAVE_LOAD_WITH_BASE(fl::Module)
};

} // namespace nflow

CEREAL_REGISTER_TYPE(nflow::FlowModule)
