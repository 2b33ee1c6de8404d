/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <mutex>

#include "nflow/common/Defines.h"
#include "nflow/nn/modules/FlowModule.h"

namespace nflow {

/**
 * Activation normalization as described in the paper
 * [Glow: Generative Flow with Invertible 1x1
 * Convolutions](https://arxiv.org/abs/1807.03039).
 *
 * A per-channel affine transform of a `[W, H, C, N]` input:
 * \f[ y = e^{s} \odot (x + b) \f]
 * with learnable shift \f$b\f$ and log-scale \f$s\f$, both `[1, 1, C, 1]`.
 * Its log-determinant is \f$H \cdot W \cdot \sum_c s_c\f$.
 *
 * The parameters are seeded once from data: the first forward call sets
 * \f$b = -E[x]\f$ and \f$s = -\log \max(\sigma[x], \epsilon)\f$ per channel,
 * with statistics taken over width, height and batch, so that its output has
 * zero mean and unit variance. Afterwards they are only changed by external
 * optimization. Seeding happens outside the autograd graph, and at most once
 * even when several threads call `apply` concurrently.
 *
 * Parameters, in order: shift, log-scale.
 */
class ActNorm : public FlowModule {
 private:
  ActNorm() = default; // intentionally private

  int channels_;
  double epsilon_;
  InitState state_{InitState::UNINITIALIZED};
  mutable std::mutex initMutex_;

  // save() and load() hold initMutex_
  FL_SAVE_LOAD_DECLARE()

  void initialize();

  /**
   * Writes data-dependent values into the existing parameter storage.
   * Works on raw tensors only, so nothing here is recorded for backward.
   * Must be called with `initMutex_` held.
   */
  void seedFromBatch(const fl::Tensor& input);

 public:
  /**
   * Constructs an uninitialized ActNorm. Until its first forward call the
   * shift and log-scale are zero, i.e. the transform is the identity.
   *
   * @param channels number of channels, > 0
   * @param epsilon floor applied to the per-channel standard deviation so
   *  that constant channels still get a finite log-scale
   */
  explicit ActNorm(int channels, double epsilon = kActNormEpsilon);

  /**
   * Copies the parameters and the seeding state of `other` as one snapshot,
   * taken under its lock.
   */
  ActNorm(const ActNorm& other);

  ActNorm& operator=(const ActNorm& other);

  /**
   * Runs the transform, seeding the parameters first if this is the first
   * forward-direction call.
   *
   * A reverse call on an uninitialized module does not seed it; it applies
   * the current (identity) parameters and logs a warning.
   */
  FlowOutput apply(
      const fl::Variable& input,
      const fl::Variable& logdet,
      bool reverse) override;

  /**
   * \f$H \cdot W \cdot \sum_c s_c\f$ for an input of the given spatial size.
   */
  fl::Variable logDeterminant(const fl::Variable& input) const;

  bool isInitialized() const;

  /**
   * Marks the parameters as seeded, e.g. after they were set through
   * `setParams()` from a trained model, so that the next forward call keeps
   * them.
   */
  void setInitialized();

  fl::Variable shift() const;

  fl::Variable logScale() const;

  int channels() const;

  std::unique_ptr<fl::Module> clone() const override;

  std::string prettyString() const override;
};

template <class Archive>
void ActNorm::save(Archive& ar, const uint32_t /* version */) const {
  std::lock_guard<std::mutex> lock(initMutex_);
  ar(cereal::base_class<FlowModule>(this), channels_, epsilon_, state_);
}

template <class Archive>
void ActNorm::load(Archive& ar, const uint32_t /* version */) {
  std::lock_guard<std::mutex> lock(initMutex_);
  ar(cereal::base_class<FlowModule>(this), channels_, epsilon_, state_);
}

} // namespace nflow

CEREAL_REGISTER_TYPE(nflow::ActNorm)
CEREAL_REGISTER_POLYMORPHIC_RELATION(nflow::FlowModule, nflow::ActNorm)
