/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "nflow/common/Defines.h"
#include "nflow/nn/modules/FlowModule.h"

namespace nflow {

/**
 * Invertible 1x1 convolution as described in the paper
 * [Glow: Generative Flow with Invertible 1x1
 * Convolutions](https://arxiv.org/abs/1807.03039).
 *
 * A learned `[C, C]` matrix \f$W\f$ mixes the channels of a `[W, H, C, N]`
 * input identically at every spatial position:
 * \f[ y_{w,h,:,n} = W \, x_{w,h,:,n} \f]
 * The same map is applied at all \f$H \times W\f$ positions, so the
 * log-determinant of the whole transform is
 * \f[ \Delta = H \cdot W \cdot \log|\det W| \f]
 *
 * The reverse direction applies \f$W^{-1}\f$ and subtracts \f$\Delta\f$,
 * taking both from a single LU factorization of \f$W\f$. It throws
 * `SingularMatrixError` if \f$W\f$ has drifted to a singular or
 * ill-conditioned matrix; the weight is never repaired here.
 *
 * The single parameter is the weight at position 0.
 */
class InvConv2D : public FlowModule {
 private:
  InvConv2D() = default; // intentionally private

  int channels_;
  double maxConditionNumber_;

  FL_SAVE_LOAD_WITH_BASE(FlowModule, channels_, maxConditionNumber_)

  void initialize();

 public:
  /**
   * Constructs an InvConv2D with a random orthogonal weight, so that
   * \f$|\det W| = 1\f$ and the initial log-determinant is zero.
   *
   * @param channels number of input and output channels, > 0
   * @param maxConditionNumber largest 1-norm condition number the weight
   *  may reach before the reverse direction refuses to invert it
   */
  explicit InvConv2D(
      int channels,
      double maxConditionNumber = kMaxConditionNumber);

  /**
   * Constructs an InvConv2D with a given `[C, C]` weight.
   */
  explicit InvConv2D(
      const fl::Variable& weight,
      double maxConditionNumber = kMaxConditionNumber);

  InvConv2D(const InvConv2D& other);

  InvConv2D& operator=(const InvConv2D& other);

  InvConv2D(InvConv2D&& other) = default;

  InvConv2D& operator=(InvConv2D&& other) = default;

  FlowOutput apply(
      const fl::Variable& input,
      const fl::Variable& logdet,
      bool reverse) override;

  /**
   * \f$H \cdot W \cdot \log|\det W|\f$ for an input of the given spatial
   * size, as a one-element Variable.
   */
  fl::Variable logDeterminant(const fl::Variable& input) const;

  int channels() const;

  std::unique_ptr<fl::Module> clone() const override;

  std::string prettyString() const override;
};

} // namespace nflow

CEREAL_REGISTER_TYPE(nflow::InvConv2D)
