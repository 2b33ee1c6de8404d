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
 * Invertible 1x1 convolution with an LU-decomposed weight, the
 * reparameterization proposed alongside Glow's invertible convolution.
 *
 * The mixing matrix is assembled as
 * \f[ W = P \, L \, (U + \mathrm{diag}(\sigma \odot e^{s})) \f]
 * where \f$P\f$ is a fixed permutation, \f$L\f$ is unit lower-triangular,
 * \f$U\f$ is strictly upper-triangular and \f$\sigma\f$ is a fixed vector of
 * signs. \f$L\f$, \f$U\f$ and \f$s\f$ are learned, and the log-determinant
 * reduces to \f$H \cdot W \cdot \sum_c s_c\f$ with no factorization per call.
 *
 * Parameters, in order: the strict lower part of \f$L\f$ `[C, C]`, the strict
 * upper part of \f$U\f$ `[C, C]`, and \f$s\f$ `[C, 1]`. Entries outside the
 * respective triangles are masked out and receive no gradient.
 */
class InvConv2DLU : public FlowModule {
 private:
  InvConv2DLU() = default; // intentionally private

  int channels_;
  double maxConditionNumber_;
  fl::Tensor permutation_; // [C, C], fixed
  fl::Tensor signs_; // [C, 1] of +/-1, fixed

  FL_SAVE_LOAD_WITH_BASE(
      FlowModule,
      channels_,
      maxConditionNumber_,
      permutation_,
      signs_)

  void initialize();

 public:
  /**
   * Constructs an InvConv2DLU from the LU factorization of a random
   * orthogonal matrix, so that the initial weight is orthogonal.
   *
   * @param channels number of input and output channels, > 0
   * @param maxConditionNumber see `InvConv2D`
   */
  explicit InvConv2DLU(
      int channels,
      double maxConditionNumber = kMaxConditionNumber);

  InvConv2DLU(const InvConv2DLU& other);

  InvConv2DLU& operator=(const InvConv2DLU& other);

  InvConv2DLU(InvConv2DLU&& other) = default;

  InvConv2DLU& operator=(InvConv2DLU&& other) = default;

  FlowOutput apply(
      const fl::Variable& input,
      const fl::Variable& logdet,
      bool reverse) override;

  /**
   * Assembles the current `[C, C]` mixing matrix from the parameters.
   */
  fl::Variable weight() const;

  /**
   * \f$H \cdot W \cdot \sum_c s_c\f$ for an input of the given spatial size.
   */
  fl::Variable logDeterminant(const fl::Variable& input) const;

  int channels() const;

  std::unique_ptr<fl::Module> clone() const override;

  std::string prettyString() const override;
};

} // namespace nflow

CEREAL_REGISTER_TYPE(nflow::InvConv2DLU)
