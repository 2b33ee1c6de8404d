/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

/**
 * @file autograd/Functions.h
 *
 * Differentiable operations on `fl::Variable`s that flashlight's autograd
 * does not provide: the inverse and log-determinant of a square matrix, and
 * the two channel-wise maps that flow layers are built from.
 *
 * Feature grids use the `[W, H, C, N]` layout (width, height, channel,
 * batch); flow operations act on the channel axis independently at every
 * spatial position.
 */

#pragma once

#include "flashlight/fl/autograd/Variable.h"
#include "flashlight/fl/tensor/TensorBase.h"

namespace nflow {

namespace detail {

/**
 * LU factorization with partial pivoting of a square matrix, together with
 * everything the flow layers derive from it. One factorization serves both
 * the inverse and the log-determinant of a mixing weight.
 */
struct LUFactorization {
  /// Number of rows (and columns) of the factorized matrix
  fl::Dim size{0};
  /// True if some pivot of U is exactly zero
  bool hasZeroPivot{false};
  /// \f$\log|\det A|\f$; -inf when `hasZeroPivot`
  double logAbsDet{0.0};
  /// \f$\|A\|_1\f$
  double norm1{0.0};
  /// \f$A^{-1}\f$ in the type of the input; empty when `hasZeroPivot`
  fl::Tensor inverse;
};

/**
 * Factorizes a `[C, C]` tensor. The matrix is copied to the host and
 * factorized in double precision.
 */
LUFactorization luFactorize(const fl::Tensor& matrix);

/**
 * 1-norm condition number \f$\|A\|_1 \|A^{-1}\|_1\f$ of a factorized matrix.
 * Infinite when the matrix has a zero pivot.
 */
double conditionNumber(const LUFactorization& lu);

} // namespace detail

/**
 * \defgroup flow_functions Flow Functions
 * @{
 */

/**
 * Inverse of a square matrix.
 *
 * The gradient is \f$-A^{-T} \, G \, A^{-T}\f$.
 */
fl::Variable inverse(const fl::Variable& input);

/**
 * Same as `inverse(input)`, reusing an existing factorization of `input`.
 */
fl::Variable inverse(
    const fl::Variable& input,
    const detail::LUFactorization& lu);

/**
 * \f$\log|\det A|\f$ of a square matrix as a one-element Variable.
 *
 * The gradient is \f$A^{-T}\f$ scaled by the incoming gradient.
 */
fl::Variable logAbsDet(const fl::Variable& input);

/**
 * Same as `logAbsDet(input)`, reusing an existing factorization of `input`.
 */
fl::Variable logAbsDet(
    const fl::Variable& input,
    const detail::LUFactorization& lu);

/**
 * Applies a `[C, C]` matrix to the channel vector at every position of a
 * `[W, H, C, N]` grid: \f$y_{w,h,:,n} = W x_{w,h,:,n}\f$.
 *
 * The weight is cast to the type of the input. Throws
 * `std::invalid_argument` if the weight is not square or does not match the
 * channel count of the input.
 */
fl::Variable channelMix(const fl::Variable& input, const fl::Variable& weight);

/**
 * Per-channel affine map of a `[W, H, C, N]` grid with `C`-element shift
 * \f$b\f$ and log-scale \f$s\f$:
 *   forward: \f$y = e^{s} (x + b)\f$
 *   reverse: \f$y = x e^{-s} - b\f$
 */
fl::Variable affineChannel(
    const fl::Variable& input,
    const fl::Variable& shift,
    const fl::Variable& logScale,
    bool reverse = false);

/**
 * Number of spatial positions \f$H \cdot W\f$ of a `[W, H, C, N]` grid.
 */
fl::Dim spatialSize(const fl::Variable& input);

/** @} */

} // namespace nflow
