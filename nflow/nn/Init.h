/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

/**
 * @file nn/Init.h
 *
 * Initializers for invertible weights, complementing `flashlight/fl/nn/Init.h`.
 */

#pragma once

#include "flashlight/fl/autograd/Variable.h"
#include "flashlight/fl/tensor/TensorBase.h"

namespace nflow {

namespace detail {

/**
 * Creates a `[size, size]` orthogonal matrix: the Q factor of the QR
 * decomposition of a matrix with standard normal entries drawn from
 * `fl::randn`. Columns are sign-corrected by diag(R) so the result is
 * uniformly distributed over the orthogonal group.
 */
fl::Tensor orthogonal(int size, fl::dtype type = fl::dtype::f32);

} // namespace detail

/**
 * Creates a random `[size, size]` orthogonal matrix `Variable`. Its
 * determinant is +/-1, so a channel mixing initialized with it starts with a
 * log-determinant of zero.
 */
fl::Variable orthogonal(
    int size,
    fl::dtype type = fl::dtype::f32,
    bool calcGrad = true);

} // namespace nflow
