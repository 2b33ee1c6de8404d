/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <Eigen/Dense>

#include "flashlight/fl/tensor/TensorBase.h"

namespace nflow {

/**
 * Copies a 2D tensor to the host as a double-precision Eigen matrix.
 * Throws `std::invalid_argument` if `matrix` has more than two dimensions.
 */
Eigen::MatrixXd toEigenMatrix(const fl::Tensor& matrix);

/**
 * Creates a `[rows, cols]` tensor of the given type from an Eigen matrix.
 */
fl::Tensor fromEigenMatrix(
    const Eigen::MatrixXd& matrix,
    fl::dtype type = fl::dtype::f32);

/**
 * Returns true if `shape` describes a square matrix.
 */
bool isSquareMatrix(const fl::Shape& shape);

} // namespace nflow
