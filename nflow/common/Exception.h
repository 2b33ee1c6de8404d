/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include <sstream>
#include <stdexcept>
#include <string>

/**
 * Throws `std::invalid_argument` carrying the call site when `__chk` fails.
 *
 * \code
 *   NFLOW_CHECK_ARG(channels > 0, "channels must be positive");
 * \endcode
 */
#define NFLOW_CHECK_ARG(__chk, __msg)                                    \
  do {                                                                   \
    if (!(__chk)) {                                                      \
      std::ostringstream __ss;                                           \
      __ss << __FILE__ << ":" << __LINE__ << " " << __msg;               \
      throw std::invalid_argument(__ss.str());                           \
    }                                                                    \
  } while (0)

namespace nflow {

/**
 * Raised when a matrix that must be inverted is singular or too badly
 * conditioned for its inverse to be trusted.
 *
 * The condition is fatal for the call that hit it. Nothing in `nflow`
 * attempts to repair the matrix; callers that train long-running models are
 * expected to restore parameters from their last saved state.
 */
class SingularMatrixError : public std::runtime_error {
 public:
  explicit SingularMatrixError(const std::string& what)
      : std::runtime_error(what) {}
};

} // namespace nflow
