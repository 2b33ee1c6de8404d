/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "nflow/autograd/autograd.h"
#include "nflow/common/common.h"
#include "nflow/nn/nn.h"
