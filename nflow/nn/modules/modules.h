/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "nflow/nn/modules/ActNorm.h"
#include "nflow/nn/modules/FlowModule.h"
#include "nflow/nn/modules/FlowSequential.h"
#include "nflow/nn/modules/InvConv2D.h"
#include "nflow/nn/modules/InvConv2DLU.h"
