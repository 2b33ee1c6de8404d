/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#pragma once

#include "nflow/common/Defines.h"
#include "nflow/common/Exception.h"
#include "nflow/common/Utils.h"
