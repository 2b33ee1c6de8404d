/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>

#include "flashlight/fl/autograd/autograd.h"
#include "flashlight/fl/common/Filesystem.h"
#include "flashlight/fl/common/Serialization.h"
#include "flashlight/fl/nn/Init.h"
#include "flashlight/fl/nn/Utils.h"
#include "flashlight/fl/tensor/Init.h"
#include "flashlight/fl/tensor/Random.h"
#include "nflow/autograd/autograd.h"
#include "nflow/common/common.h"
#include "nflow/nn/nn.h"

using namespace fl;
using namespace nflow;

namespace {

template <typename T>
std::shared_ptr<T> roundTrip(const std::shared_ptr<FlowModule>& module) {
  std::stringstream ss;
  save(ss, module);
  std::shared_ptr<FlowModule> loaded;
  load(ss, loaded);
  return std::dynamic_pointer_cast<T>(loaded);
}

} // namespace

TEST(NNSerializationTest, InvConv2D) {
  auto conv = std::make_shared<InvConv2D>(4, 1e4);
  auto loaded = roundTrip<InvConv2D>(conv);
  ASSERT_NE(loaded, nullptr);
  ASSERT_EQ(loaded->channels(), 4);
  ASSERT_TRUE(allParamsClose(*loaded, *conv, 1E-7));

  auto x = input(fl::randn({3, 3, 4, 2}));
  ASSERT_TRUE(allClose(loaded->forward(x).output, conv->forward(x).output));
}

TEST(NNSerializationTest, InvConv2DLU) {
  auto conv = std::make_shared<InvConv2DLU>(5);
  auto loaded = roundTrip<InvConv2DLU>(conv);
  ASSERT_NE(loaded, nullptr);
  ASSERT_TRUE(allParamsClose(*loaded, *conv, 1E-7));
  // Fixed permutation and signs travel with the parameters
  ASSERT_TRUE(allClose(loaded->weight(), conv->weight(), 1E-7));
}

TEST(NNSerializationTest, ActNormState) {
  int c = 3;
  auto actnorm = std::make_shared<ActNorm>(c);
  auto fresh = roundTrip<ActNorm>(actnorm);
  ASSERT_NE(fresh, nullptr);
  ASSERT_FALSE(fresh->isInitialized());

  actnorm->forward(input(fl::randn({4, 4, c, 2}) * 3 + 1));
  auto loaded = roundTrip<ActNorm>(actnorm);
  ASSERT_TRUE(loaded->isInitialized());
  ASSERT_EQ(loaded->channels(), c);
  ASSERT_TRUE(allParamsClose(*loaded, *actnorm, 1E-7));

  // A resumed module does not re-seed from new data
  auto x = input(fl::randn({4, 4, c, 2}) * 10 - 4);
  auto out = loaded->forward(x);
  ASSERT_TRUE(allParamsClose(*loaded, *actnorm, 1E-7));
  ASSERT_TRUE(allClose(out.output, actnorm->forward(x).output, 1E-5));
}

TEST(NNSerializationTest, FlowSequential) {
  int c = 2;
  auto step = std::make_shared<FlowSequential>();
  step->add(ActNorm(c));
  step->add(InvConv2DLU(c));
  step->add(InvConv2D(c));
  auto x = input(fl::randn({5, 5, c, 3}));
  auto expected = step->forward(x);

  const fs::path path = fs::temp_directory_path() / "FlowSequential.mdl";
  save(path, std::static_pointer_cast<FlowModule>(step));
  std::shared_ptr<FlowModule> loaded;
  load(path, loaded);
  fs::remove(path);

  auto loadedStep = std::dynamic_pointer_cast<FlowSequential>(loaded);
  ASSERT_NE(loadedStep, nullptr);
  ASSERT_EQ(loadedStep->modules().size(), 3);
  ASSERT_TRUE(allParamsClose(*loadedStep, *step, 1E-7));

  auto out = loadedStep->forward(x);
  ASSERT_TRUE(allClose(out.output, expected.output, 1E-5));
  ASSERT_TRUE(allClose(out.logdet, expected.logdet, 1E-5));

  // Aggregated params still alias the children's
  auto weight = param(fl::identity(c) * 2);
  loadedStep->setParams(weight, loadedStep->numParamTensors() - 1);
  auto last = std::dynamic_pointer_cast<InvConv2D>(loadedStep->module(2));
  ASSERT_TRUE(allClose(last->param(0), weight, 1E-7));
}

TEST(NNSerializationTest, MissingFile) {
  std::shared_ptr<FlowModule> loaded;
  ASSERT_THROW(
      load(fs::temp_directory_path() / "DoesNotExist" / "nested.mdl", loaded),
      std::runtime_error);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  fl::init();
  fl::setSeed(1);
  return RUN_ALL_TESTS();
}
