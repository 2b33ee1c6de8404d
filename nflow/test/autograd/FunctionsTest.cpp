/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

#include <cmath>
#include <functional>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

#include "flashlight/fl/autograd/autograd.h"
#include "flashlight/fl/tensor/Init.h"
#include "flashlight/fl/tensor/Random.h"
#include "flashlight/fl/tensor/TensorBase.h"
#include "nflow/autograd/autograd.h"
#include "nflow/common/common.h"

using namespace fl;
using namespace nflow;

namespace {

// Diagonally dominant, hence well conditioned
Tensor wellConditioned(int size, dtype type = dtype::f64) {
  return fl::identity(size, type) * 2.0 +
      fl::rand({size, size}, type) * 0.5 - 0.25;
}

// Compares the Jacobian of `func` at an f64 `input` obtained by central
// differences with the one obtained from backward().
bool jacobianTest(
    const std::function<Variable(Variable&)>& func,
    Variable& input,
    double precision = 1E-5,
    double perturbation = 1E-4) {
  const auto inShape = input.shape();
  auto values = input.tensor().toHostVector<double>();
  const auto nIn = values.size();

  auto evaluate = [&](const std::vector<double>& v) {
    input.tensor() = Tensor::fromVector(inShape, v);
    return func(input).tensor().astype(dtype::f64).toHostVector<double>();
  };

  const auto nOut = evaluate(values).size();
  std::vector<double> fwd(nOut * nIn);
  for (size_t i = 0; i < nIn; ++i) {
    auto perturbed = values;
    perturbed[i] = values[i] - perturbation;
    auto outa = evaluate(perturbed);
    perturbed[i] = values[i] + perturbation;
    auto outb = evaluate(perturbed);
    for (size_t j = 0; j < nOut; ++j) {
      fwd[j * nIn + i] = (outb[j] - outa[j]) * 0.5 / perturbation;
    }
  }
  input.tensor() = Tensor::fromVector(inShape, values);

  for (size_t j = 0; j < nOut; ++j) {
    input.zeroGrad();
    auto output = func(input);
    std::vector<double> dout(nOut, 0.0);
    dout[j] = 1.0;
    output.backward(Variable(
        Tensor::fromVector(output.shape(), dout).astype(output.type()),
        false));
    auto bwd = input.grad().tensor().astype(dtype::f64).toHostVector<double>();
    for (size_t i = 0; i < nIn; ++i) {
      if (std::abs(bwd[i] - fwd[j * nIn + i]) > precision) {
        return false;
      }
    }
  }
  return true;
}

} // namespace

TEST(FunctionsTest, LuFactorize) {
  // det = 1 * 4 - 2 * 3 = -2
  auto m = Tensor::fromVector<float>({2, 2}, {1, 3, 2, 4});
  auto lu = nflow::detail::luFactorize(m);
  ASSERT_EQ(lu.size, 2);
  ASSERT_FALSE(lu.hasZeroPivot);
  ASSERT_NEAR(lu.logAbsDet, std::log(2.0), 1E-10);
  ASSERT_EQ(lu.inverse.type(), dtype::f32);
  ASSERT_TRUE(allClose(
      fl::matmul(m, lu.inverse), fl::identity(2, dtype::f32), 1E-6));
  // ||A||_1 = 6, ||A^-1||_1 = 2.5
  ASSERT_NEAR(lu.norm1, 6.0, 1E-10);
  ASSERT_NEAR(nflow::detail::conditionNumber(lu), 15.0, 1E-5);

  auto singular = nflow::detail::luFactorize(
      Tensor::fromVector<float>({2, 2}, {1, 2, 2, 4}));
  ASSERT_TRUE(singular.hasZeroPivot);
  ASSERT_TRUE(std::isinf(singular.logAbsDet));
  ASSERT_TRUE(singular.inverse.isEmpty());
  ASSERT_TRUE(std::isinf(nflow::detail::conditionNumber(singular)));

  ASSERT_THROW(
      nflow::detail::luFactorize(fl::rand({3, 2})), std::invalid_argument);
}

TEST(FunctionsTest, LogAbsDetValue) {
  auto m = Variable(Tensor::fromVector<float>({2, 2}, {1, 3, 2, 4}), false);
  auto ld = logAbsDet(m);
  ASSERT_EQ(ld.shape(), Shape({1}));
  ASSERT_NEAR(ld.scalar<float>(), std::log(2.0), 1E-5);
}

TEST(FunctionsTest, LogAbsDetJacobian) {
  auto m = Variable(wellConditioned(4), true);
  auto funcLogAbsDet = [](Variable& in) { return logAbsDet(in); };
  ASSERT_TRUE(jacobianTest(funcLogAbsDet, m, 1E-5));
}

TEST(FunctionsTest, LogAbsDetGradIsInverseTranspose) {
  auto m = Variable(wellConditioned(5), true);
  auto ld = logAbsDet(m);
  ld.backward();
  auto expected =
      fl::transpose(nflow::detail::luFactorize(m.tensor()).inverse);
  ASSERT_TRUE(allClose(m.grad().tensor(), expected, 1E-8));
}

TEST(FunctionsTest, LogAbsDetSingularGrad) {
  auto m = Variable(Tensor::fromVector<double>({2, 2}, {1, 2, 2, 4}), true);
  auto ld = logAbsDet(m);
  ASSERT_TRUE(std::isinf(ld.scalar<double>()));
  ASSERT_THROW(ld.backward(), std::invalid_argument);
}

TEST(FunctionsTest, Inverse) {
  auto m = Variable(wellConditioned(4), true);
  auto inv = inverse(m);
  ASSERT_TRUE(allClose(
      fl::matmul(m.tensor(), inv.tensor()),
      fl::identity(4, dtype::f64),
      1E-10));

  auto funcInverse = [](Variable& in) { return inverse(in); };
  ASSERT_TRUE(jacobianTest(funcInverse, m, 1E-5));
}

TEST(FunctionsTest, InverseOfSingularMatrix) {
  auto m = Variable(Tensor::fromVector<float>({2, 2}, {1, 2, 2, 4}), false);
  ASSERT_THROW(inverse(m), std::invalid_argument);
}

TEST(FunctionsTest, SharedFactorization) {
  auto m = Variable(wellConditioned(4), true);
  auto lu = nflow::detail::luFactorize(m.tensor());

  auto inv = inverse(m, lu);
  auto ld = logAbsDet(m, lu);
  ASSERT_TRUE(allClose(inv, inverse(m), 1E-12));
  ASSERT_TRUE(allClose(ld, logAbsDet(m), 1E-12));

  ld.backward();
  ASSERT_TRUE(allClose(m.grad().tensor(), fl::transpose(inv.tensor()), 1E-8));
}

TEST(FunctionsTest, ChannelMix) {
  // [W=2, H=1, C=2, N=1]; W = [[1, 2], [3, 4]]
  auto weight =
      Variable(Tensor::fromVector<float>({2, 2}, {1, 3, 2, 4}), false);
  auto x =
      Variable(Tensor::fromVector<float>({2, 1, 2, 1}, {1, 2, 1, -1}), false);
  auto y = channelMix(x, weight);
  ASSERT_EQ(y.shape(), x.shape());
  ASSERT_TRUE(allClose(
      y.tensor(), Tensor::fromVector<float>({2, 1, 2, 1}, {3, 0, 7, 2})));
}

TEST(FunctionsTest, ChannelMixJacobian) {
  auto x = Variable(fl::randn({3, 2, 4, 2}, dtype::f64), true);
  auto w = Variable(fl::randn({4, 4}, dtype::f64), true);
  auto funcMixInput = [&w](Variable& in) { return channelMix(in, w); };
  ASSERT_TRUE(jacobianTest(funcMixInput, x, 1E-5));
  auto funcMixWeight = [&x](Variable& in) { return channelMix(x, in); };
  ASSERT_TRUE(jacobianTest(funcMixWeight, w, 1E-5));
}

TEST(FunctionsTest, ChannelMixCastsWeight) {
  auto x = Variable(fl::randn({3, 2, 4, 2}, dtype::f64), false);
  auto w = Variable(fl::randn({4, 4}, dtype::f32), true);
  auto y = channelMix(x, w);
  ASSERT_EQ(y.type(), dtype::f64);
  ASSERT_TRUE(allClose(
      y, channelMix(x, Variable(w.tensor().astype(dtype::f64), false)), 1E-6));

  y.backward(Variable(fl::full(y.shape(), 1.0, dtype::f64), false));
  ASSERT_EQ(w.grad().type(), dtype::f32);
  ASSERT_EQ(w.grad().shape(), w.shape());
}

TEST(FunctionsTest, ChannelMixShapeMismatch) {
  auto x = Variable(fl::randn({3, 2, 4, 2}), false);
  auto notSquare = Variable(fl::randn({4, 3}), false);
  auto wrongSize = Variable(fl::randn({3, 3}), false);
  auto notAGrid = Variable(fl::randn({3, 4}), false);
  ASSERT_THROW(channelMix(x, notSquare), std::invalid_argument);
  ASSERT_THROW(channelMix(x, wrongSize), std::invalid_argument);
  ASSERT_THROW(
      channelMix(notAGrid, Variable(fl::randn({4, 4}), false)),
      std::invalid_argument);
}

TEST(FunctionsTest, AffineChannel) {
  auto x = Variable(fl::randn({4, 3, 2, 5}, dtype::f64), false);
  auto shift = Variable(fl::randn({1, 1, 2, 1}, dtype::f64), true);
  auto logScale = Variable(fl::randn({1, 1, 2, 1}, dtype::f64) * 0.1, true);

  auto y = affineChannel(x, shift, logScale);
  auto expected = fl::tile(fl::exp(logScale.tensor()), {4, 3, 1, 5}) *
      (x.tensor() + fl::tile(shift.tensor(), {4, 3, 1, 5}));
  ASSERT_TRUE(allClose(y.tensor(), expected, 1E-10));

  auto back = affineChannel(y, shift, logScale, true);
  ASSERT_TRUE(allClose(back, x, 1E-10));
}

TEST(FunctionsTest, AffineChannelJacobian) {
  auto x = Variable(fl::randn({3, 2, 2, 2}, dtype::f64), true);
  auto shift = Variable(fl::randn({1, 1, 2, 1}, dtype::f64), true);
  auto logScale = Variable(fl::randn({1, 1, 2, 1}, dtype::f64) * 0.1, true);
  for (bool rev : {false, true}) {
    auto funcInput = [&](Variable& in) {
      return affineChannel(in, shift, logScale, rev);
    };
    ASSERT_TRUE(jacobianTest(funcInput, x, 1E-5));
    auto funcShift = [&](Variable& in) {
      return affineChannel(x, in, logScale, rev);
    };
    ASSERT_TRUE(jacobianTest(funcShift, shift, 1E-5));
    auto funcLogScale = [&](Variable& in) {
      return affineChannel(x, shift, in, rev);
    };
    ASSERT_TRUE(jacobianTest(funcLogScale, logScale, 1E-5));
  }
}

TEST(FunctionsTest, AffineChannelParameterMismatch) {
  auto x = Variable(fl::randn({3, 2, 2, 2}), false);
  auto three = Variable(fl::randn({1, 1, 3, 1}), false);
  auto two = Variable(fl::randn({1, 1, 2, 1}), false);
  ASSERT_THROW(affineChannel(x, three, two), std::invalid_argument);
  ASSERT_THROW(affineChannel(x, two, three), std::invalid_argument);
}

TEST(FunctionsTest, SpatialSize) {
  auto x = Variable(fl::randn({5, 7, 3, 2}), false);
  ASSERT_EQ(spatialSize(x), 35);
}

TEST(UtilsTest, EigenRoundTrip) {
  auto t = fl::randn({3, 5}, dtype::f64);
  auto m = toEigenMatrix(t);
  ASSERT_EQ(m.rows(), 3);
  ASSERT_EQ(m.cols(), 5);
  // column-major on both sides
  ASSERT_DOUBLE_EQ(m(2, 1), t(2, 1).scalar<double>());
  ASSERT_TRUE(allClose(fromEigenMatrix(m, dtype::f64), t, 1E-15));
  ASSERT_EQ(fromEigenMatrix(m).type(), dtype::f32);

  ASSERT_THROW(toEigenMatrix(fl::randn({2, 2, 2})), std::invalid_argument);
}

TEST(UtilsTest, IsSquareMatrix) {
  ASSERT_TRUE(isSquareMatrix({3, 3}));
  ASSERT_FALSE(isSquareMatrix({3, 2}));
  ASSERT_FALSE(isSquareMatrix({3}));
  ASSERT_FALSE(isSquareMatrix({3, 3, 1}));
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  fl::init();
  fl::setSeed(1);
  return RUN_ALL_TESTS();
}
