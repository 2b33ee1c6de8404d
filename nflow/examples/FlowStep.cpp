/*
 * Copyright (c) Meta Platforms, Inc. and affiliates.
 *
 * This source code is licensed under the MIT license found in the
 * LICENSE file in the root directory of this source tree.
 */

/**
 * Runs one ActNorm -> invertible 1x1 convolution step on random data in
 * both directions and reports the log-determinant and reconstruction error.
 *
 *   FlowStep --channels=8 --height=16 --width=16 --batch_size=4 --lu
 */

#include <cstdlib>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "flashlight/fl/common/Serialization.h"
#include "flashlight/fl/nn/Init.h"
#include "flashlight/fl/tensor/Init.h"
#include "flashlight/fl/tensor/Random.h"
#include "flashlight/fl/tensor/TensorBase.h"
#include "nflow/nflow.h"

DEFINE_int64(channels, 4, "Number of feature channels");
DEFINE_int64(height, 8, "Feature grid height");
DEFINE_int64(width, 8, "Feature grid width");
DEFINE_int64(batch_size, 2, "Number of samples per batch");
DEFINE_bool(lu, false, "Use the LU-decomposed invertible convolution");
DEFINE_int64(seed, 0, "Random seed");
DEFINE_string(save_path, "", "If set, save the seeded flow step here");

using namespace nflow;

int main(int argc, char** argv) {
  google::InitGoogleLogging(argv[0]);
  google::InstallFailureSignalHandler();
  gflags::SetUsageMessage("Forward/reverse pass through one flow step");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  if (FLAGS_channels <= 0 || FLAGS_height <= 0 || FLAGS_width <= 0 ||
      FLAGS_batch_size <= 0) {
    LOG(ERROR) << "--channels, --height, --width and --batch_size "
               << "must all be positive";
    return EXIT_FAILURE;
  }
  fl::init();
  fl::setSeed(static_cast<int>(FLAGS_seed));

  const int channels = static_cast<int>(FLAGS_channels);
  FlowSequential step;
  step.add(ActNorm(channels));
  if (FLAGS_lu) {
    step.add(InvConv2DLU(channels));
  } else {
    step.add(InvConv2D(channels));
  }
  LOG(INFO) << step.prettyString();

  // Shifted and scaled so that ActNorm has something to normalize.
  auto x = fl::input(
      3.0 *
          fl::randn(
              {FLAGS_width, FLAGS_height, FLAGS_channels, FLAGS_batch_size}) +
      1.5);
  auto logdet0 = fl::input(fl::full({FLAGS_batch_size}, 0.0, fl::dtype::f32));

  try {
    auto z = step.forward(x, logdet0);
    LOG(INFO) << "forward: mean="
              << fl::mean(z.output.tensor()).asScalar<double>()
              << " stdev=" << fl::std(z.output.tensor()).asScalar<double>()
              << " logdet=" << fl::mean(z.logdet.tensor()).asScalar<double>();

    auto xr = step.reverse(z);
    LOG(INFO) << "reverse: max |x - x'|="
              << fl::amax(fl::abs(xr.output.tensor() - x.tensor()))
                     .asScalar<double>()
              << " max |logdet|="
              << fl::amax(fl::abs(xr.logdet.tensor())).asScalar<double>();
  } catch (const SingularMatrixError& err) {
    LOG(ERROR) << "flow step is not invertible: " << err.what();
    return EXIT_FAILURE;
  }

  if (!FLAGS_save_path.empty()) {
    FlowModulePtr saved = std::make_shared<FlowSequential>(step);
    fl::save(FLAGS_save_path, saved);
    LOG(INFO) << "saved flow step to " << FLAGS_save_path;
  }
  return EXIT_SUCCESS;
}
