#include "cli/commands.hpp"

#include <stdlib.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

// NOLINTNEXTLINE
TEST(Commands, ForwardedEnv) {
  setenv("AICROWD_DATASET_NAME", "mpi3d_toy", 1);
  unsetenv("AICROWD_UNSET_VARIABLE");
  EXPECT_THAT(
      cli::ForwardedEnv("AICROWD_DATASET_NAME, AICROWD_UNSET_VARIABLE"),
      ElementsAre("AICROWD_DATASET_NAME=mpi3d_toy"));
  EXPECT_THAT(cli::ForwardedEnv(""), IsEmpty());
}

// NOLINTNEXTLINE
TEST(Commands, DatasetVariablesAreForwardedByDefault) {
  setenv("AICROWD_DATASET_NAME", "cars3d", 1);
  setenv("DISENTANGLEMENT_LIB_DATA", "/data/dlib", 1);
  EXPECT_THAT(cli::ForwardedEnv(FLAGS_forward_env),
              ElementsAre("AICROWD_DATASET_NAME=cars3d",
                          "DISENTANGLEMENT_LIB_DATA=/data/dlib"));
  unsetenv("DISENTANGLEMENT_LIB_DATA");
}

// NOLINTNEXTLINE
TEST(Commands, LimitsFromFlags) {
  FLAGS_time_limit = 12.5;
  FLAGS_memory_limit = 2048;
  proto::ResourceLimits limits = cli::LimitsFromFlags();
  EXPECT_FLOAT_EQ(limits.wall_time(), 12.5);
  EXPECT_EQ(limits.memory(), 2048);
}

// NOLINTNEXTLINE
TEST(Commands, SubmissionId) {
  util::TempDir tmp("/tmp/aicrowd_cli_test");
  std::string dir = util::File::JoinPath(tmp.Path(), "My Submission");
  util::File::MakeDirs(dir);
  EXPECT_EQ(cli::SubmissionId(dir), "my-submission");
  EXPECT_EQ(cli::SubmissionId(dir + "/."), "my-submission");
}

}  // namespace
