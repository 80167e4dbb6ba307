#include "executor/local_runtime.hpp"

#include <unistd.h>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using ::testing::HasSubstr;

const std::string test_tmpdir = "/tmp/aicrowd_executor_test";

class LocalRuntimeTest : public ::testing::Test {
 protected:
  LocalRuntimeTest()
      : store_(test_tmpdir + "/store"),
        context_(test_tmpdir + "/context"),
        runtime_(store_.Path()) {
    std::string home = util::File::JoinPath(context_.Path(), "home");
    util::File::Write(util::File::JoinPath(home, "run.sh"),
                      "#!/bin/sh\ncat data.txt\necho changed > data.txt\n");
    util::File::MakeExecutable(util::File::JoinPath(home, "run.sh"));
    util::File::Write(util::File::JoinPath(home, "data.txt"), "original\n");
    util::File::Write(util::File::JoinPath(context_.Path(), "environment.lock"),
                      "# base: local\n");
    build_.image_id = "local-test";
    build_.context_dir = context_.Path();
    build_.user = "aicrowd";
    build_.uid = 1001;
    build_.gid = 1001;
    build_.entrypoint = "/home/aicrowd/run.sh";
    build_.workdir = "/home/aicrowd";
  }

  std::string RunOnce() {
    util::TempDir scratch(test_tmpdir + "/scratch");
    std::unique_ptr<executor::Context> context =
        runtime_.CreateContext(build_.image_id, scratch.Path());
    executor::RunOptions options;
    options.stdout_file = util::File::JoinPath(scratch.Path(), "stdout");
    options.stderr_file = util::File::JoinPath(scratch.Path(), "stderr");
    executor::RunInfo info;
    std::string error_msg;
    EXPECT_TRUE(context->Run(options, &info, &error_msg)) << error_msg;
    EXPECT_EQ(info.status_code, 0);
    return util::File::ReadAll(options.stdout_file);
  }

  util::TempDir store_;
  util::TempDir context_;
  executor::LocalRuntime runtime_;
  executor::BuildContext build_;
};

// NOLINTNEXTLINE
TEST_F(LocalRuntimeTest, BuildAndInspect) {
  runtime_.Build(build_, nullptr);
  proto::ImageConfig config = runtime_.Inspect("local-test");
  EXPECT_EQ(config.user(), "aicrowd");
  EXPECT_EQ(config.uid(), 1001);
  EXPECT_EQ(config.workdir(), "/home/aicrowd");
  std::string root = util::File::JoinPath(runtime_.ImageDir("local-test"),
                                          "rootfs");
  EXPECT_EQ(util::File::ReadAll(root + "/home/aicrowd/data.txt"),
            "original\n");
  EXPECT_EQ(util::File::ReadAll(root + "/opt/environment.lock"),
            "# base: local\n");
  EXPECT_THROW(runtime_.Build(build_, nullptr), std::runtime_error);
}

// NOLINTNEXTLINE
TEST_F(LocalRuntimeTest, ContextsDoNotShareState) {
  runtime_.Build(build_, nullptr);
  EXPECT_EQ(RunOnce(), "original\n");
  EXPECT_EQ(RunOnce(), "original\n");
}

// NOLINTNEXTLINE
TEST_F(LocalRuntimeTest, Remove) {
  runtime_.Build(build_, nullptr);
  runtime_.Remove("local-test");
  EXPECT_FALSE(util::File::Exists(runtime_.ImageDir("local-test")));
  EXPECT_NO_THROW(runtime_.Remove("local-test"));
}

// NOLINTNEXTLINE
TEST_F(LocalRuntimeTest, InvalidImageId) {
  EXPECT_THROW(runtime_.ImageDir("../escape"), std::invalid_argument);
  EXPECT_THROW(runtime_.ImageDir(""), std::invalid_argument);
}

// NOLINTNEXTLINE
TEST_F(LocalRuntimeTest, CancelledBuild) {
  std::atomic<bool> cancelled{true};
  EXPECT_THROW(runtime_.Build(build_, &cancelled), executor::cancelled);
  EXPECT_FALSE(util::File::Exists(runtime_.ImageDir("local-test")));
}

// NOLINTNEXTLINE
TEST_F(LocalRuntimeTest, MissingLockFileRemovesImage) {
  util::File::Remove(
      util::File::JoinPath(context_.Path(), "environment.lock"));
  EXPECT_THROW(runtime_.Build(build_, nullptr), std::system_error);
  EXPECT_FALSE(util::File::Exists(runtime_.ImageDir("local-test")));
}

// NOLINTNEXTLINE
TEST(Runtime, Create) {
  util::TempDir store(test_tmpdir + "/store");
  EXPECT_EQ(executor::Runtime::Create("local", store.Path())->Id(), "local");
  EXPECT_THROW(executor::Runtime::Create("podman", store.Path()),
               std::invalid_argument);
  EXPECT_NE(executor::Runtime::Create("", store.Path()), nullptr);
}

// NOLINTNEXTLINE
TEST(Runtime, ApplyLimits) {
  proto::ResourceLimits limits;
  limits.set_wall_time(1.5);
  limits.set_cpu_time(2);
  limits.set_memory(4096);
  limits.set_processes(8);
  sandbox::ExecutionOptions options("/", "/bin/true");
  executor::ApplyLimits(limits, &options);
  EXPECT_EQ(options.wall_limit_millis, 1500);
  EXPECT_EQ(options.cpu_limit_millis, 2000);
  EXPECT_EQ(options.memory_limit_kb, 4096);
  EXPECT_EQ(options.max_procs, 8);
}

}  // namespace
