#include "harness/harness.hpp"

#include <signal.h>

#include <chrono>
#include <thread>

#include "absl/strings/numbers.h"
#include "executor/local_runtime.hpp"
#include "executor/runtime_mock.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/misc.hpp"

namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Return;
using ::testing::Throw;

const std::string test_tmpdir = "/tmp/aicrowd_harness_test";

class HarnessTest : public ::testing::Test {
 protected:
  HarnessTest()
      : store_(test_tmpdir + "/store"),
        runtime_(std::make_shared<executor::LocalRuntime>(store_.Path())) {
    options_.temp_directory = test_tmpdir + "/scratch";
  }

  // Builds a local image whose entrypoint is a shell script.
  proto::ImageHandle Image(const std::string& script) {
    static int counter = 0;
    util::TempDir context(test_tmpdir + "/context");
    std::string entrypoint =
        util::File::JoinPath(context.Path(), "home/run.sh");
    util::File::Write(entrypoint, "#!/bin/sh\n" + script + "\n");
    util::File::MakeExecutable(entrypoint);
    util::File::Write(util::File::JoinPath(context.Path(), "environment.lock"),
                      "# base: local\n");
    executor::BuildContext build;
    build.image_id = "harness-test-" + std::to_string(counter++);
    build.context_dir = context.Path();
    build.user = "aicrowd";
    build.uid = 1001;
    build.gid = 1001;
    build.entrypoint = "/home/aicrowd/run.sh";
    build.workdir = "/home/aicrowd";
    runtime_->Build(build, nullptr);
    proto::ImageHandle handle;
    handle.set_id(build.image_id);
    handle.set_submission_id("submission");
    handle.set_runtime(runtime_->Id());
    return handle;
  }

  proto::ExecutionResult Run(const std::string& script,
                             bool requires_gpu = false) {
    harness::Harness harness(runtime_, gpus_, options_);
    return harness.Run(Image(script), requires_gpu, limits_);
  }

  util::TempDir store_;
  std::shared_ptr<executor::LocalRuntime> runtime_;
  std::shared_ptr<harness::GpuPool> gpus_ =
      std::make_shared<harness::GpuPool>(std::vector<int32_t>{});
  harness::HarnessOptions options_;
  proto::ResourceLimits limits_;
};

// NOLINTNEXTLINE
TEST_F(HarnessTest, Success) {
  proto::ExecutionResult result = Run("echo hello\necho oops >&2");
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.exit_code(), 0);
  EXPECT_EQ(result.submission_id(), "submission");
  EXPECT_EQ(result.stdout_tail(), "hello\n");
  EXPECT_EQ(result.stderr_tail(), "oops\n");
  EXPECT_FALSE(result.stdout_truncated());
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, ExitCode) {
  proto::ExecutionResult result = Run("exit 17");
  EXPECT_EQ(result.status(), proto::RUNTIME_FAILURE);
  EXPECT_EQ(result.exit_code(), 17);
  EXPECT_EQ(result.signal(), 0);
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, KilledBySignal) {
  proto::ExecutionResult result = Run("kill -9 $$");
  EXPECT_EQ(result.status(), proto::RUNTIME_FAILURE);
  EXPECT_EQ(result.signal(), 9);
  EXPECT_EQ(result.exit_code(), 137);
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, CleanEnvironment) {
  options_.env.push_back("AICROWD_DATASET_NAME=mpi3d_toy");
  setenv("AICROWD_LEAK", "1", 1);
  proto::ExecutionResult result =
      Run("echo \"$AICROWD_DATASET_NAME:$USER:${AICROWD_LEAK:-none}\"");
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.stdout_tail(), "mpi3d_toy:aicrowd:none\n");
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, OutputIsTruncated) {
  options_.max_output_bytes = 10;
  proto::ExecutionResult result = Run("printf 0123456789abcdef");
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.stdout_tail(), "6789abcdef");
  EXPECT_TRUE(result.stdout_truncated());
  EXPECT_FALSE(result.stderr_truncated());
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, TimeoutKillsEverything) {
  limits_.set_wall_time(0.5);
  auto start = std::chrono::steady_clock::now();
  proto::ExecutionResult result = Run("sleep 100 &\necho $!\nwait");
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
  EXPECT_EQ(result.status(), proto::TIMEOUT);
  EXPECT_GE(result.wall_time(), 0.5);

  int child = 0;
  ASSERT_TRUE(absl::SimpleAtoi(util::Trim(result.stdout_tail()), &child));
  auto gone = [child]() {
    if (kill(child, 0) == -1 && errno == ESRCH) return true;
    try {
      std::string stat = util::File::ReadAll("/proc/" + std::to_string(child) +
                                             "/stat");
      return stat.find(") Z") != std::string::npos;
    } catch (const util::file_not_found& exc) {
      return true;
    }
  };
  for (int i = 0; i < 100 && !gone(); i++) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_TRUE(gone());
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, Cancellation) {
  std::atomic<bool> cancelled{false};
  harness::Harness harness(runtime_, gpus_, options_);
  proto::ImageHandle handle = Image("sleep 10");
  std::thread canceller([&cancelled]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    cancelled = true;
  });
  proto::ExecutionResult result =
      harness.Run(handle, false, limits_, &cancelled);
  canceller.join();
  EXPECT_EQ(result.status(), proto::CANCELLED);
  EXPECT_LT(result.wall_time(), 5);
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, NoGpuAvailable) {
  auto runtime = std::make_shared<executor::MockRuntime>();
  EXPECT_CALL(*runtime, CreateContextProxy(_, _)).Times(0);
  harness::Harness harness(runtime, gpus_, options_);
  proto::ImageHandle handle;
  handle.set_id("image");
  proto::ExecutionResult result = harness.Run(handle, true, limits_);
  EXPECT_EQ(result.status(), proto::RESOURCE_UNAVAILABLE);
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, GpuIsForwardedAndReleased) {
  gpus_ = std::make_shared<harness::GpuPool>(std::vector<int32_t>{3});
  proto::ExecutionResult result = Run("echo \"$CUDA_VISIBLE_DEVICES\"", true);
  EXPECT_EQ(result.status(), proto::SUCCESS);
  EXPECT_EQ(result.stdout_tail(), "3\n");
  EXPECT_EQ(gpus_->Available(), 1u);

  result = Run("echo \"[$CUDA_VISIBLE_DEVICES]\"");
  EXPECT_EQ(result.stdout_tail(), "[]\n");
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, ContextIsTornDownBeforeGpuRelease) {
  gpus_ = std::make_shared<harness::GpuPool>(std::vector<int32_t>{0});
  auto runtime = std::make_shared<executor::MockRuntime>();
  auto context = new executor::MockContext;
  EXPECT_CALL(*runtime, CreateContextProxy("image", _))
      .WillOnce(Return(context));
  EXPECT_CALL(*context, Run(_, _, _))
      .WillOnce([](const executor::RunOptions& options,
                   executor::RunInfo* info, std::string* /*error_msg*/) {
        EXPECT_EQ(options.gpu_device, 0);
        info->status_code = 3;
        return true;
      });
  auto gpus = gpus_;
  EXPECT_CALL(*context, Die()).WillOnce([gpus]() {
    EXPECT_EQ(gpus->Available(), 0u);
  });
  harness::Harness harness(runtime, gpus_, options_);
  proto::ImageHandle handle;
  handle.set_id("image");
  proto::ExecutionResult result = harness.Run(handle, true, limits_);
  EXPECT_EQ(result.status(), proto::RUNTIME_FAILURE);
  EXPECT_EQ(result.exit_code(), 3);
  EXPECT_EQ(gpus_->Available(), 1u);
}

// NOLINTNEXTLINE
TEST_F(HarnessTest, InternalError) {
  auto runtime = std::make_shared<executor::MockRuntime>();
  EXPECT_CALL(*runtime, CreateContextProxy(_, _))
      .WillOnce(Throw(std::runtime_error("disk on fire")));
  harness::Harness harness(runtime, gpus_, options_);
  proto::ImageHandle handle;
  handle.set_id("image");
  proto::ExecutionResult result = harness.Run(handle, false, limits_);
  EXPECT_EQ(result.status(), proto::INTERNAL_ERROR);
  EXPECT_THAT(result.error_message(), HasSubstr("disk on fire"));
}

// NOLINTNEXTLINE
TEST(GpuPool, FromFlag) {
  auto pool = harness::GpuPool::FromFlag("1, 0");
  EXPECT_EQ(pool->Size(), 2u);
  auto first = pool->TryAcquire();
  auto second = pool->TryAcquire();
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->Device(), 0);
  EXPECT_EQ(second->Device(), 1);
  EXPECT_FALSE(pool->TryAcquire());
  first.reset();
  EXPECT_EQ(pool->Available(), 1u);
  EXPECT_EQ(harness::GpuPool::FromFlag("")->Size(), 0u);
  EXPECT_THROW(harness::GpuPool::FromFlag("0,x"), std::invalid_argument);
  EXPECT_THROW(harness::GpuPool::FromFlag("0,0"), std::invalid_argument);
}

// NOLINTNEXTLINE
TEST(GpuPool, LeaseMove) {
  harness::GpuPool pool({7});
  {
    auto lease = pool.TryAcquire();
    ASSERT_TRUE(lease);
    harness::GpuPool::Lease moved = std::move(*lease);
    lease.reset();
    EXPECT_EQ(pool.Available(), 0u);
    EXPECT_EQ(moved.Device(), 7);
  }
  EXPECT_EQ(pool.Available(), 1u);
}

}  // namespace
