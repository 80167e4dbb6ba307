#include "core/core.hpp"

#include <map>
#include <set>

#include "absl/synchronization/mutex.h"
#include "executor/runtime_mock.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "reporter/reporter.hpp"
#include "util/file.hpp"

namespace {

using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/aicrowd_core_test";
const char* const kChallenge = "aicrowd-neurips-2019-disentanglement-challenge";

class CoreTest : public ::testing::Test {
 protected:
  CoreTest()
      : store_(test_tmpdir + "/store"),
        temp_(test_tmpdir + "/temp"),
        runtime_(std::make_shared<NiceMock<executor::MockRuntime>>()) {
    ON_CALL(*runtime_, Id()).WillByDefault(Return("mock"));
    proto::ImageConfig config;
    config.set_user("aicrowd");
    config.set_uid(1001);
    config.set_gid(1001);
    ON_CALL(*runtime_, Inspect(_)).WillByDefault(Return(config));
    // Every context prints the id of its image.
    ON_CALL(*runtime_, CreateContextProxy(_, _))
        .WillByDefault([this](const std::string& image_id,
                              const std::string& scratch) -> executor::Context* {
          {
            absl::MutexLock lck(&mutex_);
            scratch_dirs_.insert(scratch);
          }
          auto context = new NiceMock<executor::MockContext>;
          ON_CALL(*context, Run(_, _, _))
              .WillByDefault([image_id](const executor::RunOptions& options,
                                        executor::RunInfo* /*info*/,
                                        std::string* /*error_msg*/) {
                util::File::Write(options.stdout_file, image_id);
                return true;
              });
          return context;
        });
    options_.store_directory = store_.Path();
  }

  core::Submission MakeSubmission(const std::string& id,
                                  const std::string& challenge = kChallenge) {
    submission_dirs_.emplace_back(test_tmpdir + "/submissions");
    const std::string& path = submission_dirs_.back().Path();
    util::File::Write(util::File::JoinPath(path, "aicrowd.json"),
                      "{\"challenge_id\": \"" + challenge +
                          "\", \"grader_id\": \"" + kChallenge +
                          "\", \"authors\": [\"someone\"], \"gpu\": false}");
    util::File::Write(util::File::JoinPath(path, "run.sh"),
                      "#!/bin/sh\necho " + id + "\n");
    return core::Submission{id, path};
  }

  std::shared_ptr<core::Pipeline> MakePipeline() {
    builder::BuilderOptions builder_options;
    builder_options.cpu_base_image = "cpu";
    builder_options.gpu_base_image = "gpu";
    builder_options.temp_directory = temp_.Path();
    auto builder = std::make_shared<builder::ImageBuilder>(
        runtime_, std::make_shared<builder::PinResolver>(),
        std::make_shared<builder::LayerCache>(store_.Path()),
        builder_options);
    harness::HarnessOptions harness_options;
    harness_options.temp_directory = temp_.Path();
    auto harness = std::make_shared<harness::Harness>(
        runtime_, std::make_shared<harness::GpuPool>(std::vector<int32_t>{}),
        harness_options);
    return std::make_shared<core::Pipeline>(
        std::shared_ptr<const manifest::ChallengeRegistry>(
            manifest::StaticChallengeRegistry::Default()),
        runtime_, builder, harness, options_);
  }

  std::string Output(const proto::StructuredOutcome& outcome) {
    return util::File::ReadAll(
        reporter::OutputPath(store_.Path(), outcome.stdout_ref()));
  }

  util::TempDir store_;
  util::TempDir temp_;
  std::vector<util::TempDir> submission_dirs_;
  std::shared_ptr<NiceMock<executor::MockRuntime>> runtime_;
  core::PipelineOptions options_;
  absl::Mutex mutex_;
  std::set<std::string> scratch_dirs_;
};

// NOLINTNEXTLINE
TEST_F(CoreTest, EvaluateRemovesImage) {
  EXPECT_CALL(*runtime_, Build(_, _)).Times(1);
  EXPECT_CALL(*runtime_, Remove(StartsWith("aicrowd-a-"))).Times(1);
  proto::StructuredOutcome outcome =
      MakePipeline()->Evaluate(MakeSubmission("a"), nullptr);
  EXPECT_EQ(outcome.status(), proto::SUCCESS);
  EXPECT_EQ(outcome.submission_id(), "a");
  EXPECT_THAT(Output(outcome), StartsWith("aicrowd-a-"));
}

// NOLINTNEXTLINE
TEST_F(CoreTest, KeepImages) {
  options_.keep_images = true;
  EXPECT_CALL(*runtime_, Remove(_)).Times(0);
  proto::StructuredOutcome outcome =
      MakePipeline()->Evaluate(MakeSubmission("a"), nullptr);
  EXPECT_EQ(outcome.status(), proto::SUCCESS);
}

// NOLINTNEXTLINE
TEST_F(CoreTest, UnknownChallengeIsNeverBuilt) {
  EXPECT_CALL(*runtime_, Build(_, _)).Times(0);
  EXPECT_CALL(*runtime_, Remove(_)).Times(0);
  proto::StructuredOutcome outcome =
      MakePipeline()->Evaluate(MakeSubmission("a", "other"), nullptr);
  EXPECT_EQ(outcome.status(), proto::VALIDATION_FAILURE);
  EXPECT_THAT(outcome.message(), HasSubstr("Unknown challenge"));
  EXPECT_FALSE(outcome.retryable());
}

// NOLINTNEXTLINE
TEST_F(CoreTest, MissingManifest) {
  EXPECT_CALL(*runtime_, Build(_, _)).Times(0);
  core::Submission submission = MakeSubmission("a");
  util::File::Remove(util::File::JoinPath(submission.directory, "aicrowd.json"));
  proto::StructuredOutcome outcome =
      MakePipeline()->Evaluate(submission, nullptr);
  EXPECT_EQ(outcome.status(), proto::VALIDATION_FAILURE);
}

// NOLINTNEXTLINE
TEST_F(CoreTest, MissingEntrypoint) {
  core::Submission submission = MakeSubmission("a");
  util::File::Remove(util::File::JoinPath(submission.directory, "run.sh"));
  EXPECT_CALL(*runtime_, Build(_, _)).Times(0);
  proto::StructuredOutcome outcome =
      MakePipeline()->Evaluate(submission, nullptr);
  EXPECT_EQ(outcome.status(), proto::BUILD_FAILURE);
  EXPECT_THAT(outcome.message(), HasSubstr("Entrypoint missing"));
}

// NOLINTNEXTLINE
TEST_F(CoreTest, FailedImageBuild) {
  EXPECT_CALL(*runtime_, Build(_, _))
      .WillOnce([](const executor::BuildContext& /*context*/,
                   const std::atomic<bool>* /*cancelled*/) {
        throw executor::build_failed(
            "docker build failed: PackagesNotFoundError: numpy==99.0");
      });
  EXPECT_CALL(*runtime_, CreateContextProxy(_, _)).Times(0);
  proto::StructuredOutcome outcome =
      MakePipeline()->Evaluate(MakeSubmission("a"), nullptr);
  EXPECT_EQ(outcome.status(), proto::BUILD_FAILURE);
  EXPECT_THAT(outcome.message(), HasSubstr("PackagesNotFoundError"));
}

// NOLINTNEXTLINE
TEST_F(CoreTest, ConcurrentSubmissionsAreIsolated) {
  EXPECT_CALL(*runtime_, Build(_, _)).Times(2);
  core::Core core(MakePipeline(), 2);
  core.Submit(MakeSubmission("a"));
  core.Submit(MakeSubmission("b"));
  std::map<std::string, proto::StructuredOutcome> outcomes;
  EXPECT_TRUE(core.Run([&outcomes](const proto::StructuredOutcome& outcome) {
    outcomes[outcome.submission_id()] = outcome;
    return true;
  }));
  ASSERT_EQ(outcomes.size(), 2u);
  EXPECT_EQ(outcomes["a"].status(), proto::SUCCESS);
  EXPECT_EQ(outcomes["b"].status(), proto::SUCCESS);
  EXPECT_THAT(Output(outcomes["a"]), StartsWith("aicrowd-a-"));
  EXPECT_THAT(Output(outcomes["b"]), StartsWith("aicrowd-b-"));
  EXPECT_EQ(scratch_dirs_.size(), 2u);
}

// NOLINTNEXTLINE
TEST_F(CoreTest, CancelledSubmissionIsNeverBuilt) {
  EXPECT_CALL(*runtime_, Build(_, _)).Times(1);
  core::Core core(MakePipeline(), 1);
  core.Submit(MakeSubmission("a"));
  core.Submit(MakeSubmission("b"));
  EXPECT_TRUE(core.Cancel("a"));
  EXPECT_FALSE(core.Cancel("c"));
  std::map<std::string, proto::Status> statuses;
  core.Run([&statuses](const proto::StructuredOutcome& outcome) {
    statuses[outcome.submission_id()] = outcome.status();
    return true;
  });
  EXPECT_EQ(statuses["a"], proto::CANCELLED);
  EXPECT_EQ(statuses["b"], proto::SUCCESS);
}

// NOLINTNEXTLINE
TEST_F(CoreTest, DuplicateSubmission) {
  core::Core core(MakePipeline(), 1);
  core::Submission submission = MakeSubmission("a");
  core.Submit(submission);
  EXPECT_THROW(core.Submit(submission), std::invalid_argument);
}

// NOLINTNEXTLINE
TEST_F(CoreTest, CallbackStops) {
  core::Core core(MakePipeline(), 1);
  core.Submit(MakeSubmission("a"));
  core.Submit(MakeSubmission("b"));
  core.Submit(MakeSubmission("c"));
  int calls = 0;
  EXPECT_FALSE(core.Run([&calls](const proto::StructuredOutcome& /*outcome*/) {
    calls++;
    return false;
  }));
  EXPECT_EQ(calls, 1);
}

}  // namespace
