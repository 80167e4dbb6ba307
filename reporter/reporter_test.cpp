#include "reporter/reporter.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/sha256.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/aicrowd_reporter_test";

proto::ExecutionResult Result(proto::Status status) {
  proto::ExecutionResult result;
  result.set_submission_id("submission");
  result.set_status(status);
  return result;
}

// NOLINTNEXTLINE
TEST(Reporter, Success) {
  proto::ExecutionResult result = Result(proto::SUCCESS);
  result.set_stdout_tail("hello\n");
  result.set_wall_time(1.5);
  proto::StructuredOutcome outcome = reporter::Report(result);
  EXPECT_EQ(outcome.submission_id(), "submission");
  EXPECT_EQ(outcome.status(), proto::SUCCESS);
  EXPECT_EQ(outcome.stdout_ref(), util::HashString("hello\n").Hex());
  EXPECT_EQ(outcome.stderr_ref(), "");
  EXPECT_FLOAT_EQ(outcome.duration(), 1.5);
  EXPECT_FALSE(outcome.retryable());
  EXPECT_FALSE(outcome.output_truncated());
}

// NOLINTNEXTLINE
TEST(Reporter, RuntimeFailure) {
  proto::ExecutionResult result = Result(proto::RUNTIME_FAILURE);
  result.set_exit_code(17);
  result.set_stderr_truncated(true);
  proto::StructuredOutcome outcome = reporter::Report(result);
  EXPECT_EQ(outcome.message(), "Entrypoint exited with code 17");
  EXPECT_EQ(outcome.exit_code(), 17);
  EXPECT_TRUE(outcome.output_truncated());

  result.set_signal(9);
  result.set_exit_code(137);
  EXPECT_EQ(reporter::Report(result).message(),
            "Entrypoint killed by signal 9");
}

// NOLINTNEXTLINE
TEST(Reporter, Retryable) {
  EXPECT_TRUE(reporter::Report(Result(proto::TIMEOUT)).retryable());
  EXPECT_TRUE(
      reporter::Report(Result(proto::RESOURCE_UNAVAILABLE)).retryable());
  EXPECT_FALSE(reporter::Report(Result(proto::BUILD_FAILURE)).retryable());
  EXPECT_FALSE(reporter::Report(Result(proto::CANCELLED)).retryable());
}

// NOLINTNEXTLINE
TEST(Reporter, MessagesAreStable) {
  proto::ExecutionResult result = Result(proto::VALIDATION_FAILURE);
  result.set_error_message("Missing field: authors");
  EXPECT_EQ(reporter::Report(result).message(),
            "Invalid submission: Missing field: authors");
  EXPECT_EQ(reporter::Report(result).message(),
            reporter::Report(result).message());
  EXPECT_EQ(reporter::Report(Result(proto::INTERNAL_ERROR)).message(),
            "Internal error");
}

// NOLINTNEXTLINE
TEST(Reporter, ExitCodes) {
  EXPECT_EQ(reporter::ExitCodeFor(proto::SUCCESS), 0);
  EXPECT_EQ(reporter::ExitCodeFor(proto::RUNTIME_FAILURE), 1);
  EXPECT_EQ(reporter::ExitCodeFor(proto::TIMEOUT), 2);
  EXPECT_EQ(reporter::ExitCodeFor(proto::BUILD_FAILURE), 3);
  EXPECT_EQ(reporter::ExitCodeFor(proto::RESOURCE_UNAVAILABLE), 4);
  EXPECT_EQ(reporter::ExitCodeFor(proto::VALIDATION_FAILURE), 5);
  EXPECT_EQ(reporter::ExitCodeFor(proto::CANCELLED), 6);
  EXPECT_EQ(reporter::ExitCodeFor(proto::INTERNAL_ERROR), 7);
}

// NOLINTNEXTLINE
TEST(Reporter, Json) {
  proto::StructuredOutcome outcome =
      reporter::Report(Result(proto::TIMEOUT));
  std::string json = reporter::ToJson(outcome);
  EXPECT_THAT(json, StartsWith("{"));
  EXPECT_THAT(json, HasSubstr("\"status\":\"TIMEOUT\""));
  EXPECT_THAT(json, HasSubstr("\"submission_id\":\"submission\""));
  EXPECT_THAT(json, HasSubstr("\"retryable\":true"));
  EXPECT_THAT(json, HasSubstr("\"exit_code\":0"));
}

// NOLINTNEXTLINE
TEST(Reporter, PersistOutputs) {
  util::TempDir store(test_tmpdir);
  proto::ExecutionResult result = Result(proto::SUCCESS);
  result.set_stdout_tail("out");
  result.set_stderr_tail("err");
  reporter::PersistOutputs(result, store.Path());
  proto::StructuredOutcome outcome = reporter::Report(result);
  EXPECT_EQ(util::File::ReadAll(
                reporter::OutputPath(store.Path(), outcome.stdout_ref())),
            "out");
  EXPECT_EQ(util::File::ReadAll(
                reporter::OutputPath(store.Path(), outcome.stderr_ref())),
            "err");
  EXPECT_NO_THROW(reporter::PersistOutputs(result, store.Path()));
}

}  // namespace
