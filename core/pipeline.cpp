#include "core/pipeline.hpp"

#include "builder/build_spec.hpp"
#include "glog/logging.h"
#include "manifest/validator.hpp"
#include "reporter/reporter.hpp"
#include "util/file.hpp"

namespace {
void Fail(proto::Status status, proto::ErrorKind kind, const std::string& msg,
          proto::ExecutionResult* result) {
  result->set_status(status);
  result->set_error_kind(kind);
  result->set_error_message(msg);
}
}  // namespace

namespace core {

proto::ImageHandle Pipeline::BuildImage(const Submission& submission,
                                        const std::atomic<bool>* cancelled) {
  if (cancelled != nullptr && *cancelled) {
    throw executor::cancelled("Cancelled before validation");
  }
  LOG(INFO) << "Validating " << submission.id << " in "
            << submission.directory;
  const std::string manifest_path =
      util::File::JoinPath(submission.directory, manifest::kManifestFile);
  if (!util::File::Exists(manifest_path)) {
    throw manifest::malformed_manifest(std::string(manifest::kManifestFile) +
                                       " not found");
  }
  const std::string runtime_path =
      util::File::JoinPath(submission.directory, manifest::kRuntimeFile);
  std::string raw_runtime;
  if (util::File::Exists(runtime_path)) {
    raw_runtime = util::File::ReadAll(runtime_path);
  } else {
    VLOG(1) << submission.id << " has no " << manifest::kRuntimeFile;
  }
  manifest::ValidatedSubmission validated = manifest::Validate(
      util::File::ReadAll(manifest_path), raw_runtime, *registry_);

  proto::BuildSpec spec = builder::MakeBuildSpec(
      submission.id, submission.directory, validated);
  return builder_->Build(spec, cancelled);
}

absl::optional<proto::ImageHandle> Pipeline::Build(
    const Submission& submission, const std::atomic<bool>* cancelled,
    proto::ExecutionResult* result) {
  result->set_submission_id(submission.id);
  try {
    return BuildImage(submission, cancelled);
  } catch (const manifest::validation_error& exc) {
    LOG(WARNING) << submission.id << " rejected: " << exc.what();
    Fail(proto::VALIDATION_FAILURE, exc.Kind(), exc.what(), result);
  } catch (const builder::build_error& exc) {
    LOG(WARNING) << "Build of " << submission.id << " failed: " << exc.what();
    Fail(proto::BUILD_FAILURE, exc.Kind(), exc.what(), result);
  } catch (const executor::cancelled& exc) {
    LOG(INFO) << submission.id << " cancelled";
    Fail(proto::CANCELLED, proto::NO_ERROR_KIND, exc.what(), result);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Build of " << submission.id << " failed: " << exc.what();
    Fail(proto::INTERNAL_ERROR, proto::NO_ERROR_KIND, exc.what(), result);
  }
  return absl::nullopt;
}

proto::StructuredOutcome Pipeline::Run(const proto::ImageHandle& handle,
                                       bool requires_gpu,
                                       const std::atomic<bool>* cancelled) {
  return Report(
      harness_->Run(handle, requires_gpu, options_.limits, cancelled));
}

proto::StructuredOutcome Pipeline::Evaluate(
    const Submission& submission, const std::atomic<bool>* cancelled) {
  proto::ExecutionResult result;
  absl::optional<proto::ImageHandle> handle =
      Build(submission, cancelled, &result);
  if (handle) {
    result = harness_->Run(*handle, handle->requires_gpu(), options_.limits,
                           cancelled);
  }
  result.set_submission_id(submission.id);
  proto::StructuredOutcome outcome = Report(result);

  if (handle && !options_.keep_images) {
    try {
      runtime_->Remove(handle->id());
    } catch (const std::exception& exc) {
      LOG(WARNING) << "Could not remove image " << handle->id() << ": "
                   << exc.what();
    }
  }
  return outcome;
}

proto::StructuredOutcome Pipeline::Report(
    const proto::ExecutionResult& result) {
  proto::StructuredOutcome outcome = reporter::Report(result);
  if (!options_.store_directory.empty()) {
    try {
      reporter::PersistOutputs(result, options_.store_directory);
    } catch (const std::system_error& exc) {
      LOG(ERROR) << "Could not store the output of " << result.submission_id()
                 << ": " << exc.what();
      outcome.set_stdout_ref("");
      outcome.set_stderr_ref("");
    }
  }
  LOG(INFO) << result.submission_id() << ": "
            << proto::Status_Name(outcome.status()) << " (" << outcome.message()
            << ")";
  return outcome;
}

}  // namespace core
