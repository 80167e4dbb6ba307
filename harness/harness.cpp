#include "harness/harness.hpp"

#include "glog/logging.h"
#include "util/file.hpp"

namespace {
static const constexpr char* kStdoutFile = "stdout";
static const constexpr char* kStderrFile = "stderr";

std::string Tail(const std::string& path, int64_t max_bytes, bool* truncated) {
  *truncated = false;
  if (!util::File::Exists(path)) return "";
  return util::File::ReadTail(path, max_bytes, truncated);
}
}  // namespace

namespace harness {

void Classify(const executor::RunInfo& info, proto::ExecutionResult* result) {
  result->set_wall_time(info.wall_time_millis / 1000.0);
  result->set_cpu_time((info.cpu_time_millis + info.sys_time_millis) / 1000.0);
  result->set_memory(info.memory_usage_kb);
  if (info.cancelled) {
    result->set_status(proto::CANCELLED);
    result->set_error_message("Execution cancelled");
  } else if (info.timed_out) {
    result->set_status(proto::TIMEOUT);
    result->set_error_message("Wall-clock limit exceeded");
    result->set_signal(info.signal);
  } else if (info.signal != 0) {
    result->set_status(proto::RUNTIME_FAILURE);
    result->set_signal(info.signal);
    result->set_exit_code(128 + info.signal);
    result->set_error_message(info.message);
  } else if (info.status_code != 0) {
    result->set_status(proto::RUNTIME_FAILURE);
    result->set_exit_code(info.status_code);
    result->set_error_message("Exited with status " +
                              std::to_string(info.status_code));
  } else {
    result->set_status(proto::SUCCESS);
  }
}

proto::ExecutionResult Harness::Run(const proto::ImageHandle& handle,
                                    bool requires_gpu,
                                    const proto::ResourceLimits& limits,
                                    const std::atomic<bool>* cancelled) {
  proto::ExecutionResult result;
  result.set_submission_id(handle.submission_id());
  try {
    Execute(handle, requires_gpu, limits, cancelled, &result);
  } catch (const executor::cancelled& exc) {
    result.set_status(proto::CANCELLED);
    result.set_error_message(exc.what());
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Running " << handle.id() << " failed: " << exc.what();
    result.set_status(proto::INTERNAL_ERROR);
    result.set_error_message(exc.what());
  }
  return result;
}

void Harness::Execute(const proto::ImageHandle& handle, bool requires_gpu,
                      const proto::ResourceLimits& limits,
                      const std::atomic<bool>* cancelled,
                      proto::ExecutionResult* result) {
  if (cancelled != nullptr && *cancelled) {
    throw executor::cancelled("Execution cancelled");
  }
  // Destruction order matters: the context goes first, then the scratch
  // directory, then the GPU.
  absl::optional<GpuPool::Lease> gpu;
  if (requires_gpu) {
    if (gpus_ != nullptr) gpu = gpus_->TryAcquire();
    if (!gpu) {
      LOG(WARNING) << "No free GPU for " << handle.id();
      result->set_status(proto::RESOURCE_UNAVAILABLE);
      result->set_error_message("No GPU device available");
      return;
    }
  }
  util::TempDir scratch(options_.temp_directory);
  std::unique_ptr<executor::Context> context =
      runtime_->CreateContext(handle.id(), scratch.Path());

  executor::RunOptions options;
  options.limits = limits;
  options.env = options_.env;
  options.gpu_device = gpu ? gpu->Device() : -1;
  options.stdout_file = util::File::JoinPath(scratch.Path(), kStdoutFile);
  options.stderr_file = util::File::JoinPath(scratch.Path(), kStderrFile);
  options.max_output_bytes = options_.max_output_bytes;
  options.cancelled = cancelled;

  LOG(INFO) << "Running " << handle.id()
            << (gpu ? " on GPU " + std::to_string(gpu->Device()) : "");
  executor::RunInfo info;
  std::string error_msg;
  if (!context->Run(options, &info, &error_msg)) {
    throw std::runtime_error("Could not start the entrypoint: " + error_msg);
  }
  Classify(info, result);

  // Runtimes that honor max_output_bytes already dropped the oldest output.
  bool truncated = false;
  result->set_stdout_tail(
      Tail(options.stdout_file, options_.max_output_bytes, &truncated));
  result->set_stdout_truncated(truncated || info.stdout_truncated);
  result->set_stderr_tail(
      Tail(options.stderr_file, options_.max_output_bytes, &truncated));
  result->set_stderr_truncated(truncated || info.stderr_truncated);
  LOG(INFO) << "Run of " << handle.id() << " finished: "
            << proto::Status_Name(result->status()) << " in "
            << result->wall_time() << "s";
}

}  // namespace harness
