#ifndef HARNESS_HARNESS_HPP
#define HARNESS_HARNESS_HPP
#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "executor/runtime.hpp"
#include "harness/gpu_pool.hpp"
#include "proto/execution.pb.h"
#include "proto/image.pb.h"

namespace harness {

struct HarnessOptions {
  // Where execution contexts are created. Must be traversable by the image
  // user when the harness runs as root.
  std::string temp_directory;
  // Amount of stdout and of stderr kept for each run.
  int64_t max_output_bytes = 1024 * 1024;
  // Variables passed to every entrypoint, as NAME=value.
  std::vector<std::string> env;
};

// Runs built images, once per call, in a fresh execution context.
class Harness {
 public:
  Harness(std::shared_ptr<executor::Runtime> runtime,
          std::shared_ptr<GpuPool> gpus, HarnessOptions options)
      : runtime_(std::move(runtime)),
        gpus_(std::move(gpus)),
        options_(std::move(options)) {}

  // Executes the entrypoint of handle. Never throws: every failure is
  // reported through the status of the result. The context is torn down,
  // and then the GPU released, before returning.
  proto::ExecutionResult Run(const proto::ImageHandle& handle,
                             bool requires_gpu,
                             const proto::ResourceLimits& limits,
                             const std::atomic<bool>* cancelled = nullptr);

  ~Harness() = default;
  Harness(const Harness&) = delete;
  Harness& operator=(const Harness&) = delete;
  Harness(Harness&&) = delete;
  Harness& operator=(Harness&&) = delete;

 private:
  void Execute(const proto::ImageHandle& handle, bool requires_gpu,
               const proto::ResourceLimits& limits,
               const std::atomic<bool>* cancelled,
               proto::ExecutionResult* result);

  std::shared_ptr<executor::Runtime> runtime_;
  std::shared_ptr<GpuPool> gpus_;
  HarnessOptions options_;
};

// Maps the outcome of a process to a result status, exit code and signal.
void Classify(const executor::RunInfo& info, proto::ExecutionResult* result);

}  // namespace harness

#endif
