#ifndef EXECUTOR_RUNTIME_HPP
#define EXECUTOR_RUNTIME_HPP
#include <atomic>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "proto/execution.pb.h"
#include "proto/image.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

// Thrown when an operation notices that its cancellation flag was set.
class cancelled : public std::runtime_error {
 public:
  explicit cancelled(const std::string& msg) : std::runtime_error(msg) {}
};

// Thrown when the image could not be built from a valid context, because a
// step of the build failed or took too long.
class build_failed : public std::runtime_error {
 public:
  explicit build_failed(const std::string& msg) : std::runtime_error(msg) {}
};

// Layout of a build context directory: the files that end up in the home of
// the image user are below kContextHome, the lock file sits next to it.
static const constexpr char* kContextHome = "home";
static const constexpr char* kContextLockFile = "environment.lock";
static const constexpr char* kImageLockFile = "/opt/environment.lock";

// Everything a runtime needs to materialize an image.
struct BuildContext {
  std::string image_id;
  std::string context_dir;
  std::string base_image;
  proto::ResolvedEnvironment environment;
  std::string user;
  int32_t uid = 0;
  int32_t gid = 0;
  std::string entrypoint;
  std::string workdir;
  bool gpu = false;
  // Wall-clock limit for the whole build, in seconds. Zero means no limit.
  double time_limit = 0;
};

struct RunOptions {
  proto::ResourceLimits limits;
  // Extra environment variables, as NAME=value.
  std::vector<std::string> env;
  // Device index to expose, negative for none.
  int32_t gpu_device = -1;
  std::string stdout_file;
  std::string stderr_file;
  // Only the last bytes of each stream are kept, if positive.
  int64_t max_output_bytes = 0;
  const std::atomic<bool>* cancelled = nullptr;
};

using RunInfo = sandbox::ExecutionInfo;

// An isolated execution context created from an image. Destroying the
// context tears down everything it created.
class Context {
 public:
  // Runs the image entrypoint once. Returns false and sets error_msg if the
  // entrypoint could not be started.
  virtual bool Run(const RunOptions& options, RunInfo* info,
                   std::string* error_msg) = 0;

  Context() = default;
  virtual ~Context() = default;
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;
  Context(Context&&) = delete;
  Context& operator=(Context&&) = delete;
};

// A container runtime. Implementations need to register themselves by adding
// an entry to the list in runtime.cpp, with the same Create/Score contract as
// sandbox::Sandbox.
class Runtime {
 public:
  using create_t = std::function<Runtime*(const std::string& store_directory)>;
  using score_t = std::function<int()>;

  // Creates the runtime called name, or the best available one if name is
  // empty. Throws std::invalid_argument for unknown or unusable names.
  static std::unique_ptr<Runtime> Create(const std::string& name,
                                         const std::string& store_directory);

  // A string that identifies this runtime.
  virtual std::string Id() const = 0;

  // Materializes an image called context.image_id. Throws build_failed if
  // the build itself fails or exceeds context.time_limit, executor::cancelled
  // if cancelled becomes true before completion, and other exceptions for
  // faults of the runtime.
  virtual void Build(const BuildContext& context,
                     const std::atomic<bool>* cancelled) = 0;

  // Reads back the configuration of a built image.
  virtual proto::ImageConfig Inspect(const std::string& image_id) = 0;

  // Creates a fresh execution context for the image below scratch_dir.
  virtual std::unique_ptr<Context> CreateContext(
      const std::string& image_id, const std::string& scratch_dir) = 0;

  // Deletes an image. Removing a missing image is not an error.
  virtual void Remove(const std::string& image_id) = 0;

  Runtime() = default;
  virtual ~Runtime() = default;
  Runtime(const Runtime&) = delete;
  Runtime& operator=(const Runtime&) = delete;
  Runtime(Runtime&&) = delete;
  Runtime& operator=(Runtime&&) = delete;
};

// Limits for the sandbox, from the ones of the request.
void ApplyLimits(const proto::ResourceLimits& limits,
                 sandbox::ExecutionOptions* options);

}  // namespace executor

#endif
