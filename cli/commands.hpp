#ifndef CLI_COMMANDS_HPP
#define CLI_COMMANDS_HPP
#include <memory>
#include <string>
#include <vector>

#include "builder/layer_cache.hpp"
#include "core/pipeline.hpp"
#include "executor/runtime.hpp"
#include "proto/execution.pb.h"

namespace cli {

// Long-lived resources shared by every command, built from the flags. The
// layer cache is saved when this is destroyed.
class Services {
 public:
  static std::unique_ptr<Services> FromFlags();

  core::Pipeline* Pipeline() const { return pipeline_.get(); }
  std::shared_ptr<core::Pipeline> SharedPipeline() const { return pipeline_; }

  ~Services();
  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;

 private:
  Services() = default;

  std::shared_ptr<executor::Runtime> runtime_;
  std::shared_ptr<builder::LayerCache> cache_;
  std::shared_ptr<core::Pipeline> pipeline_;
};

// NAME=value for each of the comma-separated names that is set in the
// environment of the harness.
std::vector<std::string> ForwardedEnv(const std::string& names);

// Resource limits of every run.
proto::ResourceLimits LimitsFromFlags();

// Identifier of the submission in dir.
std::string SubmissionId(const std::string& dir);

// Each command returns the process exit code.

// Validates and builds the submission in dir, and records the image as the
// latest one.
int Build(const std::string& dir);

// Runs the latest image.
int Run(bool gpu);

// Evaluates every directory in parallel, printing one outcome per line.
int Evaluate(const std::vector<std::string>& dirs);

}  // namespace cli

#endif
