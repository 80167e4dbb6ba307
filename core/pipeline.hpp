#ifndef CORE_PIPELINE_HPP
#define CORE_PIPELINE_HPP
#include <atomic>
#include <memory>
#include <string>

#include "absl/types/optional.h"
#include "builder/image_builder.hpp"
#include "executor/runtime.hpp"
#include "harness/harness.hpp"
#include "manifest/challenge_registry.hpp"
#include "proto/execution.pb.h"
#include "proto/image.pb.h"

namespace core {

struct Submission {
  // Correlates the outcome with the request that triggered it.
  std::string id;
  std::string directory;
};

struct PipelineOptions {
  proto::ResourceLimits limits;
  // Where captured outputs are persisted. Empty to skip persistence.
  std::string store_directory;
  bool keep_images = false;
};

// Validate, build, run and report, for one submission at a time. Evaluate
// may be called concurrently for different submissions.
class Pipeline {
 public:
  Pipeline(std::shared_ptr<const manifest::ChallengeRegistry> registry,
           std::shared_ptr<executor::Runtime> runtime,
           std::shared_ptr<builder::ImageBuilder> builder,
           std::shared_ptr<harness::Harness> harness, PipelineOptions options)
      : registry_(std::move(registry)),
        runtime_(std::move(runtime)),
        builder_(std::move(builder)),
        harness_(std::move(harness)),
        options_(std::move(options)) {}

  // Always returns exactly one outcome. The image is removed afterwards
  // unless keep_images is set.
  proto::StructuredOutcome Evaluate(const Submission& submission,
                                    const std::atomic<bool>* cancelled);

  // Validates and builds the image of submission. On failure, returns
  // nothing and fills the status of result.
  absl::optional<proto::ImageHandle> Build(const Submission& submission,
                                           const std::atomic<bool>* cancelled,
                                           proto::ExecutionResult* result);

  // Runs a built image and reports its outcome.
  proto::StructuredOutcome Run(const proto::ImageHandle& handle,
                               bool requires_gpu,
                               const std::atomic<bool>* cancelled);

  // Reports result, storing its outputs if a store is configured.
  proto::StructuredOutcome Report(const proto::ExecutionResult& result);

  ~Pipeline() = default;
  Pipeline(const Pipeline&) = delete;
  Pipeline& operator=(const Pipeline&) = delete;
  Pipeline(Pipeline&&) = delete;
  Pipeline& operator=(Pipeline&&) = delete;

 private:
  proto::ImageHandle BuildImage(const Submission& submission,
                                const std::atomic<bool>* cancelled);

  std::shared_ptr<const manifest::ChallengeRegistry> registry_;
  std::shared_ptr<executor::Runtime> runtime_;
  std::shared_ptr<builder::ImageBuilder> builder_;
  std::shared_ptr<harness::Harness> harness_;
  PipelineOptions options_;
};

}  // namespace core

#endif
