#ifndef BUILDER_IMAGE_BUILDER_HPP
#define BUILDER_IMAGE_BUILDER_HPP
#include <atomic>
#include <memory>
#include <string>

#include "builder/errors.hpp"
#include "builder/layer_cache.hpp"
#include "builder/resolver.hpp"
#include "executor/runtime.hpp"
#include "proto/image.pb.h"
#include "proto/submission.pb.h"

namespace builder {

struct BuilderOptions {
  std::string cpu_base_image;
  std::string gpu_base_image;
  // Where build contexts are assembled.
  std::string temp_directory;
  // Wall-clock limit for the runtime build, in seconds. Zero means no limit.
  double build_time_limit = 0;
};

// Turns a BuildSpec into an image of the runtime. Build attempts are never
// retried: every failure is reported as a build_error subclass, or as
// executor::cancelled.
class ImageBuilder {
 public:
  ImageBuilder(std::shared_ptr<executor::Runtime> runtime,
               std::shared_ptr<const DependencyResolver> resolver,
               std::shared_ptr<LayerCache> cache, BuilderOptions options)
      : runtime_(std::move(runtime)),
        resolver_(std::move(resolver)),
        cache_(std::move(cache)),
        options_(std::move(options)) {}

  proto::ImageHandle Build(const proto::BuildSpec& spec,
                           const std::atomic<bool>* cancelled = nullptr);

  // Resolved environment of spec, from the cache when possible.
  proto::ResolvedEnvironment Resolve(const proto::BuildSpec& spec);

  // Content digest of an image: depends on the resolved environment, on the
  // user and entrypoint of spec and on the files below home_dir, but not on
  // time or on the state of the cache.
  static std::string Digest(const proto::BuildSpec& spec,
                            const proto::ResolvedEnvironment& environment,
                            const std::string& home_dir);

  // Contents of the lock file baked into the image.
  static std::string LockFile(const proto::ResolvedEnvironment& environment);

  ~ImageBuilder() = default;
  ImageBuilder(const ImageBuilder&) = delete;
  ImageBuilder& operator=(const ImageBuilder&) = delete;
  ImageBuilder(ImageBuilder&&) = delete;
  ImageBuilder& operator=(ImageBuilder&&) = delete;

 private:
  std::string ImageId(const proto::BuildSpec& spec, const std::string& digest,
                      int64_t timestamp);

  // Checks that the built image runs as the user of spec.
  void Verify(const proto::BuildSpec& spec, const std::string& image_id);

  // Removes image_id, logging failures.
  void Discard(const std::string& image_id);

  std::shared_ptr<executor::Runtime> runtime_;
  std::shared_ptr<const DependencyResolver> resolver_;
  std::shared_ptr<LayerCache> cache_;
  BuilderOptions options_;
};

}  // namespace builder

#endif
