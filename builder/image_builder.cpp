#include "builder/image_builder.hpp"

#include <string.h>
#include <unistd.h>

#include <chrono>

#include "builder/build_spec.hpp"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/sha256.hpp"

namespace {

static const constexpr size_t kMaxIdPrefix = 40;

void CheckCancelled(const std::atomic<bool>* cancelled) {
  if (cancelled != nullptr && *cancelled)
    throw executor::cancelled("Build cancelled");
}

void CheckPrivileges(const std::string& user, int32_t uid, int32_t gid) {
  if (user.empty() || user == "root" || uid <= 0 || gid <= 0) {
    throw builder::privilege_violation(
        "images must run as an unprivileged user, not " +
        (user.empty() ? std::string("root") : user) + " (" +
        std::to_string(uid) + ":" + std::to_string(gid) + ")");
  }
}

}  // namespace

namespace builder {

proto::ResolvedEnvironment ImageBuilder::Resolve(
    const proto::BuildSpec& spec) {
  const std::string& base_image = spec.manifest().gpu()
                                      ? options_.gpu_base_image
                                      : options_.cpu_base_image;
  const std::string key = LayerCache::Key(base_image, spec.runtime());
  proto::ResolvedEnvironment environment;
  if (cache_->Get(key, &environment)) {
    VLOG(1) << "Layer cache hit for " << spec.submission_id();
    return environment;
  }
  environment = resolver_->ResolveAll(spec.runtime(), base_image);
  cache_->Put(key, environment);
  return environment;
}

std::string ImageBuilder::LockFile(
    const proto::ResolvedEnvironment& environment) {
  std::string lock = "# base: " + environment.base_image() + "\n";
  for (const proto::ResolvedDependency& dep : environment.dependency()) {
    lock += dep.channel() + "::" + dep.name() + "==" + dep.version() + "\n";
  }
  return lock;
}

std::string ImageBuilder::Digest(const proto::BuildSpec& spec,
                                 const proto::ResolvedEnvironment& environment,
                                 const std::string& home_dir) {
  util::SHA256 hasher;
  auto add = [&hasher](const std::string& field) {
    hasher.update(std::to_string(field.size()) + ":");
    hasher.update(field);
  };
  add(environment.base_image());
  for (const proto::ResolvedDependency& dep : environment.dependency()) {
    add(dep.name());
    add(dep.version());
    add(dep.channel());
  }
  add(spec.user());
  add(std::to_string(spec.uid()) + ":" + std::to_string(spec.gid()));
  add(spec.entrypoint());
  for (const std::string& file : util::File::ListFiles(home_dir)) {
    add(file);
    add(util::File::Hash(util::File::JoinPath(home_dir, file)).Hex());
  }
  util::SHA256_t digest;
  hasher.finalize(&digest);
  return digest.Hex();
}

std::string ImageBuilder::ImageId(const proto::BuildSpec& spec,
                                  const std::string& digest,
                                  int64_t timestamp) {
  static std::atomic<int64_t> counter{0};
  std::string prefix = util::SanitizeName(spec.submission_id());
  if (prefix.size() > kMaxIdPrefix) prefix.resize(kMaxIdPrefix);
  return "aicrowd-" + prefix + "-" + digest.substr(0, 12) + "-" +
         std::to_string(timestamp) + "-" + std::to_string(getpid()) + "-" +
         std::to_string(counter++);
}

void ImageBuilder::Verify(const proto::BuildSpec& spec,
                          const std::string& image_id) {
  proto::ImageConfig config = runtime_->Inspect(image_id);
  if (config.user() != spec.user() || config.uid() != spec.uid() ||
      config.gid() != spec.gid() || config.uid() == 0) {
    throw privilege_violation(
        "image " + image_id + " runs as " +
        (config.user().empty() ? "root" : config.user()) + " (" +
        std::to_string(config.uid()) + ")");
  }
}

void ImageBuilder::Discard(const std::string& image_id) {
  try {
    runtime_->Remove(image_id);
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Could not remove image " << image_id << ": "
                 << exc.what();
  }
}

proto::ImageHandle ImageBuilder::Build(const proto::BuildSpec& spec,
                                       const std::atomic<bool>* cancelled) {
  CheckPrivileges(spec.user(), spec.uid(), spec.gid());
  CheckCancelled(cancelled);
  LOG(INFO) << "Building " << spec.submission_id() << " with "
            << spec.runtime().dependency_size() << " dependencies";

  proto::ResolvedEnvironment environment = Resolve(spec);
  CheckCancelled(cancelled);

  util::TempDir context(options_.temp_directory);
  const std::string home =
      util::File::JoinPath(context.Path(), executor::kContextHome);
  util::File::CopyTree(spec.submission_dir(), home, {".git"});

  if (spec.entrypoint().compare(0, strlen(kHomeDir), kHomeDir) != 0) {
    throw entrypoint_missing(spec.entrypoint() + " is not below " + kHomeDir);
  }
  const std::string entrypoint =
      util::File::Rooted(home, spec.entrypoint().substr(strlen(kHomeDir)));
  if (!util::File::Exists(entrypoint)) {
    throw entrypoint_missing(spec.entrypoint());
  }
  util::File::MakeExecutable(entrypoint);
  util::File::Write(
      util::File::JoinPath(context.Path(), executor::kContextLockFile),
      LockFile(environment), /*overwrite=*/true);

  const std::string digest = Digest(spec, environment, home);
  const int64_t timestamp =
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count();

  executor::BuildContext build;
  build.image_id = ImageId(spec, digest, timestamp);
  build.context_dir = context.Path();
  build.base_image = environment.base_image();
  build.environment = environment;
  build.user = spec.user();
  build.uid = spec.uid();
  build.gid = spec.gid();
  build.entrypoint = spec.entrypoint();
  build.workdir = kHomeDir;
  build.gpu = spec.manifest().gpu();
  build.time_limit = options_.build_time_limit;
  CheckCancelled(cancelled);
  try {
    runtime_->Build(build, cancelled);
  } catch (const executor::build_failed& exc) {
    throw image_build_failed(exc.what());
  }

  try {
    Verify(spec, build.image_id);
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Removing image " << build.image_id << ": " << exc.what();
    Discard(build.image_id);
    throw;
  }

  proto::ImageHandle handle;
  handle.set_id(build.image_id);
  handle.set_build_timestamp(timestamp);
  handle.set_digest(digest);
  handle.set_runtime(runtime_->Id());
  handle.set_submission_id(spec.submission_id());
  handle.set_requires_gpu(spec.manifest().gpu());
  LOG(INFO) << "Built " << handle.id() << " (digest " << digest << ")";
  return handle;
}

}  // namespace builder
