#include "cli/commands.hpp"

#include <stdlib.h>

#include <iostream>
#include <unordered_set>

#include "builder/image_builder.hpp"
#include "builder/resolver.hpp"
#include "core/core.hpp"
#include "glog/logging.h"
#include "google/protobuf/text_format.h"
#include "harness/gpu_pool.hpp"
#include "harness/harness.hpp"
#include "manifest/challenge_registry.hpp"
#include "reporter/reporter.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"

namespace {
static const constexpr char* kLatestImage = "latest_image";

std::string LatestImagePath() {
  return util::File::JoinPath(FLAGS_store_directory, kLatestImage);
}

int Print(const proto::StructuredOutcome& outcome) {
  std::cout << reporter::ToJson(outcome) << std::endl;
  return reporter::ExitCodeFor(outcome.status());
}
}  // namespace

namespace cli {

std::unique_ptr<Services> Services::FromFlags() {
  std::unique_ptr<Services> services(new Services);
  services->runtime_ =
      executor::Runtime::Create(FLAGS_runtime, FLAGS_store_directory);

  std::shared_ptr<const manifest::ChallengeRegistry> registry;
  if (FLAGS_challenges.empty()) {
    registry = manifest::StaticChallengeRegistry::Default();
  } else {
    registry = manifest::StaticChallengeRegistry::Load(FLAGS_challenges);
  }

  std::shared_ptr<const builder::DependencyResolver> resolver;
  if (FLAGS_package_index.empty()) {
    LOG(INFO) << "No package index given, only exact pins will resolve";
    resolver = std::make_shared<builder::PinResolver>();
  } else {
    resolver = builder::IndexResolver::Load(FLAGS_package_index);
  }

  services->cache_ =
      std::make_shared<builder::LayerCache>(FLAGS_store_directory);
  services->cache_->Setup();

  builder::BuilderOptions builder_options;
  builder_options.cpu_base_image = FLAGS_cpu_base_image;
  builder_options.gpu_base_image = FLAGS_gpu_base_image;
  builder_options.temp_directory = FLAGS_temp_directory;
  builder_options.build_time_limit = FLAGS_build_time_limit;
  auto builder = std::make_shared<builder::ImageBuilder>(
      services->runtime_, resolver, services->cache_, builder_options);

  harness::HarnessOptions harness_options;
  harness_options.temp_directory = FLAGS_temp_directory;
  harness_options.max_output_bytes =
      static_cast<int64_t>(FLAGS_max_output_kb) * 1024;
  harness_options.env = ForwardedEnv(FLAGS_forward_env);
  auto harness = std::make_shared<harness::Harness>(
      services->runtime_, harness::GpuPool::FromFlag(FLAGS_gpus),
      harness_options);

  core::PipelineOptions options;
  options.limits = LimitsFromFlags();
  options.store_directory = FLAGS_store_directory;
  options.keep_images = FLAGS_keep_images;
  services->pipeline_ = std::make_shared<core::Pipeline>(
      registry, services->runtime_, builder, harness, options);
  return services;
}

Services::~Services() {
  if (cache_ == nullptr) return;
  try {
    cache_->TearDown();
  } catch (const std::system_error& exc) {
    LOG(ERROR) << "Could not save the layer cache: " << exc.what();
  }
}

std::vector<std::string> ForwardedEnv(const std::string& names) {
  std::vector<std::string> env;
  for (const std::string& item : util::split(names, ',')) {
    std::string name = util::Trim(item);
    const char* value = getenv(name.c_str());
    if (value == nullptr) {
      VLOG(1) << name << " is not set, not forwarding it";
      continue;
    }
    env.push_back(name + "=" + value);
  }
  return env;
}

proto::ResourceLimits LimitsFromFlags() {
  proto::ResourceLimits limits;
  limits.set_wall_time(FLAGS_time_limit);
  limits.set_memory(FLAGS_memory_limit);
  return limits;
}

std::string SubmissionId(const std::string& dir) {
  char* resolved = realpath(dir.c_str(), nullptr);
  if (resolved == nullptr) return util::SanitizeName(dir);
  std::string path(resolved);
  free(resolved);  // NOLINT
  return util::SanitizeName(util::File::BaseName(path));
}

int Build(const std::string& dir) {
  std::unique_ptr<Services> services = Services::FromFlags();
  proto::ExecutionResult result;
  absl::optional<proto::ImageHandle> handle = services->Pipeline()->Build(
      core::Submission{SubmissionId(dir), dir}, nullptr, &result);
  if (!handle) return Print(services->Pipeline()->Report(result));

  std::string text;
  if (!google::protobuf::TextFormat::PrintToString(*handle, &text)) {
    throw std::runtime_error("Cannot serialize image handle");
  }
  util::File::Write(LatestImagePath(), text, /*overwrite=*/true);
  std::cout << handle->id() << std::endl;
  return reporter::ExitCodeFor(proto::SUCCESS);
}

int Run(bool gpu) {
  if (!util::File::Exists(LatestImagePath())) {
    LOG(ERROR) << "No image was built yet, run the build command first";
    return reporter::ExitCodeFor(proto::INTERNAL_ERROR);
  }
  proto::ImageHandle handle;
  if (!google::protobuf::TextFormat::ParseFromString(
          util::File::ReadAll(LatestImagePath()), &handle)) {
    throw std::runtime_error("Corrupted image handle " + LatestImagePath());
  }
  std::unique_ptr<Services> services = Services::FromFlags();
  return Print(services->Pipeline()->Run(handle, gpu, nullptr));
}

int Evaluate(const std::vector<std::string>& dirs) {
  std::unique_ptr<Services> services = Services::FromFlags();
  core::Core scheduler(services->SharedPipeline(), FLAGS_max_parallel);
  std::unordered_set<std::string> ids;
  for (const std::string& dir : dirs) {
    std::string id = SubmissionId(dir);
    for (int i = 2; ids.count(id) != 0u; i++) {
      id = SubmissionId(dir) + "-" + std::to_string(i);
    }
    ids.insert(id);
    scheduler.Submit(core::Submission{id, dir});
  }
  int exit_code = 0;
  scheduler.Run([&exit_code](const proto::StructuredOutcome& outcome) {
    int code = Print(outcome);
    if (exit_code == 0) exit_code = code;
    return true;
  });
  return exit_code;
}

}  // namespace cli
