#include "executor/local_runtime.hpp"

#include <ctype.h>
#include <unistd.h>

#include <algorithm>

#include "glog/logging.h"
#include "util/file.hpp"

namespace {
bool IsIllegalChar(char c) {
  return !isalnum(c) && c != '.' && c != '-' && c != '_';
}

const char* const kDefaultPath =
    "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

void CheckCancelled(const std::atomic<bool>* cancelled) {
  if (cancelled != nullptr && *cancelled)
    throw executor::cancelled("Build cancelled");
}

bool HasVar(const std::vector<std::string>& env, const std::string& var) {
  std::string name = var.substr(0, var.find('=') + 1);
  return std::any_of(env.begin(), env.end(), [&name](const std::string& v) {
    return v.compare(0, name.size(), name) == 0;
  });
}

class LocalContext : public executor::Context {
 public:
  LocalContext(const std::string& image_dir, const std::string& scratch_dir,
               proto::ImageConfig config)
      : home_(util::File::JoinPath(scratch_dir, "home")),
        config_(std::move(config)) {
    util::File::CopyTree(util::File::Rooted(image_dir, config_.workdir()),
                         home_);
    if (geteuid() == 0) {
      util::File::ShareTree(scratch_dir, config_.uid(), config_.gid());
    } else {
      util::File::ShareTree(scratch_dir);
    }
    VLOG(1) << "Created context in " << home_;
  }

  ~LocalContext() override {
    try {
      util::File::RemoveTree(home_);
    } catch (const std::system_error& exc) {
      LOG(WARNING) << "Could not tear down " << home_ << ": " << exc.what();
    }
  }

  bool Run(const executor::RunOptions& options, executor::RunInfo* info,
           std::string* error_msg) override {
    const std::string& workdir = config_.workdir();
    const std::string& entrypoint = config_.entrypoint();
    if (entrypoint.compare(0, workdir.size(), workdir) != 0) {
      *error_msg = "Entrypoint " + entrypoint + " is outside of " + workdir;
      return false;
    }
    sandbox::ExecutionOptions exec_options(
        home_, util::File::Rooted(home_, entrypoint.substr(workdir.size())));
    executor::ApplyLimits(options.limits, &exec_options);
    exec_options.stdout_file = options.stdout_file;
    exec_options.stderr_file = options.stderr_file;
    exec_options.max_output_bytes = options.max_output_bytes;
    exec_options.cancelled = options.cancelled;

    exec_options.env.push_back("HOME=" + home_);
    exec_options.env.push_back("USER=" + config_.user());
    exec_options.env.push_back(
        "CUDA_VISIBLE_DEVICES=" +
        (options.gpu_device >= 0 ? std::to_string(options.gpu_device) : ""));
    for (const std::string& var : config_.env()) {
      if (!HasVar(exec_options.env, var)) exec_options.env.push_back(var);
    }
    for (const std::string& var : options.env) {
      if (!HasVar(exec_options.env, var)) exec_options.env.push_back(var);
    }

    if (geteuid() == 0) {
      if (config_.uid() == 0 || config_.gid() == 0) {
        *error_msg = "Refusing to run the image as root";
        return false;
      }
      exec_options.uid = config_.uid();
      exec_options.gid = config_.gid();
    }

    std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
    if (!sb) {
      *error_msg = "No sandbox available";
      return false;
    }
    if (!sb->PrepareForExecution(exec_options.executable, error_msg))
      return false;
    return sb->Execute(exec_options, info, error_msg);
  }

 private:
  std::string home_;
  proto::ImageConfig config_;
};
}  // namespace

namespace executor {

LocalRuntime::LocalRuntime(std::string store_directory)
    : store_directory_(std::move(store_directory)) {
  util::File::MakeDirs(util::File::JoinPath(store_directory_, kImagesDir));
}

std::string LocalRuntime::ImageDir(const std::string& image_id) const {
  if (image_id.empty() ||
      std::find_if(image_id.begin(), image_id.end(), IsIllegalChar) !=
          image_id.end()) {
    throw std::invalid_argument("Invalid image id: " + image_id);
  }
  return util::File::JoinPath(
      util::File::JoinPath(store_directory_, kImagesDir), image_id);
}

void LocalRuntime::Build(const BuildContext& context,
                         const std::atomic<bool>* cancelled) {
  std::string dir = ImageDir(context.image_id);
  if (util::File::Exists(dir)) {
    throw std::runtime_error("Image " + context.image_id + " already exists");
  }
  CheckCancelled(cancelled);
  try {
    std::string root = util::File::JoinPath(dir, kRootDir);
    util::File::CopyTree(
        util::File::JoinPath(context.context_dir, kContextHome),
        util::File::Rooted(root, context.workdir));
    CheckCancelled(cancelled);
    util::File::DeepCopy(
        util::File::JoinPath(context.context_dir, kContextLockFile),
        util::File::Rooted(root, kImageLockFile));

    proto::ImageConfig config;
    config.set_user(context.user);
    config.set_uid(context.uid);
    config.set_gid(context.gid);
    config.set_entrypoint(context.entrypoint);
    config.set_workdir(context.workdir);
    *config.mutable_environment() = context.environment;
    config.set_gpu(context.gpu);
    config.add_env(std::string("PATH=") + kDefaultPath);
    config.add_env("HOME=" + context.workdir);
    util::File::Write(util::File::JoinPath(dir, kConfigFile),
                      config.SerializeAsString());
  } catch (const std::exception& exc) {
    LOG(ERROR) << "Building " << context.image_id << " failed: " << exc.what();
    Remove(context.image_id);
    throw;
  }
  LOG(INFO) << "Built image " << context.image_id << " in " << dir;
}

proto::ImageConfig LocalRuntime::Inspect(const std::string& image_id) {
  std::string path =
      util::File::JoinPath(ImageDir(image_id), std::string(kConfigFile));
  proto::ImageConfig config;
  if (!config.ParseFromString(util::File::ReadAll(path))) {
    throw std::runtime_error("Corrupted image configuration: " + path);
  }
  return config;
}

std::unique_ptr<Context> LocalRuntime::CreateContext(
    const std::string& image_id, const std::string& scratch_dir) {
  proto::ImageConfig config = Inspect(image_id);
  return std::unique_ptr<Context>(new LocalContext(
      util::File::JoinPath(ImageDir(image_id), kRootDir), scratch_dir,
      std::move(config)));
}

void LocalRuntime::Remove(const std::string& image_id) {
  std::string dir = ImageDir(image_id);
  if (!util::File::Exists(dir)) return;
  util::File::RemoveTree(dir);
  VLOG(1) << "Removed image " << image_id;
}

}  // namespace executor
