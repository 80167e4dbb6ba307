#include "executor/docker_runtime.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <sstream>

#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "glog/logging.h"
#include "util/file.hpp"
#include "util/misc.hpp"
#include "util/which.hpp"

namespace {

static const constexpr int64_t kMaxCommandOutput = 64 * 1024;

struct CommandResult {
  executor::RunInfo info;
  std::string out;
  std::string err;

  bool Ok() const {
    return info.status_code == 0 && info.signal == 0 && !info.timed_out &&
           !info.cancelled;
  }
};

// Runs a command with the environment of the current process, capturing the
// end of its output.
CommandResult RunCommand(const std::string& executable,
                         const std::vector<std::string>& args,
                         const std::string& temp_base,
                         const std::atomic<bool>* cancelled,
                         double time_limit = 0) {
  util::TempDir tmp(temp_base);
  sandbox::ExecutionOptions options(tmp.Path(), executable);
  options.args = args;
  options.stdout_file = util::File::JoinPath(tmp.Path(), "stdout");
  options.stderr_file = util::File::JoinPath(tmp.Path(), "stderr");
  options.max_output_bytes = kMaxCommandOutput;
  options.wall_limit_millis = time_limit * 1000;
  options.cancelled = cancelled;
  std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
  if (!sb) throw std::runtime_error("No sandbox available");
  VLOG(1) << executable << " " << absl::StrJoin(args, " ");
  CommandResult result;
  std::string error_msg;
  if (!sb->Execute(options, &result.info, &error_msg)) {
    throw std::runtime_error(executable + ": " + error_msg);
  }
  bool truncated = false;
  result.out =
      util::File::ReadTail(options.stdout_file, kMaxCommandOutput, &truncated);
  result.err =
      util::File::ReadTail(options.stderr_file, kMaxCommandOutput, &truncated);
  return result;
}

std::string Quote(const std::string& s) {
  std::string quoted = "'";
  for (char c : s) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  return quoted + "'";
}

std::string PackageSpec(const proto::ResolvedDependency& dep, bool conda) {
  std::string spec = dep.name() + "==" + dep.version();
  if (conda && !dep.channel().empty()) spec = dep.channel() + "::" + spec;
  return Quote(spec);
}

class DockerContext : public executor::Context {
 public:
  DockerContext(std::string docker, std::string image_id,
                const std::string& scratch_dir, proto::ImageConfig config)
      : docker_(std::move(docker)),
        image_id_(std::move(image_id)),
        scratch_dir_(scratch_dir),
        config_(std::move(config)) {
    static std::atomic<int64_t> counter{0};
    name_ = "aicrowd-run-" + std::to_string(getpid()) + "-" +
            std::to_string(counter++) + "-" +
            util::SanitizeName(util::File::BaseName(scratch_dir));
  }

  ~DockerContext() override {
    if (!started_) return;
    try {
      CommandResult result =
          RunCommand(docker_, {"rm", "--force", name_}, scratch_dir_, nullptr);
      VLOG(1) << "Removed container " << name_ << ": " << result.err;
    } catch (const std::exception& exc) {
      LOG(WARNING) << "Could not remove container " << name_ << ": "
                   << exc.what();
    }
  }

  bool Run(const executor::RunOptions& options, executor::RunInfo* info,
           std::string* error_msg) override {
    if (config_.uid() <= 0 || config_.gid() <= 0) {
      *error_msg = "Refusing to run the image as root or an unknown user";
      return false;
    }
    sandbox::ExecutionOptions exec_options(scratch_dir_, docker_);
    exec_options.args =
        executor::DockerRuntime::RunArgs(image_id_, name_, config_, options);
    exec_options.wall_limit_millis = options.limits.wall_time() * 1000;
    exec_options.stdout_file = options.stdout_file;
    exec_options.stderr_file = options.stderr_file;
    exec_options.max_output_bytes = options.max_output_bytes;
    exec_options.cancelled = options.cancelled;
    std::unique_ptr<sandbox::Sandbox> sb = sandbox::Sandbox::Create();
    if (!sb) {
      *error_msg = "No sandbox available";
      return false;
    }
    started_ = true;
    return sb->Execute(exec_options, info, error_msg);
  }

 private:
  std::string docker_;
  std::string image_id_;
  std::string scratch_dir_;
  std::string name_;
  proto::ImageConfig config_;
  bool started_ = false;
};
}  // namespace

namespace executor {

DockerRuntime::DockerRuntime(std::string store_directory)
    : DockerRuntime(std::move(store_directory), util::which("docker")) {}

DockerRuntime::DockerRuntime(std::string store_directory, std::string docker)
    : docker_(std::move(docker)),
      store_directory_(std::move(store_directory)) {
  if (docker_.empty()) throw std::runtime_error("docker not found in PATH");
  util::File::MakeDirs(util::File::JoinPath(store_directory_, "tmp"));
}

void DockerRuntime::Discard(const std::string& image_id) {
  try {
    Remove(image_id);
  } catch (const std::exception& exc) {
    LOG(WARNING) << "Could not remove image " << image_id << ": "
                 << exc.what();
  }
}

int DockerRuntime::Score() { return util::which("docker").empty() ? -1 : 2; }

std::string DockerRuntime::Dockerfile(const BuildContext& context) {
  std::ostringstream out;
  const std::string owner =
      std::to_string(context.uid) + ":" + std::to_string(context.gid);
  out << "FROM " << context.base_image << "\n";
  out << "USER root\n";
  out << "RUN groupadd --gid " << context.gid << " " << context.user
      << " && useradd --create-home --uid " << context.uid << " --gid "
      << context.gid << " --shell /bin/bash " << context.user << "\n";

  std::vector<std::string> channels;
  std::vector<std::string> conda;
  std::vector<std::string> pip;
  for (const proto::ResolvedDependency& dep :
       context.environment.dependency()) {
    if (dep.channel() == "pypi") {
      pip.push_back(PackageSpec(dep, false));
      continue;
    }
    conda.push_back(PackageSpec(dep, true));
    if (!dep.channel().empty() &&
        std::find(channels.begin(), channels.end(), dep.channel()) ==
            channels.end()) {
      channels.push_back(dep.channel());
    }
  }
  if (!conda.empty()) {
    out << "RUN conda install --yes --override-channels";
    for (const std::string& channel : channels) out << " -c " << channel;
    out << " " << absl::StrJoin(conda, " ") << " && conda clean --all --yes\n";
  }
  if (!pip.empty()) {
    out << "RUN pip install --no-cache-dir " << absl::StrJoin(pip, " ")
        << "\n";
  }
  out << "COPY --chown=" << owner << " " << kContextLockFile << " "
      << kImageLockFile << "\n";
  out << "COPY --chown=" << owner << " " << kContextHome << "/ "
      << context.workdir << "/\n";
  out << "LABEL org.aicrowd.entrypoint=\"" << context.entrypoint
      << "\" org.aicrowd.uid=\"" << context.uid << "\" org.aicrowd.gid=\""
      << context.gid << "\"\n";
  out << "ENV HOME=" << context.workdir << " USER=" << context.user << "\n";
  out << "USER " << context.user << "\n";
  out << "WORKDIR " << context.workdir << "\n";
  out << "ENTRYPOINT [\"" << context.entrypoint << "\"]\n";
  return out.str();
}

std::vector<std::string> DockerRuntime::RunArgs(
    const std::string& image_id, const std::string& name,
    const proto::ImageConfig& config, const RunOptions& options) {
  std::vector<std::string> args = {
      "run",
      "--rm",
      "--name",
      name,
      "--user",
      std::to_string(config.uid()) + ":" + std::to_string(config.gid())};
  const proto::ResourceLimits& limits = options.limits;
  if (limits.memory()) {
    args.push_back("--memory");
    args.push_back(std::to_string(limits.memory()) + "k");
  }
  if (limits.processes()) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(limits.processes()));
  }
  if (limits.nfiles()) {
    args.push_back("--ulimit");
    args.push_back("nofile=" + std::to_string(limits.nfiles()) + ":" +
                   std::to_string(limits.nfiles()));
  }
  if (limits.cpu_time() > 0) {
    int64_t seconds = static_cast<int64_t>(limits.cpu_time() + 0.999);
    args.push_back("--ulimit");
    args.push_back("cpu=" + std::to_string(seconds) + ":" +
                   std::to_string(seconds));
  }
  if (limits.fsize()) {
    int64_t bytes = limits.fsize() * 1024;
    args.push_back("--ulimit");
    args.push_back("fsize=" + std::to_string(bytes) + ":" +
                   std::to_string(bytes));
  }
  if (options.gpu_device >= 0) {
    args.push_back("--gpus");
    args.push_back("device=" + std::to_string(options.gpu_device));
  } else {
    args.push_back("--env");
    args.push_back("CUDA_VISIBLE_DEVICES=");
  }
  for (const std::string& var : options.env) {
    args.push_back("--env");
    args.push_back(var);
  }
  args.push_back(image_id);
  return args;
}

proto::ImageConfig DockerRuntime::ParseInspect(const std::string& output) {
  std::vector<std::string> fields =
      absl::StrSplit(util::Trim(output), '|');
  if (fields.size() != 5) {
    throw std::runtime_error("Unexpected docker inspect output: " + output);
  }
  proto::ImageConfig config;
  config.set_workdir(fields[1]);
  config.set_entrypoint(fields[2]);
  const std::string& user = fields[0];
  int32_t uid = -1;
  int32_t gid = -1;
  if (user.empty() || user == "root" || user == "0") {
    config.set_user("root");
    uid = 0;
    gid = 0;
  } else {
    std::vector<std::string> ids = absl::StrSplit(user, ':');
    if (absl::SimpleAtoi(ids[0], &uid)) {
      if (ids.size() < 2 || !absl::SimpleAtoi(ids[1], &gid)) gid = uid;
    } else {
      config.set_user(ids[0]);
      if (!absl::SimpleAtoi(fields[3], &uid)) uid = -1;
      if (!absl::SimpleAtoi(fields[4], &gid)) gid = -1;
    }
  }
  config.set_uid(uid);
  config.set_gid(gid);
  return config;
}

void DockerRuntime::Build(const BuildContext& context,
                          const std::atomic<bool>* cancelled) {
  if (cancelled != nullptr && *cancelled)
    throw executor::cancelled("Build cancelled");
  std::string dockerfile =
      util::File::JoinPath(context.context_dir, "Dockerfile");
  util::File::Write(dockerfile, Dockerfile(context), /*overwrite=*/true);
  LOG(INFO) << "Building image " << context.image_id << " from "
            << context.base_image;
  CommandResult result = RunCommand(
      docker_,
      {"build", "--force-rm", "--tag", context.image_id, "--file", dockerfile,
       context.context_dir},
      util::File::JoinPath(store_directory_, "tmp"), cancelled,
      context.time_limit);
  if (result.info.cancelled) {
    Discard(context.image_id);
    throw executor::cancelled("Build cancelled");
  }
  if (result.info.timed_out) {
    Discard(context.image_id);
    throw build_failed("docker build did not finish within " +
                       std::to_string(context.time_limit) + " seconds");
  }
  if (!result.Ok()) {
    Discard(context.image_id);
    throw build_failed("docker build failed: " + util::Trim(result.err));
  }
}

proto::ImageConfig DockerRuntime::Inspect(const std::string& image_id) {
  CommandResult result = RunCommand(
      docker_, {"image", "inspect", "--format", kInspectFormat, image_id},
      util::File::JoinPath(store_directory_, "tmp"), nullptr);
  if (!result.Ok()) {
    throw std::runtime_error("docker image inspect failed: " +
                             util::Trim(result.err));
  }
  return ParseInspect(result.out);
}

std::unique_ptr<Context> DockerRuntime::CreateContext(
    const std::string& image_id, const std::string& scratch_dir) {
  proto::ImageConfig config = Inspect(image_id);
  return std::unique_ptr<Context>(
      new DockerContext(docker_, image_id, scratch_dir, std::move(config)));
}

void DockerRuntime::Remove(const std::string& image_id) {
  CommandResult result =
      RunCommand(docker_, {"rmi", "--force", image_id},
                 util::File::JoinPath(store_directory_, "tmp"), nullptr);
  if (!result.Ok() && result.err.find("No such image") == std::string::npos) {
    throw std::runtime_error("docker rmi failed: " + util::Trim(result.err));
  }
  VLOG(1) << "Removed image " << image_id;
}

}  // namespace executor
