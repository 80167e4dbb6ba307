#include "executor/runtime.hpp"

#include <stdexcept>
#include <tuple>

#include "executor/docker_runtime.hpp"
#include "executor/local_runtime.hpp"
#include "glog/logging.h"

namespace executor {

namespace {
using entry_t = std::tuple<std::string, Runtime::create_t, Runtime::score_t>;

const std::vector<entry_t>& Runtimes() {
  static const std::vector<entry_t> runtimes = {
      entry_t{"local", &LocalRuntime::Create, &LocalRuntime::Score},
      entry_t{"docker", &DockerRuntime::Create, &DockerRuntime::Score},
  };
  return runtimes;
}
}  // namespace

std::unique_ptr<Runtime> Runtime::Create(const std::string& name,
                                         const std::string& store_directory) {
  const entry_t* best = nullptr;
  int best_score = 0;
  for (const entry_t& entry : Runtimes()) {
    int score = std::get<2>(entry)();
    if (!name.empty()) {
      if (std::get<0>(entry) != name) continue;
      if (score < 0)
        throw std::invalid_argument("Runtime " + name + " is not available");
      best = &entry;
      break;
    }
    if (score > best_score) {
      best_score = score;
      best = &entry;
    }
  }
  if (best == nullptr) {
    throw std::invalid_argument(
        name.empty() ? "No runtime available" : "Unknown runtime " + name);
  }
  LOG(INFO) << "Using the " << std::get<0>(*best) << " runtime";
  return std::unique_ptr<Runtime>(std::get<1>(*best)(store_directory));
}

void ApplyLimits(const proto::ResourceLimits& limits,
                 sandbox::ExecutionOptions* options) {
  options->wall_limit_millis = limits.wall_time() * 1000;
  options->cpu_limit_millis = limits.cpu_time() * 1000;
  options->memory_limit_kb = limits.memory();
  options->max_procs = limits.processes();
  options->max_files = limits.nfiles();
  options->max_file_size_kb = limits.fsize();
}

}  // namespace executor
