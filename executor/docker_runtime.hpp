#ifndef EXECUTOR_DOCKER_RUNTIME_HPP
#define EXECUTOR_DOCKER_RUNTIME_HPP

#include "executor/runtime.hpp"

namespace executor {

// Runtime backed by the docker command line client.
class DockerRuntime : public Runtime {
 public:
  explicit DockerRuntime(std::string store_directory);
  // Uses the docker client at the given path.
  DockerRuntime(std::string store_directory, std::string docker);
  ~DockerRuntime() override = default;
  DockerRuntime(const DockerRuntime&) = delete;
  DockerRuntime& operator=(const DockerRuntime&) = delete;
  DockerRuntime(DockerRuntime&&) = delete;
  DockerRuntime& operator=(DockerRuntime&&) = delete;

  std::string Id() const override { return "docker"; }
  void Build(const BuildContext& context,
             const std::atomic<bool>* cancelled) override;
  proto::ImageConfig Inspect(const std::string& image_id) override;
  std::unique_ptr<Context> CreateContext(
      const std::string& image_id, const std::string& scratch_dir) override;
  void Remove(const std::string& image_id) override;

  static Runtime* Create(const std::string& store_directory) {
    return new DockerRuntime(store_directory);
  }
  static int Score();

  // The functions below only compute strings and are exposed for testing.

  // Contents of the Dockerfile for the given context.
  static std::string Dockerfile(const BuildContext& context);

  // Arguments of docker run for a container called name.
  static std::vector<std::string> RunArgs(const std::string& image_id,
                                          const std::string& name,
                                          const proto::ImageConfig& config,
                                          const RunOptions& options);

  // Parses the output of docker image inspect with kInspectFormat.
  static proto::ImageConfig ParseInspect(const std::string& output);

  static const constexpr char* kInspectFormat =
      "{{.Config.User}}|{{.Config.WorkingDir}}|"
      "{{index .Config.Labels \"org.aicrowd.entrypoint\"}}|"
      "{{index .Config.Labels \"org.aicrowd.uid\"}}|"
      "{{index .Config.Labels \"org.aicrowd.gid\"}}";

 private:
  // Removes image_id, logging failures.
  void Discard(const std::string& image_id);

  std::string docker_;
  std::string store_directory_;
};

}  // namespace executor

#endif
