#ifndef EXECUTOR_LOCAL_RUNTIME_HPP
#define EXECUTOR_LOCAL_RUNTIME_HPP

#include "executor/runtime.hpp"

namespace executor {

// Runtime that keeps images as directories in the store and runs them with
// the process sandbox. Packages are not installed: the resolved environment
// is only recorded in the image lock file, and the entrypoint runs against
// the host interpreters.
class LocalRuntime : public Runtime {
 public:
  explicit LocalRuntime(std::string store_directory);
  ~LocalRuntime() override = default;
  LocalRuntime(const LocalRuntime&) = delete;
  LocalRuntime& operator=(const LocalRuntime&) = delete;
  LocalRuntime(LocalRuntime&&) = delete;
  LocalRuntime& operator=(LocalRuntime&&) = delete;

  std::string Id() const override { return "local"; }
  void Build(const BuildContext& context,
             const std::atomic<bool>* cancelled) override;
  proto::ImageConfig Inspect(const std::string& image_id) override;
  std::unique_ptr<Context> CreateContext(
      const std::string& image_id, const std::string& scratch_dir) override;
  void Remove(const std::string& image_id) override;

  static Runtime* Create(const std::string& store_directory) {
    return new LocalRuntime(store_directory);
  }
  static int Score() { return 1; }

  // Directory holding the image with the given id.
  std::string ImageDir(const std::string& image_id) const;

 private:
  static const constexpr char* kImagesDir = "images";
  static const constexpr char* kConfigFile = "config.pb";
  static const constexpr char* kRootDir = "rootfs";

  std::string store_directory_;
};

}  // namespace executor

#endif
