#ifndef EXECUTOR_RUNTIME_MOCK_HPP
#define EXECUTOR_RUNTIME_MOCK_HPP

#include "executor/runtime.hpp"
#include "gmock/gmock.h"

namespace executor {

class MockRuntime : public Runtime {
 public:
  MOCK_CONST_METHOD0(Id, std::string());
  MOCK_METHOD2(Build, void(const BuildContext&, const std::atomic<bool>*));
  MOCK_METHOD1(Inspect, proto::ImageConfig(const std::string&));
  MOCK_METHOD2(CreateContextProxy,
               Context*(const std::string&, const std::string&));
  MOCK_METHOD1(Remove, void(const std::string&));

  std::unique_ptr<Context> CreateContext(
      const std::string& image_id, const std::string& scratch_dir) override {
    return std::unique_ptr<Context>(CreateContextProxy(image_id, scratch_dir));
  }
};

class MockContext : public Context {
 public:
  MOCK_METHOD3(Run, bool(const RunOptions&, RunInfo*, std::string*));
  MOCK_METHOD0(Die, void());
  ~MockContext() override { Die(); }
};

}  // namespace executor

#endif
