#ifndef SANDBOX_SANDBOX_HPP
#define SANDBOX_SANDBOX_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sandbox {

// Settings to execute the program in the sandbox.
struct ExecutionOptions {
  // Optional values
  int64_t cpu_limit_millis = 0;
  int64_t wall_limit_millis = 0;
  int64_t memory_limit_kb = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_kb = 0;
  int64_t max_mlock_kb = 0;
  int64_t max_stack_kb = 0;

  std::string stdin_file;
  std::string stdout_file;
  std::string stderr_file;
  // When positive, the output of the child is collected through pipes and
  // only its last max_output_bytes bytes are written to stdout_file and to
  // stderr_file.
  int64_t max_output_bytes = 0;
  std::vector<std::string> args;

  // Environment of the child, as NAME=value. If empty, the environment of the
  // parent is inherited.
  std::vector<std::string> env;

  // Credentials to switch to before exec. Negative values keep the current
  // ones.
  int32_t uid = -1;
  int32_t gid = -1;

  // When set, the child is killed as soon as this becomes true.
  const std::atomic<bool>* cancelled = nullptr;

  // Required values
  std::string root;
  std::string executable;

  ExecutionOptions(std::string root_, std::string executable_)
      : root(std::move(root_)), executable(std::move(executable_)) {}
};

// Results of the execution.
struct ExecutionInfo {
  int64_t cpu_time_millis = 0;
  int64_t sys_time_millis = 0;
  int64_t wall_time_millis = 0;
  int64_t memory_usage_kb = 0;
  int32_t status_code = 0;
  int32_t signal = 0;
  int32_t pid = 0;
  bool timed_out = false;
  bool cancelled = false;
  // Set when older output was dropped because of max_output_bytes.
  bool stdout_truncated = false;
  bool stderr_truncated = false;
  std::string message;
};

// Sandbox interface. Implementations need to register themselves by adding
// an entry to the list in sandbox.cpp and should define the Create and Score
// static functions. Create should return a pointer to a newly allocated
// instance of the given implementation, while Score should return a value
// that defines how "good" that sandbox is: negative if the sandbox should
// not/cannot be used in the current configuration, positive otherwise (a
// bigger value means a better sandbox).
class Sandbox {
 public:
  using create_t = std::function<Sandbox*()>;
  using score_t = std::function<int()>;
  static std::unique_ptr<Sandbox> Create();

  // Runs the specified command. Returns true if the program was started,
  // and sets fields in info. Otherwise, returns false and sets error_msg.
  // Implementations of this function may not be thread safe; use one
  // instance per execution.
  virtual bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
                       std::string* error_msg) = 0;

  // Prepares a newly-created file for execution. Returns false on error,
  // and sets error_msg.
  virtual bool PrepareForExecution(const std::string& executable,
                                   std::string* error_msg) = 0;

  virtual ~Sandbox() = default;
  Sandbox() = default;
  Sandbox(const Sandbox&) = delete;
  Sandbox(Sandbox&&) = delete;
  Sandbox& operator=(const Sandbox&) = delete;
  Sandbox& operator=(Sandbox&&) = delete;
};

}  // namespace sandbox

#endif
