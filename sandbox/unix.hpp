#ifndef SANDBOX_UNIX_HPP
#define SANDBOX_UNIX_HPP
#include "sandbox/sandbox.hpp"

namespace sandbox {

// Sandbox for UNIX-like systems. The child runs in its own session, so that
// killing it also kills every process it spawned.
class Unix : public Sandbox {
 public:
  bool PrepareForExecution(const std::string& executable,
                           std::string* error_msg) override;
  bool Execute(const ExecutionOptions& options, ExecutionInfo* info,
               std::string* error_msg) override;
  static Sandbox* Create() { return new Unix(); }
  static int Score() { return 2; }

 protected:
  Unix() = default;

  // Executed before creating the child process. Returns false and sets
  // error_msg if setup fails.
  bool Setup(std::string* error_msg);

  // Creates a child process and saves its PID in child_pid_. The child process
  // should execute Child and must not return.
  virtual bool DoFork(std::string* error_msg);

  // Function that is executed in the child process.
  [[noreturn]] void Child();

  // Hook that is executed just before exec. Returns false if something went
  // wrong and exec should not be called. The error_msg string must not be
  // longer then buflen characters. This function must not use dynamic memory
  // allocation.
  virtual bool OnChild(char* error_msg, size_t buflen);

  // Waits for the termination of the child, killing it if it exceeds the
  // provided wall time limit or if the execution gets cancelled.
  bool Wait(ExecutionInfo* info, std::string* error_msg);

  // Kills the whole process group of the child.
  void KillGroup();

  // Closes every end of the output pipes that is still open.
  void CloseOutputPipes();

  int pipe_fds_[2] = {};
  // Pipes for stdout and stderr, when their size is bounded.
  int output_fds_[2][2] = {{-1, -1}, {-1, -1}};
  int child_pid_ = 0;
  const ExecutionOptions* options_ = nullptr;

  // Prepared before forking, since the child cannot allocate.
  std::vector<char*> argv_;
  std::vector<char*> envp_;
};

}  // namespace sandbox
#endif
