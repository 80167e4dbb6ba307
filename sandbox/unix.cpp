#include "sandbox/unix.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <grp.h>
#include <limits.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
char* mystrerror(int err, char* buf, size_t buf_size) {
#ifdef _GNU_SOURCE
  return strerror_r(err, buf, buf_size);
#else
  strerror_r(err, buf, buf_size);
  return buf;
#endif
}

int GetProcessMemoryUsage(pid_t pid, int64_t* memory_usage_kb) {
  int fd = open(("/proc/" + std::to_string(pid) + "/statm").c_str(),
                O_RDONLY | O_CLOEXEC);
  if (fd == -1) return fd;
  char buf[4 * 1024] = {};
  int num_read = 0;
  int cur = 0;
  do {
    cur = read(fd, buf + num_read, sizeof(buf) - 1 - num_read);
    if (cur < 0) {
      close(fd);
      return -1;
    }
    num_read += cur;
  } while (cur > 0 && num_read < static_cast<int>(sizeof(buf)) - 1);
  close(fd);
  long long pages = 0;
  if (sscanf(buf, "%lld", &pages) != 1) return -1;
  *memory_usage_kb = pages * (sysconf(_SC_PAGESIZE) / 1024);
  return 0;
}

int64_t ToMillis(const struct timeval& tv) {
  return static_cast<int64_t>(tv.tv_sec) * 1000 + tv.tv_usec / 1000;
}

static const constexpr size_t kPumpChunk = 64 * 1024;
static const constexpr int kDrainMillis = 100;

// Keeps the last max_bytes bytes that were appended to it.
class OutputTail {
 public:
  explicit OutputTail(size_t max_bytes) : max_bytes_(max_bytes) {}

  void Append(const char* data, size_t len) {
    data_.append(data, len);
    if (data_.size() > 2 * max_bytes_) Shrink();
  }
  const std::string& Data() {
    Shrink();
    return data_;
  }
  bool Truncated() const { return truncated_; }

 private:
  void Shrink() {
    if (data_.size() <= max_bytes_) return;
    data_.erase(0, data_.size() - max_bytes_);
    truncated_ = true;
  }

  size_t max_bytes_;
  std::string data_;
  bool truncated_ = false;
};

// Reads fds into tails until both are closed. Once finished is set, only the
// data that is already available is read, so that a process that left the
// session of the child cannot keep the execution alive.
void PumpOutput(int fds[2], OutputTail* tails,
                const std::atomic<bool>* finished) {
  std::unique_ptr<char[]> buf{new char[kPumpChunk]};
  std::chrono::steady_clock::time_point drain_deadline;
  bool draining = false;
  while (fds[0] != -1 || fds[1] != -1) {
    if (!draining && *finished) {
      draining = true;
      drain_deadline = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(kDrainMillis);
    }
    if (draining && std::chrono::steady_clock::now() >= drain_deadline) break;
    struct pollfd pfds[2] = {};
    int stream[2] = {};
    nfds_t count = 0;
    for (int i = 0; i < 2; i++) {
      if (fds[i] == -1) continue;
      pfds[count].fd = fds[i];
      pfds[count].events = POLLIN;
      stream[count++] = i;
    }
    int ret = poll(pfds, count, draining ? 0 : 10);
    if (ret == -1 && errno == EINTR) continue;
    if (ret == -1 || (ret == 0 && draining)) break;
    for (nfds_t j = 0; j < count; j++) {
      if (!(pfds[j].revents & (POLLIN | POLLHUP | POLLERR))) continue;
      int i = stream[j];
      ssize_t amount = read(fds[i], buf.get(), kPumpChunk);
      if (amount == -1 && errno == EINTR) continue;
      if (amount <= 0) {
        close(fds[i]);
        fds[i] = -1;
        continue;
      }
      tails[i].Append(buf.get(), amount);
    }
  }
  for (int i = 0; i < 2; i++) {
    if (fds[i] != -1) close(fds[i]);
    fds[i] = -1;
  }
}

// Returns errno, or 0 on success.
int WriteFile(const std::string& path, const std::string& data) {
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                S_IRUSR | S_IWUSR);
  if (fd == -1) return errno;
  size_t pos = 0;
  while (pos < data.size()) {
    ssize_t written = write(fd, data.c_str() + pos, data.size() - pos);
    if (written == -1 && errno == EINTR) continue;
    if (written == -1) {
      int error = errno;
      close(fd);
      return error;
    }
    pos += written;
  }
  return close(fd) == -1 ? errno : 0;
}
}  // namespace

namespace sandbox {

static const constexpr size_t kStrErrorBufSize = 2048;

bool Unix::PrepareForExecution(const std::string& executable,
                               std::string* error_msg) {
  struct stat st {};
  if (stat(executable.c_str(), &st) == -1 ||
      chmod(executable.c_str(), st.st_mode | S_IRUSR | S_IXUSR | S_IRGRP |
                                    S_IXGRP | S_IROTH | S_IXOTH) == -1) {
    *error_msg = "chmod: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  return true;
}

bool Unix::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                   std::string* error_msg) {
  options_ = &options;
  argv_.clear();
  argv_.push_back(const_cast<char*>(options.executable.c_str()));
  for (const std::string& arg : options.args)
    argv_.push_back(const_cast<char*>(arg.c_str()));
  argv_.push_back(nullptr);
  envp_.clear();
  for (const std::string& var : options.env)
    envp_.push_back(const_cast<char*>(var.c_str()));
  envp_.push_back(nullptr);

  if (!Setup(error_msg)) return false;
  if (!DoFork(error_msg)) return false;
  if (!Wait(info, error_msg)) return false;
  return true;
}

bool Unix::Setup(std::string* error_msg) {
  char buf[kStrErrorBufSize] = {};
  if (pipe2(pipe_fds_, O_CLOEXEC) == -1) {
    *error_msg = "pipe2: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }
  if (options_->max_output_bytes <= 0) return true;
  const std::string* files[2] = {&options_->stdout_file,
                                 &options_->stderr_file};
  for (int i = 0; i < 2; i++) {
    if (files[i]->empty()) continue;
    if (pipe2(output_fds_[i], O_CLOEXEC) == -1) {
      *error_msg = "pipe2: ";
      *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
      close(pipe_fds_[0]);
      close(pipe_fds_[1]);
      CloseOutputPipes();
      return false;
    }
  }
  return true;
}

void Unix::CloseOutputPipes() {
  for (auto& fds : output_fds_) {
    for (int& fd : fds) {
      if (fd != -1) close(fd);
      fd = -1;
    }
  }
}

bool Unix::DoFork(std::string* error_msg) {
  int fork_result = fork();
  if (fork_result == -1) {
    *error_msg = "fork: ";
    char buf[kStrErrorBufSize] = {};
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    close(pipe_fds_[0]);
    close(pipe_fds_[1]);
    CloseOutputPipes();
    return false;
  }
  if (fork_result != 0) {
    child_pid_ = fork_result;
    return true;
  }
  Child();
}

bool Unix::OnChild(char* error_msg, size_t buflen) {
  char buf[kStrErrorBufSize] = {};
  if (options_->gid >= 0) {
    if (geteuid() == 0 && setgroups(0, nullptr) == -1) {
      snprintf(error_msg, buflen, "setgroups: %s",
               mystrerror(errno, buf, kStrErrorBufSize));
      return false;
    }
    if (setgid(options_->gid) == -1) {
      snprintf(error_msg, buflen, "setgid: %s",
               mystrerror(errno, buf, kStrErrorBufSize));
      return false;
    }
  }
  if (options_->uid >= 0) {
    if (setuid(options_->uid) == -1) {
      snprintf(error_msg, buflen, "setuid: %s",
               mystrerror(errno, buf, kStrErrorBufSize));
      return false;
    }
    if (options_->uid != 0 && (getuid() == 0 || geteuid() == 0)) {
      snprintf(error_msg, buflen, "setuid: privileges were not dropped");
      return false;
    }
  }
  return true;
}

void Unix::Child() {
  close(pipe_fds_[0]);
  auto die2 = [this](const char* prefix, const char* err) {
    char buf[kStrErrorBufSize + 64 + 3 + 1] = {};
    strncat(buf, prefix, 64);
    strncat(buf, ": ", 3);
    strncat(buf, err, kStrErrorBufSize);
    int len = strlen(buf);
    if (write(pipe_fds_[1], &len, sizeof(len)) == sizeof(len)) {
      if (write(pipe_fds_[1], buf, len) != len) _Exit(1);
    }
    close(pipe_fds_[1]);
    _Exit(1);
  };

  auto die = [&die2](const char* prefix, int err) {
    char buf[kStrErrorBufSize] = {};
    die2(prefix, mystrerror(err, buf, kStrErrorBufSize));
  };

  // Change process group, so that we do not receive Ctrl-Cs in the terminal
  // and so that the whole tree can be killed at once.
  if (setsid() == -1) die("setsid", errno);

  int stdin_fd = -1;
  int stdout_fd = -1;
  int stderr_fd = -1;
  if (!options_->stdin_file.empty()) {
    stdin_fd = open(options_->stdin_file.c_str(), O_RDONLY | O_CLOEXEC);
    if (stdin_fd == -1) die("open", errno);
  }
  if (output_fds_[0][1] != -1) {
    stdout_fd = output_fds_[0][1];
  } else if (!options_->stdout_file.empty()) {
    stdout_fd = open(options_->stdout_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stdout_fd == -1) die("open", errno);
  }
  if (output_fds_[1][1] != -1) {
    stderr_fd = output_fds_[1][1];
  } else if (!options_->stderr_file.empty()) {
    stderr_fd = open(options_->stderr_file.c_str(),
                     O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                     S_IRUSR | S_IWUSR);
    if (stderr_fd == -1) die("open", errno);
  }

  if (chdir(options_->root.c_str()) == -1) {
    die("chdir", errno);
  }

  // Handle I/O redirection.
#define DUP(field, fd)                          \
  if (field##_fd != -1) {                       \
    int ret = dup2(field##_fd, fd);             \
    if (ret == -1) die("redir " #field, errno); \
  }
  if (stdin_fd != -1) {
    DUP(stdin, STDIN_FILENO);
  } else if (close(STDIN_FILENO) == -1) {
    die("close", errno);
  }
  DUP(stdout, STDOUT_FILENO);
  DUP(stderr, STDERR_FILENO);
#undef DUP

  // Set resource limits.
  struct rlimit rlim {};
#define SET_RLIM(res, value)                    \
  {                                             \
    rlim_t lim = value;                         \
    if (lim) {                                  \
      rlim.rlim_cur = lim;                      \
      rlim.rlim_max = lim;                      \
      if (setrlimit(RLIMIT_##res, &rlim) < 0) { \
        die("setrlim " #res, errno);            \
      }                                         \
    }                                           \
  }

  SET_RLIM(AS, options_->memory_limit_kb * 1024);
  SET_RLIM(CPU, (options_->cpu_limit_millis + 999) / 1000);
  SET_RLIM(FSIZE, options_->max_file_size_kb * 1024);
  SET_RLIM(MEMLOCK, options_->max_mlock_kb * 1024);
  SET_RLIM(NOFILE, options_->max_files);
  SET_RLIM(NPROC, options_->max_procs);
  SET_RLIM(STACK, options_->max_stack_kb ? options_->max_stack_kb * 1024
                                         : RLIM_INFINITY);
#undef SET_RLIM

  char buf[kStrErrorBufSize] = {};
  if (!OnChild(buf, kStrErrorBufSize)) {
    die2("OnChild", buf);
  }
  int count = 0;
  do {
    if (options_->env.empty()) {
      execv(options_->executable.c_str(), argv_.data());
    } else {
      execve(options_->executable.c_str(), argv_.data(), envp_.data());
    }
    usleep(100);
    // We try at most 16 times to avoid livelocks.
  } while (errno == ETXTBSY && count++ < 16);
  die("exec", errno);
  // [[noreturn]] does not work on lambdas...
  _Exit(1);
}

void Unix::KillGroup() {
  if (kill(-child_pid_, SIGKILL) == -1 && errno != ESRCH) {
    char buf[kStrErrorBufSize] = {};
    fprintf(stderr, "kill: %s\n", mystrerror(errno, buf, kStrErrorBufSize));
  }
}

bool Unix::Wait(ExecutionInfo* info, std::string* error_msg) {
  close(pipe_fds_[1]);
  for (auto& fds : output_fds_) {
    if (fds[1] != -1) close(fds[1]);
    fds[1] = -1;
  }
  int error_len = 0;
  if (read(pipe_fds_[0], &error_len, sizeof(error_len)) == sizeof(error_len)) {
    char error[PIPE_BUF] = {};
    if (error_len >= static_cast<int>(PIPE_BUF)) error_len = PIPE_BUF - 1;
    if (read(pipe_fds_[0], error, error_len) < 0) error[0] = 0;
    close(pipe_fds_[0]);
    CloseOutputPipes();
    *error_msg = error;
    int status = 0;
    while (waitpid(child_pid_, &status, 0) == -1 && errno == EINTR) {
    }
    return false;
  }
  close(pipe_fds_[0]);

  const bool bounded_output = options_->max_output_bytes > 0;
  const size_t max_output = bounded_output ? options_->max_output_bytes : 0;
  OutputTail tails[2] = {OutputTail(max_output), OutputTail(max_output)};
  int output_read_fds[2] = {output_fds_[0][0], output_fds_[1][0]};
  output_fds_[0][0] = output_fds_[1][0] = -1;
  std::atomic<bool> output_finished{false};
  std::thread output_pump;
  if (bounded_output) {
    output_pump = std::thread(PumpOutput, output_read_fds, tails,
                              &output_finished);
  }

  std::atomic<int64_t> memory_usage{0};
  std::atomic<bool> done{false};
  std::thread memory_watcher(
      [&memory_usage, &done](int pid) {
        while (!done) {
          int64_t mem = 0;
          if (GetProcessMemoryUsage(pid, &mem) == 0) {
            if (mem > memory_usage) memory_usage = mem;
          }
          std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
      },
      child_pid_);

  auto program_start = std::chrono::steady_clock::now();
  auto elapsed_millis = [&program_start]() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - program_start)
        .count();
  };

  int child_status = 0;
  bool has_exited = false;
  bool wait_failed = false;
  struct rusage rusage {};
  while (true) {
    if (options_->cancelled != nullptr && *options_->cancelled) {
      info->cancelled = true;
      break;
    }
    if (options_->wall_limit_millis &&
        elapsed_millis() >= options_->wall_limit_millis) {
      info->timed_out = true;
      break;
    }
    if (options_->memory_limit_kb && memory_usage > options_->memory_limit_kb)
      break;
    int ret = wait4(child_pid_, &child_status, WNOHANG, &rusage);
    if (ret == -1) {
      if (errno == EINTR) continue;
      wait_failed = true;
      break;
    }
    if (ret == child_pid_) {
      has_exited = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  if (!has_exited) {
    KillGroup();
    kill(child_pid_, SIGKILL);
    int ret = 0;
    while ((ret = wait4(child_pid_, &child_status, 0, &rusage)) == -1 &&
           errno == EINTR) {
    }
    if (ret != child_pid_) wait_failed = true;
  }
  // Anything the child left behind in its session goes too.
  KillGroup();
  done = true;
  memory_watcher.join();
  output_finished = true;
  if (output_pump.joinable()) output_pump.join();

  if (bounded_output) {
    const std::string* files[2] = {&options_->stdout_file,
                                   &options_->stderr_file};
    bool* truncated[2] = {&info->stdout_truncated, &info->stderr_truncated};
    for (int i = 0; i < 2; i++) {
      if (files[i]->empty()) continue;
      int err = WriteFile(*files[i], tails[i].Data());
      if (err != 0) {
        char buf[kStrErrorBufSize] = {};
        *error_msg = "write " + *files[i] + ": ";
        *error_msg += mystrerror(err, buf, kStrErrorBufSize);
        return false;
      }
      *truncated[i] = tails[i].Truncated();
    }
  }

  if (wait_failed) {
    char buf[kStrErrorBufSize] = {};
    *error_msg = "wait4: ";
    *error_msg += mystrerror(errno, buf, kStrErrorBufSize);
    return false;
  }

  info->pid = child_pid_;
  info->memory_usage_kb = memory_usage;
  info->status_code = WIFEXITED(child_status) ? WEXITSTATUS(child_status) : 0;
  info->signal = WIFSIGNALED(child_status) ? WTERMSIG(child_status) : 0;
  info->wall_time_millis = elapsed_millis();
  info->cpu_time_millis = ToMillis(rusage.ru_utime);
  info->sys_time_millis = ToMillis(rusage.ru_stime);
  return true;
}

}  // namespace sandbox
