#ifndef CORE_CORE_HPP
#define CORE_CORE_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

#include "core/pipeline.hpp"
#include "proto/execution.pb.h"

namespace core {

// Evaluates submissions on a bounded pool of worker threads. Each
// submission goes through its pipeline sequentially; independent
// submissions run in parallel.
class Core {
 public:
  // Called on the thread of Run, in completion order. Returning false
  // cancels the remaining submissions.
  using Callback = std::function<bool(const proto::StructuredOutcome&)>;

  Core(std::shared_ptr<Pipeline> pipeline, int32_t num_workers);

  // Queues a submission for the next Run. Throws std::invalid_argument if
  // the id is already queued.
  void Submit(const Submission& submission);

  // Cancels a queued or running submission. Returns false for unknown ids.
  // Can be called from any thread.
  bool Cancel(const std::string& id);

  // Cancels every submission.
  void Stop();

  // Evaluates everything that was submitted, reporting one outcome per
  // submission. Returns false if the callback asked to stop.
  bool Run(const Callback& callback);

  ~Core() = default;
  Core(const Core&) = delete;
  Core& operator=(const Core&) = delete;
  Core(Core&&) = delete;
  Core& operator=(Core&&) = delete;

 private:
  void ThreadBody();

  std::shared_ptr<Pipeline> pipeline_;
  int32_t num_workers_;

  std::vector<Submission> submissions_;
  std::unordered_map<std::string, std::unique_ptr<std::atomic<bool>>>
      cancelled_;
  std::mutex submissions_mutex_;

  std::queue<std::packaged_task<proto::StructuredOutcome()>> tasks_;
  std::mutex task_mutex_;
  std::condition_variable task_ready_;
  std::atomic<bool> quitting_{false};
};

}  // namespace core

#endif
