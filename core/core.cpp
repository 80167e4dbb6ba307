#include "core/core.hpp"

#include <chrono>
#include <stdexcept>

#include "glog/logging.h"

namespace core {

Core::Core(std::shared_ptr<Pipeline> pipeline, int32_t num_workers)
    : pipeline_(std::move(pipeline)), num_workers_(num_workers) {
  if (num_workers_ <= 0) {
    num_workers_ = std::thread::hardware_concurrency();
  }
  if (num_workers_ <= 0) num_workers_ = 1;
}

void Core::Submit(const Submission& submission) {
  std::lock_guard<std::mutex> lck(submissions_mutex_);
  if (cancelled_.count(submission.id) != 0u) {
    throw std::invalid_argument("Duplicate submission id " + submission.id);
  }
  cancelled_.emplace(submission.id,
                     std::unique_ptr<std::atomic<bool>>(
                         new std::atomic<bool>(false)));
  submissions_.push_back(submission);
}

bool Core::Cancel(const std::string& id) {
  std::lock_guard<std::mutex> lck(submissions_mutex_);
  auto it = cancelled_.find(id);
  if (it == cancelled_.end()) return false;
  LOG(INFO) << "Cancelling " << id;
  *it->second = true;
  return true;
}

void Core::Stop() {
  std::lock_guard<std::mutex> lck(submissions_mutex_);
  for (auto& entry : cancelled_) *entry.second = true;
}

void Core::ThreadBody() {
  while (!quitting_) {
    std::unique_lock<std::mutex> lck(task_mutex_);
    while (!quitting_ && tasks_.empty()) {
      task_ready_.wait(lck);
    }
    if (quitting_) break;
    std::packaged_task<proto::StructuredOutcome()> task =
        std::move(tasks_.front());
    tasks_.pop();
    lck.unlock();
    task();
  }
}

bool Core::Run(const Callback& callback) {
  std::vector<std::thread> threads(num_workers_);
  quitting_ = false;
  for (int32_t i = 0; i < num_workers_; i++)
    threads[i] = std::thread(std::bind(&Core::ThreadBody, this));

  std::queue<std::future<proto::StructuredOutcome>> running;
  {
    std::lock_guard<std::mutex> lck(submissions_mutex_);
    LOG(INFO) << "Evaluating " << submissions_.size() << " submissions on "
              << num_workers_ << " workers";
    for (const Submission& submission : submissions_) {
      const std::atomic<bool>* cancelled = cancelled_.at(submission.id).get();
      Pipeline* pipeline = pipeline_.get();
      std::packaged_task<proto::StructuredOutcome()> task(
          [pipeline, submission, cancelled]() {
            return pipeline->Evaluate(submission, cancelled);
          });
      running.push(task.get_future());
      std::lock_guard<std::mutex> task_lck(task_mutex_);
      tasks_.push(std::move(task));
      task_ready_.notify_one();
    }
    submissions_.clear();
  }

  bool keep_going = true;
  while (!running.empty()) {
    size_t queue_size = running.size();
    for (size_t _ = 0; _ < queue_size; _++) {
      std::future<proto::StructuredOutcome> future = std::move(running.front());
      running.pop();
      if (future.wait_for(std::chrono::microseconds(100)) !=
          std::future_status::ready) {
        running.push(std::move(future));
        continue;
      }
      proto::StructuredOutcome outcome = future.get();
      VLOG(1) << "Completed " << outcome.submission_id();
      if (keep_going && !callback(outcome)) {
        LOG(WARNING) << "Stopping after " << outcome.submission_id();
        keep_going = false;
        Stop();
      }
    }
  }

  {
    std::lock_guard<std::mutex> lck(task_mutex_);
    quitting_ = true;
  }
  task_ready_.notify_all();
  for (std::thread& thread : threads) thread.join();
  std::lock_guard<std::mutex> lck(submissions_mutex_);
  cancelled_.clear();
  return keep_going;
}

}  // namespace core
