#include "execution/worker_pool.h"

#include <exception>
#include <utility>

#include "core/log.h"

namespace trade_pilot {

WorkerPool::WorkerPool(std::size_t thread_count)
    : thread_count_(thread_count == 0 ? 1 : thread_count) {}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  std::lock_guard<std::mutex> lock(queue_mutex_);
  if (!workers_.empty() || stopping_) {
    return;
  }
  for (std::size_t i = 0; i < thread_count_; ++i) {
    workers_.emplace_back(&WorkerPool::WorkerLoop, this);
  }
}

void WorkerPool::Stop() {
  // 每个线程消费一个 stop 任务后退出，排在前面的任务照常执行。
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stopping_) {
      return;
    }
    stopping_ = true;
    for (std::size_t i = 0; i < workers_.size(); ++i) {
      task_queue_.push(Task{.type = Task::kStop, .name = "", .run = nullptr});
    }
  }
  queue_cv_.notify_all();
  for (std::thread& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

bool WorkerPool::Submit(const std::string& name, std::function<void()> task) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stopping_) {
      return false;
    }
    task_queue_.push(Task{.type = Task::kRun, .name = name, .run = std::move(task)});
  }
  queue_cv_.notify_one();
  return true;
}

void WorkerPool::WaitIdle() {
  std::unique_lock<std::mutex> lock(queue_mutex_);
  idle_cv_.wait(lock, [this] {
    return running_ == 0 &&
           (task_queue_.empty() || task_queue_.front().type == Task::kStop);
  });
}

void WorkerPool::WorkerLoop() {
  while (true) {
    Task task;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this] { return !task_queue_.empty(); });
      task = std::move(task_queue_.front());
      task_queue_.pop();
      if (task.type == Task::kStop) {
        idle_cv_.notify_all();
        break;
      }
      ++running_;
    }

    try {
      task.run();
    } catch (const std::exception& e) {
      LogError("工作任务异常退出: task=" + task.name + ", error=" + e.what());
    }

    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      --running_;
    }
    idle_cv_.notify_all();
  }
}

}  // namespace trade_pilot
