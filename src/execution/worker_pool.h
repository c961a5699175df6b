#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace trade_pilot {

/**
 * @brief 固定线程数的工作池
 *
 * 每个 trader 周期与每次账户对账都是一个独立任务；
 * 同一 trader/账户的互斥由分布式锁保证，这里不做任何按 key 的串行化。
 */
class WorkerPool {
 public:
  explicit WorkerPool(std::size_t thread_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  /// 启动工作线程；重复调用无副作用。
  void Start();
  /// 投递 stop 任务并等待全部线程退出（幂等）；已排队任务先执行完。
  void Stop();

  /// 投递任务；name 只用于日志。已停止时返回 false。
  bool Submit(const std::string& name, std::function<void()> task);

  /// 阻塞直到队列为空且没有运行中的任务。
  void WaitIdle();

  std::size_t thread_count() const { return thread_count_; }

 private:
  void WorkerLoop();

  struct Task {
    enum Type { kRun, kStop } type;
    std::string name;
    std::function<void()> run;
  };

  std::size_t thread_count_{1};
  std::vector<std::thread> workers_;
  std::mutex queue_mutex_;  ///< 保护队列与计数。
  std::condition_variable queue_cv_;  ///< 任务到达通知。
  std::condition_variable idle_cv_;  ///< 空闲通知。
  std::queue<Task> task_queue_;
  std::size_t running_{0};
  bool stopping_{false};
};

}  // namespace trade_pilot
