#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace trackmatch::runtime {

/*
  Fixed set of threads draining one FIFO of tasks.

  Two pools exist per process: one for CPU-bound decoding and spectral
  analysis, one for blocking provider HTTP calls. Either way the work stays
  off the scheduler thread.

  Submit returns a future; a caller that loses interest simply drops it.
  Post is fire-and-forget and the task reports its own outcome.
*/
class WorkerPool {
 public:
  using Task = std::function<void()>;

  WorkerPool(std::string name, size_t threads);
  ~WorkerPool();

  WorkerPool(const WorkerPool&)            = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  void Start();

  // Queued tasks that have not started are dropped; running ones finish.
  void Stop();

  void Post(Task task);

  template <typename Fn>
  auto Submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
    using Result = std::invoke_result_t<Fn>;
    auto task    = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
    auto future  = task->get_future();
    Post([task] { (*task)(); });
    return future;
  }

  size_t Size() const {
    return size_;
  }

 private:
  void Run();

  const std::string        name_;
  const size_t             size_;
  std::mutex               mutex_;
  std::condition_variable  cv_;
  std::deque<Task>         pending_;
  bool                     stopping_ = false;
  std::vector<std::thread> threads_;
};

} // namespace trackmatch::runtime
