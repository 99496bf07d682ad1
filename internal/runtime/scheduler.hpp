#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace trackmatch::runtime {

/*
  Single-threaded cooperative event loop with timers.

  Owns every timed suspension point of every search session. A session
  that needs to wait schedules its continuation here and returns; the
  continuation hands the step to a worker pool. Tasks must not block.
*/
class Scheduler {
 public:
  using Clock     = std::chrono::steady_clock;
  using TimePoint = Clock::time_point;
  using Task      = std::function<void()>;

  Scheduler();
  ~Scheduler();

  Scheduler(const Scheduler&)            = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  void Start();

  // Pending tasks are dropped; the running one finishes first.
  void Stop();

  void Post(Task task);
  void ScheduleAt(TimePoint when, Task task);
  void ScheduleAfter(Clock::duration delay, Task task);

  bool IsLoopThread() const;
  size_t Pending();

 private:
  struct Entry {
    TimePoint     when;
    std::uint64_t seq;
    Task          task;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.when != b.when) return a.when > b.when;
      return a.seq > b.seq;
    }
  };

  void Run();

  std::mutex                                      mutex_;
  std::condition_variable                         cv_;
  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  std::uint64_t                                   next_seq_ = 0;
  bool                                            shutdown_ = false;
  std::thread                                     thread_;
};

} // namespace trackmatch::runtime
