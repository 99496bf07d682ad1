#include "scheduler.hpp"

#include "internal/observability/logging.hpp"

namespace trackmatch::runtime {

Scheduler::Scheduler() = default;

Scheduler::~Scheduler() {
  Stop();
}

void Scheduler::Start() {
  std::lock_guard lock(mutex_);
  if (thread_.joinable()) return;
  shutdown_ = false;
  thread_   = std::thread(&Scheduler::Run, this);
}

void Scheduler::Stop() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable() && !IsLoopThread()) {
    thread_.join();
  }

  std::lock_guard lock(mutex_);
  queue_ = {};
}

void Scheduler::Post(Task task) {
  ScheduleAt(Clock::now(), std::move(task));
}

void Scheduler::ScheduleAfter(Clock::duration delay, Task task) {
  ScheduleAt(Clock::now() + delay, std::move(task));
}

void Scheduler::ScheduleAt(TimePoint when, Task task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(Entry{when, next_seq_++, std::move(task)});
  }
  cv_.notify_one();
}

bool Scheduler::IsLoopThread() const {
  return std::this_thread::get_id() == thread_.get_id();
}

size_t Scheduler::Pending() {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void Scheduler::Run() {
  std::unique_lock lock(mutex_);

  while (!shutdown_) {
    if (queue_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      continue;
    }

    const auto when = queue_.top().when;
    if (Clock::now() < when) {
      // wakes early on shutdown or when an earlier task arrives
      cv_.wait_until(lock, when);
      continue;
    }

    Task task = std::move(const_cast<Entry&>(queue_.top()).task);
    queue_.pop();

    lock.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      TRACKMATCH_LOG_ERROR("Scheduler task failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace trackmatch::runtime
