#include "worker_pool.hpp"

#include <cstdint>

#include "internal/observability/logging.hpp"

namespace trackmatch::runtime {

WorkerPool::WorkerPool(std::string name, size_t threads) : name_(std::move(name)), size_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop();
}

void WorkerPool::Start() {
  std::lock_guard lock(mutex_);
  if (!threads_.empty()) return;

  stopping_ = false;
  for (size_t i = 0; i < size_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop() {
  std::vector<std::thread> threads;
  std::deque<Task>         dropped;
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
    threads.swap(threads_);
    dropped.swap(pending_);
  }
  cv_.notify_all();

  for (auto& thread : threads) {
    if (!thread.joinable()) continue;
    if (thread.get_id() == std::this_thread::get_id()) {
      thread.detach();
    } else {
      thread.join();
    }
  }
  if (!dropped.empty()) {
    TRACKMATCH_LOG_DEBUG("Worker pool dropped queued tasks",
                         {observability::StringField("pool", name_), observability::IntField("count", static_cast<std::int64_t>(dropped.size()))});
  }
}

void WorkerPool::Post(Task task) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    pending_.push_back(std::move(task));
  }
  cv_.notify_one();
}

void WorkerPool::Run() {
  while (true) {
    Task task;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [&] { return stopping_ || !pending_.empty(); });
      if (stopping_) return;

      task = std::move(pending_.front());
      pending_.pop_front();
    }

    try {
      task();
    } catch (const std::exception& e) {
      TRACKMATCH_LOG_ERROR("Worker task failed", {observability::StringField("pool", name_), observability::StringField("error", e.what())});
    }
  }
}

} // namespace trackmatch::runtime
