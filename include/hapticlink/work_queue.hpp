#pragma once

#include <deque>
#include <functional>
#include <mutex>
#include <spdlog/spdlog.h>

namespace hapticlink {

/// Hands work from background threads to the thread that calls drain().
class work_queue {
public:
  using task = std::function<void()>;

  void post(task fn) {
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.push_back(std::move(fn));
  }

  /// Run everything queued so far on the calling thread. Tasks posted while
  /// draining wait for the next call. Returns the number of tasks run.
  size_t drain() {
    std::deque<task> batch;
    {
      std::lock_guard<std::mutex> lock(mu_);
      batch.swap(tasks_);
    }
    for (auto &fn : batch) {
      try {
        fn();
      } catch (const std::exception &e) {
        spdlog::error("[queue] callback threw: {}", e.what());
      }
    }
    return batch.size();
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    tasks_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return tasks_.size();
  }

private:
  mutable std::mutex mu_;
  std::deque<task> tasks_;
};

} // namespace hapticlink
