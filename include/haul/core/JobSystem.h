#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace haul::core {

// Fixed-size worker pool for coarse, independent jobs. The planner hands it one
// route computation per request, so work is distributed one index at a time.
//
// The calling thread takes part in parallelFor()/parallelMap(); a pool of N
// threads therefore runs up to N + 1 items at once and never blocks on itself.
class JobSystem {
public:
  // threadCount == 0 picks hardware_concurrency() (fallback 4).
  explicit JobSystem(std::size_t threadCount = 0)
    : threadCount_(threadCount > 0 ? threadCount : defaultThreadCount()) {
    workers_.reserve(threadCount_);
    for (std::size_t i = 0; i < threadCount_; ++i) workers_.emplace_back([this]() { run(); });
  }

  ~JobSystem() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      shuttingDown_ = true;
    }
    wake_.notify_all();
    for (auto& w : workers_) w.join();
  }

  JobSystem(const JobSystem&) = delete;
  JobSystem& operator=(const JobSystem&) = delete;

  std::size_t threadCount() const { return threadCount_; }

  static std::size_t defaultThreadCount() {
    const unsigned n = std::thread::hardware_concurrency();
    return n > 0 ? static_cast<std::size_t>(n) : 4;
  }

  // Queues fn() and returns its result as a future. After shutdown has begun the
  // job runs on the calling thread instead.
  template <class Fn>
  auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn&>> {
    using R = std::invoke_result_t<Fn&>;
    auto job = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    std::future<R> result = job->get_future();

    bool runHere = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (shuttingDown_) {
        runHere = true;
      } else {
        pending_.emplace_back([job]() { (*job)(); });
      }
    }
    if (runHere) {
      (*job)();
    } else {
      wake_.notify_one();
    }
    return result;
  }

  // Blocks until no job is queued or running.
  void waitIdle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() { return pending_.empty() && running_ == 0; });
  }

  // fn(i) exactly once for every i in [0, count).
  template <class Fn>
  void parallelFor(std::size_t count, Fn&& fn) {
    if (count == 0) return;
    if (threadCount_ <= 1 || count == 1) {
      for (std::size_t i = 0; i < count; ++i) fn(i);
      return;
    }

    std::atomic<std::size_t> cursor{0};
    auto drain = [&]() {
      for (std::size_t i = cursor.fetch_add(1); i < count; i = cursor.fetch_add(1)) fn(i);
    };

    const std::size_t helpers = (count - 1 < threadCount_) ? count - 1 : threadCount_;
    std::vector<std::future<void>> done;
    done.reserve(helpers);
    for (std::size_t h = 0; h < helpers; ++h) done.push_back(submit(drain));

    drain();
    for (auto& d : done) d.get();
  }

  // out[i] = fn(items[i]); output order always matches input order.
  template <class T, class Fn>
  auto parallelMap(const std::vector<T>& items, Fn&& fn) -> std::vector<std::invoke_result_t<Fn&, const T&>> {
    std::vector<std::invoke_result_t<Fn&, const T&>> out(items.size());
    parallelFor(items.size(), [&](std::size_t i) { out[i] = fn(items[i]); });
    return out;
  }

private:
  void run() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
      wake_.wait(lock, [this]() { return shuttingDown_ || !pending_.empty(); });
      if (pending_.empty()) return; // shutting down with nothing left

      std::function<void()> job = std::move(pending_.front());
      pending_.pop_front();
      ++running_;

      lock.unlock();
      job();
      lock.lock();

      --running_;
      if (pending_.empty() && running_ == 0) idle_.notify_all();
    }
  }

  std::size_t threadCount_{1};
  std::vector<std::thread> workers_;

  std::mutex mutex_;
  std::condition_variable wake_;
  std::condition_variable idle_;
  std::deque<std::function<void()>> pending_;
  std::size_t running_{0};
  bool shuttingDown_{false};
};

} // namespace haul::core
