#pragma once
#include <atomic>
#include <cstddef>
#include <thread>
#include <utility>
#include <vector>

namespace pitwall {

// Owns a set of worker threads and the flag they poll to stop early.
// Leaving scope with workers still attached (e.g. because starting another
// one threw) raises the flag and joins them, so no joinable std::thread is
// ever destroyed.
class WorkerGroup {
public:
  explicit WorkerGroup(std::atomic<bool>& stop) : stop_(stop) {}
  ~WorkerGroup() {
    if (threads_.empty()) return;
    stop_.store(true);
    join();
  }

  WorkerGroup(const WorkerGroup&) = delete;
  WorkerGroup& operator=(const WorkerGroup&) = delete;

  template <class Fn>
  void spawn(Fn&& fn) {
    threads_.reserve(threads_.size() + 1);
    threads_.emplace_back(std::forward<Fn>(fn));
  }

  // Waits for every worker; the group is empty afterwards.
  void join() {
    for (auto& t : threads_) {
      if (t.joinable()) t.join();
    }
    threads_.clear();
  }

  std::size_t size() const { return threads_.size(); }

private:
  std::atomic<bool>& stop_;
  std::vector<std::thread> threads_;
};

} // namespace pitwall
