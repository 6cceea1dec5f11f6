#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace pitwall {

// Memoizing cache with single-flight builds. The first caller for a missing
// key runs the builder; concurrent callers for that key wait on the same
// shared future and receive the same immutable value. A failed build is
// reported to every waiter and leaves the key uncached.
template <class Key, class Value>
class SingleFlightCache {
public:
  using Ptr = std::shared_ptr<const Value>;

  template <class Build>
  Ptr get_or_build(const Key& key, Build&& build) {
    std::promise<Ptr> promise;
    std::shared_future<Ptr> fut;
    std::uint64_t gen = 0;
    bool owner = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      auto it = entries_.find(key);
      if (it != entries_.end()) {
        fut = it->second.future;
      } else {
        fut = promise.get_future().share();
        gen = ++generation_;
        entries_.emplace(key, Entry{gen, fut});
        owner = true;
      }
    }
    if (owner) run_build_(key, gen, promise, std::forward<Build>(build));
    return fut.get();
  }

  // Builds a fresh value and swaps it in once ready. Readers keep seeing the
  // previous entry (or wait for an in-flight one) until the swap.
  template <class Build>
  Ptr rebuild(const Key& key, Build&& build) {
    Ptr value = std::make_shared<const Value>(build());
    std::promise<Ptr> ready;
    ready.set_value(value);
    std::lock_guard<std::mutex> lk(mu_);
    entries_.insert_or_assign(key, Entry{++generation_, ready.get_future().share()});
    return value;
  }

  // Ready value for key, or nullptr when absent or still building.
  Ptr peek(const Key& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return nullptr;
    const auto& f = it->second.future;
    if (f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return nullptr;
    return f.get();
  }

  bool contains(const Key& key) const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.count(key) != 0;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
  }

  // Drops every entry. Builds in flight still complete for their waiters
  // but are not retained.
  void clear() {
    std::lock_guard<std::mutex> lk(mu_);
    entries_.clear();
  }

private:
  struct Entry {
    std::uint64_t generation;
    std::shared_future<Ptr> future;
  };

  template <class Build>
  void run_build_(const Key& key, std::uint64_t gen, std::promise<Ptr>& promise, Build&& build) {
    try {
      promise.set_value(std::make_shared<const Value>(build()));
    } catch (...) {
      {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = entries_.find(key);
        if (it != entries_.end() && it->second.generation == gen) entries_.erase(it);
      }
      promise.set_exception(std::current_exception());
    }
  }

  mutable std::mutex mu_;
  std::map<Key, Entry> entries_;
  std::uint64_t generation_{0};
};

} // namespace pitwall
