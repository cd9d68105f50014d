#include "gitrelay/transfer_pool.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>

namespace gitrelay {

namespace {

struct WalkState {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<std::string> queue;
  std::size_t in_flight = 0;
  std::exception_ptr error;
};

void run_worker(WalkState &state, const TransferPool::Step &step,
                std::unordered_set<std::string> &seen) {
  for (;;) {
    std::string item;
    {
      std::unique_lock lock(state.mutex);
      state.cv.wait(lock, [&state] {
        return state.error || !state.queue.empty() || state.in_flight == 0;
      });
      if (state.error || state.queue.empty()) {
        return; // failed, or nothing queued and nobody left to queue more
      }
      item = std::move(state.queue.front());
      state.queue.pop_front();
      ++state.in_flight;
    }

    try {
      auto next = step(item);
      std::scoped_lock lock(state.mutex);
      for (auto &n : next) {
        if (seen.insert(n).second) {
          state.queue.push_back(std::move(n));
        }
      }
      --state.in_flight;
    } catch (...) {
      std::scoped_lock lock(state.mutex);
      if (!state.error) {
        state.error = std::current_exception();
      }
      --state.in_flight;
    }
    state.cv.notify_all();
  }
}

} // namespace

TransferPool::TransferPool(unsigned workers) : workers_(std::max(1U, workers)) {}

void TransferPool::walk(const std::vector<std::string> &roots, const Step &step,
                        std::unordered_set<std::string> &seen) const {
  WalkState state;
  for (const auto &r : roots) {
    if (seen.insert(r).second) {
      state.queue.push_back(r);
    }
  }
  if (state.queue.empty()) {
    return;
  }

  std::vector<std::thread> threads;
  threads.reserve(workers_);
  for (unsigned i = 0; i < workers_; ++i) {
    threads.emplace_back(run_worker, std::ref(state), std::cref(step), std::ref(seen));
  }
  for (auto &t : threads) {
    t.join();
  }
  if (state.error) {
    std::rethrow_exception(state.error);
  }
}

void TransferPool::for_each(const std::vector<std::string> &items,
                            const std::function<void(const std::string &)> &fn) const {
  std::unordered_set<std::string> seen;
  walk(items, [&fn](const std::string &item) {
    fn(item);
    return std::vector<std::string>{};
  }, seen);
}

} // namespace gitrelay
