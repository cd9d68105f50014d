#pragma once
#include <functional>
#include <string>
#include <unordered_set>
#include <vector>

namespace gitrelay {

// Runs independent transfers (one per object id) on a small, fixed number of
// worker threads. Threads live for the duration of one call.
class TransferPool {
public:
  // Processes one item; returns further items discovered from it.
  using Step = std::function<std::vector<std::string>(const std::string&)>;

  explicit TransferPool(unsigned workers);

  [[nodiscard]] unsigned workers() const { return workers_; }

  /**
   * Process every item reachable from `roots` through `step`, each at most
   * once. `seen` is the closure membership: items already in it are skipped,
   * every queued item is inserted (check-and-insert under the pool lock).
   * The first exception thrown by `step` stops the walk and is rethrown
   * here once all workers have finished their current item.
   */
  void walk(const std::vector<std::string>& roots, const Step& step,
            std::unordered_set<std::string>& seen) const;

  // Run `fn` once per distinct item. Rethrows the first failure.
  void for_each(const std::vector<std::string>& items,
                const std::function<void(const std::string&)>& fn) const;

private:
  unsigned workers_;
};

} // namespace gitrelay
