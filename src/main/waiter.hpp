#ifndef VALKYRIE_WAITER_HPP
#define VALKYRIE_WAITER_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>

namespace valkyrie {

/**
 * A blocking pop suspended on one or more keys. Shards call notify() after a
 * push to a key the waiter is registered on.
 *
 * notify() is called from whichever thread pushed, never with a shard lock
 * held, and must not block.
 */
class waiter {
public:
  virtual void notify() = 0;

  waiter() = default;
  waiter(const waiter &) = delete;
  waiter &operator=(const waiter &) = delete;

  virtual ~waiter() = default;
};

/**
 * A waiter for callers that park a thread.
 */
class condition_waiter : public waiter {
public:
  void notify() override;

  /**
   * Block until notified, the deadline passes or a stop is requested.
   * @return true if woken by a notification, which is consumed
   */
  bool wait(std::optional<std::chrono::steady_clock::time_point> deadline,
            std::stop_token stop);

private:
  std::mutex mutex_;
  std::condition_variable_any cv_;
  bool notified_{};
};

} // namespace valkyrie

#endif // VALKYRIE_WAITER_HPP
