#include "waiter.hpp"

void valkyrie::condition_waiter::notify() {
  {
    std::lock_guard lock(mutex_);
    notified_ = true;
  }
  cv_.notify_all();
}

bool valkyrie::condition_waiter::wait(
    const std::optional<std::chrono::steady_clock::time_point> deadline,
    std::stop_token stop) {
  std::unique_lock lock(mutex_);
  const auto notified = [this]() { return notified_; };

  const bool result = deadline
                          ? cv_.wait_until(lock, stop, *deadline, notified)
                          : cv_.wait(lock, stop, notified);

  notified_ = false;
  return result;
}
