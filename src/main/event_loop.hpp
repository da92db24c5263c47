#ifndef VALKYRIE_EVENT_LOOP_HPP
#define VALKYRIE_EVENT_LOOP_HPP

#include "connection.hpp"
#include "engine.hpp"
#include "io.hpp"
#include "waiter.hpp"

#include <ankerl/unordered_dense.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <tuple>
#include <vector>

namespace valkyrie {

class event_loop;

/**
 * Wakes a connection blocked in BLPOP. notify() may run on any thread, it
 * only queues the waiter with the owning loop; the connection is resumed on
 * the loop's own thread.
 */
class loop_waiter : public waiter,
                    public std::enable_shared_from_this<loop_waiter> {
public:
  loop_waiter(event_loop &loop, connection &owner);

  void notify() override;

  // the remaining members are for the loop's thread only

  [[nodiscard]] connection *owner() const noexcept { return owner_; }

  void detach() noexcept { owner_ = nullptr; }

private:
  event_loop &loop_;
  connection *owner_;
};

/**
 * A single threaded epoll loop owning a set of connections. Other threads
 * talk to it through a mailbox and an eventfd: waking blocked connections,
 * handing over accepted sockets and stopping it.
 */
class event_loop {
public:
  using clock = std::chrono::steady_clock;

  event_loop(std::size_t id, engine &db, std::size_t input_buffer_bytes);

  event_loop(const event_loop &) = delete;
  event_loop &operator=(const event_loop &) = delete;

  ~event_loop();

  [[nodiscard]] std::size_t id() const noexcept { return id_; }

  /**
   * Accept connections from listener. Call before run().
   */
  void listen(io::file_descriptor listener);

  /**
   * Deal accepted connections round-robin over loops instead of keeping them.
   * Call before run().
   */
  void deal_to(std::vector<event_loop *> loops);

  /**
   * Process events until stop is requested. Every connection is closed on
   * return.
   */
  void run(std::stop_token stop);

  /**
   * Take over an accepted connection. Safe from any thread.
   */
  void adopt(io::file_descriptor fd);

  /**
   * Queue w for a wakeup on this loop's thread. Safe from any thread.
   */
  void wake(std::shared_ptr<loop_waiter> w);

  void add_timer(clock::time_point deadline, int fd);

  void cancel_timer(clock::time_point deadline, int fd) noexcept;

private:
  void interrupt() noexcept;
  void on_event(const ::epoll_event &event);
  void on_accept();
  void on_mailbox();
  void on_timers();
  void add_connection(io::file_descriptor fd);
  void close(int fd);
  [[nodiscard]] int next_timeout() const;

  template <typename Function> void guarded(int fd, Function function);

  const std::size_t id_;
  engine &db_;
  const std::size_t input_buffer_bytes_;
  io::file_descriptor epoll_;
  io::file_descriptor wakeup_;
  io::file_descriptor listener_;
  std::vector<event_loop *> peers_;
  std::size_t next_peer_{};

  std::mutex mailbox_mutex_;
  std::vector<std::shared_ptr<loop_waiter>> woken_;
  std::vector<io::file_descriptor> adopted_;

  std::set<std::tuple<clock::time_point, int>> timers_;
  ankerl::unordered_dense::map<int, std::unique_ptr<connection>> connections_;
};

} // namespace valkyrie

#endif // VALKYRIE_EVENT_LOOP_HPP
