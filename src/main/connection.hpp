#ifndef VALKYRIE_CONNECTION_HPP
#define VALKYRIE_CONNECTION_HPP

#include "commands.hpp"
#include "engine.hpp"
#include "io.hpp"
#include "request.hpp"
#include "resp.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace valkyrie {

class event_loop;
class loop_waiter;

/**
 * The peer shut down its end of the connection.
 */
class peer_closed : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

/**
 * One client connection, driven by the event loop that owns it.
 *
 * A connection is either reading, decoding and executing requests in arrival
 * order, or blocked in a BLPOP. While blocked it leaves further input
 * buffered and resumes once the pop completes or times out. Replies are
 * written without waiting; while too many are unsent the connection stops
 * decoding and resumes when the socket becomes writable again.
 *
 * Every member runs on the owning loop's thread. The on_* members throw when
 * the connection should be closed; a protocol error has already been replied
 * to by then.
 */
class connection {
public:
  connection(io::file_descriptor fd, engine &db, event_loop &loop,
             std::size_t input_buffer_bytes);

  connection(const connection &) = delete;
  connection &operator=(const connection &) = delete;

  ~connection();

  [[nodiscard]] int fd() const noexcept { return fd_.value(); }

  [[nodiscard]] bool blocked() const noexcept {
    return state_ == state::blocked;
  }

  void on_readable();

  void on_writable();

  /**
   * A key this connection is blocked on has been pushed to.
   */
  void on_wakeup();

  /**
   * The blocking pop's deadline has passed.
   */
  void on_timeout();

private:
  enum class state { reading, blocked };

  void process();
  void execute(const args_t &args);
  void block(commands::blocking_pop pop);
  bool try_complete();
  bool congested();
  void finish_wait() noexcept;
  void flush();

  io::file_descriptor fd_;
  engine &db_;
  event_loop &loop_;
  io::ring_buffer in_;
  std::size_t read_index_{};
  std::size_t write_index_{};
  io::ofstreambuf out_buf_;
  std::ostream out_{&out_buf_};
  resp::writer writer_{out_};
  request_builder request_;
  state state_{state::reading};

  std::vector<std::string> keys_;
  std::vector<std::string_view> key_views_;
  std::shared_ptr<loop_waiter> waiter_;
  engine::registration registration_;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace valkyrie

#endif // VALKYRIE_CONNECTION_HPP
