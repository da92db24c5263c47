#ifndef VALKYRIE_SERVER_HPP
#define VALKYRIE_SERVER_HPP

#include "config.hpp"
#include "engine.hpp"
#include "event_loop.hpp"

#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace valkyrie {

/**
 * The engine plus one event loop per configured thread, listening as soon as
 * it's constructed.
 */
class server {
public:
  explicit server(const config &cfg);

  server(const server &) = delete;
  server &operator=(const server &) = delete;

  ~server();

  /**
   * The port actually bound, which differs from the configured one when that
   * was 0.
   */
  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

  [[nodiscard]] engine &db() noexcept { return engine_; }

  /**
   * Stop every event loop and wait for their threads. Idempotent.
   */
  void stop();

private:
  engine engine_;
  std::uint16_t port_{};
  std::vector<std::unique_ptr<event_loop>> loops_;
  std::vector<std::jthread> threads_;
};

} // namespace valkyrie

#endif // VALKYRIE_SERVER_HPP
