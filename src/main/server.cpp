#include "server.hpp"
#include "log.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace {

namespace io = valkyrie::io;

io::file_descriptor make_listener(const std::string &address,
                                  std::uint16_t port, bool reuseport) {
  sockaddr_in listen_address{
      .sin_family = AF_INET,
      .sin_port = htons(port),
  };

  if (::inet_pton(AF_INET, address.c_str(), &listen_address.sin_addr) != 1)
    throw valkyrie::config_error("invalid IPv4 address '" + address + "'");

  io::file_descriptor sockfd(::socket, AF_INET,
                             SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);

  io::set_socket_option(sockfd.value(), SOL_SOCKET, SO_REUSEADDR, 1);
  if (reuseport)
    io::set_socket_option(sockfd.value(), SOL_SOCKET, SO_REUSEPORT, 1);

  io::posix_call(::bind, sockfd.value(),
                 reinterpret_cast<sockaddr *>(&listen_address),
                 socklen_t(sizeof(listen_address)));

  io::posix_call(::listen, sockfd.value(), SOMAXCONN);

  return sockfd;
}

std::uint16_t bound_port(int fd) {
  sockaddr_in address{};
  socklen_t len = sizeof(address);
  io::posix_call(::getsockname, fd, reinterpret_cast<sockaddr *>(&address),
                 &len);
  return ntohs(address.sin_port);
}

} // namespace

valkyrie::server::server(const config &cfg) : engine_(cfg.shards) {
  if (cfg.threads == 0)
    throw config_error("at least one thread is required");

  for (std::size_t i = 0; i < cfg.threads; ++i) {
    loops_.push_back(
        std::make_unique<event_loop>(i, engine_, cfg.input_buffer_bytes));
  }

  switch (cfg.mode) {
  case listener_mode::reuseport: {
    // the first bind settles an ephemeral port for the rest to share
    auto port = cfg.port;
    for (auto &loop : loops_) {
      auto listener = make_listener(cfg.address, port, true);
      port = bound_port(listener.value());
      loop->listen(std::move(listener));
    }
    port_ = port;
    break;
  }
  case listener_mode::dispatcher: {
    auto listener = make_listener(cfg.address, cfg.port, false);
    port_ = bound_port(listener.value());

    std::vector<event_loop *> peers;
    for (auto &loop : loops_)
      peers.push_back(loop.get());

    loops_.front()->listen(std::move(listener));
    loops_.front()->deal_to(std::move(peers));
    break;
  }
  }

  log::info("listening on {}:{} ({} mode, {} threads, {} shards)",
            cfg.address, port_, mode_name(cfg.mode), cfg.threads,
            engine_.shard_count());

  for (auto &loop : loops_) {
    threads_.emplace_back([&self = *loop](std::stop_token stop) {
      try {
        self.run(stop);
      } catch (const std::exception &e) {
        log::error("event loop {} failed: {}", self.id(), e.what());
      }
    });
  }
}

valkyrie::server::~server() { stop(); }

void valkyrie::server::stop() {
  for (auto &thread : threads_)
    thread.request_stop();
  for (auto &thread : threads_) {
    if (thread.joinable())
      thread.join();
  }
}
