#include "config.hpp"
#include "log.hpp"
#include "server.hpp"

#include <iostream>
#include <system_error>

#include <pthread.h>
#include <signal.h>

namespace {

void install_sig_handlers() {
  // replies are written with write(), a vanished peer shouldn't kill us
  struct sigaction sa {};
  sa.sa_handler = SIG_IGN;
  valkyrie::io::posix_call(::sigaction, SIGPIPE, &sa, nullptr);
}

::sigset_t shutdown_signals() {
  ::sigset_t result;
  ::sigemptyset(&result);
  ::sigaddset(&result, SIGINT);
  ::sigaddset(&result, SIGTERM);
  return result;
}

} // namespace

int main(int argc, char *argv[]) {
  namespace ns = valkyrie;

  std::optional<ns::config> cfg;
  try {
    cfg = ns::parse_config(argc, argv, std::cout);
  } catch (const ns::config_error &e) {
    std::cerr << "valkyrie-server: " << e.what() << "\n\n"
              << ns::options_description() << '\n';
    return 1;
  }

  if (!cfg)
    return 0;

  ns::log::set_level(cfg->log_level);

  try {
    install_sig_handlers();

    // block before any thread starts so only sigwait() sees them
    const auto signals = shutdown_signals();
    if (const auto rc = ::pthread_sigmask(SIG_BLOCK, &signals, nullptr))
      throw std::system_error(rc, std::generic_category());

    ns::server server(*cfg);

    int sig{};
    if (const auto rc = ::sigwait(&signals, &sig))
      throw std::system_error(rc, std::generic_category());

    ns::log::info("received signal {}, shutting down", sig);
    server.stop();
  } catch (const std::exception &e) {
    ns::log::error("{}", e.what());
    return 1;
  }

  return 0;
}
