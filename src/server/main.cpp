#include "common/concurrent_store.hpp"
#include "common/errors.hpp"
#include "server/config.hpp"
#include "server/tcp_server.hpp"
#include "util/logger.hpp"
#include <csignal>
#include <cstring>
#include <iostream>
#include <pthread.h>

int main(int argc, char **argv) {
  MiniKV::ServerConfig config;
  try {
    config = MiniKV::parse_args(argc, argv);
    MiniKV::set_log_level(MiniKV::parse_log_level(config.log_level));
  } catch (const MiniKV::ConfigError &e) {
    std::cerr << "minikv-server: " << e.what() << "\n"
              << MiniKV::usage(argv[0]);
    return 2;
  }
  if (config.show_help) {
    std::cout << MiniKV::usage(argv[0]);
    return 0;
  }

  // block shutdown signals before any thread starts so only sigwait sees them
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);
  std::signal(SIGPIPE, SIG_IGN);

  MiniKV::ConcurrentStore store;
  MiniKV::TCPServer server(config, store);
  try {
    server.start();
  } catch (const std::exception &e) {
    MiniKV::log_error("cannot start server: {}", e.what());
    return 1;
  }

  int sig = 0;
  if (sigwait(&signals, &sig) == 0) {
    MiniKV::log_info("received {}, shutting down", strsignal(sig));
  }
  server.stop();
  return 0;
}
