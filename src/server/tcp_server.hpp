#pragma once
#include "common/concurrent_store.hpp"
#include "server/command_handler.hpp"
#include "server/config.hpp"
#include "server/server_stats.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>

namespace MiniKV {

class TCPServer {
public:
  TCPServer(const ServerConfig &config, ConcurrentStore &store);
  ~TCPServer();

  TCPServer(const TCPServer &) = delete;
  TCPServer &operator=(const TCPServer &) = delete;

  // Binds, listens and starts the accept and expiry threads. Returns once
  // the server is accepting; throws std::system_error if the socket setup
  // fails.
  void start();
  // Closes the listener and every client connection, then waits for all
  // server threads to finish. Safe to call more than once.
  void stop();

  // actual listening port, resolved after start() when configured as 0
  int port() const { return port_; }
  bool running() const { return running_; }
  const ServerStats &stats() const { return stats_; }

private:
  void accept_clients();
  void expiry_loop();
  void handle_client(int client_fd, i64 client_id);

  bool register_client(int client_fd);
  void unregister_client(int client_fd);

  ServerConfig config_;
  int port_;
  int server_fd_ = -1;
  std::atomic<bool> running_;

  ConcurrentStore &data_store_;
  ServerStats stats_;
  CommandHandler commands_;

  std::thread accept_thread_;
  std::thread maintenance_thread_;

  // signals the expiry loop to wake up early on stop()
  std::mutex maintenance_mtx_;
  std::condition_variable maintenance_cv_;

  std::mutex clients_mtx_;
  std::condition_variable clients_cv_;
  std::unordered_set<int> client_fds_;
  int active_clients_ = 0;
};

} // namespace MiniKV
