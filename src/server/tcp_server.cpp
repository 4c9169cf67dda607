#include "../server/tcp_server.hpp"
#include "common/errors.hpp"
#include "util/RESP.hpp"
#include "util/logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <netinet/in.h>
#include <optional>
#include <sys/socket.h>
#include <sys/time.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace MiniKV {

TCPServer::TCPServer(const ServerConfig &config, ConcurrentStore &store)
    : config_(config), port_(config.port), running_(false),
      data_store_(store), commands_(store, stats_) {}

TCPServer::~TCPServer() { stop(); }

void TCPServer::start() {
  if (running_)
    return;

  sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(static_cast<u16>(config_.port));
  if (inet_pton(AF_INET, config_.host.c_str(), &address.sin_addr) != 1) {
    throw ConfigError("invalid bind address '" + config_.host + "'");
  }

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw std::system_error(errno, std::generic_category(), "socket");
  }
  int opt = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (bind(fd, reinterpret_cast<sockaddr *>(&address), sizeof(address)) != 0) {
    int err = errno;
    close(fd);
    throw std::system_error(err, std::generic_category(),
                            std::format("bind {}:{}", config_.host,
                                        config_.port));
  }
  if (listen(fd, SOMAXCONN) != 0) {
    int err = errno;
    close(fd);
    throw std::system_error(err, std::generic_category(), "listen");
  }

  socklen_t len = sizeof(address);
  if (getsockname(fd, reinterpret_cast<sockaddr *>(&address), &len) == 0) {
    port_ = ntohs(address.sin_port);
  }

  server_fd_ = fd;
  running_ = true;
  accept_thread_ = std::thread([this]() { accept_clients(); });
  if (config_.expiry_interval_ms > 0) {
    maintenance_thread_ = std::thread([this]() { expiry_loop(); });
  }
  log_info("Server started on {}:{}", config_.host, port_);
}

void TCPServer::stop() {
  bool was_running = running_.exchange(false);

  if (server_fd_ >= 0) {
    // wakes the blocked accept()
    shutdown(server_fd_, SHUT_RDWR);
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  if (server_fd_ >= 0) {
    close(server_fd_);
    server_fd_ = -1;
  }

  {
    std::lock_guard<std::mutex> lock(maintenance_mtx_);
  }
  maintenance_cv_.notify_all();
  if (maintenance_thread_.joinable()) {
    maintenance_thread_.join();
  }

  std::unique_lock<std::mutex> lock(clients_mtx_);
  for (int fd : client_fds_) {
    shutdown(fd, SHUT_RDWR);
  }
  clients_cv_.wait(lock, [this]() { return active_clients_ == 0; });

  if (was_running) {
    log_info("Server on port {} stopped", port_);
  }
}

void TCPServer::expiry_loop() {
  std::unique_lock<std::mutex> lock(maintenance_mtx_);
  auto interval = std::chrono::milliseconds(config_.expiry_interval_ms);
  while (running_) {
    maintenance_cv_.wait_for(lock, interval, [this]() { return !running_; });
    if (!running_)
      break;
    i64 reclaimed = data_store_.active_expiry_cycle();
    if (reclaimed > 0) {
      log_debug("expiry cycle reclaimed {} keys", reclaimed);
    }
  }
}

void TCPServer::accept_clients() {
  while (running_) {
    sockaddr_in client{};
    socklen_t addrlen = sizeof(client);
    int client_fd =
        accept(server_fd_, reinterpret_cast<sockaddr *>(&client), &addrlen);
    if (client_fd < 0) {
      if (!running_)
        break;
      if (errno == EINTR || errno == ECONNABORTED)
        continue;
      log_warn("accept() failed: {}", std::strerror(errno));
      if (errno == EMFILE || errno == ENFILE)
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      continue;
    }

    if (!register_client(client_fd)) {
      stats_.rejected_connections++;
      if (!send_RESP(client_fd,
                     make_error("ERR max number of clients reached")))
        log_debug("could not notify rejected client");
      close(client_fd);
      log_warn("rejected connection, {} clients connected",
               stats_.connected_clients.load());
      continue;
    }

    char ip[INET_ADDRSTRLEN] = "?";
    inet_ntop(AF_INET, &client.sin_addr, ip, sizeof(ip));
    i64 client_id = ++stats_.total_connections;
    log_debug("client #{} connected from {}:{}", client_id, ip,
              ntohs(client.sin_port));

    std::thread([this, client_fd, client_id]() {
      handle_client(client_fd, client_id);
      unregister_client(client_fd);
      log_debug("client #{} disconnected", client_id);
    }).detach();
  }
}

// false when the server is already at max_clients
bool TCPServer::register_client(int client_fd) {
  std::lock_guard<std::mutex> lock(clients_mtx_);
  if (active_clients_ >= config_.max_clients)
    return false;
  client_fds_.insert(client_fd);
  active_clients_++;
  stats_.connected_clients++;
  return true;
}

// closes under the lock so stop() can never shut down a recycled fd
void TCPServer::unregister_client(int client_fd) {
  std::lock_guard<std::mutex> lock(clients_mtx_);
  client_fds_.erase(client_fd);
  close(client_fd);
  active_clients_--;
  stats_.connected_clients--;
  clients_cv_.notify_all();
}

void TCPServer::handle_client(int client_fd, i64 client_id) {
  configure_socket_safety(client_fd);
  if (config_.client_timeout > 0) {
    timeval tv{};
    tv.tv_sec = config_.client_timeout;
    setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  }

  std::string buffer;
  bool open = true;
  try {
    while (open && running_) {
      char temp[4096];
      ssize_t n = recv(client_fd, temp, sizeof(temp), 0);
      if (n == 0)
        break;
      if (n < 0) {
        if (errno == EINTR)
          continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
          log_debug("client #{} idle timeout", client_id);
        } else if (running_) {
          log_warn("client #{} recv() failed: {}", client_id,
                   std::strerror(errno));
        }
        break;
      }

      buffer.append(temp, static_cast<size_t>(n));

      while (open) {
        std::optional<Request> req;
        try {
          req = next_request(buffer);
        } catch (const ProtocolError &e) {
          log_debug("client #{} protocol error: {}", client_id, e.what());
          open = send_RESP(client_fd, make_error(e.what()));
          continue;
        }
        if (!req)
          break;

        if (req->name == "QUIT") {
          if (!send_RESP(client_fd, make_simple("OK")))
            log_debug("client #{} gone before QUIT reply", client_id);
          open = false;
          break;
        }

        // the store lock is released before the reply hits the socket
        RESP reply = commands_.dispatch(*req);
        open = send_RESP(client_fd, reply);
      }
    }
  } catch (const std::exception &e) {
    log_error("client #{} dropped: {}", client_id, e.what());
  }
}

} // namespace MiniKV
