#pragma once
#include "util/RESP.hpp"
#include <string>

namespace MiniKV {

class TCPClient {
public:
  TCPClient();
  ~TCPClient();

  TCPClient(const TCPClient &) = delete;
  TCPClient &operator=(const TCPClient &) = delete;

  // throws std::runtime_error when the server cannot be reached
  void connect_to_server(const std::string &address, int port);
  void close_connection();
  bool connected() const { return sock_fd_ >= 0; }

  // Sends a command line (split like the server splits inline requests)
  // as a multibulk request and waits for one reply.
  RESP execute(const std::string &command_line);
  // Sends bytes verbatim and waits for one reply.
  RESP send_raw(const std::string &bytes);
  // blocks until one complete reply has arrived
  RESP read_reply();

private:

  int sock_fd_;
  std::string buffer_;
};

// redis-cli style rendering of a reply
std::string format_reply(const RESP &resp, const std::string &indent = "");

} // namespace MiniKV
