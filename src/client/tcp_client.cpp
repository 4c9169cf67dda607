#include "../client/tcp_client.hpp"
#include "common/errors.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace MiniKV {

TCPClient::TCPClient() : sock_fd_(-1) {}

TCPClient::~TCPClient() { close_connection(); }

void TCPClient::connect_to_server(const std::string &address, int port) {
  close_connection();

  sockaddr_in server_addr{};
  server_addr.sin_family = AF_INET;
  server_addr.sin_port = htons(static_cast<uint16_t>(port));

  if (inet_pton(AF_INET, address.c_str(), &server_addr.sin_addr) <= 0)
    throw std::runtime_error("Invalid address/ Address not supported: " +
                             address);

  int fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0)
    throw std::runtime_error("Socket creation failed");

  if (connect(fd, reinterpret_cast<sockaddr *>(&server_addr),
              sizeof(server_addr)) < 0) {
    std::string reason = std::strerror(errno);
    close(fd);
    throw std::runtime_error("Could not connect to " + address + ":" +
                             std::to_string(port) + ": " + reason);
  }
  configure_socket_safety(fd);
  sock_fd_ = fd;
  buffer_.clear();
}

void TCPClient::close_connection() {
  if (sock_fd_ >= 0) {
    close(sock_fd_);
    sock_fd_ = -1;
  }
}

RESP TCPClient::execute(const std::string &command_line) {
  RESP request = convert_inline_to_RESP(command_line);
  if (request.elements.empty())
    throw ProtocolError("empty request");
  return send_raw(serialize_RESP(request));
}

RESP TCPClient::send_raw(const std::string &bytes) {
  if (sock_fd_ < 0)
    throw std::runtime_error("Not connected");
  if (!robust_send(sock_fd_, bytes.c_str(), bytes.size()))
    throw std::runtime_error("Failed to send data to server");
  return read_reply();
}

RESP TCPClient::read_reply() {
  while (true) {
    size_t pos = 0;
    auto reply = try_parse_RESP(buffer_, pos);
    if (reply) {
      buffer_.erase(0, pos);
      return std::move(*reply);
    }

    char temp[4096];
    ssize_t n = recv(sock_fd_, temp, sizeof(temp), 0);
    if (n < 0 && errno == EINTR)
      continue;
    if (n <= 0) {
      close_connection();
      throw std::runtime_error("Connection closed by server");
    }
    buffer_.append(temp, static_cast<size_t>(n));
  }
}

std::string format_reply(const RESP &resp, const std::string &indent) {
  switch (resp.resp_type) {
  case RESP::type::SIMPLE_STRING:
    return resp.str;
  case RESP::type::ERROR:
    return "(error) " + resp.str;
  case RESP::type::INTEGER:
    return "(integer) " + std::to_string(resp.integer);
  case RESP::type::BULK_STRING:
    if (resp.is_null)
      return "(nil)";
    return "\"" + resp.str + "\"";
  case RESP::type::ARRAY: {
    if (resp.is_null)
      return "(nil)";
    if (resp.elements.empty())
      return "(empty array)";
    std::string out;
    for (size_t i = 0; i < resp.elements.size(); i++) {
      std::string label = std::to_string(i + 1) + ") ";
      if (i > 0)
        out += "\n" + indent;
      out += label +
             format_reply(resp.elements[i],
                          indent + std::string(label.size(), ' '));
    }
    return out;
  }
  }
  return "";
}

} // namespace MiniKV
