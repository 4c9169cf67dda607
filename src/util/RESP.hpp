#pragma once
#include <cstddef>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <optional>
#include <string>
#include <sys/socket.h>
#include <vector>

namespace MiniKV {

struct RESP {
  enum class type { SIMPLE_STRING, ERROR, INTEGER, BULK_STRING, ARRAY };
  type resp_type;
  std::string str;
  long long integer = 0;
  std::vector<RESP> elements;
  bool is_null = false;
};

// A decoded client command. `name` is upper-cased.
struct Request {
  std::string name;
  std::vector<std::string> args;
};

constexpr int MAX_RESP_DEPTH = 128;
constexpr long long MAX_BULK_LEN = 512 * 1024 * 1024;
constexpr long long MAX_ARRAY_COUNT = 1024 * 1024;
constexpr std::size_t MAX_INLINE_LEN = 64 * 1024;

RESP make_simple(std::string text);
RESP make_error(std::string text);
RESP make_integer(long long value);
RESP make_bulk(std::string value);
RESP make_null_bulk();
RESP make_array(const std::vector<std::string> &items);

std::string serialize_RESP(const RESP &resp);

// Parses one RESP value starting at `pos`. Returns nullopt and leaves `pos`
// untouched when `data` ends before the value does. Throws ProtocolError on
// malformed input.
std::optional<RESP> try_parse_RESP(const std::string &data, size_t &pos);
// Same, but a truncated value is an error too.
RESP parse_RESP(const std::string &data, size_t &pos);

std::vector<std::string> RESP_to_tokens(const RESP &resp);

// Splits an inline command line on whitespace. Double-quoted tokens honour
// \n \r \t \\ \" escapes, single-quoted tokens are taken literally.
std::vector<std::string> split_command_line(const std::string &line);
RESP convert_inline_to_RESP(const std::string &input);

// Pops one complete request (inline or multi-bulk) off the front of
// `buffer`. Returns nullopt when more bytes are needed. On ProtocolError the
// offending bytes have already been discarded.
std::optional<Request> next_request(std::string &buffer);
// Decodes a self-contained request; empty or unterminated input throws.
Request decode_request(const std::string &data);

bool robust_send(int sock_fd, const char *data, size_t len);

inline bool send_RESP(int sock_fd, const RESP &resp) {
  std::string serialized = serialize_RESP(resp);
  return robust_send(sock_fd, serialized.c_str(), serialized.size());
}

inline void configure_socket_safety(int sock_fd) {
  int nodelay = 1;
  setsockopt(sock_fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
  int keepalive = 1;
  setsockopt(sock_fd, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

} // namespace MiniKV
