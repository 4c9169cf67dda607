#include "RESP.hpp"
#include "common/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <vector>

namespace MiniKV {

// longest "$<len>" / "*<count>" header accepted while waiting for its CRLF
constexpr size_t MAX_HEADER_LEN = 64;

static bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// reads a line up to \r\n; nullopt when the terminator has not arrived yet
static std::optional<std::string> read_line_CRLF(const std::string &data,
                                                 size_t &pos) {
  size_t e = data.find("\r\n", pos);
  if (e == std::string::npos) {
    if (data.size() - pos > MAX_HEADER_LEN)
      throw ProtocolError("line too long");
    return std::nullopt;
  }
  std::string out = data.substr(pos, e - pos);
  pos = e + 2;
  return out;
}

// attempts to convert to long long
static long long stoll_safe(const std::string &line, const char *what) {
  try {
    size_t pos;
    long long val = std::stoll(line, &pos);

    if (pos != line.length()) {
      throw ProtocolError(std::string("invalid ") + what);
    }
    return val;
  } catch (const std::invalid_argument &) {
    throw ProtocolError(std::string("invalid ") + what);
  } catch (const std::out_of_range &) {
    throw ProtocolError(std::string("invalid ") + what);
  }
}

RESP make_simple(std::string text) {
  return RESP{.resp_type = RESP::type::SIMPLE_STRING, .str = std::move(text)};
}

RESP make_error(std::string text) {
  return RESP{.resp_type = RESP::type::ERROR, .str = std::move(text)};
}

RESP make_integer(long long value) {
  return RESP{.resp_type = RESP::type::INTEGER, .integer = value};
}

RESP make_bulk(std::string value) {
  return RESP{.resp_type = RESP::type::BULK_STRING, .str = std::move(value)};
}

RESP make_null_bulk() {
  return RESP{.resp_type = RESP::type::BULK_STRING, .is_null = true};
}

RESP make_array(const std::vector<std::string> &items) {
  RESP resp{.resp_type = RESP::type::ARRAY};
  resp.elements.reserve(items.size());
  for (const auto &item : items) {
    resp.elements.push_back(make_bulk(item));
  }
  return resp;
}

static std::optional<RESP> parse_RESP_internal(const std::string &data,
                                               size_t &pos, int depth) {
  if (depth > MAX_RESP_DEPTH) {
    throw ProtocolError("nesting depth exceeded");
  }

  if (pos >= data.size()) {
    return std::nullopt;
  }

  size_t p = pos;
  char prefix = data[p++];

  switch (prefix) {
  case '+':
  case '-': {
    size_t e = data.find("\r\n", p);
    if (e == std::string::npos)
      return std::nullopt;
    RESP resp{};
    resp.resp_type =
        (prefix == '+') ? RESP::type::SIMPLE_STRING : RESP::type::ERROR;
    resp.str = data.substr(p, e - p);
    pos = e + 2;
    return resp;
  }
  case ':': {
    auto line = read_line_CRLF(data, p);
    if (!line)
      return std::nullopt;
    RESP resp{};
    resp.resp_type = RESP::type::INTEGER;
    resp.integer = stoll_safe(*line, "integer");
    pos = p;
    return resp;
  }
  case '$': {
    auto line = read_line_CRLF(data, p);
    if (!line)
      return std::nullopt;
    long long len = stoll_safe(*line, "bulk length");

    if (len == -1) {
      pos = p;
      return make_null_bulk();
    }

    if (len < 0 || len > MAX_BULK_LEN) {
      throw ProtocolError("invalid bulk length");
    }

    size_t safe_len = static_cast<size_t>(len);

    if (p + safe_len + 2 > data.size()) {
      return std::nullopt;
    }

    if (data.compare(p + safe_len, 2, "\r\n") != 0) {
      throw ProtocolError("bulk string missing trailing CRLF");
    }

    RESP resp = make_bulk(data.substr(p, safe_len));
    pos = p + safe_len + 2;
    return resp;
  }
  case '*': {
    auto line = read_line_CRLF(data, p);
    if (!line)
      return std::nullopt;
    long long count = stoll_safe(*line, "multibulk length");

    if (count == -1) {
      pos = p;
      return RESP{.resp_type = RESP::type::ARRAY, .is_null = true};
    }

    if (count < 0 || count > MAX_ARRAY_COUNT) {
      throw ProtocolError("invalid multibulk length");
    }

    RESP resp{};
    resp.resp_type = RESP::type::ARRAY;
    resp.elements.reserve(static_cast<size_t>(std::min(count, 1024LL)));
    for (long long i = 0; i < count; ++i) {
      auto element = parse_RESP_internal(data, p, depth + 1);
      if (!element)
        return std::nullopt;
      resp.elements.emplace_back(std::move(*element));
    }
    pos = p;
    return resp;
  }
  default:
    throw ProtocolError(std::string("unexpected type byte '") + prefix + "'");
  }
}

std::optional<RESP> try_parse_RESP(const std::string &data, size_t &pos) {
  return parse_RESP_internal(data, pos, 0);
}

RESP parse_RESP(const std::string &data, size_t &pos) {
  auto resp = parse_RESP_internal(data, pos, 0);
  if (!resp) {
    throw ProtocolError("unexpected end of data");
  }
  return std::move(*resp);
}

// convert a RESP struct into a string
std::string serialize_RESP(const RESP &resp) {
  switch (resp.resp_type) {
  case RESP::type::SIMPLE_STRING:
    return "+" + resp.str + "\r\n";
  case RESP::type::ERROR:
    return "-" + resp.str + "\r\n";
  case RESP::type::INTEGER:
    return ":" + std::to_string(resp.integer) + "\r\n";
  case RESP::type::BULK_STRING:
    if (resp.is_null) {
      return "$-1\r\n";
    } else {
      return "$" + std::to_string(resp.str.size()) + "\r\n" + resp.str + "\r\n";
    }
  case RESP::type::ARRAY:
    if (resp.is_null) {
      return "*-1\r\n";
    } else {
      std::stringstream ss;
      ss << "*" << resp.elements.size() << "\r\n";
      for (const auto &element : resp.elements) {
        ss << serialize_RESP(element);
      }
      return ss.str();
    }
  }
  throw std::logic_error("unsupported RESP type for serialization");
}

// tokenize a RESP struct into a vector
std::vector<std::string> RESP_to_tokens(const RESP &resp) {
  std::vector<std::string> tokens;

  if (resp.resp_type != RESP::type::ARRAY || resp.is_null) {
    throw ProtocolError("expected a multibulk request");
  }

  for (const auto &element : resp.elements) {
    if (element.resp_type != RESP::type::BULK_STRING || element.is_null) {
      throw ProtocolError("expected bulk strings in multibulk request");
    }
    tokens.push_back(element.str);
  }

  return tokens;
}

static char unescape(char c) {
  switch (c) {
  case 'n':
    return '\n';
  case 'r':
    return '\r';
  case 't':
    return '\t';
  case 'b':
    return '\b';
  case 'a':
    return '\a';
  default:
    return c;
  }
}

std::vector<std::string> split_command_line(const std::string &line) {
  std::vector<std::string> tokens;
  size_t i = 0;
  const size_t n = line.size();

  while (true) {
    while (i < n && is_space(line[i]))
      i++;
    if (i >= n)
      return tokens;

    std::string current;
    bool in_double = false;
    bool in_single = false;
    bool done = false;

    while (!done) {
      if (in_double) {
        if (i >= n)
          throw ProtocolError("unbalanced quotes in request");
        char c = line[i];
        if (c == '\\' && i + 1 < n) {
          current.push_back(unescape(line[++i]));
        } else if (c == '"') {
          // closing quote must end the token
          if (i + 1 < n && !is_space(line[i + 1]))
            throw ProtocolError("unbalanced quotes in request");
          done = true;
        } else {
          current.push_back(c);
        }
      } else if (in_single) {
        if (i >= n)
          throw ProtocolError("unbalanced quotes in request");
        char c = line[i];
        if (c == '\\' && i + 1 < n && line[i + 1] == '\'') {
          current.push_back('\'');
          i++;
        } else if (c == '\'') {
          if (i + 1 < n && !is_space(line[i + 1]))
            throw ProtocolError("unbalanced quotes in request");
          done = true;
        } else {
          current.push_back(c);
        }
      } else if (i >= n) {
        done = true;
      } else {
        char c = line[i];
        if (is_space(c))
          done = true;
        else if (c == '"')
          in_double = true;
        else if (c == '\'')
          in_single = true;
        else
          current.push_back(c);
      }
      if (i < n)
        i++;
    }
    tokens.push_back(std::move(current));
  }
}

// converts a command line into the multibulk array a client sends
RESP convert_inline_to_RESP(const std::string &input) {
  return make_array(split_command_line(input));
}

static Request to_request(std::vector<std::string> tokens) {
  if (tokens.empty()) {
    throw ProtocolError("empty request");
  }
  Request req;
  req.name = std::move(tokens.front());
  std::transform(req.name.begin(), req.name.end(), req.name.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  req.args.assign(std::make_move_iterator(tokens.begin() + 1),
                  std::make_move_iterator(tokens.end()));
  return req;
}

// A request is an array of bulk strings only. Every other element type is
// refused on its type byte, so no element can buffer without a length bound.
static std::optional<std::vector<std::string>>
parse_request_frame(const std::string &data, size_t &pos) {
  size_t p = pos + 1;
  auto header = read_line_CRLF(data, p);
  if (!header)
    return std::nullopt;
  long long count = stoll_safe(*header, "multibulk length");
  if (count < -1 || count > MAX_ARRAY_COUNT) {
    throw ProtocolError("invalid multibulk length");
  }

  std::vector<std::string> tokens;
  tokens.reserve(static_cast<size_t>(std::clamp(count, 0LL, 1024LL)));
  for (long long i = 0; i < count; ++i) {
    if (p >= data.size())
      return std::nullopt;
    if (data[p] != '$') {
      throw ProtocolError(std::string("expected '$', got '") + data[p] + "'");
    }
    auto element = parse_RESP_internal(data, p, 1);
    if (!element)
      return std::nullopt;
    if (element->is_null) {
      throw ProtocolError("expected bulk strings in multibulk request");
    }
    tokens.push_back(std::move(element->str));
  }
  pos = p;
  return tokens;
}

std::optional<Request> next_request(std::string &buffer) {
  if (buffer.empty())
    return std::nullopt;

  if (buffer[0] == '*') {
    size_t pos = 0;
    std::optional<std::vector<std::string>> tokens;
    try {
      tokens = parse_request_frame(buffer, pos);
    } catch (const ProtocolError &) {
      // no way to find the next frame boundary, drop what we have
      buffer.clear();
      throw;
    }
    if (!tokens)
      return std::nullopt;
    buffer.erase(0, pos);
    return to_request(std::move(*tokens));
  }

  size_t lf = buffer.find('\n');
  if (lf == std::string::npos) {
    if (buffer.size() > MAX_INLINE_LEN) {
      buffer.clear();
      throw ProtocolError("too big inline request");
    }
    return std::nullopt;
  }

  std::string line = buffer.substr(0, lf);
  buffer.erase(0, lf + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return to_request(split_command_line(line));
}

Request decode_request(const std::string &data) {
  if (data.empty()) {
    throw ProtocolError("empty request");
  }
  std::string buffer = data;
  auto req = next_request(buffer);
  if (!req) {
    throw ProtocolError("unterminated request");
  }
  return std::move(*req);
}

bool robust_send(int sock_fd, const char *data, size_t len) {
  if (sock_fd < 0 || !data || len == 0) {
    return false;
  }

  size_t sent = 0;

  while (sent < len) {
    ssize_t n = send(sock_fd, data + sent, len - sent, MSG_NOSIGNAL);

    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      // EAGAIN here means the send timeout fired; ECONNRESET, EPIPE etc.
      // mean the peer is gone. Either way the connection is done.
      return false;
    }

    if (n == 0) {
      return false;
    }
    sent += static_cast<size_t>(n);
  }

  return true;
}

} // namespace MiniKV
