#pragma once

#include <stdexcept>
#include <string>

namespace MiniKV {

// what() carries the reply text sent to the client, minus the leading '-'
class MiniKVError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class ProtocolError : public MiniKVError {
public:
  explicit ProtocolError(const std::string &detail)
      : MiniKVError("ERR Protocol error: " + detail) {}
};

class ArityError : public MiniKVError {
public:
  explicit ArityError(const std::string &command)
      : MiniKVError("ERR wrong number of arguments for '" + command +
                    "' command") {}
};

class TypeError : public MiniKVError {
public:
  TypeError() : MiniKVError("ERR value is not an integer or out of range") {}
  explicit TypeError(const std::string &message) : MiniKVError(message) {}
};

class UnknownCommandError : public MiniKVError {
public:
  explicit UnknownCommandError(const std::string &command)
      : MiniKVError("ERR unknown command '" + command + "'") {}
};

class SyntaxError : public MiniKVError {
public:
  SyntaxError() : MiniKVError("ERR syntax error") {}
  explicit SyntaxError(const std::string &message) : MiniKVError(message) {}
};

class NoSuchKeyError : public MiniKVError {
public:
  NoSuchKeyError() : MiniKVError("ERR no such key") {}
};

class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace MiniKV
