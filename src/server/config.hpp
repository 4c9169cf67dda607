#pragma once

#include "common/types.hpp"
#include <string>
#include <vector>

namespace MiniKV {

struct ServerConfig {
  std::string host = "127.0.0.1";
  int port = 6380;
  std::string log_level = "info";
  // active expiry sweep period, 0 disables the sweep
  int expiry_interval_ms = 100;
  int max_clients = 10000;
  // idle seconds before a client is dropped, 0 means never
  int client_timeout = 0;
  bool show_help = false;
};

// Applies `key value` lines from a config file on top of `cfg`.
void load_config_file(const std::string &path, ServerConfig &cfg);

// Defaults, then --config file, then the remaining flags.
ServerConfig parse_args(const std::vector<std::string> &args);
ServerConfig parse_args(int argc, char **argv);

std::string usage(const std::string &program);

} // namespace MiniKV
