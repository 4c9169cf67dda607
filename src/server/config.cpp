#include "config.hpp"
#include "common/errors.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <fstream>
#include <sstream>

namespace MiniKV {

static std::string trim(const std::string &s) {
  auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto first = std::find_if(s.begin(), s.end(), not_space);
  if (first == s.end())
    return "";
  auto last = std::find_if(s.rbegin(), s.rend(), not_space).base();
  return std::string(first, last);
}

static int parse_int(const std::string &name, const std::string &value,
                     int min, int max) {
  int out = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), out);
  if (value.empty() || ec != std::errc() ||
      ptr != value.data() + value.size() || out < min || out > max) {
    throw ConfigError(std::format("invalid value '{}' for {}", value, name));
  }
  return out;
}

// shared by the config file and the command line; returns false for an
// unrecognised key
static bool apply_setting(ServerConfig &cfg, const std::string &key,
                          const std::string &value) {
  if (key == "bind" || key == "host") {
    cfg.host = value;
  } else if (key == "port") {
    cfg.port = parse_int(key, value, 0, 65535);
  } else if (key == "loglevel") {
    parse_log_level(value);
    cfg.log_level = value;
  } else if (key == "hz-interval-ms" || key == "expiry-interval") {
    cfg.expiry_interval_ms = parse_int(key, value, 0, 60 * 60 * 1000);
  } else if (key == "maxclients") {
    cfg.max_clients = parse_int(key, value, 1, 1000000);
  } else if (key == "timeout") {
    cfg.client_timeout = parse_int(key, value, 0, 365 * 24 * 3600);
  } else {
    return false;
  }
  return true;
}

void load_config_file(const std::string &path, ServerConfig &cfg) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw ConfigError(std::format("cannot open config file '{}'", path));
  }

  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    lineno++;
    std::string cleaned = trim(line.substr(0, line.find('#')));
    if (cleaned.empty())
      continue;

    std::istringstream iss(cleaned);
    std::string key;
    iss >> key;
    std::string value;
    std::getline(iss, value);
    value = trim(value);

    if (value.empty()) {
      throw ConfigError(
          std::format("{}:{}: missing value for '{}'", path, lineno, key));
    }
    if (!apply_setting(cfg, key, value)) {
      throw ConfigError(
          std::format("{}:{}: unknown directive '{}'", path, lineno, key));
    }
  }
}

ServerConfig parse_args(const std::vector<std::string> &args) {
  ServerConfig cfg;
  std::vector<std::pair<std::string, std::string>> flags;

  for (size_t i = 0; i < args.size(); i++) {
    const std::string &arg = args[i];
    if (arg == "-h" || arg == "--help") {
      cfg.show_help = true;
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      // bare port number, as older invocations passed it
      if (i == 0) {
        flags.emplace_back("port", arg);
        continue;
      }
      throw ConfigError(std::format("unexpected argument '{}'", arg));
    }

    std::string key = arg.substr(2);
    std::string value;
    size_t eq = key.find('=');
    if (eq != std::string::npos) {
      value = key.substr(eq + 1);
      key.resize(eq);
    } else if (i + 1 < args.size()) {
      value = args[++i];
    } else {
      throw ConfigError(std::format("missing value for --{}", key));
    }
    flags.emplace_back(std::move(key), std::move(value));
  }

  // the config file is the base layer, whatever its position on the line
  for (const auto &[key, value] : flags) {
    if (key == "config")
      load_config_file(value, cfg);
  }
  for (const auto &[key, value] : flags) {
    if (key == "config")
      continue;
    if (!apply_setting(cfg, key, value))
      throw ConfigError(std::format("unknown option --{}", key));
  }
  return cfg;
}

ServerConfig parse_args(int argc, char **argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  return parse_args(args);
}

std::string usage(const std::string &program) {
  return std::format(
      "Usage: {} [options]\n"
      "  --config <file>           read settings from a config file\n"
      "  --host, --bind <addr>     listen address (default 127.0.0.1)\n"
      "  --port <port>             listen port (default 6380, 0 = any)\n"
      "  --loglevel <level>        error | warn | info | debug\n"
      "  --expiry-interval <ms>    active expiry period, 0 disables\n"
      "  --maxclients <n>          maximum simultaneous clients\n"
      "  --timeout <seconds>       close idle clients, 0 disables\n"
      "  -h, --help                show this help\n",
      program);
}

} // namespace MiniKV
