#include "command_handler.hpp"
#include "common/errors.hpp"
#include "util/logger.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <limits>

namespace MiniKV {

static std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

static std::string to_upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

static i64 parse_integer_arg(const std::string &s) {
  i64 out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
    throw TypeError();
  return out;
}

// seconds or milliseconds argument -> milliseconds, rejecting overflow
static i64 parse_ttl_ms(const std::string &s, i64 unit_ms,
                        const std::string &command) {
  i64 amount = parse_integer_arg(s);
  if (amount > std::numeric_limits<i64>::max() / unit_ms ||
      amount < std::numeric_limits<i64>::min() / unit_ms)
    throw SyntaxError("ERR invalid expire time in '" + command + "' command");
  return amount * unit_ms;
}

CommandHandler::CommandHandler(ConcurrentStore &store, ServerStats &stats)
    : store_(store), stats_(stats) {
  commands_ = {
      {"PING", {&CommandHandler::handle_ping, 0, 1}},
      {"ECHO", {&CommandHandler::handle_echo, 1, 1}},
      {"SET", {&CommandHandler::handle_set, 2, -1}},
      {"GET", {&CommandHandler::handle_get, 1, 1}},
      {"DEL", {&CommandHandler::handle_del, 1, -1}},
      {"EXISTS", {&CommandHandler::handle_exists, 1, -1}},
      {"EXPIRE", {&CommandHandler::handle_expire, 2, 2}},
      {"PEXPIRE", {&CommandHandler::handle_pexpire, 2, 2}},
      {"PERSIST", {&CommandHandler::handle_persist, 1, 1}},
      {"TTL", {&CommandHandler::handle_ttl, 1, 1}},
      {"PTTL", {&CommandHandler::handle_pttl, 1, 1}},
      {"KEYS", {&CommandHandler::handle_keys, 1, 1}},
      {"INCR", {&CommandHandler::handle_incr, 1, 1}},
      {"DECR", {&CommandHandler::handle_decr, 1, 1}},
      {"INCRBY", {&CommandHandler::handle_incrby, 2, 2}},
      {"DECRBY", {&CommandHandler::handle_decrby, 2, 2}},
      {"APPEND", {&CommandHandler::handle_append, 2, 2}},
      {"STRLEN", {&CommandHandler::handle_strlen, 1, 1}},
      {"RENAME", {&CommandHandler::handle_rename, 2, 2}},
      {"TYPE", {&CommandHandler::handle_type, 1, 1}},
      {"DBSIZE", {&CommandHandler::handle_dbsize, 0, 0}},
      {"FLUSHDB", {&CommandHandler::handle_flushdb, 0, 0}},
      {"INFO", {&CommandHandler::handle_info, 0, 1}},
  };
}

bool CommandHandler::is_known(const std::string &name) const {
  return commands_.count(to_upper(name)) > 0;
}

RESP CommandHandler::execute(const Request &req) {
  std::string name = to_upper(req.name);
  auto it = commands_.find(name);
  if (it == commands_.end())
    throw UnknownCommandError(to_lower(name));

  const CommandSpec &spec = it->second;
  int argc = static_cast<int>(req.args.size());
  if (argc < spec.min_args || (spec.max_args >= 0 && argc > spec.max_args))
    throw ArityError(to_lower(name));

  stats_.total_commands++;
  return (this->*spec.handler)(req.args);
}

RESP CommandHandler::dispatch(const Request &req) {
  try {
    return execute(req);
  } catch (const MiniKVError &e) {
    log_debug("command {} failed: {}", req.name, e.what());
    return make_error(e.what());
  }
}

RESP CommandHandler::handle_ping(const Args &args) {
  if (!args.empty())
    return make_bulk(args[0]);
  return make_simple("PONG");
}

RESP CommandHandler::handle_echo(const Args &args) {
  return make_bulk(args[0]);
}

// SET key value [EX seconds | PX milliseconds] [NX | XX]
RESP CommandHandler::handle_set(const Args &args) {
  SetOptions opts;
  bool has_ttl = false;

  for (size_t i = 2; i < args.size(); i++) {
    std::string opt = to_upper(args[i]);
    if ((opt == "EX" || opt == "PX") && !has_ttl && i + 1 < args.size()) {
      opts.ttl_ms = parse_ttl_ms(args[++i], opt == "EX" ? 1000 : 1, "set");
      if (opts.ttl_ms <= 0)
        throw SyntaxError("ERR invalid expire time in 'set' command");
      has_ttl = true;
    } else if (opt == "NX" && !opts.only_if_present) {
      opts.only_if_absent = true;
    } else if (opt == "XX" && !opts.only_if_absent) {
      opts.only_if_present = true;
    } else {
      throw SyntaxError();
    }
  }

  if (!store_.set(args[0], args[1], opts))
    return make_null_bulk();
  return make_simple("OK");
}

RESP CommandHandler::handle_get(const Args &args) {
  auto value = store_.get(args[0]);
  if (!value)
    return make_null_bulk();
  return make_bulk(std::move(*value));
}

RESP CommandHandler::handle_del(const Args &args) {
  return make_integer(store_.del(args));
}

RESP CommandHandler::handle_exists(const Args &args) {
  return make_integer(store_.exists(args));
}

RESP CommandHandler::handle_expire(const Args &args) {
  i64 ttl = parse_ttl_ms(args[1], 1000, "expire");
  return make_integer(store_.expire(args[0], ttl) ? 1 : 0);
}

RESP CommandHandler::handle_pexpire(const Args &args) {
  i64 ttl = parse_ttl_ms(args[1], 1, "pexpire");
  return make_integer(store_.expire(args[0], ttl) ? 1 : 0);
}

RESP CommandHandler::handle_persist(const Args &args) {
  return make_integer(store_.persist(args[0]) ? 1 : 0);
}

// a live key never reports 0, remaining time is rounded up
RESP CommandHandler::handle_ttl(const Args &args) {
  i64 ms = store_.ttl_ms(args[0]);
  if (ms < 0)
    return make_integer(ms);
  return make_integer(ms / 1000 + (ms % 1000 != 0 ? 1 : 0));
}

RESP CommandHandler::handle_pttl(const Args &args) {
  return make_integer(store_.ttl_ms(args[0]));
}

RESP CommandHandler::handle_keys(const Args &args) {
  return make_array(store_.keys(args[0]));
}

RESP CommandHandler::handle_incr(const Args &args) {
  return make_integer(store_.incr_by(args[0], 1));
}

RESP CommandHandler::handle_decr(const Args &args) {
  return make_integer(store_.incr_by(args[0], -1));
}

RESP CommandHandler::handle_incrby(const Args &args) {
  return make_integer(store_.incr_by(args[0], parse_integer_arg(args[1])));
}

RESP CommandHandler::handle_decrby(const Args &args) {
  i64 delta = parse_integer_arg(args[1]);
  if (delta == std::numeric_limits<i64>::min())
    throw TypeError("ERR decrement would overflow");
  return make_integer(store_.incr_by(args[0], -delta));
}

RESP CommandHandler::handle_append(const Args &args) {
  return make_integer(store_.append(args[0], args[1]));
}

RESP CommandHandler::handle_strlen(const Args &args) {
  return make_integer(store_.strlen(args[0]));
}

RESP CommandHandler::handle_rename(const Args &args) {
  store_.rename(args[0], args[1]);
  return make_simple("OK");
}

RESP CommandHandler::handle_type(const Args &args) {
  return make_simple(store_.type(args[0]));
}

RESP CommandHandler::handle_dbsize(const Args &) {
  return make_integer(store_.size());
}

RESP CommandHandler::handle_flushdb(const Args &) {
  store_.flush();
  return make_simple("OK");
}

// INFO [server | clients | stats | keyspace | all]
RESP CommandHandler::handle_info(const Args &args) {
  std::string section = args.empty() ? "all" : to_lower(args[0]);
  bool all = section == "all" || section == "default" || section == "everything";
  std::string out;

  if (all || section == "server") {
    out += std::format("# Server\r\n"
                       "minikv_version:{}\r\n"
                       "uptime_in_seconds:{}\r\n\r\n",
                       MINIKV_VERSION,
                       (steady_now_ms() - stats_.started_at_ms) / 1000);
  }
  if (all || section == "clients") {
    out += std::format("# Clients\r\nconnected_clients:{}\r\n\r\n",
                       stats_.connected_clients.load());
  }
  if (all || section == "stats") {
    out += std::format("# Stats\r\n"
                       "total_connections_received:{}\r\n"
                       "rejected_connections:{}\r\n"
                       "total_commands_processed:{}\r\n\r\n",
                       stats_.total_connections.load(),
                       stats_.rejected_connections.load(),
                       stats_.total_commands.load());
  }
  if (all || section == "keyspace") {
    out += std::format("# Keyspace\r\ndb0:keys={}\r\n", store_.size());
  }
  return make_bulk(std::move(out));
}

} // namespace MiniKV
