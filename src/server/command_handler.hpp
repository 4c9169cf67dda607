#pragma once
#include "common/concurrent_store.hpp"
#include "server/server_stats.hpp"
#include "util/RESP.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace MiniKV {

class CommandHandler {
public:
  CommandHandler(ConcurrentStore &store, ServerStats &stats);

  // Runs one request against the store. Throws a MiniKVError subclass for
  // unknown commands, bad arity or bad arguments.
  RESP execute(const Request &req);

  // execute(), with errors turned into an error reply
  RESP dispatch(const Request &req);

  bool is_known(const std::string &name) const;

private:
  using Args = std::vector<std::string>;
  using Handler = RESP (CommandHandler::*)(const Args &args);

  struct CommandSpec {
    Handler handler;
    int min_args;
    int max_args; // -1 when variadic
  };

  RESP handle_ping(const Args &args);
  RESP handle_echo(const Args &args);
  RESP handle_set(const Args &args);
  RESP handle_get(const Args &args);
  RESP handle_del(const Args &args);
  RESP handle_exists(const Args &args);
  RESP handle_expire(const Args &args);
  RESP handle_pexpire(const Args &args);
  RESP handle_persist(const Args &args);
  RESP handle_ttl(const Args &args);
  RESP handle_pttl(const Args &args);
  RESP handle_keys(const Args &args);
  RESP handle_incr(const Args &args);
  RESP handle_decr(const Args &args);
  RESP handle_incrby(const Args &args);
  RESP handle_decrby(const Args &args);
  RESP handle_append(const Args &args);
  RESP handle_strlen(const Args &args);
  RESP handle_rename(const Args &args);
  RESP handle_type(const Args &args);
  RESP handle_dbsize(const Args &args);
  RESP handle_flushdb(const Args &args);
  RESP handle_info(const Args &args);

  std::unordered_map<std::string, CommandSpec> commands_;
  ConcurrentStore &store_;
  ServerStats &stats_;
};

} // namespace MiniKV
