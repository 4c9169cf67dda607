#pragma once

#include "common/types.hpp"
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace MiniKV {

// Monotonic milliseconds. Injected so tests can drive expiration.
using Clock = std::function<i64()>;

i64 steady_now_ms();

class ConcurrentStore {
private:
  std::unordered_map<std::string, Entry> store_;
  // key -> deadline for every entry with a TTL, walked by the active sweep
  std::unordered_map<std::string, i64> expiry_index_;
  std::size_t sweep_bucket_ = 0;
  Clock clock_;
  mutable std::shared_mutex mtx_;

  using Iterator = std::unordered_map<std::string, Entry>::iterator;

  Iterator find_live(const std::string &key, i64 now);
  void erase_entry(Iterator it);
  void set_deadline(Iterator it, i64 expires_at);

public:
  ConcurrentStore();
  explicit ConcurrentStore(Clock clock);

  bool set(const std::string &key, std::string value, SetOptions opts = {});
  std::optional<std::string> get(const std::string &key);

  i64 del(const std::vector<std::string> &keys);
  i64 exists(const std::vector<std::string> &keys) const;

  bool expire(const std::string &key, i64 ttl_ms);
  bool persist(const std::string &key);
  i64 ttl_ms(const std::string &key) const;

  std::vector<std::string> keys(const std::string &pattern) const;

  i64 incr_by(const std::string &key, i64 delta);
  i64 append(const std::string &key, const std::string &value);
  i64 strlen(const std::string &key) const;
  void rename(const std::string &from, const std::string &to);
  std::string type(const std::string &key) const;

  i64 size() const;
  void flush();

  i64 active_expiry_cycle(std::size_t limit = 20);
};

} // namespace MiniKV
