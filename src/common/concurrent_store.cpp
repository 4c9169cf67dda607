#include "concurrent_store.hpp"
#include "common/errors.hpp"
#include <charconv>
#include <chrono>
#include <fnmatch.h>
#include <limits>
#include <mutex>

namespace MiniKV {

i64 steady_now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

static bool parse_i64(const std::string &s, i64 &out) {
  if (s.empty())
    return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && ptr == s.data() + s.size();
}

// saturates at the largest deadline instead of overflowing
static i64 deadline_after(i64 now, i64 ttl_ms) {
  if (ttl_ms > std::numeric_limits<i64>::max() - now)
    return std::numeric_limits<i64>::max();
  return now + ttl_ms;
}

ConcurrentStore::ConcurrentStore() : clock_(steady_now_ms) {}

ConcurrentStore::ConcurrentStore(Clock clock) : clock_(std::move(clock)) {}

// caller holds the unique lock; reclaims the entry if it has expired
ConcurrentStore::Iterator ConcurrentStore::find_live(const std::string &key,
                                                     i64 now) {
  auto it = store_.find(key);
  if (it != store_.end() && it->second.is_expired(now)) {
    erase_entry(it);
    return store_.end();
  }
  return it;
}

void ConcurrentStore::erase_entry(Iterator it) {
  if (!it->second.is_persistent())
    expiry_index_.erase(it->first);
  store_.erase(it);
}

void ConcurrentStore::set_deadline(Iterator it, i64 expires_at) {
  it->second.expires_at = expires_at;
  if (expires_at > 0)
    expiry_index_[it->first] = expires_at;
  else
    expiry_index_.erase(it->first);
}

bool ConcurrentStore::set(const std::string &key, std::string value,
                          SetOptions opts) {
  std::unique_lock lock(mtx_);
  i64 now = clock_();

  auto it = find_live(key, now);
  bool exists = it != store_.end();
  if ((opts.only_if_absent && exists) || (opts.only_if_present && !exists))
    return false;

  i64 expires_at = opts.ttl_ms > 0 ? deadline_after(now, opts.ttl_ms) : 0;
  if (exists) {
    it->second.value = std::move(value);
  } else {
    it = store_.emplace(key, Entry{std::move(value)}).first;
  }
  // overwriting without a TTL drops any previous deadline
  set_deadline(it, expires_at);
  return true;
}

std::optional<std::string> ConcurrentStore::get(const std::string &key) {
  {
    std::shared_lock lock(mtx_);
    auto it = store_.find(key);
    if (it == store_.end())
      return std::nullopt;
    if (!it->second.is_expired(clock_()))
      return it->second.value;
  }

  // expired: take the write lock and re-check, another client may have
  // replaced the key in between
  std::unique_lock lock(mtx_);
  auto it = find_live(key, clock_());
  if (it == store_.end())
    return std::nullopt;
  return it->second.value;
}

i64 ConcurrentStore::del(const std::vector<std::string> &keys) {
  std::unique_lock lock(mtx_);
  i64 now = clock_();
  i64 removed = 0;
  for (const auto &key : keys) {
    auto it = find_live(key, now);
    if (it != store_.end()) {
      erase_entry(it);
      removed++;
    }
  }
  return removed;
}

i64 ConcurrentStore::exists(const std::vector<std::string> &keys) const {
  std::shared_lock lock(mtx_);
  i64 now = clock_();
  i64 count = 0;
  for (const auto &key : keys) {
    auto it = store_.find(key);
    if (it != store_.end() && !it->second.is_expired(now))
      count++;
  }
  return count;
}

bool ConcurrentStore::expire(const std::string &key, i64 ttl_ms) {
  std::unique_lock lock(mtx_);
  i64 now = clock_();
  auto it = find_live(key, now);
  if (it == store_.end())
    return false;

  if (ttl_ms <= 0) {
    erase_entry(it);
    return true;
  }
  set_deadline(it, deadline_after(now, ttl_ms));
  return true;
}

bool ConcurrentStore::persist(const std::string &key) {
  std::unique_lock lock(mtx_);
  auto it = find_live(key, clock_());
  if (it == store_.end() || it->second.is_persistent())
    return false;
  set_deadline(it, 0);
  return true;
}

i64 ConcurrentStore::ttl_ms(const std::string &key) const {
  std::shared_lock lock(mtx_);
  i64 now = clock_();
  auto it = store_.find(key);
  if (it == store_.end() || it->second.is_expired(now))
    return -2;
  if (it->second.is_persistent())
    return -1;
  return it->second.expires_at - now;
}

std::vector<std::string>
ConcurrentStore::keys(const std::string &pattern) const {
  std::shared_lock lock(mtx_);
  i64 now = clock_();
  bool match_all = pattern == "*";

  std::vector<std::string> out;
  for (const auto &[key, entry] : store_) {
    if (entry.is_expired(now))
      continue;
    if (match_all || fnmatch(pattern.c_str(), key.c_str(), 0) == 0)
      out.push_back(key);
  }
  return out;
}

i64 ConcurrentStore::incr_by(const std::string &key, i64 delta) {
  std::unique_lock lock(mtx_);
  auto it = find_live(key, clock_());

  i64 current = 0;
  if (it != store_.end() && !parse_i64(it->second.value, current))
    throw TypeError();

  if ((delta > 0 && current > std::numeric_limits<i64>::max() - delta) ||
      (delta < 0 && current < std::numeric_limits<i64>::min() - delta))
    throw TypeError("ERR increment or decrement would overflow");

  i64 next = current + delta;
  if (it == store_.end())
    store_.emplace(key, Entry{std::to_string(next)});
  else
    it->second.value = std::to_string(next);
  return next;
}

i64 ConcurrentStore::append(const std::string &key, const std::string &value) {
  std::unique_lock lock(mtx_);
  auto it = find_live(key, clock_());
  if (it == store_.end())
    it = store_.emplace(key, Entry{value}).first;
  else
    it->second.value += value;
  return static_cast<i64>(it->second.value.size());
}

i64 ConcurrentStore::strlen(const std::string &key) const {
  std::shared_lock lock(mtx_);
  auto it = store_.find(key);
  if (it == store_.end() || it->second.is_expired(clock_()))
    return 0;
  return static_cast<i64>(it->second.value.size());
}

void ConcurrentStore::rename(const std::string &from, const std::string &to) {
  std::unique_lock lock(mtx_);
  i64 now = clock_();
  auto src = find_live(from, now);
  if (src == store_.end())
    throw NoSuchKeyError();
  if (from == to)
    return;

  Entry moved = std::move(src->second);
  erase_entry(src);

  auto dst = store_.find(to);
  if (dst != store_.end())
    erase_entry(dst);

  i64 expires_at = moved.expires_at;
  dst = store_.emplace(to, std::move(moved)).first;
  set_deadline(dst, expires_at);
}

std::string ConcurrentStore::type(const std::string &key) const {
  std::shared_lock lock(mtx_);
  auto it = store_.find(key);
  if (it == store_.end() || it->second.is_expired(clock_()))
    return "none";
  return "string";
}

i64 ConcurrentStore::size() const {
  std::shared_lock lock(mtx_);
  i64 now = clock_();
  i64 count = 0;
  for (const auto &[key, entry] : store_) {
    if (!entry.is_expired(now))
      count++;
  }
  return count;
}

void ConcurrentStore::flush() {
  std::unique_lock lock(mtx_);
  store_.clear();
  expiry_index_.clear();
  sweep_bucket_ = 0;
}

// Walks the expiry index bucket by bucket, resuming where the previous
// cycle stopped, and looks at no more than `limit` deadlines per call.
i64 ConcurrentStore::active_expiry_cycle(std::size_t limit) {
  std::unique_lock lock(mtx_);
  if (expiry_index_.empty()) {
    return 0;
  }

  i64 now = clock_();
  std::size_t buckets = expiry_index_.bucket_count();
  std::size_t bucket = sweep_bucket_ % buckets;
  std::size_t examined = 0;
  std::vector<std::string> expired;

  for (std::size_t visited = 0; visited < buckets && examined < limit;
       visited++) {
    for (auto it = expiry_index_.begin(bucket);
         it != expiry_index_.end(bucket); ++it) {
      if (it->second <= now)
        expired.push_back(it->first);
      examined++;
    }
    bucket = (bucket + 1) % buckets;
  }
  sweep_bucket_ = bucket;

  for (const auto &key : expired) {
    auto it = store_.find(key);
    if (it != store_.end())
      erase_entry(it);
    else
      expiry_index_.erase(key);
  }
  return static_cast<i64>(expired.size());
}

} // namespace MiniKV
