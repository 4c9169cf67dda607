#pragma once

#include "common/concurrent_store.hpp"
#include "common/types.hpp"
#include <atomic>

namespace MiniKV {

// Counters shared between the connection threads and INFO.
struct ServerStats {
  std::atomic<i64> connected_clients{0};
  std::atomic<i64> total_connections{0};
  std::atomic<i64> rejected_connections{0};
  std::atomic<i64> total_commands{0};
  i64 started_at_ms = steady_now_ms();
};

} // namespace MiniKV
