#pragma once
/**
 * @file clock.hpp
 * @brief The two clocks the core reads.
 *
 * Components take `now_ms` arguments (as the node loop always has:
 * `tick(now_ms)`). Only the daemon loop and background threads (link readers,
 * supervised tasks) call these to produce them.
 *
 * - `steady_ms()` drives timers: backoff, retry spacing, timeouts, idle reclaim.
 * - `wall_ms()` stamps anything persisted (trust records, transfer checkpoints),
 *   because those must still make sense after a restart.
 */

#include <chrono>
#include <cstdint>

namespace kdc {

inline int64_t steady_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

inline int64_t wall_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace kdc
