/**
 * @file clock.hpp
 * @brief Monotonic millisecond time source shared by cache, registry, keys and core.
 *
 * @details
 * Every timeout in HopMesh (cache expiration, stale peers, connect timeout,
 * session rotation) is measured against an injected Clock instead of reading
 * the system clock directly. Production code uses SteadyClock; tests drive a
 * ManualClock so that "five minutes later" is one call, not a sleep.
 */
#ifndef HOPMESH_CLOCK_HPP
#define HOPMESH_CLOCK_HPP

#include <stdint.h>
#include <atomic>
#include <chrono>

namespace hopmesh {

/// Abstract monotonic time source (milliseconds, arbitrary epoch).
class Clock {
public:
  virtual ~Clock() = default;
  virtual uint64_t now_ms() const = 0;
};

/// std::chrono::steady_clock in milliseconds.
class SteadyClock : public Clock {
public:
  uint64_t now_ms() const override {
    using namespace std::chrono;
    return static_cast<uint64_t>(
        duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
  }
};

/**
 * @brief Hand-driven clock for tests and simulations.
 *
 * Thread-safe: forwarding threads may read while the test advances it.
 */
class ManualClock : public Clock {
public:
  explicit ManualClock(uint64_t start_ms = 0) : now_(start_ms) {}

  uint64_t now_ms() const override { return now_.load(); }

  void set(uint64_t ms) { now_.store(ms); }
  void advance(uint64_t delta_ms) { now_.fetch_add(delta_ms); }

private:
  std::atomic<uint64_t> now_;
};

} // namespace hopmesh

#endif // HOPMESH_CLOCK_HPP
