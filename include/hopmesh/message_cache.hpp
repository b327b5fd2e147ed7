/**
 * @file message_cache.hpp
 * @brief Bounded, time-expiring "have I seen this frame" cache.
 *
 * @details
 * Key: `(sender_id, message_id)` of the ORIGIN, exactly as carried in the
 * frame header. Value: the time of first sight.
 *
 * Policy:
 * - **FIFO by insertion**, not by access. A lookup never refreshes an entry,
 *   so memory is bounded by `capacity()` whatever the query pattern is.
 * - **Expiration** is lazy: contains() and insert() first drop every entry
 *   older than the window. Because entries are stored in insertion order and
 *   the clock is monotonic, expired entries are always at the front.
 * - purge_expired() does the same sweep on demand (periodic task).
 *
 * Every method takes the internal mutex; insert() is the atomic
 * insert-if-absent the forwarding paths rely on.
 *
 * @code
 * if (!cache.insert(hdr.sender_id, hdr.message_id)) return; // duplicate
 * @endcode
 */
#ifndef HOPMESH_MESSAGE_CACHE_HPP
#define HOPMESH_MESSAGE_CACHE_HPP

#include <stdint.h>
#include <stddef.h>
#include <mutex>
#include <unordered_set>

#include "etl/deque.h"

#include "hopmesh/clock.hpp"
#include "hopmesh/device_id.hpp"

namespace hopmesh {

class MessageCache {
public:
  /// Fixed storage; runtime capacity may be anything in [1, MAX_CAPACITY].
  static constexpr size_t   MAX_CAPACITY          = 4096;
  static constexpr size_t   DEFAULT_CAPACITY      = 1000;
  static constexpr uint64_t DEFAULT_EXPIRATION_MS = 5ull * 60ull * 1000ull;

  struct Stats {
    uint64_t hits{0};         ///< lookups/inserts that found a live entry
    uint64_t misses{0};       ///< inserts of a new key
    uint64_t evictions{0};    ///< entries pushed out by capacity
    uint64_t expirations{0};  ///< entries dropped by age
  };

  /**
   * @param clock         Time source (must outlive the cache).
   * @param capacity      Entry bound; clamped to [1, MAX_CAPACITY].
   * @param expiration_ms Entry lifetime; an entry inserted at T is gone at any time > T + expiration_ms.
   */
  explicit MessageCache(const Clock& clock,
                        size_t capacity = DEFAULT_CAPACITY,
                        uint64_t expiration_ms = DEFAULT_EXPIRATION_MS);

  /// True if the key is present and unexpired. Drops expired entries first.
  bool contains(const CompactId& sender, int64_t message_id);

  /**
   * @brief Record first sight of a frame.
   * @return true if the key was new (now stored); false if already present,
   *         in which case nothing changes.
   */
  bool insert(const CompactId& sender, int64_t message_id);

  /// Drop all expired entries. @return number removed.
  size_t purge_expired();

  void   clear();
  size_t size() const;
  size_t capacity() const { return capacity_; }
  uint64_t expiration_ms() const { return expiration_ms_; }
  Stats  stats() const;

private:
  struct Key {
    CompactId sender;
    int64_t   message_id;
    bool operator==(const Key& o) const { return message_id == o.message_id && sender == o.sender; }
  };
  struct KeyHash {
    size_t operator()(const Key& k) const noexcept {
      return std::hash<CompactId>()(k.sender) ^ (std::hash<int64_t>()(k.message_id) * 31u);
    }
  };
  struct Entry {
    Key      key;
    uint64_t inserted_ms;
  };

  size_t purge_expired_locked(uint64_t now);

  const Clock&                       clock_;
  const size_t                       capacity_;
  const uint64_t                     expiration_ms_;

  mutable std::mutex                 mutex_;
  etl::deque<Entry, MAX_CAPACITY>    order_;   // oldest at front
  std::unordered_set<Key, KeyHash>   index_;
  Stats                              stats_;
};

} // namespace hopmesh

#endif // HOPMESH_MESSAGE_CACHE_HPP
