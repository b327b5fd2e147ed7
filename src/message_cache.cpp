// -----------------------------------------------------------------------------
// message_cache.cpp: FIFO dedup cache with lazy expiration.
//
// API & policy: see include/hopmesh/message_cache.hpp
// -----------------------------------------------------------------------------
#include "hopmesh/message_cache.hpp"
#include "hopmesh/log.hpp"

#include <algorithm>

namespace hopmesh {

MessageCache::MessageCache(const Clock& clock, size_t capacity, uint64_t expiration_ms)
: clock_(clock),
  capacity_(std::min(std::max<size_t>(capacity, 1), MAX_CAPACITY)),
  expiration_ms_(expiration_ms) {
  if (capacity_ != capacity) {
    HOPMESH_LOG_WARN("cache", "capacity " << capacity << " clamped to " << capacity_);
  }
  index_.reserve(capacity_);
}

// -----------------------------------------------------------------------------
// purge_expired_locked
// PRE: mutex_ held.
// POLICY: entries are in insertion order, so stop at the first live one.
// An entry is live while (now - inserted) <= expiration.
// -----------------------------------------------------------------------------
size_t MessageCache::purge_expired_locked(uint64_t now) {
  size_t removed = 0;
  while (!order_.empty()) {
    const Entry& oldest = order_.front();
    if (now < oldest.inserted_ms || now - oldest.inserted_ms <= expiration_ms_) break;
    index_.erase(oldest.key);
    order_.pop_front();
    ++removed;
  }
  stats_.expirations += removed;
  return removed;
}

bool MessageCache::contains(const CompactId& sender, int64_t message_id) {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);
  purge_expired_locked(now);
  const bool hit = index_.count(Key{sender, message_id}) != 0;
  if (hit) ++stats_.hits;
  return hit;
}

// -----------------------------------------------------------------------------
// insert
// POLICY: atomic insert-if-absent. Expired entries go first, then the oldest
// live entry if still full. A present key leaves the cache untouched.
// -----------------------------------------------------------------------------
bool MessageCache::insert(const CompactId& sender, int64_t message_id) {
  const uint64_t now = clock_.now_ms();
  const Key key{sender, message_id};

  std::lock_guard<std::mutex> lock(mutex_);
  purge_expired_locked(now);

  if (index_.count(key) != 0) {
    ++stats_.hits;
    return false;
  }

  if (order_.size() >= capacity_) {
    index_.erase(order_.front().key);
    order_.pop_front();
    ++stats_.evictions;
  }

  order_.push_back(Entry{key, now});
  index_.insert(key);
  ++stats_.misses;
  return true;
}

size_t MessageCache::purge_expired() {
  const uint64_t now = clock_.now_ms();
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t removed = purge_expired_locked(now);
  if (removed) {
    HOPMESH_LOG_DEBUG("cache", "purged " << removed << " expired entries, " << order_.size() << " left");
  }
  return removed;
}

void MessageCache::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  order_.clear();
  index_.clear();
}

size_t MessageCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_.size();
}

MessageCache::Stats MessageCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

} // namespace hopmesh
