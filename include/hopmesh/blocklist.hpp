/**
 * @file blocklist.hpp
 * @brief Persistent set of blocked compact sender ids.
 *
 * @details
 * Membership is consulted before any connection attempt (both directions)
 * and before any payload from the sender is processed. The set is loaded
 * from a BlocklistStore once and written back on every change; a failed
 * write is logged and the in-memory set stays authoritative for this run.
 */
#ifndef HOPMESH_BLOCKLIST_HPP
#define HOPMESH_BLOCKLIST_HPP

#include <stddef.h>
#include <mutex>
#include <set>
#include <vector>

#include "hopmesh/device_id.hpp"

namespace hopmesh {

class BlocklistStore;

class Blocklist {
public:
  /// Load from `store` (may be nullptr: memory only).
  explicit Blocklist(BlocklistStore* store = nullptr);

  /// @return true if `id` was not blocked before.
  bool block(const CompactId& id);

  /// @return true if `id` was blocked before.
  bool unblock(const CompactId& id);

  bool is_blocked(const CompactId& id) const;

  /// Snapshot in ascending id order.
  std::vector<CompactId> blocked() const;

  size_t count() const;
  void   clear();

private:
  void persist_locked();

  BlocklistStore*     store_;
  mutable std::mutex  mutex_;
  std::set<CompactId> ids_;
};

} // namespace hopmesh

#endif // HOPMESH_BLOCKLIST_HPP
