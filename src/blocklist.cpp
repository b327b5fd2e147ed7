// -----------------------------------------------------------------------------
// blocklist.cpp: blocked sender ids, persisted as display strings.
// -----------------------------------------------------------------------------
#include "hopmesh/blocklist.hpp"
#include "hopmesh/log.hpp"
#include "hopmesh/state_store.hpp"

#include <string>

namespace hopmesh {

Blocklist::Blocklist(BlocklistStore* store)
: store_(store) {
  if (!store_) return;

  std::set<std::string> stored;
  if (!store_->load_blocklist(stored)) {
    HOPMESH_LOG_WARN("peers", "blocklist could not be loaded; starting empty");
    return;
  }
  for (const auto& s : stored) {
    CompactId id;
    if (CompactId::parse(s.c_str(), id)) {
      ids_.insert(id);
    } else {
      HOPMESH_LOG_WARN("peers", "ignoring malformed blocklist entry '" << s << "'");
    }
  }
  if (!ids_.empty()) HOPMESH_LOG_INFO("peers", "loaded " << ids_.size() << " blocked ids");
}

void Blocklist::persist_locked() {
  if (!store_) return;
  std::set<std::string> out;
  for (const auto& id : ids_) out.insert(id.str());
  if (!store_->save_blocklist(out)) {
    HOPMESH_LOG_ERROR("store", "blocklist save failed (" << out.size() << " ids)");
  }
}

bool Blocklist::block(const CompactId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!ids_.insert(id).second) return false;
  persist_locked();
  return true;
}

bool Blocklist::unblock(const CompactId& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ids_.erase(id) == 0) return false;
  persist_locked();
  return true;
}

bool Blocklist::is_blocked(const CompactId& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ids_.count(id) != 0;
}

std::vector<CompactId> Blocklist::blocked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<CompactId>(ids_.begin(), ids_.end());
}

size_t Blocklist::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return ids_.size();
}

void Blocklist::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ids_.empty()) return;
  ids_.clear();
  persist_locked();
}

} // namespace hopmesh
