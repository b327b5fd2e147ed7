// -----------------------------------------------------------------------------
// state_store.cpp: in-memory and JSON-file persistence for HopMesh state.
//
// API & file schema: see include/hopmesh/state_store.hpp
//
// JsonStateStore: read the whole document, patch one field, write to
// "<path>.tmp" and rename it over the live file.
// -----------------------------------------------------------------------------
#include "hopmesh/state_store.hpp"
#include "hopmesh/log.hpp"

#include "nlohmann/json.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace hopmesh {

// =============================================================================
// MemoryStateStore
// =============================================================================

bool MemoryStateStore::load_device_id(std::string& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (device_id_.empty()) return false;
  out = device_id_;
  return true;
}

bool MemoryStateStore::save_device_id(const std::string& uuid) {
  std::lock_guard<std::mutex> lock(mutex_);
  device_id_ = uuid;
  return true;
}

void MemoryStateStore::clear_device_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  device_id_.clear();
}

bool MemoryStateStore::load_blocklist(std::set<std::string>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  out = blocked_;
  return true;
}

bool MemoryStateStore::save_blocklist(const std::set<std::string>& blocked) {
  std::lock_guard<std::mutex> lock(mutex_);
  blocked_ = blocked;
  ++blocklist_saves_;
  return true;
}

bool MemoryStateStore::load_identity_keys(IdentityKeyBlob& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_keys_) return false;
  out = keys_;
  return true;
}

bool MemoryStateStore::save_identity_keys(const IdentityKeyBlob& keys) {
  std::lock_guard<std::mutex> lock(mutex_);
  keys_ = keys;
  has_keys_ = true;
  return true;
}

size_t MemoryStateStore::blocklist_saves() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocklist_saves_;
}

// =============================================================================
// JsonStateStore helpers
// =============================================================================

namespace {

std::string to_hex(const std::vector<uint8_t>& bytes) {
  static const char* HEX = "0123456789abcdef";
  std::string s;
  s.reserve(bytes.size() * 2);
  for (uint8_t b : bytes) {
    s += HEX[b >> 4];
    s += HEX[b & 0x0F];
  }
  return s;
}

bool from_hex(const std::string& s, std::vector<uint8_t>& out) {
  if (s.size() % 2 != 0) return false;
  auto val = [](char c, uint8_t& v) {
    if (c >= '0' && c <= '9') { v = static_cast<uint8_t>(c - '0');      return true; }
    if (c >= 'a' && c <= 'f') { v = static_cast<uint8_t>(c - 'a' + 10); return true; }
    if (c >= 'A' && c <= 'F') { v = static_cast<uint8_t>(c - 'A' + 10); return true; }
    return false;
  };
  std::vector<uint8_t> tmp;
  tmp.reserve(s.size() / 2);
  for (size_t i = 0; i < s.size(); i += 2) {
    uint8_t hi = 0, lo = 0;
    if (!val(s[i], hi) || !val(s[i + 1], lo)) return false;
    tmp.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  out.swap(tmp);
  return true;
}

// Missing file => empty object. Parse errors are logged and read as empty.
json read_document(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) return json::object();

  std::ifstream in(path);
  if (!in) {
    HOPMESH_LOG_WARN("store", "cannot open " << path);
    return json::object();
  }
  json doc = json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (doc.is_discarded() || !doc.is_object()) {
    HOPMESH_LOG_WARN("store", "state file " << path << " is not a JSON object; ignoring it");
    return json::object();
  }
  return doc;
}

bool write_document_atomic(const std::string& path, const json& doc) {
  const fs::path target(path);
  std::error_code ec;
  if (target.has_parent_path()) {
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
      HOPMESH_LOG_ERROR("store", "create_directories(" << target.parent_path().string()
                                 << ") failed: " << ec.message());
      return false;
    }
  }

  fs::path tmp = target;
  tmp += ".tmp";
  fs::remove(tmp, ec);   // a leftover from a crashed write; O_EXCL below needs it gone

  // The document may hold identity keys: owner read/write from creation on.
  const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
  if (fd < 0) {
    HOPMESH_LOG_ERROR("store", "cannot create " << tmp.string() << ": " << std::strerror(errno));
    return false;
  }
  if (::fchmod(fd, S_IRUSR | S_IWUSR) != 0) {
    HOPMESH_LOG_ERROR("store", "cannot restrict " << tmp.string() << ": " << std::strerror(errno));
    ::close(fd);
    fs::remove(tmp, ec);
    return false;
  }

  const std::string text = doc.dump(2);
  size_t done = 0;
  while (done < text.size()) {
    const ssize_t n = ::write(fd, text.data() + done, text.size() - done);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      HOPMESH_LOG_ERROR("store", "short write to " << tmp.string() << ": " << std::strerror(errno));
      ::close(fd);
      fs::remove(tmp, ec);
      return false;
    }
    done += static_cast<size_t>(n);
  }
  if (::fsync(fd) != 0 || ::close(fd) != 0) {
    HOPMESH_LOG_ERROR("store", "cannot flush " << tmp.string() << ": " << std::strerror(errno));
    fs::remove(tmp, ec);
    return false;
  }

  fs::rename(tmp, target, ec);
  if (ec) {
    HOPMESH_LOG_ERROR("store", "rename to " << path << " failed: " << ec.message());
    return false;
  }
  return true;
}

} // namespace

// =============================================================================
// JsonStateStore
// =============================================================================

JsonStateStore::JsonStateStore(std::string path)
: path_(std::move(path)) {}

bool JsonStateStore::load_device_id(std::string& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  json doc = read_document(path_);
  auto it = doc.find("device_id");
  if (it == doc.end() || !it->is_string()) return false;
  out = it->get<std::string>();
  return !out.empty();
}

bool JsonStateStore::save_device_id(const std::string& uuid) {
  std::lock_guard<std::mutex> lock(mutex_);
  json doc = read_document(path_);
  doc["device_id"] = uuid;
  return write_document_atomic(path_, doc);
}

void JsonStateStore::clear_device_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  json doc = read_document(path_);
  doc.erase("device_id");
  if (!write_document_atomic(path_, doc)) {
    HOPMESH_LOG_WARN("store", "device id could not be cleared from " << path_);
  }
}

bool JsonStateStore::load_blocklist(std::set<std::string>& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  json doc = read_document(path_);
  out.clear();
  auto it = doc.find("blocked");
  if (it == doc.end()) return true;            // nothing blocked yet
  if (!it->is_array()) return false;
  for (const auto& v : *it) {
    if (v.is_string()) out.insert(v.get<std::string>());
  }
  return true;
}

bool JsonStateStore::save_blocklist(const std::set<std::string>& blocked) {
  std::lock_guard<std::mutex> lock(mutex_);
  json doc = read_document(path_);
  doc["blocked"] = json::array();
  for (const auto& id : blocked) doc["blocked"].push_back(id);
  return write_document_atomic(path_, doc);
}

bool JsonStateStore::load_identity_keys(IdentityKeyBlob& out) {
  std::lock_guard<std::mutex> lock(mutex_);
  json doc = read_document(path_);
  auto it = doc.find("identity_keys");
  if (it == doc.end() || !it->is_object()) return false;

  const json& keys = *it;
  if (!keys.contains("signing") || !keys["signing"].is_string()) return false;
  if (!keys.contains("agreement") || !keys["agreement"].is_string()) return false;

  IdentityKeyBlob blob;
  if (!from_hex(keys["signing"].get<std::string>(), blob.signing)) return false;
  if (!from_hex(keys["agreement"].get<std::string>(), blob.agreement)) return false;
  out = std::move(blob);
  return true;
}

bool JsonStateStore::save_identity_keys(const IdentityKeyBlob& keys) {
  std::lock_guard<std::mutex> lock(mutex_);
  json doc = read_document(path_);
  doc["identity_keys"] = {
    {"signing",   to_hex(keys.signing)},
    {"agreement", to_hex(keys.agreement)},
  };
  return write_document_atomic(path_, doc);
}

} // namespace hopmesh
