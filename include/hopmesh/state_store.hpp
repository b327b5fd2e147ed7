/**
 * @file state_store.hpp
 * @brief Persistence seams: device identity, blocklist and identity key material.
 *
 * @details
 * The core decides *what* must survive a restart; the host decides *where*.
 * Three small interfaces express the schema:
 *
 * - IdentityStore: the device UUID (its first 6 bytes are the compact id).
 * - BlocklistStore: the set of blocked compact ids, as display strings.
 * - IdentityKeyStore: opaque identity key material written by KeyManager.
 *
 * Two implementations ship with the library:
 *
 * - MemoryStateStore: process memory only (tests, simulator).
 * - JsonStateStore: one human-readable JSON file, written atomically
 *   (`<file>.tmp` created mode 0600, then renamed over the file), e.g.
 *   @code
 *   {
 *     "device_id": "550e8400-e29b-41d4-a716-446655440000",
 *     "blocked": ["11:22:33:44:55:66"],
 *     "identity_keys": { "signing": "<hex>", "agreement": "<hex>" }
 *   }
 *   @endcode
 *
 * Failures are reported as `false`; callers log and carry on with in-memory state.
 */
#ifndef HOPMESH_STATE_STORE_HPP
#define HOPMESH_STATE_STORE_HPP

#include <stdint.h>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace hopmesh {

/// Private identity key material as the store sees it. Only KeyManager fills or reads it.
struct IdentityKeyBlob {
  std::vector<uint8_t> signing;     ///< Ed25519 private seed (32 bytes)
  std::vector<uint8_t> agreement;   ///< X25519 private key (32 bytes)
};

class IdentityStore {
public:
  virtual ~IdentityStore() = default;
  virtual bool load_device_id(std::string& out) = 0;
  virtual bool save_device_id(const std::string& uuid) = 0;
  virtual void clear_device_id() = 0;
};

class BlocklistStore {
public:
  virtual ~BlocklistStore() = default;
  virtual bool load_blocklist(std::set<std::string>& out) = 0;
  virtual bool save_blocklist(const std::set<std::string>& blocked) = 0;
};

class IdentityKeyStore {
public:
  virtual ~IdentityKeyStore() = default;
  virtual bool load_identity_keys(IdentityKeyBlob& out) = 0;
  virtual bool save_identity_keys(const IdentityKeyBlob& keys) = 0;
};

/**
 * @class MemoryStateStore
 * @brief All three stores in process memory. Thread-safe.
 */
class MemoryStateStore : public IdentityStore, public BlocklistStore, public IdentityKeyStore {
public:
  bool load_device_id(std::string& out) override;
  bool save_device_id(const std::string& uuid) override;
  void clear_device_id() override;

  bool load_blocklist(std::set<std::string>& out) override;
  bool save_blocklist(const std::set<std::string>& blocked) override;

  bool load_identity_keys(IdentityKeyBlob& out) override;
  bool save_identity_keys(const IdentityKeyBlob& keys) override;

  /// Number of successful save_blocklist() calls (tests check persistence happened).
  size_t blocklist_saves() const;

private:
  mutable std::mutex    mutex_;
  std::string           device_id_;
  std::set<std::string> blocked_;
  IdentityKeyBlob       keys_;
  bool                  has_keys_{false};
  size_t                blocklist_saves_{0};
};

/**
 * @class JsonStateStore
 * @brief All three stores in a single JSON file.
 *
 * Each save rewrites the whole document (read-modify-write under a mutex), so
 * the stores can be shared by DeviceIdentity, Blocklist and KeyManager.
 * A missing or unreadable file reads as "nothing stored".
 */
class JsonStateStore : public IdentityStore, public BlocklistStore, public IdentityKeyStore {
public:
  explicit JsonStateStore(std::string path);

  const std::string& path() const { return path_; }

  bool load_device_id(std::string& out) override;
  bool save_device_id(const std::string& uuid) override;
  void clear_device_id() override;

  bool load_blocklist(std::set<std::string>& out) override;
  bool save_blocklist(const std::set<std::string>& blocked) override;

  bool load_identity_keys(IdentityKeyBlob& out) override;
  bool save_identity_keys(const IdentityKeyBlob& keys) override;

private:
  std::string path_;
  std::mutex  mutex_;
};

} // namespace hopmesh

#endif // HOPMESH_STATE_STORE_HPP
