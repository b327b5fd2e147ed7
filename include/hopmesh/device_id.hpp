/**
 * @file device_id.hpp
 * @brief Durable device identity and the 6-byte compact sender id used on the wire.
 *
 * @details
 * Every HopMesh device owns one UUID-class identity, generated once and kept
 * by the host (see state_store.hpp). Frames do not carry the full 16 bytes;
 * they carry the **compact id**: the first 6 bytes of that UUID.
 *
 * | Form        | Example                                  |
 * |-------------|------------------------------------------|
 * | Device UUID | `550e8400-e29b-41d4-a716-446655440000`   |
 * | Compact id  | bytes `55 0E 84 00 E2 9B`                |
 * | Display     | `55:0E:84:00:E2:9B`                      |
 *
 * The compact id is the origin half of the deduplication key
 * `(sender id, message id)`, the blocklist key, and the registry's durable
 * peer key. It never changes for the life of an installation.
 */
#ifndef HOPMESH_DEVICE_ID_HPP
#define HOPMESH_DEVICE_ID_HPP

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <string>

#include "etl/array.h"
#include "etl/string.h"

namespace hopmesh {

class IdentityStore;

/// Display form of a compact id: "AA:BB:CC:DD:EE:FF" (17 chars).
using CompactIdStr = etl::string<17>;

/**
 * @struct CompactId
 * @brief 6 raw bytes identifying the originating device of a frame.
 */
struct CompactId {
  static constexpr size_t SIZE = 6;

  etl::array<uint8_t, SIZE> bytes{};

  CompactId() = default;

  /// Copy exactly SIZE bytes from `data` (caller guarantees length).
  explicit CompactId(const uint8_t* data);

  /**
   * @brief Derive the compact id from a UUID string.
   * @param uuid UUID text; hyphens are ignored, the first 12 hex digits are used.
   * @param out  Receives the id on success.
   * @return false if fewer than 12 hex digits are present or a digit is invalid.
   */
  static bool from_uuid(const std::string& uuid, CompactId& out);

  /**
   * @brief Parse the display form.
   * @param text "AA:BB:CC:DD:EE:FF" or "AA-BB-CC-DD-EE-FF", case-insensitive.
   * @param out  Receives the id on success.
   * @return false on wrong group count or bad hex.
   */
  static bool parse(const char* text, CompactId& out);

  /// Upper-case, colon-separated display form.
  CompactIdStr to_string() const;

  /// std::string copy of to_string(), for maps, JSON and logs.
  std::string str() const { return std::string(to_string().c_str()); }

  /// True when all six bytes are zero (the "unset" id).
  bool is_zero() const;

  bool operator==(const CompactId& o) const { return bytes == o.bytes; }
  bool operator!=(const CompactId& o) const { return !(*this == o); }
  bool operator<(const CompactId& o) const;
};

/// Random RFC 4122 version-4 UUID, lower-case with hyphens, from the OpenSSL CSPRNG.
std::string generate_device_uuid();

/**
 * @class DeviceIdentity
 * @brief The local device's durable UUID and its compact id.
 *
 * Persistence is delegated to an IdentityStore; this class only decides
 * "reuse what is stored, or mint a new one".
 */
class DeviceIdentity {
public:
  /**
   * @brief Load the stored UUID or generate and store a fresh one.
   * @param store Host persistence for the UUID.
   * @return Identity whose compact id is stable across restarts.
   */
  static DeviceIdentity get_or_create(IdentityStore& store);

  /// Forget the stored UUID; the next get_or_create() mints a new identity.
  static void reset(IdentityStore& store);

  /// Build from a known UUID (tests, simulator).
  explicit DeviceIdentity(std::string uuid);

  const std::string& uuid() const { return uuid_; }
  const CompactId& compact_id() const { return compact_; }

private:
  std::string uuid_;
  CompactId   compact_;
};

} // namespace hopmesh

namespace std {
template <>
struct hash<hopmesh::CompactId> {
  size_t operator()(const hopmesh::CompactId& id) const noexcept {
    uint64_t v = 0;
    for (size_t i = 0; i < hopmesh::CompactId::SIZE; ++i) v = (v << 8) | id.bytes[i];
    return std::hash<uint64_t>()(v);
  }
};
} // namespace std

#endif // HOPMESH_DEVICE_ID_HPP
