// -----------------------------------------------------------------------------
// device_id.cpp: compact sender id helpers and durable device identity.
//
// API & formats: see include/hopmesh/device_id.hpp
// -----------------------------------------------------------------------------
#include "hopmesh/device_id.hpp"
#include "hopmesh/log.hpp"
#include "hopmesh/state_store.hpp"

#include <openssl/rand.h>

#include <algorithm>

namespace hopmesh {

namespace {

// Single hex digit -> value. False on anything outside 0-9, A-F, a-f;
// `out` untouched.
bool hex_char_to_val(char c, uint8_t& out) {
  if ('0' <= c && c <= '9') { out = static_cast<uint8_t>(c - '0');      return true; }
  if ('A' <= c && c <= 'F') { out = static_cast<uint8_t>(c - 'A' + 10); return true; }
  if ('a' <= c && c <= 'f') { out = static_cast<uint8_t>(c - 'a' + 10); return true; }
  return false;
}

const char HEX_UPPER[] = "0123456789ABCDEF";
const char HEX_LOWER[] = "0123456789abcdef";

} // namespace

// =============================================================================
// CompactId
// =============================================================================

CompactId::CompactId(const uint8_t* data) {
  std::copy(data, data + SIZE, bytes.begin());
}

bool CompactId::from_uuid(const std::string& uuid, CompactId& out) {
  // Collect hex digits, skipping hyphens, until we have 12 (= 6 bytes).
  uint8_t nibbles[SIZE * 2];
  size_t  n = 0;
  for (char c : uuid) {
    if (n == sizeof(nibbles)) break;
    if (c == '-') continue;
    if (!hex_char_to_val(c, nibbles[n])) return false;
    ++n;
  }
  if (n < sizeof(nibbles)) return false;

  for (size_t i = 0; i < SIZE; ++i) {
    out.bytes[i] = static_cast<uint8_t>((nibbles[i * 2] << 4) | nibbles[i * 2 + 1]);
  }
  return true;
}

bool CompactId::parse(const char* text, CompactId& out) {
  if (!text) return false;

  // Expect exactly "HH?HH?HH?HH?HH?HH" with ? in {':', '-'}.
  CompactId tmp;
  const char* p = text;
  for (size_t i = 0; i < SIZE; ++i) {
    uint8_t hi = 0, lo = 0;
    if (!hex_char_to_val(p[0], hi)) return false;
    if (!hex_char_to_val(p[1], lo)) return false;
    tmp.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    p += 2;
    if (i + 1 < SIZE) {
      if (*p != ':' && *p != '-') return false;
      ++p;
    }
  }
  if (*p != '\0') return false;   // trailing junk

  out = tmp;
  return true;
}

CompactIdStr CompactId::to_string() const {
  CompactIdStr s;
  for (size_t i = 0; i < SIZE; ++i) {
    if (i) s += ':';
    s += HEX_UPPER[bytes[i] >> 4];
    s += HEX_UPPER[bytes[i] & 0x0F];
  }
  return s;
}

bool CompactId::is_zero() const {
  return std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
}

bool CompactId::operator<(const CompactId& o) const {
  return std::lexicographical_compare(bytes.begin(), bytes.end(), o.bytes.begin(), o.bytes.end());
}

// =============================================================================
// UUID generation
// =============================================================================

std::string generate_device_uuid() {
  uint8_t raw[16];
  if (RAND_bytes(raw, sizeof(raw)) != 1) {
    HOPMESH_LOG_ERROR("store", "RAND_bytes failed while generating device uuid");
    return std::string();
  }
  raw[6] = static_cast<uint8_t>((raw[6] & 0x0F) | 0x40);   // version 4
  raw[8] = static_cast<uint8_t>((raw[8] & 0x3F) | 0x80);   // RFC 4122 variant

  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < sizeof(raw); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out += '-';
    out += HEX_LOWER[raw[i] >> 4];
    out += HEX_LOWER[raw[i] & 0x0F];
  }
  return out;
}

// =============================================================================
// DeviceIdentity
// =============================================================================

DeviceIdentity::DeviceIdentity(std::string uuid)
: uuid_(std::move(uuid)) {
  if (!CompactId::from_uuid(uuid_, compact_)) {
    HOPMESH_LOG_WARN("store", "device uuid '" << uuid_ << "' is not valid hex; compact id left zero");
  }
}

DeviceIdentity DeviceIdentity::get_or_create(IdentityStore& store) {
  std::string existing;
  CompactId   parsed;
  if (store.load_device_id(existing) && CompactId::from_uuid(existing, parsed)) {
    return DeviceIdentity(existing);
  }

  std::string fresh = generate_device_uuid();
  if (!store.save_device_id(fresh)) {
    HOPMESH_LOG_WARN("store", "could not persist new device id; identity lasts this run only");
  }
  HOPMESH_LOG_INFO("store", "created device id " << fresh);
  return DeviceIdentity(fresh);
}

void DeviceIdentity::reset(IdentityStore& store) {
  store.clear_device_id();
}

} // namespace hopmesh
