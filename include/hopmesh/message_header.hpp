/**
 * @page hm-message-header HopMesh MessageHeader
 * @file message_header.hpp
 * @brief HopMesh MessageHeader: fixed 20-byte frame header for TTL-bounded flood forwarding.
 *
 * Every frame that crosses a HopMesh link starts with this header, followed
 * immediately by `payload_length` bytes of (possibly encrypted) payload.
 *
 * @section hm_header_layout Wire layout (big-endian)
 *
 * | Bytes  | Field            | Size | Notes                                      |
 * |--------|------------------|------|--------------------------------------------|
 * | 0      | version          | 1    | must equal PROTOCOL_VERSION (0x01)         |
 * | 1      | type             | 1    | MessageType; not validated by the codec    |
 * | 2      | ttl              | 1    | remaining forward budget (0-255)           |
 * | 3      | hop_count        | 1    | forwards already performed (0-255)         |
 * | 4-11   | message_id       | 8    | signed 64-bit, unique per origin           |
 * | 12-17  | sender_id        | 6    | compact id of the ORIGIN (never rewritten) |
 * | 18-19  | payload_length   | 2    | unsigned 16-bit                            |
 *
 * ### Example
 * `01 01 03 00 | 00 00 00 00 00 00 00 2A | AA BB CC DD EE FF | 00 05`
 * - version 1, PUBLIC, ttl 3, hop 0, id 42, sender AA:BB:CC:DD:EE:FF, 5 payload bytes.
 *
 * @section hm_header_rules Rules the rest of the core relies on
 * - `message_id` and `sender_id` never change across hops; together they are
 *   the global deduplication key.
 * - `ttl` and `hop_count` change only through forwarded_copy(): ttl-1, hop+1.
 * - can_forward() is `ttl > 1`, so a message born with ttl N travels at most
 *   N-1 forwards and arrives with ttl 1 at the last node.
 * - The codec rejects short buffers (DataTooSmall) and foreign versions
 *   (UnsupportedVersion). It does **not** judge type or ttl; that is Core's job.
 *
 * @note Both directions use network byte order; the choice is free but symmetric.
 */
#ifndef HOPMESH_MESSAGE_HEADER_HPP
#define HOPMESH_MESSAGE_HEADER_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

#include "hopmesh/device_id.hpp"

namespace hopmesh {

/// Frame type byte. Values are the on-air constants.
enum class MessageType : uint8_t {
  Public           = 0x01,
  Private          = 0x02,
  Channel          = 0x03,
  PeerAnnouncement = 0x04,
  Acknowledgment   = 0x05,
  KeyExchange      = 0x06,
  StoreForward     = 0x07,
  RoutingUpdate    = 0x08,
};

/// Outcome of decoding a header or frame (the MalformedWire family).
enum class DecodeResult : uint8_t {
  Ok                 = 0,
  DataTooSmall       = 1,   ///< fewer than 20 bytes
  UnsupportedVersion = 2,   ///< byte 0 != PROTOCOL_VERSION
  PayloadTruncated   = 3,   ///< frame shorter than 20 + payload_length
};

const char* to_string(MessageType type);
const char* to_string(DecodeResult result);

/**
 * @struct MessageHeader
 * @brief Decoded view of the 20-byte frame header.
 *
 * `type` is kept as the raw byte so that frames with types this build does not
 * know survive a decode/encode round trip unchanged.
 */
struct MessageHeader {
  static constexpr uint8_t PROTOCOL_VERSION = 0x01;
  static constexpr size_t  SIZE             = 20;
  static constexpr size_t  MAX_PAYLOAD      = 0xFFFF;

  uint8_t   version{PROTOCOL_VERSION};
  uint8_t   type{static_cast<uint8_t>(MessageType::Public)};
  uint8_t   ttl{0};
  uint8_t   hop_count{0};
  int64_t   message_id{0};
  CompactId sender_id{};
  uint16_t  payload_length{0};

  MessageHeader() = default;

  /// Build a header for a fresh or forwarded message. version is always PROTOCOL_VERSION.
  MessageHeader(MessageType type, uint8_t ttl, uint8_t hop_count, int64_t message_id,
                const CompactId& sender_id, uint16_t payload_length);

  /**
   * @brief Write exactly SIZE bytes into `out_buf`.
   * @param out_buf Output buffer of at least SIZE bytes.
   */
  void pack(uint8_t* out_buf) const;

  /**
   * @brief Decode a header from the start of `in_buf`.
   * @param in_buf Input bytes.
   * @param len    Number of valid bytes in `in_buf`.
   * @param out    Receives the header when the result is Ok; untouched otherwise.
   * @return Ok, DataTooSmall (len < SIZE) or UnsupportedVersion.
   */
  static DecodeResult unpack(const uint8_t* in_buf, size_t len, MessageHeader& out);

  /// The type byte as an enum (may name a value outside the known set).
  MessageType message_type() const { return static_cast<MessageType>(type); }

  /// True for the eight types listed in MessageType.
  bool is_known_type() const { return type >= 0x01 && type <= 0x08; }

  /// A relay may forward this header: ttl >= 2.
  bool can_forward() const { return ttl > 1; }

  /**
   * @brief The header a relay transmits: ttl-1, hop_count+1, everything else identical.
   *
   * ttl never goes below zero and hop_count saturates at 255.
   */
  MessageHeader forwarded_copy() const;

  /// One-line debug summary, e.g. "PUBLIC id=42 from=AA:.. ttl=3 hop=0 len=5".
  std::string describe() const;

  bool operator==(const MessageHeader& o) const;
  bool operator!=(const MessageHeader& o) const { return !(*this == o); }
};

/**
 * @brief Allocate a message id for a message originated here.
 *
 * 64 bits from the OpenSSL CSPRNG. Uniqueness (negligible collision
 * probability over the process lifetime) is the contract, not ordering.
 */
int64_t generate_message_id();

/**
 * @brief Header + payload as one transmit buffer.
 * @param header  Header to write; its payload_length is replaced by payload.size().
 * @param payload Payload bytes (at most MessageHeader::MAX_PAYLOAD).
 * @param out     Receives SIZE + payload.size() bytes.
 * @return false if the payload is too large for the 16-bit length field.
 */
bool encode_frame(const MessageHeader& header, const std::vector<uint8_t>& payload,
                  std::vector<uint8_t>& out);

/**
 * @brief Split a received buffer into header and payload.
 *
 * Bytes beyond `20 + payload_length` are ignored (radio padding).
 *
 * @return Header decode result, or PayloadTruncated when the buffer ends early.
 */
DecodeResult decode_frame(const uint8_t* data, size_t len,
                          MessageHeader& header, std::vector<uint8_t>& payload);

} // namespace hopmesh

#endif // HOPMESH_MESSAGE_HEADER_HPP
