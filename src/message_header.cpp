// -----------------------------------------------------------------------------
// @file message_header.cpp
// @brief Implementation of the 20-byte HopMesh frame header codec.
//
// Implemented here:
// - Field constructor, pack/unpack (network byte order)
// - forwarded_copy(): the only place ttl/hop_count change
// - Message id generation (CSPRNG)
// - Whole-frame encode/decode helpers
// -----------------------------------------------------------------------------
#include "hopmesh/message_header.hpp"
#include "hopmesh/log.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <sstream>

namespace hopmesh {

// =============================================================================
// Names
// =============================================================================

const char* to_string(MessageType type) {
  switch (type) {
    case MessageType::Public:           return "PUBLIC";
    case MessageType::Private:          return "PRIVATE";
    case MessageType::Channel:          return "CHANNEL";
    case MessageType::PeerAnnouncement: return "PEER_ANNOUNCEMENT";
    case MessageType::Acknowledgment:   return "ACKNOWLEDGMENT";
    case MessageType::KeyExchange:      return "KEY_EXCHANGE";
    case MessageType::StoreForward:     return "STORE_FORWARD";
    case MessageType::RoutingUpdate:    return "ROUTING_UPDATE";
  }
  return "UNKNOWN";
}

const char* to_string(DecodeResult result) {
  switch (result) {
    case DecodeResult::Ok:                 return "ok";
    case DecodeResult::DataTooSmall:       return "data too small";
    case DecodeResult::UnsupportedVersion: return "unsupported version";
    case DecodeResult::PayloadTruncated:   return "payload truncated";
  }
  return "?";
}

// =============================================================================
// Construction
// =============================================================================

MessageHeader::MessageHeader(MessageType t, uint8_t ttl_, uint8_t hops, int64_t id,
                             const CompactId& sender, uint16_t len)
    : version(PROTOCOL_VERSION),
      type(static_cast<uint8_t>(t)),
      ttl(ttl_),
      hop_count(hops),
      message_id(id),
      sender_id(sender),
      payload_length(len) {}

// =============================================================================
// Packing & Unpacking
// =============================================================================

void MessageHeader::pack(uint8_t* out_buf) const {
  out_buf[0] = version;
  out_buf[1] = type;
  out_buf[2] = ttl;
  out_buf[3] = hop_count;

  // message id: 8 bytes, most significant first
  const uint64_t id = static_cast<uint64_t>(message_id);
  for (int i = 0; i < 8; ++i) {
    out_buf[4 + i] = static_cast<uint8_t>((id >> (56 - 8 * i)) & 0xFF);
  }

  // sender id: 6 raw bytes
  std::copy(sender_id.bytes.begin(), sender_id.bytes.end(), out_buf + 12);

  // payload length: 2 bytes, high byte first
  out_buf[18] = static_cast<uint8_t>((payload_length >> 8) & 0xFF);
  out_buf[19] = static_cast<uint8_t>(payload_length & 0xFF);
}

DecodeResult MessageHeader::unpack(const uint8_t* in_buf, size_t len, MessageHeader& out) {
  if (in_buf == nullptr || len < SIZE) return DecodeResult::DataTooSmall;
  if (in_buf[0] != PROTOCOL_VERSION)   return DecodeResult::UnsupportedVersion;

  MessageHeader h;
  h.version   = in_buf[0];
  h.type      = in_buf[1];
  h.ttl       = in_buf[2];
  h.hop_count = in_buf[3];

  uint64_t id = 0;
  for (int i = 0; i < 8; ++i) id = (id << 8) | in_buf[4 + i];
  h.message_id = static_cast<int64_t>(id);

  h.sender_id      = CompactId(in_buf + 12);
  h.payload_length = static_cast<uint16_t>((in_buf[18] << 8) | in_buf[19]);

  out = h;
  return DecodeResult::Ok;
}

// =============================================================================
// Forwarding
// =============================================================================

MessageHeader MessageHeader::forwarded_copy() const {
  MessageHeader next = *this;
  if (next.ttl > 0)         --next.ttl;        // never wrap below zero
  if (next.hop_count < 255) ++next.hop_count;  // saturate instead of wrapping to 0
  return next;
}

std::string MessageHeader::describe() const {
  std::ostringstream os;
  os << (is_known_type() ? to_string(message_type()) : "UNKNOWN")
     << " id=" << message_id
     << " from=" << sender_id.to_string().c_str()
     << " ttl=" << static_cast<int>(ttl)
     << " hop=" << static_cast<int>(hop_count)
     << " len=" << payload_length;
  return os.str();
}

bool MessageHeader::operator==(const MessageHeader& o) const {
  return version == o.version && type == o.type && ttl == o.ttl &&
         hop_count == o.hop_count && message_id == o.message_id &&
         sender_id == o.sender_id && payload_length == o.payload_length;
}

// =============================================================================
// Message ids
// =============================================================================

int64_t generate_message_id() {
  uint64_t v = 0;
  if (RAND_bytes(reinterpret_cast<unsigned char*>(&v), sizeof(v)) == 1) {
    return static_cast<int64_t>(v);
  }

  // CSPRNG unavailable: time in the high half, a process counter in the low
  // half keeps ids unique within this run.
  static std::atomic<uint32_t> counter{0};
  HOPMESH_LOG_ERROR("core", "RAND_bytes failed; message id falls back to time+counter");
  const uint64_t ms = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch()).count());
  v = (ms << 32) ^ counter.fetch_add(1);
  return static_cast<int64_t>(v);
}

// =============================================================================
// Frames
// =============================================================================

bool encode_frame(const MessageHeader& header, const std::vector<uint8_t>& payload,
                  std::vector<uint8_t>& out) {
  if (payload.size() > MessageHeader::MAX_PAYLOAD) return false;

  MessageHeader h = header;
  h.payload_length = static_cast<uint16_t>(payload.size());

  out.resize(MessageHeader::SIZE + payload.size());
  h.pack(out.data());
  std::copy(payload.begin(), payload.end(), out.begin() + MessageHeader::SIZE);
  return true;
}

DecodeResult decode_frame(const uint8_t* data, size_t len,
                          MessageHeader& header, std::vector<uint8_t>& payload) {
  MessageHeader h;
  DecodeResult r = MessageHeader::unpack(data, len, h);
  if (r != DecodeResult::Ok) return r;

  const size_t need = MessageHeader::SIZE + h.payload_length;
  if (len < need) return DecodeResult::PayloadTruncated;

  header = h;
  payload.assign(data + MessageHeader::SIZE, data + need);
  return DecodeResult::Ok;
}

} // namespace hopmesh
