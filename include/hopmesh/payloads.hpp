/**
 * @file payloads.hpp
 * @brief Bodies carried after the 20-byte header, per message type.
 *
 * | Type              | Body                                                        |
 * |-------------------|-------------------------------------------------------------|
 * | PUBLIC            | UTF-8 text                                                  |
 * | PRIVATE           | recipient id (6) + serialized EncryptedMessage              |
 * | CHANNEL           | name length (1) + name + serialized EncryptedMessage        |
 * | PEER_ANNOUNCEMENT | nick length (1) + nick + X25519 public (32) + Ed25519 public (32) |
 * | anything else     | opaque                                                      |
 *
 * Parsers only check framing. Envelope contents are EncryptionService's business.
 */
#ifndef HOPMESH_PAYLOADS_HPP
#define HOPMESH_PAYLOADS_HPP

#include <stdint.h>
#include <stddef.h>
#include <string>
#include <vector>

#include "hopmesh/device_id.hpp"

namespace hopmesh {

static constexpr size_t MAX_NICKNAME_LEN     = 255;
static constexpr size_t MAX_CHANNEL_NAME_LEN = 255;

struct AnnouncementPayload {
  std::string          nickname;
  std::vector<uint8_t> agreement_public;   ///< 32 bytes
  std::vector<uint8_t> signing_public;     ///< 32 bytes
};

struct PrivatePayload {
  CompactId            recipient;
  std::vector<uint8_t> envelope;
};

struct ChannelPayload {
  std::string          channel;
  std::vector<uint8_t> envelope;
};

/// Nicknames longer than MAX_NICKNAME_LEN are cut. @return false on wrong key sizes.
bool encode_announcement(const AnnouncementPayload& in, std::vector<uint8_t>& out);
bool decode_announcement(const std::vector<uint8_t>& in, AnnouncementPayload& out);

void encode_private(const PrivatePayload& in, std::vector<uint8_t>& out);
bool decode_private(const std::vector<uint8_t>& in, PrivatePayload& out);

/// @return false for an empty name or one longer than MAX_CHANNEL_NAME_LEN.
bool encode_channel(const ChannelPayload& in, std::vector<uint8_t>& out);
bool decode_channel(const std::vector<uint8_t>& in, ChannelPayload& out);

} // namespace hopmesh

#endif // HOPMESH_PAYLOADS_HPP
