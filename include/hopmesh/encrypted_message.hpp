/**
 * @file encrypted_message.hpp
 * @brief Encryption envelope and its length-prefixed wire form.
 *
 * @details
 * Wire form (all lengths big-endian u32):
 * ```
 * [len][ciphertext] [len][nonce] [len][tag]
 * [present u8][len][ephemeral public key]   present=0 => no len/bytes follow
 * [present u8][len][signature]
 * [present u8][len][signing public key]
 * ```
 * Private envelopes carry all three optional fields. Channel envelopes leave
 * out the ephemeral key.
 */
#ifndef HOPMESH_ENCRYPTED_MESSAGE_HPP
#define HOPMESH_ENCRYPTED_MESSAGE_HPP

#include <stdint.h>
#include <stddef.h>
#include <optional>
#include <vector>

namespace hopmesh {

/// Outcome of any key or envelope operation (the CryptoFailure family plus Ok).
enum class CryptoResult : uint8_t {
  Ok                   = 0,
  InvalidSignature     = 1,
  MissingEphemeralKey  = 2,
  MissingKeyMaterial   = 3,
  DecryptFailed        = 4,
  WrongChannelPassword = 5,
  ChannelNotJoined     = 6,
  MalformedEnvelope    = 7,
  InternalError        = 8,
};

const char* to_string(CryptoResult r);

struct EncryptedMessage {
  std::vector<uint8_t>                ciphertext;
  std::vector<uint8_t>                nonce;
  std::vector<uint8_t>                tag;
  std::optional<std::vector<uint8_t>> ephemeral_public;
  std::optional<std::vector<uint8_t>> signature;
  std::optional<std::vector<uint8_t>> signing_public;

  /// ciphertext || nonce || tag, the bytes covered by the signature.
  std::vector<uint8_t> signed_bytes() const;

  void serialize(std::vector<uint8_t>& out) const;

  /// @return Ok, or MalformedEnvelope if any length overruns the buffer.
  static CryptoResult deserialize(const uint8_t* data, size_t len, EncryptedMessage& out);
};

} // namespace hopmesh

#endif // HOPMESH_ENCRYPTED_MESSAGE_HPP
