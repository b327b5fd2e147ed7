/**
 * @file encryption_service.hpp
 * @brief Private (per-peer) and channel (password) envelopes on top of KeyManager.
 *
 * @details
 * Private message, sender side:
 * 1. session = KeyManager::get_session_keys(recipient)   (ephemeral X25519 x recipient identity)
 * 2. key     = HKDF-SHA256(session.shared_secret, info = "hopmesh_private_message")
 * 3. ct,tag  = ChaCha20-Poly1305(key, fresh 12-byte nonce, content)
 * 4. sig     = Ed25519(identity, ct || nonce || tag)
 * 5. envelope carries ct, nonce, tag, ephemeral public, sig, signing public
 *
 * Receiver side runs the checks in a fixed order and stops at the first failure:
 * signature (InvalidSignature) -> ephemeral key present (MissingEphemeralKey)
 * -> X25519(identity, ephemeral) + HKDF -> AEAD open (DecryptFailed).
 * No plaintext is produced unless every step passed.
 *
 * Channel messages swap steps 1-2 for the joined channel's key and leave out
 * the ephemeral key. A tag failure there reads as WrongChannelPassword; an
 * unknown channel as ChannelNotJoined.
 */
#ifndef HOPMESH_ENCRYPTION_SERVICE_HPP
#define HOPMESH_ENCRYPTION_SERVICE_HPP

#include <stdint.h>
#include <optional>
#include <string>
#include <vector>

#include "hopmesh/encrypted_message.hpp"
#include "hopmesh/key_manager.hpp"

namespace hopmesh {

class EncryptionService {
public:
  explicit EncryptionService(KeyManager& keys);

  CryptoResult encrypt_private_message(const std::string& recipient_id,
                                       const Bytes& recipient_agreement_public,
                                       const Bytes& content,
                                       EncryptedMessage& out);

  /**
   * @param sender_id             Peer id of the origin (logs only).
   * @param sender_signing_public Pinned Ed25519 key of the sender when known; the
   *                              envelope's signing key must match it.
   */
  CryptoResult decrypt_private_message(const std::string& sender_id,
                                       const std::optional<Bytes>& sender_signing_public,
                                       const EncryptedMessage& envelope,
                                       Bytes& plain_out);

  CryptoResult encrypt_channel_message(const std::string& channel,
                                       const Bytes& content,
                                       EncryptedMessage& out);

  CryptoResult decrypt_channel_message(const std::string& channel,
                                       const EncryptedMessage& envelope,
                                       const std::optional<Bytes>& sender_signing_public,
                                       Bytes& plain_out);

private:
  CryptoResult seal(const Bytes& key, const Bytes& content, EncryptedMessage& out);
  CryptoResult check_signature(const EncryptedMessage& envelope,
                               const std::optional<Bytes>& pinned) const;

  KeyManager& keys_;
};

} // namespace hopmesh

#endif // HOPMESH_ENCRYPTION_SERVICE_HPP
