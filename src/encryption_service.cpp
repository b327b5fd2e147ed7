// -----------------------------------------------------------------------------
// encryption_service.cpp: seal/open private and channel envelopes.
// -----------------------------------------------------------------------------
#include "hopmesh/encryption_service.hpp"
#include "hopmesh/crypto.hpp"
#include "hopmesh/log.hpp"

namespace hopmesh {

EncryptionService::EncryptionService(KeyManager& keys)
: keys_(keys) {}

// -----------------------------------------------------------------------------
// seal
// OUT: ct, nonce, tag, signature and signing key filled in. A fresh random
// nonce per call, so equal plaintexts never produce equal envelopes.
// -----------------------------------------------------------------------------
CryptoResult EncryptionService::seal(const Bytes& key, const Bytes& content, EncryptedMessage& out) {
  EncryptedMessage env;
  if (!crypto::random_bytes(crypto::NONCE_SIZE, env.nonce)) return CryptoResult::InternalError;
  if (!crypto::aead_encrypt(key, env.nonce, content, env.ciphertext, env.tag)) {
    return CryptoResult::InternalError;
  }

  Bytes sig;
  if (!keys_.sign(env.signed_bytes(), sig)) return CryptoResult::MissingKeyMaterial;
  env.signature      = std::move(sig);
  env.signing_public = keys_.identity_signing_public();

  out = std::move(env);
  return CryptoResult::Ok;
}

// POLICY: fail closed. An envelope without a signature is rejected outright.
CryptoResult EncryptionService::check_signature(const EncryptedMessage& envelope,
                                                const std::optional<Bytes>& pinned) const {
  if (!envelope.signature || !envelope.signing_public) return CryptoResult::InvalidSignature;
  if (pinned && !crypto::equal(*pinned, *envelope.signing_public)) return CryptoResult::InvalidSignature;
  if (!keys_.verify(envelope.signed_bytes(), *envelope.signature, *envelope.signing_public)) {
    return CryptoResult::InvalidSignature;
  }
  return CryptoResult::Ok;
}

// =============================================================================
// Private
// =============================================================================

CryptoResult EncryptionService::encrypt_private_message(const std::string& recipient_id,
                                                        const Bytes& recipient_agreement_public,
                                                        const Bytes& content,
                                                        EncryptedMessage& out) {
  std::shared_ptr<const SessionKeys> session;
  CryptoResult r = keys_.get_session_keys(recipient_id, recipient_agreement_public, session);
  if (r != CryptoResult::Ok) return r;

  Bytes key;
  if (!crypto::hkdf_sha256(session->shared_secret, KeyManager::PRIVATE_MESSAGE_INFO,
                           crypto::KEY_SIZE, key)) {
    return CryptoResult::InternalError;
  }

  r = seal(key, content, out);
  crypto::wipe(key);
  if (r != CryptoResult::Ok) return r;

  out.ephemeral_public = session->ephemeral_public;
  return CryptoResult::Ok;
}

CryptoResult EncryptionService::decrypt_private_message(const std::string& sender_id,
                                                        const std::optional<Bytes>& sender_signing_public,
                                                        const EncryptedMessage& envelope,
                                                        Bytes& plain_out) {
  CryptoResult r = check_signature(envelope, sender_signing_public);
  if (r != CryptoResult::Ok) {
    HOPMESH_LOG_WARN("crypto", "private message from " << sender_id << ": " << to_string(r));
    return r;
  }
  if (!envelope.ephemeral_public || envelope.ephemeral_public->empty()) {
    return CryptoResult::MissingEphemeralKey;
  }

  Bytes secret;
  if (!keys_.derive_shared_secret_for_decryption(*envelope.ephemeral_public, secret)) {
    return keys_.has_identity() ? CryptoResult::DecryptFailed : CryptoResult::MissingKeyMaterial;
  }

  Bytes key;
  const bool derived = crypto::hkdf_sha256(secret, KeyManager::PRIVATE_MESSAGE_INFO, crypto::KEY_SIZE, key);
  crypto::wipe(secret);
  if (!derived) return CryptoResult::InternalError;

  Bytes plain;
  const bool opened = crypto::aead_decrypt(key, envelope.nonce, envelope.ciphertext, envelope.tag, plain);
  crypto::wipe(key);
  if (!opened) {
    HOPMESH_LOG_WARN("crypto", "private message from " << sender_id << " failed authentication");
    return CryptoResult::DecryptFailed;
  }

  plain_out.swap(plain);
  return CryptoResult::Ok;
}

// =============================================================================
// Channel
// =============================================================================

CryptoResult EncryptionService::encrypt_channel_message(const std::string& channel,
                                                        const Bytes& content,
                                                        EncryptedMessage& out) {
  Bytes key;
  if (!keys_.channel_key(channel, key)) return CryptoResult::ChannelNotJoined;
  CryptoResult r = seal(key, content, out);
  crypto::wipe(key);
  return r;
}

CryptoResult EncryptionService::decrypt_channel_message(const std::string& channel,
                                                        const EncryptedMessage& envelope,
                                                        const std::optional<Bytes>& sender_signing_public,
                                                        Bytes& plain_out) {
  CryptoResult r = check_signature(envelope, sender_signing_public);
  if (r != CryptoResult::Ok) return r;

  Bytes key;
  if (!keys_.channel_key(channel, key)) return CryptoResult::ChannelNotJoined;

  Bytes plain;
  const bool opened = crypto::aead_decrypt(key, envelope.nonce, envelope.ciphertext, envelope.tag, plain);
  crypto::wipe(key);
  if (!opened) {
    HOPMESH_LOG_DEBUG("crypto", "channel " << channel << ": tag mismatch");
    return CryptoResult::WrongChannelPassword;
  }

  plain_out.swap(plain);
  return CryptoResult::Ok;
}

} // namespace hopmesh
