/**
 * @file key_manager.hpp
 * @brief Identity keys, per-peer session keys, channel keys and peer public keys.
 *
 * @details
 * WHAT IT HOLDS
 * -------------
 * - **Identity**: one Ed25519 signing pair and one X25519 agreement pair,
 *   generated on first run. Private halves never leave this class except
 *   through an IdentityKeyStore (save_identity / load_or_create).
 * - **Sessions**: per peer, an ephemeral X25519 pair agreed against the
 *   peer's identity agreement key. Only the ephemeral public key and the
 *   shared secret are kept, as an immutable SessionKeys snapshot.
 * - **Channels**: name -> 32-byte key from scrypt(password, salt = name).
 * - **Peer public keys**: peer id -> PeerPublicKeys, copied on store and
 *   pinned on first use: later stores must name the same keys. Every
 *   accepted store fires the key hook so the core can react to newly usable peers.
 *
 * SESSION SLOTS
 * -------------
 * Each peer has a slot with its own mutex and an explicit state:
 * ```
 *   NoSession ──derive──► Active{keys} ──age/uses/new peer key──► RotationPending ──► Active{new keys}
 * ```
 * The transition runs while the slot mutex is held, so when two senders
 * find the same session due for rotation, the first derives new keys and
 * the second, once it gets the mutex, finds `Active` with fresh keys and uses them.
 * SessionKeys are shared as `shared_ptr<const SessionKeys>`: replaced
 * wholesale, never edited.
 *
 * Peer ids are opaque strings (the core uses the compact id display form).
 */
#ifndef HOPMESH_KEY_MANAGER_HPP
#define HOPMESH_KEY_MANAGER_HPP

#include <stdint.h>
#include <stddef.h>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "hopmesh/clock.hpp"
#include "hopmesh/crypto.hpp"
#include "hopmesh/encrypted_message.hpp"

namespace hopmesh {

class IdentityKeyStore;

using Bytes = std::vector<uint8_t>;

/// Immutable per-peer session snapshot.
struct SessionKeys {
  Bytes    ephemeral_public;   ///< our ephemeral X25519 public key (goes into envelopes)
  Bytes    remote_public;      ///< peer identity agreement key it was derived against
  Bytes    shared_secret;      ///< X25519 output
  uint64_t created_ms{0};

  SessionKeys() = default;
  SessionKeys(const SessionKeys&) = delete;
  SessionKeys& operator=(const SessionKeys&) = delete;
  ~SessionKeys();

  /// True once older than `max_age_ms`.
  bool should_rotate(uint64_t now_ms, uint64_t max_age_ms) const {
    return now_ms > created_ms && now_ms - created_ms > max_age_ms;
  }
};

enum class SessionState : uint8_t { NoSession = 0, Active = 1, RotationPending = 2 };

const char* to_string(SessionState s);

/// A peer's published keys.
struct PeerPublicKeys {
  Bytes                agreement;   ///< X25519, 32 bytes
  std::optional<Bytes> signing;     ///< Ed25519, 32 bytes, when announced
};

struct KeyManagerConfig {
  uint64_t session_max_age_ms{24ull * 60ull * 60ull * 1000ull};
  uint64_t session_max_uses{10000};
};

class KeyManager {
public:
  using PeerKeyHook = std::function<void(const std::string& peer_id, const PeerPublicKeys& keys)>;

  static constexpr const char* PRIVATE_MESSAGE_INFO = "hopmesh_private_message";

  /// Generates a fresh identity. Check has_identity() when the backend may be broken.
  explicit KeyManager(const Clock& clock, KeyManagerConfig cfg = KeyManagerConfig());
  ~KeyManager();

  KeyManager(const KeyManager&) = delete;
  KeyManager& operator=(const KeyManager&) = delete;

  /// @name Identity
  ///@{
  bool  has_identity() const;
  Bytes identity_signing_public() const;
  Bytes identity_agreement_public() const;

  /**
   * @brief Replace the generated identity with the stored one, or store the
   * generated one when the store is empty.
   * @return false if the store holds unusable key material (the generated
   *         identity stays in use) or a save failed.
   */
  bool load_or_create(IdentityKeyStore& store);
  bool save_identity(IdentityKeyStore& store) const;

  bool sign(const Bytes& data, Bytes& signature_out) const;
  bool verify(const Bytes& data, const Bytes& signature, const Bytes& signing_public) const;

  /// X25519(identity agreement private, `ephemeral_public`): the receiver half of a private message.
  bool derive_shared_secret_for_decryption(const Bytes& ephemeral_public, Bytes& secret_out) const;
  ///@}

  /// @name Sessions
  ///@{

  /**
   * @brief Cached session for `peer_id`, or a freshly derived one.
   *
   * Rotates when the session is older than session_max_age_ms, has been used
   * session_max_uses times, or was derived against a different peer key.
   */
  CryptoResult get_session_keys(const std::string& peer_id, const Bytes& peer_agreement_public,
                                std::shared_ptr<const SessionKeys>& out);

  SessionState session_state(const std::string& peer_id) const;
  size_t       session_count() const;

  /// Drop every session past its rotation threshold and erase empty slots. @return sessions dropped.
  size_t rotate_expired_sessions();

  /// Slots held, active or not.
  size_t session_slot_count() const;
  ///@}

  /// @name Channels
  ///@{

  /// Deterministic scrypt derivation. Nothing is cached; joined channels keep only the key.
  CryptoResult derive_channel_key(const std::string& channel, const std::string& password, Bytes& key_out);

  CryptoResult join_channel(const std::string& channel, const std::string& password);
  bool         leave_channel(const std::string& channel);
  bool         channel_key(const std::string& channel, Bytes& key_out) const;
  bool         is_joined(const std::string& channel) const;
  std::vector<std::string> joined_channels() const;
  ///@}

  /// @name Peer public keys
  ///@{
  /// @return false on bad key sizes or when different keys are already pinned for `peer_id`.
  bool store_peer_public_key(const std::string& peer_id, const PeerPublicKeys& keys);
  std::optional<PeerPublicKeys> get_peer_public_key(const std::string& peer_id) const;
  bool remove_peer_public_key(const std::string& peer_id);

  /// Drop the peer's keys and session slot. @return true if anything was held.
  bool forget_peer(const std::string& peer_id);
  size_t peer_key_count() const;
  void set_peer_key_hook(PeerKeyHook hook);
  ///@}

  /// Wipe sessions and channel keys. Identity and peer keys stay.
  void clear_all_keys();

private:
  struct SessionSlot {
    std::mutex                          mutex;
    SessionState                        state{SessionState::NoSession};
    std::shared_ptr<const SessionKeys>  keys;
    uint64_t                            uses{0};
  };

  std::shared_ptr<SessionSlot> slot_for(const std::string& peer_id);
  bool derive_session(const Bytes& peer_agreement_public, std::shared_ptr<const SessionKeys>& out) const;

  const Clock&            clock_;
  const KeyManagerConfig  cfg_;

  mutable std::shared_mutex identity_mutex_;
  crypto::PkeyPtr           signing_key_;
  crypto::PkeyPtr           agreement_key_;
  Bytes                     signing_public_;
  Bytes                     agreement_public_;

  mutable std::mutex                                              sessions_mutex_;
  std::unordered_map<std::string, std::shared_ptr<SessionSlot>>   sessions_;

  mutable std::mutex             channels_mutex_;
  std::map<std::string, Bytes>   channel_keys_;    // joined channels

  mutable std::mutex                               peers_mutex_;
  std::unordered_map<std::string, PeerPublicKeys>  peer_keys_;
  PeerKeyHook                                      hook_;
};

} // namespace hopmesh

#endif // HOPMESH_KEY_MANAGER_HPP
