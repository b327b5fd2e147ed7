// -----------------------------------------------------------------------------
// key_manager.cpp: identity, sessions, channels, peer public keys.
//
// API & session slot model: see include/hopmesh/key_manager.hpp
// -----------------------------------------------------------------------------
#include "hopmesh/key_manager.hpp"
#include "hopmesh/log.hpp"
#include "hopmesh/state_store.hpp"

namespace hopmesh {

SessionKeys::~SessionKeys() {
  crypto::wipe(shared_secret);
}

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::NoSession:       return "no-session";
    case SessionState::Active:          return "active";
    case SessionState::RotationPending: return "rotation-pending";
  }
  return "?";
}

// =============================================================================
// Identity
// =============================================================================

KeyManager::KeyManager(const Clock& clock, KeyManagerConfig cfg)
: clock_(clock),
  cfg_(cfg),
  signing_key_(crypto::generate_ed25519()),
  agreement_key_(crypto::generate_x25519()) {
  if (!crypto::raw_public_key(signing_key_.get(), signing_public_) ||
      !crypto::raw_public_key(agreement_key_.get(), agreement_public_)) {
    HOPMESH_LOG_ERROR("keys", "identity key generation failed; encryption disabled");
    signing_key_.reset();
    agreement_key_.reset();
    signing_public_.clear();
    agreement_public_.clear();
  }
}

KeyManager::~KeyManager() {
  clear_all_keys();
}

bool KeyManager::has_identity() const {
  std::shared_lock<std::shared_mutex> lock(identity_mutex_);
  return signing_key_ && agreement_key_;
}

Bytes KeyManager::identity_signing_public() const {
  std::shared_lock<std::shared_mutex> lock(identity_mutex_);
  return signing_public_;
}

Bytes KeyManager::identity_agreement_public() const {
  std::shared_lock<std::shared_mutex> lock(identity_mutex_);
  return agreement_public_;
}

// -----------------------------------------------------------------------------
// load_or_create
// POLICY: stored keys win. Corrupt material is reported and left in the store;
// the in-memory identity is used for this run only.
// -----------------------------------------------------------------------------
bool KeyManager::load_or_create(IdentityKeyStore& store) {
  IdentityKeyBlob blob;
  if (!store.load_identity_keys(blob)) {
    HOPMESH_LOG_INFO("keys", "no stored identity keys; saving the generated pair");
    return save_identity(store);
  }

  crypto::PkeyPtr signer = crypto::ed25519_from_seed(blob.signing);
  crypto::PkeyPtr agree = crypto::x25519_from_private(blob.agreement);
  crypto::wipe(blob.signing);
  crypto::wipe(blob.agreement);

  Bytes sign_pub, agree_pub;
  if (!signer || !agree ||
      !crypto::raw_public_key(signer.get(), sign_pub) ||
      !crypto::raw_public_key(agree.get(), agree_pub)) {
    HOPMESH_LOG_WARN("keys", "stored identity keys are unusable; keeping generated identity");
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(identity_mutex_);
  signing_key_      = std::move(signer);
  agreement_key_    = std::move(agree);
  signing_public_   = std::move(sign_pub);
  agreement_public_ = std::move(agree_pub);
  HOPMESH_LOG_INFO("keys", "loaded stored identity keys");
  return true;
}

bool KeyManager::save_identity(IdentityKeyStore& store) const {
  IdentityKeyBlob blob;
  {
    std::shared_lock<std::shared_mutex> lock(identity_mutex_);
    if (!signing_key_ || !agreement_key_) return false;
    if (!crypto::raw_private_key(signing_key_.get(), blob.signing) ||
        !crypto::raw_private_key(agreement_key_.get(), blob.agreement)) {
      return false;
    }
  }
  const bool ok = store.save_identity_keys(blob);
  crypto::wipe(blob.signing);
  crypto::wipe(blob.agreement);
  if (!ok) HOPMESH_LOG_ERROR("store", "identity keys could not be saved");
  return ok;
}

bool KeyManager::sign(const Bytes& data, Bytes& signature_out) const {
  std::shared_lock<std::shared_mutex> lock(identity_mutex_);
  if (!signing_key_) return false;
  return crypto::ed25519_sign(signing_key_.get(), data, signature_out);
}

bool KeyManager::verify(const Bytes& data, const Bytes& signature, const Bytes& signing_public) const {
  return crypto::ed25519_verify(signing_public, data, signature);
}

bool KeyManager::derive_shared_secret_for_decryption(const Bytes& ephemeral_public, Bytes& secret_out) const {
  std::shared_lock<std::shared_mutex> lock(identity_mutex_);
  if (!agreement_key_) return false;
  return crypto::x25519_derive(agreement_key_.get(), ephemeral_public, secret_out);
}

// =============================================================================
// Sessions
// =============================================================================

std::shared_ptr<KeyManager::SessionSlot> KeyManager::slot_for(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  auto& slot = sessions_[peer_id];
  if (!slot) slot = std::make_shared<SessionSlot>();
  return slot;
}

bool KeyManager::derive_session(const Bytes& peer_agreement_public,
                                std::shared_ptr<const SessionKeys>& out) const {
  crypto::PkeyPtr ephemeral = crypto::generate_x25519();
  if (!ephemeral) return false;

  auto keys = std::make_shared<SessionKeys>();
  if (!crypto::raw_public_key(ephemeral.get(), keys->ephemeral_public) ||
      !crypto::x25519_derive(ephemeral.get(), peer_agreement_public, keys->shared_secret)) {
    return false;
  }
  keys->remote_public = peer_agreement_public;
  keys->created_ms    = clock_.now_ms();
  out = std::move(keys);
  return true;
}

// -----------------------------------------------------------------------------
// get_session_keys
// PRE: peer_agreement_public is a 32-byte X25519 key.
// POLICY: single writer per slot. The slot mutex is held across the
// Active -> RotationPending -> Active transition, so a second caller never
// derives a parallel session; it waits and then reuses the winner's keys.
// -----------------------------------------------------------------------------
CryptoResult KeyManager::get_session_keys(const std::string& peer_id, const Bytes& peer_agreement_public,
                                          std::shared_ptr<const SessionKeys>& out) {
  if (peer_agreement_public.size() != crypto::PUBLIC_KEY_SIZE) return CryptoResult::MissingKeyMaterial;

  std::shared_ptr<SessionSlot> slot = slot_for(peer_id);
  const uint64_t now = clock_.now_ms();

  std::lock_guard<std::mutex> lock(slot->mutex);
  if (slot->state == SessionState::Active && slot->keys) {
    const bool stale = slot->keys->should_rotate(now, cfg_.session_max_age_ms) ||
                       slot->uses >= cfg_.session_max_uses ||
                       slot->keys->remote_public != peer_agreement_public;
    if (!stale) {
      ++slot->uses;
      out = slot->keys;
      return CryptoResult::Ok;
    }
    slot->state = SessionState::RotationPending;
    HOPMESH_LOG_DEBUG("keys", "rotating session for " << peer_id << " after " << slot->uses << " uses");
  }

  std::shared_ptr<const SessionKeys> fresh;
  if (!derive_session(peer_agreement_public, fresh)) {
    slot->state = slot->keys ? SessionState::Active : SessionState::NoSession;
    HOPMESH_LOG_WARN("keys", "session derivation for " << peer_id << " failed");
    return CryptoResult::InternalError;
  }

  slot->keys  = fresh;
  slot->uses  = 1;
  slot->state = SessionState::Active;
  out = std::move(fresh);
  return CryptoResult::Ok;
}

SessionState KeyManager::session_state(const std::string& peer_id) const {
  std::shared_ptr<SessionSlot> slot;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(peer_id);
    if (it == sessions_.end()) return SessionState::NoSession;
    slot = it->second;
  }
  std::lock_guard<std::mutex> lock(slot->mutex);
  return slot->state;
}

size_t KeyManager::session_count() const {
  std::vector<std::shared_ptr<SessionSlot>> slots;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& kv : sessions_) slots.push_back(kv.second);
  }
  size_t n = 0;
  for (const auto& s : slots) {
    std::lock_guard<std::mutex> lock(s->mutex);
    if (s->state == SessionState::Active) ++n;
  }
  return n;
}

size_t KeyManager::rotate_expired_sessions() {
  const uint64_t now = clock_.now_ms();
  std::vector<std::shared_ptr<SessionSlot>> slots;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& kv : sessions_) slots.push_back(kv.second);
  }

  size_t dropped = 0;
  for (const auto& s : slots) {
    std::lock_guard<std::mutex> lock(s->mutex);
    if (s->state != SessionState::Active || !s->keys) continue;
    if (s->keys->should_rotate(now, cfg_.session_max_age_ms) || s->uses >= cfg_.session_max_uses) {
      s->keys.reset();
      s->uses  = 0;
      s->state = SessionState::NoSession;
      ++dropped;
    }
  }

  // Empty slots go too. A slot busy deriving is left for the next sweep.
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      std::unique_lock<std::mutex> slot_lock(it->second->mutex, std::try_to_lock);
      if (slot_lock.owns_lock() && it->second->state == SessionState::NoSession) {
        slot_lock.unlock();
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (dropped) HOPMESH_LOG_INFO("keys", "rotated " << dropped << " session keys");
  return dropped;
}

size_t KeyManager::session_slot_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}

// =============================================================================
// Channels
// =============================================================================

CryptoResult KeyManager::derive_channel_key(const std::string& channel, const std::string& password,
                                            Bytes& key_out) {
  if (channel.empty()) return CryptoResult::MissingKeyMaterial;

  // No lock: scrypt is pure, and passwords are never retained.
  Bytes key;
  if (!crypto::scrypt_derive(password, channel, key)) return CryptoResult::InternalError;
  key_out = std::move(key);
  return CryptoResult::Ok;
}

CryptoResult KeyManager::join_channel(const std::string& channel, const std::string& password) {
  Bytes key;
  CryptoResult r = derive_channel_key(channel, password, key);
  if (r != CryptoResult::Ok) return r;

  std::lock_guard<std::mutex> lock(channels_mutex_);
  auto it = channel_keys_.find(channel);
  if (it != channel_keys_.end()) crypto::wipe(it->second);
  channel_keys_[channel] = std::move(key);
  HOPMESH_LOG_INFO("keys", "joined channel " << channel);
  return CryptoResult::Ok;
}

bool KeyManager::leave_channel(const std::string& channel) {
  std::lock_guard<std::mutex> lock(channels_mutex_);
  auto it = channel_keys_.find(channel);
  if (it == channel_keys_.end()) return false;
  crypto::wipe(it->second);
  channel_keys_.erase(it);
  HOPMESH_LOG_INFO("keys", "left channel " << channel);
  return true;
}

bool KeyManager::channel_key(const std::string& channel, Bytes& key_out) const {
  std::lock_guard<std::mutex> lock(channels_mutex_);
  auto it = channel_keys_.find(channel);
  if (it == channel_keys_.end()) return false;
  key_out = it->second;
  return true;
}

bool KeyManager::is_joined(const std::string& channel) const {
  std::lock_guard<std::mutex> lock(channels_mutex_);
  return channel_keys_.count(channel) != 0;
}

std::vector<std::string> KeyManager::joined_channels() const {
  std::lock_guard<std::mutex> lock(channels_mutex_);
  std::vector<std::string> out;
  for (const auto& kv : channel_keys_) out.push_back(kv.first);
  return out;
}

// =============================================================================
// Peer public keys
// =============================================================================

// -----------------------------------------------------------------------------
// store_peer_public_key
// POLICY: trust on first use. Keys already held for `peer_id` are pinned: a
// store naming a different agreement or signing key is refused. A pinned
// entry without a signing key may gain one when the agreement key matches.
// Only remove_peer_public_key() / forget_peer() unpin.
// -----------------------------------------------------------------------------
bool KeyManager::store_peer_public_key(const std::string& peer_id, const PeerPublicKeys& keys) {
  if (keys.agreement.size() != crypto::PUBLIC_KEY_SIZE) return false;
  if (keys.signing && keys.signing->size() != crypto::PUBLIC_KEY_SIZE) return false;

  PeerPublicKeys copy = keys;   // the caller's buffers stay theirs
  PeerKeyHook hook;
  {
    std::lock_guard<std::mutex> lock(peers_mutex_);
    auto it = peer_keys_.find(peer_id);
    if (it != peer_keys_.end()) {
      const PeerPublicKeys& pinned = it->second;
      const bool same_signing = !pinned.signing ||
                                (copy.signing && crypto::equal(*pinned.signing, *copy.signing));
      if (!crypto::equal(pinned.agreement, copy.agreement) || !same_signing) {
        HOPMESH_LOG_WARN("keys", "refused new keys for " << peer_id << ": keys already pinned");
        return false;
      }
      if (!copy.signing) copy.signing = pinned.signing;
    }
    peer_keys_[peer_id] = copy;
    hook = hook_;
  }
  // Hook runs unlocked so it may call back into the key manager.
  if (hook) hook(peer_id, copy);
  return true;
}

std::optional<PeerPublicKeys> KeyManager::get_peer_public_key(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  auto it = peer_keys_.find(peer_id);
  if (it == peer_keys_.end()) return std::nullopt;
  return it->second;
}

bool KeyManager::remove_peer_public_key(const std::string& peer_id) {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  return peer_keys_.erase(peer_id) != 0;
}

bool KeyManager::forget_peer(const std::string& peer_id) {
  bool had_session = false;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    had_session = sessions_.erase(peer_id) != 0;
  }
  const bool had_keys = remove_peer_public_key(peer_id);
  return had_keys || had_session;
}

size_t KeyManager::peer_key_count() const {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  return peer_keys_.size();
}

void KeyManager::set_peer_key_hook(PeerKeyHook hook) {
  std::lock_guard<std::mutex> lock(peers_mutex_);
  hook_ = std::move(hook);
}

void KeyManager::clear_all_keys() {
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.clear();
  }
  std::lock_guard<std::mutex> lock(channels_mutex_);
  for (auto& kv : channel_keys_) crypto::wipe(kv.second);
  channel_keys_.clear();
}

} // namespace hopmesh
