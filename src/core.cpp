// -----------------------------------------------------------------------------
// core.cpp: implementation of HopMesh Core
//
// API & field descriptions:
//   see include/hopmesh/core.hpp
//
// Multi-node scenarios:
//   see tests/test_core_forwarding.cpp, tests/test_core_control.cpp
//
// NOTE: this file holds the *policies* (drop order, what is surfaced, what is
// forwarded). The data structures live in their own modules.
// -----------------------------------------------------------------------------
#include "hopmesh/core.hpp"
#include "hopmesh/log.hpp"
#include "hopmesh/payloads.hpp"

namespace hopmesh {

const char* to_string(SendResult r) {
  switch (r) {
    case SendResult::Ok:               return "ok";
    case SendResult::NotRunning:       return "not_running";
    case SendResult::PayloadTooLarge:  return "payload_too_large";
    case SendResult::UnknownRecipient: return "unknown_recipient";
    case SendResult::ChannelNotJoined: return "channel_not_joined";
    case SendResult::CryptoError:      return "crypto_error";
    case SendResult::EncodeError:      return "encode_error";
  }
  return "?";
}

// ---------- construction / lifecycle ----------

Core::Core(const CompactId& self, transport::ITransport& transport, const MeshConfig& cfg,
           const Clock& clock, BlocklistStore* blocklist_store)
: self_(self),
  transport_(transport),
  cfg_(cfg),
  clock_(clock),
  blocklist_(blocklist_store),
  registry_(clock, blocklist_, cfg.max_connections),
  cache_(clock, cfg.cache_capacity, cfg.cache_expiration_ms),
  keys_(clock, KeyManagerConfig{cfg.session_max_age_ms, cfg.session_max_uses}),
  crypto_(keys_) {
  keys_.set_peer_key_hook([](const std::string& peer_id, const PeerPublicKeys& k) {
    HOPMESH_LOG_DEBUG("core", "keys for " << peer_id << " stored"
                              << (k.signing ? " (with signing key)" : ""));
  });
}

Core::~Core() {
  stop();
}

// -----------------------------------------------------------------------------
// start
// POLICY: a config the core cannot honour is refused here, not at first use.
// The three maintenance loops are independent timers on one worker.
// -----------------------------------------------------------------------------
bool Core::start() {
  if (running_.load()) return true;

  std::string why;
  if (validate_mesh_config(cfg_, &why) != ConfigResult::Ok) {
    HOPMESH_LOG_ERROR("core", "invalid config: " << why);
    emit(MeshEvent::Kind::Error, "invalid config: " + why);
    return false;
  }

  auto sched = std::make_unique<TaskScheduler>();
  const TaskScheduler::TaskId ids[] = {
    sched->schedule_every("cache-sweep", cfg_.effective_cache_sweep_ms(), [this] { sweep_cache(); }),
    sched->schedule_every("stale-peers", cfg_.effective_stale_sweep_ms(), [this] { sweep_stale_peers(); }),
    sched->schedule_every("connect-timeouts", cfg_.connect_check_interval_ms,
                          [this] { enforce_connect_timeouts(); }),
  };
  for (TaskScheduler::TaskId id : ids) {
    if (id == TaskScheduler::INVALID_TASK) {
      HOPMESH_LOG_ERROR("core", "could not arm maintenance timers");
      emit(MeshEvent::Kind::Error, "could not arm maintenance timers");
      sched->stop();
      return false;
    }
  }
  scheduler_ = std::move(sched);
  running_.store(true);

  HOPMESH_LOG_INFO("core", "mesh started as " << self_.to_string().c_str()
                           << " over " << transport_.name());
  emit(MeshEvent::Kind::MeshStarted, "mesh started");
  return true;
}

void Core::stop() {
  if (!running_.exchange(false)) return;

  if (scheduler_) {
    scheduler_->stop();
    scheduler_.reset();
  }
  for (const std::string& link : registry_.disconnect_all()) {
    const transport::TxResult r = transport_.request_disconnect(link);
    if (r != transport::TxResult::Ok) {
      HOPMESH_LOG_WARN("core", "disconnect " << link << " on stop: " << transport::to_string(r));
    }
  }
  HOPMESH_LOG_INFO("core", "mesh stopped");
  emit(MeshEvent::Kind::MeshStopped, "mesh stopped");
}

// ---------- sending ----------

SendResult Core::send_public(const std::string& text, int64_t* message_id_out) {
  if (!running_.load()) return SendResult::NotRunning;
  const std::vector<uint8_t> payload(text.begin(), text.end());
  return originate(MessageType::Public, payload, registry_.connected_connection_ids(), message_id_out);
}

SendResult Core::send_private(const CompactId& recipient, const std::string& text,
                              int64_t* message_id_out) {
  if (!running_.load()) return SendResult::NotRunning;
  if (recipient == self_) return SendResult::UnknownRecipient;

  const std::optional<PeerPublicKeys> peer_keys = keys_.get_peer_public_key(recipient.str());
  if (!peer_keys) {
    HOPMESH_LOG_WARN("core", "no keys for " << recipient.to_string().c_str() << "; has it announced?");
    return SendResult::UnknownRecipient;
  }

  EncryptedMessage envelope;
  const Bytes content(text.begin(), text.end());
  const CryptoResult cr = crypto_.encrypt_private_message(recipient.str(), peer_keys->agreement,
                                                          content, envelope);
  if (cr != CryptoResult::Ok) {
    HOPMESH_LOG_ERROR("core", "encrypt for " << recipient.to_string().c_str() << ": " << to_string(cr));
    return SendResult::CryptoError;
  }

  PrivatePayload body;
  body.recipient = recipient;
  envelope.serialize(body.envelope);
  std::vector<uint8_t> payload;
  encode_private(body, payload);
  return originate(MessageType::Private, payload, registry_.connected_connection_ids(), message_id_out);
}

SendResult Core::send_channel(const std::string& channel, const std::string& text,
                              int64_t* message_id_out) {
  if (!running_.load()) return SendResult::NotRunning;
  if (!keys_.is_joined(channel)) return SendResult::ChannelNotJoined;

  EncryptedMessage envelope;
  const Bytes content(text.begin(), text.end());
  const CryptoResult cr = crypto_.encrypt_channel_message(channel, content, envelope);
  if (cr == CryptoResult::ChannelNotJoined) return SendResult::ChannelNotJoined;
  if (cr != CryptoResult::Ok) {
    HOPMESH_LOG_ERROR("core", "encrypt for #" << channel << ": " << to_string(cr));
    return SendResult::CryptoError;
  }

  ChannelPayload body;
  body.channel = channel;
  envelope.serialize(body.envelope);
  std::vector<uint8_t> payload;
  if (!encode_channel(body, payload)) return SendResult::EncodeError;
  return originate(MessageType::Channel, payload, registry_.connected_connection_ids(), message_id_out);
}

SendResult Core::announce() {
  if (!running_.load()) return SendResult::NotRunning;
  std::vector<uint8_t> payload;
  if (!build_announcement(payload)) return SendResult::CryptoError;
  return originate(MessageType::PeerAnnouncement, payload, registry_.connected_connection_ids(), nullptr);
}

// -----------------------------------------------------------------------------
// originate
// POLICY: our own (sender, id) goes into the cache before the first send, so
// an echo coming back around a loop is a duplicate. No connected links is not
// an error; the message simply reaches nobody.
// -----------------------------------------------------------------------------
SendResult Core::originate(MessageType type, const std::vector<uint8_t>& payload,
                           const std::vector<std::string>& targets, int64_t* message_id_out) {
  if (payload.size() > MessageHeader::MAX_PAYLOAD) return SendResult::PayloadTooLarge;

  const int64_t id = generate_message_id();
  const MessageHeader hdr(type, cfg_.default_ttl, 0, id, self_, static_cast<uint16_t>(payload.size()));

  std::vector<uint8_t> frame;
  if (!encode_frame(hdr, payload, frame)) return SendResult::EncodeError;

  cache_.insert(self_, id);
  const size_t handed = transmit(frame, targets);
  ++counters_.sent;

  HOPMESH_LOG_DEBUG("core", "sent " << hdr.describe() << " to " << handed << "/" << targets.size() << " links");
  if (message_id_out) *message_id_out = id;
  return SendResult::Ok;
}

size_t Core::transmit(const std::vector<uint8_t>& frame, const std::vector<std::string>& targets) {
  size_t handed = 0;
  for (const std::string& link : targets) {
    const transport::TxResult r = transport_.send_bytes(link, frame);
    if (r == transport::TxResult::Ok) {
      ++handed;
      continue;
    }
    ++counters_.send_failures;
    HOPMESH_LOG_WARN("core", "send to " << link << " failed: " << transport::to_string(r));
    emit(MeshEvent::Kind::SendFailed, std::string("send failed: ") + transport::to_string(r),
         registry_.sender_for_connection(link), link);
  }
  return handed;
}

bool Core::build_announcement(std::vector<uint8_t>& payload) const {
  AnnouncementPayload a;
  a.nickname         = cfg_.nickname;
  a.agreement_public = keys_.identity_agreement_public();
  a.signing_public   = keys_.identity_signing_public();
  return encode_announcement(a, payload);
}

void Core::send_announcement_to(const std::string& connection_id) {
  std::vector<uint8_t> payload;
  if (!build_announcement(payload)) {
    HOPMESH_LOG_ERROR("core", "no identity keys to announce");
    return;
  }
  const SendResult r = originate(MessageType::PeerAnnouncement, payload, {connection_id}, nullptr);
  if (r != SendResult::Ok) {
    HOPMESH_LOG_WARN("core", "announce to " << connection_id << ": " << to_string(r));
  }
}

// ---------- peers ----------

ConnectResult Core::connect(const CompactId& peer) {
  if (!running_.load()) return ConnectResult::InvalidState;

  std::string link;
  const ConnectResult r = registry_.begin_connect(peer, link);
  return request_link(r, link, peer);
}

ConnectResult Core::connect_link(const std::string& connection_id) {
  if (!running_.load()) return ConnectResult::InvalidState;

  std::string link;
  const ConnectResult r = registry_.begin_connect_link(connection_id, link);
  return request_link(r, link, registry_.sender_for_connection(connection_id));
}

ConnectResult Core::request_link(ConnectResult r, const std::string& link, std::optional<CompactId> peer) {
  if (r == ConnectResult::CapacityExceeded) {
    emit(MeshEvent::Kind::CapacityExceeded, "connection limit reached", peer);
  }
  if (r != ConnectResult::Ok) return r;

  const transport::TxResult tx = transport_.request_connect(link);
  if (tx != transport::TxResult::Ok) {
    HOPMESH_LOG_WARN("core", "connect " << link << ": transport " << transport::to_string(tx));
    registry_.mark_disconnected(link);
    return ConnectResult::TransportError;
  }
  return ConnectResult::Ok;
}

bool Core::disconnect(const CompactId& peer) {
  const std::optional<Peer> p = registry_.find_by_sender(peer);
  if (!p) return false;

  if (p->state == ConnectionState::Connected) {
    registry_.mark_disconnecting(p->connection_id);
  } else if (p->state == ConnectionState::Connecting) {
    registry_.mark_disconnected(p->connection_id);
  } else if (p->state != ConnectionState::Disconnecting) {
    return false;
  }
  drop_link(p->connection_id);
  return true;
}

bool Core::block(const CompactId& peer) {
  std::string link;
  const bool added = registry_.block(peer, link);
  if (!link.empty()) drop_link(link);
  return added;
}

bool Core::unblock(const CompactId& peer) {
  return registry_.unblock(peer);
}

// POLICY: if the transport will not even take the request, the link is
// treated as gone so the state machine does not wait on it forever.
void Core::drop_link(const std::string& connection_id) {
  const transport::TxResult r = transport_.request_disconnect(connection_id);
  if (r != transport::TxResult::Ok) {
    HOPMESH_LOG_WARN("core", "disconnect " << connection_id << ": transport " << transport::to_string(r));
    registry_.mark_disconnected(connection_id);
  }
}

// ---------- channels ----------

CryptoResult Core::join_channel(const std::string& channel, const std::string& password) {
  if (channel.empty() || channel.size() > MAX_CHANNEL_NAME_LEN) return CryptoResult::MissingKeyMaterial;
  const CryptoResult r = keys_.join_channel(channel, password);
  if (r == CryptoResult::Ok) HOPMESH_LOG_INFO("core", "joined #" << channel);
  return r;
}

bool Core::leave_channel(const std::string& channel) {
  const bool left = keys_.leave_channel(channel);
  if (left) HOPMESH_LOG_INFO("core", "left #" << channel);
  return left;
}

// ---------- maintenance ----------

size_t Core::sweep_cache() {
  const size_t n = cache_.purge_expired();
  if (n) HOPMESH_LOG_DEBUG("core", "cache sweep dropped " << n);
  return n;
}

size_t Core::sweep_stale_peers() {
  const size_t n = registry_.remove_stale_peers(cfg_.stale_peer_timeout_ms);
  const size_t s = keys_.rotate_expired_sessions();
  const size_t k = prune_known_senders();
  if (n || s || k) {
    HOPMESH_LOG_DEBUG("core", "stale sweep: " << n << " peers, " << s << " sessions, "
                              << k << " senders");
  }
  return n;
}

size_t Core::known_sender_count() const {
  std::lock_guard<std::mutex> lock(names_mutex_);
  return known_.size();
}

size_t Core::enforce_connect_timeouts() {
  const std::vector<std::string> expired = registry_.expire_connect_timeouts(cfg_.connection_timeout_ms);
  for (const std::string& link : expired) {
    HOPMESH_LOG_WARN("core", "connect to " << link << " timed out after "
                             << cfg_.connection_timeout_ms << " ms");
    emit(MeshEvent::Kind::ConnectionTimeout, "connect timed out",
         registry_.sender_for_connection(link), link);
    // Withdraw the request; a late link-up would otherwise land unannounced.
    const transport::TxResult r = transport_.request_disconnect(link);
    if (r != transport::TxResult::Ok) {
      HOPMESH_LOG_DEBUG("core", "cancel " << link << ": " << transport::to_string(r));
    }
  }
  return expired.size();
}

// ---------- stats / helpers ----------

MeshStats Core::stats() const {
  MeshStats s;
  s.sent            = counters_.sent.load();
  s.received        = counters_.received.load();
  s.forwarded       = counters_.forwarded.load();
  s.duplicates      = counters_.duplicates.load();
  s.cache_misses    = counters_.cache_misses.load();
  s.ttl_exhausted   = counters_.ttl_exhausted.load();
  s.malformed       = counters_.malformed.load();
  s.crypto_failures = counters_.crypto_failures.load();
  s.blocked_dropped = counters_.blocked_dropped.load();
  s.send_failures   = counters_.send_failures.load();
  return s;
}

std::set<CompactId> Core::connected_senders() const {
  std::set<CompactId> out;
  for (const Peer& p : registry_.connected_peers()) {
    if (p.sender_id) out.insert(*p.sender_id);
  }
  return out;
}

// -----------------------------------------------------------------------------
// remember_sender
// POLICY: at most max_known_senders entries. A new sender past the cap evicts
// the one heard from longest ago, preferring senders without a live link.
// Eviction forgets the sender's keys and session too.
// -----------------------------------------------------------------------------
void Core::remember_sender(const CompactId& sender, const std::string& nickname) {
  const std::set<CompactId> linked = connected_senders();
  std::optional<CompactId> evicted;
  {
    std::lock_guard<std::mutex> lock(names_mutex_);
    auto it = known_.find(sender);
    if (it == known_.end() && known_.size() >= cfg_.max_known_senders) {
      auto victim = known_.end();
      bool victim_linked = true;
      for (auto k = known_.begin(); k != known_.end(); ++k) {
        const bool is_linked = linked.count(k->first) != 0;
        if (victim == known_.end() ||
            (victim_linked && !is_linked) ||
            (victim_linked == is_linked && k->second.last_heard_ms < victim->second.last_heard_ms)) {
          victim        = k;
          victim_linked = is_linked;
        }
      }
      evicted = victim->first;
      known_.erase(victim);
    }
    KnownSender& entry = known_[sender];
    if (!nickname.empty()) entry.nickname = nickname;
    entry.last_heard_ms = clock_.now_ms();
  }
  if (evicted) {
    keys_.forget_peer(evicted->str());
    HOPMESH_LOG_DEBUG("core", "forgot sender " << evicted->to_string().c_str() << " (directory full)");
  }
}

void Core::touch_sender(const CompactId& sender) {
  std::lock_guard<std::mutex> lock(names_mutex_);
  auto it = known_.find(sender);
  if (it != known_.end()) it->second.last_heard_ms = clock_.now_ms();
}

// Senders silent for known_sender_timeout_ms are forgotten unless linked.
size_t Core::prune_known_senders() {
  const std::set<CompactId> linked = connected_senders();
  const uint64_t now = clock_.now_ms();
  std::vector<CompactId> gone;
  {
    std::lock_guard<std::mutex> lock(names_mutex_);
    for (auto it = known_.begin(); it != known_.end();) {
      const uint64_t heard = it->second.last_heard_ms;
      if (!linked.count(it->first) && now > heard && now - heard > cfg_.known_sender_timeout_ms) {
        gone.push_back(it->first);
        it = known_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (const CompactId& id : gone) keys_.forget_peer(id.str());
  return gone.size();
}

std::string Core::nickname_of(const CompactId& sender) const {
  std::lock_guard<std::mutex> lock(names_mutex_);
  auto it = known_.find(sender);
  return it == known_.end() ? std::string() : it->second.nickname;
}

void Core::emit(MeshEvent::Kind kind, const std::string& text,
                std::optional<CompactId> peer, const std::string& connection_id) {
  MeshEvent ev;
  ev.kind          = kind;
  ev.text          = text;
  ev.peer          = peer;
  ev.connection_id = connection_id;
  mesh_events_.push(ev);
}

void Core::report_crypto_failure(const MessageHeader& hdr, CryptoResult r) {
  ++counters_.crypto_failures;
  HOPMESH_LOG_WARN("core", "dropped " << to_string(hdr.message_type()) << " from "
                           << hdr.sender_id.to_string().c_str() << ": " << to_string(r));
  emit(MeshEvent::Kind::MessageDropped,
       std::string(to_string(hdr.message_type())) + " dropped: " + to_string(r), hdr.sender_id);
}

// ---------- transport callbacks ----------

void Core::on_peer_discovered(const PeerDescriptor& desc) {
  registry_.add_or_update_discovered(desc);
}

// POLICY: a link the registry will not admit (blocked, over the cap) is torn
// down immediately; the remote sees a plain disconnect.
void Core::on_peer_connected(const std::string& connection_id) {
  const ConnectResult r = registry_.admit_connection(connection_id);
  if (r != ConnectResult::Ok) {
    HOPMESH_LOG_WARN("core", "link " << connection_id << " rejected: " << to_string(r));
    if (r == ConnectResult::CapacityExceeded) {
      emit(MeshEvent::Kind::CapacityExceeded, "connection limit reached",
           registry_.sender_for_connection(connection_id), connection_id);
    }
    if (r != ConnectResult::InvalidState) drop_link(connection_id);
    return;
  }
  if (running_.load() && cfg_.announce_on_connect) send_announcement_to(connection_id);
}

void Core::on_peer_disconnected(const std::string& connection_id) {
  registry_.mark_disconnected(connection_id);
}

void Core::on_send_failed(const std::string& connection_id, const std::string& reason) {
  ++counters_.send_failures;
  HOPMESH_LOG_WARN("core", "transport lost a frame to " << connection_id << ": " << reason);
  emit(MeshEvent::Kind::SendFailed, reason, registry_.sender_for_connection(connection_id), connection_id);
}

// -----------------------------------------------------------------------------
// on_bytes_received
// PRE: called once per frame, possibly concurrently for different links.
// POLICY (in order; the first rule that fires ends processing):
//   1. undecodable                  -> malformed, drop
//   2. our own sender id            -> duplicate, drop
//   3. blocked origin or link owner -> blocked, drop
//   4. already in the cache         -> duplicate, drop
//   5. handle by type; a body that fails to parse is dropped unforwarded
//   6. ttl > 1 -> relay to every connected link except the arrival one
//   7. surface, if the type handler said so
// -----------------------------------------------------------------------------
void Core::on_bytes_received(const std::string& connection_id, const std::vector<uint8_t>& bytes) {
  registry_.touch(connection_id);
  if (!running_.load()) {
    HOPMESH_LOG_DEBUG("core", "not running; ignored " << bytes.size() << " bytes from " << connection_id);
    return;
  }

  MessageHeader hdr;
  std::vector<uint8_t> payload;
  const DecodeResult dr = decode_frame(bytes.data(), bytes.size(), hdr, payload);
  if (dr != DecodeResult::Ok) {
    ++counters_.malformed;
    HOPMESH_LOG_WARN("core", "malformed frame from " << connection_id << ": " << to_string(dr));
    return;
  }

  if (hdr.sender_id == self_) {
    ++counters_.duplicates;
    return;
  }

  const std::optional<CompactId> link_owner = registry_.sender_for_connection(connection_id);
  if (blocklist_.is_blocked(hdr.sender_id) || (link_owner && blocklist_.is_blocked(*link_owner))) {
    ++counters_.blocked_dropped;
    HOPMESH_LOG_DEBUG("core", "blocked: " << hdr.describe() << " via " << connection_id);
    if (hdr.hop_count == 0 && registry_.mark_disconnecting(connection_id)) drop_link(connection_id);
    return;
  }

  if (!cache_.insert(hdr.sender_id, hdr.message_id)) {
    ++counters_.duplicates;
    return;
  }
  ++counters_.cache_misses;
  registry_.note_message_from(hdr.sender_id, hdr.hop_count);
  touch_sender(hdr.sender_id);

  InboundMessage msg;
  msg.type            = hdr.message_type();
  msg.raw_type        = hdr.type;
  msg.sender_id       = hdr.sender_id;
  msg.message_id      = hdr.message_id;
  msg.ttl             = hdr.ttl;
  msg.hop_count       = hdr.hop_count;
  msg.via_connection  = connection_id;

  bool surface = false;
  bool forward = true;

  if (!hdr.is_known_type()) {
    HOPMESH_LOG_DEBUG("core", "relaying unknown type 0x" << std::hex << int(hdr.type) << std::dec);
  } else {
    switch (hdr.message_type()) {
      case MessageType::PeerAnnouncement:
        forward = handle_announcement(connection_id, hdr, payload);
        break;
      case MessageType::Private:
        if (!handle_private(hdr, payload, msg, surface, forward)) return;
        break;
      case MessageType::Channel:
        forward = handle_channel(hdr, payload, msg, surface);
        break;
      default:
        msg.content = payload;
        surface     = true;
        break;
    }
  }
  if (!forward && !surface) return;

  if (forward) {
    if (hdr.can_forward()) {
      const MessageHeader relay = hdr.forwarded_copy();
      std::vector<uint8_t> frame;
      if (encode_frame(relay, payload, frame)) {
        const size_t handed = transmit(frame, registry_.connected_connection_ids(connection_id));
        counters_.forwarded += handed;
        msg.forwarded = handed > 0;
        HOPMESH_LOG_DEBUG("core", "relayed " << relay.describe() << " to " << handed << " links");
      }
    } else {
      ++counters_.ttl_exhausted;
    }
  }

  if (surface) {
    msg.sender_nickname = nickname_of(hdr.sender_id);
    messages_.push(msg);
    ++counters_.received;
  }
}

// An announcement at hop 0 was sent by the device at the other end of the link.
bool Core::handle_announcement(const std::string& connection_id, const MessageHeader& hdr,
                               const std::vector<uint8_t>& payload) {
  AnnouncementPayload a;
  if (!decode_announcement(payload, a)) {
    ++counters_.malformed;
    HOPMESH_LOG_WARN("core", "bad announcement from " << hdr.sender_id.to_string().c_str());
    return false;
  }

  PeerPublicKeys pk;
  pk.agreement = a.agreement_public;
  pk.signing   = a.signing_public;
  if (!keys_.store_peer_public_key(hdr.sender_id.str(), pk)) {
    // Different keys than the ones pinned for this sender: not relayed, no binding.
    ++counters_.crypto_failures;
    HOPMESH_LOG_WARN("core", "dropped announcement from " << hdr.sender_id.to_string().c_str()
                             << ": keys differ from the pinned ones");
    emit(MeshEvent::Kind::MessageDropped, "PEER_ANNOUNCEMENT dropped: keys differ from the pinned ones",
         hdr.sender_id, connection_id);
    return false;
  }

  remember_sender(hdr.sender_id, a.nickname);
  registry_.set_nickname(hdr.sender_id, a.nickname);
  if (hdr.hop_count == 0) registry_.bind_sender_id(connection_id, hdr.sender_id, a.nickname);
  return true;
}

// @return false when the frame is finished with (dropped or delivered here).
bool Core::handle_private(const MessageHeader& hdr, const std::vector<uint8_t>& payload,
                          InboundMessage& msg, bool& surface, bool& forward) {
  PrivatePayload body;
  if (!decode_private(payload, body)) {
    ++counters_.malformed;
    HOPMESH_LOG_WARN("core", "bad private body from " << hdr.sender_id.to_string().c_str());
    return false;
  }
  if (body.recipient != self_) return true;   // not ours: relay only

  forward = false;

  EncryptedMessage envelope;
  CryptoResult r = EncryptedMessage::deserialize(body.envelope.data(), body.envelope.size(), envelope);
  if (r == CryptoResult::Ok) {
    std::optional<Bytes> pinned;
    const std::optional<PeerPublicKeys> known = keys_.get_peer_public_key(hdr.sender_id.str());
    if (known) pinned = known->signing;
    r = crypto_.decrypt_private_message(hdr.sender_id.str(), pinned, envelope, msg.content);
  }
  if (r != CryptoResult::Ok) {
    report_crypto_failure(hdr, r);
    return false;
  }

  msg.encrypted = true;
  surface       = true;
  return true;
}

// @return false when the body is unreadable (not relayed). Members and
// non-members alike relay a readable frame.
bool Core::handle_channel(const MessageHeader& hdr, const std::vector<uint8_t>& payload,
                          InboundMessage& msg, bool& surface) {
  ChannelPayload body;
  if (!decode_channel(payload, body)) {
    ++counters_.malformed;
    HOPMESH_LOG_WARN("core", "bad channel body from " << hdr.sender_id.to_string().c_str());
    return false;
  }
  if (!keys_.is_joined(body.channel)) return true;

  EncryptedMessage envelope;
  CryptoResult r = EncryptedMessage::deserialize(body.envelope.data(), body.envelope.size(), envelope);
  if (r == CryptoResult::Ok) {
    std::optional<Bytes> pinned;
    const std::optional<PeerPublicKeys> known = keys_.get_peer_public_key(hdr.sender_id.str());
    if (known) pinned = known->signing;
    r = crypto_.decrypt_channel_message(body.channel, envelope, pinned, msg.content);
  }
  if (r != CryptoResult::Ok) {
    report_crypto_failure(hdr, r);
    return true;
  }

  msg.channel   = body.channel;
  msg.encrypted = true;
  surface       = true;
  return true;
}

} // namespace hopmesh
