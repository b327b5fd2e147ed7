/**
 * @file core.hpp
 * @brief HopMesh Core: the mesh forwarding engine (decode, dedup, surface, flood).
 *
 * @details
 * ## Field Brief
 * **Core** sits between one radio transport and one application. It does not
 * know BLE, sockets or screens. It knows **frames in**, **frames out**, and
 * which links are live right now.
 *
 * ---
 *
 * @par What This File Provides
 * - `hopmesh::Core`, which:
 *   - Implements `transport::ITransportListener` (bytes, discovery, link up/down).
 *   - Originates PUBLIC, PRIVATE, CHANNEL and PEER_ANNOUNCEMENT frames.
 *   - Deduplicates by (sender id, message id) and floods with a TTL.
 *   - Owns the peer registry, blocklist, dedup cache, keys and the three
 *     maintenance timers.
 *   - Surfaces results on three bounded queues (see events.hpp).
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  [Transport link P]                       [Core]
 *         │  on_bytes_received(P, bytes)     │
 *         └─────────────────────────────────►│ decode header      (malformed: drop)
 *                                            │ self / blocked?    (drop)
 *                                            │ cache.insert()     (seen: drop)
 *                                            │ handle by type     (announce / decrypt)
 *                                            │ ttl > 1 ?  ──► forwarded_copy() to every
 *                                            │               connected link except P
 *                                            └─► next_message()  (exactly once)
 * ```
 * - The cache entry is written before any forward is attempted. A forward that
 *   fails everywhere is not retried: delivery is at-most-once, best effort.
 * - A PRIVATE frame for this node is surfaced and not forwarded. A PRIVATE
 *   frame for someone else is forwarded and not surfaced.
 * - A CHANNEL frame is surfaced when the channel is joined and decrypts, and
 *   forwarded either way.
 * - An announcement with hop_count 0 came straight from the link's owner and
 *   binds that link to the announced sender id.
 * - The first keys announced for a sender are pinned. At most
 *   max_known_senders senders are held; silent ones are forgotten after
 *   known_sender_timeout_ms by the stale sweep, keys and session included.
 *
 * ---
 *
 * @par Threading
 * - Transport callbacks may arrive concurrently, one thread per link. Every
 *   shared structure (cache, registry, keys, queues, counters) is internally
 *   synchronized; Core itself holds no lock across a transport call.
 * - Maintenance runs on the TaskScheduler worker started by start().
 * - stop() must not be called from a transport callback or a timer body.
 *
 * ---
 *
 * @par Failure Model
 * - **Malformed frame:** dropped, counted, logged. The link stays up.
 * - **Crypto failure:** dropped, counted, MeshEvent::MessageDropped. Never
 *   surfaced as plaintext.
 * - **Conflicting announcement:** keys differ from the ones pinned for that
 *   sender. Dropped, not relayed, no link binding, counted as a crypto failure.
 * - **Capacity:** connect() returns CapacityExceeded; an inbound link over the
 *   cap is dropped and reported as MeshEvent::CapacityExceeded.
 * - **Connect timeout:** the peer is forced to disconnected, MeshEvent::ConnectionTimeout.
 * - **Transport handoff failure:** counted, MeshEvent::SendFailed. No retry.
 *
 * ---
 *
 * @par Minimal Usage Example
 * @code
 * hopmesh::SteadyClock clock;
 * hopmesh::MeshConfig  cfg;
 * hopmesh::Core core(self_id, transport, cfg, clock, &store);
 * platform.set_listener(&core);
 * core.start();
 *
 * core.send_public("hello mesh");
 *
 * hopmesh::InboundMessage msg;
 * while (core.next_message(msg)) {
 *   // show msg.text()
 * }
 * @endcode
 */
#ifndef HOPMESH_CORE_HPP
#define HOPMESH_CORE_HPP

#include <stdint.h>
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

#include "hopmesh/blocklist.hpp"
#include "hopmesh/clock.hpp"
#include "hopmesh/device_id.hpp"
#include "hopmesh/encryption_service.hpp"
#include "hopmesh/events.hpp"
#include "hopmesh/key_manager.hpp"
#include "hopmesh/mesh_config.hpp"
#include "hopmesh/message_cache.hpp"
#include "hopmesh/message_header.hpp"
#include "hopmesh/peer_registry.hpp"
#include "hopmesh/periodic_task.hpp"
#include "hopmesh/transport/transport_base.hpp"

namespace hopmesh {

class BlocklistStore;

/// Outcome of originating a message.
enum class SendResult : uint8_t {
  Ok               = 0,
  NotRunning       = 1,
  PayloadTooLarge  = 2,
  UnknownRecipient = 3,   ///< no announced keys for the recipient
  ChannelNotJoined = 4,
  CryptoError      = 5,
  EncodeError      = 6,
};

const char* to_string(SendResult r);

/**
 * @struct MeshStats
 * @brief Snapshot of the forwarding counters.
 */
struct MeshStats {
  uint64_t sent{0};             ///< messages originated here
  uint64_t received{0};         ///< messages surfaced to the application
  uint64_t forwarded{0};        ///< relay frames handed to the transport
  uint64_t duplicates{0};       ///< frames dropped as already seen (cache hits)
  uint64_t cache_misses{0};     ///< first sightings
  uint64_t ttl_exhausted{0};    ///< first sightings not relayed because ttl <= 1
  uint64_t malformed{0};
  uint64_t crypto_failures{0};
  uint64_t blocked_dropped{0};
  uint64_t send_failures{0};
};

/**
 * @class Core
 * @brief Transport-agnostic mesh node.
 *
 * @details
 * One Core per node. It borrows the transport and clock (both must outlive
 * it) and owns everything else. Construction does no I/O; start() arms the
 * maintenance timers and opens the node for traffic.
 *
 * @note
 * Core is large (fixed-capacity cache and queues). Allocate it on the heap.
 */
class Core : public transport::ITransportListener {
public:
  /**
   * @param self            Compact id of this device (goes on every originated frame).
   * @param transport       Link layer; send/connect/disconnect requests go here.
   * @param cfg             Protocol and timing knobs (copied).
   * @param clock           Time source for cache, registry and keys.
   * @param blocklist_store Persistence for the blocklist, or nullptr for memory only.
   */
  Core(const CompactId& self, transport::ITransport& transport, const MeshConfig& cfg,
       const Clock& clock, BlocklistStore* blocklist_store = nullptr);
  ~Core() override;

  Core(const Core&) = delete;
  Core& operator=(const Core&) = delete;

  /// @name Lifecycle
  ///@{

  /**
   * @brief Validate the config, arm the timers, accept traffic.
   * @return false on an invalid config (reported as MeshEvent::Error).
   */
  bool start();

  /// Cancel timers, drop every live link, refuse traffic. Idempotent.
  void stop();

  bool running() const { return running_.load(); }
  ///@}

  /// @name Sending
  ///@{

  /**
   * @brief Flood a plaintext message to every connected link.
   * @param message_id_out Receives the allocated id (may be nullptr).
   */
  SendResult send_public(const std::string& text, int64_t* message_id_out = nullptr);

  /**
   * @brief Encrypt for one recipient and flood it.
   *
   * Requires the recipient's announced keys (UnknownRecipient otherwise).
   */
  SendResult send_private(const CompactId& recipient, const std::string& text,
                          int64_t* message_id_out = nullptr);

  /// Encrypt under a joined channel's key and flood it.
  SendResult send_channel(const std::string& channel, const std::string& text,
                          int64_t* message_id_out = nullptr);

  /// Flood our nickname and public keys.
  SendResult announce();
  ///@}

  /// @name Peers
  ///@{
  ConnectResult connect(const CompactId& peer);

  /// Connect to a discovered link. NoSenderId while the link has not announced itself.
  ConnectResult connect_link(const std::string& connection_id);

  /// @return false if the peer is unknown or has no live link.
  bool disconnect(const CompactId& peer);

  /// Block and, if the peer is linked, drop the link. @return true if newly blocked.
  bool block(const CompactId& peer);
  bool unblock(const CompactId& peer);

  std::vector<Peer>   peers() const { return registry_.peers(); }
  std::vector<Peer>   connected_peers() const { return registry_.connected_peers(); }
  std::optional<Peer> find_peer(const CompactId& peer) const { return registry_.find_by_sender(peer); }
  ///@}

  /// @name Channels
  ///@{
  CryptoResult join_channel(const std::string& channel, const std::string& password);
  bool         leave_channel(const std::string& channel);
  std::vector<std::string> joined_channels() const { return keys_.joined_channels(); }
  ///@}

  /// @name Maintenance (also driven by the timers)
  ///@{

  /// Drop expired dedup entries. @return entries removed.
  size_t sweep_cache();

  /// Evict peers not connected and unseen for stale_peer_timeout_ms. @return peers removed.
  size_t sweep_stale_peers();

  /// Force connects older than connection_timeout_ms to disconnected. @return links timed out.
  size_t enforce_connect_timeouts();
  ///@}

  /// @name Outbound streams
  ///@{
  bool next_message(InboundMessage& out) { return messages_.pop(out); }
  bool next_peer_event(PeerEvent& out) { return registry_.next_event(out); }
  bool next_mesh_event(MeshEvent& out) { return mesh_events_.pop(out); }
  ///@}

  /// @name Introspection
  ///@{
  MeshStats          stats() const;
  const CompactId&   self_id() const { return self_; }
  const MeshConfig&  config() const { return cfg_; }
  KeyManager&        keys() { return keys_; }
  size_t             known_sender_count() const;
  PeerRegistry&      registry() { return registry_; }
  MessageCache&      cache() { return cache_; }
  ///@}

  /// @name transport::ITransportListener
  ///@{
  void on_bytes_received(const std::string& connection_id, const std::vector<uint8_t>& bytes) override;
  void on_peer_discovered(const PeerDescriptor& desc) override;
  void on_peer_connected(const std::string& connection_id) override;
  void on_peer_disconnected(const std::string& connection_id) override;
  void on_send_failed(const std::string& connection_id, const std::string& reason) override;
  ///@}

private:
  struct Counters {
    std::atomic<uint64_t> sent{0};
    std::atomic<uint64_t> received{0};
    std::atomic<uint64_t> forwarded{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> cache_misses{0};
    std::atomic<uint64_t> ttl_exhausted{0};
    std::atomic<uint64_t> malformed{0};
    std::atomic<uint64_t> crypto_failures{0};
    std::atomic<uint64_t> blocked_dropped{0};
    std::atomic<uint64_t> send_failures{0};
  };

  /// Frame an originated payload, mark it seen, hand it to `targets`.
  SendResult originate(MessageType type, const std::vector<uint8_t>& payload,
                       const std::vector<std::string>& targets, int64_t* message_id_out);

  /// @return number of links the frame was handed to.
  size_t transmit(const std::vector<uint8_t>& frame, const std::vector<std::string>& targets);

  bool build_announcement(std::vector<uint8_t>& payload) const;
  void send_announcement_to(const std::string& connection_id);

  /// @return false when the frame must not be forwarded (bad body for its type).
  bool handle_announcement(const std::string& connection_id, const MessageHeader& hdr,
                           const std::vector<uint8_t>& payload);
  bool handle_private(const MessageHeader& hdr, const std::vector<uint8_t>& payload,
                      InboundMessage& msg, bool& surface, bool& forward);
  bool handle_channel(const MessageHeader& hdr, const std::vector<uint8_t>& payload,
                      InboundMessage& msg, bool& surface);

  void        remember_sender(const CompactId& sender, const std::string& nickname);
  void        touch_sender(const CompactId& sender);
  size_t      prune_known_senders();
  std::string nickname_of(const CompactId& sender) const;
  std::set<CompactId> connected_senders() const;

  /// Hand a registry-approved connect to the transport.
  ConnectResult request_link(ConnectResult r, const std::string& link, std::optional<CompactId> peer);

  void drop_link(const std::string& connection_id);
  void report_crypto_failure(const MessageHeader& hdr, CryptoResult r);
  void emit(MeshEvent::Kind kind, const std::string& text,
            std::optional<CompactId> peer = std::nullopt,
            const std::string& connection_id = std::string());

  const CompactId          self_;
  transport::ITransport&   transport_;
  const MeshConfig         cfg_;
  const Clock&             clock_;

  Blocklist                blocklist_;
  PeerRegistry             registry_;
  MessageCache             cache_;
  KeyManager               keys_;
  EncryptionService        crypto_;

  MessageQueue             messages_;
  MeshEventQueue           mesh_events_;
  Counters                 counters_;

  struct KnownSender {
    std::string nickname;
    uint64_t    last_heard_ms{0};
  };

  mutable std::mutex                           names_mutex_;
  std::unordered_map<CompactId, KnownSender>   known_;   // announced senders, any hop

  std::atomic<bool>              running_{false};
  std::unique_ptr<TaskScheduler> scheduler_;
};

} // namespace hopmesh

#endif // HOPMESH_CORE_HPP
