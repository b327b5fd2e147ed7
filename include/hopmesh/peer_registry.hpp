/**
 * @file peer_registry.hpp
 * @brief Every known peer, its link, its state, and whether it is blocked.
 *
 * @details
 * PURPOSE
 * -------
 * The forwarding engine needs two answers fast: "which links are live right
 * now" (to flood) and "who is behind this link" (to bind a durable sender id
 * to a transport connection id). The registry answers both and owns the
 * connection state machine described in peer.hpp.
 *
 * LAYOUT
 * ------
 * One arena of records addressed by stable handles, plus two indexes:
 * ```
 *   by_connection_ : connection id ──► handle
 *   by_sender_     : sender id     ──► handle
 *   records_       : handle        ──► Peer
 * ```
 * A peer seen first only by its link gets a record with no sender id. When
 * the handshake reveals the sender id, bind_sender_id() updates the sender
 * index in the same critical section and, if a record already existed for
 * that sender (e.g. it was discovered under another link earlier), merges
 * the two instead of keeping a duplicate.
 *
 * CONCURRENCY
 * -----------
 * One mutex guards the arena and both indexes. Every transition is a
 * compare-and-transition under that mutex: the current state is checked
 * against the legal edges and the new state written before the lock is
 * released, so two racing callers can never both "win" a connect.
 *
 * EVENTS
 * ------
 * Lifecycle changes are queued as PeerEvent (see events.hpp) in emission order.
 *
 * CAPACITY
 * --------
 * At most `max_connections` peers are `connected` at once. begin_connect()
 * counts connecting + connected against the cap; admit_connection() counts
 * connected. Both fail fast with CapacityExceeded.
 */
#ifndef HOPMESH_PEER_REGISTRY_HPP
#define HOPMESH_PEER_REGISTRY_HPP

#include <stdint.h>
#include <stddef.h>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "hopmesh/blocklist.hpp"
#include "hopmesh/clock.hpp"
#include "hopmesh/device_id.hpp"
#include "hopmesh/events.hpp"
#include "hopmesh/peer.hpp"

namespace hopmesh {

class PeerRegistry {
public:
  using Handle = uint32_t;

  static constexpr size_t DEFAULT_MAX_CONNECTIONS = 7;

  PeerRegistry(const Clock& clock, Blocklist& blocklist,
               size_t max_connections = DEFAULT_MAX_CONNECTIONS);

  /// @name Discovery
  ///@{

  /**
   * @brief Insert an unseen peer or refresh a known one.
   *
   * Lookup is by sender id when the descriptor carries one, otherwise by
   * connection id. A known peer gets rssi/last_seen refreshed and keeps its
   * identity and state. A new peer starts in `discovered`.
   *
   * @return true if a new record was created.
   */
  bool add_or_update_discovered(const PeerDescriptor& desc);

  /// Refresh last_seen (and rssi when given) for the peer behind `connection_id`.
  bool touch(const std::string& connection_id, std::optional<int> rssi = std::nullopt);

  /// Record the hop distance at which a message from `sender` was last seen.
  void note_message_from(const CompactId& sender, uint8_t hop_count);

  /// Update the display name of a known sender.
  void set_nickname(const CompactId& sender, const std::string& nickname);
  ///@}

  /// @name Transitions
  ///@{

  /**
   * @brief Outbound connect: `discovered|disconnected -> connecting`.
   * @param sender         Durable id of the peer.
   * @param connection_out Receives the link id to hand to the transport.
   */
  ConnectResult begin_connect(const CompactId& sender, std::string& connection_out);

  /// Outbound connect to a link seen in discovery. NoSenderId until the handshake names it.
  ConnectResult begin_connect_link(const std::string& connection_id, std::string& connection_out);

  /**
   * @brief The transport reports a live link: `-> connected`.
   *
   * Accepts links we initiated (connecting) and links the remote initiated
   * (discovered, disconnected or unknown; those pass through connecting).
   * Rejected links end up `disconnected` and the caller must drop them.
   */
  ConnectResult admit_connection(const std::string& connection_id);

  /// `connected -> disconnecting`.
  bool mark_disconnecting(const std::string& connection_id);

  /// `connecting|connected|disconnecting -> disconnected`.
  bool mark_disconnected(const std::string& connection_id);

  /**
   * @brief Handshake result: the peer on `connection_id` is `sender`.
   *
   * Merges any record previously known only by `sender`.
   * @return false if no record exists for the link.
   */
  bool bind_sender_id(const std::string& connection_id, const CompactId& sender,
                      const std::string& nickname);
  ///@}

  /// @name Blocklist
  ///@{

  /**
   * @brief Block `sender`. A connected peer moves to `disconnecting`, a
   * connecting one straight to `disconnected`.
   * @param drop_connection_out Link the caller must tear down (empty if none).
   * @return true if the id was not blocked before.
   */
  bool block(const CompactId& sender, std::string& drop_connection_out);
  bool unblock(const CompactId& sender);
  bool is_blocked(const CompactId& sender) const;
  ///@}

  /// @name Maintenance
  ///@{

  /// Evict peers not `connected` whose last sighting is older than `timeout_ms`.
  size_t remove_stale_peers(uint64_t timeout_ms);

  /// Force `connecting` peers older than `timeout_ms` to `disconnected`. @return their links.
  std::vector<std::string> expire_connect_timeouts(uint64_t timeout_ms);

  /// Move every live link to `disconnected`. @return the links that were live.
  std::vector<std::string> disconnect_all();
  ///@}

  /// @name Queries
  ///@{
  std::optional<Peer>      find_by_sender(const CompactId& sender) const;
  std::optional<Peer>      find_by_connection(const std::string& connection_id) const;
  std::optional<CompactId> sender_for_connection(const std::string& connection_id) const;
  std::vector<Peer>        peers() const;
  std::vector<Peer>        connected_peers() const;

  /// Links currently `connected`, minus `exclude` (the arrival link when flooding).
  std::vector<std::string> connected_connection_ids(const std::string& exclude = std::string()) const;

  size_t size() const;
  size_t connected_count() const;
  size_t max_connections() const { return max_connections_; }
  ///@}

  /// Pop the oldest lifecycle event. @return false when none.
  bool next_event(PeerEvent& out) { return events_.pop(out); }
  size_t dropped_events() const { return events_.dropped(); }

private:
  // All helpers below expect mutex_ held.
  Peer*  find_conn_locked(const std::string& connection_id);
  Peer*  find_sender_locked(const CompactId& sender);
  Peer   snapshot_locked(const Peer& rec) const;
  ConnectResult begin_connect_locked(Peer& rec, std::string& connection_out);
  void   set_state_locked(Peer& rec, ConnectionState to, uint64_t now);
  void   emit_locked(PeerEvent::Kind kind, const Peer& rec);
  size_t count_state_locked(ConnectionState s) const;
  void   erase_locked(Handle h);

  const Clock&  clock_;
  Blocklist&    blocklist_;
  const size_t  max_connections_;

  mutable std::mutex                           mutex_;
  std::unordered_map<Handle, Peer>             records_;
  std::unordered_map<std::string, Handle>      by_connection_;
  std::unordered_map<CompactId, Handle>        by_sender_;
  Handle                                       next_handle_{1};
  PeerEventQueue                               events_;
};

} // namespace hopmesh

#endif // HOPMESH_PEER_REGISTRY_HPP
