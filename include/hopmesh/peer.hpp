/**
 * @file peer.hpp
 * @brief Peer record, connection state machine and connect result codes.
 *
 * @details
 * State machine (every edge is a compare-and-transition inside PeerRegistry):
 * ```
 *   discovered ──► connecting ──► connected ──► disconnecting ──► disconnected
 *                      │              │                               │
 *                      └──────────────┴──────────► disconnected ◄─────┘
 *   disconnected ──► connecting   (reconnect)
 * ```
 * Only `discovered` and `disconnected` may start a connection, and only for a
 * peer whose sender id is known and who is not blocked (can_connect()).
 *
 * Identity: two records are the same peer when their sender ids match; before
 * the sender id is known the transport connection id is the only key.
 */
#ifndef HOPMESH_PEER_HPP
#define HOPMESH_PEER_HPP

#include <stdint.h>
#include <optional>
#include <string>

#include "hopmesh/device_id.hpp"

namespace hopmesh {

enum class ConnectionState : uint8_t {
  Discovered    = 0,
  Connecting    = 1,
  Connected     = 2,
  Disconnecting = 3,
  Disconnected  = 4,
};

const char* to_string(ConnectionState s);

/// True when `from -> to` is an edge of the state machine above.
bool is_valid_transition(ConnectionState from, ConnectionState to);

/// Outcome of a connect request or of admitting a link.
enum class ConnectResult : uint8_t {
  Ok               = 0,
  UnknownPeer      = 1,
  Blocked          = 2,
  NoSenderId       = 3,
  InvalidState     = 4,
  CapacityExceeded = 5,
  TransportError   = 6,
};

const char* to_string(ConnectResult r);

/// What the transport reports when it sights a device.
struct PeerDescriptor {
  std::string              connection_id;
  std::optional<CompactId> sender_id;
  std::string              nickname;
  int                      rssi{0};
};

/**
 * @struct Peer
 * @brief Snapshot of one registry record.
 */
struct Peer {
  std::optional<CompactId> sender_id;        ///< durable id, known after handshake/advertisement
  std::string      connection_id;            ///< transport link id, always present
  std::string      nickname;                 ///< display only
  int              rssi{0};
  uint64_t         last_seen_ms{0};
  ConnectionState  state{ConnectionState::Discovered};
  uint64_t         state_since_ms{0};        ///< when `state` was entered
  bool             is_blocked{false};
  uint8_t          hop_count{0};             ///< informational
  uint64_t         last_forward_ms{0};       ///< informational

  /// not blocked AND sender id known AND state is discovered or disconnected
  bool can_connect() const;

  /// "AA:BB:CC:DD:EE:FF" when known, else the connection id.
  std::string display_id() const;
};

} // namespace hopmesh

#endif // HOPMESH_PEER_HPP
