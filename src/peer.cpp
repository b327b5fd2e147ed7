// -----------------------------------------------------------------------------
// peer.cpp: peer state machine edges and names.
// -----------------------------------------------------------------------------
#include "hopmesh/peer.hpp"
#include "hopmesh/events.hpp"

namespace hopmesh {

const char* to_string(ConnectionState s) {
  switch (s) {
    case ConnectionState::Discovered:    return "discovered";
    case ConnectionState::Connecting:    return "connecting";
    case ConnectionState::Connected:     return "connected";
    case ConnectionState::Disconnecting: return "disconnecting";
    case ConnectionState::Disconnected:  return "disconnected";
  }
  return "?";
}

bool is_valid_transition(ConnectionState from, ConnectionState to) {
  using S = ConnectionState;
  switch (from) {
    case S::Discovered:    return to == S::Connecting;
    case S::Connecting:    return to == S::Connected || to == S::Disconnected;
    case S::Connected:     return to == S::Disconnecting || to == S::Disconnected;
    case S::Disconnecting: return to == S::Disconnected;
    case S::Disconnected:  return to == S::Connecting;
  }
  return false;
}

const char* to_string(ConnectResult r) {
  switch (r) {
    case ConnectResult::Ok:               return "ok";
    case ConnectResult::UnknownPeer:      return "unknown peer";
    case ConnectResult::Blocked:          return "peer is blocked";
    case ConnectResult::NoSenderId:       return "sender id not known";
    case ConnectResult::InvalidState:     return "invalid state";
    case ConnectResult::CapacityExceeded: return "connection capacity exceeded";
    case ConnectResult::TransportError:   return "transport error";
  }
  return "?";
}

bool Peer::can_connect() const {
  if (is_blocked || !sender_id) return false;
  return state == ConnectionState::Discovered || state == ConnectionState::Disconnected;
}

std::string Peer::display_id() const {
  return sender_id ? sender_id->str() : connection_id;
}

// -----------------------------------------------------------------------------
// Event names
// -----------------------------------------------------------------------------

const char* to_string(PeerEvent::Kind k) {
  switch (k) {
    case PeerEvent::Kind::Discovered:   return "discovered";
    case PeerEvent::Kind::Connecting:   return "connecting";
    case PeerEvent::Kind::Connected:    return "connected";
    case PeerEvent::Kind::Disconnected: return "disconnected";
    case PeerEvent::Kind::Blocked:      return "blocked";
    case PeerEvent::Kind::Unblocked:    return "unblocked";
    case PeerEvent::Kind::Removed:      return "removed";
    case PeerEvent::Kind::Identified:   return "identified";
  }
  return "?";
}

const char* to_string(MeshEvent::Kind k) {
  switch (k) {
    case MeshEvent::Kind::MeshStarted:       return "mesh started";
    case MeshEvent::Kind::MeshStopped:       return "mesh stopped";
    case MeshEvent::Kind::Error:             return "error";
    case MeshEvent::Kind::ConnectionTimeout: return "connection timeout";
    case MeshEvent::Kind::CapacityExceeded:  return "capacity exceeded";
    case MeshEvent::Kind::SendFailed:        return "send failed";
    case MeshEvent::Kind::MessageDropped:    return "message dropped";
  }
  return "?";
}

} // namespace hopmesh
