/**
 * @file transport_base.hpp
 * @brief Radio-agnostic link interface between HopMesh Core and the platform layer.
 *
 * Downward (core -> platform): ITransport. Every call is a non-blocking
 * handoff; delivery failures that show up later come back through
 * ITransportListener::on_send_failed().
 *
 * Upward (platform -> core): ITransportListener, implemented by Core. The
 * platform may call it from any thread, one thread per link if it likes.
 *
 * A link is named by its connection id, an opaque string chosen by the
 * platform (a BLE address, a socket name, a loopback node name).
 */
#ifndef HOPMESH_TRANSPORT_BASE_HPP
#define HOPMESH_TRANSPORT_BASE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "hopmesh/peer.hpp"

namespace hopmesh::transport {

// Return codes kept simple; the core only needs "handed off" or not.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };

const char* to_string(TxResult r);

class ITransport {
public:
  virtual ~ITransport() = default;
  virtual TxResult    send_bytes(const std::string& connection_id, const std::vector<uint8_t>& bytes) = 0;
  virtual TxResult    request_connect(const std::string& connection_id) = 0;
  virtual TxResult    request_disconnect(const std::string& connection_id) = 0;
  virtual const char* name() const = 0;
};

class ITransportListener {
public:
  virtual ~ITransportListener() = default;
  virtual void on_bytes_received(const std::string& connection_id, const std::vector<uint8_t>& bytes) = 0;
  virtual void on_peer_discovered(const PeerDescriptor& desc) = 0;
  virtual void on_peer_connected(const std::string& connection_id) = 0;
  virtual void on_peer_disconnected(const std::string& connection_id) = 0;
  virtual void on_send_failed(const std::string& connection_id, const std::string& reason) = 0;
};

} // namespace hopmesh::transport

#endif // HOPMESH_TRANSPORT_BASE_HPP
