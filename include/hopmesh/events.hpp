/**
 * @file events.hpp
 * @brief Outbound event streams from the core to the application layer.
 *
 * @details
 * The core never calls into the application from a forwarding thread. It
 * pushes into three bounded queues and the host drains them at its own pace:
 *
 * | Stream          | Item            | Drained with             |
 * |-----------------|-----------------|--------------------------|
 * | messages        | InboundMessage  | Core::next_message()     |
 * | peer lifecycle  | PeerEvent       | Core::next_peer_event()  |
 * | operational     | MeshEvent       | Core::next_mesh_event()  |
 *
 * Each queue keeps emission order. When a queue is full the OLDEST item is
 * dropped and counted; producers never block.
 */
#ifndef HOPMESH_EVENTS_HPP
#define HOPMESH_EVENTS_HPP

#include <stdint.h>
#include <stddef.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "etl/deque.h"

#include "hopmesh/device_id.hpp"
#include "hopmesh/message_header.hpp"
#include "hopmesh/peer.hpp"

namespace hopmesh {

/**
 * @class EventQueue
 * @brief Fixed-capacity, mutex-protected FIFO. Drop-oldest on overflow.
 */
template <typename T, size_t CAP>
class EventQueue {
public:
  void push(const T& item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.full()) {
      items_.pop_front();
      ++dropped_;
    }
    items_.push_back(item);
  }

  bool pop(T& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) return false;
    out = items_.front();
    items_.pop_front();
    return true;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
  }

  static constexpr size_t capacity() { return CAP; }

private:
  mutable std::mutex  mutex_;
  etl::deque<T, CAP>  items_;
  size_t              dropped_{0};
};

/// One decoded, deduplicated, decrypted message surfaced to the application.
struct InboundMessage {
  MessageType          type{MessageType::Public};
  uint8_t              raw_type{0};      ///< header byte (differs from `type` only for unknown types)
  CompactId            sender_id;
  std::string          sender_nickname;  ///< empty until the sender announced itself
  int64_t              message_id{0};
  uint8_t              ttl{0};           ///< as received
  uint8_t              hop_count{0};     ///< as received
  std::string          channel;          ///< CHANNEL only
  std::vector<uint8_t> content;
  bool                 encrypted{false}; ///< content was decrypted here
  bool                 forwarded{false}; ///< this node also relayed the frame
  std::string          via_connection;   ///< link it arrived on

  std::string text() const { return std::string(content.begin(), content.end()); }
};

struct PeerEvent {
  enum class Kind : uint8_t {
    Discovered, Connecting, Connected, Disconnected, Blocked, Unblocked, Removed, Identified,
  };
  Kind kind{Kind::Discovered};
  Peer peer;
};

struct MeshEvent {
  enum class Kind : uint8_t {
    MeshStarted, MeshStopped, Error, ConnectionTimeout, CapacityExceeded, SendFailed, MessageDropped,
  };
  Kind                     kind{Kind::Error};
  std::string              text;
  std::optional<CompactId> peer;
  std::string              connection_id;
};

const char* to_string(PeerEvent::Kind k);
const char* to_string(MeshEvent::Kind k);

static constexpr size_t MESSAGE_QUEUE_CAP    = 256;
static constexpr size_t PEER_EVENT_QUEUE_CAP = 128;
static constexpr size_t MESH_EVENT_QUEUE_CAP = 128;

using MessageQueue   = EventQueue<InboundMessage, MESSAGE_QUEUE_CAP>;
using PeerEventQueue = EventQueue<PeerEvent, PEER_EVENT_QUEUE_CAP>;
using MeshEventQueue = EventQueue<MeshEvent, MESH_EVENT_QUEUE_CAP>;

} // namespace hopmesh

#endif // HOPMESH_EVENTS_HPP
