// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace peerlink {
namespace network {

class PeerConnection;
using PeerConnectionPtr = std::shared_ptr<PeerConnection>;

/**
 * MessageDispatcher - post-handshake message routing via handler registry
 *
 * Design:
 * - Components register handlers for their message types
 * - Thread-safe registration and dispatch
 * - Exception boundary: a throwing handler is logged and reported as
 *   unhandled, never propagated into the receive loop
 *
 * Ownership:
 * - Handlers receive the message by const reference, valid only during
 *   the call. Copy it if it is needed later.
 *
 * Usage:
 *   MessageDispatcher dispatcher;
 *   dispatcher.RegisterHandler(message::MessageType::TextMessage,
 *     [this](PeerConnectionPtr p, const message::PeerMessage& m) {
 *       return handle_chat(p, m);
 *     });
 *   dispatcher.Dispatch(peer, msg);
 */
class MessageDispatcher {
public:
  // Handler signature: takes peer + message, returns success
  using MessageHandler =
      std::function<bool(PeerConnectionPtr, const message::PeerMessage &)>;

  MessageDispatcher() = default;
  ~MessageDispatcher() = default;

  MessageDispatcher(const MessageDispatcher &) = delete;
  MessageDispatcher &operator=(const MessageDispatcher &) = delete;

  // Empty handlers are rejected
  void RegisterHandler(message::MessageType type, MessageHandler handler);

  // Register the same handler for several types
  void RegisterHandler(const std::vector<message::MessageType> &types, const MessageHandler &handler);

  void UnregisterHandler(message::MessageType type);

  /**
   * Dispatch message to its registered handler
   *
   * @return false if no handler is registered, the handler returned false,
   *         or it threw
   */
  bool Dispatch(PeerConnectionPtr peer, const message::PeerMessage &msg);

  bool HasHandler(message::MessageType type) const;

  // Registered types in enum order (diagnostics)
  std::vector<message::MessageType> GetRegisteredTypes() const;

private:
  mutable std::mutex mutex_;
  std::map<message::MessageType, MessageHandler> handlers_;
};

} // namespace network
} // namespace peerlink
