// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/message_dispatcher.hpp"
#include "network/peer_connection.hpp"
#include "util/logging.hpp"

namespace peerlink {
namespace network {

void MessageDispatcher::RegisterHandler(message::MessageType type, MessageHandler handler) {
  if (!handler) {
    LOG_NET_ERROR("Attempted to register empty handler for message type: {}",
                  message::MessageTypeName(type));
    return;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[type] = std::move(handler);
  LOG_NET_TRACE("Registered handler for message type: {}", message::MessageTypeName(type));
}

void MessageDispatcher::RegisterHandler(const std::vector<message::MessageType> &types,
                                        const MessageHandler &handler) {
  for (auto type : types) {
    RegisterHandler(type, handler);
  }
}

void MessageDispatcher::UnregisterHandler(message::MessageType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (handlers_.erase(type) > 0) {
    LOG_NET_TRACE("Unregistered handler for message type: {}", message::MessageTypeName(type));
  }
}

bool MessageDispatcher::Dispatch(PeerConnectionPtr peer, const message::PeerMessage &msg) {
  if (!peer) {
    LOG_NET_WARN("MessageDispatcher::Dispatch called with null peer");
    return false;
  }

  MessageHandler handler;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(msg.type());
    if (it == handlers_.end()) {
      LOG_NET_DEBUG("No handler for {} from peer {}", message::MessageTypeName(msg.type()),
                    peer->id());
      return false;
    }
    handler = it->second;
  }

  // Execute handler (outside lock)
  try {
    return handler(peer, msg);
  } catch (const std::exception &e) {
    LOG_NET_ERROR("Handler exception for {} from peer {}: {}",
                  message::MessageTypeName(msg.type()), peer->id(), e.what());
    return false;
  }
}

bool MessageDispatcher::HasHandler(message::MessageType type) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return handlers_.count(type) > 0;
}

std::vector<message::MessageType> MessageDispatcher::GetRegisteredTypes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<message::MessageType> result;
  result.reserve(handlers_.size());
  for (const auto &[type, _] : handlers_) {
    result.push_back(type);
  }
  return result;
}

} // namespace network
} // namespace peerlink
