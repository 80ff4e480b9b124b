// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include "network/transport.hpp"
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace peerlink {
namespace network {

// Interfaces the engine consumes from the embedding application. All methods
// are invoked on the engine's io_context thread.

class IdentityProvider {
public:
  virtual ~IdentityProvider() = default;

  virtual message::PeerIdentity local_identity() const = 0;

  // PEM certificate and key for TLS; std::nullopt runs plaintext
  virtual std::optional<TlsCredential> tls_credential() const { return std::nullopt; }
};

// An inbound connection waiting for the user's decision
struct PendingRequest {
  message::PeerIdentity peer;
  std::string endpoint;
  int64_t received_at = 0; // Unix seconds
};

using ConsentCallback = std::function<void(bool accepted)>;

class ConsentProvider {
public:
  virtual ~ConsentProvider() = default;

  // Ask the user; decide() may be called later from any handler on the
  // engine's io_context. Calls after the request expired are ignored.
  virtual void request_consent(const PendingRequest &request, ConsentCallback decide) = 0;

  // The request was withdrawn (cancel from the initiator or timeout)
  virtual void cancel_consent(const std::string &peer_id) = 0;
};

class ChatSink {
public:
  virtual ~ChatSink() = default;

  virtual void on_text_message(const std::string &peer_id,
                               const message::TextMessagePayload &text) = 0;
  virtual void on_media_message(const std::string &peer_id,
                                const message::MediaMessagePayload &media) = 0;
  virtual void on_reaction(const std::string &peer_id,
                           const message::ReactionPayload &reaction) = 0;
  virtual void on_receipt(const std::string &peer_id,
                          const message::MessageReceiptPayload &receipt) = 0;
  virtual void on_typing(const std::string &peer_id, bool is_typing) = 0;
  virtual void on_chat_rejected(const std::string &peer_id, const std::string &reason) = 0;
};

class CallSignalingSink {
public:
  virtual ~CallSignalingSink() = default;

  virtual void on_call_request(const std::string &peer_id) = 0;
  virtual void on_call_accept(const std::string &peer_id) = 0;
  virtual void on_call_reject(const std::string &peer_id, const std::string &reason) = 0;
  virtual void on_call_end(const std::string &peer_id) = 0;
  // sdpOffer, sdpAnswer, iceCandidate
  virtual void on_signaling(const std::string &peer_id, const message::PeerMessage &msg) = 0;
};

class StorageProvider {
public:
  virtual ~StorageProvider() = default;

  virtual uint64_t available_bytes() const = 0;
  virtual std::filesystem::path download_directory() const = 0;
};

// Storage backed by a real directory
class DirectoryStorage : public StorageProvider {
public:
  explicit DirectoryStorage(std::filesystem::path dir) : dir_(std::move(dir)) {}

  uint64_t available_bytes() const override;
  std::filesystem::path download_directory() const override { return dir_; }

private:
  std::filesystem::path dir_;
};

struct FeatureSettings {
  bool file_transfer = true;
  bool voice_call = true;
  bool chat = true;
};

enum class TransferDirection { Sent, Received };

struct TransferRecord {
  std::string file_name;
  int64_t file_size = 0;
  TransferDirection direction = TransferDirection::Received;
  int64_t timestamp = 0; // Unix seconds
  bool success = false;
};

enum class LifecycleEvent { Background, Foreground };

} // namespace network
} // namespace peerlink
