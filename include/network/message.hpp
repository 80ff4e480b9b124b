// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/protocol.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {
namespace message {

/**
 * Message vocabulary
 *
 * Closed set; the wire name of each type is its camelCase spelling
 * (MessageTypeName). An envelope with any other "type" string fails with
 * DecodeError::UnknownMessageType.
 */
enum class MessageType {
  // Handshake
  Hello,
  ConnectionRequest,
  ConnectionAccept,
  ConnectionReject,
  ConnectionCancel,
  Disconnect,

  // File transfer
  FileOffer,
  FileAccept,
  FileReject,
  FileChunk,
  FileComplete,
  BatchStart,
  BatchComplete,

  // Voice call signaling
  CallRequest,
  CallAccept,
  CallReject,
  CallEnd,
  SdpOffer,
  SdpAnswer,
  IceCandidate,

  // Chat
  TextMessage,
  MediaMessage,
  MessageReceipt,
  TypingIndicator,
  Reaction,
  ChatReject,

  // Heartbeat
  Ping,
  Pong,
};

// Every MessageType in declaration order (used by tests and diagnostics)
const std::vector<MessageType> &AllMessageTypes();

const char *MessageTypeName(MessageType type);
std::optional<MessageType> MessageTypeFromName(const std::string &name);

/**
 * Decode failures
 *
 * None is success. FrameTooLarge is fatal to the byte stream (framing is
 * lost); every other error affects only the offending frame.
 */
enum class DecodeError {
  None,
  FrameTooLarge,
  MalformedEnvelope,
  UnknownMessageType,
  MissingField,
  InvalidBase64,
  MissingPayload,
  MalformedPayload,
};

const char *DecodeErrorString(DecodeError error);

// ============================================================================
// Typed payloads (JSON inside the base64 "payload" envelope field)
// ============================================================================

// Carried by hello and connectionAccept
struct PeerIdentity {
  std::string id;
  std::string display_name;
  std::optional<std::string> certificate_fingerprint; // lowercase SHA-256 hex

  bool operator==(const PeerIdentity &other) const = default;
};

// connectionReject, fileReject, callReject, chatReject
struct RejectionPayload {
  std::string reason;

  bool operator==(const RejectionPayload &other) const = default;
};

// fileOffer
struct TransferMetadata {
  std::string file_name;
  int64_t file_size = 0;
  std::optional<std::string> mime_type;
  std::string sha256_hash;
  std::optional<int> file_index;  // position within a batch
  std::optional<int> total_files; // batch size
  bool is_directory = false;      // sender zipped a directory

  bool operator==(const TransferMetadata &other) const = default;
};

// batchStart
struct BatchMetadata {
  int total_files = 0;
  std::string batch_id;

  bool operator==(const BatchMetadata &other) const = default;
};

// fileComplete
struct FileCompletePayload {
  std::string hash;

  bool operator==(const FileCompletePayload &other) const = default;
};

// batchComplete
struct BatchCompletePayload {
  std::string batch_id;

  bool operator==(const BatchCompletePayload &other) const = default;
};

// sdpOffer / sdpAnswer
struct SdpPayload {
  std::string type; // "offer" or "answer"
  std::string sdp;

  bool operator==(const SdpPayload &other) const = default;
};

// iceCandidate
struct IceCandidatePayload {
  std::optional<std::string> sdp_mid;
  int32_t sdp_mline_index = 0;
  std::string candidate;

  bool operator==(const IceCandidatePayload &other) const = default;
};

// textMessage
struct TextMessagePayload {
  std::string text;
  double timestamp = 0; // Unix seconds
  std::optional<std::string> reply_to_message_id;
  std::optional<std::string> reply_to_text;
  std::optional<std::string> reply_to_sender_name;
  std::optional<std::string> group_id;
  std::optional<std::string> sender_name;

  bool operator==(const TextMessagePayload &other) const = default;
};

// mediaMessage (announces a media item; bytes travel as a file transfer)
struct MediaMessagePayload {
  std::string id;
  std::string media_type; // image, video, file, voice
  std::string file_name;
  int64_t file_size = 0;
  std::string mime_type;
  std::optional<double> duration;
  std::optional<std::vector<uint8_t>> thumbnail_data;
  double timestamp = 0;

  bool operator==(const MediaMessagePayload &other) const = default;
};

// messageReceipt
struct MessageReceiptPayload {
  std::vector<std::string> message_ids;
  std::string receipt_type; // delivered, read
  double timestamp = 0;
  std::optional<std::string> group_id;
  std::optional<std::string> sender_id;

  bool operator==(const MessageReceiptPayload &other) const = default;
};

// typingIndicator
struct TypingIndicatorPayload {
  bool is_typing = false;

  bool operator==(const TypingIndicatorPayload &other) const = default;
};

// reaction
struct ReactionPayload {
  std::string message_id;
  std::string emoji;
  std::string action; // add, remove
  double timestamp = 0;

  bool operator==(const ReactionPayload &other) const = default;
};

/**
 * PeerMessage - immutable protocol message
 *
 * Envelope: {"version": N, "type": "<name>", "senderID": "<id>",
 *            "payload": "<base64>"}  (payload omitted when absent)
 *
 * The payload is raw bytes: the JSON of a typed payload, or file data for
 * fileChunk.
 */
class PeerMessage {
public:
  PeerMessage() = default;
  PeerMessage(MessageType type, std::string sender_id,
              std::optional<std::vector<uint8_t>> payload = std::nullopt,
              uint32_t version = protocol::PROTOCOL_VERSION);

  MessageType type() const { return type_; }
  const std::string &sender_id() const { return sender_id_; }
  uint32_t version() const { return version_; }
  bool has_payload() const { return payload_.has_value(); }
  // Empty when there is no payload
  const std::vector<uint8_t> &payload() const;

  bool operator==(const PeerMessage &other) const = default;

private:
  MessageType type_{MessageType::Ping};
  std::string sender_id_;
  uint32_t version_{protocol::PROTOCOL_VERSION};
  std::optional<std::vector<uint8_t>> payload_;
};

// ============================================================================
// Envelope codec (no length prefix; see wire_codec.hpp for framing)
// ============================================================================

std::vector<uint8_t> encode_envelope(const PeerMessage &msg);
DecodeError decode_envelope(const uint8_t *data, size_t size, PeerMessage &out);

// ============================================================================
// Payload decoding
// ============================================================================

DecodeError decode_payload(const PeerMessage &msg, PeerIdentity &out);
DecodeError decode_payload(const PeerMessage &msg, RejectionPayload &out);
DecodeError decode_payload(const PeerMessage &msg, TransferMetadata &out);
DecodeError decode_payload(const PeerMessage &msg, BatchMetadata &out);
DecodeError decode_payload(const PeerMessage &msg, FileCompletePayload &out);
DecodeError decode_payload(const PeerMessage &msg, BatchCompletePayload &out);
DecodeError decode_payload(const PeerMessage &msg, SdpPayload &out);
DecodeError decode_payload(const PeerMessage &msg, IceCandidatePayload &out);
DecodeError decode_payload(const PeerMessage &msg, TextMessagePayload &out);
DecodeError decode_payload(const PeerMessage &msg, MediaMessagePayload &out);
DecodeError decode_payload(const PeerMessage &msg, MessageReceiptPayload &out);
DecodeError decode_payload(const PeerMessage &msg, TypingIndicatorPayload &out);
DecodeError decode_payload(const PeerMessage &msg, ReactionPayload &out);

// ============================================================================
// Factories
// ============================================================================

// Handshake (hello's senderID is the identity id)
PeerMessage make_hello(const PeerIdentity &identity);
PeerMessage make_connection_request(const std::string &sender_id);
PeerMessage make_connection_accept(const PeerIdentity &identity);
PeerMessage make_connection_reject(const std::string &sender_id, const std::string &reason);
PeerMessage make_connection_cancel(const std::string &sender_id);
PeerMessage make_disconnect(const std::string &sender_id);

// File transfer
PeerMessage make_file_offer(const std::string &sender_id, const TransferMetadata &metadata);
PeerMessage make_file_accept(const std::string &sender_id);
PeerMessage make_file_reject(const std::string &sender_id, const std::string &reason);
PeerMessage make_file_chunk(const std::string &sender_id, std::vector<uint8_t> data);
PeerMessage make_file_complete(const std::string &sender_id, const std::string &hash);
PeerMessage make_batch_start(const std::string &sender_id, const BatchMetadata &metadata);
PeerMessage make_batch_complete(const std::string &sender_id, const std::string &batch_id);

// Voice call signaling
PeerMessage make_call_request(const std::string &sender_id);
PeerMessage make_call_accept(const std::string &sender_id);
PeerMessage make_call_reject(const std::string &sender_id, const std::string &reason);
PeerMessage make_call_end(const std::string &sender_id);
PeerMessage make_sdp_offer(const std::string &sender_id, const std::string &sdp);
PeerMessage make_sdp_answer(const std::string &sender_id, const std::string &sdp);
PeerMessage make_ice_candidate(const std::string &sender_id, const IceCandidatePayload &candidate);

// Chat
PeerMessage make_text_message(const std::string &sender_id, const TextMessagePayload &text);
PeerMessage make_media_message(const std::string &sender_id, const MediaMessagePayload &media);
PeerMessage make_message_receipt(const std::string &sender_id, const MessageReceiptPayload &receipt);
PeerMessage make_typing_indicator(const std::string &sender_id, bool is_typing);
PeerMessage make_reaction(const std::string &sender_id, const ReactionPayload &reaction);
PeerMessage make_chat_reject(const std::string &sender_id, const std::string &reason);

// Heartbeat
PeerMessage make_ping(const std::string &sender_id);
PeerMessage make_pong(const std::string &sender_id);

} // namespace message
} // namespace peerlink
