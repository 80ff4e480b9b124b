// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/message.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <unordered_map>

namespace peerlink {
namespace message {

using json = nlohmann::json;

namespace {

struct TypeEntry {
  MessageType type;
  const char *name;
};

const TypeEntry kTypeTable[] = {
    {MessageType::Hello, "hello"},
    {MessageType::ConnectionRequest, "connectionRequest"},
    {MessageType::ConnectionAccept, "connectionAccept"},
    {MessageType::ConnectionReject, "connectionReject"},
    {MessageType::ConnectionCancel, "connectionCancel"},
    {MessageType::Disconnect, "disconnect"},
    {MessageType::FileOffer, "fileOffer"},
    {MessageType::FileAccept, "fileAccept"},
    {MessageType::FileReject, "fileReject"},
    {MessageType::FileChunk, "fileChunk"},
    {MessageType::FileComplete, "fileComplete"},
    {MessageType::BatchStart, "batchStart"},
    {MessageType::BatchComplete, "batchComplete"},
    {MessageType::CallRequest, "callRequest"},
    {MessageType::CallAccept, "callAccept"},
    {MessageType::CallReject, "callReject"},
    {MessageType::CallEnd, "callEnd"},
    {MessageType::SdpOffer, "sdpOffer"},
    {MessageType::SdpAnswer, "sdpAnswer"},
    {MessageType::IceCandidate, "iceCandidate"},
    {MessageType::TextMessage, "textMessage"},
    {MessageType::MediaMessage, "mediaMessage"},
    {MessageType::MessageReceipt, "messageReceipt"},
    {MessageType::TypingIndicator, "typingIndicator"},
    {MessageType::Reaction, "reaction"},
    {MessageType::ChatReject, "chatReject"},
    {MessageType::Ping, "ping"},
    {MessageType::Pong, "pong"},
};

// Base64 via OpenSSL EVP block coding (no line breaks)
std::string base64_encode(const std::vector<uint8_t> &data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()), data.data(),
                          static_cast<int>(data.size()));
  out.resize(n < 0 ? 0 : static_cast<size_t>(n));
  return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string &text) {
  if (text.empty()) {
    return std::vector<uint8_t>{};
  }
  if (text.size() % 4 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out(3 * (text.size() / 4));
  int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char *>(text.data()),
                          static_cast<int>(text.size()));
  if (n < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock counts padding as zero bytes
  size_t padding = 0;
  if (text[text.size() - 1] == '=') ++padding;
  if (text[text.size() - 2] == '=') ++padding;
  out.resize(static_cast<size_t>(n) - padding);
  return out;
}

std::vector<uint8_t> to_bytes(const json &j) {
  const std::string s = j.dump();
  return std::vector<uint8_t>(s.begin(), s.end());
}

// Parse a message payload as a JSON object
DecodeError parse_payload(const PeerMessage &msg, json &out) {
  if (!msg.has_payload()) {
    return DecodeError::MissingPayload;
  }
  const auto &bytes = msg.payload();
  out = json::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (out.is_discarded() || !out.is_object()) {
    return DecodeError::MalformedPayload;
  }
  return DecodeError::None;
}

// Field readers: absent required field is MissingField, wrong JSON type is
// MalformedPayload. Optional fields accept absent or null.

DecodeError read_string(const json &j, const char *key, std::string &out) {
  if (!j.contains(key)) return DecodeError::MissingField;
  if (!j[key].is_string()) return DecodeError::MalformedPayload;
  out = j[key].get<std::string>();
  return DecodeError::None;
}

DecodeError read_opt_string(const json &j, const char *key, std::optional<std::string> &out) {
  out.reset();
  if (!j.contains(key) || j[key].is_null()) return DecodeError::None;
  if (!j[key].is_string()) return DecodeError::MalformedPayload;
  out = j[key].get<std::string>();
  return DecodeError::None;
}

DecodeError read_int64(const json &j, const char *key, int64_t &out) {
  if (!j.contains(key)) return DecodeError::MissingField;
  if (!j[key].is_number_integer()) return DecodeError::MalformedPayload;
  out = j[key].get<int64_t>();
  return DecodeError::None;
}

DecodeError read_int(const json &j, const char *key, int &out) {
  int64_t v = 0;
  DecodeError err = read_int64(j, key, v);
  if (err != DecodeError::None) return err;
  if (v < INT32_MIN || v > INT32_MAX) return DecodeError::MalformedPayload;
  out = static_cast<int>(v);
  return DecodeError::None;
}

DecodeError read_opt_int(const json &j, const char *key, std::optional<int> &out) {
  out.reset();
  if (!j.contains(key) || j[key].is_null()) return DecodeError::None;
  int v = 0;
  DecodeError err = read_int(j, key, v);
  if (err != DecodeError::None) return err;
  out = v;
  return DecodeError::None;
}

DecodeError read_double(const json &j, const char *key, double &out) {
  if (!j.contains(key)) return DecodeError::MissingField;
  if (!j[key].is_number()) return DecodeError::MalformedPayload;
  out = j[key].get<double>();
  return DecodeError::None;
}

DecodeError read_bool(const json &j, const char *key, bool &out) {
  if (!j.contains(key)) return DecodeError::MissingField;
  if (!j[key].is_boolean()) return DecodeError::MalformedPayload;
  out = j[key].get<bool>();
  return DecodeError::None;
}

// Chains field reads, stopping at the first error
class FieldReader {
public:
  explicit FieldReader(const json &j) : j_(j) {}

  template <typename Fn> FieldReader &operator()(Fn &&fn) {
    if (error_ == DecodeError::None) {
      error_ = fn(j_);
    }
    return *this;
  }

  DecodeError error() const { return error_; }

private:
  const json &j_;
  DecodeError error_{DecodeError::None};
};

json rejection_json(const std::string &reason) {
  json j;
  j["reason"] = reason;
  return j;
}

} // namespace

// ============================================================================
// Names
// ============================================================================

const std::vector<MessageType> &AllMessageTypes() {
  static const std::vector<MessageType> all = [] {
    std::vector<MessageType> v;
    for (const auto &entry : kTypeTable) {
      v.push_back(entry.type);
    }
    return v;
  }();
  return all;
}

const char *MessageTypeName(MessageType type) {
  for (const auto &entry : kTypeTable) {
    if (entry.type == type) {
      return entry.name;
    }
  }
  return "unknown";
}

std::optional<MessageType> MessageTypeFromName(const std::string &name) {
  static const std::unordered_map<std::string, MessageType> by_name = [] {
    std::unordered_map<std::string, MessageType> m;
    for (const auto &entry : kTypeTable) {
      m.emplace(entry.name, entry.type);
    }
    return m;
  }();
  auto it = by_name.find(name);
  if (it == by_name.end()) {
    return std::nullopt;
  }
  return it->second;
}

const char *DecodeErrorString(DecodeError error) {
  switch (error) {
  case DecodeError::None:
    return "none";
  case DecodeError::FrameTooLarge:
    return "frame too large";
  case DecodeError::MalformedEnvelope:
    return "malformed envelope";
  case DecodeError::UnknownMessageType:
    return "unknown message type";
  case DecodeError::MissingField:
    return "missing field";
  case DecodeError::InvalidBase64:
    return "invalid base64 payload";
  case DecodeError::MissingPayload:
    return "missing payload";
  case DecodeError::MalformedPayload:
    return "malformed payload";
  }
  return "unknown";
}

// ============================================================================
// PeerMessage
// ============================================================================

PeerMessage::PeerMessage(MessageType type, std::string sender_id,
                         std::optional<std::vector<uint8_t>> payload, uint32_t version)
    : type_(type), sender_id_(std::move(sender_id)), version_(version),
      payload_(std::move(payload)) {}

const std::vector<uint8_t> &PeerMessage::payload() const {
  static const std::vector<uint8_t> empty;
  return payload_ ? *payload_ : empty;
}

// ============================================================================
// Envelope
// ============================================================================

std::vector<uint8_t> encode_envelope(const PeerMessage &msg) {
  json j;
  j["version"] = msg.version();
  j["type"] = MessageTypeName(msg.type());
  j["senderID"] = msg.sender_id();
  if (msg.has_payload()) {
    j["payload"] = base64_encode(msg.payload());
  }
  return to_bytes(j);
}

DecodeError decode_envelope(const uint8_t *data, size_t size, PeerMessage &out) {
  json j = json::parse(data, data + size, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return DecodeError::MalformedEnvelope;
  }

  if (!j.contains("version") || !j.contains("type") || !j.contains("senderID")) {
    return DecodeError::MissingField;
  }
  if (!j["version"].is_number_unsigned() || !j["type"].is_string() ||
      !j["senderID"].is_string()) {
    return DecodeError::MalformedEnvelope;
  }

  auto type = MessageTypeFromName(j["type"].get<std::string>());
  if (!type) {
    return DecodeError::UnknownMessageType;
  }

  std::optional<std::vector<uint8_t>> payload;
  if (j.contains("payload") && !j["payload"].is_null()) {
    if (!j["payload"].is_string()) {
      return DecodeError::MalformedEnvelope;
    }
    payload = base64_decode(j["payload"].get<std::string>());
    if (!payload) {
      return DecodeError::InvalidBase64;
    }
  }

  uint64_t version = j["version"].get<uint64_t>();
  if (version > UINT32_MAX) {
    return DecodeError::MalformedEnvelope;
  }

  out = PeerMessage(*type, j["senderID"].get<std::string>(), std::move(payload),
                    static_cast<uint32_t>(version));
  return DecodeError::None;
}

// ============================================================================
// Payload decoding
// ============================================================================

DecodeError decode_payload(const PeerMessage &msg, PeerIdentity &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  PeerIdentity v;
  auto err = FieldReader(j)
                 ([&](const json &o) { return read_string(o, "id", v.id); })
                 ([&](const json &o) { return read_string(o, "displayName", v.display_name); })
                 ([&](const json &o) {
                   return read_opt_string(o, "certificateFingerprint", v.certificate_fingerprint);
                 })
                 .error();
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, RejectionPayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  RejectionPayload v;
  auto err = read_string(j, "reason", v.reason);
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, TransferMetadata &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  TransferMetadata v;
  auto err = FieldReader(j)
                 ([&](const json &o) { return read_string(o, "fileName", v.file_name); })
                 ([&](const json &o) { return read_int64(o, "fileSize", v.file_size); })
                 ([&](const json &o) { return read_opt_string(o, "mimeType", v.mime_type); })
                 ([&](const json &o) { return read_string(o, "sha256Hash", v.sha256_hash); })
                 ([&](const json &o) { return read_opt_int(o, "fileIndex", v.file_index); })
                 ([&](const json &o) { return read_opt_int(o, "totalFiles", v.total_files); })
                 ([&](const json &o) {
                   // Older senders omit isDirectory
                   if (!o.contains("isDirectory")) return DecodeError::None;
                   return read_bool(o, "isDirectory", v.is_directory);
                 })
                 .error();
  if (err == DecodeError::None && v.file_size < 0) {
    err = DecodeError::MalformedPayload;
  }
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, BatchMetadata &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  BatchMetadata v;
  auto err = FieldReader(j)
                 ([&](const json &o) { return read_int(o, "totalFiles", v.total_files); })
                 ([&](const json &o) { return read_string(o, "batchID", v.batch_id); })
                 .error();
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, FileCompletePayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  FileCompletePayload v;
  auto err = read_string(j, "hash", v.hash);
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, BatchCompletePayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  BatchCompletePayload v;
  auto err = read_string(j, "batchID", v.batch_id);
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, SdpPayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  SdpPayload v;
  auto err = FieldReader(j)
                 ([&](const json &o) { return read_string(o, "type", v.type); })
                 ([&](const json &o) { return read_string(o, "sdp", v.sdp); })
                 .error();
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, IceCandidatePayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  IceCandidatePayload v;
  int index = 0;
  auto err = FieldReader(j)
                 ([&](const json &o) { return read_opt_string(o, "sdpMid", v.sdp_mid); })
                 ([&](const json &o) { return read_int(o, "sdpMLineIndex", index); })
                 ([&](const json &o) { return read_string(o, "candidate", v.candidate); })
                 .error();
  v.sdp_mline_index = index;
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, TextMessagePayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  TextMessagePayload v;
  auto err =
      FieldReader(j)
          ([&](const json &o) { return read_string(o, "text", v.text); })
          ([&](const json &o) { return read_double(o, "timestamp", v.timestamp); })
          ([&](const json &o) { return read_opt_string(o, "replyToMessageID", v.reply_to_message_id); })
          ([&](const json &o) { return read_opt_string(o, "replyToText", v.reply_to_text); })
          ([&](const json &o) { return read_opt_string(o, "replyToSenderName", v.reply_to_sender_name); })
          ([&](const json &o) { return read_opt_string(o, "groupID", v.group_id); })
          ([&](const json &o) { return read_opt_string(o, "senderName", v.sender_name); })
          .error();
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, MediaMessagePayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  MediaMessagePayload v;
  auto err = FieldReader(j)
                 ([&](const json &o) { return read_string(o, "id", v.id); })
                 ([&](const json &o) { return read_string(o, "mediaType", v.media_type); })
                 ([&](const json &o) { return read_string(o, "fileName", v.file_name); })
                 ([&](const json &o) { return read_int64(o, "fileSize", v.file_size); })
                 ([&](const json &o) { return read_string(o, "mimeType", v.mime_type); })
                 ([&](const json &o) { return read_double(o, "timestamp", v.timestamp); })
                 ([&](const json &o) {
                   if (!o.contains("duration") || o["duration"].is_null()) return DecodeError::None;
                   double d = 0;
                   auto e = read_double(o, "duration", d);
                   if (e == DecodeError::None) v.duration = d;
                   return e;
                 })
                 ([&](const json &o) {
                   std::optional<std::string> thumb;
                   auto e = read_opt_string(o, "thumbnailData", thumb);
                   if (e != DecodeError::None || !thumb) return e;
                   auto bytes = base64_decode(*thumb);
                   if (!bytes) return DecodeError::InvalidBase64;
                   v.thumbnail_data = std::move(*bytes);
                   return DecodeError::None;
                 })
                 .error();
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, MessageReceiptPayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  MessageReceiptPayload v;
  auto err = FieldReader(j)
                 ([&](const json &o) {
                   if (!o.contains("messageIDs")) return DecodeError::MissingField;
                   if (!o["messageIDs"].is_array()) return DecodeError::MalformedPayload;
                   for (const auto &id : o["messageIDs"]) {
                     if (!id.is_string()) return DecodeError::MalformedPayload;
                     v.message_ids.push_back(id.get<std::string>());
                   }
                   return DecodeError::None;
                 })
                 ([&](const json &o) { return read_string(o, "receiptType", v.receipt_type); })
                 ([&](const json &o) { return read_double(o, "timestamp", v.timestamp); })
                 ([&](const json &o) { return read_opt_string(o, "groupID", v.group_id); })
                 ([&](const json &o) { return read_opt_string(o, "senderID", v.sender_id); })
                 .error();
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, TypingIndicatorPayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  TypingIndicatorPayload v;
  auto err = read_bool(j, "isTyping", v.is_typing);
  if (err == DecodeError::None) out = v;
  return err;
}

DecodeError decode_payload(const PeerMessage &msg, ReactionPayload &out) {
  json j;
  if (auto err = parse_payload(msg, j); err != DecodeError::None) return err;
  ReactionPayload v;
  auto err = FieldReader(j)
                 ([&](const json &o) { return read_string(o, "messageID", v.message_id); })
                 ([&](const json &o) { return read_string(o, "emoji", v.emoji); })
                 ([&](const json &o) { return read_string(o, "action", v.action); })
                 ([&](const json &o) { return read_double(o, "timestamp", v.timestamp); })
                 .error();
  if (err == DecodeError::None) out = std::move(v);
  return err;
}

// ============================================================================
// Factories
// ============================================================================

namespace {

json identity_json(const PeerIdentity &identity) {
  json j;
  j["id"] = identity.id;
  j["displayName"] = identity.display_name;
  if (identity.certificate_fingerprint) {
    j["certificateFingerprint"] = *identity.certificate_fingerprint;
  }
  return j;
}

PeerMessage with_json(MessageType type, const std::string &sender_id, const json &j) {
  return PeerMessage(type, sender_id, to_bytes(j));
}

} // namespace

PeerMessage make_hello(const PeerIdentity &identity) {
  return with_json(MessageType::Hello, identity.id, identity_json(identity));
}

PeerMessage make_connection_request(const std::string &sender_id) {
  return PeerMessage(MessageType::ConnectionRequest, sender_id);
}

PeerMessage make_connection_accept(const PeerIdentity &identity) {
  return with_json(MessageType::ConnectionAccept, identity.id, identity_json(identity));
}

PeerMessage make_connection_reject(const std::string &sender_id, const std::string &reason) {
  return with_json(MessageType::ConnectionReject, sender_id, rejection_json(reason));
}

PeerMessage make_connection_cancel(const std::string &sender_id) {
  return PeerMessage(MessageType::ConnectionCancel, sender_id);
}

PeerMessage make_disconnect(const std::string &sender_id) {
  return PeerMessage(MessageType::Disconnect, sender_id);
}

PeerMessage make_file_offer(const std::string &sender_id, const TransferMetadata &metadata) {
  json j;
  j["fileName"] = metadata.file_name;
  j["fileSize"] = metadata.file_size;
  if (metadata.mime_type) j["mimeType"] = *metadata.mime_type;
  j["sha256Hash"] = metadata.sha256_hash;
  if (metadata.file_index) j["fileIndex"] = *metadata.file_index;
  if (metadata.total_files) j["totalFiles"] = *metadata.total_files;
  j["isDirectory"] = metadata.is_directory;
  return with_json(MessageType::FileOffer, sender_id, j);
}

PeerMessage make_file_accept(const std::string &sender_id) {
  return PeerMessage(MessageType::FileAccept, sender_id);
}

PeerMessage make_file_reject(const std::string &sender_id, const std::string &reason) {
  return with_json(MessageType::FileReject, sender_id, rejection_json(reason));
}

PeerMessage make_file_chunk(const std::string &sender_id, std::vector<uint8_t> data) {
  return PeerMessage(MessageType::FileChunk, sender_id, std::move(data));
}

PeerMessage make_file_complete(const std::string &sender_id, const std::string &hash) {
  json j;
  j["hash"] = hash;
  return with_json(MessageType::FileComplete, sender_id, j);
}

PeerMessage make_batch_start(const std::string &sender_id, const BatchMetadata &metadata) {
  json j;
  j["totalFiles"] = metadata.total_files;
  j["batchID"] = metadata.batch_id;
  return with_json(MessageType::BatchStart, sender_id, j);
}

PeerMessage make_batch_complete(const std::string &sender_id, const std::string &batch_id) {
  json j;
  j["batchID"] = batch_id;
  return with_json(MessageType::BatchComplete, sender_id, j);
}

PeerMessage make_call_request(const std::string &sender_id) {
  return PeerMessage(MessageType::CallRequest, sender_id);
}

PeerMessage make_call_accept(const std::string &sender_id) {
  return PeerMessage(MessageType::CallAccept, sender_id);
}

PeerMessage make_call_reject(const std::string &sender_id, const std::string &reason) {
  return with_json(MessageType::CallReject, sender_id, rejection_json(reason));
}

PeerMessage make_call_end(const std::string &sender_id) {
  return PeerMessage(MessageType::CallEnd, sender_id);
}

PeerMessage make_sdp_offer(const std::string &sender_id, const std::string &sdp) {
  json j;
  j["type"] = "offer";
  j["sdp"] = sdp;
  return with_json(MessageType::SdpOffer, sender_id, j);
}

PeerMessage make_sdp_answer(const std::string &sender_id, const std::string &sdp) {
  json j;
  j["type"] = "answer";
  j["sdp"] = sdp;
  return with_json(MessageType::SdpAnswer, sender_id, j);
}

PeerMessage make_ice_candidate(const std::string &sender_id, const IceCandidatePayload &candidate) {
  json j;
  if (candidate.sdp_mid) j["sdpMid"] = *candidate.sdp_mid;
  j["sdpMLineIndex"] = candidate.sdp_mline_index;
  j["candidate"] = candidate.candidate;
  return with_json(MessageType::IceCandidate, sender_id, j);
}

PeerMessage make_text_message(const std::string &sender_id, const TextMessagePayload &text) {
  json j;
  j["text"] = text.text;
  j["timestamp"] = text.timestamp;
  if (text.reply_to_message_id) j["replyToMessageID"] = *text.reply_to_message_id;
  if (text.reply_to_text) j["replyToText"] = *text.reply_to_text;
  if (text.reply_to_sender_name) j["replyToSenderName"] = *text.reply_to_sender_name;
  if (text.group_id) j["groupID"] = *text.group_id;
  if (text.sender_name) j["senderName"] = *text.sender_name;
  return with_json(MessageType::TextMessage, sender_id, j);
}

PeerMessage make_media_message(const std::string &sender_id, const MediaMessagePayload &media) {
  json j;
  j["id"] = media.id;
  j["mediaType"] = media.media_type;
  j["fileName"] = media.file_name;
  j["fileSize"] = media.file_size;
  j["mimeType"] = media.mime_type;
  if (media.duration) j["duration"] = *media.duration;
  if (media.thumbnail_data) j["thumbnailData"] = base64_encode(*media.thumbnail_data);
  j["timestamp"] = media.timestamp;
  return with_json(MessageType::MediaMessage, sender_id, j);
}

PeerMessage make_message_receipt(const std::string &sender_id,
                                 const MessageReceiptPayload &receipt) {
  json j;
  j["messageIDs"] = receipt.message_ids;
  j["receiptType"] = receipt.receipt_type;
  j["timestamp"] = receipt.timestamp;
  if (receipt.group_id) j["groupID"] = *receipt.group_id;
  if (receipt.sender_id) j["senderID"] = *receipt.sender_id;
  return with_json(MessageType::MessageReceipt, sender_id, j);
}

PeerMessage make_typing_indicator(const std::string &sender_id, bool is_typing) {
  json j;
  j["isTyping"] = is_typing;
  return with_json(MessageType::TypingIndicator, sender_id, j);
}

PeerMessage make_reaction(const std::string &sender_id, const ReactionPayload &reaction) {
  json j;
  j["messageID"] = reaction.message_id;
  j["emoji"] = reaction.emoji;
  j["action"] = reaction.action;
  j["timestamp"] = reaction.timestamp;
  return with_json(MessageType::Reaction, sender_id, j);
}

PeerMessage make_chat_reject(const std::string &sender_id, const std::string &reason) {
  return with_json(MessageType::ChatReject, sender_id, rejection_json(reason));
}

PeerMessage make_ping(const std::string &sender_id) {
  return PeerMessage(MessageType::Ping, sender_id);
}

PeerMessage make_pong(const std::string &sender_id) {
  return PeerMessage(MessageType::Pong, sender_id);
}

} // namespace message
} // namespace peerlink
