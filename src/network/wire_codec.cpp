// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/wire_codec.hpp"
#include "network/protocol.hpp"
#include <algorithm>

namespace peerlink {
namespace network {

using message::DecodeError;

namespace {

// Compact once the consumed prefix passes this size
constexpr size_t COMPACT_THRESHOLD = 64 * 1024;

void write_frame_length(uint8_t *header, uint32_t len) {
  header[0] = static_cast<uint8_t>(len >> 24);
  header[1] = static_cast<uint8_t>(len >> 16);
  header[2] = static_cast<uint8_t>(len >> 8);
  header[3] = static_cast<uint8_t>(len);
}

} // namespace

uint32_t read_frame_length(const uint8_t *header) {
  return (static_cast<uint32_t>(header[0]) << 24) | (static_cast<uint32_t>(header[1]) << 16) |
         (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
}

std::vector<uint8_t> encode_frame(const message::PeerMessage &msg) {
  std::vector<uint8_t> envelope = message::encode_envelope(msg);
  if (envelope.size() > protocol::MAX_FRAME_SIZE) {
    return {};
  }

  std::vector<uint8_t> frame(protocol::FRAME_HEADER_SIZE + envelope.size());
  write_frame_length(frame.data(), static_cast<uint32_t>(envelope.size()));
  std::copy(envelope.begin(), envelope.end(), frame.begin() + protocol::FRAME_HEADER_SIZE);
  return frame;
}

DecodeError decode_frame(const std::vector<uint8_t> &frame, message::PeerMessage &out) {
  if (frame.size() < protocol::FRAME_HEADER_SIZE) {
    return DecodeError::MalformedEnvelope;
  }
  uint32_t len = read_frame_length(frame.data());
  if (len > protocol::MAX_FRAME_SIZE) {
    return DecodeError::FrameTooLarge;
  }
  if (frame.size() - protocol::FRAME_HEADER_SIZE != len) {
    return DecodeError::MalformedEnvelope;
  }
  return message::decode_envelope(frame.data() + protocol::FRAME_HEADER_SIZE, len, out);
}

void FrameDecoder::feed(const uint8_t *data, size_t size) {
  if (failed_ || size == 0) {
    return;
  }
  compact();
  buffer_.insert(buffer_.end(), data, data + size);
}

std::optional<FrameDecoder::Result> FrameDecoder::next() {
  if (failed_) {
    return Result{DecodeError::FrameTooLarge, {}};
  }
  if (buffered() < protocol::FRAME_HEADER_SIZE) {
    return std::nullopt;
  }

  uint32_t len = read_frame_length(buffer_.data() + offset_);
  if (len > protocol::MAX_FRAME_SIZE) {
    failed_ = true;
    buffer_.clear();
    offset_ = 0;
    return Result{DecodeError::FrameTooLarge, {}};
  }
  if (buffered() < protocol::FRAME_HEADER_SIZE + len) {
    return std::nullopt;
  }

  Result result;
  result.error = message::decode_envelope(buffer_.data() + offset_ + protocol::FRAME_HEADER_SIZE,
                                          len, result.message);
  offset_ += protocol::FRAME_HEADER_SIZE + len;
  if (offset_ == buffer_.size()) {
    buffer_.clear();
    offset_ = 0;
  }
  return result;
}

void FrameDecoder::reset() {
  buffer_.clear();
  offset_ = 0;
  failed_ = false;
}

void FrameDecoder::compact() {
  if (offset_ == 0) {
    return;
  }
  if (offset_ >= COMPACT_THRESHOLD || offset_ * 2 >= buffer_.size()) {
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset_));
    offset_ = 0;
  }
}

} // namespace network
} // namespace peerlink
