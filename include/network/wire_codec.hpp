// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/message.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace peerlink {
namespace network {

/**
 * Wire framing
 *
 * Frame: [4-byte big-endian length][JSON envelope of that length]
 *
 * The declared length is validated against protocol::MAX_FRAME_SIZE before
 * any payload byte is buffered.
 */

// Read the 4-byte big-endian length prefix
uint32_t read_frame_length(const uint8_t *header);

// Returns an empty vector if the encoded envelope exceeds MAX_FRAME_SIZE
std::vector<uint8_t> encode_frame(const message::PeerMessage &msg);

// Decode exactly one complete frame (header + envelope)
message::DecodeError decode_frame(const std::vector<uint8_t> &frame,
                                  message::PeerMessage &out);

/**
 * FrameDecoder - incremental receive-side decoder
 *
 * Bytes arrive in arbitrary pieces from the transport. feed() appends them;
 * next() yields complete frames in arrival order. Consumed bytes are tracked
 * with a read offset and compacted lazily.
 *
 * A per-frame decode error (bad JSON, unknown type) skips only that frame.
 * FrameTooLarge poisons the decoder: framing is lost, every later next()
 * reports FrameTooLarge, and the owner must close the stream.
 */
class FrameDecoder {
public:
  struct Result {
    message::DecodeError error{message::DecodeError::None};
    message::PeerMessage message; // valid only when error == None
  };

  void feed(const uint8_t *data, size_t size);
  void feed(const std::vector<uint8_t> &data) { feed(data.data(), data.size()); }

  // std::nullopt when no complete frame is buffered
  std::optional<Result> next();

  bool failed() const { return failed_; }

  // Bytes received but not yet consumed
  size_t buffered() const { return buffer_.size() - offset_; }

  void reset();

private:
  void compact();

  std::vector<uint8_t> buffer_;
  size_t offset_{0};
  bool failed_{false};
};

} // namespace network
} // namespace peerlink
