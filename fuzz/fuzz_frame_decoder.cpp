// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

// Fuzz target for the incremental frame decoder
// Feeds untrusted bytes in fuzzer-chosen pieces and checks decoder invariants

#include "network/protocol.hpp"
#include "network/wire_codec.hpp"
#include <cstddef>
#include <cstdint>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  using namespace peerlink;
  using message::DecodeError;

  if (size < 1) return 0;

  // First byte picks the piece size the transport delivers
  size_t piece = static_cast<size_t>(data[0] % 64) + 1;
  const uint8_t *input = data + 1;
  size_t input_size = size - 1;

  network::FrameDecoder decoder;
  for (size_t pos = 0; pos < input_size; pos += piece) {
    size_t n = input_size - pos < piece ? input_size - pos : piece;
    decoder.feed(input + pos, n);

    while (auto result = decoder.next()) {
      if (result->error == DecodeError::FrameTooLarge) {
        // Poisoned decoders must stay poisoned
        auto after = decoder.next();
        if (!decoder.failed() || !after || after->error != DecodeError::FrameTooLarge) {
          __builtin_trap();
        }
        return 0;
      }
      if (result->error != DecodeError::None) continue;

      // Anything we accept must re-encode into a frame we accept again
      auto frame = network::encode_frame(result->message);
      if (frame.empty() || frame.size() > protocol::MAX_FRAME_SIZE + protocol::FRAME_HEADER_SIZE) {
        __builtin_trap();
      }
      message::PeerMessage again;
      if (network::decode_frame(frame, again) != DecodeError::None || !(again == result->message)) {
        __builtin_trap();
      }
    }
  }

  // Leftover bytes are an incomplete frame and yield nothing
  if (decoder.next()) {
    __builtin_trap();
  }
  return 0;
}
