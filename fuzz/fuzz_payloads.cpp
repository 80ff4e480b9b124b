// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

// Fuzz target for typed payload decoding
// Every message type's payload decoder must handle arbitrary bytes gracefully

#include "network/message.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace {

template <typename Payload>
void Exercise(const peerlink::message::PeerMessage &msg) {
  Payload out;
  (void)peerlink::message::decode_payload(msg, out);
}

} // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
  using namespace peerlink::message;

  if (size < 1) return 0;

  const auto &types = AllMessageTypes();
  MessageType type = types[data[0] % types.size()];
  PeerMessage msg(type, "fuzz", std::vector<uint8_t>(data + 1, data + size));

  switch (data[0] % 13) {
  case 0:
    Exercise<PeerIdentity>(msg);
    break;
  case 1:
    Exercise<RejectionPayload>(msg);
    break;
  case 2:
    Exercise<TransferMetadata>(msg);
    break;
  case 3:
    Exercise<BatchMetadata>(msg);
    break;
  case 4:
    Exercise<FileCompletePayload>(msg);
    break;
  case 5:
    Exercise<BatchCompletePayload>(msg);
    break;
  case 6:
    Exercise<SdpPayload>(msg);
    break;
  case 7:
    Exercise<IceCandidatePayload>(msg);
    break;
  case 8:
    Exercise<TextMessagePayload>(msg);
    break;
  case 9:
    Exercise<MediaMessagePayload>(msg);
    break;
  case 10:
    Exercise<MessageReceiptPayload>(msg);
    break;
  case 11:
    Exercise<TypingIndicatorPayload>(msg);
    break;
  case 12:
    Exercise<ReactionPayload>(msg);
    break;
  }

  // The envelope decoder sees the same bytes as a raw frame body
  PeerMessage decoded;
  if (decode_envelope(data, size, decoded) == DecodeError::None) {
    auto bytes = encode_envelope(decoded);
    PeerMessage again;
    if (decode_envelope(bytes.data(), bytes.size(), again) != DecodeError::None ||
        !(again == decoded)) {
      __builtin_trap();
    }
  }
  return 0;
}
