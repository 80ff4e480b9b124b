// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/transport.hpp"

namespace peerlink {
namespace network {

const char *TransportErrorString(TransportError error) {
  switch (error) {
  case TransportError::None:
    return "No error";
  case TransportError::Refused:
    return "Connection refused";
  case TransportError::Reset:
    return "Connection reset by peer";
  case TransportError::TimedOut:
    return "Connection timed out";
  case TransportError::Unreachable:
    return "Peer unreachable";
  case TransportError::TlsFailure:
    return "Secure handshake failed";
  case TransportError::Closed:
    return "Connection closed";
  case TransportError::Other:
    return "Network error";
  }
  return "Network error";
}

} // namespace network
} // namespace peerlink
