// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "util/string_parsing.hpp"
#include <cctype>
#include <stdexcept>

namespace peerlink {
namespace util {

namespace {

// Shared by the integer parsers: rejects empty/whitespace-led input and
// trailing characters. std::stoll throws on garbage and overflow.
std::optional<long long> ParseWhole(const std::string& str) {
  if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
    return std::nullopt;
  }
  try {
    size_t pos = 0;
    long long value = std::stoll(str, &pos);
    if (pos != str.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

} // namespace

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = ParseWhole(str);
  if (!value || *value < min || *value > max) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = ParseWhole(str);
  if (!value || *value < 1 || *value > 65535) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::optional<std::pair<std::string, uint16_t>> ParseHostPort(const std::string& str) {
  std::string host;
  std::string port_str;

  if (!str.empty() && str.front() == '[') {
    // Bracketed IPv6 literal
    size_t close = str.find(']');
    if (close == std::string::npos || close + 1 >= str.size() || str[close + 1] != ':') {
      return std::nullopt;
    }
    host = str.substr(1, close - 1);
    port_str = str.substr(close + 2);
  } else {
    size_t colon = str.rfind(':');
    if (colon == std::string::npos) {
      return std::nullopt;
    }
    host = str.substr(0, colon);
    port_str = str.substr(colon + 1);
    // Unbracketed IPv6 is ambiguous
    if (host.find(':') != std::string::npos) {
      return std::nullopt;
    }
  }

  if (host.empty()) {
    return std::nullopt;
  }

  auto port = SafeParsePort(port_str);
  if (!port) {
    return std::nullopt;
  }
  return std::make_pair(host, *port);
}

} // namespace util
} // namespace peerlink
