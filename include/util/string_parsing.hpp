// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line and user-entered values (ports, counts,
   manual peer addresses)
 - Returns std::nullopt on any parsing error (no exceptions thrown)
 - Validates the entire input is consumed (no trailing garbage)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace peerlink {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("9876") -> 9876
 *   SafeParsePort("0") -> std::nullopt
 *   SafeParsePort("99999") -> std::nullopt
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * True if all characters are hex digits [0-9a-fA-F] (empty -> false)
 */
bool IsValidHex(const std::string& str);

/**
 * Split "host:port" or "[v6-host]:port" into its parts
 *
 * Examples:
 *   ParseHostPort("192.168.1.5:9876") -> {"192.168.1.5", 9876}
 *   ParseHostPort("[fe80::1]:9876")   -> {"fe80::1", 9876}
 *   ParseHostPort("host")             -> std::nullopt (port required)
 *   ParseHostPort(":9876")            -> std::nullopt (empty host)
 */
std::optional<std::pair<std::string, uint16_t>> ParseHostPort(const std::string& str);

} // namespace util
} // namespace peerlink
