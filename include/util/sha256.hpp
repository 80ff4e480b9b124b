// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Opaque OpenSSL digest context
struct evp_md_ctx_st;

namespace peerlink {
namespace util {

/**
 * Incremental SHA-256 (OpenSSL EVP)
 *
 * Used for file transfer integrity (the sender hashes the file before the
 * offer, the receiver hashes chunks as they arrive) and for TLS certificate
 * fingerprints.
 *
 * Not thread-safe; one hasher per stream.
 */
class Sha256Hasher {
public:
  Sha256Hasher();
  ~Sha256Hasher();

  Sha256Hasher(const Sha256Hasher &) = delete;
  Sha256Hasher &operator=(const Sha256Hasher &) = delete;

  void Update(const uint8_t *data, size_t len);
  void Update(const std::vector<uint8_t> &data) { Update(data.data(), data.size()); }

  // Finish and return lowercase hex (64 chars). The hasher is reset afterwards.
  std::string FinalizeHex();

  void Reset();

private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st *ctx) const;
  };
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

// One-shot digest of a buffer as lowercase hex
std::string Sha256Hex(const uint8_t *data, size_t len);
std::string Sha256Hex(const std::vector<uint8_t> &data);

// Digest of a whole file; std::nullopt if the file cannot be read
std::optional<std::string> Sha256File(const std::filesystem::path &path);

// Lowercase hex encoding of raw bytes
std::string HexStr(const uint8_t *data, size_t len);

} // namespace util
} // namespace peerlink
