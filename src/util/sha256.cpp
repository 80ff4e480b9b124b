// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "util/sha256.hpp"
#include <array>
#include <fstream>
#include <openssl/evp.h>
#include <stdexcept>

namespace peerlink {
namespace util {

void Sha256Hasher::CtxDeleter::operator()(evp_md_ctx_st *ctx) const {
  EVP_MD_CTX_free(ctx);
}

Sha256Hasher::Sha256Hasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  Reset();
}

Sha256Hasher::~Sha256Hasher() = default;

void Sha256Hasher::Reset() {
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
}

void Sha256Hasher::Update(const uint8_t *data, size_t len) {
  if (len == 0) {
    return;
  }
  if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

std::string Sha256Hasher::FinalizeHex() {
  std::array<uint8_t, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest.data(), &digest_len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  Reset();
  return HexStr(digest.data(), digest_len);
}

std::string Sha256Hex(const uint8_t *data, size_t len) {
  Sha256Hasher hasher;
  hasher.Update(data, len);
  return hasher.FinalizeHex();
}

std::string Sha256Hex(const std::vector<uint8_t> &data) {
  return Sha256Hex(data.data(), data.size());
}

std::optional<std::string> Sha256File(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }

  Sha256Hasher hasher;
  std::vector<char> buf(64 * 1024);
  while (file) {
    file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    std::streamsize n = file.gcount();
    if (n > 0) {
      hasher.Update(reinterpret_cast<const uint8_t *>(buf.data()), static_cast<size_t>(n));
    }
  }
  if (file.bad()) {
    return std::nullopt;
  }
  return hasher.FinalizeHex();
}

std::string HexStr(const uint8_t *data, size_t len) {
  static constexpr char kHexDigits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(kHexDigits[data[i] >> 4]);
    out.push_back(kHexDigits[data[i] & 0x0f]);
  }
  return out;
}

} // namespace util
} // namespace peerlink
