// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/collaborators.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace peerlink {
namespace app {

/**
 * IdentityStore - the device identity persisted as <datadir>/identity.json
 *
 *   {"version": 1, "id": "<32 hex chars>", "displayName": "<name>"}
 *
 * Load() creates a fresh identity when the file is missing. A file that
 * exists but does not parse is an error (the id must stay stable across
 * restarts, so it is never silently replaced).
 */
class IdentityStore : public network::IdentityProvider {
public:
  explicit IdentityStore(std::filesystem::path datadir);

  // display_name overrides the stored name (and is persisted)
  bool Load(const std::optional<std::string> &display_name = std::nullopt);
  bool Save() const;

  void SetTlsCredential(network::TlsCredential credential) { tls_ = std::move(credential); }

  message::PeerIdentity local_identity() const override { return identity_; }
  std::optional<network::TlsCredential> tls_credential() const override { return tls_; }

  const std::filesystem::path &path() const { return path_; }

  // 128-bit random id, lowercase hex
  static std::string GenerateId();
  static std::string DefaultDisplayName();

private:
  std::filesystem::path path_;
  message::PeerIdentity identity_;
  std::optional<network::TlsCredential> tls_;
};

} // namespace app
} // namespace peerlink
