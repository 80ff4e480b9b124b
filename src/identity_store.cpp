// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "identity_store.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/sha256.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <unistd.h>

namespace peerlink {
namespace app {

using json = nlohmann::json;

namespace {
constexpr int IDENTITY_FILE_VERSION = 1;
constexpr size_t MAX_DISPLAY_NAME = 64;
} // namespace

IdentityStore::IdentityStore(std::filesystem::path datadir)
    : path_(std::move(datadir) / "identity.json") {}

std::string IdentityStore::GenerateId() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  uint8_t bytes[16];
  for (size_t i = 0; i < sizeof(bytes); i += 8) {
    uint64_t v = gen();
    for (size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(v >> (8 * j));
    }
  }
  return util::HexStr(bytes, sizeof(bytes));
}

std::string IdentityStore::DefaultDisplayName() {
  char host[256] = {0};
  if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
    return host;
  }
  return "PeerLink device";
}

bool IdentityStore::Load(const std::optional<std::string> &display_name) {
  auto contents = util::read_small_file(path_);
  if (!contents) {
    std::error_code ec;
    if (std::filesystem::exists(path_, ec)) {
      LOG_APP_ERROR("Cannot read {}", path_.string());
      return false;
    }
    identity_.id = GenerateId();
    identity_.display_name = display_name.value_or(DefaultDisplayName());
    LOG_APP_INFO("Created new identity {}", identity_.id);
    return Save();
  }

  json j = json::parse(*contents, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    LOG_APP_ERROR("Malformed identity file {}", path_.string());
    return false;
  }
  if (!j.contains("version") || !j["version"].is_number_integer() ||
      j["version"].get<int>() != IDENTITY_FILE_VERSION) {
    LOG_APP_ERROR("Unsupported identity file version in {}", path_.string());
    return false;
  }
  if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
    LOG_APP_ERROR("Identity file {} has no id", path_.string());
    return false;
  }

  identity_.id = j["id"].get<std::string>();
  if (j.contains("displayName") && j["displayName"].is_string()) {
    identity_.display_name = j["displayName"].get<std::string>();
  }
  if (identity_.display_name.empty()) {
    identity_.display_name = DefaultDisplayName();
  }

  if (display_name && *display_name != identity_.display_name) {
    identity_.display_name = *display_name;
    return Save();
  }
  return true;
}

bool IdentityStore::Save() const {
  if (identity_.display_name.size() > MAX_DISPLAY_NAME) {
    LOG_APP_WARN("Display name longer than {} characters", MAX_DISPLAY_NAME);
  }
  json j;
  j["version"] = IDENTITY_FILE_VERSION;
  j["id"] = identity_.id;
  j["displayName"] = identity_.display_name;

  if (!util::atomic_write_file(path_, j.dump(2) + "\n", 0600)) {
    LOG_APP_ERROR("Failed to write {}", path_.string());
    return false;
  }
  return true;
}

} // namespace app
} // namespace peerlink
