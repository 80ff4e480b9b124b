// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "identity_store.hpp"
#include "network/collaborators.hpp"
#include "network/connection_orchestrator.hpp"
#include "network/notifications.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace peerlink {
namespace app {

// Application configuration
struct AppConfig {
  // Data directory (identity.json, downloads/, debug.log)
  std::filesystem::path datadir;

  // Network configuration
  network::ConnectionOrchestrator::Config network_config;

  // Overrides the persisted display name
  std::optional<std::string> display_name;

  // Peers to dial once started ("host", port)
  std::vector<std::pair<std::string, uint16_t>> connect;

  // Files sent to every peer as soon as it connects
  std::vector<std::filesystem::path> send_paths;

  // Accept every inbound request without asking
  bool auto_accept = false;

  // TLS (both or neither)
  std::string tls_cert;
  std::string tls_key;

  AppConfig() : datadir(util::get_default_datadir()) {}
};

// Console collaborators for the headless daemon. Incoming requests are
// accepted only with --autoaccept; chat and call traffic is logged.
class ConsoleConsent : public network::ConsentProvider {
public:
  explicit ConsoleConsent(bool auto_accept) : auto_accept_(auto_accept) {}

  void request_consent(const network::PendingRequest &request,
                       network::ConsentCallback decide) override;
  void cancel_consent(const std::string &peer_id) override;

private:
  bool auto_accept_;
};

class ConsoleChat : public network::ChatSink {
public:
  void on_text_message(const std::string &peer_id,
                       const message::TextMessagePayload &text) override;
  void on_media_message(const std::string &peer_id,
                        const message::MediaMessagePayload &media) override;
  void on_reaction(const std::string &peer_id, const message::ReactionPayload &reaction) override;
  void on_receipt(const std::string &peer_id,
                  const message::MessageReceiptPayload &receipt) override;
  void on_typing(const std::string &peer_id, bool is_typing) override;
  void on_chat_rejected(const std::string &peer_id, const std::string &reason) override;
};

// Application - Main application coordinator
// Initializes components, manages lifecycle, handles signals, coordinates
// shutdown
class Application : private network::CallSignalingSink {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Component access
  network::ConnectionOrchestrator &orchestrator() { return *orchestrator_; }
  const IdentityStore &identity() const { return *identity_; }

  bool is_running() const { return running_; }
  void request_shutdown() { shutdown_requested_ = true; }

  // Signal handling
  static void signal_handler(int signal);
  static Application *instance();

private:
  // Voice media is out of scope for the daemon: requests are declined
  void on_call_request(const std::string &peer_id) override;
  void on_call_accept(const std::string &peer_id) override;
  void on_call_reject(const std::string &peer_id, const std::string &reason) override;
  void on_call_end(const std::string &peer_id) override;
  void on_signaling(const std::string &peer_id, const message::PeerMessage &msg) override;

  AppConfig config_;
  std::atomic<bool> running_{false};
  std::atomic<bool> shutdown_requested_{false};

  util::DirectoryLock datadir_lock_;

  // Components (initialized in order)
  std::unique_ptr<IdentityStore> identity_;
  std::unique_ptr<ConsoleConsent> consent_;
  std::unique_ptr<ConsoleChat> chat_;
  std::unique_ptr<network::DirectoryStorage> storage_;
  std::unique_ptr<network::ConnectionOrchestrator> orchestrator_;

  // Peers that already received --send files (io thread only)
  std::set<std::string> sent_to_;

  // IMPORTANT: Must be declared AFTER components so they are destroyed BEFORE
  network::ConnectionNotifications::Subscription state_sub_;
  network::ConnectionNotifications::Subscription peer_sub_;
  network::ConnectionNotifications::Subscription transfer_sub_;
  network::ConnectionNotifications::Subscription peers_changed_sub_;

  // Initialization steps
  bool init_datadir();
  bool init_identity();
  bool init_network();
  void subscribe();

  void shutdown();

  static Application *instance_;
  void setup_signal_handlers();
};

} // namespace app
} // namespace peerlink
