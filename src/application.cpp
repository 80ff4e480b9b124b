// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "application.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include "version.hpp"
#include <boost/asio/post.hpp>
#include <chrono>
#include <iostream>
#include <thread>
#include <unistd.h> // For write(), STDOUT_FILENO (async-signal-safe)

namespace peerlink {
namespace app {

// ============================================================================
// Console collaborators
// ============================================================================

void ConsoleConsent::request_consent(const network::PendingRequest &request,
                                     network::ConsentCallback decide) {
  if (auto_accept_) {
    LOG_APP_INFO("Accepting connection from {} ({}) at {}", request.peer.display_name,
                 request.peer.id, request.endpoint);
    decide(true);
    return;
  }
  LOG_APP_INFO("Declining connection from {} ({}) at {} (start with --autoaccept to accept)",
               request.peer.display_name, request.peer.id, request.endpoint);
  decide(false);
}

void ConsoleConsent::cancel_consent(const std::string &peer_id) {
  LOG_APP_INFO("Connection request from {} expired", peer_id);
}

void ConsoleChat::on_text_message(const std::string &peer_id,
                                  const message::TextMessagePayload &text) {
  LOG_APP_INFO("[{}] {}: {}", peer_id, text.sender_name.value_or(peer_id), text.text);
}

void ConsoleChat::on_media_message(const std::string &peer_id,
                                   const message::MediaMessagePayload &media) {
  LOG_APP_INFO("[{}] sent {} '{}' ({} bytes)", peer_id, media.media_type, media.file_name,
               media.file_size);
}

void ConsoleChat::on_reaction(const std::string &peer_id,
                              const message::ReactionPayload &reaction) {
  LOG_APP_INFO("[{}] {} reaction {} on {}", peer_id, reaction.action, reaction.emoji,
               reaction.message_id);
}

void ConsoleChat::on_receipt(const std::string &peer_id,
                             const message::MessageReceiptPayload &receipt) {
  LOG_APP_INFO("[{}] {} receipt for {} message(s)", peer_id, receipt.receipt_type,
               receipt.message_ids.size());
}

void ConsoleChat::on_typing(const std::string &, bool) {}

void ConsoleChat::on_chat_rejected(const std::string &peer_id, const std::string &reason) {
  if (reason == protocol::reasons::FEATURE_DISABLED) {
    LOG_APP_WARN("Peer {} has chat disabled", peer_id);
  } else {
    LOG_APP_WARN("Peer {} rejected chat: {}", peer_id, reason);
  }
}

// ============================================================================
// Application
// ============================================================================

// Static instance for signal handling
Application *Application::instance_ = nullptr;

Application::Application(const AppConfig &config) : config_(config) { instance_ = this; }

Application::~Application() {
  stop();
  instance_ = nullptr;
}

Application *Application::instance() { return instance_; }

bool Application::initialize() {
  LOG_APP_INFO("Initializing PeerLink...");

  if (!init_datadir()) {
    LOG_APP_ERROR("Failed to initialize data directory");
    return false;
  }

  if (!init_identity()) {
    LOG_APP_ERROR("Failed to initialize identity");
    return false;
  }

  // Print startup banner once the device name is known
  std::cout << GetStartupBanner(identity_->local_identity().display_name) << std::flush;

  if (!init_network()) {
    LOG_APP_ERROR("Failed to initialize connection engine");
    return false;
  }

  subscribe();

  LOG_APP_INFO("Initialization complete");
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }

  LOG_APP_INFO("Starting PeerLink...");
  setup_signal_handlers();

  if (!orchestrator_->start()) {
    LOG_APP_ERROR("Failed to start connection engine");
    return false;
  }
  running_ = true;

  LOG_APP_INFO("Device id: {}", identity_->local_identity().id);
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());
  if (config_.network_config.listen_enabled) {
    LOG_APP_INFO("Listening on port: {}", orchestrator_->listening_port());
  } else {
    LOG_APP_INFO("Inbound connections disabled");
  }

  // The engine is driven from its io thread
  for (const auto &[host, port] : config_.connect) {
    boost::asio::post(orchestrator_->io_context(), [this, host = host, port = port]() {
      auto result = orchestrator_->request_connection(host, port);
      if (result != network::ConnectionResult::Success) {
        LOG_APP_WARN("Cannot connect to {}:{}: {}", host, port,
                     network::ConnectionResultName(result));
      }
    });
  }

  LOG_APP_INFO("Press Ctrl+C to stop");
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown();
}

void Application::wait_for_shutdown() {
  while (running_ && !shutdown_requested_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (shutdown_requested_) {
    shutdown();
  }
}

void Application::shutdown() {
  if (!running_) {
    return;
  }
  LOG_APP_INFO("Shutting down PeerLink...");
  running_ = false;

  // Unsubscribe BEFORE stopping components
  state_sub_.Unsubscribe();
  peer_sub_.Unsubscribe();
  transfer_sub_.Unsubscribe();
  peers_changed_sub_.Unsubscribe();

  if (orchestrator_) {
    LOG_APP_INFO("Stopping connection engine...");
    orchestrator_->stop();
  }

  datadir_lock_.Release();
  LOG_APP_INFO("Shutdown complete");
}

bool Application::init_datadir() {
  LOG_APP_INFO("Data directory: {}", config_.datadir.string());

  if (!util::ensure_directory(config_.datadir)) {
    LOG_APP_ERROR("Failed to create data directory: {}", config_.datadir.string());
    return false;
  }

  util::LockResult lock_result = datadir_lock_.Acquire(config_.datadir);
  if (lock_result == util::LockResult::ErrorWrite) {
    LOG_APP_ERROR("Cannot write to data directory: {}", config_.datadir.string());
    return false;
  }
  if (lock_result == util::LockResult::ErrorLock) {
    LOG_APP_ERROR("Cannot obtain a lock on data directory {}. "
                  "PeerLink is probably already running.",
                  config_.datadir.string());
    return false;
  }
  return true;
}

bool Application::init_identity() {
  identity_ = std::make_unique<IdentityStore>(config_.datadir);
  if (!identity_->Load(config_.display_name)) {
    return false;
  }

  if (!config_.tls_cert.empty() || !config_.tls_key.empty()) {
    if (config_.tls_cert.empty() || config_.tls_key.empty()) {
      LOG_APP_ERROR("--tlscert and --tlskey must be given together");
      return false;
    }
    identity_->SetTlsCredential(network::TlsCredential{config_.tls_cert, config_.tls_key});
  }
  return true;
}

bool Application::init_network() {
  LOG_APP_INFO("Initializing connection engine...");

  auto downloads = config_.datadir / "downloads";
  if (!util::ensure_directory(downloads)) {
    LOG_APP_ERROR("Failed to create download directory: {}", downloads.string());
    return false;
  }

  consent_ = std::make_unique<ConsoleConsent>(config_.auto_accept);
  chat_ = std::make_unique<ConsoleChat>();
  storage_ = std::make_unique<network::DirectoryStorage>(downloads);
  orchestrator_ = std::make_unique<network::ConnectionOrchestrator>(
      *identity_, *consent_, *storage_, config_.network_config);
  orchestrator_->set_chat_sink(chat_.get());
  orchestrator_->set_call_sink(this);
  return true;
}

void Application::subscribe() {
  auto &notifications = orchestrator_->notifications();

  state_sub_ = notifications.SubscribeStateChange([](const network::ConnectionState &state) {
    LOG_APP_INFO("State: {}", state.ToString());
  });

  // Ship --send files to each peer once, right after it connects
  peer_sub_ = notifications.SubscribePeerConnectionChange(
      [this](const std::string &peer_id, const network::PeerConnectionState &state) {
        if (!state.is_connected() || config_.send_paths.empty() || sent_to_.count(peer_id)) {
          return;
        }
        sent_to_.insert(peer_id);
        boost::asio::post(orchestrator_->io_context(), [this, peer_id]() {
          if (!orchestrator_->send_files(peer_id, config_.send_paths)) {
            LOG_APP_WARN("Could not start sending files to {}", peer_id);
          }
        });
      });

  transfer_sub_ = notifications.SubscribeTransferComplete(
      [](const std::string &peer_id, const network::TransferRecord &record) {
        LOG_APP_INFO("{} '{}' ({} bytes) {} {} at {}: {}",
                     record.direction == network::TransferDirection::Sent ? "Sent" : "Received",
                     record.file_name, record.file_size,
                     record.direction == network::TransferDirection::Sent ? "to" : "from", peer_id,
                     util::FormatTime(record.timestamp), record.success ? "ok" : "failed");
      });

  peers_changed_sub_ = notifications.SubscribePeersChanged(
      [](const std::vector<network::DiscoveredPeer> &peers) {
        for (const auto &peer : peers) {
          LOG_APP_DEBUG("Discovered {} ({}) at {}:{} via {}", peer.display_name, peer.id,
                        peer.host(), peer.port(), network::DiscoverySourceName(peer.source));
        }
      });
}

void Application::on_call_request(const std::string &peer_id) {
  LOG_APP_INFO("Declining call from {} (no audio support)", peer_id);
  if (!orchestrator_->answer_call(peer_id, false)) {
    LOG_APP_DEBUG("Could not decline call from {}", peer_id);
  }
}

void Application::on_call_accept(const std::string &peer_id) {
  LOG_APP_INFO("Call accepted by {}", peer_id);
}

void Application::on_call_reject(const std::string &peer_id, const std::string &reason) {
  if (reason == protocol::reasons::FEATURE_DISABLED) {
    LOG_APP_INFO("Peer {} has voice calls disabled", peer_id);
  } else {
    LOG_APP_INFO("Call rejected by {}: {}", peer_id, reason);
  }
}

void Application::on_call_end(const std::string &peer_id) {
  LOG_APP_INFO("Call with {} ended", peer_id);
}

void Application::on_signaling(const std::string &peer_id, const message::PeerMessage &msg) {
  LOG_APP_DEBUG("Ignoring {} from {}", message::MessageTypeName(msg.type()), peer_id);
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int signal) {
  (void)signal;
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    const char *msg = "\nReceived signal\n";
    ssize_t written = write(STDOUT_FILENO, msg, 17);
    (void)written;
    instance_->shutdown_requested_ = true;
  }
}

} // namespace app
} // namespace peerlink
