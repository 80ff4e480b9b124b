// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/discovery.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <algorithm>

namespace peerlink {
namespace network {

const char *DiscoverySourceName(DiscoverySource source) {
  switch (source) {
  case DiscoverySource::Service:
    return "service";
  case DiscoverySource::Manual:
    return "manual";
  }
  return "unknown";
}

const std::string &DiscoveredPeer::host() const {
  return std::visit([](const auto &ep) -> const std::string & { return ep.host; }, endpoint);
}

uint16_t DiscoveredPeer::port() const {
  return std::visit([](const auto &ep) { return ep.port; }, endpoint);
}

std::string ManualPeerId(const std::string &host, uint16_t port) {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

DiscoveryCoordinator::~DiscoveryCoordinator() {
  for (auto &backend : backends_) {
    backend->set_peers_handler(nullptr);
    if (backend->is_running()) {
      backend->stop();
    }
  }
}

void DiscoveryCoordinator::add_backend(std::shared_ptr<DiscoveryBackend> backend) {
  size_t index;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    index = backends_.size();
    backends_.push_back(backend);
    backend_views_.emplace_back();
  }
  backend->set_peers_handler(
      [this, index](const std::vector<DiscoveredPeer> &peers) { on_backend_peers(index, peers); });
}

void DiscoveryCoordinator::start() {
  std::vector<std::shared_ptr<DiscoveryBackend>> backends;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
    backends = backends_;
  }
  LOG_DISC_INFO("Starting discovery ({} backends)", backends.size());
  for (auto &backend : backends) {
    backend->start();
  }
}

void DiscoveryCoordinator::stop() {
  std::vector<std::shared_ptr<DiscoveryBackend>> backends;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    backends = backends_;
  }
  LOG_DISC_INFO("Stopping discovery");
  for (auto &backend : backends) {
    backend->stop();
  }
}

bool DiscoveryCoordinator::is_running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

std::string DiscoveryCoordinator::add_manual_peer(const std::string &host, uint16_t port,
                                                  const std::optional<std::string> &name) {
  std::string id = ManualPeerId(host, port);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(manual_.begin(), manual_.end(),
                           [&](const DiscoveredPeer &p) { return p.id == id; });
    if (it != manual_.end()) {
      it->last_seen = util::GetTime();
      if (name) {
        it->display_name = *name;
      }
    } else {
      DiscoveredPeer peer;
      peer.id = id;
      peer.display_name = name.value_or(host);
      peer.endpoint = ManualEndpoint{host, port};
      peer.source = DiscoverySource::Manual;
      peer.last_seen = util::GetTime();
      manual_.push_back(std::move(peer));
      LOG_DISC_INFO("Added manual peer {}", id);
    }
    rebuild_locked();
  }
  notify();
  return id;
}

bool DiscoveryCoordinator::remove_manual_peer(const std::string &id) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto before = manual_.size();
    manual_.erase(std::remove_if(manual_.begin(), manual_.end(),
                                 [&](const DiscoveredPeer &p) { return p.id == id; }),
                  manual_.end());
    if (manual_.size() == before) {
      return false;
    }
    rebuild_locked();
  }
  LOG_DISC_INFO("Removed manual peer {}", id);
  notify();
  return true;
}

void DiscoveryCoordinator::mark_seen(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto &peer : manual_) {
    if (peer.id == id) {
      peer.last_seen = util::GetTime();
    }
  }
  rebuild_locked();
}

size_t DiscoveryCoordinator::cleanup_stale_peers(int64_t older_than_sec) {
  size_t removed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t cutoff = util::GetTime() - older_than_sec;
    auto before = manual_.size();
    manual_.erase(std::remove_if(manual_.begin(), manual_.end(),
                                 [cutoff](const DiscoveredPeer &p) { return p.last_seen < cutoff; }),
                  manual_.end());
    removed = before - manual_.size();
    if (removed > 0) {
      rebuild_locked();
    }
  }
  if (removed > 0) {
    LOG_DISC_DEBUG("Removed {} stale manual peers", removed);
    notify();
  }
  return removed;
}

std::vector<DiscoveredPeer> DiscoveryCoordinator::peers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return merged_;
}

std::optional<DiscoveredPeer> DiscoveryCoordinator::find(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &peer : merged_) {
    if (peer.id == id) {
      return peer;
    }
  }
  return std::nullopt;
}

void DiscoveryCoordinator::set_peers_changed_handler(PeersChangedHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  peers_changed_handler_ = std::move(handler);
}

void DiscoveryCoordinator::on_backend_peers(size_t index, const std::vector<DiscoveredPeer> &peers) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= backend_views_.size()) {
      return;
    }
    backend_views_[index] = peers;
    rebuild_locked();
  }
  LOG_DISC_TRACE("Backend {} reported {} peers", index, peers.size());
  notify();
}

void DiscoveryCoordinator::rebuild_locked() {
  std::vector<DiscoveredPeer> merged = manual_;
  for (const auto &view : backend_views_) {
    for (const auto &peer : view) {
      bool present = std::any_of(merged.begin(), merged.end(),
                                 [&](const DiscoveredPeer &p) { return p.id == peer.id; });
      if (!present) {
        merged.push_back(peer);
      }
    }
  }
  merged_ = std::move(merged);
}

void DiscoveryCoordinator::notify() {
  PeersChangedHandler handler;
  std::vector<DiscoveredPeer> snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handler = peers_changed_handler_;
    snapshot = merged_;
  }
  if (handler) {
    handler(snapshot);
  }
}

} // namespace network
} // namespace peerlink
