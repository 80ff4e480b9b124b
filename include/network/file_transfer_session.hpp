// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include "network/collaborators.hpp"
#include "network/message.hpp"
#include "util/sha256.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {
namespace network {

class FileTransferSession;
using FileTransferSessionPtr = std::shared_ptr<FileTransferSession>;

/**
 * FileTransferSession - chunked file transfer with one peer
 *
 * Phases:
 *   Idle -> Offered -> Accepted -> Streaming -> Complete
 *                   -> Rejected
 *   any non-terminal phase -> Failed (network failure, hash mismatch, cancel)
 *
 * Sending: offer (metadata + SHA-256) -> wait for fileAccept -> stream 64 KiB
 * chunks, one handler at a time, pausing while the transport's send queue is
 * above FILE_SEND_HIGH_WATER -> fileComplete(hash).
 *
 * Receiving: an offer is checked against available storage (file size plus
 * STORAGE_SAFETY_MARGIN). If it does not fit, fileReject("insufficientStorage")
 * is sent and no transfer state is created. Otherwise chunks stream into a
 * temporary file in the download directory, are hashed as they arrive, and the
 * verified file is moved into place under a unique name.
 *
 * Multi-file sends are bracketed by batchStart/batchComplete.
 *
 * A session handles one file at a time, in one direction. Terminal phases
 * (Complete, Rejected, Failed) accept a new transfer.
 *
 * Single-threaded: every method and handler runs on the io_context.
 */
class FileTransferSession : public std::enable_shared_from_this<FileTransferSession> {
private:
  struct PrivateTag {};

public:
  enum class Phase { Idle, Offered, Accepted, Rejected, Streaming, Complete, Failed };
  enum class Role { None, Sending, Receiving };

  using SendFunction = std::function<bool(const message::PeerMessage &)>;
  using QueueDepthFunction = std::function<size_t()>;
  using ProgressHandler = std::function<void(double progress)>;
  using PhaseHandler = std::function<void(Phase phase, const std::string &reason)>;
  using RecordHandler = std::function<void(const TransferRecord &record)>;

  static FileTransferSessionPtr create(boost::asio::io_context &io_context, std::string peer_id,
                                       std::string local_id, const StorageProvider &storage,
                                       SendFunction send, QueueDepthFunction queue_depth);

  FileTransferSession(PrivateTag, boost::asio::io_context &io_context, std::string peer_id,
                      std::string local_id, const StorageProvider &storage, SendFunction send,
                      QueueDepthFunction queue_depth);
  ~FileTransferSession();

  FileTransferSession(const FileTransferSession &) = delete;
  FileTransferSession &operator=(const FileTransferSession &) = delete;

  // Offer a single regular file. False if busy, the file is unreadable, or
  // the offer could not be sent.
  bool send_file(const std::filesystem::path &path);

  // Offer several files one after another inside a batch
  bool send_files(const std::vector<std::filesystem::path> &paths);

  // Feed a received message. Returns true if it is a file-transfer message
  // (consumed even when it was ignored for being out of phase).
  bool handle_message(const message::PeerMessage &msg);

  // The transport dropped: non-terminal transfers fail
  void handle_transport_failure();

  // Abort locally and remove temporary data
  void cancel();

  void set_progress_handler(ProgressHandler handler) { progress_handler_ = std::move(handler); }
  void set_phase_handler(PhaseHandler handler) { phase_handler_ = std::move(handler); }
  void set_record_handler(RecordHandler handler) { record_handler_ = std::move(handler); }

  const std::string &peer_id() const { return peer_id_; }
  Phase phase() const { return phase_; }
  Role role() const { return role_; }
  bool is_active() const {
    return phase_ == Phase::Offered || phase_ == Phase::Accepted || phase_ == Phase::Streaming;
  }
  double progress() const;
  int64_t bytes_received() const { return bytes_received_; }
  int64_t bytes_sent() const { return bytes_sent_; }
  const std::optional<message::TransferMetadata> &metadata() const { return metadata_; }
  const std::optional<message::BatchMetadata> &batch() const { return batch_; }
  const std::string &last_error() const { return last_error_; }
  const std::vector<std::filesystem::path> &received_files() const { return received_files_; }

#ifdef PEERLINK_TESTS
  // Test-only: how long to wait before re-checking a full send queue
  static void SetBackpressureRetryForTest(std::chrono::milliseconds delay);
  static void ResetBackpressureRetryForTest();
#endif

private:
  // Sending
  bool offer_next_file();
  void on_file_accept();
  void on_file_reject(const message::PeerMessage &msg);
  void schedule_send_step();
  void send_step(uint64_t generation);
  void finish_sending();

  // Receiving
  void on_file_offer(const message::PeerMessage &msg);
  void on_file_chunk(const message::PeerMessage &msg);
  void on_file_complete(const message::PeerMessage &msg);
  void on_batch_start(const message::PeerMessage &msg);
  void on_batch_complete(const message::PeerMessage &msg);

  void set_phase(Phase phase, const std::string &reason = {});
  void fail(const std::string &reason);
  void emit_record(TransferDirection direction, bool success);
  void emit_progress();
  void cleanup_receive_state();
  void reset_transfer();
  bool send(const message::PeerMessage &msg);

  static std::chrono::milliseconds backpressure_retry();

  boost::asio::io_context &io_context_;
  std::string peer_id_;
  std::string local_id_;
  const StorageProvider &storage_;
  SendFunction send_;
  QueueDepthFunction queue_depth_;

  Phase phase_{Phase::Idle};
  Role role_{Role::None};
  uint64_t generation_{0};
  std::string last_error_;

  std::optional<message::TransferMetadata> metadata_;
  std::optional<message::BatchMetadata> batch_;

  // Sending state
  std::deque<std::filesystem::path> pending_files_;
  std::filesystem::path send_path_;
  std::ifstream send_stream_;
  int64_t bytes_sent_{0};
  int batch_index_{0};
  boost::asio::steady_timer backpressure_timer_;

  // Receiving state
  std::filesystem::path temp_path_;
  std::ofstream receive_stream_;
  util::Sha256Hasher hasher_;
  int64_t bytes_received_{0};
  std::vector<std::filesystem::path> received_files_;

  ProgressHandler progress_handler_;
  PhaseHandler phase_handler_;
  RecordHandler record_handler_;

#ifdef PEERLINK_TESTS
  static std::atomic<std::chrono::milliseconds> backpressure_retry_override_ms_;
#endif
};

const char *FileTransferPhaseName(FileTransferSession::Phase phase);

} // namespace network
} // namespace peerlink
