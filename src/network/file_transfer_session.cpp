// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "network/file_transfer_session.hpp"
#include "network/protocol.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <random>

namespace peerlink {
namespace network {

namespace {

std::string random_hex(size_t bytes) {
  static thread_local std::mt19937_64 gen(std::random_device{}());
  std::vector<uint8_t> buf(bytes);
  for (auto &b : buf) {
    b = static_cast<uint8_t>(gen() & 0xFF);
  }
  return util::HexStr(buf.data(), buf.size());
}

} // namespace

const char *FileTransferPhaseName(FileTransferSession::Phase phase) {
  switch (phase) {
  case FileTransferSession::Phase::Idle:
    return "idle";
  case FileTransferSession::Phase::Offered:
    return "offered";
  case FileTransferSession::Phase::Accepted:
    return "accepted";
  case FileTransferSession::Phase::Rejected:
    return "rejected";
  case FileTransferSession::Phase::Streaming:
    return "streaming";
  case FileTransferSession::Phase::Complete:
    return "complete";
  case FileTransferSession::Phase::Failed:
    return "failed";
  }
  return "unknown";
}

#ifdef PEERLINK_TESTS
std::atomic<std::chrono::milliseconds> FileTransferSession::backpressure_retry_override_ms_{
    std::chrono::milliseconds{0}};

void FileTransferSession::SetBackpressureRetryForTest(std::chrono::milliseconds delay) {
  backpressure_retry_override_ms_.store(delay, std::memory_order_relaxed);
}

void FileTransferSession::ResetBackpressureRetryForTest() {
  backpressure_retry_override_ms_.store(std::chrono::milliseconds{0}, std::memory_order_relaxed);
}
#endif

std::chrono::milliseconds FileTransferSession::backpressure_retry() {
#ifdef PEERLINK_TESTS
  auto ov = backpressure_retry_override_ms_.load(std::memory_order_relaxed);
  if (ov.count() > 0) {
    return ov;
  }
#endif
  return std::chrono::milliseconds{20};
}

FileTransferSessionPtr FileTransferSession::create(boost::asio::io_context &io_context,
                                                   std::string peer_id, std::string local_id,
                                                   const StorageProvider &storage,
                                                   SendFunction send,
                                                   QueueDepthFunction queue_depth) {
  return std::make_shared<FileTransferSession>(PrivateTag{}, io_context, std::move(peer_id),
                                               std::move(local_id), storage, std::move(send),
                                               std::move(queue_depth));
}

FileTransferSession::FileTransferSession(PrivateTag, boost::asio::io_context &io_context,
                                         std::string peer_id, std::string local_id,
                                         const StorageProvider &storage, SendFunction send,
                                         QueueDepthFunction queue_depth)
    : io_context_(io_context), peer_id_(std::move(peer_id)), local_id_(std::move(local_id)),
      storage_(storage), send_(std::move(send)), queue_depth_(std::move(queue_depth)),
      backpressure_timer_(io_context) {}

FileTransferSession::~FileTransferSession() {
  backpressure_timer_.cancel();
  if (receive_stream_.is_open()) {
    receive_stream_.close();
  }
  if (!temp_path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
  }
}

double FileTransferSession::progress() const {
  if (!metadata_) {
    return 0.0;
  }
  if (phase_ == Phase::Complete) {
    return 1.0;
  }
  if (metadata_->file_size <= 0) {
    return 0.0;
  }
  int64_t done = role_ == Role::Sending ? bytes_sent_ : bytes_received_;
  double p = static_cast<double>(done) / static_cast<double>(metadata_->file_size);
  return p > 1.0 ? 1.0 : p;
}

bool FileTransferSession::send(const message::PeerMessage &msg) {
  return send_ && send_(msg);
}

void FileTransferSession::set_phase(Phase phase, const std::string &reason) {
  if (phase_ == phase) {
    return;
  }
  LOG_XFER_DEBUG("Transfer with peer {}: {} -> {}{}{}", peer_id_, FileTransferPhaseName(phase_),
                 FileTransferPhaseName(phase), reason.empty() ? "" : " : ", reason);
  phase_ = phase;
  if (phase_handler_) {
    auto handler = phase_handler_;
    handler(phase_, reason);
  }
}

void FileTransferSession::fail(const std::string &reason) {
  LOG_XFER_WARN("Transfer with peer {} failed: {}", peer_id_, reason);
  last_error_ = reason;
  ++generation_;
  backpressure_timer_.cancel();
  send_stream_.close();
  pending_files_.clear();
  cleanup_receive_state();
  set_phase(Phase::Failed, reason);
}

void FileTransferSession::emit_record(TransferDirection direction, bool success) {
  if (!metadata_ || !record_handler_) {
    return;
  }
  TransferRecord record;
  record.file_name = metadata_->file_name;
  record.file_size = metadata_->file_size;
  record.direction = direction;
  record.timestamp = util::GetTime();
  record.success = success;
  auto handler = record_handler_;
  handler(record);
}

void FileTransferSession::emit_progress() {
  if (progress_handler_) {
    auto handler = progress_handler_;
    handler(progress());
  }
}

void FileTransferSession::cleanup_receive_state() {
  if (receive_stream_.is_open()) {
    receive_stream_.close();
  }
  if (!temp_path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    temp_path_.clear();
  }
}

void FileTransferSession::reset_transfer() {
  ++generation_;
  backpressure_timer_.cancel();
  send_stream_.close();
  cleanup_receive_state();
  metadata_.reset();
  bytes_sent_ = 0;
  bytes_received_ = 0;
  hasher_.Reset();
}

// ============================================================================
// Sending
// ============================================================================

bool FileTransferSession::send_file(const std::filesystem::path &path) {
  if (is_active()) {
    LOG_XFER_WARN("Cannot send {} to peer {}: transfer already in progress", path.string(),
                  peer_id_);
    return false;
  }
  batch_.reset();
  pending_files_.clear();
  pending_files_.push_back(path);
  return offer_next_file();
}

bool FileTransferSession::send_files(const std::vector<std::filesystem::path> &paths) {
  if (paths.empty()) {
    return false;
  }
  if (paths.size() == 1) {
    return send_file(paths.front());
  }
  if (is_active()) {
    LOG_XFER_WARN("Cannot start batch to peer {}: transfer already in progress", peer_id_);
    return false;
  }

  message::BatchMetadata batch;
  batch.total_files = static_cast<int>(paths.size());
  batch.batch_id = random_hex(16);
  if (!send(message::make_batch_start(local_id_, batch))) {
    LOG_XFER_WARN("Failed to send batchStart to peer {}", peer_id_);
    return false;
  }
  LOG_XFER_INFO("Starting batch {} ({} files) to peer {}", batch.batch_id, batch.total_files,
                peer_id_);

  batch_ = batch;
  batch_index_ = 0;
  pending_files_.assign(paths.begin(), paths.end());
  return offer_next_file();
}

bool FileTransferSession::offer_next_file() {
  if (pending_files_.empty()) {
    return false;
  }
  auto path = pending_files_.front();
  pending_files_.pop_front();

  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    LOG_XFER_WARN("Cannot send {}: not a regular file", path.string());
    if (batch_) {
      fail("Cannot read " + path.filename().string());
    }
    return false;
  }
  auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    LOG_XFER_WARN("Cannot send {}: {}", path.string(), ec.message());
    if (batch_) {
      fail("Cannot read " + path.filename().string());
    }
    return false;
  }
  auto hash = util::Sha256File(path);
  if (!hash) {
    LOG_XFER_WARN("Cannot hash {}", path.string());
    if (batch_) {
      fail("Cannot read " + path.filename().string());
    }
    return false;
  }

  reset_transfer();
  role_ = Role::Sending;
  last_error_.clear();
  send_path_ = path;

  message::TransferMetadata meta;
  meta.file_name = path.filename().string();
  meta.file_size = static_cast<int64_t>(size);
  meta.sha256_hash = *hash;
  if (batch_) {
    meta.file_index = ++batch_index_;
    meta.total_files = batch_->total_files;
  }
  metadata_ = meta;

  if (!send(message::make_file_offer(local_id_, meta))) {
    fail("Failed to send file offer");
    return false;
  }
  LOG_XFER_INFO("Offered {} ({} bytes) to peer {}", meta.file_name, meta.file_size, peer_id_);
  set_phase(Phase::Offered);
  return true;
}

void FileTransferSession::on_file_accept() {
  if (role_ != Role::Sending || phase_ != Phase::Offered) {
    LOG_XFER_DEBUG("Ignoring fileAccept from peer {} in phase {}", peer_id_,
                   FileTransferPhaseName(phase_));
    return;
  }
  set_phase(Phase::Accepted);

  send_stream_.open(send_path_, std::ios::binary);
  if (!send_stream_) {
    fail("Cannot open " + send_path_.filename().string());
    return;
  }
  set_phase(Phase::Streaming);
  schedule_send_step();
}

void FileTransferSession::on_file_reject(const message::PeerMessage &msg) {
  if (role_ != Role::Sending || phase_ != Phase::Offered) {
    LOG_XFER_DEBUG("Ignoring fileReject from peer {} in phase {}", peer_id_,
                   FileTransferPhaseName(phase_));
    return;
  }
  message::RejectionPayload rejection;
  if (message::decode_payload(msg, rejection) != message::DecodeError::None) {
    rejection.reason.clear();
  }
  last_error_ = rejection.reason == protocol::reasons::FEATURE_DISABLED
                    ? "Peer has file transfer disabled"
                    : "File transfer was rejected";
  LOG_XFER_INFO("Peer {} rejected {} ({})", peer_id_,
                metadata_ ? metadata_->file_name : std::string("file"),
                rejection.reason.empty() ? "no reason" : rejection.reason);

  pending_files_.clear();
  batch_.reset();
  emit_record(TransferDirection::Sent, false);
  set_phase(Phase::Rejected, rejection.reason);
}

void FileTransferSession::schedule_send_step() {
  auto self = shared_from_this();
  uint64_t gen = generation_;
  boost::asio::post(io_context_, [self, gen]() { self->send_step(gen); });
}

void FileTransferSession::send_step(uint64_t generation) {
  if (generation != generation_ || phase_ != Phase::Streaming) {
    return;
  }

  // Back-pressure: let the transport drain before queueing more
  if (queue_depth_ && queue_depth_() > protocol::FILE_SEND_HIGH_WATER) {
    auto self = shared_from_this();
    backpressure_timer_.expires_after(backpressure_retry());
    backpressure_timer_.async_wait([self, generation](const boost::system::error_code &ec) {
      if (!ec) {
        self->send_step(generation);
      }
    });
    return;
  }

  if (bytes_sent_ >= metadata_->file_size) {
    finish_sending();
    return;
  }

  size_t want = static_cast<size_t>(std::min<int64_t>(
      static_cast<int64_t>(protocol::FILE_CHUNK_SIZE), metadata_->file_size - bytes_sent_));
  std::vector<uint8_t> chunk(want);
  send_stream_.read(reinterpret_cast<char *>(chunk.data()), static_cast<std::streamsize>(want));
  auto got = send_stream_.gcount();
  if (got <= 0) {
    fail("File changed while sending");
    return;
  }
  chunk.resize(static_cast<size_t>(got));

  if (!send(message::make_file_chunk(local_id_, std::move(chunk)))) {
    fail("Failed to send chunk");
    return;
  }
  bytes_sent_ += got;
  emit_progress();
  schedule_send_step();
}

void FileTransferSession::finish_sending() {
  send_stream_.close();
  if (!send(message::make_file_complete(local_id_, metadata_->sha256_hash))) {
    fail("Failed to send completion");
    return;
  }
  LOG_XFER_INFO("Sent {} ({} bytes) to peer {}", metadata_->file_name, metadata_->file_size,
                peer_id_);
  emit_progress();
  emit_record(TransferDirection::Sent, true);
  set_phase(Phase::Complete);

  if (!batch_) {
    return;
  }
  if (!pending_files_.empty()) {
    if (!offer_next_file()) {
      LOG_XFER_WARN("Batch {} to peer {} stopped at file {}", batch_->batch_id, peer_id_,
                    batch_index_ + 1);
    }
    return;
  }
  if (!send(message::make_batch_complete(local_id_, batch_->batch_id))) {
    LOG_XFER_WARN("Failed to send batchComplete to peer {}", peer_id_);
  }
  LOG_XFER_INFO("Batch {} to peer {} complete", batch_->batch_id, peer_id_);
  batch_.reset();
}

// ============================================================================
// Receiving
// ============================================================================

void FileTransferSession::on_file_offer(const message::PeerMessage &msg) {
  message::TransferMetadata meta;
  auto err = message::decode_payload(msg, meta);
  if (err != message::DecodeError::None) {
    LOG_XFER_WARN("Invalid file offer from peer {}: {}", peer_id_,
                  message::DecodeErrorString(err));
    if (!send(message::make_file_reject(local_id_, protocol::reasons::INVALID_OFFER))) {
      LOG_XFER_DEBUG("Failed to send fileReject to peer {}", peer_id_);
    }
    return;
  }

  if (is_active()) {
    LOG_XFER_WARN("Rejecting offer of {} from peer {}: transfer already in progress",
                  meta.file_name, peer_id_);
    if (!send(message::make_file_reject(local_id_, protocol::reasons::BUSY))) {
      LOG_XFER_DEBUG("Failed to send fileReject to peer {}", peer_id_);
    }
    return;
  }

  if (meta.file_size < 0 || meta.sha256_hash.size() != 64 || !util::IsValidHex(meta.sha256_hash)) {
    LOG_XFER_WARN("Rejecting offer of {} from peer {}: bad size or hash", meta.file_name, peer_id_);
    if (!send(message::make_file_reject(local_id_, protocol::reasons::INVALID_OFFER))) {
      LOG_XFER_DEBUG("Failed to send fileReject to peer {}", peer_id_);
    }
    return;
  }

  // Storage check happens before any state is allocated
  uint64_t required = static_cast<uint64_t>(meta.file_size) + protocol::STORAGE_SAFETY_MARGIN;
  uint64_t available = storage_.available_bytes();
  if (available < required) {
    LOG_XFER_WARN("Insufficient storage for {} from peer {}: need {} bytes, available {}",
                  meta.file_name, peer_id_, required, available);
    last_error_ = "Not enough storage space";
    if (!send(message::make_file_reject(local_id_, protocol::reasons::INSUFFICIENT_STORAGE))) {
      LOG_XFER_DEBUG("Failed to send fileReject to peer {}", peer_id_);
    }
    return;
  }

  reset_transfer();
  role_ = Role::Receiving;
  last_error_.clear();
  metadata_ = meta;
  set_phase(Phase::Offered);

  auto dir = storage_.download_directory();
  if (!util::ensure_directory(dir)) {
    fail("Cannot prepare file for receiving");
    return;
  }
  temp_path_ = dir / (".peerlink-" + random_hex(8) + ".part");
  receive_stream_.open(temp_path_, std::ios::binary | std::ios::trunc);
  if (!receive_stream_) {
    fail("Cannot prepare file for receiving");
    return;
  }

  // Consent was given at connection level; offers are accepted automatically
  if (!send(message::make_file_accept(local_id_))) {
    fail("Failed to accept file transfer");
    return;
  }
  LOG_XFER_INFO("Accepted {} ({} bytes) from peer {}", meta.file_name, meta.file_size, peer_id_);
  set_phase(Phase::Accepted);
}

void FileTransferSession::on_file_chunk(const message::PeerMessage &msg) {
  if (role_ != Role::Receiving ||
      (phase_ != Phase::Accepted && phase_ != Phase::Streaming)) {
    LOG_XFER_DEBUG("Ignoring fileChunk from peer {} in phase {}", peer_id_,
                   FileTransferPhaseName(phase_));
    return;
  }
  if (phase_ == Phase::Accepted) {
    set_phase(Phase::Streaming);
  }

  const auto &data = msg.payload();
  if (bytes_received_ + static_cast<int64_t>(data.size()) > metadata_->file_size) {
    fail("Received more data than offered");
    return;
  }
  receive_stream_.write(reinterpret_cast<const char *>(data.data()),
                        static_cast<std::streamsize>(data.size()));
  if (!receive_stream_) {
    fail("Failed to write received data");
    return;
  }
  hasher_.Update(data);
  bytes_received_ += static_cast<int64_t>(data.size());
  emit_progress();
}

void FileTransferSession::on_file_complete(const message::PeerMessage &msg) {
  if (role_ != Role::Receiving ||
      (phase_ != Phase::Accepted && phase_ != Phase::Streaming)) {
    LOG_XFER_DEBUG("Ignoring fileComplete from peer {} in phase {}", peer_id_,
                   FileTransferPhaseName(phase_));
    return;
  }

  message::FileCompletePayload complete;
  auto err = message::decode_payload(msg, complete);
  if (err != message::DecodeError::None) {
    LOG_XFER_WARN("Invalid fileComplete from peer {}: {}", peer_id_,
                  message::DecodeErrorString(err));
  }

  receive_stream_.close();
  std::string computed = hasher_.FinalizeHex();
  bool verified = bytes_received_ == metadata_->file_size && computed == metadata_->sha256_hash &&
                  (err != message::DecodeError::None || complete.hash == computed);

  if (!verified) {
    LOG_XFER_WARN("Hash mismatch for {} from peer {}: expected {}, computed {}",
                  metadata_->file_name, peer_id_, metadata_->sha256_hash, computed);
    emit_record(TransferDirection::Received, false);
    fail("Hash verification failed");
    return;
  }

  auto dest = util::unique_destination(storage_.download_directory(), metadata_->file_name);
  if (!util::move_file(temp_path_, dest)) {
    emit_record(TransferDirection::Received, false);
    fail("Cannot save received file");
    return;
  }
  temp_path_.clear();
  received_files_.push_back(dest);

  LOG_XFER_INFO("Received {} ({} bytes) from peer {} -> {}", metadata_->file_name,
                metadata_->file_size, peer_id_, dest.string());
  emit_progress();
  emit_record(TransferDirection::Received, true);
  set_phase(Phase::Complete);
}

void FileTransferSession::on_batch_start(const message::PeerMessage &msg) {
  message::BatchMetadata batch;
  auto err = message::decode_payload(msg, batch);
  if (err != message::DecodeError::None) {
    LOG_XFER_WARN("Invalid batchStart from peer {}: {}", peer_id_,
                  message::DecodeErrorString(err));
    return;
  }
  LOG_XFER_INFO("Peer {} starting batch {} ({} files)", peer_id_, batch.batch_id,
                batch.total_files);
  batch_ = batch;
  received_files_.clear();
}

void FileTransferSession::on_batch_complete(const message::PeerMessage &msg) {
  message::BatchCompletePayload done;
  auto err = message::decode_payload(msg, done);
  if (err != message::DecodeError::None) {
    LOG_XFER_WARN("Invalid batchComplete from peer {}: {}", peer_id_,
                  message::DecodeErrorString(err));
    return;
  }
  if (!batch_ || batch_->batch_id != done.batch_id) {
    LOG_XFER_DEBUG("batchComplete for unknown batch {} from peer {}", done.batch_id, peer_id_);
    return;
  }
  LOG_XFER_INFO("Batch {} from peer {} complete ({} files received)", done.batch_id, peer_id_,
                received_files_.size());
  batch_.reset();
}

// ============================================================================
// Dispatch and teardown
// ============================================================================

bool FileTransferSession::handle_message(const message::PeerMessage &msg) {
  using message::MessageType;
  switch (msg.type()) {
  case MessageType::FileOffer:
    on_file_offer(msg);
    return true;
  case MessageType::FileAccept:
    on_file_accept();
    return true;
  case MessageType::FileReject:
    on_file_reject(msg);
    return true;
  case MessageType::FileChunk:
    on_file_chunk(msg);
    return true;
  case MessageType::FileComplete:
    on_file_complete(msg);
    return true;
  case MessageType::BatchStart:
    on_batch_start(msg);
    return true;
  case MessageType::BatchComplete:
    on_batch_complete(msg);
    return true;
  default:
    return false;
  }
}

void FileTransferSession::handle_transport_failure() {
  batch_.reset();
  if (!is_active()) {
    return;
  }
  fail("Connection lost during transfer");
}

void FileTransferSession::cancel() {
  batch_.reset();
  if (!is_active()) {
    return;
  }
  fail("Transfer cancelled");
}

} // namespace network
} // namespace peerlink
