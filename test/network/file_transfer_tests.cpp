// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "network/file_transfer_session.hpp"
#include "network/protocol.hpp"
#include "util/files.hpp"
#include "util/sha256.hpp"
#include <boost/asio/post.hpp>
#include <filesystem>
#include <fstream>

using namespace peerlink;
using namespace peerlink::network;
using Phase = FileTransferSession::Phase;
using namespace std::chrono_literals;

namespace {

class FakeStorage : public StorageProvider {
public:
  explicit FakeStorage(std::filesystem::path dir) : dir_(std::move(dir)) {}
  uint64_t available_bytes() const override { return available_; }
  std::filesystem::path download_directory() const override { return dir_; }
  void set_available(uint64_t bytes) { available_ = bytes; }

private:
  std::filesystem::path dir_;
  uint64_t available_ = 1ull << 40;
};

std::vector<uint8_t> Pattern(size_t size) {
  std::vector<uint8_t> data(size);
  for (size_t i = 0; i < size; ++i) {
    data[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
  }
  return data;
}

void WriteFile(const std::filesystem::path &path, const std::vector<uint8_t> &data) {
  std::ofstream out(path, std::ios::binary);
  out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
}

std::vector<uint8_t> ReadFile(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

size_t CountEntries(const std::filesystem::path &dir) {
  size_t n = 0;
  for (const auto &entry : std::filesystem::directory_iterator(dir)) {
    (void)entry;
    ++n;
  }
  return n;
}

// Two sessions wired back to back through the io_context
struct TransferFixture {
  boost::asio::io_context io;
  std::filesystem::path root;
  FakeStorage sender_storage;
  FakeStorage receiver_storage;
  FileTransferSessionPtr sender;
  FileTransferSessionPtr receiver;
  std::vector<message::PeerMessage> to_receiver;
  std::vector<TransferRecord> sender_records;
  std::vector<TransferRecord> receiver_records;
  std::vector<double> receiver_progress;
  size_t queue_depth = 0;
  bool link_up = true;

  TransferFixture()
      : root(std::filesystem::temp_directory_path() / "peerlink_transfer_test"),
        sender_storage(root / "sender"), receiver_storage(root / "inbox") {
    std::filesystem::remove_all(root);
    util::ensure_directory(root / "outbox");
    util::ensure_directory(root / "inbox");

    sender = FileTransferSession::create(
        io, "receiver", "sender", sender_storage,
        [this](const message::PeerMessage &m) {
          if (!link_up) return false;
          to_receiver.push_back(m);
          boost::asio::post(io, [this, m]() { receiver->handle_message(m); });
          return true;
        },
        [this]() { return queue_depth; });
    receiver = FileTransferSession::create(
        io, "sender", "receiver", receiver_storage,
        [this](const message::PeerMessage &m) {
          if (!link_up) return false;
          boost::asio::post(io, [this, m]() { sender->handle_message(m); });
          return true;
        },
        []() { return size_t{0}; });

    sender->set_record_handler([this](const TransferRecord &r) { sender_records.push_back(r); });
    receiver->set_record_handler([this](const TransferRecord &r) { receiver_records.push_back(r); });
    receiver->set_progress_handler([this](double p) { receiver_progress.push_back(p); });
  }

  ~TransferFixture() {
    sender->cancel();
    receiver->cancel();
    std::filesystem::remove_all(root);
  }

  std::filesystem::path make_file(const std::string &name, size_t size) {
    auto path = root / "outbox" / name;
    WriteFile(path, Pattern(size));
    return path;
  }

  void run() {
    io.restart();
    io.run_for(2s);
  }
};

} // namespace

TEST_CASE("File transfer streams and verifies a file", "[network][transfer]") {
  TransferFixture f;
  const size_t size = 2 * protocol::FILE_CHUNK_SIZE + 1234;
  auto path = f.make_file("photo.jpg", size);

  REQUIRE(f.sender->send_file(path));
  REQUIRE(f.sender->phase() == Phase::Offered);
  REQUIRE(f.sender->role() == FileTransferSession::Role::Sending);
  REQUIRE(f.sender->metadata()->sha256_hash == *util::Sha256File(path));

  // A second offer while busy is refused
  REQUIRE_FALSE(f.sender->send_file(path));

  f.run();

  REQUIRE(f.sender->phase() == Phase::Complete);
  REQUIRE(f.receiver->phase() == Phase::Complete);
  REQUIRE(f.receiver->bytes_received() == static_cast<int64_t>(size));

  size_t chunks = 0;
  for (const auto &m : f.to_receiver) {
    if (m.type() == message::MessageType::FileChunk) {
      ++chunks;
      REQUIRE(m.payload().size() <= protocol::FILE_CHUNK_SIZE);
    }
  }
  REQUIRE(chunks == 3);

  REQUIRE(f.receiver->received_files().size() == 1);
  auto received = f.receiver->received_files()[0];
  REQUIRE(received == f.root / "inbox" / "photo.jpg");
  REQUIRE(ReadFile(received) == Pattern(size));
  // Only the final file remains, no .part leftovers
  REQUIRE(CountEntries(f.root / "inbox") == 1);

  REQUIRE(f.sender_records.size() == 1);
  REQUIRE(f.sender_records[0].direction == TransferDirection::Sent);
  REQUIRE(f.sender_records[0].success);
  REQUIRE(f.receiver_records.size() == 1);
  REQUIRE(f.receiver_records[0].direction == TransferDirection::Received);
  REQUIRE(f.receiver_records[0].file_size == static_cast<int64_t>(size));
  REQUIRE(f.receiver_progress.back() == 1.0);

  SECTION("Same name again lands beside the first copy") {
    REQUIRE(f.sender->send_file(path));
    f.run();
    REQUIRE(f.receiver->phase() == Phase::Complete);
    REQUIRE(f.receiver->received_files().back() == f.root / "inbox" / "photo (1).jpg");
  }
}

TEST_CASE("File transfer rejects offers that do not fit", "[network][transfer]") {
  TransferFixture f;
  auto path = f.make_file("big.bin", 4096);
  // File fits, the safety margin does not
  f.receiver_storage.set_available(4096 + protocol::STORAGE_SAFETY_MARGIN - 1);

  REQUIRE(f.sender->send_file(path));
  f.run();

  REQUIRE(f.sender->phase() == Phase::Rejected);
  REQUIRE(f.sender->last_error() == "File transfer was rejected");
  REQUIRE(f.sender_records.size() == 1);
  REQUIRE_FALSE(f.sender_records[0].success);

  // Receiver allocated nothing
  REQUIRE(f.receiver->phase() == Phase::Idle);
  REQUIRE(f.receiver->last_error() == "Not enough storage space");
  REQUIRE(CountEntries(f.root / "inbox") == 0);
}

TEST_CASE("File transfer fails on hash mismatch", "[network][transfer]") {
  TransferFixture f;

  message::TransferMetadata meta;
  meta.file_name = "doc.txt";
  meta.file_size = 3;
  meta.sha256_hash = std::string(64, '0');

  std::vector<Phase> phases;
  f.receiver->set_phase_handler([&](Phase p, const std::string &) { phases.push_back(p); });

  REQUIRE(f.receiver->handle_message(message::make_file_offer("sender", meta)));
  REQUIRE(f.receiver->phase() == Phase::Accepted);
  REQUIRE(f.receiver->handle_message(message::make_file_chunk("sender", {'a', 'b', 'c'})));
  REQUIRE(f.receiver->phase() == Phase::Streaming);
  REQUIRE(f.receiver->handle_message(message::make_file_complete("sender", meta.sha256_hash)));

  REQUIRE(f.receiver->phase() == Phase::Failed);
  REQUIRE(f.receiver->last_error() == "Hash verification failed");
  REQUIRE(f.receiver_records.size() == 1);
  REQUIRE_FALSE(f.receiver_records[0].success);
  REQUIRE(CountEntries(f.root / "inbox") == 0);
  REQUIRE(phases == std::vector<Phase>{Phase::Offered, Phase::Accepted, Phase::Streaming,
                                       Phase::Failed});
}

TEST_CASE("File transfer rejects oversized streams", "[network][transfer]") {
  TransferFixture f;
  message::TransferMetadata meta;
  meta.file_name = "small.txt";
  meta.file_size = 2;
  meta.sha256_hash = std::string(64, '0');

  f.receiver->handle_message(message::make_file_offer("sender", meta));
  f.receiver->handle_message(message::make_file_chunk("sender", {1, 2, 3}));
  REQUIRE(f.receiver->phase() == Phase::Failed);
  REQUIRE(CountEntries(f.root / "inbox") == 0);
}

TEST_CASE("File transfer batch", "[network][transfer]") {
  TransferFixture f;
  auto a = f.make_file("a.txt", 100);
  auto b = f.make_file("b.txt", protocol::FILE_CHUNK_SIZE + 1);

  REQUIRE(f.sender->send_files({a, b}));
  REQUIRE(f.sender->batch().has_value());
  REQUIRE(f.sender->batch()->total_files == 2);
  f.run();

  REQUIRE(f.sender->phase() == Phase::Complete);
  REQUIRE_FALSE(f.sender->batch().has_value());
  REQUIRE(f.receiver->received_files().size() == 2);
  REQUIRE(f.sender_records.size() == 2);
  REQUIRE(f.receiver_records.size() == 2);

  REQUIRE(f.to_receiver.front().type() == message::MessageType::BatchStart);
  REQUIRE(f.to_receiver.back().type() == message::MessageType::BatchComplete);

  message::TransferMetadata second;
  for (const auto &m : f.to_receiver) {
    if (m.type() == message::MessageType::FileOffer) {
      REQUIRE(message::decode_payload(m, second) == message::DecodeError::None);
    }
  }
  REQUIRE(second.file_index == 2);
  REQUIRE(second.total_files == 2);
}

TEST_CASE("File transfer pauses under back-pressure and fails on link loss",
          "[network][transfer]") {
  FileTransferSession::SetBackpressureRetryForTest(5ms);
  TransferFixture f;
  auto path = f.make_file("video.mp4", 3 * protocol::FILE_CHUNK_SIZE);
  f.queue_depth = protocol::FILE_SEND_HIGH_WATER + 1;

  REQUIRE(f.sender->send_file(path));
  f.io.restart();
  f.io.run_for(100ms);

  REQUIRE(f.sender->phase() == Phase::Streaming);
  REQUIRE(f.sender->bytes_sent() == 0);

  f.sender->handle_transport_failure();
  REQUIRE(f.sender->phase() == Phase::Failed);
  REQUIRE(f.sender->last_error() == "Connection lost during transfer");

  f.receiver->handle_transport_failure();
  REQUIRE(f.receiver->phase() == Phase::Failed);
  REQUIRE(CountEntries(f.root / "inbox") == 0);

  FileTransferSession::ResetBackpressureRetryForTest();
}

TEST_CASE("File transfer ignores out-of-phase messages", "[network][transfer]") {
  TransferFixture f;
  REQUIRE(f.sender->handle_message(message::make_file_accept("receiver")));
  REQUIRE(f.sender->phase() == Phase::Idle);
  REQUIRE(f.receiver->handle_message(message::make_file_chunk("sender", {1})));
  REQUIRE(f.receiver->phase() == Phase::Idle);
  REQUIRE_FALSE(f.receiver->handle_message(message::make_ping("sender")));
}

TEST_CASE("File transfer rejects malformed offers", "[network][transfer]") {
  TransferFixture f;
  message::TransferMetadata meta;
  meta.file_name = "x.bin";
  meta.file_size = 10;
  meta.sha256_hash = "not-a-hash";

  REQUIRE(f.receiver->handle_message(message::make_file_offer("sender", meta)));
  REQUIRE(f.receiver->phase() == Phase::Idle);
  REQUIRE(CountEntries(f.root / "inbox") == 0);

  meta.sha256_hash = std::string(64, 'a');
  meta.file_size = -1;
  REQUIRE(f.receiver->handle_message(message::make_file_offer("sender", meta)));
  REQUIRE(f.receiver->phase() == Phase::Idle);
}
