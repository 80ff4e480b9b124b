// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#include "util/files.hpp"
#include <cstdio>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <random>
#include <sstream>
#include <unistd.h>

namespace peerlink {
namespace util {

namespace {

// Sync directory so the rename is durable
bool sync_directory(const std::filesystem::path &dir) {
#if defined(__APPLE__)
  // macOS doesn't have O_DIRECTORY flag
  int fd = open(dir.c_str(), O_RDONLY);
#else
  int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);
#endif
  if (fd < 0)
    return false;
  bool result = fsync(fd) == 0;
  close(fd);
  return result;
}

std::string random_suffix() {
  static thread_local std::mt19937 gen(std::random_device{}());
  static thread_local std::uniform_int_distribution<> dis(0, 0xFFFF);
  char buf[8];
  snprintf(buf, sizeof(buf), "%04x", dis(gen));
  return std::string(buf);
}

constexpr std::uintmax_t MAX_SMALL_FILE_SIZE = 1024 * 1024;

} // anonymous namespace

bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode) {
  auto parent = path.parent_path();
  if (!parent.empty() && !ensure_directory(parent)) {
    return false;
  }

  auto temp_path = path;
  temp_path += ".tmp." + random_suffix();

  int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
  if (fd < 0) {
    return false;
  }

  // Handle partial writes
  size_t total = 0;
  while (total < data.size()) {
    ssize_t n = write(fd, data.data() + total, data.size() - total);
    if (n <= 0) {
      close(fd);
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      return false;
    }
    total += static_cast<size_t>(n);
  }

  if (fsync(fd) != 0) {
    close(fd);
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    return false;
  }
  close(fd);

  if (!parent.empty() && !sync_directory(parent)) {
    std::error_code ec;
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return false;
  }

  return true;
}

std::optional<std::string> read_small_file(const std::filesystem::path &path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if (ec || size > MAX_SMALL_FILE_SIZE) {
    return std::nullopt;
  }

  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return ss.str();
}

bool ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  return !ec || std::filesystem::exists(dir);
}

uint64_t available_space(const std::filesystem::path &dir) {
  std::error_code ec;
  auto info = std::filesystem::space(dir, ec);
  if (ec) {
    return 0;
  }
  return static_cast<uint64_t>(info.available);
}

std::filesystem::path unique_destination(const std::filesystem::path &dir,
                                         const std::string &file_name) {
  // Never let a remote name escape the target directory
  std::filesystem::path name = std::filesystem::path(file_name).filename();
  if (name.empty() || name == "." || name == "..") {
    name = "received";
  }

  auto candidate = dir / name;
  std::error_code ec;
  if (!std::filesystem::exists(candidate, ec)) {
    return candidate;
  }

  const std::string stem = name.stem().string();
  const std::string ext = name.extension().string();
  for (int i = 1; i < 10000; ++i) {
    candidate = dir / (stem + " (" + std::to_string(i) + ")" + ext);
    if (!std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
  return dir / (stem + "." + random_suffix() + ext);
}

bool move_file(const std::filesystem::path &from, const std::filesystem::path &to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (!ec) {
    return true;
  }

  // EXDEV: temp dir on another filesystem
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    return false;
  }
  std::filesystem::remove(from, ec);
  return true;
}

std::filesystem::path get_default_datadir() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::filesystem::path(home) / ".peerlink";
  }

  // Fallback to current directory
  return std::filesystem::current_path() / ".peerlink";
}

} // namespace util
} // namespace peerlink
