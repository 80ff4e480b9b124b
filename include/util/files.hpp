// Copyright (c) 2025 The PeerLink Developers
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace peerlink {
namespace util {

/**
 * File helpers for the identity store and received files
 *
 * atomic_write_file pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file
 * 3. fsync() the directory
 * 4. Atomic rename over original file
 */

/**
 * Write string to file atomically
 * @param mode File permissions (0600 for the identity file)
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns std::nullopt on failure or if the file exceeds 1 MB
 */
std::optional<std::string> read_small_file(const std::filesystem::path &path);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

/**
 * Free bytes available to unprivileged users on the filesystem holding dir.
 * Returns 0 if the query fails.
 */
uint64_t available_space(const std::filesystem::path &dir);

/**
 * Pick a path inside dir for file_name that does not exist yet.
 * "photo.jpg" becomes "photo (1).jpg", "photo (2).jpg", ... on collision.
 * Any directory components in file_name are stripped.
 */
std::filesystem::path unique_destination(const std::filesystem::path &dir,
                                         const std::string &file_name);

/**
 * Move a finished file into place (rename, falling back to copy+remove
 * across filesystems). Returns true on success.
 */
bool move_file(const std::filesystem::path &from, const std::filesystem::path &to);

/**
 * Get default data directory
 * Returns ~/.peerlink on Unix
 */
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace peerlink
