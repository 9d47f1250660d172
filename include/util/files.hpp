// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace peerlink {
namespace util {

/**
 * Write a text file atomically: temp file, fsync, fsync directory, rename.
 * Readers see either the old file or the new one, never a partial write.
 * Returns true on success.
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

constexpr size_t MAX_CONFIG_FILE_SIZE = 1024 * 1024;

/**
 * Read a whole text file
 * Returns empty string on failure or if the file exceeds
 * MAX_CONFIG_FILE_SIZE
 */
std::string read_file_string(const std::filesystem::path &path);

// Create directory (recursive). True if it exists afterwards.
bool ensure_directory(const std::filesystem::path &dir);

// ~/.peerlink (falls back to ./.peerlink when HOME is unset)
std::filesystem::path get_default_datadir();

} // namespace util
} // namespace peerlink
