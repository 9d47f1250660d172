// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <string>

namespace peerlink {
namespace util {

/**
 * SessionSettings - file-backed configuration
 *
 * JSON layout (all keys optional, unknown keys ignored):
 *   {
 *     "reply_timeout_ms": 10000,
 *     "activation_timeout_ms": 5000,
 *     "log_level": "info",
 *     "log_file": "",                 // empty = console
 *     "component_levels": { "codec": "debug" }
 *   }
 */
struct SessionSettings {
  std::chrono::milliseconds reply_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds activation_timeout{std::chrono::seconds(5)};
  std::string log_level{"info"};
  std::string log_file;
  std::map<std::string, std::string> component_levels;
};

// True for trace, debug, info, warn, error, critical, off
bool IsValidLogLevel(const std::string &level);

/**
 * Load settings from a JSON file into out
 *
 * Fields that are missing keep their current value in out. A field with a
 * wrong type or value is skipped with a warning. Timeouts above one day
 * (86400000 ms) are rejected.
 *
 * @return false if the file is missing, unparsable, or any field was
 *         rejected
 */
bool LoadSessionConfig(const std::filesystem::path &path, SessionSettings &out);

// Write settings as JSON (atomic). Returns false on I/O failure.
bool SaveSessionConfig(const std::filesystem::path &path,
                       const SessionSettings &settings);

// Initialize LogManager and apply per-component levels
void ApplyLogSettings(const SessionSettings &settings);

// <datadir>/peerlink.json
std::filesystem::path DefaultConfigPath();

} // namespace util
} // namespace peerlink
