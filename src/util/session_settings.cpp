// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/session_settings.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include <nlohmann/json.hpp>

namespace peerlink {
namespace util {

namespace {

using json = nlohmann::json;

// Upper bound for any timeout field (one day)
constexpr uint64_t MAX_TIMEOUT_MS = 24ULL * 60 * 60 * 1000;

bool ReadMilliseconds(const json &root, const char *key,
                      std::chrono::milliseconds &out) {
  auto it = root.find(key);
  if (it == root.end()) {
    return true;
  }
  if (!it->is_number_unsigned()) {
    LOG_WARN("Config: {} must be a non-negative integer, ignoring", key);
    return false;
  }
  const uint64_t value = it->get<uint64_t>();
  if (value > MAX_TIMEOUT_MS) {
    LOG_WARN("Config: {} = {} exceeds {} ms, ignoring", key, value,
             MAX_TIMEOUT_MS);
    return false;
  }
  out = std::chrono::milliseconds(static_cast<int64_t>(value));
  return true;
}

bool ReadLevel(const json &value, const std::string &what, std::string &out) {
  if (!value.is_string() || !IsValidLogLevel(value.get<std::string>())) {
    LOG_WARN("Config: invalid log level for {}, ignoring", what);
    return false;
  }
  out = value.get<std::string>();
  return true;
}

} // namespace

bool IsValidLogLevel(const std::string &level) {
  return level == "trace" || level == "debug" || level == "info" ||
         level == "warn" || level == "error" || level == "critical" ||
         level == "off";
}

bool LoadSessionConfig(const std::filesystem::path &path, SessionSettings &out) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    LOG_DEBUG("No config file found at {}", path.string());
    return false;
  }

  const std::string text = read_file_string(path);
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error &e) {
    LOG_WARN("Failed to parse config file {}: {}", path.string(), e.what());
    return false;
  }

  if (!root.is_object()) {
    LOG_WARN("Config file {} is not a JSON object", path.string());
    return false;
  }

  bool ok = true;
  ok &= ReadMilliseconds(root, "reply_timeout_ms", out.reply_timeout);
  ok &= ReadMilliseconds(root, "activation_timeout_ms", out.activation_timeout);

  if (auto it = root.find("log_level"); it != root.end()) {
    ok &= ReadLevel(*it, "log_level", out.log_level);
  }

  if (auto it = root.find("log_file"); it != root.end()) {
    if (it->is_string()) {
      out.log_file = it->get<std::string>();
    } else {
      LOG_WARN("Config: log_file must be a string, ignoring");
      ok = false;
    }
  }

  if (auto it = root.find("component_levels"); it != root.end()) {
    if (!it->is_object()) {
      LOG_WARN("Config: component_levels must be an object, ignoring");
      ok = false;
    } else {
      for (auto entry = it->begin(); entry != it->end(); ++entry) {
        std::string level;
        if (ReadLevel(entry.value(), "component " + entry.key(), level)) {
          out.component_levels[entry.key()] = level;
        } else {
          ok = false;
        }
      }
    }
  }

  LOG_DEBUG("Loaded config from {} ({})", path.string(),
            ok ? "ok" : "with rejected fields");
  return ok;
}

bool SaveSessionConfig(const std::filesystem::path &path,
                       const SessionSettings &settings) {
  json root;
  root["reply_timeout_ms"] = static_cast<uint64_t>(settings.reply_timeout.count());
  root["activation_timeout_ms"] =
      static_cast<uint64_t>(settings.activation_timeout.count());
  root["log_level"] = settings.log_level;
  root["log_file"] = settings.log_file;
  root["component_levels"] = json::object();
  for (const auto &[component, level] : settings.component_levels) {
    root["component_levels"][component] = level;
  }

  if (!atomic_write_file(path, root.dump(2))) {
    LOG_ERROR("Failed to write config file {}", path.string());
    return false;
  }
  return true;
}

void ApplyLogSettings(const SessionSettings &settings) {
  LogManager::Initialize(settings.log_level, !settings.log_file.empty(),
                         settings.log_file.empty() ? "peerlink.log"
                                                   : settings.log_file);
  // Initialize() is once-only; the level still follows the latest settings
  LogManager::SetLogLevel(settings.log_level);
  for (const auto &[component, level] : settings.component_levels) {
    if (!LogManager::SetComponentLevel(component, level)) {
      LOG_WARN("Unknown log component '{}' in config", component);
    }
  }
}

std::filesystem::path DefaultConfigPath() {
  return get_default_datadir() / "peerlink.json";
}

} // namespace util
} // namespace peerlink
