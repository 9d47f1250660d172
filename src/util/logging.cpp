// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/logging.hpp"
#include "version.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace peerlink {
namespace util {

namespace {

const char *const kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

std::once_flag s_init_flag;

// Guards every access to s_loggers
std::mutex s_loggers_mutex;
std::map<std::string, std::shared_ptr<spdlog::logger>> s_loggers;

std::vector<spdlog::sink_ptr> MakeSinks(bool log_to_file,
                                        const std::string &log_file_path) {
  std::vector<spdlog::sink_ptr> sinks;

  if (log_to_file) {
    namespace fs = std::filesystem;
    try {
      fs::path p = log_file_path.empty() ? fs::path("peerlink.log")
                                         : fs::path(log_file_path);
      if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
        if (ec) {
          std::cerr << "Cannot create log directory " << p.parent_path()
                    << ": " << ec.message() << "\n";
        }
      }
      // 5MB per file, 3 files
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          p.string(), 5 * 1024 * 1024, 3);
      file_sink->set_pattern(kPattern);
      sinks.push_back(file_sink);
      return sinks;
    } catch (const spdlog::spdlog_ex &ex) {
      std::cerr << "Failed to initialize file logger (" << ex.what()
                << "), falling back to console logging\n";
    }
  }

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  console_sink->set_pattern(kPattern);
  sinks.push_back(console_sink);
  return sinks;
}

void InitializeInternal(const std::string &log_level, bool log_to_file,
                        const std::string &log_file_path) {
  try {
    auto sinks = MakeSinks(log_to_file, log_file_path);

    std::lock_guard<std::mutex> lock(s_loggers_mutex);

    for (const auto &component : LogManager::Components()) {
      auto logger = std::make_shared<spdlog::logger>(component, sinks.begin(),
                                                     sinks.end());
      logger->set_level(spdlog::level::from_str(log_level));
      logger->flush_on(spdlog::level::warn);
      spdlog::register_logger(logger);
      s_loggers[component] = logger;
    }

    spdlog::set_default_logger(s_loggers["default"]);

    // Direct logger access (LOG_INFO would re-enter GetLogger and deadlock)
    if (log_level != "off") {
      s_loggers["default"]->info("{}: logging initialized (level: {})",
                                 GetFullVersionString(), log_level);
    }
  } catch (const spdlog::spdlog_ex &ex) {
    std::cerr << "Log initialization failed: " << ex.what() << std::endl;
  }
}

} // namespace

std::vector<std::string> LogManager::Components() {
  return {"default", "session", "codec", "transport", "network"};
}

void LogManager::Initialize(const std::string &log_level, bool log_to_file,
                            const std::string &log_file_path) {
  std::call_once(s_init_flag, InitializeInternal, log_level, log_to_file,
                 log_file_path);
}

void LogManager::Shutdown() {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);
  spdlog::shutdown();
  s_loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::GetLogger(const std::string &name) {
  Initialize();

  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  auto it = s_loggers.find(name);
  if (it != s_loggers.end()) {
    return it->second;
  }

  // Initialization failed or Shutdown() ran: install a silent console logger
  // so the macros never dereference null.
  if (s_loggers.empty()) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    auto logger = std::make_shared<spdlog::logger>("default", console_sink);
    logger->set_level(spdlog::level::off);
    s_loggers["default"] = logger;
    return logger;
  }

  return s_loggers["default"];
}

void LogManager::SetLogLevel(const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return;
  }

  auto log_level = spdlog::level::from_str(level);
  for (auto &[name, logger] : s_loggers) {
    logger->set_level(log_level);
  }

  if (level != "off") {
    s_loggers["default"]->info("Log level changed to: {}", level);
  }
}

bool LogManager::SetComponentLevel(const std::string &component,
                                   const std::string &level) {
  std::lock_guard<std::mutex> lock(s_loggers_mutex);

  if (s_loggers.empty()) {
    return false;
  }

  auto it = s_loggers.find(component);
  if (it == s_loggers.end()) {
    auto def = s_loggers.find("default");
    if (def != s_loggers.end() &&
        def->second->level() != spdlog::level::off) {
      def->second->warn("Unknown log component: {}", component);
    }
    return false;
  }

  it->second->set_level(spdlog::level::from_str(level));
  return true;
}

} // namespace util
} // namespace peerlink
