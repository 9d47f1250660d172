// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/path_status.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace peerlink {
namespace network {

// Platform collaborators for path monitoring
// - Platform monitor backed by the host OS path API
// - MockPathMonitor / MockNetworkPing: in-memory, for testing (in test/)

/**
 * PathMonitor - source of network path updates
 *
 * The handler may be invoked from any thread, before or after start()
 * returns. No updates are expected after cancel().
 */
class PathMonitor {
public:
  using PathHandler = std::function<void(const NetworkPath &)>;

  virtual ~PathMonitor() = default;

  // Single handler (replaces any previous one)
  virtual void on_path_update(PathHandler handler) = 0;
  virtual void start() = 0;
  virtual void cancel() = 0;
};

using PathMonitorPtr = std::shared_ptr<PathMonitor>;

// Outcome of one reachability ping
struct PingResult {
  std::optional<std::string> error;
  std::chrono::milliseconds round_trip{0};

  bool ok() const { return !error.has_value(); }
};

/**
 * NetworkPing - periodic reachability check run while monitoring
 *
 * should_ping() is asked with the current path status before every ping.
 * The completion may run on any thread, including inline.
 */
class NetworkPing {
public:
  using PingCompletion = std::function<void(const PingResult &)>;

  virtual ~NetworkPing() = default;

  // Period between pings (zero or negative disables pinging)
  virtual std::chrono::milliseconds interval() const = 0;
  virtual bool should_ping(const PathStatus &status) const = 0;
  virtual void ping(PingCompletion completion) = 0;
};

using NetworkPingPtr = std::shared_ptr<NetworkPing>;

} // namespace network
} // namespace peerlink
