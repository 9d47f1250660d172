// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/path_monitor.hpp"
#include "network/path_status.hpp"
#include "session/event_broadcaster.hpp"
#include <boost/asio.hpp>
#include <cstdint>
#include <memory>
#include <mutex>

namespace peerlink {
namespace network {

using session::EventStream;
using session::Subscription;

/**
 * NetworkMonitor - host network path status as level signals
 *
 * - Path updates from the PathMonitor are posted to a strand and applied
 *   there; status, expensive and constrained are each published only when
 *   they change (initial state: unknown, false, false)
 * - With a NetworkPing, a steady_timer pings immediately on Start() and
 *   then every interval(), skipping rounds where should_ping() declines
 * - Start() and Stop() are idempotent; a stopped monitor may be restarted
 *
 * The io_context is driven by the caller (a SessionController's
 * io_context() works). Destroy the monitor on the thread that runs it, or
 * after that io_context has stopped.
 */
class NetworkMonitor {
public:
  NetworkMonitor(boost::asio::io_context &io_context, PathMonitorPtr monitor,
                 NetworkPingPtr ping = nullptr);
  ~NetworkMonitor();

  // Non-copyable
  NetworkMonitor(const NetworkMonitor &) = delete;
  NetworkMonitor &operator=(const NetworkMonitor &) = delete;

  void Start();
  void Stop();
  bool IsRunning() const;

  // Latest applied path
  NetworkPath Current() const;

  // === Level signals (current value replayed on subscribe) ===

  [[nodiscard]] Subscription
  SubscribePathStatus(std::function<void(const PathStatus &)> callback) {
    return path_status_.Subscribe(std::move(callback));
  }
  [[nodiscard]] Subscription
  SubscribeExpensive(std::function<void(const bool &)> callback) {
    return expensive_.Subscribe(std::move(callback));
  }
  [[nodiscard]] Subscription
  SubscribeConstrained(std::function<void(const bool &)> callback) {
    return constrained_.Subscribe(std::move(callback));
  }

  std::shared_ptr<EventStream<PathStatus>> PathStatusStream() {
    return path_status_.Stream();
  }
  std::shared_ptr<EventStream<bool>> ExpensiveStream() {
    return expensive_.Stream();
  }
  std::shared_ptr<EventStream<bool>> ConstrainedStream() {
    return constrained_.Stream();
  }

  // === Edge signal ===

  [[nodiscard]] Subscription
  SubscribePingResults(std::function<void(const PingResult &)> callback) {
    return ping_results_.Subscribe(std::move(callback));
  }
  std::shared_ptr<EventStream<PingResult>> PingResultStream() {
    return ping_results_.Stream();
  }

private:
  class Gate;

  // Strand-only
  void HandlePathUpdate(uint64_t generation, const NetworkPath &path);
  void PerformPing(uint64_t generation);
  void SchedulePing(uint64_t generation);
  void HandlePingResult(uint64_t generation, const PingResult &result);

  bool IsCurrent(uint64_t generation) const;

  PathMonitorPtr monitor_;
  NetworkPingPtr ping_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::shared_ptr<Gate> gate_;
  std::unique_ptr<boost::asio::steady_timer> ping_timer_;

  // Guards running_, generation_ and path_
  mutable std::mutex mutex_;
  bool running_{false};
  uint64_t generation_{0}; // bumped by every Start() and Stop()
  NetworkPath path_;

  session::EventBroadcaster<PathStatus> path_status_;
  session::EventBroadcaster<bool> expensive_;
  session::EventBroadcaster<bool> constrained_;
  session::EventBroadcaster<PingResult> ping_results_;
};

} // namespace network
} // namespace peerlink
