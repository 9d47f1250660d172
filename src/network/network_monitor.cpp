// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/network_monitor.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace peerlink {
namespace network {

// ============================================================================
// Gate - posts onto the strand while the monitor is alive
// ============================================================================

class NetworkMonitor::Gate : public std::enable_shared_from_this<Gate> {
public:
  explicit Gate(NetworkMonitor *owner) : owner_(owner) {}

  template <typename Fn> void Post(Fn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!owner_) {
      return;
    }
    boost::asio::post(owner_->strand_,
                      [self = shared_from_this(), fn = std::move(fn)]() mutable {
                        if (NetworkMonitor *owner = self->owner()) {
                          fn(*owner);
                        }
                      });
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    owner_ = nullptr;
  }

  NetworkMonitor *owner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_;
  }

private:
  mutable std::mutex mutex_;
  NetworkMonitor *owner_;
};

// ============================================================================
// NetworkMonitor
// ============================================================================

NetworkMonitor::NetworkMonitor(boost::asio::io_context &io_context,
                               PathMonitorPtr monitor, NetworkPingPtr ping)
    : monitor_(std::move(monitor)), ping_(std::move(ping)),
      strand_(io_context.get_executor()),
      ping_timer_(std::make_unique<boost::asio::steady_timer>(io_context)),
      path_status_("path-status", session::SignalMode::Level),
      expensive_("path-expensive", session::SignalMode::Level),
      constrained_("path-constrained", session::SignalMode::Level),
      ping_results_("ping-results") {
  if (!monitor_) {
    throw std::invalid_argument("NetworkMonitor requires a PathMonitor");
  }

  path_status_.Notify(path_.status);
  expensive_.Notify(path_.is_expensive);
  constrained_.Notify(path_.is_constrained);

  gate_ = std::make_shared<Gate>(this);
}

NetworkMonitor::~NetworkMonitor() {
  gate_->Close();

  bool was_running;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_running = running_;
    running_ = false;
    ++generation_;
  }
  if (was_running) {
    monitor_->on_path_update(nullptr);
    monitor_->cancel();
  }
}

void NetworkMonitor::Start() {
  uint64_t generation;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
      return;
    }
    running_ = true;
    generation = ++generation_;
  }

  LOG_NETWORK_INFO("Network monitor started (ping: {})", ping_ ? "yes" : "no");

  auto gate = gate_;
  monitor_->on_path_update([gate, generation](const NetworkPath &path) {
    gate->Post([generation, path](NetworkMonitor &m) {
      m.HandlePathUpdate(generation, path);
    });
  });
  monitor_->start();

  if (ping_) {
    gate_->Post([generation](NetworkMonitor &m) {
      m.PerformPing(generation);
      m.SchedulePing(generation);
    });
  }
}

void NetworkMonitor::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    ++generation_;
  }

  monitor_->cancel();
  gate_->Post([](NetworkMonitor &m) { m.ping_timer_->cancel(); });

  LOG_NETWORK_INFO("Network monitor stopped");
}

bool NetworkMonitor::IsRunning() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

NetworkPath NetworkMonitor::Current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return path_;
}

bool NetworkMonitor::IsCurrent(uint64_t generation) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_ && generation == generation_;
}

void NetworkMonitor::HandlePathUpdate(uint64_t generation,
                                      const NetworkPath &path) {
  NetworkPath previous;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || generation != generation_) {
      return;
    }
    previous = path_;
    path_ = path;
  }

  if (path.status != previous.status) {
    LOG_NETWORK_DEBUG("Path status {} -> {}", previous.status.ToString(),
                      path.status.ToString());
    path_status_.Notify(path.status);
  }
  if (path.is_expensive != previous.is_expensive) {
    expensive_.Notify(path.is_expensive);
  }
  if (path.is_constrained != previous.is_constrained) {
    constrained_.Notify(path.is_constrained);
  }
}

void NetworkMonitor::PerformPing(uint64_t generation) {
  if (!IsCurrent(generation) || ping_->interval().count() <= 0) {
    return;
  }

  const PathStatus status = Current().status;
  if (!ping_->should_ping(status)) {
    LOG_NETWORK_TRACE("Ping skipped (path {})", status.ToString());
    return;
  }

  auto gate = gate_;
  try {
    ping_->ping([gate, generation](const PingResult &result) {
      gate->Post([generation, result](NetworkMonitor &m) {
        m.HandlePingResult(generation, result);
      });
    });
  } catch (const std::exception &e) {
    LOG_NETWORK_WARN("Ping failed to start: {}", e.what());
    PingResult result;
    result.error = e.what();
    HandlePingResult(generation, result);
  }
}

void NetworkMonitor::SchedulePing(uint64_t generation) {
  const auto interval = ping_->interval();
  if (interval.count() <= 0 || !IsCurrent(generation)) {
    return;
  }

  ping_timer_->expires_after(interval);
  ping_timer_->async_wait(boost::asio::bind_executor(
      strand_, [gate = gate_, generation](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (NetworkMonitor *owner = gate->owner()) {
          owner->PerformPing(generation);
          owner->SchedulePing(generation);
        }
      }));
}

void NetworkMonitor::HandlePingResult(uint64_t generation,
                                      const PingResult &result) {
  if (!IsCurrent(generation)) {
    return;
  }
  if (!result.ok()) {
    LOG_NETWORK_DEBUG("Ping failed: {}", *result.error);
  }
  ping_results_.Notify(result);
}

} // namespace network
} // namespace peerlink
