// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "util/logging.hpp"
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace peerlink {
namespace session {

/**
 * One-to-many event distribution
 *
 * Design:
 * - Callback subscribers get an RAII Subscription; explicit cancel
 * - Stream subscribers get an EventStream held weakly by the broadcaster;
 *   dropping the last reference or calling Close() cancels
 * - Notify snapshots subscribers under the registry lock, releases it, then
 *   delivers; subscribing or cancelling from inside a callback is allowed
 * - Dead streams are pruned on every Notify and every subscribe
 *
 * Signal modes:
 * - Edge: every event delivered once, never replayed; streams buffer
 *   without bound
 * - Level: the latest value is replayed to each new subscriber; streams
 *   coalesce to the latest value; a subscriber never goes back to an
 *   older value
 *
 * Callbacks run on the notifying thread and must not block. A callback
 * that throws is logged and skipped; other subscribers still receive the
 * event. Once Unsubscribe() returns, the callback is not invoked again
 * (Unsubscribe waits for an in-progress delivery on another thread).
 */
enum class SignalMode { Edge, Level };

namespace detail {
class SubscriptionTarget {
public:
  virtual ~SubscriptionTarget() = default;
  virtual void Unsubscribe(size_t id) = 0;
};
} // namespace detail

/**
 * Subscription handle - RAII wrapper
 * Automatically unsubscribes when destroyed. Safe to outlive the
 * broadcaster.
 */
class Subscription {
public:
  Subscription() = default;
  ~Subscription();

  // Movable but not copyable
  Subscription(Subscription &&other) noexcept;
  Subscription &operator=(Subscription &&other) noexcept;
  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  // Unsubscribe explicitly
  void Unsubscribe();

  bool IsActive() const { return active_; }

private:
  template <typename T> friend class EventBroadcaster;
  Subscription(std::weak_ptr<detail::SubscriptionTarget> owner, size_t id);

  std::weak_ptr<detail::SubscriptionTarget> owner_;
  size_t id_{0};
  bool active_{false};
};

template <typename T> class EventBroadcaster;

/**
 * EventStream - pull side of a broadcaster
 *
 * Next() suspends the calling thread until an event arrives, the stream is
 * closed, or the broadcaster goes away (buffered events are drained first
 * in that case).
 */
template <typename T> class EventStream {
public:
  explicit EventStream(SignalMode mode) : mode_(mode) {}

  EventStream(const EventStream &) = delete;
  EventStream &operator=(const EventStream &) = delete;

  // Block until the next event; nullopt once closed or finished and drained
  std::optional<T> Next() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || finished_ || !queue_.empty(); });
    return PopLocked();
  }

  // As Next(), but gives up after timeout
  template <typename Rep, typename Period>
  std::optional<T> NextFor(const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout,
                 [this] { return closed_ || finished_ || !queue_.empty(); });
    return PopLocked();
  }

  std::optional<T> TryNext() {
    std::lock_guard<std::mutex> lock(mutex_);
    return PopLocked();
  }

  // Cancel: discards buffered events and wakes any waiter
  void Close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
      queue_.clear();
    }
    cv_.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  // True once the broadcaster is gone and nothing is buffered
  bool IsFinished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ || (finished_ && queue_.empty());
  }

  size_t Pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
  }

  SignalMode mode() const { return mode_; }

private:
  template <typename U> friend class EventBroadcaster;

  // version is 0 for edge events
  void Deliver(const T &value, uint64_t version) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || finished_) {
        return;
      }
      if (mode_ == SignalMode::Level) {
        if (version <= last_version_) {
          return;
        }
        last_version_ = version;
        queue_.clear();
      }
      queue_.push_back(value);
    }
    cv_.notify_one();
  }

  void Finish() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      finished_ = true;
    }
    cv_.notify_all();
  }

  std::optional<T> PopLocked() {
    if (closed_ || queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  const SignalMode mode_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> queue_;
  uint64_t last_version_{0};
  bool closed_{false};
  bool finished_{false};
};

template <typename T> class EventBroadcaster {
public:
  using Callback = std::function<void(const T &)>;
  using StreamPtr = std::shared_ptr<EventStream<T>>;

  explicit EventBroadcaster(std::string name,
                            SignalMode mode = SignalMode::Edge)
      : core_(std::make_shared<Core>(std::move(name), mode)) {}

  // Finishes every live stream
  ~EventBroadcaster() {
    std::vector<StreamPtr> streams;
    {
      std::lock_guard<std::mutex> lock(core_->mutex);
      streams = core_->LiveStreamsLocked();
      core_->streams.clear();
    }
    for (auto &stream : streams) {
      stream->Finish();
    }
  }

  // Non-copyable
  EventBroadcaster(const EventBroadcaster &) = delete;
  EventBroadcaster &operator=(const EventBroadcaster &) = delete;

  /**
   * Register a callback. Level broadcasters deliver the current value
   * before returning.
   * Empty callbacks are rejected (inactive handle returned).
   */
  [[nodiscard]] Subscription Subscribe(Callback callback) {
    if (!callback) {
      LOG_SESSION_WARN("{}: rejected empty subscriber", core_->name);
      return Subscription();
    }

    auto entry = std::make_shared<Entry>();
    entry->callback = std::move(callback);

    std::optional<T> replay;
    uint64_t version = 0;
    size_t id;
    {
      std::lock_guard<std::mutex> lock(core_->mutex);
      core_->PruneLocked();
      id = core_->next_id++;
      entry->id = id;
      core_->entries.push_back(entry);
      if (core_->mode == SignalMode::Level && core_->current) {
        replay = core_->current;
        version = core_->version;
      }
    }

    if (replay) {
      core_->DeliverTo(*entry, *replay, version);
    }
    return Subscription(core_, id);
  }

  // Open a stream. Level broadcasters seed it with the current value.
  StreamPtr Stream() {
    auto stream = std::make_shared<EventStream<T>>(core_->mode);

    std::optional<T> replay;
    uint64_t version = 0;
    {
      std::lock_guard<std::mutex> lock(core_->mutex);
      core_->PruneLocked();
      core_->streams.push_back(stream);
      if (core_->mode == SignalMode::Level && core_->current) {
        replay = core_->current;
        version = core_->version;
      }
    }

    if (replay) {
      stream->Deliver(*replay, version);
    }
    return stream;
  }

  void Notify(const T &event) {
    std::vector<std::shared_ptr<Entry>> entries;
    std::vector<StreamPtr> streams;
    uint64_t version;
    {
      std::lock_guard<std::mutex> lock(core_->mutex);
      version = ++core_->version;
      if (core_->mode == SignalMode::Level) {
        core_->current = event;
      }
      core_->PruneLocked();
      entries = core_->entries;
      streams = core_->LiveStreamsLocked();
    }

    for (auto &entry : entries) {
      core_->DeliverTo(*entry, event, version);
    }
    const uint64_t stream_version =
        core_->mode == SignalMode::Level ? version : 0;
    for (auto &stream : streams) {
      stream->Deliver(event, stream_version);
    }
  }

  // Latest value (level broadcasters only)
  std::optional<T> Current() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->current;
  }

  // Callbacks plus open streams
  size_t SubscriberCount() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    size_t count = core_->entries.size();
    for (const auto &weak : core_->streams) {
      auto stream = weak.lock();
      if (stream && !stream->IsClosed()) {
        ++count;
      }
    }
    return count;
  }

  size_t CallbackCount() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->entries.size();
  }

  SignalMode mode() const { return core_->mode; }
  const std::string &name() const { return core_->name; }

private:
  struct Entry {
    size_t id{0};
    Callback callback;
    std::recursive_mutex delivery_mutex;
    bool active{true};
    uint64_t last_version{0};
  };

  struct Core : public detail::SubscriptionTarget {
    Core(std::string n, SignalMode m) : name(std::move(n)), mode(m) {}

    void Unsubscribe(size_t id) override {
      std::shared_ptr<Entry> entry;
      {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = std::find_if(
            entries.begin(), entries.end(),
            [id](const std::shared_ptr<Entry> &e) { return e->id == id; });
        if (it != entries.end()) {
          entry = *it;
          entries.erase(it);
        }
      }
      if (entry) {
        std::lock_guard<std::recursive_mutex> lock(entry->delivery_mutex);
        entry->active = false;
      }
    }

    void DeliverTo(Entry &entry, const T &event, uint64_t version) {
      std::lock_guard<std::recursive_mutex> lock(entry.delivery_mutex);
      if (!entry.active) {
        return;
      }
      if (mode == SignalMode::Level) {
        if (version <= entry.last_version) {
          return;
        }
        entry.last_version = version;
      }
      try {
        entry.callback(event);
      } catch (const std::exception &e) {
        LOG_SESSION_ERROR("{}: subscriber {} threw: {}", name, entry.id,
                          e.what());
      }
    }

    // Drop streams that were released or closed
    void PruneLocked() {
      streams.erase(std::remove_if(streams.begin(), streams.end(),
                                   [](const std::weak_ptr<EventStream<T>> &w) {
                                     auto s = w.lock();
                                     return !s || s->IsClosed();
                                   }),
                    streams.end());
    }

    std::vector<StreamPtr> LiveStreamsLocked() const {
      std::vector<StreamPtr> live;
      live.reserve(streams.size());
      for (const auto &weak : streams) {
        if (auto stream = weak.lock()) {
          live.push_back(std::move(stream));
        }
      }
      return live;
    }

    const std::string name;
    const SignalMode mode;

    mutable std::mutex mutex;
    std::vector<std::shared_ptr<Entry>> entries;
    std::vector<std::weak_ptr<EventStream<T>>> streams;
    std::optional<T> current;
    uint64_t version{0};
    size_t next_id{1}; // 0 reserved for invalid
  };

  std::shared_ptr<Core> core_;
};

} // namespace session
} // namespace peerlink
