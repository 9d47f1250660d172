// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/event_broadcaster.hpp"

namespace peerlink {
namespace session {

Subscription::Subscription(std::weak_ptr<detail::SubscriptionTarget> owner,
                           size_t id)
    : owner_(std::move(owner)), id_(id), active_(true) {}

Subscription::~Subscription() { Unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : owner_(std::move(other.owner_)), id_(other.id_), active_(other.active_) {
  other.owner_.reset();
  other.active_ = false;
}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = std::move(other.owner_);
    id_ = other.id_;
    active_ = other.active_;
    other.owner_.reset();
    other.active_ = false;
  }
  return *this;
}

void Subscription::Unsubscribe() {
  if (!active_) {
    return;
  }
  active_ = false;
  // Broadcaster may already be gone
  if (auto owner = owner_.lock()) {
    owner->Unsubscribe(id_);
  }
  owner_.reset();
}

} // namespace session
} // namespace peerlink
