// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/message_codec.hpp"
#include "session/session_state.hpp"
#include <string>

namespace peerlink {
namespace session {

// Delivery channel chosen for one send
enum class DeliveryPlan {
  Interactive,  // round trip, reply expected
  Queued,       // pending context, no reply
  Binary,       // raw bytes round trip
  NoCounterpart // fail without touching the transport
};

std::string DeliveryPlanToString(DeliveryPlan plan);

/**
 * Transport arbitration (pure function of one state snapshot)
 *
 * Binary:     reachable -> Binary, otherwise NoCounterpart.
 *             There is no queued fallback for binary payloads.
 * Dictionary: reachable -> Interactive
 *             else peer installed -> Queued
 *             else NoCounterpart
 *
 * Activation state is not consulted: the transport reports its own
 * not-activated errors.
 */
DeliveryPlan SelectTransport(const SessionState &state, TransportKind kind);

} // namespace session
} // namespace peerlink
