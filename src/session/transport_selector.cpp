// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/transport_selector.hpp"

namespace peerlink {
namespace session {

std::string DeliveryPlanToString(DeliveryPlan plan) {
  switch (plan) {
  case DeliveryPlan::Interactive:
    return "interactive";
  case DeliveryPlan::Queued:
    return "queued";
  case DeliveryPlan::Binary:
    return "binary";
  case DeliveryPlan::NoCounterpart:
    return "no-counterpart";
  }
  return "unknown";
}

DeliveryPlan SelectTransport(const SessionState &state, TransportKind kind) {
  if (kind == TransportKind::Binary) {
    return state.reachable ? DeliveryPlan::Binary : DeliveryPlan::NoCounterpart;
  }
  if (state.reachable) {
    return DeliveryPlan::Interactive;
  }
  if (state.peer_installed) {
    return DeliveryPlan::Queued;
  }
  return DeliveryPlan::NoCounterpart;
}

} // namespace session
} // namespace peerlink
