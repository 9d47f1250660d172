// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/session_error.hpp"
#include <optional>
#include <string>

namespace peerlink {
namespace session {

// Activation state of the peer link.
// Transitions are driven exclusively by TransportSession callbacks.
enum class ActivationState {
  NotActivated = 0,
  Inactive = 1,
  Activated = 2
};

std::string ActivationStateToString(ActivationState state);

/**
 * SessionState - point-in-time snapshot of the link
 *
 * Plain value type. Every routing decision is made against one copy of
 * this struct taken at the start of the decision.
 */
struct SessionState {
  ActivationState activation{ActivationState::NotActivated};
  bool reachable{false};
  bool peer_installed{false};
  // Platform dependent: only some hosts can report pairing
  std::optional<bool> peer_paired;
  // Error reported by the most recent activation-complete callback
  std::optional<SessionError> activation_error;

  bool operator==(const SessionState &other) const;
  bool operator!=(const SessionState &other) const { return !(*this == other); }

  std::string ToString() const;
};

} // namespace session
} // namespace peerlink
