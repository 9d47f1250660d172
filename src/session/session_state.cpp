// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/session_state.hpp"

namespace peerlink {
namespace session {

std::string ActivationStateToString(ActivationState state) {
  switch (state) {
  case ActivationState::NotActivated:
    return "NotActivated";
  case ActivationState::Inactive:
    return "Inactive";
  case ActivationState::Activated:
    return "Activated";
  }
  return "Unknown";
}

bool SessionState::operator==(const SessionState &other) const {
  return activation == other.activation && reachable == other.reachable &&
         peer_installed == other.peer_installed &&
         peer_paired == other.peer_paired &&
         activation_error == other.activation_error;
}

std::string SessionState::ToString() const {
  std::string out = "activation=" + ActivationStateToString(activation);
  out += " reachable=" + std::string(reachable ? "true" : "false");
  out += " installed=" + std::string(peer_installed ? "true" : "false");
  out += " paired=";
  out += peer_paired ? (*peer_paired ? "true" : "false") : "n/a";
  return out;
}

} // namespace session
} // namespace peerlink
