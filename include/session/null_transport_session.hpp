// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/transport_session.hpp"

namespace peerlink {
namespace session {

// NullTransportSession - host without a peer link.
// activate() throws SessionUnsupported; every send completes with
// SessionUnsupported; the link is never reachable.
class NullTransportSession : public TransportSession {
public:
  ActivationState activation_state() const override {
    return ActivationState::NotActivated;
  }
  bool is_reachable() const override { return false; }
  bool is_peer_installed() const override { return false; }
  std::optional<bool> is_peer_paired() const override { return std::nullopt; }

  void activate() override;
  void send_interactive(const GenericMessage &message,
                        InteractiveCompletion completion) override;
  void send_queued(const GenericMessage &context) override;
  void send_binary(const Bytes &data, BinaryCompletion completion) override;
  void set_delegate(std::shared_ptr<TransportSessionDelegate> delegate) override;
};

} // namespace session
} // namespace peerlink
