// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/events.hpp"
#include "session/generic_message.hpp"
#include "session/session_error.hpp"
#include "session/session_state.hpp"
#include <functional>
#include <memory>
#include <optional>

namespace peerlink {
namespace session {

// Abstract peer-link interface
// Allows dependency injection of different implementations:
// - Platform session backed by the host OS link
// - NullTransportSession: hosts without a peer link
// - MockTransportSession / LoopbackTransport: in-memory, for testing (in test/)

// Completion of an interactive send: reply on success, error otherwise
using InteractiveCompletion = std::function<void(
    const GenericMessage &reply, const std::optional<SessionError> &error)>;
// Completion of a binary send
using BinaryCompletion = std::function<void(
    const Bytes &reply, const std::optional<SessionError> &error)>;

/**
 * TransportSessionDelegate - push notifications from the link
 *
 * Implementations must accept calls from any thread, concurrently.
 */
class TransportSessionDelegate {
public:
  virtual ~TransportSessionDelegate() = default;

  // Activation finished; error set if the link could not be established
  virtual void OnActivationComplete(ActivationState state,
                                    const std::optional<SessionError> &error) = 0;
  virtual void OnBecameInactive() = 0;
  virtual void OnDeactivated() = 0;
  virtual void OnReachabilityChanged(bool reachable) = 0;
  virtual void OnPeerStateChanged(bool installed,
                                  std::optional<bool> paired) = 0;

  // The peer waits until reply is invoked (or its own timeout fires)
  virtual void OnMessageReceived(const GenericMessage &message,
                                 ReplyHandler reply) = 0;
  virtual void OnContextReceived(const GenericMessage &context) = 0;
  virtual void OnBinaryMessageReceived(const Bytes &data,
                                       BinaryReplyHandler reply) = 0;
};

/**
 * TransportSession - the OS-provided link to the peer
 *
 * Getters must be safe to call from any thread.
 * Completions may run on any thread, including inline from the send call.
 */
class TransportSession {
public:
  virtual ~TransportSession() = default;

  virtual ActivationState activation_state() const = 0;
  virtual bool is_reachable() const = 0;
  virtual bool is_peer_installed() const = 0;
  // nullopt where the platform cannot report pairing
  virtual std::optional<bool> is_peer_paired() const = 0;

  // Request activation (throws SessionException(SessionUnsupported) if the
  // host cannot establish a peer link). Completion arrives on the delegate.
  virtual void activate() = 0;

  virtual void send_interactive(const GenericMessage &message,
                                InteractiveCompletion completion) = 0;

  // Replace the pending context (throws SessionException on failure)
  virtual void send_queued(const GenericMessage &context) = 0;

  virtual void send_binary(const Bytes &data, BinaryCompletion completion) = 0;

  // Single delegate sink (replaces any previous one, nullptr detaches)
  virtual void set_delegate(std::shared_ptr<TransportSessionDelegate> delegate) = 0;

  // Most recently received context, if the platform keeps one
  virtual std::optional<GenericMessage> received_context() const {
    return std::nullopt;
  }
};

using TransportSessionPtr = std::shared_ptr<TransportSession>;

} // namespace session
} // namespace peerlink
