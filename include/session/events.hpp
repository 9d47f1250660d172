// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/generic_message.hpp"
#include "session/message_codec.hpp"
#include "session/session_error.hpp"
#include "session/session_state.hpp"
#include "session/typed_message.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace peerlink {
namespace session {

/**
 * SendOutcome - result of exactly one send
 *
 * DeliveredImmediate: the peer answered on the interactive or binary
 *   channel (binary sends carry an empty dictionary reply)
 * QueuedContext: handed to the queued channel, no reply
 * Failed: see error()
 */
class SendOutcome {
public:
  enum class Type { DeliveredImmediate, QueuedContext, Failed };

  static SendOutcome Delivered(TransportKind transport, GenericMessage reply,
                               Bytes binary_reply = {});
  static SendOutcome Queued(TransportKind transport);
  static SendOutcome Failure(SessionError error);

  Type type() const { return type_; }
  bool IsDelivered() const { return type_ == Type::DeliveredImmediate; }
  bool IsQueued() const { return type_ == Type::QueuedContext; }
  bool IsFailed() const { return type_ == Type::Failed; }

  // Set for DeliveredImmediate and QueuedContext
  std::optional<TransportKind> transport() const { return transport_; }
  const GenericMessage &reply() const { return reply_; }
  const Bytes &binary_reply() const { return binary_reply_; }
  // Set for Failed
  const std::optional<SessionError> &error() const { return error_; }

  std::string ToString() const;

private:
  SendOutcome() = default;

  Type type_{Type::Failed};
  std::optional<TransportKind> transport_;
  GenericMessage reply_;
  Bytes binary_reply_;
  std::optional<SessionError> error_;
};

// Published on the send-result channel
struct SendResult {
  // Dictionary form of what was sent (envelope for typed messages)
  GenericMessage message;
  SendOutcome outcome;
};

// Published on the activation-completed channel
struct ActivationResult {
  SessionState state;
  std::optional<SessionError> error;

  bool Succeeded() const {
    return !error && state.activation == ActivationState::Activated;
  }
};

// Which receive path produced an event
enum class ReceiveSource { Interactive, Context, Binary };

std::string ReceiveSourceToString(ReceiveSource source);

using ReplyHandler = std::function<void(const GenericMessage &reply)>;
using BinaryReplyHandler = std::function<void(const Bytes &reply)>;

/**
 * ReceiveEvent - one inbound dictionary message
 *
 * InteractiveWithReply events carry a reply channel shared by every copy
 * of the event: the first Reply() wins and later calls return false, so
 * the peer's waiting call completes exactly once no matter how many
 * subscribers see the event.
 */
class ReceiveEvent {
public:
  enum class Kind { InteractiveWithReply, ContextUpdate };

  static ReceiveEvent Interactive(GenericMessage message, ReplyHandler reply);
  static ReceiveEvent Context(GenericMessage message);

  Kind kind() const { return kind_; }
  const GenericMessage &message() const { return message_; }
  bool HasReplyChannel() const { return kind_ == Kind::InteractiveWithReply; }

  // Complete the peer's call. Returns false if there is no reply channel or
  // a reply was already sent.
  bool Reply(const GenericMessage &reply) const;

  bool Replied() const;

private:
  struct ReplyChannel {
    ReplyHandler handler;
    std::atomic<bool> used{false};
  };

  ReceiveEvent(Kind kind, GenericMessage message,
               std::shared_ptr<ReplyChannel> channel);

  Kind kind_;
  GenericMessage message_;
  std::shared_ptr<ReplyChannel> channel_;
};

// Published on the typed-message channel after a successful decode
struct TypedReceiveEvent {
  TypedMessagePtr message;
  ReceiveSource source;
};

// Published on the decode-failure channel; the raw event was still delivered
struct DecodeFailureEvent {
  ReceiveSource source;
  SessionError error;
  GenericMessage raw;   // Interactive / Context
  Bytes raw_binary;     // Binary
};

} // namespace session
} // namespace peerlink
