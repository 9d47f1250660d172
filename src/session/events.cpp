// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/events.hpp"
#include "util/logging.hpp"

namespace peerlink {
namespace session {

SendOutcome SendOutcome::Delivered(TransportKind transport,
                                   GenericMessage reply, Bytes binary_reply) {
  SendOutcome outcome;
  outcome.type_ = Type::DeliveredImmediate;
  outcome.transport_ = transport;
  outcome.reply_ = reply.is_null() ? EmptyMessage() : std::move(reply);
  outcome.binary_reply_ = std::move(binary_reply);
  return outcome;
}

SendOutcome SendOutcome::Queued(TransportKind transport) {
  SendOutcome outcome;
  outcome.type_ = Type::QueuedContext;
  outcome.transport_ = transport;
  return outcome;
}

SendOutcome SendOutcome::Failure(SessionError error) {
  SendOutcome outcome;
  outcome.type_ = Type::Failed;
  outcome.error_ = std::move(error);
  return outcome;
}

std::string SendOutcome::ToString() const {
  switch (type_) {
  case Type::DeliveredImmediate:
    return "DeliveredImmediate(" + TransportKindToString(*transport_) + ")";
  case Type::QueuedContext:
    return "QueuedContext(" + TransportKindToString(*transport_) + ")";
  case Type::Failed:
    return "Failed(" + (error_ ? error_->ToString() : std::string("?")) + ")";
  }
  return "Unknown";
}

std::string ReceiveSourceToString(ReceiveSource source) {
  switch (source) {
  case ReceiveSource::Interactive:
    return "interactive";
  case ReceiveSource::Context:
    return "context";
  case ReceiveSource::Binary:
    return "binary";
  }
  return "unknown";
}

ReceiveEvent::ReceiveEvent(Kind kind, GenericMessage message,
                           std::shared_ptr<ReplyChannel> channel)
    : kind_(kind), message_(std::move(message)), channel_(std::move(channel)) {}

ReceiveEvent ReceiveEvent::Interactive(GenericMessage message,
                                       ReplyHandler reply) {
  auto channel = std::make_shared<ReplyChannel>();
  channel->handler = std::move(reply);
  return ReceiveEvent(Kind::InteractiveWithReply, std::move(message),
                      std::move(channel));
}

ReceiveEvent ReceiveEvent::Context(GenericMessage message) {
  return ReceiveEvent(Kind::ContextUpdate, std::move(message), nullptr);
}

bool ReceiveEvent::Reply(const GenericMessage &reply) const {
  if (!channel_) {
    return false;
  }
  if (channel_->used.exchange(true)) {
    LOG_SESSION_DEBUG("Duplicate reply ignored");
    return false;
  }
  if (channel_->handler) {
    channel_->handler(reply.is_null() ? EmptyMessage() : reply);
  }
  return true;
}

bool ReceiveEvent::Replied() const {
  return channel_ && channel_->used.load();
}

} // namespace session
} // namespace peerlink
