// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "session/session_controller.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/asio/executor_work_guard.hpp>
#include <stdexcept>

namespace peerlink {
namespace session {

namespace {

// Errors reported by the collaborator keep their kind when it is one the
// transport may legitimately produce; anything else is wrapped
SessionError AsTransportFailure(const SessionError &error) {
  switch (error.kind()) {
  case ErrorKind::TransportFailure:
  case ErrorKind::SessionUnsupported:
  case ErrorKind::NoCounterpart:
    return error;
  case ErrorKind::DecodeFailure:
  case ErrorKind::EncodeFailure:
    break;
  }
  return SessionError::Transport(TransportErrorCode::Generic, error.ToString());
}

// Payload descriptions are only built when someone will read them
bool TraceEnabled() {
  return util::LogManager::GetLogger("session")->should_log(spdlog::level::trace);
}

std::exception_ptr MakeSessionException(const SessionError &error) {
  return std::make_exception_ptr(SessionException(error));
}

} // namespace

// ============================================================================
// Gate - posts onto the strand while the controller is alive
// ============================================================================

class SessionController::Gate : public std::enable_shared_from_this<Gate> {
public:
  explicit Gate(SessionController *owner) : owner_(owner) {}

  // Run fn(controller) on the strand; dropped once the gate is closed
  template <typename Fn> void Post(Fn fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!owner_) {
      return;
    }
    boost::asio::post(owner_->strand_,
                      [self = shared_from_this(), fn = std::move(fn)]() mutable {
                        if (SessionController *owner = self->owner()) {
                          fn(*owner);
                        }
                      });
  }

  void Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    owner_ = nullptr;
  }

  SessionController *owner() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_;
  }

private:
  mutable std::mutex mutex_;
  SessionController *owner_;
};

// ============================================================================
// DelegateBridge - TransportSession callbacks -> strand
// ============================================================================

class SessionController::DelegateBridge : public TransportSessionDelegate {
public:
  explicit DelegateBridge(std::shared_ptr<Gate> gate) : gate_(std::move(gate)) {}

  void OnActivationComplete(ActivationState state,
                            const std::optional<SessionError> &error) override {
    gate_->Post([state, error](SessionController &c) {
      c.HandleActivationComplete(state, error);
    });
  }

  void OnBecameInactive() override {
    gate_->Post([](SessionController &c) { c.HandleBecameInactive(); });
  }

  void OnDeactivated() override {
    gate_->Post([](SessionController &c) { c.HandleDeactivated(); });
  }

  void OnReachabilityChanged(bool reachable) override {
    gate_->Post([reachable](SessionController &c) {
      c.HandleReachabilityChanged(reachable);
    });
  }

  void OnPeerStateChanged(bool installed, std::optional<bool> paired) override {
    gate_->Post([installed, paired](SessionController &c) {
      c.HandlePeerStateChanged(installed, paired);
    });
  }

  void OnMessageReceived(const GenericMessage &message,
                         ReplyHandler reply) override {
    gate_->Post([message, reply = std::move(reply)](SessionController &c) mutable {
      c.HandleMessageReceived(message, std::move(reply));
    });
  }

  void OnContextReceived(const GenericMessage &context) override {
    gate_->Post([context](SessionController &c) {
      c.HandleContextReceived(context);
    });
  }

  void OnBinaryMessageReceived(const Bytes &data,
                               BinaryReplyHandler reply) override {
    gate_->Post([data, reply = std::move(reply)](SessionController &c) mutable {
      c.HandleBinaryMessageReceived(data, std::move(reply));
    });
  }

private:
  std::shared_ptr<Gate> gate_;
};

// ============================================================================
// SessionController
// ============================================================================

SessionController::Config
SessionController::Config::FromSettings(const util::SessionSettings &settings) {
  Config config;
  config.reply_timeout = settings.reply_timeout;
  config.activation_timeout = settings.activation_timeout;
  return config;
}

SessionController::SessionController(
    TransportSessionPtr session, std::shared_ptr<TypeRegistry> registry,
    const Config &config,
    std::shared_ptr<boost::asio::io_context> external_io_context)
    : config_(config), session_(std::move(session)),
      registry_(registry ? std::move(registry)
                         : std::make_shared<TypeRegistry>()),
      codec_(registry_),
      io_context_(external_io_context
                      ? external_io_context
                      : std::make_shared<boost::asio::io_context>()),
      external_io_context_(external_io_context != nullptr),
      strand_(io_context_->get_executor()),
      activation_state_("activation-state", SignalMode::Level),
      reachability_("reachability", SignalMode::Level),
      peer_installed_("peer-installed", SignalMode::Level),
      peer_paired_("peer-paired", SignalMode::Level),
      activation_completed_("activation-completed"),
      raw_messages_("messages"), typed_messages_("typed-messages"),
      send_results_("send-results"), decode_failures_("decode-failures") {
  if (!session_) {
    throw std::invalid_argument("SessionController requires a TransportSession");
  }

  // Seed level signals with the initial snapshot
  published_ = state_;
  activation_state_.Notify(state_.activation);
  reachability_.Notify(state_.reachable);
  peer_installed_.Notify(state_.peer_installed);
  peer_paired_.Notify(state_.peer_paired);

  gate_ = std::make_shared<Gate>(this);
  bridge_ = std::make_shared<DelegateBridge>(gate_);

  // Only spawn threads for an owned io_context
  if (config_.io_threads > 0 && !external_io_context_) {
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(*io_context_));
    for (size_t i = 0; i < config_.io_threads; ++i) {
      io_threads_.emplace_back([this]() { io_context_->run(); });
    }
  }

  session_->set_delegate(bridge_);

  LOG_SESSION_DEBUG("SessionController created (io_threads={}, external_io={}, "
                    "reply_timeout={}ms)",
                    config_.io_threads, external_io_context_ ? "yes" : "no",
                    config_.reply_timeout.count());
}

SessionController::~SessionController() {
  // Handlers that have not started yet are dropped from here on
  gate_->Close();
  session_->set_delegate(nullptr);

  if (work_guard_) {
    work_guard_.reset();
  }
  if (!external_io_context_) {
    io_context_->stop();
  }
  for (auto &thread : io_threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  io_threads_.clear();

  // Strand is idle. Sends whose handler was dropped by the gate are still
  // in the table and get their outcome here.
  std::vector<PendingSendPtr> pending;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    shutting_down_ = true;
    for (auto &[id, request] : pending_sends_) {
      pending.push_back(request);
    }
    pending_sends_.clear();
  }
  std::sort(pending.begin(), pending.end(),
            [](const PendingSendPtr &a, const PendingSendPtr &b) { return a->id < b->id; });

  const SessionError destroyed =
      SessionError::Transport(TransportErrorCode::Generic, "controller destroyed");
  if (!pending.empty()) {
    LOG_SESSION_DEBUG("Failing {} pending send(s) at shutdown", pending.size());
  }
  for (auto &request : pending) {
    FinishSend(request, SendOutcome::Failure(destroyed));
  }
  FailActivationWaiter(destroyed);
}

void SessionController::Activate() {
  if (State().activation == ActivationState::Activated) {
    LOG_SESSION_DEBUG("Activate(): already activated");
    return;
  }

  LOG_SESSION_DEBUG("Requesting activation");
  try {
    session_->activate();
  } catch (const SessionException &e) {
    LOG_SESSION_WARN("Activation request failed: {}", e.what());
    throw;
  } catch (const std::exception &e) {
    LOG_SESSION_WARN("Activation request failed: {}", e.what());
    throw SessionException(
        SessionError::Transport(TransportErrorCode::Generic, e.what()));
  }
}

std::future<void>
SessionController::ActivateAndWait(std::optional<std::chrono::milliseconds> timeout) {
  if (State().activation == ActivationState::Activated) {
    std::promise<void> ready;
    ready.set_value();
    return ready.get_future();
  }

  auto waiter = std::make_shared<ActivationWaiter>();
  auto future = waiter->promise.get_future();
  const auto wait_for = timeout.value_or(config_.activation_timeout);

  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (activation_waiter_) {
      waiter->promise.set_exception(MakeSessionException(SessionError::Transport(
          TransportErrorCode::InvalidParameter, "activation wait already pending")));
      return future;
    }
    activation_waiter_ = waiter;
  }

  gate_->Post([waiter, wait_for](SessionController &c) {
    if (!c.IsCurrentWaiter(waiter)) {
      return;
    }
    if (c.state_.activation == ActivationState::Activated) {
      c.CompleteActivationWaiter(c.state_, std::nullopt);
      return;
    }

    if (wait_for.count() > 0) {
      waiter->timer = std::make_unique<boost::asio::steady_timer>(*c.io_context_);
      waiter->timer->expires_after(wait_for);
      waiter->timer->async_wait(boost::asio::bind_executor(
          c.strand_, [gate = c.gate_, waiter,
                      wait_for](const boost::system::error_code &ec) {
            if (ec == boost::asio::error::operation_aborted) {
              return;
            }
            SessionController *owner = gate->owner();
            if (!owner || !owner->IsCurrentWaiter(waiter)) {
              return;
            }
            LOG_SESSION_WARN("No activation callback within {} ms",
                             wait_for.count());
            owner->FailActivationWaiter(SessionError::Transport(
                TransportErrorCode::TransferTimedOut,
                "no activation callback within " +
                    std::to_string(wait_for.count()) + " ms"));
          }));
    }

    try {
      c.session_->activate();
    } catch (const SessionException &e) {
      LOG_SESSION_WARN("Activation request failed: {}", e.what());
      c.FailActivationWaiter(e.error());
    } catch (const std::exception &e) {
      LOG_SESSION_WARN("Activation request failed: {}", e.what());
      c.FailActivationWaiter(
          SessionError::Transport(TransportErrorCode::Generic, e.what()));
    }
  });

  return future;
}

std::future<SendOutcome> SessionController::Send(const TypedMessage &message,
                                                 SendOptions options) {
  auto promise = std::make_shared<std::promise<SendOutcome>>();
  auto future = promise->get_future();
  SendAsync(message, options,
            [promise](const SendOutcome &outcome) { promise->set_value(outcome); });
  return future;
}

std::future<SendOutcome> SessionController::Send(const GenericMessage &message) {
  auto promise = std::make_shared<std::promise<SendOutcome>>();
  auto future = promise->get_future();
  SendAsync(message,
            [promise](const SendOutcome &outcome) { promise->set_value(outcome); });
  return future;
}

void SessionController::SendAsync(const TypedMessage &message,
                                  SendOptions options,
                                  SendCompletion completion) {
  auto request = std::make_shared<PendingSend>();
  request->id = next_send_id_++;
  request->completion = std::move(completion);

  EncodedMessage encoded;
  CodecState state;
  if (!codec_.Encode(message, options, encoded, state)) {
    request->message = MakeEnvelope(message.TypeKey(), EmptyMessage());
    const SessionError error = state.ToError();
    if (RegisterSend(request)) {
      gate_->Post([request, error](SessionController &c) { c.FailSend(request, error); });
    }
    return;
  }

  request->kind = encoded.kind;
  request->message = std::move(encoded.dictionary);
  request->binary = std::move(encoded.binary);
  if (!RegisterSend(request)) {
    return;
  }
  gate_->Post([request](SessionController &c) { c.DispatchSend(request); });
}

void SessionController::SendAsync(const GenericMessage &message,
                                  SendCompletion completion) {
  auto request = std::make_shared<PendingSend>();
  request->id = next_send_id_++;
  request->completion = std::move(completion);
  request->message = message;

  std::string reason;
  if (!IsWellFormed(message, &reason)) {
    LOG_CODEC_WARN("Refusing to send malformed message: {}", reason);
    const SessionError error = SessionError::Encode("not-flat: " + reason);
    if (RegisterSend(request)) {
      gate_->Post([request, error](SessionController &c) { c.FailSend(request, error); });
    }
    return;
  }

  if (!RegisterSend(request)) {
    return;
  }
  gate_->Post([request](SessionController &c) { c.DispatchSend(request); });
}

void SessionController::ReplayReceivedContext() {
  gate_->Post([](SessionController &c) { c.ReplayPendingContext(); });
}

SessionState SessionController::State() const {
  std::lock_guard<std::mutex> lock(published_mutex_);
  return published_;
}

// ============================================================================
// Send path (strand)
// ============================================================================

bool SessionController::RegisterSend(const PendingSendPtr &request) {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (!shutting_down_) {
      pending_sends_[request->id] = request;
      return true;
    }
  }
  request->done = true;
  if (request->completion) {
    request->completion(SendOutcome::Failure(SessionError::Transport(
        TransportErrorCode::Generic, "controller destroyed")));
  }
  return false;
}

void SessionController::DispatchSend(const PendingSendPtr &request) {
  // One snapshot per decision
  const SessionState snapshot = state_;
  const DeliveryPlan plan = SelectTransport(snapshot, request->kind);
  LOG_SESSION_DEBUG("send #{} ({}): plan={} [{}]", request->id,
                    TransportKindToString(request->kind),
                    DeliveryPlanToString(plan), snapshot.ToString());

  switch (plan) {
  case DeliveryPlan::NoCounterpart:
    FinishSend(request,
               SendOutcome::Failure(SessionError::NoCounterpart(
                   request->kind == TransportKind::Binary
                       ? "binary transport requires a reachable peer"
                       : "peer is neither reachable nor installed")));
    return;

  case DeliveryPlan::Queued:
    try {
      session_->send_queued(request->message);
    } catch (const SessionException &e) {
      FailSend(request, e.error());
      return;
    } catch (const std::exception &e) {
      FailSend(request, SessionError::Transport(TransportErrorCode::Generic, e.what()));
      return;
    }
    FinishSend(request, SendOutcome::Queued(TransportKind::Dictionary));
    return;

  case DeliveryPlan::Interactive:
  case DeliveryPlan::Binary:
    break;
  }

  // Round trip: completion may arrive on any thread, or never
  StartReplyTimer(request);

  const uint64_t id = request->id;
  auto gate = gate_;
  try {
    if (plan == DeliveryPlan::Interactive) {
      session_->send_interactive(
          request->message,
          [gate, id](const GenericMessage &reply,
                     const std::optional<SessionError> &error) {
            SendOutcome outcome =
                error ? SendOutcome::Failure(AsTransportFailure(*error))
                      : SendOutcome::Delivered(TransportKind::Dictionary, reply);
            gate->Post([id, outcome](SessionController &c) {
              c.OnSendCompleted(id, outcome);
            });
          });
    } else {
      session_->send_binary(
          request->binary,
          [gate, id](const Bytes &reply, const std::optional<SessionError> &error) {
            SendOutcome outcome =
                error ? SendOutcome::Failure(AsTransportFailure(*error))
                      : SendOutcome::Delivered(TransportKind::Binary,
                                               EmptyMessage(), reply);
            gate->Post([id, outcome](SessionController &c) {
              c.OnSendCompleted(id, outcome);
            });
          });
    }
  } catch (const SessionException &e) {
    OnSendCompleted(id, SendOutcome::Failure(AsTransportFailure(e.error())));
  } catch (const std::exception &e) {
    OnSendCompleted(id, SendOutcome::Failure(SessionError::Transport(
                            TransportErrorCode::Generic, e.what())));
  }
}

void SessionController::StartReplyTimer(const PendingSendPtr &request) {
  if (config_.reply_timeout.count() <= 0) {
    return;
  }

  const uint64_t id = request->id;
  const auto timeout = config_.reply_timeout;
  request->timer = std::make_unique<boost::asio::steady_timer>(*io_context_);
  request->timer->expires_after(timeout);
  request->timer->async_wait(boost::asio::bind_executor(
      strand_, [gate = gate_, id, timeout](const boost::system::error_code &ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (SessionController *owner = gate->owner()) {
          owner->OnSendCompleted(
              id, SendOutcome::Failure(SessionError::Transport(
                      TransportErrorCode::MessageReplyTimedOut,
                      "no reply within " + std::to_string(timeout.count()) + " ms")));
        }
      }));
}

void SessionController::OnSendCompleted(uint64_t id, SendOutcome outcome) {
  PendingSendPtr request;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    auto it = pending_sends_.find(id);
    if (it != pending_sends_.end()) {
      request = it->second;
    }
  }
  if (!request) {
    LOG_SESSION_DEBUG("send #{}: late completion discarded ({})", id,
                      outcome.ToString());
    return;
  }
  FinishSend(request, outcome);
}

void SessionController::FailSend(const PendingSendPtr &request,
                                 const SessionError &error) {
  FinishSend(request, SendOutcome::Failure(
                          error.kind() == ErrorKind::EncodeFailure
                              ? error
                              : AsTransportFailure(error)));
}

void SessionController::FinishSend(const PendingSendPtr &request,
                                   const SendOutcome &outcome) {
  if (request->done) {
    return;
  }
  request->done = true;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending_sends_.erase(request->id);
  }
  if (request->timer) {
    (void)request->timer->cancel();
  }

  if (outcome.IsFailed()) {
    LOG_SESSION_DEBUG("send #{} -> {}", request->id, outcome.ToString());
  } else {
    LOG_SESSION_TRACE("send #{} -> {}", request->id, outcome.ToString());
  }

  send_results_.Notify(SendResult{request->message, outcome});

  if (request->completion) {
    auto completion = std::move(request->completion);
    request->completion = nullptr;
    try {
      completion(outcome);
    } catch (const std::exception &e) {
      LOG_SESSION_ERROR("send #{} completion threw: {}", request->id, e.what());
    }
  }
}

// ============================================================================
// Delegate handling (strand)
// ============================================================================

void SessionController::HandleActivationComplete(
    ActivationState activation, const std::optional<SessionError> &error) {
  SessionState next = state_;
  next.activation = activation;
  next.reachable = session_->is_reachable();
  next.peer_installed = session_->is_peer_installed();
  next.peer_paired = session_->is_peer_paired();
  next.activation_error = error;

  if (error) {
    LOG_SESSION_WARN("Activation completed with error: {}", error->ToString());
  } else {
    LOG_SESSION_INFO("Activation completed: {}", ActivationStateToString(activation));
  }

  PublishState(next);
  activation_completed_.Notify(ActivationResult{next, error});
  CompleteActivationWaiter(next, error);

  // A context that arrived while we were not active
  if (!error && activation == ActivationState::Activated) {
    ReplayPendingContext();
  }
}

void SessionController::HandleBecameInactive() {
  SessionState next = state_;
  next.activation = session_->activation_state();
  LOG_SESSION_DEBUG("Session became inactive (reports {})",
                    ActivationStateToString(next.activation));
  PublishState(next);
}

void SessionController::HandleDeactivated() {
  SessionState next = state_;
  next.activation = session_->activation_state();
  LOG_SESSION_DEBUG("Session deactivated (reports {})",
                    ActivationStateToString(next.activation));
  PublishState(next);
}

void SessionController::HandleReachabilityChanged(bool reachable) {
  SessionState next = state_;
  next.reachable = reachable;
  PublishState(next);

  // A context that arrived while the peer was out of reach
  if (reachable) {
    ReplayPendingContext();
  }
}

void SessionController::HandlePeerStateChanged(bool installed,
                                               std::optional<bool> paired) {
  SessionState next = state_;
  next.peer_installed = installed;
  next.peer_paired = paired;
  PublishState(next);
}

void SessionController::HandleMessageReceived(const GenericMessage &message,
                                              ReplyHandler reply) {
  if (TraceEnabled()) {
    LOG_SESSION_TRACE("Interactive message received: {}", Describe(message));
  }

  ReceiveEvent event = ReceiveEvent::Interactive(message, std::move(reply));
  if (raw_messages_.SubscriberCount() == 0) {
    LOG_SESSION_DEBUG("No message subscribers, answering with empty reply");
    try {
      event.Reply(EmptyMessage());
    } catch (const std::exception &e) {
      LOG_TRANSPORT_WARN("Reply handler threw: {}", e.what());
    }
  }

  raw_messages_.Notify(event);
  DecodeAndPublish(message, ReceiveSource::Interactive);
}

void SessionController::HandleContextReceived(const GenericMessage &context) {
  if (TraceEnabled()) {
    LOG_SESSION_TRACE("Context received: {}", Describe(context));
  }
  raw_messages_.Notify(ReceiveEvent::Context(context));
  DecodeAndPublish(context, ReceiveSource::Context);
}

void SessionController::HandleBinaryMessageReceived(const Bytes &data,
                                                    BinaryReplyHandler reply) {
  LOG_SESSION_TRACE("Binary message received ({} bytes)", data.size());

  CodecState state;
  auto typed = codec_.DecodeBinary(data, state);
  if (typed) {
    typed_messages_.Notify(TypedReceiveEvent{typed, ReceiveSource::Binary});
  } else {
    ReportDecodeFailure(ReceiveSource::Binary, state, EmptyMessage(), data);
  }

  // The sender's call completes only once we reply
  if (reply) {
    try {
      reply(Bytes{});
    } catch (const std::exception &e) {
      LOG_TRANSPORT_WARN("Binary reply handler threw: {}", e.what());
    }
  }
}

void SessionController::ReplayPendingContext() {
  auto context = session_->received_context();
  if (!context) {
    LOG_SESSION_TRACE("No pending context to replay");
    return;
  }
  LOG_SESSION_DEBUG("Replaying pending context");
  HandleContextReceived(*context);
}

void SessionController::DecodeAndPublish(const GenericMessage &message,
                                         ReceiveSource source) {
  CodecState state;
  auto typed = codec_.Decode(message, state);
  if (typed) {
    LOG_CODEC_TRACE("Decoded {} message as {}", ReceiveSourceToString(source),
                    typed->TypeKey());
    typed_messages_.Notify(TypedReceiveEvent{typed, source});
    return;
  }
  ReportDecodeFailure(source, state, message, Bytes{});
}

void SessionController::ReportDecodeFailure(ReceiveSource source,
                                            const CodecState &state,
                                            const GenericMessage &raw,
                                            const Bytes &raw_binary) {
  // Untyped dictionaries are common; everything else deserves attention
  if (state.IsUndecodable() && state.GetRejectReason() == "missing-type-key") {
    LOG_CODEC_DEBUG("Untyped {} message not decoded", ReceiveSourceToString(source));
  } else {
    LOG_CODEC_WARN("Failed to decode {} message: {} {}",
                   ReceiveSourceToString(source), state.GetRejectReason(),
                   state.GetDebugMessage());
  }
  decode_failures_.Notify(
      DecodeFailureEvent{source, state.ToError(), raw, raw_binary});
}

void SessionController::PublishState(const SessionState &next) {
  const SessionState previous = state_;
  state_ = next;
  {
    std::lock_guard<std::mutex> lock(published_mutex_);
    published_ = next;
  }

  if (previous == next) {
    return;
  }
  LOG_SESSION_DEBUG("State: [{}] -> [{}]", previous.ToString(), next.ToString());

  if (previous.activation != next.activation) {
    activation_state_.Notify(next.activation);
  }
  if (previous.reachable != next.reachable) {
    reachability_.Notify(next.reachable);
  }
  if (previous.peer_installed != next.peer_installed) {
    peer_installed_.Notify(next.peer_installed);
  }
  if (previous.peer_paired != next.peer_paired) {
    peer_paired_.Notify(next.peer_paired);
  }
}

bool SessionController::IsCurrentWaiter(
    const std::shared_ptr<ActivationWaiter> &waiter) const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return activation_waiter_ == waiter;
}

std::shared_ptr<SessionController::ActivationWaiter>
SessionController::TakeActivationWaiter() {
  std::shared_ptr<ActivationWaiter> waiter;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    waiter = std::move(activation_waiter_);
    activation_waiter_.reset();
  }
  if (waiter && waiter->timer) {
    (void)waiter->timer->cancel();
  }
  return waiter;
}

void SessionController::CompleteActivationWaiter(
    const SessionState &state, const std::optional<SessionError> &error) {
  auto waiter = TakeActivationWaiter();
  if (!waiter) {
    return;
  }

  if (error) {
    waiter->promise.set_exception(
        MakeSessionException(SessionError::Unsupported(error->ToString())));
  } else if (state.activation != ActivationState::Activated) {
    waiter->promise.set_exception(MakeSessionException(SessionError::Transport(
        TransportErrorCode::SessionNotActivated,
        "activation completed in state " + ActivationStateToString(state.activation))));
  } else {
    waiter->promise.set_value();
  }
}

void SessionController::FailActivationWaiter(const SessionError &error) {
  auto waiter = TakeActivationWaiter();
  if (!waiter) {
    return;
  }
  waiter->promise.set_exception(MakeSessionException(error));
}

} // namespace session
} // namespace peerlink
