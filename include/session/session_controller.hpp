// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "session/event_broadcaster.hpp"
#include "session/events.hpp"
#include "session/message_codec.hpp"
#include "session/session_state.hpp"
#include "session/transport_selector.hpp"
#include "session/transport_session.hpp"
#include "session/type_registry.hpp"
#include "util/session_settings.hpp"
#include <atomic>
#include <boost/asio.hpp>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

namespace peerlink {
namespace session {

/**
 * SessionController - orchestrates one peer link
 *
 * Serialization domain:
 * - Every TransportSession callback and every send decision is posted to a
 *   single strand; SessionState is touched only there
 * - A send is registered in the pending table before it is posted, so the
 *   destructor can settle sends whose handler never ran
 * - State() reads a copy published after each mutation (any thread)
 *
 * Sends:
 * - Encode (caller thread) -> snapshot state on the strand ->
 *   SelectTransport -> one TransportSession call -> exactly one outcome
 * - The outcome goes to the caller and to the send-result channel
 * - Dropping the returned future does not cancel the transport attempt
 *
 * Lifetime:
 * - io_threads == 1: the controller owns an io_context and its thread
 * - io_threads == 0: the caller drives the io_context (tests call poll());
 *   destroy the controller on the thread that runs it
 * - Destruction detaches from the session, fails every pending send with
 *   TransportFailure(Generic) (caller and send-result channel), fails a
 *   pending ActivateAndWait, and finishes every stream
 *
 * Pending context:
 * - The session's received context is replayed through the context path
 *   when activation completes as Activated and whenever the peer is
 *   reported reachable
 */
class SessionController {
public:
  struct Config {
    size_t io_threads;                          // 1 = owned thread, 0 = external io_context
    std::chrono::milliseconds reply_timeout;    // round-trip reply timeout (0 = none)
    std::chrono::milliseconds activation_timeout; // default for ActivateAndWait

    Config()
        : io_threads(1), reply_timeout(std::chrono::seconds(10)),
          activation_timeout(std::chrono::seconds(5)) {}

    // Timeouts from a loaded settings file, other fields defaulted
    static Config FromSettings(const util::SessionSettings &settings);
  };

  using SendCompletion = std::function<void(const SendOutcome &)>;

  /**
   * @param session Link collaborator (required)
   * @param registry Types to decode on receive (nullptr = empty registry)
   * @param config Controller configuration
   * @param external_io_context Optional external io_context (nullptr = owned)
   */
  SessionController(TransportSessionPtr session,
                    std::shared_ptr<TypeRegistry> registry,
                    const Config &config = Config{},
                    std::shared_ptr<boost::asio::io_context> external_io_context = nullptr);
  ~SessionController();

  // Non-copyable
  SessionController(const SessionController &) = delete;
  SessionController &operator=(const SessionController &) = delete;

  /**
   * Request activation (idempotent). Throws SessionException when the host
   * cannot establish a peer link. Activated/Inactive arrives later through
   * the activation-completed channel.
   */
  void Activate();

  /**
   * Request activation and wait for the activation-complete callback.
   * The future throws SessionException:
   * - SessionUnsupported: activation reported an error or activate() threw
   * - TransportFailure(SessionNotActivated): completed but not Activated
   * - TransportFailure(TransferTimedOut): no callback within timeout
   * - TransportFailure(InvalidParameter): another wait is pending
   */
  std::future<void> ActivateAndWait(
      std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  // Send a typed message; binary-capable types use the binary transport
  // unless options contain ForceDictionary
  std::future<SendOutcome> Send(const TypedMessage &message,
                                SendOptions options = SendOptions::None);
  void SendAsync(const TypedMessage &message, SendOptions options,
                 SendCompletion completion);

  // Send an untyped dictionary (dictionary transport only)
  std::future<SendOutcome> Send(const GenericMessage &message);
  void SendAsync(const GenericMessage &message, SendCompletion completion);

  // Re-run the context-received path for the session's pending context
  // (also done automatically on activation and on reachability)
  void ReplayReceivedContext();

  // Latest published snapshot
  SessionState State() const;

  TypeRegistry &registry() { return *registry_; }
  const MessageCodec &codec() const { return codec_; }
  boost::asio::io_context &io_context() { return *io_context_; }

  // === Level signals (current value replayed on subscribe) ===

  [[nodiscard]] Subscription
  SubscribeActivationState(std::function<void(const ActivationState &)> callback) {
    return activation_state_.Subscribe(std::move(callback));
  }
  [[nodiscard]] Subscription
  SubscribeReachability(std::function<void(const bool &)> callback) {
    return reachability_.Subscribe(std::move(callback));
  }
  [[nodiscard]] Subscription
  SubscribePeerInstalled(std::function<void(const bool &)> callback) {
    return peer_installed_.Subscribe(std::move(callback));
  }
  [[nodiscard]] Subscription SubscribePeerPaired(
      std::function<void(const std::optional<bool> &)> callback) {
    return peer_paired_.Subscribe(std::move(callback));
  }

  std::shared_ptr<EventStream<ActivationState>> ActivationStateStream() {
    return activation_state_.Stream();
  }
  std::shared_ptr<EventStream<bool>> ReachabilityStream() {
    return reachability_.Stream();
  }
  std::shared_ptr<EventStream<bool>> PeerInstalledStream() {
    return peer_installed_.Stream();
  }
  std::shared_ptr<EventStream<std::optional<bool>>> PeerPairedStream() {
    return peer_paired_.Stream();
  }

  // === Edge signals (never replayed) ===

  [[nodiscard]] Subscription SubscribeActivationCompleted(
      std::function<void(const ActivationResult &)> callback) {
    return activation_completed_.Subscribe(std::move(callback));
  }
  // Interactive messages with no raw subscriber are answered with an
  // empty reply
  [[nodiscard]] Subscription
  SubscribeMessages(std::function<void(const ReceiveEvent &)> callback) {
    return raw_messages_.Subscribe(std::move(callback));
  }
  [[nodiscard]] Subscription SubscribeTypedMessages(
      std::function<void(const TypedReceiveEvent &)> callback) {
    return typed_messages_.Subscribe(std::move(callback));
  }
  [[nodiscard]] Subscription
  SubscribeSendResults(std::function<void(const SendResult &)> callback) {
    return send_results_.Subscribe(std::move(callback));
  }
  [[nodiscard]] Subscription SubscribeDecodeFailures(
      std::function<void(const DecodeFailureEvent &)> callback) {
    return decode_failures_.Subscribe(std::move(callback));
  }

  std::shared_ptr<EventStream<ActivationResult>> ActivationCompletedStream() {
    return activation_completed_.Stream();
  }
  std::shared_ptr<EventStream<ReceiveEvent>> MessageStream() {
    return raw_messages_.Stream();
  }
  std::shared_ptr<EventStream<TypedReceiveEvent>> TypedMessageStream() {
    return typed_messages_.Stream();
  }
  std::shared_ptr<EventStream<SendResult>> SendResultStream() {
    return send_results_.Stream();
  }
  std::shared_ptr<EventStream<DecodeFailureEvent>> DecodeFailureStream() {
    return decode_failures_.Stream();
  }

private:
  class Gate;
  class DelegateBridge;

  struct PendingSend {
    uint64_t id{0};
    TransportKind kind{TransportKind::Dictionary};
    GenericMessage message; // dictionary form (published in SendResult)
    Bytes binary;           // Binary only
    SendCompletion completion;
    std::unique_ptr<boost::asio::steady_timer> timer;
    bool done{false};
  };
  using PendingSendPtr = std::shared_ptr<PendingSend>;

  struct ActivationWaiter {
    std::promise<void> promise;
    std::unique_ptr<boost::asio::steady_timer> timer;
  };

  // Any thread; false once the controller is shutting down
  bool RegisterSend(const PendingSendPtr &request);

  // Strand-only helpers
  void DispatchSend(const PendingSendPtr &request);
  void StartReplyTimer(const PendingSendPtr &request);
  void OnSendCompleted(uint64_t id, SendOutcome outcome);
  void FinishSend(const PendingSendPtr &request, const SendOutcome &outcome);
  void FailSend(const PendingSendPtr &request, const SessionError &error);

  void HandleActivationComplete(ActivationState activation,
                                const std::optional<SessionError> &error);
  void HandleBecameInactive();
  void HandleDeactivated();
  void HandleReachabilityChanged(bool reachable);
  void HandlePeerStateChanged(bool installed, std::optional<bool> paired);
  void HandleMessageReceived(const GenericMessage &message, ReplyHandler reply);
  void HandleContextReceived(const GenericMessage &context);
  void HandleBinaryMessageReceived(const Bytes &data, BinaryReplyHandler reply);
  void ReplayPendingContext();

  void DecodeAndPublish(const GenericMessage &message, ReceiveSource source);
  void ReportDecodeFailure(ReceiveSource source, const CodecState &state,
                           const GenericMessage &raw, const Bytes &raw_binary);
  void PublishState(const SessionState &next);
  bool IsCurrentWaiter(const std::shared_ptr<ActivationWaiter> &waiter) const;
  std::shared_ptr<ActivationWaiter> TakeActivationWaiter();
  void CompleteActivationWaiter(const SessionState &state,
                                const std::optional<SessionError> &error);
  void FailActivationWaiter(const SessionError &error);

  Config config_;
  TransportSessionPtr session_;
  std::shared_ptr<TypeRegistry> registry_;
  MessageCodec codec_;

  // Threading
  std::shared_ptr<boost::asio::io_context> io_context_;
  bool external_io_context_;
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::vector<std::thread> io_threads_;
  std::shared_ptr<Gate> gate_;
  std::shared_ptr<DelegateBridge> bridge_;

  // Strand-owned
  SessionState state_;
  std::atomic<uint64_t> next_send_id_{1};

  // Sends without an outcome yet, and the single activation waiter
  mutable std::mutex pending_mutex_;
  std::unordered_map<uint64_t, PendingSendPtr> pending_sends_;
  std::shared_ptr<ActivationWaiter> activation_waiter_;
  bool shutting_down_{false};

  // Copy of state_ for State()
  mutable std::mutex published_mutex_;
  SessionState published_;

  EventBroadcaster<ActivationState> activation_state_;
  EventBroadcaster<bool> reachability_;
  EventBroadcaster<bool> peer_installed_;
  EventBroadcaster<std::optional<bool>> peer_paired_;
  EventBroadcaster<ActivationResult> activation_completed_;
  EventBroadcaster<ReceiveEvent> raw_messages_;
  EventBroadcaster<TypedReceiveEvent> typed_messages_;
  EventBroadcaster<SendResult> send_results_;
  EventBroadcaster<DecodeFailureEvent> decode_failures_;
};

} // namespace session
} // namespace peerlink
