#ifndef PEERLINK_TEST_LOOPBACK_TRANSPORT_HPP
#define PEERLINK_TEST_LOOPBACK_TRANSPORT_HPP

#include "session/transport_session.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace peerlink {
namespace test {

/**
 * LoopbackSession - In-memory TransportSession pair
 *
 * Two sessions created together are each other's counterpart:
 * - Interactive and binary sends are handed to the other side's delegate;
 *   the other side's reply completes the sender's call
 * - Queued contexts become the other side's received_context() and are
 *   announced through OnContextReceived
 * - Reachability is shared by both sides and starts false
 *
 * Delegate callbacks run on the calling thread, like the OS framework
 * calling back on its own queue.
 */
class LoopbackSession : public session::TransportSession {
public:
    using Pair = std::pair<std::shared_ptr<LoopbackSession>, std::shared_ptr<LoopbackSession>>;

    static Pair CreatePair();

    // TransportSession interface
    session::ActivationState activation_state() const override;
    bool is_reachable() const override;
    bool is_peer_installed() const override;
    std::optional<bool> is_peer_paired() const override;

    void activate() override;
    void send_interactive(const session::GenericMessage& message,
                          session::InteractiveCompletion completion) override;
    void send_queued(const session::GenericMessage& context) override;
    void send_binary(const session::Bytes& data,
                     session::BinaryCompletion completion) override;
    void set_delegate(std::shared_ptr<session::TransportSessionDelegate> delegate) override;
    std::optional<session::GenericMessage> received_context() const override;

    // Change reachability for both sides and notify both delegates
    void SetReachable(bool reachable);

    size_t messages_delivered() const { return delivered_.load(); }

private:
    struct Link {
        std::mutex mutex;
        bool reachable{false};
        std::weak_ptr<LoopbackSession> sides[2];
    };

    LoopbackSession(std::shared_ptr<Link> link, int side);

    std::shared_ptr<LoopbackSession> peer() const;
    std::shared_ptr<session::TransportSessionDelegate> delegate() const;

    std::shared_ptr<Link> link_;
    const int side_;

    mutable std::mutex mutex_;
    session::ActivationState activation_{session::ActivationState::NotActivated};
    std::shared_ptr<session::TransportSessionDelegate> delegate_;
    std::optional<session::GenericMessage> received_context_;
    std::atomic<size_t> delivered_{0};
};

} // namespace test
} // namespace peerlink

#endif // PEERLINK_TEST_LOOPBACK_TRANSPORT_HPP
