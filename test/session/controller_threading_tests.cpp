// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Threading tests: controller running its own io thread while callbacks
// and sends arrive from many threads

#include <catch2/catch_test_macros.hpp>
#include "session/session_controller.hpp"
#include "infra/mock_transport_session.hpp"
#include "infra/test_helpers.hpp"
#include "infra/test_messages.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace peerlink::session;
using namespace peerlink::test;
using namespace std::chrono_literals;

namespace {

SessionController::Config ThreadedConfig() {
    SessionController::Config config;
    config.io_threads = 1;
    config.reply_timeout = 2s;
    return config;
}

std::unique_ptr<SessionController> MakeActivatedController(
    const std::shared_ptr<MockTransportSession>& session, bool reachable, bool installed) {
    auto registry = std::make_shared<TypeRegistry>();
    registry->Register<ColorMessage>();
    auto controller = std::make_unique<SessionController>(session, registry, ThreadedConfig());

    session->SetLinkState(ActivationState::NotActivated, reachable, installed, installed);
    auto ready = controller->ActivateAndWait(2s);
    session->TriggerActivationComplete(ActivationState::Activated);
    REQUIRE(ready.wait_for(2s) == std::future_status::ready);
    ready.get();
    return controller;
}

} // namespace

TEST_CASE("SessionController threading: concurrent senders", "[session][controller][threading]") {
    auto session = std::make_shared<MockTransportSession>();
    auto controller = MakeActivatedController(session, true, true);

    std::atomic<size_t> results{0};
    auto sub = controller->SubscribeSendResults([&](const SendResult&) { ++results; });

    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    std::atomic<int> delivered{0};
    std::atomic<int> other{0};

    std::vector<std::thread> senders;
    for (int t = 0; t < kThreads; ++t) {
        senders.emplace_back([&, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                auto future = controller->Send(ColorMessage(t, i, 0));
                if (future.wait_for(2s) != std::future_status::ready) {
                    ++other;
                    continue;
                }
                if (future.get().IsDelivered()) {
                    ++delivered;
                } else {
                    ++other;
                }
            }
        });
    }
    for (auto& t : senders) t.join();

    REQUIRE(delivered.load() == kThreads * kPerThread);
    REQUIRE(other.load() == 0);
    REQUIRE(WaitFor([&]() { return results.load() == kThreads * kPerThread; }));
    REQUIRE(session->interactive_sent().size() == kThreads * kPerThread);
}

TEST_CASE("SessionController threading: sends racing reachability changes", "[session][controller][threading]") {
    auto session = std::make_shared<MockTransportSession>();
    auto controller = MakeActivatedController(session, true, true);

    std::atomic<bool> stop{false};
    std::thread flapper([&]() {
        bool reachable = false;
        while (!stop.load()) {
            session->TriggerReachability(reachable);
            reachable = !reachable;
            std::this_thread::sleep_for(50us);
        }
    });

    // Installed peer: every send is either interactive or queued
    int delivered = 0;
    int queued = 0;
    int failed = 0;
    for (int i = 0; i < 200; ++i) {
        auto future = controller->Send(GenericMessage{{"seq", i}});
        REQUIRE(future.wait_for(2s) == std::future_status::ready);
        SendOutcome outcome = future.get();
        if (outcome.IsDelivered()) ++delivered;
        else if (outcome.IsQueued()) ++queued;
        else ++failed;
    }
    stop = true;
    flapper.join();

    REQUIRE(failed == 0);
    REQUIRE(delivered + queued == 200);
    REQUIRE(session->interactive_sent().size() == static_cast<size_t>(delivered));
    REQUIRE(session->queued_sent().size() == static_cast<size_t>(queued));
}

TEST_CASE("SessionController threading: streams across threads", "[session][controller][threading]") {
    auto session = std::make_shared<MockTransportSession>();
    auto controller = MakeActivatedController(session, true, true);

    auto typed = controller->TypedMessageStream();
    auto raw = controller->MessageStream();

    std::thread sender([&]() {
        for (int i = 0; i < 20; ++i) {
            session->TriggerContext(MakeEnvelope("color", {{"r", i}, {"g", 0}, {"b", 0}}));
        }
    });

    // Single sender thread: order is preserved
    for (int i = 0; i < 20; ++i) {
        auto event = typed->NextFor(2s);
        REQUIRE(event.has_value());
        REQUIRE(event->source == ReceiveSource::Context);
        REQUIRE(event->message->As<ColorMessage>()->r == i);
    }
    sender.join();
    REQUIRE(WaitFor([&]() { return raw->Pending() == 20; }));

    // Closing one stream does not disturb the other
    raw->Close();
    session->TriggerContext(MakeEnvelope("color", {{"r", 99}, {"g", 0}, {"b", 0}}));
    auto last = typed->NextFor(2s);
    REQUIRE(last.has_value());
    REQUIRE(last->message->As<ColorMessage>()->r == 99);
    REQUIRE(raw->Pending() == 0);
}

TEST_CASE("SessionController threading: level stream sees the final state", "[session][controller][threading]") {
    auto session = std::make_shared<MockTransportSession>();
    auto controller = MakeActivatedController(session, false, true);
    auto stream = controller->ReachabilityStream();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) session->TriggerReachability(i % 2 == 0);
        });
    }
    for (auto& t : threads) t.join();
    session->TriggerReachability(true);

    REQUIRE(WaitFor([&]() { return controller->State().reachable; }));
    REQUIRE(WaitFor([&]() {
        auto value = stream->TryNext();
        return value.has_value() && *value && stream->Pending() == 0 &&
               controller->State().reachable;
    }));
}

TEST_CASE("SessionController threading: destruction with callbacks in flight", "[session][controller][threading]") {
    auto session = std::make_shared<MockTransportSession>();
    auto controller = MakeActivatedController(session, true, true);
    session->SetReplyMode(MockTransportSession::ReplyMode::Manual);

    std::vector<std::future<SendOutcome>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(controller->Send(GenericMessage{{"seq", i}}));
    }
    REQUIRE(WaitFor([&]() { return session->interactive_sent().size() == 10; }));

    std::atomic<bool> stop{false};
    std::thread noise([&]() {
        while (!stop.load()) {
            session->TriggerReachability(true);
            session->TriggerMessage(GenericMessage{{"text", "hi"}}, [](const GenericMessage&) {});
        }
    });

    controller.reset();
    stop = true;
    noise.join();

    for (auto& future : futures) {
        REQUIRE(future.wait_for(0s) == std::future_status::ready);
        REQUIRE(future.get().IsFailed());
    }
    // Completions arriving now find no controller
    while (session->CompleteNextInteractive(EmptyMessage())) {
    }
}

TEST_CASE("SessionController threading: send immediately followed by destruction", "[session][controller][threading]") {
    auto session = std::make_shared<MockTransportSession>();
    session->SetReplyMode(MockTransportSession::ReplyMode::Manual);

    int failed = 0;
    for (int i = 0; i < 200; ++i) {
        auto controller = MakeActivatedController(session, true, true);
        std::atomic<int> published{0};
        auto sub = controller->SubscribeSendResults([&](const SendResult&) { ++published; });

        auto future = controller->Send(GenericMessage{{"seq", i}});
        controller.reset();

        REQUIRE(future.wait_for(0s) == std::future_status::ready);
        SendOutcome outcome = future.get();
        REQUIRE(outcome.IsFailed());
        REQUIRE(outcome.error()->transport_code() == TransportErrorCode::Generic);
        REQUIRE(published.load() == 1);
        ++failed;

        while (session->CompleteNextInteractive(EmptyMessage())) {
        }
    }
    REQUIRE(failed == 200);
}
