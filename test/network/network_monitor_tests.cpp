// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for NetworkMonitor path signals and periodic ping
// (externally driven io_context)

#include <catch2/catch_test_macros.hpp>
#include "network/network_monitor.hpp"
#include "infra/mock_path_monitor.hpp"
#include "infra/test_helpers.hpp"
#include <chrono>
#include <stdexcept>
#include <vector>

using namespace peerlink::network;
using namespace peerlink::test;
using namespace std::chrono_literals;

namespace {

struct MonitorFixture {
    boost::asio::io_context io;
    std::shared_ptr<MockPathMonitor> path_monitor = std::make_shared<MockPathMonitor>();
    std::shared_ptr<MockNetworkPing> ping;
    std::unique_ptr<NetworkMonitor> monitor;

    explicit MonitorFixture(std::shared_ptr<MockNetworkPing> p = nullptr) : ping(std::move(p)) {
        monitor = std::make_unique<NetworkMonitor>(io, path_monitor, ping);
    }

    ~MonitorFixture() {
        monitor.reset();
        Drain();
    }

    void Drain() { peerlink::test::Drain(io); }
};

} // namespace

TEST_CASE("PathStatus: formatting and equality", "[network][path]") {
    REQUIRE(PathStatus::Unknown().ToString() == "unknown");
    REQUIRE(PathStatus::RequiresConnection().ToString() == "requiresConnection");
    REQUIRE(PathStatus::Unsatisfied(std::nullopt).ToString() == "unsatisfied");
    REQUIRE(PathStatus::Unsatisfied(UnsatisfiedReason::WifiDenied).ToString() ==
            "unsatisfied(wifiDenied)");
    REQUIRE(PathStatus::Satisfied(InterfaceType::Wifi | InterfaceType::Loopback).ToString() ==
            "satisfied(wifi,loopback)");
    REQUIRE(PathStatus::Satisfied(InterfaceType::None).ToString() == "satisfied(none)");

    REQUIRE(PathStatus::Satisfied(InterfaceType::Wifi) == PathStatus::Satisfied(InterfaceType::Wifi));
    REQUIRE(PathStatus::Satisfied(InterfaceType::Wifi) != PathStatus::Satisfied(InterfaceType::Cellular));
    REQUIRE(PathStatus::Unsatisfied(UnsatisfiedReason::NotAvailable) !=
            PathStatus::Unsatisfied(std::nullopt));
    REQUIRE_FALSE(PathStatus::RequiresConnection().IsSatisfied());
    REQUIRE(HasInterface(InterfaceType::Cellular | InterfaceType::WiredEthernet,
                         InterfaceType::WiredEthernet));
    REQUIRE_FALSE(HasInterface(InterfaceType::Cellular, InterfaceType::Wifi));
}

TEST_CASE("NetworkMonitor: lifecycle", "[network][monitor]") {
    MonitorFixture f;

    SECTION("Requires a path monitor") {
        boost::asio::io_context io;
        REQUIRE_THROWS_AS(NetworkMonitor(io, nullptr), std::invalid_argument);
    }

    SECTION("Initial state is unknown and replayed to subscribers") {
        REQUIRE(f.monitor->Current() == NetworkPath{});
        std::vector<PathStatus> seen;
        auto sub = f.monitor->SubscribePathStatus([&](const PathStatus& s) { seen.push_back(s); });
        REQUIRE(seen == std::vector<PathStatus>{PathStatus::Unknown()});

        auto expensive = f.monitor->ExpensiveStream();
        auto first = expensive->TryNext();
        REQUIRE(first.has_value());
        REQUIRE_FALSE(*first);
    }

    SECTION("Start and Stop are idempotent") {
        f.monitor->Stop();
        REQUIRE(f.path_monitor->cancel_calls() == 0);

        f.monitor->Start();
        f.monitor->Start();
        REQUIRE(f.monitor->IsRunning());
        REQUIRE(f.path_monitor->start_calls() == 1);
        REQUIRE(f.path_monitor->has_handler());

        f.monitor->Stop();
        f.monitor->Stop();
        REQUIRE_FALSE(f.monitor->IsRunning());
        REQUIRE(f.path_monitor->cancel_calls() == 1);

        f.monitor->Start();
        REQUIRE(f.path_monitor->start_calls() == 2);
    }

    SECTION("Destruction cancels a running monitor and drops its handler") {
        f.monitor->Start();
        f.monitor.reset();
        REQUIRE(f.path_monitor->cancel_calls() == 1);
        REQUIRE_FALSE(f.path_monitor->has_handler());
    }
}

TEST_CASE("NetworkMonitor: path updates", "[network][monitor]") {
    MonitorFixture f;
    std::vector<PathStatus> statuses;
    std::vector<bool> expensive;
    std::vector<bool> constrained;
    auto s1 = f.monitor->SubscribePathStatus([&](const PathStatus& s) { statuses.push_back(s); });
    auto s2 = f.monitor->SubscribeExpensive([&](const bool& v) { expensive.push_back(v); });
    auto s3 = f.monitor->SubscribeConstrained([&](const bool& v) { constrained.push_back(v); });
    f.monitor->Start();

    SECTION("Each signal is published only when it changes") {
        const auto wifi = PathStatus::Satisfied(InterfaceType::Wifi);
        f.path_monitor->Push(wifi);
        f.Drain();
        f.path_monitor->Push(wifi);
        f.Drain();
        f.path_monitor->Push(wifi, true, false);
        f.Drain();
        f.path_monitor->Push(wifi, true, true);
        f.Drain();

        REQUIRE(statuses == std::vector<PathStatus>{PathStatus::Unknown(), wifi});
        REQUIRE(expensive == std::vector<bool>{false, true});
        REQUIRE(constrained == std::vector<bool>{false, true});

        NetworkPath current = f.monitor->Current();
        REQUIRE(current.status == wifi);
        REQUIRE(current.is_expensive);
        REQUIRE(current.is_constrained);
    }

    SECTION("Updates are applied in arrival order") {
        f.path_monitor->Push(PathStatus::RequiresConnection());
        f.path_monitor->Push(PathStatus::Unsatisfied(UnsatisfiedReason::NotAvailable));
        f.Drain();
        REQUIRE(statuses.size() == 3);
        REQUIRE(statuses[1] == PathStatus::RequiresConnection());
        REQUIRE(f.monitor->Current().status ==
                PathStatus::Unsatisfied(UnsatisfiedReason::NotAvailable));
    }

    SECTION("Updates after Stop are ignored") {
        f.path_monitor->Push(PathStatus::Satisfied(InterfaceType::Cellular));
        f.monitor->Stop();
        f.Drain();
        f.path_monitor->Push(PathStatus::Satisfied(InterfaceType::Wifi));
        f.Drain();
        REQUIRE(statuses == std::vector<PathStatus>{PathStatus::Unknown()});
        REQUIRE(f.monitor->Current() == NetworkPath{});
    }

    SECTION("Status stream holds the latest value") {
        auto stream = f.monitor->PathStatusStream();
        f.path_monitor->Push(PathStatus::Satisfied(InterfaceType::WiredEthernet));
        f.Drain();
        auto latest = stream->TryNext();
        REQUIRE(latest.has_value());
        REQUIRE(*latest == PathStatus::Satisfied(InterfaceType::WiredEthernet));
    }
}

TEST_CASE("NetworkMonitor: ping", "[network][monitor][ping]") {
    SECTION("Pings once immediately when started") {
        auto ping = std::make_shared<MockNetworkPing>(1h);
        ping->SetPingWhenUnsatisfied(true);
        MonitorFixture f(ping);
        std::vector<PingResult> results;
        auto sub = f.monitor->SubscribePingResults([&](const PingResult& r) { results.push_back(r); });

        f.monitor->Start();
        f.Drain();
        REQUIRE(ping->ping_calls() == 1);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].ok());
    }

    SECTION("should_ping is asked with the current status") {
        auto ping = std::make_shared<MockNetworkPing>(1h);
        MonitorFixture f(ping);
        f.monitor->Start();
        f.Drain();
        REQUIRE(ping->should_ping_calls() == 1);
        REQUIRE(ping->ping_calls() == 0);
    }

    SECTION("Repeats every interval until stopped") {
        auto ping = std::make_shared<MockNetworkPing>(10ms);
        ping->SetPingWhenUnsatisfied(true);
        MonitorFixture f(ping);

        f.monitor->Start();
        RunFor(f.io, 100ms);
        REQUIRE(ping->ping_calls() >= 3);

        f.monitor->Stop();
        f.Drain();
        const int after_stop = ping->ping_calls();
        RunFor(f.io, 50ms);
        REQUIRE(ping->ping_calls() == after_stop);
    }

    SECTION("Rounds are skipped until the path is satisfied") {
        auto ping = std::make_shared<MockNetworkPing>(10ms);
        MonitorFixture f(ping);

        f.monitor->Start();
        RunFor(f.io, 50ms);
        REQUIRE(ping->ping_calls() == 0);
        REQUIRE(ping->should_ping_calls() >= 2);

        f.path_monitor->Push(PathStatus::Satisfied(InterfaceType::Wifi));
        RunFor(f.io, 50ms);
        REQUIRE(ping->ping_calls() >= 1);
        f.monitor->Stop();
    }

    SECTION("Failed pings are published with their error") {
        auto ping = std::make_shared<MockNetworkPing>(1h);
        ping->SetPingWhenUnsatisfied(true);
        PingResult failure;
        failure.error = "host unreachable";
        ping->SetResult(failure);
        MonitorFixture f(ping);
        auto stream = f.monitor->PingResultStream();

        f.monitor->Start();
        f.Drain();
        auto result = stream->TryNext();
        REQUIRE(result.has_value());
        REQUIRE_FALSE(result->ok());
        REQUIRE(*result->error == "host unreachable");
    }

    SECTION("A result arriving after Stop is dropped") {
        auto ping = std::make_shared<MockNetworkPing>(1h);
        ping->SetPingWhenUnsatisfied(true);
        ping->SetHold(true);
        MonitorFixture f(ping);
        auto stream = f.monitor->PingResultStream();

        f.monitor->Start();
        f.Drain();
        REQUIRE(ping->ping_calls() == 1);

        f.monitor->Stop();
        REQUIRE(ping->CompleteNext(PingResult{}));
        f.Drain();
        REQUIRE_FALSE(stream->TryNext().has_value());
    }

    SECTION("Zero interval disables pinging") {
        auto ping = std::make_shared<MockNetworkPing>(0ms);
        ping->SetPingWhenUnsatisfied(true);
        MonitorFixture f(ping);
        f.monitor->Start();
        f.Drain();
        REQUIRE(ping->should_ping_calls() == 0);
        REQUIRE(ping->ping_calls() == 0);
    }
}
