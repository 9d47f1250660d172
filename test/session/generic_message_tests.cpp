// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for the flat message helpers

#include <catch2/catch_test_macros.hpp>
#include "session/generic_message.hpp"
#include "session/session_state.hpp"

using namespace peerlink::session;

TEST_CASE("GenericMessage: well-formedness", "[session][message]") {
    SECTION("Flat scalars are accepted") {
        GenericMessage msg = {{"text", "hi"}, {"count", 3}, {"ratio", 0.5}, {"ok", true}};
        msg["blob"] = BytesValue(Bytes{1, 2, 3});
        REQUIRE(IsWellFormed(msg));
        REQUIRE(IsWellFormed(EmptyMessage()));
    }

    SECTION("Nested values are rejected with the offending key") {
        GenericMessage msg = {{"text", "hi"}, {"nested", {{"a", 1}}}};
        std::string reason;
        REQUIRE_FALSE(IsWellFormed(msg, &reason));
        REQUIRE(reason.find("nested") != std::string::npos);

        GenericMessage with_array = {{"list", {1, 2, 3}}};
        REQUIRE_FALSE(IsWellFormed(with_array));

        GenericMessage with_null = {{"nothing", nullptr}};
        REQUIRE_FALSE(IsWellFormed(with_null));
    }

    SECTION("Non-objects are rejected") {
        std::string reason;
        REQUIRE_FALSE(IsWellFormed(GenericMessage::array({1, 2}), &reason));
        REQUIRE(reason == "not an object");
        REQUIRE_FALSE(IsWellFormed(GenericMessage("text")));
    }

    SECTION("Envelope parameters may hold one flat level") {
        GenericMessage envelope = MakeEnvelope("color", {{"r", 1}, {"g", 0}, {"b", 0}});
        REQUIRE(IsWellFormed(envelope));

        envelope[keys::PARAMETERS]["deep"] = {{"x", 1}};
        std::string reason;
        REQUIRE_FALSE(IsWellFormed(envelope, &reason));
        REQUIRE(reason.find("parameters.deep") != std::string::npos);
    }
}

TEST_CASE("GenericMessage: envelope and blob helpers", "[session][message]") {
    SECTION("MakeEnvelope with null parameters yields an empty object") {
        GenericMessage envelope = MakeEnvelope("ping", nullptr);
        REQUIRE(envelope[keys::TYPE_KEY] == "ping");
        REQUIRE(envelope[keys::PARAMETERS].is_object());
        REQUIRE(envelope[keys::PARAMETERS].empty());
    }

    SECTION("GetBytes reads blobs only") {
        GenericMessage msg = {{"name", "x"}};
        msg["data"] = BytesValue(Bytes{0xde, 0xad});
        auto data = GetBytes(msg, "data");
        REQUIRE(data.has_value());
        REQUIRE(*data == Bytes{0xde, 0xad});
        REQUIRE_FALSE(GetBytes(msg, "name").has_value());
        REQUIRE_FALSE(GetBytes(msg, "missing").has_value());
        REQUIRE_FALSE(GetBytes(GenericMessage::array(), "data").has_value());
    }

    SECTION("Describe summarizes blobs instead of dumping them") {
        GenericMessage msg = EmptyMessage();
        msg["data"] = BytesValue(Bytes(1024, 0x55));
        REQUIRE(Describe(msg) == "{\"data\":<1024 bytes>}");
    }

    SECTION("Describe tolerates invalid UTF-8 from a peer") {
        GenericMessage msg{{"text", std::string("\xff\xfe")}};
        std::string text;
        REQUIRE_NOTHROW(text = Describe(msg));
        REQUIRE(text.find("text") != std::string::npos);
        REQUIRE_NOTHROW(Describe(GenericMessage(std::string("\xc3"))));
    }
}

TEST_CASE("SessionState: equality and formatting", "[session][state]") {
    SessionState a;
    SessionState b;
    REQUIRE(a == b);
    REQUIRE(a.activation == ActivationState::NotActivated);
    REQUIRE_FALSE(a.reachable);
    REQUIRE_FALSE(a.peer_installed);
    REQUIRE_FALSE(a.peer_paired.has_value());

    b.peer_paired = false;
    REQUIRE(a != b);

    b = a;
    b.reachable = true;
    REQUIRE(a != b);
    REQUIRE(b.ToString().find("reachable") != std::string::npos);
}
