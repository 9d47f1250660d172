// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Tests for settings file loading/saving and the file helpers

#include <catch2/catch_test_macros.hpp>
#include "session/session_controller.hpp"
#include "util/files.hpp"
#include "util/session_settings.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace peerlink::util;
using namespace std::chrono_literals;

namespace {

std::filesystem::path TestDir() {
    auto dir = std::filesystem::temp_directory_path() /
               ("peerlink_settings_test_" + std::to_string(getpid()));
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

void WriteText(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::trunc);
    out << text;
}

} // namespace

TEST_CASE("File utilities", "[util][files]") {
    auto dir = TestDir();

    SECTION("ensure_directory creates nested directories") {
        auto nested = dir / "a" / "b";
        REQUIRE(ensure_directory(nested));
        REQUIRE(std::filesystem::is_directory(nested));
        REQUIRE(ensure_directory(nested));
    }

    SECTION("atomic_write_file then read_file_string") {
        auto path = dir / "data.json";
        REQUIRE(atomic_write_file(path, "{\"a\":1}"));
        REQUIRE(read_file_string(path) == "{\"a\":1}");

        REQUIRE(atomic_write_file(path, "second"));
        REQUIRE(read_file_string(path) == "second");
        // No temp files left behind
        size_t entries = 0;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            (void)entry;
            ++entries;
        }
        REQUIRE(entries == 1);
    }

    SECTION("read_file_string on a missing file") {
        REQUIRE(read_file_string(dir / "missing").empty());
    }

    SECTION("Oversized files are not read") {
        auto path = dir / "big";
        WriteText(path, std::string(MAX_CONFIG_FILE_SIZE + 1, 'x'));
        REQUIRE(read_file_string(path).empty());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("SessionSettings: load", "[util][settings]") {
    auto dir = TestDir();
    auto path = dir / "peerlink.json";
    SessionSettings settings;

    SECTION("Missing file keeps defaults") {
        REQUIRE_FALSE(LoadSessionConfig(path, settings));
        REQUIRE(settings.reply_timeout == 10s);
        REQUIRE(settings.activation_timeout == 5s);
        REQUIRE(settings.log_level == "info");
    }

    SECTION("All fields") {
        WriteText(path, R"({
            "reply_timeout_ms": 2500,
            "activation_timeout_ms": 750,
            "log_level": "debug",
            "log_file": "/tmp/peerlink.log",
            "component_levels": {"codec": "trace", "transport": "warn"},
            "unknown_key": [1, 2, 3]
        })");
        REQUIRE(LoadSessionConfig(path, settings));
        REQUIRE(settings.reply_timeout == 2500ms);
        REQUIRE(settings.activation_timeout == 750ms);
        REQUIRE(settings.log_level == "debug");
        REQUIRE(settings.log_file == "/tmp/peerlink.log");
        REQUIRE(settings.component_levels.size() == 2);
        REQUIRE(settings.component_levels.at("codec") == "trace");
    }

    SECTION("Partial file only overrides what it names") {
        WriteText(path, R"({"reply_timeout_ms": 100})");
        REQUIRE(LoadSessionConfig(path, settings));
        REQUIRE(settings.reply_timeout == 100ms);
        REQUIRE(settings.activation_timeout == 5s);
    }

    SECTION("Rejected fields keep their previous values") {
        WriteText(path, R"({
            "reply_timeout_ms": -5,
            "activation_timeout_ms": "soon",
            "log_level": "verbose",
            "component_levels": {"codec": 3, "session": "error"}
        })");
        REQUIRE_FALSE(LoadSessionConfig(path, settings));
        REQUIRE(settings.reply_timeout == 10s);
        REQUIRE(settings.activation_timeout == 5s);
        REQUIRE(settings.log_level == "info");
        REQUIRE(settings.component_levels.count("codec") == 0);
        REQUIRE(settings.component_levels.at("session") == "error");
    }

    SECTION("Timeouts beyond one day are rejected") {
        WriteText(path, R"({
            "reply_timeout_ms": 18446744073709551615,
            "activation_timeout_ms": 86400001
        })");
        REQUIRE_FALSE(LoadSessionConfig(path, settings));
        REQUIRE(settings.reply_timeout == 10s);
        REQUIRE(settings.activation_timeout == 5s);

        WriteText(path, R"({"reply_timeout_ms": 86400000})");
        REQUIRE(LoadSessionConfig(path, settings));
        REQUIRE(settings.reply_timeout == 24h);
    }

    SECTION("Unparsable file") {
        WriteText(path, "{ not json");
        REQUIRE_FALSE(LoadSessionConfig(path, settings));
        REQUIRE(settings.reply_timeout == 10s);
    }

    SECTION("Root must be an object") {
        WriteText(path, "[1, 2]");
        REQUIRE_FALSE(LoadSessionConfig(path, settings));
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("SessionSettings: save and reload", "[util][settings]") {
    auto dir = TestDir();
    auto path = dir / "nested" / "peerlink.json";

    SessionSettings original;
    original.reply_timeout = 1234ms;
    original.activation_timeout = 42ms;
    original.log_level = "warn";
    original.component_levels["session"] = "debug";

    REQUIRE(ensure_directory(path.parent_path()));
    REQUIRE(SaveSessionConfig(path, original));

    SessionSettings loaded;
    REQUIRE(LoadSessionConfig(path, loaded));
    REQUIRE(loaded.reply_timeout == original.reply_timeout);
    REQUIRE(loaded.activation_timeout == original.activation_timeout);
    REQUIRE(loaded.log_level == "warn");
    REQUIRE(loaded.log_file.empty());
    REQUIRE(loaded.component_levels == original.component_levels);

    std::filesystem::remove_all(dir);
}

TEST_CASE("SessionSettings: controller config", "[util][settings]") {
    SessionSettings settings;
    settings.reply_timeout = 300ms;
    settings.activation_timeout = 900ms;

    auto config = peerlink::session::SessionController::Config::FromSettings(settings);
    REQUIRE(config.reply_timeout == 300ms);
    REQUIRE(config.activation_timeout == 900ms);
    REQUIRE(config.io_threads == 1);

    REQUIRE(IsValidLogLevel("trace"));
    REQUIRE(IsValidLogLevel("off"));
    REQUIRE_FALSE(IsValidLogLevel("verbose"));
    REQUIRE(DefaultConfigPath().filename() == "peerlink.json");
}
