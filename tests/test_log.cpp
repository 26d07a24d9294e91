#include <catch2/catch_test_macros.hpp>
#include "core/log.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

struct CapturedLog {
    std::vector<std::pair<ac::log::Level, std::string>> entries;

    CapturedLog() {
        ac::log::set_sink([this](ac::log::Level lvl, const std::string& msg) {
            entries.emplace_back(lvl, msg);
        });
    }
    ~CapturedLog() {
        ac::log::set_sink(nullptr);
        ac::log::set_level(ac::log::Level::Info);
    }
};

} // namespace

TEST_CASE("Custom sink receives messages with their level", "[log]") {
    CapturedLog capture;
    ac::log::set_level(ac::log::Level::Trace);

    ac::log::info("hello");
    ac::log::error("boom");

    REQUIRE(capture.entries.size() == 2);
    REQUIRE(capture.entries[0].first == ac::log::Level::Info);
    REQUIRE(capture.entries[0].second == "hello");
    REQUIRE(capture.entries[1].first == ac::log::Level::Error);
}

TEST_CASE("Messages below the configured level are dropped", "[log]") {
    CapturedLog capture;
    ac::log::set_level(ac::log::Level::Warn);

    ac::log::debug("hidden");
    ac::log::info("hidden too");
    ac::log::warn("shown");
    ac::log::critical("shown too");

    REQUIRE(capture.entries.size() == 2);
    REQUIRE(capture.entries[0].second == "shown");
    REQUIRE(ac::log::level() == ac::log::Level::Warn);
}

TEST_CASE("JSON mode toggles", "[log]") {
    REQUIRE_FALSE(ac::log::json_mode());
    ac::log::set_json_mode(true);
    REQUIRE(ac::log::json_mode());
    ac::log::set_json_mode(false);
    REQUIRE_FALSE(ac::log::json_mode());
}

TEST_CASE("Level names are stable", "[log]") {
    REQUIRE(std::string(ac::log::level_name(ac::log::Level::Warn)) == "warn");
    REQUIRE(std::string(ac::log::level_name(ac::log::Level::Critical)) == "critical");
}

TEST_CASE("JSON escaping covers quotes, backslashes and control characters", "[log]") {
    REQUIRE(ac::log::json_escape("plain") == "plain");
    REQUIRE(ac::log::json_escape("say \"hi\"") == "say \\\"hi\\\"");
    REQUIRE(ac::log::json_escape("C:\\clips") == "C:\\\\clips");
    REQUIRE(ac::log::json_escape("a\nb\tc\rd") == "a\\nb\\tc\\rd");
    REQUIRE(ac::log::json_escape(std::string("bell\x07")) == "bell\\u0007");
    REQUIRE(ac::log::json_escape(std::string("\x1f")) == "\\u001f");
}

TEST_CASE("JSON mode writes one valid line per message", "[log]") {
    std::ostringstream captured;
    auto* previous = std::clog.rdbuf(captured.rdbuf());
    ac::log::set_json_mode(true);

    ac::log::warn("line1\nline2 \"quoted\"");

    ac::log::set_json_mode(false);
    std::clog.rdbuf(previous);

    const std::string out = captured.str();
    REQUIRE(std::count(out.begin(), out.end(), '\n') == 1);
    REQUIRE(out.back() == '\n');
    REQUIRE(out.find("\"level\":\"warn\"") != std::string::npos);
    REQUIRE(out.find("\"msg\":\"line1\\nline2 \\\"quoted\\\"\"}") != std::string::npos);
}
