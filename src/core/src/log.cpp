#include "core/log.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <iostream>
#include <mutex>

#include <spdlog/spdlog.h>

namespace ac::log {

namespace {

SinkFn g_sink;
std::mutex g_mutex;
std::atomic<bool> g_json{false};
std::atomic<int> g_level{static_cast<int>(Level::Info)};

constexpr std::array<spdlog::level::level_enum, 6> kSpdlogLevels = {
    spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
    spdlog::level::warn,  spdlog::level::err,   spdlog::level::critical};

spdlog::level::level_enum to_spdlog(Level lvl) {
    return kSpdlogLevels[static_cast<size_t>(lvl)];
}

// Local time as 2024-05-01T12:00:00.123
std::string iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto t = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char stamp[40];
    std::snprintf(stamp, sizeof(stamp), "%s.%03d", date, static_cast<int>(ms));
    return stamp;
}

void emit_json(Level lvl, const std::string& msg) {
    std::string line = "{\"ts\":\"" + iso_timestamp() + "\",\"level\":\"" + level_name(lvl) +
                       "\",\"msg\":\"" + json_escape(msg) + "\"}\n";
    std::clog << line << std::flush;
}

void emit_spdlog(Level lvl, const std::string& msg) {
    spdlog::log(to_spdlog(lvl), "{}", msg);
}

} // namespace

const char* level_name(Level lvl) noexcept {
    switch (lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
    }
    return "unknown";
}

std::string json_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char code[8];
                    std::snprintf(code, sizeof(code), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += code;
                } else {
                    out += c;
                }
        }
    }
    return out;
}

void set_sink(SinkFn sink) noexcept {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void set_json_mode(bool enabled) noexcept { g_json.store(enabled, std::memory_order_relaxed); }
bool json_mode() noexcept { return g_json.load(std::memory_order_relaxed); }

void set_level(Level lvl) noexcept {
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
    // spdlog filters on its own level too; keep it open as far as ours.
    spdlog::set_level(to_spdlog(lvl));
}

Level level() noexcept { return static_cast<Level>(g_level.load(std::memory_order_relaxed)); }

void write(Level lvl, const std::string& msg) noexcept {
    if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
    std::scoped_lock lock(g_mutex);
    try {
        if (g_sink) {
            g_sink(lvl, msg);
        } else if (json_mode()) {
            emit_json(lvl, msg);
        } else {
            emit_spdlog(lvl, msg);
        }
    } catch (const std::exception& e) {
        std::fputs("log sink failed: ", stderr);
        std::fputs(e.what(), stderr);
        std::fputc('\n', stderr);
    }
}

void trace(const std::string& msg) noexcept { write(Level::Trace, msg); }
void debug(const std::string& msg) noexcept { write(Level::Debug, msg); }
void info(const std::string& msg) noexcept { write(Level::Info, msg); }
void warn(const std::string& msg) noexcept { write(Level::Warn, msg); }
void error(const std::string& msg) noexcept { write(Level::Error, msg); }
void critical(const std::string& msg) noexcept { write(Level::Critical, msg); }

} // namespace ac::log
