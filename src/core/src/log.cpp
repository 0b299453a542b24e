#include "core/log.hpp"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace ce::log {

namespace {

SinkFn g_sink;
std::mutex g_mutex;
std::atomic<bool> g_json{false};
std::atomic<int> g_level{static_cast<int>(Level::Info)};

spdlog::level::level_enum to_spdlog(Level lvl) {
    switch(lvl) {
        case Level::Trace: return spdlog::level::trace;
        case Level::Debug: return spdlog::level::debug;
        case Level::Info: return spdlog::level::info;
        case Level::Warn: return spdlog::level::warn;
        case Level::Error: return spdlog::level::err;
        case Level::Critical: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

// Engine-owned logger so the host application's default logger keeps its own settings.
spdlog::logger& engine_logger() {
    static std::shared_ptr<spdlog::logger> logger = [] {
        auto existing = spdlog::get("color_engine");
        if(existing) return existing;
        auto created = spdlog::stderr_color_mt("color_engine");
        created->set_level(spdlog::level::trace);  // filtering happens in write()
        return created;
    }();
    return *logger;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream ts;
    ts << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms.count();
    return ts.str();
}

void append_json_escaped(std::string& out, const std::string& text) {
    for(char c : text) {
        switch(c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
}

// {"ts":"2024-01-01T12:00:00.000","level":"warn","logger":"color_engine","msg":"..."}
void emit_json(Level lvl, const std::string& msg) {
    std::string line = "{\"ts\":\"" + timestamp() + "\",\"level\":\"" + level_name(lvl) +
                       "\",\"logger\":\"color_engine\",\"msg\":\"";
    append_json_escaped(line, msg);
    line += "\"}\n";
    std::clog << line;
}

} // namespace

const char* level_name(Level lvl) noexcept {
    switch(lvl) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Critical: return "critical";
    }
    return "unknown";
}

std::optional<Level> parse_level(std::string_view name) noexcept {
    for(Level lvl : {Level::Trace, Level::Debug, Level::Info, Level::Warn, Level::Error, Level::Critical}) {
        if(name == level_name(lvl)) return lvl;
    }
    if(name == "warning") return Level::Warn;
    if(name == "err") return Level::Error;
    return std::nullopt;
}

void set_sink(SinkFn sink) noexcept {
    std::scoped_lock lock(g_mutex);
    g_sink = std::move(sink);
}

void set_level(Level lvl) noexcept { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }
Level level() noexcept { return static_cast<Level>(g_level.load(std::memory_order_relaxed)); }

void set_json_mode(bool enabled) noexcept { g_json.store(enabled, std::memory_order_relaxed); }
bool json_mode() noexcept { return g_json.load(std::memory_order_relaxed); }

void write(Level lvl, const std::string& msg) noexcept {
    if(static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
    std::scoped_lock lock(g_mutex);
    try {
        if(g_sink) g_sink(lvl, msg);
        else if(json_mode()) emit_json(lvl, msg);
        else engine_logger().log(to_spdlog(lvl), msg);
    } catch(const std::exception& e) {
        // A failing sink must not take down a color conversion.
        std::fprintf(stderr, "ce::log: sink failed: %s\n", e.what());
    }
}

void trace(const std::string& msg) noexcept { write(Level::Trace, msg); }
void debug(const std::string& msg) noexcept { write(Level::Debug, msg); }
void info(const std::string& msg) noexcept { write(Level::Info, msg); }
void warn(const std::string& msg) noexcept { write(Level::Warn, msg); }
void error(const std::string& msg) noexcept { write(Level::Error, msg); }
void critical(const std::string& msg) noexcept { write(Level::Critical, msg); }

void init_from_env() noexcept {
    if(const char* lvl = std::getenv("CE_LOG_LEVEL")) {
        if(auto parsed = parse_level(lvl)) {
            set_level(*parsed);
        } else {
            warn(std::string("CE_LOG_LEVEL: unknown level '") + lvl + "', keeping " + level_name(level()));
        }
    }
    if(const char* js = std::getenv("CE_LOG_JSON")) {
        std::string_view v(js);
        set_json_mode(!(v.empty() || v == "0" || v == "false"));
    }
}

} // namespace ce::log
