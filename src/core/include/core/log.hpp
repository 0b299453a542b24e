#pragma once
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace ce::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

// Replaces the default spdlog backend. Pass an empty function to restore it.
void set_sink(SinkFn sink) noexcept;

// Messages below the threshold are dropped before reaching any sink. Default: Info.
void set_level(Level lvl) noexcept;
Level level() noexcept;

// One JSON object per line on std::clog instead of the spdlog console pattern.
void set_json_mode(bool enabled) noexcept;
bool json_mode() noexcept;

void write(Level lvl, const std::string& msg) noexcept;
void trace(const std::string& msg) noexcept;
void debug(const std::string& msg) noexcept;
void info(const std::string& msg) noexcept;
void warn(const std::string& msg) noexcept;
void error(const std::string& msg) noexcept;
void critical(const std::string& msg) noexcept;

// Reads CE_LOG_LEVEL (trace|debug|info|warn|error|critical) and CE_LOG_JSON.
// Safe to call more than once; later calls re-apply the environment.
void init_from_env() noexcept;

const char* level_name(Level lvl) noexcept;
std::optional<Level> parse_level(std::string_view name) noexcept;

} // namespace ce::log
