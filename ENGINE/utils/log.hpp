#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rowscroll::log {

enum class Level {
    Error = 0,
    Warn  = 1,
    Info  = 2,
    Debug = 3,
};

void set_level(Level level);
// Applies level unless ROWSCROLL_LOG_LEVEL named a valid one. Returns whether
// it was applied.
bool set_default_level(Level level);
Level level();
bool enabled(Level level);

// Accepts error|warn|warning|info|debug in any case.
std::optional<Level> parse_level(std::string_view text);
const char* level_name(Level level);

void reset_time_origin();

void error(const std::string& message);
void warn(const std::string& message);
void info(const std::string& message);
void debug(const std::string& message);

// Component-tagged variants, rendered as "[component] message".
void error(std::string_view component, const std::string& message);
void warn(std::string_view component, const std::string& message);
void info(std::string_view component, const std::string& message);
void debug(std::string_view component, const std::string& message);

}
