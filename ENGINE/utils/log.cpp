#include "log.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace {

using rowscroll::log::Level;

struct LogState {
    std::mutex mutex;
    Level level = Level::Info;
    bool level_from_env = false;
    std::unique_ptr<std::ofstream> file_sink;
    std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
};

LogState& state() {
    static LogState s;
    return s;
}

std::atomic<bool>& env_loaded() {
    static std::atomic<bool> loaded{false};
    return loaded;
}

bool env_flag_set(const char* value) {
    if (!value || !*value) {
        return false;
    }
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(*value)));
    return c == '1' || c == 'y' || c == 't';
}

void load_env_once() {
    bool expected = false;
    if (!env_loaded().compare_exchange_strong(expected, true)) {
        return;
    }
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (const char* v = std::getenv("ROWSCROLL_LOG_LEVEL")) {
        if (auto parsed = rowscroll::log::parse_level(v)) {
            s.level = *parsed;
            s.level_from_env = true;
        }
    }
    const char* file = std::getenv("ROWSCROLL_LOG_FILE");
    if (file && *file) {
        std::ios_base::openmode mode = std::ios::out;
        mode |= env_flag_set(std::getenv("ROWSCROLL_LOG_APPEND")) ? std::ios::app : std::ios::trunc;
        auto sink = std::make_unique<std::ofstream>(file, mode);
        if (sink->good()) {
            s.file_sink = std::move(sink);
        }
    }
}

std::string format_line(Level level, std::string_view component, const std::string& message, double secs) {
    std::ostringstream line;
    line.setf(std::ios::fixed);
    line << '[' << rowscroll::log::level_name(level) << "] +" << std::setprecision(3) << secs << "s: ";
    if (!component.empty()) {
        line << '[' << component << "] ";
    }
    line << message << '\n';
    return line.str();
}

void write_line(Level level, std::string_view component, const std::string& message) {
    if (!rowscroll::log::enabled(level)) {
        return;
    }
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - s.origin).count();
    const std::string line = format_line(level, component, message, secs);
    std::ostream& os = (level == Level::Error) ? std::cerr : std::cout;
    os << line;
    os.flush();
    if (s.file_sink) {
        *s.file_sink << line;
        s.file_sink->flush();
    }
}

}

namespace rowscroll::log {

void set_level(Level lvl) {
    load_env_once();
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = lvl;
}

bool set_default_level(Level lvl) {
    load_env_once();
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.level_from_env) {
        return false;
    }
    s.level = lvl;
    return true;
}

Level level() {
    load_env_once();
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.level;
}

bool enabled(Level lvl) {
    return static_cast<int>(lvl) <= static_cast<int>(level());
}

std::optional<Level> parse_level(std::string_view text) {
    std::string lower(text);
    for (auto& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return std::nullopt;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::Error: return "ERROR";
        case Level::Warn:  return "WARN";
        case Level::Info:  return "INFO";
        case Level::Debug: return "DEBUG";
    }
    return "INFO";
}

void reset_time_origin() {
    LogState& s = state();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.origin = std::chrono::steady_clock::now();
}

void error(const std::string& message) { write_line(Level::Error, {}, message); }
void warn (const std::string& message) { write_line(Level::Warn,  {}, message); }
void info (const std::string& message) { write_line(Level::Info,  {}, message); }
void debug(const std::string& message) { write_line(Level::Debug, {}, message); }

void error(std::string_view component, const std::string& message) { write_line(Level::Error, component, message); }
void warn (std::string_view component, const std::string& message) { write_line(Level::Warn,  component, message); }
void info (std::string_view component, const std::string& message) { write_line(Level::Info,  component, message); }
void debug(std::string_view component, const std::string& message) { write_line(Level::Debug, component, message); }

}
