#include "log.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>

#include "string_utils.hpp"

namespace {

struct LogSink {
    std::mutex mutex;
    vnstage::log::Level level = vnstage::log::Level::Info;
    std::unique_ptr<std::ofstream> file;
    std::chrono::steady_clock::time_point origin = std::chrono::steady_clock::now();
};

LogSink& sink() {
    static LogSink s;
    return s;
}

std::atomic<bool>& env_applied() {
    static std::atomic<bool> applied{false};
    return applied;
}

bool env_flag_enabled(const char* value) {
    if (!value || !*value) return false;
    const char c = *value;
    return c == '1' || c == 'y' || c == 'Y' || c == 't' || c == 'T';
}

void apply_env_once() {
    bool expected = false;
    if (!env_applied().compare_exchange_strong(expected, true)) {
        return;
    }
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (const char* v = std::getenv("VNSTAGE_LOG_LEVEL")) {
        if (auto parsed = vnstage::log::parse_level(v)) {
            s.level = *parsed;
        }
    }
    const char* path = std::getenv("VNSTAGE_LOG_FILE");
    if (path && *path) {
        std::ios_base::openmode mode = std::ios::out;
        mode |= env_flag_enabled(std::getenv("VNSTAGE_LOG_APPEND")) ? std::ios::app : std::ios::trunc;
        auto file = std::make_unique<std::ofstream>(path, mode);
        if (file->good()) {
            s.file = std::move(file);
        }
    }
}

const char* level_tag(vnstage::log::Level level) {
    switch (level) {
        case vnstage::log::Level::Error: return "ERROR";
        case vnstage::log::Level::Warn:  return "WARN";
        case vnstage::log::Level::Info:  return "INFO";
        case vnstage::log::Level::Debug: return "DEBUG";
    }
    return "INFO";
}

void write_line(vnstage::log::Level level, const std::string& message) {
    apply_env_once();
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    if (static_cast<int>(level) > static_cast<int>(s.level)) {
        return;
    }
    using namespace std::chrono;
    const double secs = duration_cast<duration<double>>(steady_clock::now() - s.origin).count();
    std::ostringstream line;
    line << '[' << level_tag(level) << "] +" << std::fixed << std::setprecision(3) << secs
         << "s: " << message << '\n';
    const std::string text = line.str();
    std::ostream& os = (level == vnstage::log::Level::Error) ? std::cerr : std::cout;
    os << text;
    os.flush();
    if (s.file) {
        (*s.file) << text;
        s.file->flush();
    }
}

}

namespace vnstage::log {

void set_level(Level level) {
    apply_env_once();
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.level = level;
}

Level level() {
    apply_env_once();
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.level;
}

std::optional<Level> parse_level(std::string_view text) {
    const std::string lower = vnstage::strings::to_lower_copy(vnstage::strings::trim_copy(text));
    if (lower == "error") return Level::Error;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "info") return Level::Info;
    if (lower == "debug") return Level::Debug;
    return std::nullopt;
}

void reset_time_origin() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mutex);
    s.origin = std::chrono::steady_clock::now();
}

void error(const std::string& message) { write_line(Level::Error, message); }
void warn (const std::string& message) { write_line(Level::Warn,  message); }
void info (const std::string& message) { write_line(Level::Info,  message); }
void debug(const std::string& message) { write_line(Level::Debug, message); }

}
