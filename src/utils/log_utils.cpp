#include "log_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

namespace log_utils {
    namespace {
        Level current_level = Level::INFO;
        std::ostream* current_sink = nullptr;

        const char* level_name(Level level) {
            switch (level) {
                case Level::DEBUG:
                    return "DEBUG";
                case Level::INFO:
                    return "INFO";
                case Level::WARN:
                    return "WARN";
                case Level::ERROR:
                    return "ERROR";
            }
            return "INFO";
        }
    }  // namespace

    void set_level(Level level) { current_level = level; }

    Level get_level() { return current_level; }

    std::optional<Level> parse_level(std::string_view name) {
        std::string lowered(name);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lowered == "debug") {
            return Level::DEBUG;
        }
        if (lowered == "info") {
            return Level::INFO;
        }
        if (lowered == "warn" || lowered == "warning") {
            return Level::WARN;
        }
        if (lowered == "error") {
            return Level::ERROR;
        }
        return std::nullopt;
    }

    void set_sink(std::ostream* sink) { current_sink = sink; }

    void log(Level level, std::string_view message) {
        if (level < current_level) {
            return;
        }
        std::ostream& out = current_sink != nullptr ? *current_sink : std::clog;
        out << "[join_relay] " << level_name(level) << ' ' << message << '\n';
    }

    void debug(std::string_view message) { log(Level::DEBUG, message); }

    void info(std::string_view message) { log(Level::INFO, message); }

    void warn(std::string_view message) { log(Level::WARN, message); }

    void error(std::string_view message) { log(Level::ERROR, message); }
}  // namespace log_utils
