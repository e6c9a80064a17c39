#ifndef JOIN_RELAY_LOG_UTILS_HPP
#define JOIN_RELAY_LOG_UTILS_HPP

#include <optional>
#include <ostream>
#include <string_view>

// Line-oriented diagnostics on stderr. stdout is reserved for the CGI response.
namespace log_utils {
    enum class Level { DEBUG, INFO, WARN, ERROR };

    void set_level(Level level);
    [[nodiscard]] Level get_level();
    [[nodiscard]] std::optional<Level> parse_level(std::string_view name);

    // Tests redirect this; nullptr restores std::clog.
    void set_sink(std::ostream* sink);

    void log(Level level, std::string_view message);
    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);
}  // namespace log_utils

#endif
