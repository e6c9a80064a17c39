#ifndef JOIN_RELAY_CONFIG_HPP
#define JOIN_RELAY_CONFIG_HPP

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/log_utils.hpp"

namespace relay::config {
    // Read once at startup and shared by const reference for the rest of the process.
    struct RelayConfig {
        std::chrono::milliseconds timeout_{constants::DEFAULT_TIMEOUT_MS};
        std::vector<std::string> upstream_urls_;
        std::string upstream_base_;
        std::vector<std::string> upstream_headers_ = {constants::DEFAULT_CONTENT_TYPE_HEADER};
        std::string cors_origin_ = constants::DEFAULT_CORS_ORIGIN;
        log_utils::Level log_level_ = log_utils::Level::INFO;
    };

    using EnvLookup = std::function<std::optional<std::string>(const char*)>;

    std::optional<std::string> process_env(const char* key);

    [[nodiscard]] RelayConfig load_from_env(const EnvLookup& lookup = process_env);

    // Parses a JSON object of string values into "Name: value" header lines.
    // Anything else yields the default JSON content-type header.
    [[nodiscard]] std::vector<std::string> parse_upstream_headers(std::string_view json);

    [[nodiscard]] std::chrono::milliseconds parse_timeout(const std::optional<std::string>& raw);
}  // namespace relay::config

#endif
