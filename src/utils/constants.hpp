#ifndef JOIN_RELAY_CONSTANTS_HPP
#define JOIN_RELAY_CONSTANTS_HPP

#include <array>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr int HEX_RADIX = 16;
    inline constexpr long DEFAULT_TIMEOUT_MS = 8000;
    inline constexpr long MAX_TIMEOUT_MS = 3'600'000;
    inline constexpr long MAX_REDIRECTS = 10;
    inline constexpr std::array<const char*, 3> DEFAULT_JOIN_PATHS = {"/api/join", "/v1/join", "/join"};
    inline constexpr const char* DEFAULT_CORS_ORIGIN = "*";
    inline constexpr const char* DEFAULT_CONTENT_TYPE_HEADER = "Content-Type: application/json";
    inline constexpr const char* FAILURE_TIMEOUT_OR_NETWORK = "timeout-or-network";
    inline constexpr const char* USER_AGENT = "join-relay/1.0";

    // Environment keys read once at startup.
    inline constexpr const char* ENV_TIMEOUT_MS = "TIMEOUT_MS";
    inline constexpr const char* ENV_UPSTREAM_URLS = "UPSTREAM_URLS";
    inline constexpr const char* ENV_UPSTREAM_BASE = "UPSTREAM_BASE";
    inline constexpr const char* ENV_UPSTREAM_HEADERS = "UPSTREAM_HEADERS";
    inline constexpr const char* ENV_CORS_ORIGIN = "CORS_ORIGIN";
    inline constexpr const char* ENV_LOG_LEVEL = "LOG_LEVEL";
    inline constexpr const char* ENV_REQUEST_METHOD = "REQUEST_METHOD";
    inline constexpr const char* ENV_CONTENT_LENGTH = "CONTENT_LENGTH";

}  // namespace constants

#endif
