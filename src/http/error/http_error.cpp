#include "http_error.hpp"

#include <stdexcept>
#include <string>

namespace http::http_error {
    TransportError::TransportError(std::string u, int curl_code, bool timed_out,
                                   const std::string &msg)  // NOLINT(bugprone-easily-swappable-parameters)
        : std::runtime_error(msg), url_(std::move(u)), curl_code_(curl_code), timed_out_(timed_out) {}
};  // namespace http::http_error
