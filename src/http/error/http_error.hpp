#ifndef JOIN_RELAY_HTTP_ERROR_HPP
#define JOIN_RELAY_HTTP_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::http_error {
    struct TransportError : public std::runtime_error {
        std::string url_;
        int curl_code_;
        bool timed_out_;
        explicit TransportError(std::string u, int curl_code, bool timed_out, const std::string &msg);
    };
}  // namespace http::http_error

#endif
