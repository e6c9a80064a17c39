#ifndef JOIN_RELAY_HTTP_MODEL_HPP
#define JOIN_RELAY_HTTP_MODEL_HPP

#include <chrono>
#include <string>
#include <vector>

namespace http::model {
    const long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    const long HTTP_SUCCESS_UPPER_BOUNDARY = 300;

    enum class HttpStatusCode : long {
        OK = 200,
        NO_CONTENT = 204,
        BAD_REQUEST = 400,
        METHOD_NOT_ALLOWED = 405,
        INTERNAL_SERVER_ERROR = 500,
        BAD_GATEWAY = 502,
    };

    inline bool is_success(long status) { return status >= HTTP_SUCCESS_LOWER_BOUNDARY && status < HTTP_SUCCESS_UPPER_BOUNDARY; }

    struct Request {
        std::string url_;
        std::string method_ = "GET";
        std::string body_;

        std::vector<std::string> headers_;

        // Bounds connect, send and the full body read together.
        std::chrono::milliseconds timeout_{0};
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        std::string effective_url_;

        // Status line arrived but the body could not be read to the end; body_ is empty.
        bool body_read_failed_ = false;
    };
}  // namespace http::model

#endif
