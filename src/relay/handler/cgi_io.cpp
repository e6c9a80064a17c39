#include "cgi_io.hpp"

#include <iterator>
#include <string>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace relay::handler {
    InboundRequest read_cgi_request(std::istream& in, const relay::config::EnvLookup& lookup) {
        InboundRequest req;
        req.method_ = lookup(constants::ENV_REQUEST_METHOD).value_or("POST");

        const std::optional<std::string> raw_length = lookup(constants::ENV_CONTENT_LENGTH);
        const std::optional<long> length = raw_length ? string_utils::parse_long(*raw_length) : std::nullopt;

        if (length && *length >= 0) {
            req.body_.resize(static_cast<size_t>(*length));
            in.read(req.body_.data(), static_cast<std::streamsize>(req.body_.size()));
            req.body_.resize(static_cast<size_t>(in.gcount()));
        } else {
            req.body_.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        }

        return req;
    }

    const char* reason_phrase(long status) {
        switch (status) {
            case 200:
                return "OK";
            case 201:
                return "Created";
            case 202:
                return "Accepted";
            case 204:
                return "No Content";
            case 400:
                return "Bad Request";
            case 401:
                return "Unauthorized";
            case 403:
                return "Forbidden";
            case 404:
                return "Not Found";
            case 405:
                return "Method Not Allowed";
            case 409:
                return "Conflict";
            case 422:
                return "Unprocessable Entity";
            case 429:
                return "Too Many Requests";
            case 500:
                return "Internal Server Error";
            case 502:
                return "Bad Gateway";
            case 503:
                return "Service Unavailable";
            case 504:
                return "Gateway Timeout";
            default:
                return "Unknown";
        }
    }

    void write_cgi_response(std::ostream& out, const HandlerResponse& response) {
        out << "Status: " << response.status_ << ' ' << reason_phrase(response.status_) << "\r\n";
        for (const auto& [name, value] : response.headers_) {
            out << name << ": " << value << "\r\n";
        }
        out << "\r\n" << response.body_;
        out.flush();
    }
}  // namespace relay::handler
