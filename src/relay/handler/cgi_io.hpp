#ifndef JOIN_RELAY_CGI_IO_HPP
#define JOIN_RELAY_CGI_IO_HPP

#include <istream>
#include <ostream>
#include <string>

#include "../config/config.hpp"
#include "join_handler.hpp"

namespace relay::handler {
    // REQUEST_METHOD defaults to POST so the binary can be driven from a shell.
    // Reads CONTENT_LENGTH bytes from in, or everything when the length is absent or invalid.
    [[nodiscard]] InboundRequest read_cgi_request(std::istream& in, const relay::config::EnvLookup& lookup = relay::config::process_env);

    void write_cgi_response(std::ostream& out, const HandlerResponse& response);

    [[nodiscard]] const char* reason_phrase(long status);
}  // namespace relay::handler

#endif
