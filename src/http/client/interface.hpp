#ifndef JOIN_RELAY_CLIENT_INTERFACE_HPP
#define JOIN_RELAY_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Performs exactly one call. Any status code is returned as a Response;
        // transport failures and deadline expiry throw http_error::TransportError.
        virtual http::model::Response send(const http::model::Request& req) = 0;
    };
}  // namespace http::client

#endif
