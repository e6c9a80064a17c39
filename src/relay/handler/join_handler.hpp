#ifndef JOIN_RELAY_JOIN_HANDLER_HPP
#define JOIN_RELAY_JOIN_HANDLER_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../attempt/attempt_executor.hpp"
#include "../config/config.hpp"
#include "../fallback/fallback_coordinator.hpp"
#include "../model/model.hpp"

namespace relay::handler {
    const char* const MISSING_FIELDS_MESSAGE = "Missing code or name";
    const char* const METHOD_NOT_ALLOWED_MESSAGE = "Use POST /api/join with JSON { code, name }";

    struct InboundRequest {
        std::string method_;
        std::string body_;
    };

    using HeaderList = std::vector<std::pair<std::string, std::string>>;

    struct HandlerResponse {
        long status_ = 0;
        HeaderList headers_;
        std::string body_;
    };

    // The Access-Control-* headers carried by every response, including fatal errors.
    [[nodiscard]] HeaderList cors_headers(std::string_view origin);

    // CORS headers, JSON content type and {"error": message}.
    [[nodiscard]] HandlerResponse error_response(long status, std::string_view origin, std::string_view message);

    class JoinHandler {
       public:
        // config must outlive the handler.
        JoinHandler(const relay::config::RelayConfig& config, std::shared_ptr<relay::attempt::IAttemptExecutor> executor);
        JoinHandler(const relay::config::RelayConfig& config, std::shared_ptr<http::client::IHttpClient> client);

        [[nodiscard]] HandlerResponse handle(const InboundRequest& req) const;

        // Returns the payload only when the whole body is one JSON object with non-empty string code and name.
        [[nodiscard]] static std::optional<relay::model::JoinPayload> parse_join_body(std::string_view body);

       private:
        [[nodiscard]] HandlerResponse with_cors(long status) const;

        const relay::config::RelayConfig& config_;
        relay::fallback::FallbackCoordinator coordinator_;
    };
}  // namespace relay::handler

#endif
