#include "join_handler.hpp"

#include <simdjson.h>

#include <string>

#include "../../http/model/model.hpp"
#include "../../utils/log_utils.hpp"
#include "../candidates/candidate_builder.hpp"
#include "../response/response_translator.hpp"

namespace relay::handler {
    struct CorsHeaders {
        static constexpr const char* ALLOW_ORIGIN = "Access-Control-Allow-Origin";
        static constexpr const char* ALLOW_METHODS = "Access-Control-Allow-Methods";
        static constexpr const char* ALLOW_HEADERS = "Access-Control-Allow-Headers";
        static constexpr const char* ALLOWED_METHODS = "POST,OPTIONS";
        static constexpr const char* ALLOWED_HEADERS = "Content-Type";
    };

    HeaderList cors_headers(std::string_view origin) {
        return {
            {CorsHeaders::ALLOW_ORIGIN, std::string(origin)},
            {CorsHeaders::ALLOW_METHODS, CorsHeaders::ALLOWED_METHODS},
            {CorsHeaders::ALLOW_HEADERS, CorsHeaders::ALLOWED_HEADERS},
        };
    }

    namespace {
        HandlerResponse json_response(long status, std::string_view origin, std::string body) {
            HandlerResponse r;
            r.status_ = status;
            r.headers_ = cors_headers(origin);
            r.headers_.emplace_back("Content-Type", "application/json");
            r.body_ = std::move(body);
            return r;
        }
    }  // namespace

    HandlerResponse error_response(long status, std::string_view origin, std::string_view message) {
        return json_response(status, origin, relay::response::error_body(message));
    }

    JoinHandler::JoinHandler(const relay::config::RelayConfig& config, std::shared_ptr<relay::attempt::IAttemptExecutor> executor)
        : config_(config), coordinator_(std::move(executor)) {}

    JoinHandler::JoinHandler(const relay::config::RelayConfig& config, std::shared_ptr<http::client::IHttpClient> client)
        : JoinHandler(config, std::make_shared<relay::attempt::AttemptExecutor>(std::move(client), config.upstream_headers_)) {}

    HandlerResponse JoinHandler::with_cors(long status) const {
        HandlerResponse r;
        r.status_ = status;
        r.headers_ = cors_headers(config_.cors_origin_);
        return r;
    }

    std::optional<relay::model::JoinPayload> JoinHandler::parse_join_body(std::string_view body) {
        simdjson::ondemand::parser parser;
        simdjson::padded_string padded(body);
        simdjson::ondemand::document doc;
        if (parser.iterate(padded).get(doc) != simdjson::SUCCESS) {
            return std::nullopt;
        }

        simdjson::ondemand::object object;
        if (doc.get_object().get(object) != simdjson::SUCCESS) {
            return std::nullopt;
        }

        // Walk every field so the end-of-document check below sees what follows the object.
        std::optional<std::string> code;
        std::optional<std::string> name;
        for (auto field : object) {
            std::string_view key;
            if (field.unescaped_key().get(key) != simdjson::SUCCESS) {
                return std::nullopt;
            }
            if (key != "code" && key != "name") {
                continue;
            }

            std::string_view value;
            if (field.value().get_string().get(value) != simdjson::SUCCESS) {
                return std::nullopt;
            }
            (key == "code" ? code : name) = std::string(value);
        }

        if (!doc.at_end()) {
            return std::nullopt;
        }

        if (!code || !name || code->empty() || name->empty()) {
            return std::nullopt;
        }

        return relay::model::JoinPayload{.code_ = std::move(*code), .name_ = std::move(*name)};
    }

    HandlerResponse JoinHandler::handle(const InboundRequest& req) const {
        if (req.method_ == "OPTIONS") {
            return with_cors(static_cast<long>(http::model::HttpStatusCode::NO_CONTENT));
        }

        if (req.method_ != "POST") {
            log_utils::info("rejected " + req.method_ + " request");
            return error_response(static_cast<long>(http::model::HttpStatusCode::METHOD_NOT_ALLOWED), config_.cors_origin_, METHOD_NOT_ALLOWED_MESSAGE);
        }

        const std::optional<relay::model::JoinPayload> payload = parse_join_body(req.body_);
        if (!payload) {
            log_utils::info("rejected join request without code or name");
            return error_response(static_cast<long>(http::model::HttpStatusCode::BAD_REQUEST), config_.cors_origin_, MISSING_FIELDS_MESSAGE);
        }

        const auto descriptors = relay::candidates::build_candidates(config_, payload->code_, payload->name_);
        const relay::model::FallbackResult result = coordinator_.dispatch(descriptors, config_.timeout_);
        relay::response::CallerResponse caller = relay::response::translate(result);

        return json_response(caller.http_status_, config_.cors_origin_, std::move(caller.body_));
    }
}  // namespace relay::handler
