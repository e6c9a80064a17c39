#include "attempt_executor.hpp"

#include <nlohmann/json.hpp>
#include <simdjson.h>

#include <exception>
#include <string>

#include "../../http/error/http_error.hpp"
#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace relay::attempt {
    AttemptExecutor::AttemptExecutor(std::shared_ptr<http::client::IHttpClient> client, std::vector<std::string> post_headers)
        : client_(std::move(client)), post_headers_(std::move(post_headers)) {}

    std::string AttemptExecutor::serialize_payload(const relay::model::JoinPayload& payload) {
        const nlohmann::ordered_json body = {{"code", payload.code_}, {"name", payload.name_}};
        return body.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }

    http::model::Request AttemptExecutor::build_request(const relay::model::AttemptDescriptor& descriptor, std::chrono::milliseconds timeout) const {
        http::model::Request req;
        req.url_ = descriptor.target_;
        req.method_ = relay::model::to_string(descriptor.method_);
        req.timeout_ = timeout;

        if (descriptor.method_ == relay::model::Method::POST) {
            req.headers_ = post_headers_;
            if (descriptor.payload_) {
                req.body_ = serialize_payload(*descriptor.payload_);
            }
        }

        return req;
    }

    relay::model::BodyValue AttemptExecutor::normalize_body(const http::model::Response& resp) {
        if (resp.body_read_failed_) {
            return {};
        }

        const std::string_view text = string_utils::strip_bom(resp.body_);
        if (text.empty()) {
            return {};
        }

        simdjson::dom::parser parser;
        simdjson::dom::element doc;
        if (parser.parse(text.data(), text.size()).get(doc) == simdjson::SUCCESS) {
            return relay::model::BodyValue{.kind_ = relay::model::BodyKind::JSON, .text_ = string_utils::trim(std::string(text))};
        }

        if (simdjson::validate_utf8(text.data(), text.size())) {
            return relay::model::BodyValue{.kind_ = relay::model::BodyKind::TEXT, .text_ = std::string(text)};
        }
        return relay::model::BodyValue{.kind_ = relay::model::BodyKind::TEXT, .text_ = string_utils::to_valid_utf8(text)};
    }

    relay::model::AttemptOutcome AttemptExecutor::execute(const relay::model::AttemptDescriptor& descriptor, std::chrono::milliseconds timeout) const {
        relay::model::AttemptOutcome outcome;
        outcome.descriptor_label_ = descriptor.label_;

        http::model::Response resp;
        try {
            resp = client_->send(build_request(descriptor, timeout));
        } catch (const http::http_error::TransportError& e) {
            outcome.failure_reason_ = constants::FAILURE_TIMEOUT_OR_NETWORK;
            outcome.failure_detail_ = e.what();
            return outcome;
        } catch (const std::exception& e) {
            // Handle setup failures count as unreachable.
            outcome.failure_reason_ = constants::FAILURE_TIMEOUT_OR_NETWORK;
            outcome.failure_detail_ = e.what();
            return outcome;
        }

        outcome.succeeded_ = http::model::is_success(resp.status_);
        outcome.http_status_ = resp.status_;
        outcome.body_ = normalize_body(resp);
        return outcome;
    }
}  // namespace relay::attempt
