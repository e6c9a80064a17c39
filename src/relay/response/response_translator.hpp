#ifndef JOIN_RELAY_RESPONSE_TRANSLATOR_HPP
#define JOIN_RELAY_RESPONSE_TRANSLATOR_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

#include "../model/model.hpp"

namespace relay::response {
    struct CallerResponse {
        long http_status_ = 0;
        std::string body_;
    };

    // success: {"joined":true,"upstreamStatus":..,"via":..,"data":..}       HTTP 200
    // failure: {"joined":false,"error":..,"upstreamData":..|null}           HTTP result status, 502 if unset
    [[nodiscard]] CallerResponse translate(const relay::model::FallbackResult& result);

    // EMPTY renders as {}, TEXT as a JSON string, JSON as the parsed upstream document.
    [[nodiscard]] nlohmann::ordered_json to_json(const relay::model::BodyValue& body);

    // {"error": message}
    [[nodiscard]] std::string error_body(std::string_view message);

    // Compact dump; invalid UTF-8 becomes U+FFFD instead of throwing.
    [[nodiscard]] std::string dump(const nlohmann::ordered_json& json);
}  // namespace relay::response

#endif
