#include "response_translator.hpp"

#include <nlohmann/json.hpp>

#include <string>

#include "../../http/model/model.hpp"

namespace relay::response {
    std::string dump(const nlohmann::ordered_json& json) { return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace); }

    nlohmann::ordered_json to_json(const relay::model::BodyValue& body) {
        switch (body.kind_) {
            case relay::model::BodyKind::JSON: {
                nlohmann::ordered_json parsed = nlohmann::ordered_json::parse(body.text_, nullptr, false);
                if (parsed.is_discarded()) {
                    return body.text_;
                }
                return parsed;
            }
            case relay::model::BodyKind::TEXT:
                return body.text_;
            case relay::model::BodyKind::EMPTY:
                return nlohmann::ordered_json::object();
        }
        return nlohmann::ordered_json::object();
    }

    std::string error_body(std::string_view message) {
        nlohmann::ordered_json out;
        out["error"] = std::string(message);
        return dump(out);
    }

    CallerResponse translate(const relay::model::FallbackResult& result) {
        if (result.joined_) {
            nlohmann::ordered_json out;
            out["joined"] = true;
            out["upstreamStatus"] = result.status_;
            out["via"] = result.via_.value_or("");
            if (result.data_) {
                out["data"] = to_json(*result.data_);
            } else {
                out["data"] = nullptr;
            }
            return CallerResponse{.http_status_ = static_cast<long>(http::model::HttpStatusCode::OK), .body_ = dump(out)};
        }

        nlohmann::ordered_json out;
        out["joined"] = false;
        out["error"] = result.error_message_.value_or("Upstream join failed");
        if (result.data_) {
            out["upstreamData"] = to_json(*result.data_);
        } else {
            out["upstreamData"] = nullptr;
        }

        const long status = result.status_ != 0 ? result.status_ : static_cast<long>(http::model::HttpStatusCode::BAD_GATEWAY);
        return CallerResponse{.http_status_ = status, .body_ = dump(out)};
    }
}  // namespace relay::response
