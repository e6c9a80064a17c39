#ifndef JOIN_RELAY_RELAY_MODEL_HPP
#define JOIN_RELAY_RELAY_MODEL_HPP

#include <optional>
#include <string>

namespace relay::model {
    enum class Method { GET, POST };

    inline const char* to_string(Method m) { return m == Method::POST ? "POST" : "GET"; }

    struct JoinPayload {
        std::string code_;
        std::string name_;
    };

    // One planned upstream call. Built once by the candidate builder and never modified afterwards.
    struct AttemptDescriptor {
        std::string label_;
        Method method_ = Method::GET;
        std::string target_;
        std::optional<JoinPayload> payload_;
    };

    enum class BodyKind { EMPTY, JSON, TEXT };

    // JSON holds the upstream document text as received (validated, whitespace-trimmed).
    // TEXT holds the raw upstream text that failed to parse.
    struct BodyValue {
        BodyKind kind_ = BodyKind::EMPTY;
        std::string text_;
    };

    struct AttemptOutcome {
        bool succeeded_ = false;
        std::optional<long> http_status_;
        BodyValue body_;
        std::string descriptor_label_;
        std::optional<std::string> failure_reason_;

        // Transport error text, for logs only.
        std::string failure_detail_;
    };

    struct FallbackResult {
        bool joined_ = false;
        long status_ = 0;
        std::optional<std::string> via_;
        std::optional<BodyValue> data_;
        std::optional<std::string> error_message_;
    };
}  // namespace relay::model

#endif
