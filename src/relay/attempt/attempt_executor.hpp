#ifndef JOIN_RELAY_ATTEMPT_EXECUTOR_HPP
#define JOIN_RELAY_ATTEMPT_EXECUTOR_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../../http/client/interface.hpp"
#include "../../http/model/model.hpp"
#include "../model/model.hpp"

namespace relay::attempt {
    class IAttemptExecutor {
       public:
        IAttemptExecutor() = default;
        virtual ~IAttemptExecutor() = default;
        IAttemptExecutor(const IAttemptExecutor&) = delete;
        IAttemptExecutor& operator=(const IAttemptExecutor&) = delete;
        IAttemptExecutor(IAttemptExecutor&&) = delete;
        IAttemptExecutor& operator=(IAttemptExecutor&&) = delete;

        [[nodiscard]] virtual relay::model::AttemptOutcome execute(const relay::model::AttemptDescriptor& descriptor,
                                                                   std::chrono::milliseconds timeout) const = 0;
    };

    // Runs one descriptor as exactly one HTTP call. Never retries and never throws for upstream
    // or transport failures; those come back as a failed outcome.
    class AttemptExecutor : public IAttemptExecutor {
       public:
        AttemptExecutor(std::shared_ptr<http::client::IHttpClient> client, std::vector<std::string> post_headers);

        [[nodiscard]] relay::model::AttemptOutcome execute(const relay::model::AttemptDescriptor& descriptor,
                                                           std::chrono::milliseconds timeout) const override;

        [[nodiscard]] static relay::model::BodyValue normalize_body(const http::model::Response& resp);
        [[nodiscard]] static std::string serialize_payload(const relay::model::JoinPayload& payload);

       private:
        [[nodiscard]] http::model::Request build_request(const relay::model::AttemptDescriptor& descriptor, std::chrono::milliseconds timeout) const;

        std::shared_ptr<http::client::IHttpClient> client_;
        std::vector<std::string> post_headers_;
    };
}  // namespace relay::attempt

#endif
