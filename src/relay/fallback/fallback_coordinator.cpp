#include "fallback_coordinator.hpp"

#include <optional>
#include <string>

#include "../../http/model/model.hpp"
#include "../../utils/log_utils.hpp"
#include "../../utils/string_utils.hpp"

namespace relay::fallback {
    FallbackCoordinator::FallbackCoordinator(std::shared_ptr<relay::attempt::IAttemptExecutor> executor) : executor_(std::move(executor)) {}

    relay::model::FallbackResult FallbackCoordinator::no_candidates() {
        return relay::model::FallbackResult{
            .joined_ = false,
            .status_ = static_cast<long>(http::model::HttpStatusCode::INTERNAL_SERVER_ERROR),
            .via_ = std::nullopt,
            .data_ = std::nullopt,
            .error_message_ = NO_CANDIDATES_MESSAGE,
        };
    }

    relay::model::FallbackResult FallbackCoordinator::from_success(relay::model::AttemptOutcome&& outcome) {
        return relay::model::FallbackResult{
            .joined_ = true,
            .status_ = outcome.http_status_.value_or(static_cast<long>(http::model::HttpStatusCode::OK)),
            .via_ = std::move(outcome.descriptor_label_),
            .data_ = std::move(outcome.body_),
            .error_message_ = std::nullopt,
        };
    }

    relay::model::FallbackResult FallbackCoordinator::from_failure(relay::model::AttemptOutcome&& outcome) {
        // Reachable upstream that said no: keep its status and body.
        if (outcome.http_status_ && !outcome.failure_reason_) {
            return relay::model::FallbackResult{
                .joined_ = false,
                .status_ = *outcome.http_status_,
                .via_ = std::nullopt,
                .data_ = std::move(outcome.body_),
                .error_message_ = "Upstream error via " + outcome.descriptor_label_,
            };
        }

        return relay::model::FallbackResult{
            .joined_ = false,
            .status_ = static_cast<long>(http::model::HttpStatusCode::BAD_GATEWAY),
            .via_ = std::nullopt,
            .data_ = std::nullopt,
            .error_message_ = "Fetch failed (timeout/network) via " + outcome.descriptor_label_,
        };
    }

    relay::model::FallbackResult FallbackCoordinator::dispatch(const std::vector<relay::model::AttemptDescriptor>& descriptors,
                                                               std::chrono::milliseconds timeout) const {
        if (descriptors.empty()) {
            log_utils::error("no upstream candidates configured");
            return no_candidates();
        }

        std::optional<relay::model::AttemptOutcome> last_failure;

        for (const auto& descriptor : descriptors) {
            const std::string log_label = string_utils::strip_query(descriptor.label_);
            log_utils::debug("attempting " + log_label);

            relay::model::AttemptOutcome outcome = executor_->execute(descriptor, timeout);

            if (outcome.succeeded_) {
                log_utils::info("joined via " + log_label + " (status " + std::to_string(outcome.http_status_.value_or(0)) + ")");
                return from_success(std::move(outcome));
            }

            if (outcome.failure_reason_) {
                log_utils::warn(log_label + " unreachable: " + outcome.failure_detail_);
            } else {
                log_utils::warn(log_label + " rejected with status " + std::to_string(outcome.http_status_.value_or(0)));
            }

            last_failure = std::move(outcome);
        }

        log_utils::error("all " + std::to_string(descriptors.size()) + " upstream candidates failed");
        return from_failure(std::move(*last_failure));
    }
}  // namespace relay::fallback
