#ifndef JOIN_RELAY_FALLBACK_COORDINATOR_HPP
#define JOIN_RELAY_FALLBACK_COORDINATOR_HPP

#include <chrono>
#include <memory>
#include <vector>

#include "../attempt/attempt_executor.hpp"
#include "../model/model.hpp"

namespace relay::fallback {
    const char* const NO_CANDIDATES_MESSAGE = "No upstream candidates configured; no attempts made.";

    // Tries descriptors one at a time, in order, and stops at the first 2xx.
    // A descriptor is never started before the previous one has finished, so the
    // worst-case latency of dispatch() is timeout * descriptors.size().
    class FallbackCoordinator {
       public:
        explicit FallbackCoordinator(std::shared_ptr<relay::attempt::IAttemptExecutor> executor);

        [[nodiscard]] relay::model::FallbackResult dispatch(const std::vector<relay::model::AttemptDescriptor>& descriptors,
                                                            std::chrono::milliseconds timeout) const;

       private:
        [[nodiscard]] static relay::model::FallbackResult from_success(relay::model::AttemptOutcome&& outcome);
        [[nodiscard]] static relay::model::FallbackResult from_failure(relay::model::AttemptOutcome&& outcome);
        [[nodiscard]] static relay::model::FallbackResult no_candidates();

        std::shared_ptr<relay::attempt::IAttemptExecutor> executor_;
    };
}  // namespace relay::fallback

#endif
