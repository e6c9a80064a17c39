#ifndef JOIN_RELAY_CANDIDATE_BUILDER_HPP
#define JOIN_RELAY_CANDIDATE_BUILDER_HPP

#include <string>
#include <string_view>
#include <vector>

#include "../config/config.hpp"
#include "../model/model.hpp"

namespace relay::candidates {
    // Explicit upstream_urls_ win; otherwise upstream_base_ is expanded with the default join paths.
    // Empty when neither is configured.
    [[nodiscard]] std::vector<std::string> resolve_targets(const relay::config::RelayConfig& config);

    // Two descriptors per target, POST then GET, in target order. Pure: same inputs, same sequence.
    [[nodiscard]] std::vector<relay::model::AttemptDescriptor> build_candidates(const relay::config::RelayConfig& config, std::string_view code,
                                                                                std::string_view name);

    [[nodiscard]] std::string build_join_query(std::string_view code, std::string_view name);
}  // namespace relay::candidates

#endif
