#include "candidate_builder.hpp"

#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/string_utils.hpp"

namespace relay::candidates {
    std::vector<std::string> resolve_targets(const relay::config::RelayConfig& config) {
        if (!config.upstream_urls_.empty()) {
            return config.upstream_urls_;
        }

        std::vector<std::string> targets;
        if (config.upstream_base_.empty()) {
            return targets;
        }

        targets.reserve(constants::DEFAULT_JOIN_PATHS.size());
        for (const char* path : constants::DEFAULT_JOIN_PATHS) {
            targets.push_back(config.upstream_base_ + path);
        }
        return targets;
    }

    std::string build_join_query(std::string_view code, std::string_view name) {
        return "code=" + string_utils::percent_encode(code) + "&name=" + string_utils::percent_encode(name);
    }

    std::vector<relay::model::AttemptDescriptor> build_candidates(const relay::config::RelayConfig& config, std::string_view code,
                                                                  std::string_view name) {
        const std::vector<std::string> targets = resolve_targets(config);
        const std::string query = build_join_query(code, name);

        std::vector<relay::model::AttemptDescriptor> descriptors;
        descriptors.reserve(targets.size() * 2);

        for (const auto& target : targets) {
            descriptors.push_back(relay::model::AttemptDescriptor{
                .label_ = std::string(relay::model::to_string(relay::model::Method::POST)) + " " + target,
                .method_ = relay::model::Method::POST,
                .target_ = target,
                .payload_ = relay::model::JoinPayload{.code_ = std::string(code), .name_ = std::string(name)},
            });

            std::string get_target = target + "?" + query;
            descriptors.push_back(relay::model::AttemptDescriptor{
                .label_ = std::string(relay::model::to_string(relay::model::Method::GET)) + " " + get_target,
                .method_ = relay::model::Method::GET,
                .target_ = std::move(get_target),
                .payload_ = std::nullopt,
            });
        }

        return descriptors;
    }
}  // namespace relay::candidates
