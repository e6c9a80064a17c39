#include <gtest/gtest.h>

#include "src/relay/candidates/candidate_builder.hpp"
#include "src/relay/config/config.hpp"
#include "src/relay/model/model.hpp"

using relay::candidates::build_candidates;
using relay::config::RelayConfig;
using relay::model::Method;

TEST(CandidateBuilder, ExplicitTargetsYieldPostThenGetPerTarget) {
    RelayConfig config;
    config.upstream_urls_ = {"https://a.test", "https://b.test", "https://c.test"};

    const auto descriptors = build_candidates(config, "ABC123", "Ada");

    ASSERT_EQ(descriptors.size(), 6U);
    for (size_t i = 0; i < config.upstream_urls_.size(); ++i) {
        const auto& post = descriptors[i * 2];
        const auto& get = descriptors[i * 2 + 1];
        EXPECT_EQ(post.method_, Method::POST);
        EXPECT_EQ(post.target_, config.upstream_urls_[i]);
        EXPECT_EQ(post.label_, "POST " + config.upstream_urls_[i]);
        EXPECT_EQ(get.method_, Method::GET);
        EXPECT_EQ(get.target_, config.upstream_urls_[i] + "?code=ABC123&name=Ada");
        EXPECT_EQ(get.label_, "GET " + config.upstream_urls_[i] + "?code=ABC123&name=Ada");
    }
}

TEST(CandidateBuilder, ExplicitTargetsTakePrecedenceOverBase) {
    RelayConfig config;
    config.upstream_urls_ = {"https://a.test/join"};
    config.upstream_base_ = "https://ignored.test";

    const auto descriptors = build_candidates(config, "c", "n");

    ASSERT_EQ(descriptors.size(), 2U);
    EXPECT_EQ(descriptors[0].target_, "https://a.test/join");
}

TEST(CandidateBuilder, BaseExpandsToSixDescriptorsInPathOrder) {
    RelayConfig config;
    config.upstream_base_ = "https://game.test";

    const auto descriptors = build_candidates(config, "X1", "Bob");

    ASSERT_EQ(descriptors.size(), 6U);
    EXPECT_EQ(descriptors[0].label_, "POST https://game.test/api/join");
    EXPECT_EQ(descriptors[1].label_, "GET https://game.test/api/join?code=X1&name=Bob");
    EXPECT_EQ(descriptors[2].label_, "POST https://game.test/v1/join");
    EXPECT_EQ(descriptors[3].label_, "GET https://game.test/v1/join?code=X1&name=Bob");
    EXPECT_EQ(descriptors[4].label_, "POST https://game.test/join");
    EXPECT_EQ(descriptors[5].label_, "GET https://game.test/join?code=X1&name=Bob");
}

TEST(CandidateBuilder, NothingConfiguredYieldsEmptySequence) {
    const RelayConfig config;
    EXPECT_TRUE(build_candidates(config, "c", "n").empty());
    EXPECT_TRUE(relay::candidates::resolve_targets(config).empty());
}

TEST(CandidateBuilder, QueryIsEncodedButPayloadKeepsRawValues) {
    RelayConfig config;
    config.upstream_urls_ = {"https://a.test"};

    const std::string code = "a b&c=d";
    const std::string name = "Zoë/Ω?";
    const auto descriptors = build_candidates(config, code, name);

    ASSERT_EQ(descriptors.size(), 2U);
    ASSERT_TRUE(descriptors[0].payload_.has_value());
    EXPECT_EQ(descriptors[0].payload_->code_, code);
    EXPECT_EQ(descriptors[0].payload_->name_, name);
    EXPECT_FALSE(descriptors[1].payload_.has_value());
    EXPECT_EQ(descriptors[1].target_, "https://a.test?code=a%20b%26c%3Dd&name=Zo%C3%AB%2F%CE%A9%3F");
}

TEST(CandidateBuilder, SameInputsProduceSameSequence) {
    RelayConfig config;
    config.upstream_base_ = "https://game.test";

    const auto first = build_candidates(config, "code", "name");
    const auto second = build_candidates(config, "code", "name");

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].label_, second[i].label_);
        EXPECT_EQ(first[i].target_, second[i].target_);
        EXPECT_EQ(first[i].method_, second[i].method_);
    }
}
