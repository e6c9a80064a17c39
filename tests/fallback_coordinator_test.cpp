#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <vector>

#include "mocks.hpp"
#include "src/relay/candidates/candidate_builder.hpp"
#include "src/relay/fallback/fallback_coordinator.hpp"

using relay::fallback::FallbackCoordinator;
using relay::model::AttemptDescriptor;
using relay::model::BodyKind;
using test_support::accepted;
using test_support::MockAttemptExecutor;
using test_support::rejected;
using test_support::unreachable;
using ::testing::_;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;

namespace {
    const std::chrono::milliseconds TIMEOUT{100};

    std::vector<AttemptDescriptor> two_target_descriptors() {
        relay::config::RelayConfig config;
        config.upstream_urls_ = {"https://a.test", "https://b.test"};
        return relay::candidates::build_candidates(config, "C0DE", "Ada");
    }

    auto labelled(const std::string& label) { return Field(&AttemptDescriptor::label_, label); }

    class FallbackCoordinatorTest : public ::testing::Test {
       protected:
        std::shared_ptr<MockAttemptExecutor> executor_ = std::make_shared<MockAttemptExecutor>();
        FallbackCoordinator coordinator_{executor_};
    };
}  // namespace

TEST_F(FallbackCoordinatorTest, EmptySequenceIsTerminalWithoutAttempts) {
    EXPECT_CALL(*executor_, execute(_, _)).Times(0);

    const auto result = coordinator_.dispatch({}, TIMEOUT);

    EXPECT_FALSE(result.joined_);
    EXPECT_EQ(result.status_, 500);
    EXPECT_EQ(result.error_message_, relay::fallback::NO_CANDIDATES_MESSAGE);
    EXPECT_FALSE(result.data_.has_value());
}

TEST_F(FallbackCoordinatorTest, FirstSuccessWinsAndLaterCandidatesAreNeverTried) {
    const auto descriptors = two_target_descriptors();
    {
        InSequence seq;
        EXPECT_CALL(*executor_, execute(labelled("POST https://a.test"), TIMEOUT)).WillOnce(Return(rejected("POST https://a.test", 500)));
        EXPECT_CALL(*executor_, execute(labelled("GET https://a.test?code=C0DE&name=Ada"), TIMEOUT))
            .WillOnce(Return(rejected("GET https://a.test?code=C0DE&name=Ada", 500)));
        EXPECT_CALL(*executor_, execute(labelled("POST https://b.test"), TIMEOUT))
            .WillOnce(Return(accepted("POST https://b.test", 200, R"({"room":"x"})")));
    }
    EXPECT_CALL(*executor_, execute(labelled("GET https://b.test?code=C0DE&name=Ada"), _)).Times(0);

    const auto result = coordinator_.dispatch(descriptors, TIMEOUT);

    EXPECT_TRUE(result.joined_);
    EXPECT_EQ(result.status_, 200);
    EXPECT_EQ(result.via_, "POST https://b.test");
    ASSERT_TRUE(result.data_.has_value());
    EXPECT_EQ(result.data_->kind_, BodyKind::JSON);
    EXPECT_EQ(result.data_->text_, R"({"room":"x"})");
}

TEST_F(FallbackCoordinatorTest, ExhaustionReportsLastDescriptorRejection) {
    const auto descriptors = two_target_descriptors();
    EXPECT_CALL(*executor_, execute(_, _))
        .WillOnce(Return(rejected("POST https://a.test", 503, R"({"first":true})")))
        .WillOnce(Return(unreachable("GET https://a.test?code=C0DE&name=Ada")))
        .WillOnce(Return(rejected("POST https://b.test", 500)))
        .WillOnce(Return(rejected("GET https://b.test?code=C0DE&name=Ada", 409, R"({"reason":"full"})")));

    const auto result = coordinator_.dispatch(descriptors, TIMEOUT);

    EXPECT_FALSE(result.joined_);
    EXPECT_EQ(result.status_, 409);
    EXPECT_EQ(result.error_message_, "Upstream error via GET https://b.test?code=C0DE&name=Ada");
    ASSERT_TRUE(result.data_.has_value());
    EXPECT_EQ(result.data_->text_, R"({"reason":"full"})");
}

TEST_F(FallbackCoordinatorTest, ExhaustionByTimeoutReportsBadGatewayWithoutData) {
    const auto descriptors = two_target_descriptors();
    EXPECT_CALL(*executor_, execute(_, _))
        .WillOnce(Return(rejected("POST https://a.test", 500, R"({"x":1})")))
        .WillOnce(Return(rejected("GET https://a.test?code=C0DE&name=Ada", 500)))
        .WillOnce(Return(rejected("POST https://b.test", 500)))
        .WillOnce(Return(unreachable("GET https://b.test?code=C0DE&name=Ada")));

    const auto result = coordinator_.dispatch(descriptors, TIMEOUT);

    EXPECT_FALSE(result.joined_);
    EXPECT_EQ(result.status_, 502);
    EXPECT_EQ(result.error_message_, "Fetch failed (timeout/network) via GET https://b.test?code=C0DE&name=Ada");
    EXPECT_FALSE(result.data_.has_value());
}

TEST_F(FallbackCoordinatorTest, TimeoutAdvancesLikeRejection) {
    const auto descriptors = two_target_descriptors();
    {
        InSequence seq;
        EXPECT_CALL(*executor_, execute(labelled("POST https://a.test"), _)).WillOnce(Return(unreachable("POST https://a.test")));
        EXPECT_CALL(*executor_, execute(labelled("GET https://a.test?code=C0DE&name=Ada"), _))
            .WillOnce(Return(accepted("GET https://a.test?code=C0DE&name=Ada", 200, R"({"ok":true})")));
    }

    const auto result = coordinator_.dispatch(descriptors, TIMEOUT);

    EXPECT_TRUE(result.joined_);
    EXPECT_EQ(result.via_, "GET https://a.test?code=C0DE&name=Ada");
}
