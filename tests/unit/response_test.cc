#include <gtest/gtest.h>
#include "consensus/response.hh"
#include <limits>

using namespace oracle;

namespace {

AgentResponse sample_response() {
    AgentResponse response;
    response.agent_id = "agent-1";
    response.intervention_vector = {0.1, -0.2, 0.3};
    response.causal_response = {-0.18, -0.15, -0.21};
    response.spectral_features = {0.4, 0.6};
    response.proof_reference = "proof://abc";
    response.base_prediction = 1.0;
    return response;
}

}  // namespace

TEST(AgentResponseTest, ScalarSummaryAddsMeanDelta) {
    auto response = sample_response();
    EXPECT_NEAR(response.scalar_summary(), 1.0 - 0.18, 1e-12);
}

TEST(AgentResponseTest, WellFormed) {
    EXPECT_TRUE(sample_response().is_well_formed());
}

TEST(AgentResponseTest, DimensionMismatchIsMalformed) {
    auto response = sample_response();
    response.intervention_vector.pop_back();
    EXPECT_FALSE(response.is_well_formed());
}

TEST(AgentResponseTest, NonFiniteIsMalformed) {
    auto response = sample_response();
    response.causal_response[1] = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(response.is_well_formed());

    response = sample_response();
    response.base_prediction = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(response.is_well_formed());
}

TEST(AgentResponseTest, EmptyResponseIsMalformed) {
    auto response = sample_response();
    response.causal_response.clear();
    response.intervention_vector.clear();
    EXPECT_FALSE(response.is_well_formed());

    response = sample_response();
    response.agent_id.clear();
    EXPECT_FALSE(response.is_well_formed());
}

TEST(AgentResponseTest, Serialization) {
    auto response = sample_response();
    auto decoded = AgentResponse::deserialize(response.serialize());

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->agent_id, response.agent_id);
    EXPECT_EQ(decoded->intervention_vector, response.intervention_vector);
    EXPECT_EQ(decoded->causal_response, response.causal_response);
    EXPECT_EQ(decoded->spectral_features, response.spectral_features);
    EXPECT_EQ(decoded->proof_reference, response.proof_reference);
    EXPECT_EQ(decoded->base_prediction, response.base_prediction);
}

TEST(AgentResponseTest, RejectsUnknownVersion) {
    auto bytes = sample_response().serialize();
    bytes[0] = AgentResponse::VERSION + 1;
    EXPECT_FALSE(AgentResponse::deserialize(bytes).has_value());
}

TEST(AgentResponseTest, RejectsTrailingAndTruncatedBytes) {
    auto bytes = sample_response().serialize();

    auto longer = bytes;
    longer.push_back(0);
    EXPECT_FALSE(AgentResponse::deserialize(longer).has_value());

    auto shorter = bytes;
    shorter.pop_back();
    EXPECT_FALSE(AgentResponse::deserialize(shorter).has_value());

    EXPECT_FALSE(AgentResponse::deserialize(std::span<const std::uint8_t>{}).has_value());
}
