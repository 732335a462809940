#include <gtest/gtest.h>
#include "consensus/aggregator.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace oracle {
namespace {

AgentResponse make_response(const agent_id_t& agent_id, std::vector<double> causal,
                            double base = 1.0) {
    AgentResponse response;
    response.agent_id = agent_id;
    response.intervention_vector.assign(causal.size(), 0.5);
    response.causal_response = std::move(causal);
    response.base_prediction = base;
    return response;
}

class AggregatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger_ = std::make_shared<ReputationLedger>([] { return timestamp_ms_t{1'000}; });
        aggregator_ = std::make_unique<ConsensusAggregator>(config_, ledger_);
    }

    // Pairwise cosine 0.9 between every pair
    AggregationInput clustered_input() const {
        AggregationInput input;
        input.session_id = 9;
        input.phase = ProtocolPhase::AGGREGATING;
        input.participants = {"a", "b", "c"};
        input.responses = {
            make_response("a", {3, 1, 0, 0}),
            make_response("b", {3, 0, 1, 0}),
            make_response("c", {3, 0, 0, 1}),
        };
        for (const auto& response : input.responses) {
            input.reveal_hashes.push_back(sha3_256(response.serialize()));
        }
        input.now_ms = 5'000;
        return input;
    }

    ConsensusConfig config_;
    std::shared_ptr<ReputationLedger> ledger_;
    std::unique_ptr<ConsensusAggregator> aggregator_;
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(AggregatorTest, RejectsNullLedger) {
    EXPECT_THROW(ConsensusAggregator aggregator(config_, nullptr), std::invalid_argument);
}

// ============================================================================
// Preconditions
// ============================================================================

TEST_F(AggregatorTest, RequiresAggregatingPhase) {
    auto input = clustered_input();
    input.phase = ProtocolPhase::REVEALING;
    auto outcome = aggregator_->aggregate(input);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, ConsensusError::INSUFFICIENT_VALID_REVEALS);
}

TEST_F(AggregatorTest, RequiresTwoResponses) {
    auto input = clustered_input();
    input.responses.resize(1);
    auto outcome = aggregator_->aggregate(input);
    EXPECT_FALSE(outcome.ok());
    EXPECT_EQ(outcome.error, ConsensusError::INSUFFICIENT_VALID_REVEALS);
    EXPECT_FALSE(outcome.result.has_value());
}

// ============================================================================
// Partitioning
// ============================================================================

TEST_F(AggregatorTest, ClusteredAgentsAllValid) {
    auto outcome = aggregator_->aggregate(clustered_input());
    ASSERT_TRUE(outcome.ok());
    const auto& result = *outcome.result;

    EXPECT_EQ(result.session_id, 9u);
    EXPECT_EQ(result.valid_agents, (std::vector<agent_id_t>{"a", "b", "c"}));
    EXPECT_TRUE(result.outliers.empty());
    EXPECT_TRUE(result.missing_agents.empty());
    EXPECT_DOUBLE_EQ(result.pass_rate, 1.0);
    EXPECT_NEAR(result.consensus_similarity, 0.9, 1e-12);
    EXPECT_NEAR(result.agent_similarity.at("b"), 0.9, 1e-12);
    EXPECT_DOUBLE_EQ(result.consensus_value, 2.0);
    EXPECT_EQ(result.finalized_at_ms, 5'000);
    EXPECT_TRUE(result.is_valid("a"));
    EXPECT_FALSE(result.is_valid("z"));
}

TEST_F(AggregatorTest, DissimilarAgentIsOutlier) {
    auto input = clustered_input();
    input.participants.insert("d");
    input.responses.push_back(make_response("d", {0, 0, 0, 5}, 40.0));

    auto outcome = aggregator_->aggregate(input);
    ASSERT_TRUE(outcome.ok());
    const auto& result = *outcome.result;

    EXPECT_EQ(result.valid_agents, (std::vector<agent_id_t>{"a", "b", "c"}));
    EXPECT_EQ(result.outliers, (std::vector<agent_id_t>{"d"}));
    EXPECT_TRUE(result.excluded_agents.empty());
    EXPECT_DOUBLE_EQ(result.pass_rate, 0.75);
    // The outlier's prediction does not move the consensus value
    EXPECT_DOUBLE_EQ(result.consensus_value, 2.0);
}

TEST_F(AggregatorTest, LowReputationExcluded) {
    ledger_->apply_penalty("b", 450.0, ReputationReason::ADJUSTMENT);

    auto outcome = aggregator_->aggregate(clustered_input());
    ASSERT_TRUE(outcome.ok());
    const auto& result = *outcome.result;

    EXPECT_EQ(result.valid_agents, (std::vector<agent_id_t>{"a", "c"}));
    EXPECT_EQ(result.outliers, (std::vector<agent_id_t>{"b"}));
    EXPECT_EQ(result.excluded_agents, (std::vector<agent_id_t>{"b"}));
}

TEST_F(AggregatorTest, MissingParticipantsListed) {
    auto input = clustered_input();
    input.participants.insert("e");

    auto outcome = aggregator_->aggregate(input);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->missing_agents, (std::vector<agent_id_t>{"e"}));
    EXPECT_DOUBLE_EQ(outcome.result->pass_rate, 0.75);
}

TEST_F(AggregatorTest, DegenerateConsensusAveragesEveryone) {
    AggregationInput input;
    input.session_id = 2;
    input.phase = ProtocolPhase::AGGREGATING;
    input.participants = {"x", "y"};
    input.responses = {
        make_response("x", {1, 0}),
        make_response("y", {0, 1}),
    };

    auto outcome = aggregator_->aggregate(input);
    ASSERT_TRUE(outcome.ok());
    const auto& result = *outcome.result;

    EXPECT_TRUE(result.valid_agents.empty());
    EXPECT_EQ(result.outliers.size(), 2u);
    EXPECT_TRUE(result.has_warning(DEGENERATE_CONSENSUS_WARNING));
    EXPECT_DOUBLE_EQ(result.pass_rate, 0.0);
    EXPECT_DOUBLE_EQ(result.consensus_value, 1.5);
}

// ============================================================================
// Consensus Value
// ============================================================================

TEST_F(AggregatorTest, ReputationWeightedValue) {
    ledger_->apply_reward("hi", 400.0, ReputationReason::ADJUSTMENT);

    AggregationInput input;
    input.session_id = 3;
    input.phase = ProtocolPhase::AGGREGATING;
    input.participants = {"hi", "lo"};
    input.responses = {
        make_response("hi", {1, 1}, 0.0),
        make_response("lo", {1, 1}, 2.0),
    };

    auto plain = aggregator_->aggregate(input);
    ASSERT_TRUE(plain.ok());
    EXPECT_DOUBLE_EQ(plain.result->consensus_value, 2.0);

    config_.reputation_weighted_consensus = true;
    ConsensusAggregator weighted(config_, ledger_);
    auto outcome = weighted.aggregate(input);
    ASSERT_TRUE(outcome.ok());
    // (900 * 1 + 500 * 3) / 1400
    EXPECT_NEAR(outcome.result->consensus_value, 2400.0 / 1400.0, 1e-12);
}

TEST_F(AggregatorTest, DeterministicAcrossInputOrder) {
    auto input = clustered_input();
    auto shuffled = input;
    std::reverse(shuffled.responses.begin(), shuffled.responses.end());
    std::reverse(shuffled.reveal_hashes.begin(), shuffled.reveal_hashes.end());

    auto first = aggregator_->aggregate(input);
    auto second = aggregator_->aggregate(shuffled);
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(first.result->serialize(), second.result->serialize());
    EXPECT_EQ(first.result->result_hash(), second.result->result_hash());
}

TEST_F(AggregatorTest, RevealRootCoversSortedHashes) {
    auto input = clustered_input();
    auto outcome = aggregator_->aggregate(input);
    ASSERT_TRUE(outcome.ok());

    auto leaves = input.reveal_hashes;
    std::sort(leaves.begin(), leaves.end());
    EXPECT_EQ(outcome.result->reveal_root, compute_merkle_root(leaves));
}

TEST_F(AggregatorTest, AggregateLeavesReputationUntouched) {
    auto outcome = aggregator_->aggregate(clustered_input());
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(ledger_->size(), 0u);
}

TEST_F(AggregatorTest, CarriesEvidenceAndWarnings) {
    auto input = clustered_input();
    input.evidence.push_back(make_below_floor_evidence(9, "a", 10, 100));
    input.warnings.emplace_back("low_model_diversity");

    auto outcome = aggregator_->aggregate(input);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->evidence.size(), 1u);
    EXPECT_TRUE(outcome.result->has_warning("low_model_diversity"));
    EXPECT_FALSE(outcome.result->has_warning(DEGENERATE_CONSENSUS_WARNING));
}

TEST_F(AggregatorTest, InactiveAgentExcluded) {
    // Eleven outlier rounds and no successes take b out of rotation with its
    // score untouched
    for (int i = 0; i < 11; ++i) {
        ledger_->apply_penalty("b", 0.0, ReputationReason::OUTLIER);
    }
    ASSERT_DOUBLE_EQ(ledger_->score_or_initial("b"), 500.0);
    ASSERT_FALSE(ledger_->is_active("b"));

    auto outcome = aggregator_->aggregate(clustered_input());
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->valid_agents, (std::vector<agent_id_t>{"a", "c"}));
    EXPECT_EQ(outcome.result->excluded_agents, (std::vector<agent_id_t>{"b"}));
}

// ============================================================================
// Aggregation Methods
// ============================================================================

class AggregationMethodTest : public AggregatorTest {
protected:
    // Identical fingerprints, scalar summaries 1, 2, 3, 4 and 101
    AggregationInput skewed_input() const {
        AggregationInput input;
        input.session_id = 11;
        input.phase = ProtocolPhase::AGGREGATING;
        input.now_ms = 6'000;
        const std::pair<const char*, double> bases[] = {
            {"a", 0.0}, {"b", 1.0}, {"c", 2.0}, {"d", 3.0}, {"e", 100.0},
        };
        for (const auto& [agent, base] : bases) {
            input.participants.insert(agent);
            input.responses.push_back(make_response(agent, {3, 1, 0, 0}, base));
        }
        return input;
    }

    AggregationOutcome aggregate_with(AggregationMethod method, double trim = 0.1) {
        config_.aggregation_method = method;
        config_.trimmed_mean_fraction = trim;
        ConsensusAggregator aggregator(config_, ledger_);
        return aggregator.aggregate(skewed_input());
    }
};

TEST_F(AggregationMethodTest, MeanIsDefault) {
    EXPECT_EQ(ConsensusConfig{}.aggregation_method, AggregationMethod::MEAN);

    auto outcome = aggregator_->aggregate(skewed_input());
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->method, AggregationMethod::MEAN);
    EXPECT_NEAR(outcome.result->consensus_value, 22.2, 1e-12);
}

TEST_F(AggregationMethodTest, WeightedMedianIgnoresExtremeValue) {
    auto outcome = aggregate_with(AggregationMethod::WEIGHTED_MEDIAN);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->method, AggregationMethod::WEIGHTED_MEDIAN);
    EXPECT_DOUBLE_EQ(outcome.result->consensus_value, 3.0);
}

TEST_F(AggregationMethodTest, WeightedMedianFollowsReputation) {
    ledger_->apply_reward("e", 500.0, ReputationReason::ADJUSTMENT);
    ledger_->apply_penalty("a", 400.0, ReputationReason::ADJUSTMENT);
    ledger_->apply_penalty("b", 350.0, ReputationReason::ADJUSTMENT);
    ledger_->apply_penalty("c", 350.0, ReputationReason::ADJUSTMENT);
    config_.reputation_weighted_consensus = true;

    // Weights 100, 150, 150, 500, 1000: e alone holds over half
    auto outcome = aggregate_with(AggregationMethod::WEIGHTED_MEDIAN);
    ASSERT_TRUE(outcome.ok());
    EXPECT_DOUBLE_EQ(outcome.result->consensus_value, 101.0);
}

TEST_F(AggregationMethodTest, TrimmedMeanDropsBothEnds) {
    // floor(5 * 0.1) trims nothing
    auto untrimmed = aggregate_with(AggregationMethod::TRIMMED_MEAN);
    ASSERT_TRUE(untrimmed.ok());
    EXPECT_NEAR(untrimmed.result->consensus_value, 22.2, 1e-12);

    auto trimmed = aggregate_with(AggregationMethod::TRIMMED_MEAN, 0.2);
    ASSERT_TRUE(trimmed.ok());
    EXPECT_EQ(trimmed.result->method, AggregationMethod::TRIMMED_MEAN);
    EXPECT_DOUBLE_EQ(trimmed.result->consensus_value, 3.0);
}

TEST_F(AggregationMethodTest, AdaptiveSwitchesOnDispersedValues) {
    auto outcome = aggregate_with(AggregationMethod::ADAPTIVE);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->method, AggregationMethod::WEIGHTED_MEDIAN);
    EXPECT_DOUBLE_EQ(outcome.result->consensus_value, 3.0);
}

TEST_F(AggregationMethodTest, AdaptiveKeepsMeanForTightValues) {
    config_.aggregation_method = AggregationMethod::ADAPTIVE;
    ConsensusAggregator aggregator(config_, ledger_);

    auto input = clustered_input();
    auto outcome = aggregator.aggregate(input);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.result->method, AggregationMethod::MEAN);
    EXPECT_DOUBLE_EQ(outcome.result->consensus_value, 2.0);
}

TEST_F(AggregationMethodTest, AdaptiveSelection) {
    std::vector<double> tight = {2.0, 2.0, 2.0, 2.0, 2.2};
    std::vector<double> even = {1.0, 1.0, 1.0, 1.0, 1.0};
    std::vector<double> lopsided = {1.0, 1.0, 1.0, 1.0, 100.0};

    EXPECT_EQ(aggregator_->select_method(tight, even), AggregationMethod::MEAN);
    // Weight cv is about 1.9, under the default 3.0
    EXPECT_EQ(aggregator_->select_method(tight, lopsided), AggregationMethod::MEAN);

    config_.adaptive_weight_cv_threshold = 1.0;
    ConsensusAggregator strict(config_, ledger_);
    EXPECT_EQ(strict.select_method(tight, lopsided), AggregationMethod::WEIGHTED_MEDIAN);
}

TEST_F(AggregationMethodTest, CombineDirectly) {
    std::vector<double> values = {4.0, 1.0, 3.0, 2.0};
    std::vector<double> equal = {1.0, 1.0, 1.0, 1.0};
    std::vector<double> heavy_top = {10.0, 1.0, 1.0, 1.0};

    EXPECT_DOUBLE_EQ(aggregator_->combine(values, equal, AggregationMethod::MEAN), 2.5);
    // Lower median for an even count
    EXPECT_DOUBLE_EQ(aggregator_->combine(values, equal, AggregationMethod::WEIGHTED_MEDIAN), 2.0);
    EXPECT_DOUBLE_EQ(aggregator_->combine(values, heavy_top, AggregationMethod::WEIGHTED_MEDIAN),
                     4.0);
    EXPECT_DOUBLE_EQ(aggregator_->combine(values, heavy_top, AggregationMethod::MEAN),
                     46.0 / 13.0);
    EXPECT_DOUBLE_EQ(aggregator_->combine({}, {}, AggregationMethod::MEAN), 0.0);
}

TEST_F(AggregationMethodTest, MethodChangesResultHash) {
    auto mean = aggregate_with(AggregationMethod::MEAN);
    auto trimmed = aggregate_with(AggregationMethod::TRIMMED_MEAN);
    ASSERT_TRUE(mean.ok());
    ASSERT_TRUE(trimmed.ok());
    EXPECT_DOUBLE_EQ(mean.result->consensus_value, trimmed.result->consensus_value);
    EXPECT_NE(mean.result->result_hash(), trimmed.result->result_hash());
}

// ============================================================================
// Settlement
// ============================================================================

TEST_F(AggregatorTest, SettleRewardsAndPenalizes) {
    auto input = clustered_input();
    input.participants.insert("d");
    input.responses.push_back(make_response("d", {0, 0, 0, 5}));

    auto outcome = aggregator_->aggregate(input);
    ASSERT_TRUE(outcome.ok());
    aggregator_->settle(*outcome.result);

    // s_a = (0.9 + 0.9 + 0) / 3
    EXPECT_NEAR(ledger_->score_or_initial("a"), 506.0, 1e-9);
    EXPECT_DOUBLE_EQ(ledger_->score_or_initial("d"), 495.0);

    auto a = ledger_->get("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->successful_tasks, 1u);
    auto d = ledger_->get("d");
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->outlier_count, 1u);
}

}  // namespace
}  // namespace oracle
