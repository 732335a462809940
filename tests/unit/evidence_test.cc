#include <gtest/gtest.h>
#include "consensus/evidence.hh"
#include <cmath>
#include <limits>

using namespace oracle;

// ============================================================================
// Severity Tests
// ============================================================================

TEST(EvidenceTest, ClampSeverity) {
    EXPECT_DOUBLE_EQ(clamp_severity(0.5), 0.5);
    EXPECT_DOUBLE_EQ(clamp_severity(2.0), 1.0);
    EXPECT_DOUBLE_EQ(clamp_severity(0.0), MIN_EVIDENCE_SEVERITY);
    EXPECT_DOUBLE_EQ(clamp_severity(-3.0), MIN_EVIDENCE_SEVERITY);
    EXPECT_DOUBLE_EQ(clamp_severity(std::numeric_limits<double>::quiet_NaN()),
                     MIN_EVIDENCE_SEVERITY);
}

TEST(EvidenceTest, BelowFloorSeverityScalesWithShortfall) {
    auto ev = make_below_floor_evidence(3, "agent-1", 10, 100);
    EXPECT_EQ(ev.kind, TimingAnomalyKind::BELOW_FLOOR);
    EXPECT_EQ(ev.observed_ms, 10u);
    EXPECT_DOUBLE_EQ(ev.expected_range.min, 100.0);
    EXPECT_TRUE(std::isinf(ev.expected_range.max));
    EXPECT_NEAR(ev.severity, 0.9, 1e-12);

    auto mild = make_below_floor_evidence(3, "agent-1", 95, 100);
    EXPECT_DOUBLE_EQ(mild.severity, MIN_EVIDENCE_SEVERITY);
}

TEST(EvidenceTest, SynchronizedSeverity) {
    auto ev = make_synchronized_evidence(1, "a", 500, 0.01, 0.05);
    EXPECT_EQ(ev.kind, TimingAnomalyKind::SYNCHRONIZED);
    EXPECT_DOUBLE_EQ(ev.statistic, 0.01);
    EXPECT_NEAR(ev.severity, 0.8, 1e-12);

    auto identical = make_synchronized_evidence(1, "a", 500, 0.0, 0.05);
    EXPECT_DOUBLE_EQ(identical.severity, 1.0);
}

TEST(EvidenceTest, OutlierSeverityAndRange) {
    auto ev = make_outlier_evidence(1, "a", 900, 500.0, 100.0, 4.0, 2.5);
    EXPECT_EQ(ev.kind, TimingAnomalyKind::STATISTICAL_OUTLIER);
    EXPECT_NEAR(ev.severity, 0.8, 1e-12);
    EXPECT_DOUBLE_EQ(ev.expected_range.min, 250.0);
    EXPECT_DOUBLE_EQ(ev.expected_range.max, 750.0);
}

TEST(EvidenceTest, SpectralSeverity) {
    ValueRange range{0.6, 0.9};

    auto low = make_spectral_evidence(1, "a", 0.3, range);
    EXPECT_NEAR(low.severity, 0.5, 1e-12);

    auto high = make_spectral_evidence(1, "a", 1.0, range);
    EXPECT_NEAR(high.severity, 1.0, 1e-9);

    auto zero = make_spectral_evidence(1, "a", 0.0, range);
    EXPECT_DOUBLE_EQ(zero.severity, 1.0);
}

TEST(EvidenceTest, CollusionPairIsOrdered) {
    auto ab = make_collusion_evidence(1, "b-agent", "a-agent", 0.97);
    EXPECT_EQ(ab.agent_a, "a-agent");
    EXPECT_EQ(ab.agent_b, "b-agent");
    EXPECT_DOUBLE_EQ(ab.severity, 0.97);

    auto ba = make_collusion_evidence(1, "a-agent", "b-agent", 0.97);
    EXPECT_EQ(evidence_key(ab), evidence_key(ba));
}

// ============================================================================
// Accessor Tests
// ============================================================================

TEST(EvidenceTest, KindAndSessionAccessors) {
    DefenseEvidence sybil = make_sybil_evidence(7, "10.0.0.1", {"x", "y"}, 0.8);
    DefenseEvidence spectral = make_spectral_evidence(8, "z", 0.1, {0.6, 0.9});

    EXPECT_EQ(evidence_kind(sybil), EvidenceKind::SYBIL);
    EXPECT_EQ(evidence_kind(spectral), EvidenceKind::SPECTRAL_ANOMALY);
    EXPECT_EQ(evidence_session(sybil), 7u);
    EXPECT_EQ(evidence_session(spectral), 8u);
    EXPECT_DOUBLE_EQ(evidence_severity(sybil), 0.8);
}

TEST(EvidenceTest, ImplicatedAgents) {
    DefenseEvidence sybil = make_sybil_evidence(1, "origin", {"c", "a", "b"}, 0.9);
    EXPECT_EQ(implicated_agents(sybil), (std::vector<agent_id_t>{"a", "b", "c"}));

    DefenseEvidence collusion = make_collusion_evidence(1, "q", "p", 0.9);
    EXPECT_EQ(implicated_agents(collusion), (std::vector<agent_id_t>{"p", "q"}));

    DefenseEvidence timing = make_below_floor_evidence(1, "t", 1, 100);
    EXPECT_EQ(implicated_agents(timing), (std::vector<agent_id_t>{"t"}));
}

TEST(EvidenceTest, KeysSeparateTimingKinds) {
    DefenseEvidence floor = make_below_floor_evidence(1, "a", 10, 100);
    DefenseEvidence sync = make_synchronized_evidence(1, "a", 10, 0.0, 0.05);
    DefenseEvidence other_session = make_below_floor_evidence(2, "a", 10, 100);

    EXPECT_NE(evidence_key(floor), evidence_key(sync));
    EXPECT_NE(evidence_key(floor), evidence_key(other_session));
}

TEST(EvidenceTest, DescribeMentionsAgents) {
    DefenseEvidence collusion = make_collusion_evidence(1, "alpha", "beta", 0.95);
    auto text = describe_evidence(collusion);
    EXPECT_NE(text.find("alpha"), std::string::npos);
    EXPECT_NE(text.find("beta"), std::string::npos);
    EXPECT_NE(text.find("0.950"), std::string::npos);
}

TEST(EvidenceTest, EncodingStartsWithKindAndSession) {
    DefenseEvidence spectral = make_spectral_evidence(0x0102, "z", 0.1, {0.6, 0.9});
    std::vector<std::uint8_t> out;
    append_evidence(out, spectral);

    ASSERT_GT(out.size(), 9u);
    EXPECT_EQ(out[0], static_cast<std::uint8_t>(EvidenceKind::SPECTRAL_ANOMALY));
    EXPECT_EQ(decode_u64(out.data() + 1), 0x0102u);
}
