#pragma once

#include "core/types.hh"
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace oracle {

// ============================================================================
// Evidence Kinds
// ============================================================================

enum class EvidenceKind : std::uint8_t {
    SYBIL = 0,
    COLLUSION = 1,
    TIMING_ANOMALY = 2,
    SPECTRAL_ANOMALY = 3,
};

[[nodiscard]] constexpr std::string_view evidence_kind_string(EvidenceKind kind) {
    switch (kind) {
        case EvidenceKind::SYBIL: return "sybil";
        case EvidenceKind::COLLUSION: return "collusion";
        case EvidenceKind::TIMING_ANOMALY: return "timing_anomaly";
        case EvidenceKind::SPECTRAL_ANOMALY: return "spectral_anomaly";
    }
    return "unknown";
}

enum class TimingAnomalyKind : std::uint8_t {
    BELOW_FLOOR = 0,           // faster than the plausible minimum
    SYNCHRONIZED = 1,          // session durations too uniform
    STATISTICAL_OUTLIER = 2,   // z-score against the agent's own history
};

[[nodiscard]] constexpr std::string_view timing_anomaly_string(TimingAnomalyKind kind) {
    switch (kind) {
        case TimingAnomalyKind::BELOW_FLOOR: return "below_floor";
        case TimingAnomalyKind::SYNCHRONIZED: return "synchronized";
        case TimingAnomalyKind::STATISTICAL_OUTLIER: return "statistical_outlier";
    }
    return "unknown";
}

struct ValueRange {
    double min = 0.0;
    double max = 0.0;

    [[nodiscard]] bool contains(double v) const { return v >= min && v <= max; }

    auto operator<=>(const ValueRange&) const = default;
};

// ============================================================================
// Evidence Records
// ============================================================================

// Every record carries severity in (0, 1]; it scales the reputation penalty.

struct SybilEvidence {
    session_id_t session_id = 0;
    std::string shared_origin;
    std::set<agent_id_t> suspected_agents;
    double similarity_score = 0.0;
    double severity = 0.0;
};

struct CollusionEvidence {
    session_id_t session_id = 0;
    agent_id_t agent_a;          // agent_a < agent_b
    agent_id_t agent_b;
    double similarity_score = 0.0;
    double severity = 0.0;
};

struct TimingAnomalyEvidence {
    session_id_t session_id = 0;
    agent_id_t agent_id;
    std::uint64_t observed_ms = 0;
    ValueRange expected_range;
    TimingAnomalyKind kind = TimingAnomalyKind::BELOW_FLOOR;
    double statistic = 0.0;      // CV for SYNCHRONIZED, z-score for STATISTICAL_OUTLIER
    double severity = 0.0;
};

struct SpectralAnomalyEvidence {
    session_id_t session_id = 0;
    agent_id_t agent_id;
    double entropy = 0.0;
    ValueRange acceptable_range;
    double severity = 0.0;
};

using DefenseEvidence = std::variant<
    SybilEvidence,
    CollusionEvidence,
    TimingAnomalyEvidence,
    SpectralAnomalyEvidence>;

// ============================================================================
// Constructors (compute severity)
// ============================================================================

[[nodiscard]] double clamp_severity(double severity);

[[nodiscard]] SybilEvidence make_sybil_evidence(
    session_id_t session_id, std::string origin,
    std::set<agent_id_t> agents, double similarity);

// Orders the pair so (a, b) and (b, a) produce the same record
[[nodiscard]] CollusionEvidence make_collusion_evidence(
    session_id_t session_id, const agent_id_t& a, const agent_id_t& b, double similarity);

[[nodiscard]] TimingAnomalyEvidence make_below_floor_evidence(
    session_id_t session_id, const agent_id_t& agent_id,
    std::uint64_t observed_ms, std::uint64_t min_plausible_ms);

[[nodiscard]] TimingAnomalyEvidence make_synchronized_evidence(
    session_id_t session_id, const agent_id_t& agent_id,
    std::uint64_t observed_ms, double cv, double cv_floor);

[[nodiscard]] TimingAnomalyEvidence make_outlier_evidence(
    session_id_t session_id, const agent_id_t& agent_id,
    std::uint64_t observed_ms, double history_mean, double history_std,
    double z_score, double z_threshold);

[[nodiscard]] SpectralAnomalyEvidence make_spectral_evidence(
    session_id_t session_id, const agent_id_t& agent_id,
    double entropy, ValueRange acceptable);

// ============================================================================
// Accessors
// ============================================================================

[[nodiscard]] EvidenceKind evidence_kind(const DefenseEvidence& evidence);
[[nodiscard]] double evidence_severity(const DefenseEvidence& evidence);
[[nodiscard]] session_id_t evidence_session(const DefenseEvidence& evidence);

// Agents the evidence implicates, sorted
[[nodiscard]] std::vector<agent_id_t> implicated_agents(const DefenseEvidence& evidence);

// Identity of a finding; two records with the same key are the same finding
[[nodiscard]] std::string evidence_key(const DefenseEvidence& evidence);

[[nodiscard]] std::string describe_evidence(const DefenseEvidence& evidence);

void append_evidence(std::vector<std::uint8_t>& out, const DefenseEvidence& evidence);

}  // namespace oracle
