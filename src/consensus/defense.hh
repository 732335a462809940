#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "evidence.hh"
#include "reputation.hh"
#include "response.hh"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace oracle {

// Session warning raised when too few distinct models answered
inline constexpr std::string_view LOW_MODEL_DIVERSITY_WARNING = "low_model_diversity";

// ============================================================================
// Defense Report
// ============================================================================

struct DefenseReport {
    std::vector<DefenseEvidence> evidence;   // findings first recorded by this evaluation
    std::vector<std::string> warnings;
    std::size_t model_diversity = 0;
};

struct PendingPenalty {
    agent_id_t agent_id;
    double amount = 0.0;
    ReputationReason reason = ReputationReason::ADJUSTMENT;
};

// ============================================================================
// Malicious Defense Manager
// ============================================================================

// Runs the Sybil, collusion and spectral detectors over a session's revealed
// responses, keeps the append-only evidence log, and turns each unique
// finding into a reputation penalty.
class MaliciousDefenseManager {
public:
    // Throws std::invalid_argument on an invalid config or a null ledger
    MaliciousDefenseManager(const ConsensusConfig& config,
                            std::shared_ptr<ReputationLedger> ledger);

    MaliciousDefenseManager(const MaliciousDefenseManager&) = delete;
    MaliciousDefenseManager& operator=(const MaliciousDefenseManager&) = delete;

    // Network origin used for Sybil grouping; a later call replaces the origin
    void register_origin(const agent_id_t& agent_id, const std::string& origin);
    [[nodiscard]] std::optional<std::string> origin_of(const agent_id_t& agent_id) const;

    // ------------------------------------------------------------------------
    // Detectors (no side effects)
    // ------------------------------------------------------------------------

    [[nodiscard]] std::vector<SybilEvidence> detect_sybil(
        session_id_t session_id, const std::vector<AgentResponse>& responses) const;

    [[nodiscard]] std::vector<CollusionEvidence> detect_collusion(
        session_id_t session_id, const std::vector<AgentResponse>& responses) const;

    [[nodiscard]] std::optional<SpectralAnomalyEvidence> analyze_spectral(
        session_id_t session_id, const AgentResponse& response) const;

    // Entropy clusters separated by more than MODEL_ENTROPY_GAP
    [[nodiscard]] std::size_t count_model_diversity(
        const std::vector<AgentResponse>& responses) const;

    // ------------------------------------------------------------------------
    // Evidence and penalties
    // ------------------------------------------------------------------------

    // Appends the finding and penalizes each implicated agent, immediately or
    // on flush_penalties(). Returns false for a finding already on record.
    bool record_evidence(const DefenseEvidence& evidence);

    // Runs every detector and records what they find
    DefenseReport evaluate(session_id_t session_id, const std::vector<AgentResponse>& responses);

    // Applies the penalties queued for a session; returns how many were applied
    std::size_t flush_penalties(session_id_t session_id);

    [[nodiscard]] std::vector<PendingPenalty> pending_penalties(session_id_t session_id) const;

    // Applies anything still queued for a finished session and drops its
    // duplicate-detection keys. The evidence log keeps the session's findings.
    void release_session(session_id_t session_id);

    // Drops the agent's origin; its evidence stays on record
    void forget_agent(const agent_id_t& agent_id);

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    [[nodiscard]] std::map<agent_id_t, std::set<EvidenceKind>> get_all_malicious_nodes() const;
    [[nodiscard]] std::optional<double> get_reputation_score(const agent_id_t& agent_id) const;
    [[nodiscard]] std::vector<DefenseEvidence> session_evidence(session_id_t session_id) const;
    [[nodiscard]] std::size_t evidence_count() const;

    // Clears the agent from the malicious index; the evidence log is kept
    void clear_agent_record(const agent_id_t& agent_id);

    [[nodiscard]] const std::shared_ptr<ReputationLedger>& ledger() const { return ledger_; }
    [[nodiscard]] const ConsensusConfig& config() const { return config_; }

    [[nodiscard]] static double base_penalty(EvidenceKind kind);

private:
    ConsensusConfig config_;
    std::shared_ptr<ReputationLedger> ledger_;

    std::unordered_map<agent_id_t, std::string> origins_;
    std::unordered_map<session_id_t, std::vector<DefenseEvidence>> evidence_;
    std::unordered_map<session_id_t, std::unordered_set<std::string>> evidence_keys_;
    std::size_t evidence_count_ = 0;
    std::map<agent_id_t, std::set<EvidenceKind>> malicious_;
    std::unordered_map<session_id_t, std::vector<PendingPenalty>> pending_;

    mutable std::mutex mutex_;
};

}  // namespace oracle
