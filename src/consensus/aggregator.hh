#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "evidence.hh"
#include "reputation.hh"
#include "response.hh"
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace oracle {

inline constexpr std::string_view DEGENERATE_CONSENSUS_WARNING = "degenerate_consensus";

// ============================================================================
// Consensus Result
// ============================================================================

struct ConsensusResult {
    session_id_t session_id = 0;
    double consensus_value = 0.0;
    AggregationMethod method = AggregationMethod::MEAN;   // as applied; never ADAPTIVE
    double consensus_similarity = 0.0;           // mean over all response pairs
    std::vector<agent_id_t> valid_agents;        // sorted
    std::vector<agent_id_t> outliers;            // revealed but not valid; sorted
    std::vector<agent_id_t> excluded_agents;     // outliers by low or inactive reputation alone
    std::vector<agent_id_t> missing_agents;      // participants with no accepted reveal
    std::map<agent_id_t, double> agent_similarity;
    double pass_rate = 0.0;                      // |valid_agents| / |participants|
    std::vector<DefenseEvidence> evidence;
    std::vector<std::string> warnings;
    hash_t reveal_root{};                        // Merkle root of accepted reveal hashes
    timestamp_ms_t finalized_at_ms = 0;

    [[nodiscard]] bool has_warning(std::string_view warning) const;
    [[nodiscard]] bool is_valid(const agent_id_t& agent_id) const;

    // Canonical encoding handed to the result publisher
    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] hash_t result_hash() const;
};

// ============================================================================
// Aggregation Input
// ============================================================================

struct AggregationInput {
    session_id_t session_id = 0;
    ProtocolPhase phase = ProtocolPhase::PENDING;
    std::set<agent_id_t> participants;
    std::vector<AgentResponse> responses;
    std::vector<hash_t> reveal_hashes;           // any order; sorted before hashing
    std::vector<DefenseEvidence> evidence;
    std::vector<std::string> warnings;
    timestamp_ms_t now_ms = 0;
};

struct AggregationOutcome {
    ConsensusError error = ConsensusError::NONE;
    std::optional<ConsensusResult> result;

    [[nodiscard]] bool ok() const { return error == ConsensusError::NONE && result.has_value(); }
};

// ============================================================================
// Consensus Aggregator
// ============================================================================

class ConsensusAggregator {
public:
    // Throws std::invalid_argument on an invalid config or a null ledger
    ConsensusAggregator(const ConsensusConfig& config, std::shared_ptr<ReputationLedger> ledger);

    // Partitions the responses and computes the consensus value. Reads
    // reputation but never changes it; the same input always gives the same
    // result.
    [[nodiscard]] AggregationOutcome aggregate(const AggregationInput& input) const;

    // Rewards valid agents in proportion to their similarity and charges
    // outliers the outlier penalty
    void settle(const ConsensusResult& result);

    [[nodiscard]] const ConsensusConfig& config() const { return config_; }

    // Method ADAPTIVE resolves to for these values and weights
    [[nodiscard]] AggregationMethod select_method(std::span<const double> values,
                                                  std::span<const double> weights) const;

    // Combines scalar summaries with the configured method. Weights are
    // positive and parallel to values.
    [[nodiscard]] double combine(std::span<const double> values, std::span<const double> weights,
                                 AggregationMethod method) const;

private:
    ConsensusConfig config_;
    std::shared_ptr<ReputationLedger> ledger_;
};

}  // namespace oracle
