#pragma once

#include "types.hh"
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace oracle {

// ============================================================================
// Consensus Configuration
// ============================================================================

struct ConsensusConfig {
    // Defense thresholds
    double sybil_threshold = 0.75;
    double collusion_similarity_threshold = 0.85;
    std::uint32_t min_model_diversity = 3;
    double min_spectral_entropy = 0.6;
    double max_spectral_entropy = 0.9;
    double timing_anomaly_threshold = 2.5;       // z-score
    double reputation_penalty_factor = 0.5;
    bool enable_instant_penalty = true;

    // Aggregation
    double consensus_similarity_threshold = 0.5;
    double exclusion_score = 100.0;              // agents below this never count as valid
    bool reputation_weighted_consensus = false;
    AggregationMethod aggregation_method = AggregationMethod::MEAN;
    double trimmed_mean_fraction = 0.1;          // dropped from each end, below 0.5
    double adaptive_cv_threshold = 0.3;          // value dispersion that selects the median
    double adaptive_weight_cv_threshold = 3.0;   // weight dispersion that selects the median

    // Session timing, each window at most MAX_PHASE_TIMEOUT_MS
    std::uint64_t commit_timeout_ms = 30'000;
    std::uint64_t reveal_timeout_ms = 30'000;
    double quorum_fraction = 0.6;

    // Independent thinking
    std::uint64_t min_plausible_duration_ms = 100;
    double timing_cv_floor = 0.05;

    // Session challenge; dimension 0 lets agents choose their own
    std::uint32_t intervention_dimension = 0;
    double intervention_magnitude = 0.5;

    bool require_signed_commitments = false;

    // Returns a description of the first invalid field
    [[nodiscard]] std::optional<std::string> validate() const;

    // Sets one option from its textual form. Unknown keys and unparsable
    // values leave the config untouched.
    bool set_option(std::string_view key, std::string_view value);

    [[nodiscard]] static std::optional<ConsensusConfig> from_options(
        const std::map<std::string, std::string>& options);

    // Smallest number of commitments or reveals that keeps a session alive
    [[nodiscard]] std::size_t quorum_for(std::size_t participants) const;
};

}  // namespace oracle
