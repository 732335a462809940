#pragma once

#include "core/types.hh"
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace oracle {

// ============================================================================
// Agent Response (causal fingerprint)
// ============================================================================

// Decoded form of Reveal::response_data.
struct AgentResponse {
    static constexpr std::uint8_t VERSION = 1;

    agent_id_t agent_id;
    std::vector<double> intervention_vector;   // perturbation the agent applied
    std::vector<double> causal_response;       // response delta under that perturbation
    std::vector<double> spectral_features;
    std::string proof_reference;               // external proof handle, opaque here
    double base_prediction = 0.0;

    // base_prediction + mean(causal_response)
    [[nodiscard]] double scalar_summary() const;

    // Non-empty causal response matching the intervention dimension, all
    // components finite.
    [[nodiscard]] bool is_well_formed() const;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<AgentResponse> deserialize(
        std::span<const std::uint8_t> data);
};

}  // namespace oracle
