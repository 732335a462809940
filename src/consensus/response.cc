#include "response.hh"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace oracle {

namespace {

bool all_finite(const std::vector<double>& values) {
    return std::all_of(values.begin(), values.end(),
                       [](double v) { return std::isfinite(v); });
}

}  // namespace

double AgentResponse::scalar_summary() const {
    if (causal_response.empty()) {
        return base_prediction;
    }
    double sum = std::accumulate(causal_response.begin(), causal_response.end(), 0.0);
    return base_prediction + sum / static_cast<double>(causal_response.size());
}

bool AgentResponse::is_well_formed() const {
    if (agent_id.empty() || causal_response.empty()) {
        return false;
    }
    if (intervention_vector.size() != causal_response.size()) {
        return false;
    }
    return std::isfinite(base_prediction) &&
           all_finite(intervention_vector) &&
           all_finite(causal_response) &&
           all_finite(spectral_features);
}

std::vector<std::uint8_t> AgentResponse::serialize() const {
    std::vector<std::uint8_t> result;
    result.reserve(1 + 4 + agent_id.size() + 8 +
                   12 + 8 * (intervention_vector.size() + causal_response.size() +
                             spectral_features.size()) +
                   4 + proof_reference.size());

    append_u8(result, VERSION);
    append_string(result, agent_id);
    append_f64(result, base_prediction);
    append_f64_vector(result, intervention_vector);
    append_f64_vector(result, causal_response);
    append_f64_vector(result, spectral_features);
    append_string(result, proof_reference);
    return result;
}

std::optional<AgentResponse> AgentResponse::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() > MAX_RESPONSE_SIZE) {
        return std::nullopt;
    }

    ByteReader reader(data);
    AgentResponse response;

    std::uint8_t version = 0;
    if (!reader.read_u8(version) || version != VERSION) {
        return std::nullopt;
    }

    if (!reader.read_string(response.agent_id, MAX_AGENT_ID_LENGTH) ||
        !reader.read_f64(response.base_prediction) ||
        !reader.read_f64_vector(response.intervention_vector, MAX_VECTOR_DIMENSION) ||
        !reader.read_f64_vector(response.causal_response, MAX_VECTOR_DIMENSION) ||
        !reader.read_f64_vector(response.spectral_features, MAX_VECTOR_DIMENSION) ||
        !reader.read_string(response.proof_reference, MAX_PROOF_REFERENCE_LENGTH)) {
        return std::nullopt;
    }

    // Exactly one encoding per response
    if (!reader.at_end()) {
        return std::nullopt;
    }

    return response;
}

}  // namespace oracle
