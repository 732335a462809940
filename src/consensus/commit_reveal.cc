#include "commit_reveal.hh"
#include "crypto/hash.hh"

namespace oracle {

namespace {

constexpr std::string_view COMMIT_DOMAIN = "oracle.commitment.v1";

}  // namespace

// ============================================================================
// Commitment Implementation
// ============================================================================

std::vector<std::uint8_t> Commitment::signing_bytes(session_id_t session_id) const {
    std::vector<std::uint8_t> result;
    result.reserve(COMMIT_DOMAIN.size() + 8 + 4 + agent_id.size() + HASH_SIZE + 8 + NONCE_SIZE);

    result.insert(result.end(), COMMIT_DOMAIN.begin(), COMMIT_DOMAIN.end());
    append_u64(result, session_id);
    append_string(result, agent_id);
    append_bytes(result, commitment_hash);
    append_i64(result, timestamp);
    append_bytes(result, nonce);
    return result;
}

std::vector<std::uint8_t> Commitment::serialize() const {
    std::vector<std::uint8_t> result;
    result.reserve(4 + agent_id.size() + HASH_SIZE + 8 + NONCE_SIZE + 1 +
                   (signature ? MLDSA65_SIGNATURE_SIZE : 0));

    append_string(result, agent_id);
    append_bytes(result, commitment_hash);
    append_i64(result, timestamp);
    append_bytes(result, nonce);

    append_u8(result, signature.has_value() ? 1 : 0);
    if (signature) {
        append_bytes(result, *signature);
    }
    return result;
}

std::optional<Commitment> Commitment::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    Commitment commitment;

    std::uint8_t has_signature = 0;
    if (!reader.read_string(commitment.agent_id, MAX_AGENT_ID_LENGTH) ||
        !reader.read_bytes(commitment.commitment_hash) ||
        !reader.read_i64(commitment.timestamp) ||
        !reader.read_bytes(commitment.nonce) ||
        !reader.read_u8(has_signature) ||
        has_signature > 1) {
        return std::nullopt;
    }

    if (has_signature) {
        mldsa_signature_t sig;
        if (!reader.read_bytes(sig)) {
            return std::nullopt;
        }
        commitment.signature = sig;
    }

    if (!reader.at_end()) {
        return std::nullopt;
    }
    return commitment;
}

Commitment Commitment::create(const agent_id_t& agent_id,
                              std::span<const std::uint8_t> response_data,
                              const nonce_t& nonce,
                              timestamp_ms_t timestamp) {
    Commitment commitment;
    commitment.agent_id = agent_id;
    commitment.commitment_hash = oracle::commitment_hash(response_data, nonce);
    commitment.timestamp = timestamp;
    commitment.nonce = nonce;
    return commitment;
}

// ============================================================================
// Reveal Implementation
// ============================================================================

hash_t Reveal::reveal_hash() const {
    return commitment_hash(response_data, nonce);
}

bool Reveal::matches(const Commitment& commitment) const {
    return agent_id == commitment.agent_id &&
           hashes_equal(reveal_hash(), commitment.commitment_hash);
}

std::vector<std::uint8_t> Reveal::serialize() const {
    std::vector<std::uint8_t> result;
    result.reserve(4 + agent_id.size() + 4 + response_data.size() + NONCE_SIZE + 8);

    append_string(result, agent_id);
    append_blob(result, response_data);
    append_bytes(result, nonce);
    append_i64(result, timestamp);
    return result;
}

std::optional<Reveal> Reveal::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    Reveal reveal;

    if (!reader.read_string(reveal.agent_id, MAX_AGENT_ID_LENGTH) ||
        !reader.read_blob(reveal.response_data, MAX_RESPONSE_SIZE) ||
        !reader.read_bytes(reveal.nonce) ||
        !reader.read_i64(reveal.timestamp) ||
        !reader.at_end()) {
        return std::nullopt;
    }
    return reveal;
}

}  // namespace oracle
