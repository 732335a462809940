#pragma once

#include "core/types.hh"
#include "commit_reveal.hh"
#include <mutex>
#include <optional>
#include <unordered_map>

namespace oracle {

// ============================================================================
// Agent Identity Registry
// ============================================================================

// Maps agent ids to ML-DSA-65 public keys. Issuing and proving identities
// happens elsewhere; this registry only checks commitment signatures.
class AgentIdentityRegistry {
public:
    AgentIdentityRegistry() = default;

    enum class RegisterResult {
        SUCCESS,
        DUPLICATE,
        INVALID_AGENT_ID,
        KEY_IN_USE,          // another agent already holds this key
    };
    RegisterResult register_agent(const agent_id_t& agent_id, const mldsa_public_key_t& public_key);

    // Removes an agent; its commitments stop verifying
    bool revoke(const agent_id_t& agent_id);

    [[nodiscard]] bool is_registered(const agent_id_t& agent_id) const;
    [[nodiscard]] std::optional<mldsa_public_key_t> public_key(const agent_id_t& agent_id) const;
    [[nodiscard]] std::size_t size() const;

    // True only for a registered agent whose signature covers the
    // commitment's signing bytes for this session
    [[nodiscard]] bool verify_commitment(session_id_t session_id, const Commitment& commitment) const;

private:
    struct AgentRecord {
        mldsa_public_key_t public_key;
        hash_t key_fingerprint;
    };

    std::unordered_map<agent_id_t, AgentRecord> agents_;
    std::unordered_map<hash_t, agent_id_t> key_owners_;   // keyed by SHA3(public_key)
    mutable std::mutex mutex_;
};

}  // namespace oracle
