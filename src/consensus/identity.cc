#include "identity.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"
#include "core/logging.hh"

namespace oracle {

AgentIdentityRegistry::RegisterResult AgentIdentityRegistry::register_agent(
    const agent_id_t& agent_id, const mldsa_public_key_t& public_key) {
    if (agent_id.empty() || agent_id.size() > MAX_AGENT_ID_LENGTH) {
        return RegisterResult::INVALID_AGENT_ID;
    }

    hash_t fingerprint = sha3_256(public_key);

    std::lock_guard<std::mutex> lock(mutex_);

    if (agents_.contains(agent_id)) {
        ORACLE_LOG_DEBUG(log::identity) << "Agent " << agent_id << " already registered";
        return RegisterResult::DUPLICATE;
    }
    if (key_owners_.contains(fingerprint)) {
        log::identity.warn() << "Key " << short_hex(fingerprint)
                             << " already registered to " << key_owners_[fingerprint]
                             << ", refusing " << agent_id;
        return RegisterResult::KEY_IN_USE;
    }

    agents_.emplace(agent_id, AgentRecord{public_key, fingerprint});
    key_owners_.emplace(fingerprint, agent_id);

    ORACLE_LOG_INFO(log::identity) << "Registered agent " << agent_id
                                   << " key=" << short_hex(fingerprint);
    return RegisterResult::SUCCESS;
}

bool AgentIdentityRegistry::revoke(const agent_id_t& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return false;
    }
    key_owners_.erase(it->second.key_fingerprint);
    agents_.erase(it);
    log::identity.info() << "Revoked agent " << agent_id;
    return true;
}

bool AgentIdentityRegistry::is_registered(const agent_id_t& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.contains(agent_id);
}

std::optional<mldsa_public_key_t> AgentIdentityRegistry::public_key(const agent_id_t& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = agents_.find(agent_id);
    if (it == agents_.end()) {
        return std::nullopt;
    }
    return it->second.public_key;
}

std::size_t AgentIdentityRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return agents_.size();
}

bool AgentIdentityRegistry::verify_commitment(session_id_t session_id,
                                              const Commitment& commitment) const {
    if (!commitment.signature) {
        ORACLE_LOG_DEBUG(log::identity) << "Unsigned commitment from " << commitment.agent_id;
        return false;
    }

    auto key = public_key(commitment.agent_id);
    if (!key) {
        ORACLE_LOG_DEBUG(log::identity) << "No key on file for " << commitment.agent_id;
        return false;
    }

    return mldsa_verify(*key, commitment.signing_bytes(session_id), *commitment.signature);
}

}  // namespace oracle
