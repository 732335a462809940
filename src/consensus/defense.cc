#include "defense.hh"
#include "core/logging.hh"
#include "similarity.hh"
#include <algorithm>
#include <stdexcept>

namespace oracle {

namespace {

ReputationReason reason_for(EvidenceKind kind) {
    switch (kind) {
        case EvidenceKind::SYBIL: return ReputationReason::SYBIL;
        case EvidenceKind::COLLUSION: return ReputationReason::COLLUSION;
        case EvidenceKind::TIMING_ANOMALY: return ReputationReason::TIMING_ANOMALY;
        case EvidenceKind::SPECTRAL_ANOMALY: return ReputationReason::SPECTRAL_ANOMALY;
    }
    return ReputationReason::ADJUSTMENT;
}

}  // namespace

MaliciousDefenseManager::MaliciousDefenseManager(const ConsensusConfig& config,
                                                 std::shared_ptr<ReputationLedger> ledger)
    : config_(config), ledger_(std::move(ledger)) {
    if (auto problem = config_.validate()) {
        throw std::invalid_argument("invalid consensus config: " + *problem);
    }
    if (!ledger_) {
        throw std::invalid_argument("defense manager requires a reputation ledger");
    }
}

double MaliciousDefenseManager::base_penalty(EvidenceKind kind) {
    switch (kind) {
        case EvidenceKind::SYBIL: return SYBIL_BASE_PENALTY;
        case EvidenceKind::COLLUSION: return COLLUSION_BASE_PENALTY;
        case EvidenceKind::TIMING_ANOMALY: return TIMING_BASE_PENALTY;
        case EvidenceKind::SPECTRAL_ANOMALY: return SPECTRAL_BASE_PENALTY;
    }
    return 0.0;
}

void MaliciousDefenseManager::register_origin(const agent_id_t& agent_id,
                                              const std::string& origin) {
    std::lock_guard<std::mutex> lock(mutex_);
    origins_[agent_id] = origin;
}

std::optional<std::string> MaliciousDefenseManager::origin_of(const agent_id_t& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = origins_.find(agent_id);
    if (it == origins_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Detectors
// ============================================================================

std::vector<SybilEvidence> MaliciousDefenseManager::detect_sybil(
    session_id_t session_id, const std::vector<AgentResponse>& responses) const {
    std::map<std::string, std::vector<std::size_t>> by_origin;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::size_t i = 0; i < responses.size(); ++i) {
            auto it = origins_.find(responses[i].agent_id);
            if (it != origins_.end()) {
                by_origin[it->second].push_back(i);
            }
        }
    }

    std::vector<SybilEvidence> result;
    for (const auto& [origin, members] : by_origin) {
        if (members.size() < 2) {
            continue;
        }

        std::vector<std::vector<double>> vectors;
        vectors.reserve(members.size());
        for (std::size_t idx : members) {
            vectors.push_back(responses[idx].causal_response);
        }
        SimilarityMatrix matrix(vectors);
        std::vector<std::size_t> rows(members.size());
        for (std::size_t r = 0; r < rows.size(); ++r) {
            rows[r] = r;
        }
        double max_similarity = matrix.max_among(rows);

        if (max_similarity > config_.sybil_threshold) {
            std::set<agent_id_t> agents;
            for (std::size_t idx : members) {
                agents.insert(responses[idx].agent_id);
            }
            result.push_back(make_sybil_evidence(session_id, origin, std::move(agents),
                                                 max_similarity));
        }
    }
    return result;
}

std::vector<CollusionEvidence> MaliciousDefenseManager::detect_collusion(
    session_id_t session_id, const std::vector<AgentResponse>& responses) const {
    std::vector<CollusionEvidence> result;
    for (std::size_t i = 0; i < responses.size(); ++i) {
        for (std::size_t j = i + 1; j < responses.size(); ++j) {
            double sim = cosine_similarity(responses[i].causal_response,
                                           responses[j].causal_response);
            if (sim >= config_.collusion_similarity_threshold) {
                result.push_back(make_collusion_evidence(session_id, responses[i].agent_id,
                                                         responses[j].agent_id, sim));
            }
        }
    }
    return result;
}

std::optional<SpectralAnomalyEvidence> MaliciousDefenseManager::analyze_spectral(
    session_id_t session_id, const AgentResponse& response) const {
    ValueRange acceptable{config_.min_spectral_entropy, config_.max_spectral_entropy};
    double entropy = normalized_spectral_entropy(response.causal_response);
    if (acceptable.contains(entropy)) {
        return std::nullopt;
    }
    return make_spectral_evidence(session_id, response.agent_id, entropy, acceptable);
}

std::size_t MaliciousDefenseManager::count_model_diversity(
    const std::vector<AgentResponse>& responses) const {
    if (responses.empty()) {
        return 0;
    }

    std::vector<double> entropies;
    entropies.reserve(responses.size());
    for (const auto& response : responses) {
        entropies.push_back(normalized_spectral_entropy(response.causal_response));
    }
    std::sort(entropies.begin(), entropies.end());

    std::size_t models = 1;
    double cluster_start = entropies.front();
    for (double h : entropies) {
        if (h - cluster_start > MODEL_ENTROPY_GAP) {
            ++models;
            cluster_start = h;
        }
    }
    return models;
}

// ============================================================================
// Evidence Recording
// ============================================================================

bool MaliciousDefenseManager::record_evidence(const DefenseEvidence& evidence) {
    std::string key = evidence_key(evidence);
    EvidenceKind kind = evidence_kind(evidence);
    session_id_t session_id = evidence_session(evidence);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!evidence_keys_[session_id].insert(key).second) {
        return false;
    }

    evidence_[session_id].push_back(evidence);
    ++evidence_count_;

    log::defense.warn() << "Session " << session_id << ": " << describe_evidence(evidence);

    double amount = base_penalty(kind) * evidence_severity(evidence) *
                    config_.reputation_penalty_factor;
    ReputationReason reason = reason_for(kind);

    for (const auto& agent_id : implicated_agents(evidence)) {
        malicious_[agent_id].insert(kind);
        if (config_.enable_instant_penalty) {
            ledger_->apply_penalty(agent_id, amount, reason);
        } else {
            pending_[session_id].push_back(PendingPenalty{agent_id, amount, reason});
        }
    }
    return true;
}

DefenseReport MaliciousDefenseManager::evaluate(session_id_t session_id,
                                                const std::vector<AgentResponse>& responses) {
    DefenseReport report;

    std::vector<DefenseEvidence> findings;
    for (auto& ev : detect_sybil(session_id, responses)) {
        findings.emplace_back(std::move(ev));
    }
    for (auto& ev : detect_collusion(session_id, responses)) {
        findings.emplace_back(std::move(ev));
    }
    for (const auto& response : responses) {
        if (auto ev = analyze_spectral(session_id, response)) {
            findings.emplace_back(std::move(*ev));
        }
    }

    for (auto& finding : findings) {
        if (record_evidence(finding)) {
            report.evidence.push_back(std::move(finding));
        }
    }

    report.model_diversity = count_model_diversity(responses);
    if (report.model_diversity < config_.min_model_diversity) {
        log::defense.info() << "Session " << session_id << " has " << report.model_diversity
                            << " distinct models, expected at least "
                            << config_.min_model_diversity;
        report.warnings.emplace_back(LOW_MODEL_DIVERSITY_WARNING);
    }

    ORACLE_LOG_DEBUG(log::defense) << "Session " << session_id << " evaluated: "
                                   << report.evidence.size() << " new findings";
    return report;
}

std::size_t MaliciousDefenseManager::flush_penalties(session_id_t session_id) {
    std::vector<PendingPenalty> queued;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(session_id);
        if (it == pending_.end()) {
            return 0;
        }
        queued = std::move(it->second);
        pending_.erase(it);
    }

    for (const auto& penalty : queued) {
        ledger_->apply_penalty(penalty.agent_id, penalty.amount, penalty.reason);
    }
    return queued.size();
}

void MaliciousDefenseManager::release_session(session_id_t session_id) {
    std::size_t applied = flush_penalties(session_id);

    std::lock_guard<std::mutex> lock(mutex_);
    evidence_keys_.erase(session_id);
    ORACLE_LOG_DEBUG(log::defense) << "Released session " << session_id << " ("
                                   << applied << " late penalties)";
}

void MaliciousDefenseManager::forget_agent(const agent_id_t& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    origins_.erase(agent_id);
}

std::vector<PendingPenalty> MaliciousDefenseManager::pending_penalties(
    session_id_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(session_id);
    if (it == pending_.end()) {
        return {};
    }
    return it->second;
}

// ============================================================================
// Queries
// ============================================================================

std::map<agent_id_t, std::set<EvidenceKind>> MaliciousDefenseManager::get_all_malicious_nodes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return malicious_;
}

std::optional<double> MaliciousDefenseManager::get_reputation_score(
    const agent_id_t& agent_id) const {
    return ledger_->get_score(agent_id);
}

std::vector<DefenseEvidence> MaliciousDefenseManager::session_evidence(
    session_id_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = evidence_.find(session_id);
    if (it == evidence_.end()) {
        return {};
    }
    return it->second;
}

std::size_t MaliciousDefenseManager::evidence_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evidence_count_;
}

void MaliciousDefenseManager::clear_agent_record(const agent_id_t& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (malicious_.erase(agent_id) > 0) {
        log::defense.info() << "Cleared malicious record for " << agent_id;
    }
}

}  // namespace oracle
