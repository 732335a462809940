#include "reputation.hh"
#include "core/logging.hh"
#include <algorithm>
#include <cmath>

namespace oracle {

ReputationTier tier_for_score(double score) {
    if (score >= 900.0) return ReputationTier::PLATINUM;
    if (score >= 800.0) return ReputationTier::DIAMOND;
    if (score >= 700.0) return ReputationTier::GOLD;
    if (score >= 600.0) return ReputationTier::SILVER;
    if (score >= 500.0) return ReputationTier::BRONZE;
    if (score >= 400.0) return ReputationTier::IRON;
    if (score >= 300.0) return ReputationTier::COPPER;
    return ReputationTier::NEWBIE;
}

std::string_view reputation_tier_string(ReputationTier tier) {
    switch (tier) {
        case ReputationTier::NEWBIE: return "newbie";
        case ReputationTier::COPPER: return "copper";
        case ReputationTier::IRON: return "iron";
        case ReputationTier::BRONZE: return "bronze";
        case ReputationTier::SILVER: return "silver";
        case ReputationTier::GOLD: return "gold";
        case ReputationTier::DIAMOND: return "diamond";
        case ReputationTier::PLATINUM: return "platinum";
    }
    return "unknown";
}

std::string_view reputation_reason_string(ReputationReason reason) {
    switch (reason) {
        case ReputationReason::CONSENSUS_REWARD: return "consensus_reward";
        case ReputationReason::OUTLIER: return "outlier";
        case ReputationReason::SYBIL: return "sybil";
        case ReputationReason::COLLUSION: return "collusion";
        case ReputationReason::TIMING_ANOMALY: return "timing_anomaly";
        case ReputationReason::SPECTRAL_ANOMALY: return "spectral_anomaly";
        case ReputationReason::ADJUSTMENT: return "adjustment";
    }
    return "unknown";
}

// ============================================================================
// ReputationScore Implementation
// ============================================================================

double ReputationScore::success_rate() const {
    if (total_tasks == 0) {
        return 0.0;
    }
    return static_cast<double>(successful_tasks) / static_cast<double>(total_tasks);
}

bool ReputationScore::is_active() const {
    return !(outlier_count > 10 && success_rate() < 0.5);
}

// ============================================================================
// ReputationLedger Implementation
// ============================================================================

ReputationLedger::ReputationLedger(Clock clock)
    : clock_(clock ? std::move(clock) : Clock(system_now_ms)) {}

double ReputationLedger::apply_penalty(const agent_id_t& agent_id, double amount,
                                       ReputationReason reason) {
    if (!std::isfinite(amount) || amount < 0.0) {
        log::reputation.warn() << "Ignoring penalty of " << amount << " for " << agent_id;
        return score_or_initial(agent_id);
    }
    return apply(agent_id, -amount, reason);
}

double ReputationLedger::apply_reward(const agent_id_t& agent_id, double amount,
                                      ReputationReason reason) {
    if (!std::isfinite(amount) || amount < 0.0) {
        log::reputation.warn() << "Ignoring reward of " << amount << " for " << agent_id;
        return score_or_initial(agent_id);
    }
    return apply(agent_id, amount, reason);
}

bool ReputationLedger::is_active(const agent_id_t& agent_id) const {
    auto score = get(agent_id);
    return !score || score->is_active();
}

void ReputationLedger::insert_entry(const agent_id_t& agent_id) {
    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    auto [it, inserted] = entries_.try_emplace(agent_id, nullptr);
    if (inserted) {
        it->second = std::make_unique<Entry>();
        it->second->score.agent_id = agent_id;
        it->second->score.last_updated = clock_();
    }
}

double ReputationLedger::apply(const agent_id_t& agent_id, double delta, ReputationReason reason) {
    std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
    auto found = entries_.find(agent_id);
    while (found == entries_.end()) {
        index_lock.unlock();
        insert_entry(agent_id);
        index_lock.lock();
        found = entries_.find(agent_id);
    }
    Entry* entry = found->second.get();

    std::lock_guard<std::mutex> lock(entry->mutex);
    ReputationScore& s = entry->score;

    double before = s.score;
    ReputationTier tier_before = s.tier();
    s.score = std::clamp(before + delta, REPUTATION_MIN, REPUTATION_MAX);
    s.last_updated = clock_();

    switch (reason) {
        case ReputationReason::CONSENSUS_REWARD:
            ++s.total_tasks;
            ++s.successful_tasks;
            break;
        case ReputationReason::OUTLIER:
            ++s.total_tasks;
            ++s.outlier_count;
            break;
        default:
            break;
    }

    s.history.push_back(ReputationEvent{s.last_updated, reason, s.score - before, s.score});
    while (s.history.size() > REPUTATION_HISTORY_LIMIT) {
        s.history.pop_front();
    }

    ORACLE_LOG_DEBUG(log::reputation) << agent_id << " " << reputation_reason_string(reason)
                                      << " " << before << " -> " << s.score;
    if (s.tier() != tier_before) {
        log::reputation.info() << agent_id << " moved from " << reputation_tier_string(tier_before)
                               << " to " << reputation_tier_string(s.tier());
    }
    return s.score;
}

std::optional<ReputationScore> ReputationLedger::get(const agent_id_t& agent_id) const {
    std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
    auto it = entries_.find(agent_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->score;
}

std::optional<double> ReputationLedger::get_score(const agent_id_t& agent_id) const {
    std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
    auto it = entries_.find(agent_id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(it->second->mutex);
    return it->second->score.score;
}

double ReputationLedger::score_or_initial(const agent_id_t& agent_id) const {
    return get_score(agent_id).value_or(REPUTATION_INITIAL);
}

std::vector<agent_id_t> ReputationLedger::agents() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    std::vector<agent_id_t> result;
    result.reserve(entries_.size());
    for (const auto& [agent_id, entry] : entries_) {
        result.push_back(agent_id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t ReputationLedger::size() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return entries_.size();
}

std::vector<std::uint8_t> ReputationLedger::serialize() const {
    std::vector<std::uint8_t> result;

    std::shared_lock<std::shared_mutex> index_lock(index_mutex_);

    std::vector<const Entry*> ordered;
    ordered.reserve(entries_.size());
    for (const auto& [agent_id, entry] : entries_) {
        ordered.push_back(entry.get());
    }
    std::sort(ordered.begin(), ordered.end(), [](const Entry* a, const Entry* b) {
        return a->score.agent_id < b->score.agent_id;
    });

    append_u32(result, static_cast<std::uint32_t>(ordered.size()));
    for (const Entry* entry : ordered) {
        std::lock_guard<std::mutex> lock(entry->mutex);
        const ReputationScore& s = entry->score;
        append_string(result, s.agent_id);
        append_f64(result, s.score);
        append_u64(result, s.total_tasks);
        append_u64(result, s.successful_tasks);
        append_u64(result, s.outlier_count);
        append_i64(result, s.last_updated);
    }
    return result;
}

bool ReputationLedger::load(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    std::uint32_t count = 0;
    if (!reader.read_u32(count)) {
        return false;
    }

    std::unordered_map<agent_id_t, std::unique_ptr<Entry>> loaded;
    for (std::uint32_t i = 0; i < count; ++i) {
        auto entry = std::make_unique<Entry>();
        ReputationScore& s = entry->score;
        if (!reader.read_string(s.agent_id, MAX_AGENT_ID_LENGTH) ||
            !reader.read_f64(s.score) ||
            !reader.read_u64(s.total_tasks) ||
            !reader.read_u64(s.successful_tasks) ||
            !reader.read_u64(s.outlier_count) ||
            !reader.read_i64(s.last_updated)) {
            return false;
        }
        if (!std::isfinite(s.score) || s.score < REPUTATION_MIN || s.score > REPUTATION_MAX ||
            s.successful_tasks > s.total_tasks || s.agent_id.empty()) {
            return false;
        }
        auto id = s.agent_id;
        if (!loaded.emplace(std::move(id), std::move(entry)).second) {
            return false;
        }
    }
    if (!reader.at_end()) {
        return false;
    }

    std::unique_lock<std::shared_mutex> lock(index_mutex_);
    entries_ = std::move(loaded);
    log::reputation.info() << "Loaded reputation snapshot with " << entries_.size() << " agents";
    return true;
}

}  // namespace oracle
