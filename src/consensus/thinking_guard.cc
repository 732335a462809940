#include "thinking_guard.hh"
#include "core/logging.hh"
#include "similarity.hh"
#include <algorithm>
#include <cmath>

namespace oracle {

IndependentThinkingGuard::IndependentThinkingGuard(const ConsensusConfig& config)
    : config_(config) {}

// ============================================================================
// Start Tracking
// ============================================================================

ConsensusError IndependentThinkingGuard::record_start(const agent_id_t& agent_id,
                                                      session_id_t session_id,
                                                      timestamp_ms_t started_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = starts_.try_emplace(StartKey{session_id, agent_id}, started_at);
    if (!inserted) {
        log::guard.debug() << "Duplicate start for " << agent_id << " in session " << session_id;
        return ConsensusError::ALREADY_STARTED;
    }
    return ConsensusError::NONE;
}

std::optional<timestamp_ms_t> IndependentThinkingGuard::start_time(session_id_t session_id,
                                                                   const agent_id_t& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = starts_.find(StartKey{session_id, agent_id});
    if (it == starts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::uint64_t> IndependentThinkingGuard::elapsed_since_start(
    session_id_t session_id, const agent_id_t& agent_id, timestamp_ms_t now_ms) const {
    auto started = start_time(session_id, agent_id);
    if (!started) {
        return std::nullopt;
    }
    if (now_ms <= *started) {
        return std::uint64_t{0};
    }
    return static_cast<std::uint64_t>(now_ms - *started);
}

// ============================================================================
// Duration Checks
// ============================================================================

std::optional<TimingAnomalyEvidence> IndependentThinkingGuard::verify_duration(
    const agent_id_t& agent_id, std::uint64_t observed_ms, std::uint64_t min_plausible_ms,
    session_id_t session_id) const {
    if (observed_ms >= min_plausible_ms) {
        return std::nullopt;
    }
    return make_below_floor_evidence(session_id, agent_id, observed_ms, min_plausible_ms);
}

IndependentThinkingGuard::Observation IndependentThinkingGuard::observe(
    session_id_t session_id, const agent_id_t& agent_id, std::uint64_t observed_ms) {
    Observation result;

    std::lock_guard<std::mutex> lock(mutex_);

    auto& window = windows_[session_id];
    bool seen = std::any_of(window.begin(), window.end(),
                            [&](const auto& entry) { return entry.first == agent_id; });
    if (seen) {
        return result;
    }

    window.emplace_back(agent_id, observed_ms);
    while (window.size() > TIMING_WINDOW_LIMIT) {
        window.pop_front();
    }
    result.recorded = true;

    if (auto floor = verify_duration(agent_id, observed_ms, config_.min_plausible_duration_ms,
                                     session_id)) {
        log::guard.warn() << agent_id << " finished in " << observed_ms << "ms, floor is "
                          << config_.min_plausible_duration_ms << "ms";
        result.anomalies.push_back(std::move(*floor));
    }

    if (auto outlier = check_history(session_id, agent_id, observed_ms)) {
        log::guard.warn() << agent_id << " duration " << observed_ms << "ms has z-score "
                          << outlier->statistic;
        result.anomalies.push_back(std::move(*outlier));
    }

    return result;
}

std::optional<TimingAnomalyEvidence> IndependentThinkingGuard::check_history(
    session_id_t session_id, const agent_id_t& agent_id, std::uint64_t observed_ms) {
    auto& history = histories_[agent_id];
    history.push_back(static_cast<double>(observed_ms));
    while (history.size() > TIMING_HISTORY_LIMIT) {
        history.pop_front();
    }

    if (history.size() < MIN_ZSCORE_SAMPLES) {
        return std::nullopt;
    }

    std::vector<double> samples(history.begin(), history.end());
    double mu = mean(samples);
    double sigma = std_dev(samples);
    if (sigma <= 0.0) {
        return std::nullopt;
    }

    double z = std::abs(static_cast<double>(observed_ms) - mu) / sigma;
    if (z <= config_.timing_anomaly_threshold) {
        return std::nullopt;
    }
    return make_outlier_evidence(session_id, agent_id, observed_ms, mu, sigma, z,
                                 config_.timing_anomaly_threshold);
}

std::vector<TimingAnomalyEvidence> IndependentThinkingGuard::check_synchronization(
    session_id_t session_id) const {
    std::vector<TimingAnomalyEvidence> result;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(session_id);
    if (it == windows_.end() || it->second.size() < MIN_SYNC_SAMPLES) {
        return result;
    }

    std::vector<double> durations;
    durations.reserve(it->second.size());
    for (const auto& [agent_id, ms] : it->second) {
        durations.push_back(static_cast<double>(ms));
    }

    double cv = coefficient_of_variation(durations);
    if (cv >= config_.timing_cv_floor) {
        return result;
    }

    log::guard.warn() << "Session " << session_id << " durations are synchronized (cv="
                      << cv << ", floor=" << config_.timing_cv_floor << ")";
    for (const auto& [agent_id, ms] : it->second) {
        result.push_back(make_synchronized_evidence(session_id, agent_id, ms, cv,
                                                    config_.timing_cv_floor));
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<std::pair<agent_id_t, std::uint64_t>> IndependentThinkingGuard::session_durations(
    session_id_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = windows_.find(session_id);
    if (it == windows_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

std::size_t IndependentThinkingGuard::history_size(const agent_id_t& agent_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(agent_id);
    return it == histories_.end() ? 0 : it->second.size();
}

void IndependentThinkingGuard::clear_session(session_id_t session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    windows_.erase(session_id);
    starts_.erase(starts_.lower_bound(StartKey{session_id, agent_id_t{}}),
                  starts_.lower_bound(StartKey{session_id + 1, agent_id_t{}}));
}

void IndependentThinkingGuard::forget_agent(const agent_id_t& agent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    histories_.erase(agent_id);
}

}  // namespace oracle
