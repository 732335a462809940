#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "evidence.hh"
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace oracle {

// ============================================================================
// Independent Thinking Guard
// ============================================================================

// Flags responses computed implausibly fast or with implausibly uniform
// timing across a session. Works only on durations handed to it; it never
// waits on the clock itself.
class IndependentThinkingGuard {
public:
    struct Observation {
        bool recorded = false;                          // false for a repeat in the same session
        std::vector<TimingAnomalyEvidence> anomalies;   // floor and z-score findings
    };

    explicit IndependentThinkingGuard(const ConsensusConfig& config);

    // One start per (session, agent)
    [[nodiscard]] ConsensusError record_start(const agent_id_t& agent_id,
                                              session_id_t session_id,
                                              timestamp_ms_t started_at);

    [[nodiscard]] std::optional<timestamp_ms_t> start_time(session_id_t session_id,
                                                           const agent_id_t& agent_id) const;

    // Milliseconds from the recorded start to now_ms; clamped at zero
    [[nodiscard]] std::optional<std::uint64_t> elapsed_since_start(session_id_t session_id,
                                                                   const agent_id_t& agent_id,
                                                                   timestamp_ms_t now_ms) const;

    // Hard floor check. Pure; does not touch any window or history.
    [[nodiscard]] std::optional<TimingAnomalyEvidence> verify_duration(
        const agent_id_t& agent_id,
        std::uint64_t observed_ms,
        std::uint64_t min_plausible_ms,
        session_id_t session_id = 0) const;

    // Records the duration into the session window and the agent's history,
    // then runs the floor and z-score checks.
    Observation observe(session_id_t session_id, const agent_id_t& agent_id,
                        std::uint64_t observed_ms);

    // Evidence for every agent in the window when the session's durations
    // are too uniform
    [[nodiscard]] std::vector<TimingAnomalyEvidence> check_synchronization(
        session_id_t session_id) const;

    [[nodiscard]] std::vector<std::pair<agent_id_t, std::uint64_t>> session_durations(
        session_id_t session_id) const;

    [[nodiscard]] std::size_t history_size(const agent_id_t& agent_id) const;

    // Drops starts and the duration window; per-agent history survives
    void clear_session(session_id_t session_id);

    // Drops the agent's duration history
    void forget_agent(const agent_id_t& agent_id);

private:
    using StartKey = std::pair<session_id_t, agent_id_t>;

    ConsensusConfig config_;
    std::map<StartKey, timestamp_ms_t> starts_;
    std::unordered_map<session_id_t, std::deque<std::pair<agent_id_t, std::uint64_t>>> windows_;
    std::unordered_map<agent_id_t, std::deque<double>> histories_;
    mutable std::mutex mutex_;

    std::optional<TimingAnomalyEvidence> check_history(session_id_t session_id,
                                                       const agent_id_t& agent_id,
                                                       std::uint64_t observed_ms);
};

}  // namespace oracle
