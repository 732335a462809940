#pragma once

#include "core/types.hh"
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace oracle {

// ============================================================================
// Reputation Tiers
// ============================================================================

enum class ReputationTier : std::uint8_t {
    NEWBIE = 0,      // < 300
    COPPER = 1,      // >= 300
    IRON = 2,        // >= 400
    BRONZE = 3,      // >= 500
    SILVER = 4,      // >= 600
    GOLD = 5,        // >= 700
    DIAMOND = 6,     // >= 800
    PLATINUM = 7,    // >= 900
};

[[nodiscard]] ReputationTier tier_for_score(double score);
[[nodiscard]] std::string_view reputation_tier_string(ReputationTier tier);

enum class ReputationReason : std::uint8_t {
    CONSENSUS_REWARD = 0,
    OUTLIER = 1,
    SYBIL = 2,
    COLLUSION = 3,
    TIMING_ANOMALY = 4,
    SPECTRAL_ANOMALY = 5,
    ADJUSTMENT = 6,
};

[[nodiscard]] std::string_view reputation_reason_string(ReputationReason reason);

// ============================================================================
// Reputation Score
// ============================================================================

struct ReputationEvent {
    timestamp_ms_t at = 0;
    ReputationReason reason = ReputationReason::ADJUSTMENT;
    double delta = 0.0;          // applied change after saturation
    double score_after = 0.0;
};

struct ReputationScore {
    agent_id_t agent_id;
    double score = REPUTATION_INITIAL;
    std::uint64_t total_tasks = 0;
    std::uint64_t successful_tasks = 0;
    std::uint64_t outlier_count = 0;
    timestamp_ms_t last_updated = 0;
    std::deque<ReputationEvent> history;   // most recent REPUTATION_HISTORY_LIMIT

    [[nodiscard]] ReputationTier tier() const { return tier_for_score(score); }
    [[nodiscard]] double success_rate() const;

    // Repeat outliers with a poor success record drop out of rotation
    [[nodiscard]] bool is_active() const;
};

// ============================================================================
// Reputation Ledger
// ============================================================================

// In-memory view of agent reputation, shared between the defense manager and
// the aggregator. Updates are atomic per agent and saturate at
// [REPUTATION_MIN, REPUTATION_MAX].
class ReputationLedger {
public:
    using Clock = std::function<timestamp_ms_t()>;

    explicit ReputationLedger(Clock clock = {});

    ReputationLedger(const ReputationLedger&) = delete;
    ReputationLedger& operator=(const ReputationLedger&) = delete;

    // Both return the score after the update. Negative or non-finite amounts
    // are ignored.
    double apply_penalty(const agent_id_t& agent_id, double amount, ReputationReason reason);
    double apply_reward(const agent_id_t& agent_id, double amount, ReputationReason reason);

    [[nodiscard]] std::optional<ReputationScore> get(const agent_id_t& agent_id) const;
    [[nodiscard]] std::optional<double> get_score(const agent_id_t& agent_id) const;

    // Unknown agents start at REPUTATION_INITIAL
    [[nodiscard]] double score_or_initial(const agent_id_t& agent_id) const;

    // Unknown agents are active
    [[nodiscard]] bool is_active(const agent_id_t& agent_id) const;

    [[nodiscard]] std::vector<agent_id_t> agents() const;
    [[nodiscard]] std::size_t size() const;

    // Snapshot without history, for the external durable copy
    [[nodiscard]] std::vector<std::uint8_t> serialize() const;

    // Replaces every entry with the snapshot's contents. Leaves the ledger
    // untouched and returns false on malformed input.
    bool load(std::span<const std::uint8_t> data);

private:
    struct Entry {
        mutable std::mutex mutex;
        ReputationScore score;
    };

    Clock clock_;
    std::unordered_map<agent_id_t, std::unique_ptr<Entry>> entries_;
    mutable std::shared_mutex index_mutex_;

    void insert_entry(const agent_id_t& agent_id);
    double apply(const agent_id_t& agent_id, double delta, ReputationReason reason);
};

}  // namespace oracle
