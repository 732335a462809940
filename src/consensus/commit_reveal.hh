#pragma once

#include "core/types.hh"
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace oracle {

// ============================================================================
// Commitment
// ============================================================================

struct Commitment {
    agent_id_t agent_id;
    hash_t commitment_hash{};                    // SHA3(response_data || nonce)
    timestamp_ms_t timestamp = 0;
    nonce_t nonce{};
    std::optional<mldsa_signature_t> signature;  // over signing_bytes(session)

    // Binds the commitment to one session so it cannot be replayed elsewhere
    [[nodiscard]] std::vector<std::uint8_t> signing_bytes(session_id_t session_id) const;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<Commitment> deserialize(
        std::span<const std::uint8_t> data);

    [[nodiscard]] static Commitment create(const agent_id_t& agent_id,
                                           std::span<const std::uint8_t> response_data,
                                           const nonce_t& nonce,
                                           timestamp_ms_t timestamp);
};

// ============================================================================
// Reveal
// ============================================================================

struct Reveal {
    agent_id_t agent_id;
    std::vector<std::uint8_t> response_data;
    nonce_t nonce{};
    timestamp_ms_t timestamp = 0;

    // Hash this reveal commits to
    [[nodiscard]] hash_t reveal_hash() const;

    // Constant-time check against a stored commitment
    [[nodiscard]] bool matches(const Commitment& commitment) const;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<Reveal> deserialize(
        std::span<const std::uint8_t> data);
};

// ============================================================================
// Append-only Session Log
// ============================================================================

// One record per (session, agent). Records are never replaced or removed
// while their session is live; visibility across phases is the
// coordinator's concern.
template<typename Record>
class SessionLog {
public:
    enum class AddResult {
        ADDED,
        DUPLICATE,
    };

    AddResult add(session_id_t session_id, const Record& record) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [it, inserted] = records_.try_emplace(Key{session_id, record.agent_id}, record);
        return inserted ? AddResult::ADDED : AddResult::DUPLICATE;
    }

    [[nodiscard]] std::optional<Record> get(session_id_t session_id,
                                            const agent_id_t& agent_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(Key{session_id, agent_id});
        if (it == records_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] bool contains(session_id_t session_id, const agent_id_t& agent_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.contains(Key{session_id, agent_id});
    }

    [[nodiscard]] std::size_t count(session_id_t session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [first, last] = session_range(session_id);
        return static_cast<std::size_t>(std::distance(first, last));
    }

    // Records of one session, ordered by agent id
    [[nodiscard]] std::vector<Record> session_records(session_id_t session_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Record> result;
        auto [first, last] = session_range(session_id);
        for (auto it = first; it != last; ++it) {
            result.push_back(it->second);
        }
        return result;
    }

    // Drops a finished session's records
    std::size_t erase_session(session_id_t session_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto [first, last] = session_range(session_id);
        auto removed = static_cast<std::size_t>(std::distance(first, last));
        records_.erase(first, last);
        return removed;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_.size();
    }

private:
    using Key = std::pair<session_id_t, agent_id_t>;
    using Map = std::map<Key, Record>;

    Map records_;
    mutable std::mutex mutex_;

    std::pair<typename Map::const_iterator, typename Map::const_iterator>
    session_range(session_id_t session_id) const {
        return {records_.lower_bound(Key{session_id, agent_id_t{}}),
                records_.lower_bound(Key{session_id + 1, agent_id_t{}})};
    }
};

using CommitmentStore = SessionLog<Commitment>;
using RevealStore = SessionLog<Reveal>;

}  // namespace oracle
