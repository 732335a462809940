#pragma once

#include "core/config.hh"
#include "core/types.hh"
#include "aggregator.hh"
#include "commit_reveal.hh"
#include "defense.hh"
#include "identity.hh"
#include "reputation.hh"
#include "response.hh"
#include "thinking_guard.hh"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace oracle {

// ============================================================================
// Result Publication
// ============================================================================

struct PublishReceipt {
    bool accepted = false;
    hash_t result_hash{};
    std::string reference;      // ledger-side handle, opaque here
};

// External ledger hand-off. Called once per completed session, outside any
// session lock. Retries are the implementation's concern.
class ResultPublisher {
public:
    virtual ~ResultPublisher() = default;
    virtual PublishReceipt publish(const ConsensusResult& result) = 0;
};

enum class PublishState : std::uint8_t {
    NOT_ATTEMPTED = 0,
    PUBLISHED = 1,
    REJECTED = 2,
    FAILED = 3,
};

[[nodiscard]] std::string_view publish_state_string(PublishState state);

// ============================================================================
// Session Status
// ============================================================================

struct SessionStart {
    ConsensusError error = ConsensusError::NONE;
    session_id_t session_id = 0;

    [[nodiscard]] bool ok() const { return error == ConsensusError::NONE; }
};

struct SessionStatus {
    session_id_t session_id = 0;
    ProtocolPhase phase = ProtocolPhase::PENDING;
    std::size_t participant_count = 0;
    std::size_t commitment_count = 0;
    std::size_t reveal_count = 0;
    timestamp_ms_t commit_deadline = 0;
    timestamp_ms_t reveal_deadline = 0;         // zero until the reveal phase opens
    ConsensusError failure_reason = ConsensusError::NONE;
    PublishState publish_state = PublishState::NOT_ATTEMPTED;
    std::string publish_reference;
};

// ============================================================================
// Protocol Coordinator
// ============================================================================

// Owns every session and is the only component that moves a session's phase.
// Each session has its own mutex; phase checks and the writes that depend on
// them happen under it. Lock order is session, then guard / defense / ledger.
class ProtocolCoordinator {
public:
    using Clock = std::function<timestamp_ms_t()>;

    // Throws std::invalid_argument on an invalid config. A null ledger gets a
    // private one.
    explicit ProtocolCoordinator(const ConsensusConfig& config,
                                 std::shared_ptr<ReputationLedger> ledger = nullptr,
                                 Clock clock = {});

    ProtocolCoordinator(const ProtocolCoordinator&) = delete;
    ProtocolCoordinator& operator=(const ProtocolCoordinator&) = delete;

    // ------------------------------------------------------------------------
    // Session lifecycle
    // ------------------------------------------------------------------------

    // Timeouts from the config
    [[nodiscard]] SessionStart start_session(const std::set<agent_id_t>& participants);

    [[nodiscard]] SessionStart start_session(const std::set<agent_id_t>& participants,
                                             std::uint64_t commit_timeout_ms,
                                             std::uint64_t reveal_timeout_ms);

    [[nodiscard]] ConsensusError submit_commitment(session_id_t session_id,
                                                   const Commitment& commitment);

    // Accepts only a reveal whose data and nonce hash to the stored commitment
    [[nodiscard]] ConsensusError submit_reveal(session_id_t session_id, const Reveal& reveal);

    // Applies elapsed deadlines and completion; from AGGREGATING runs the
    // defense and aggregation pipeline. Returns the phase afterwards, or
    // nullopt for an unknown session.
    std::optional<ProtocolPhase> advance_phase(session_id_t session_id);

    // ------------------------------------------------------------------------
    // Independent thinking
    // ------------------------------------------------------------------------

    // Marks the server-side start of an agent's computation
    [[nodiscard]] ConsensusError record_compute_start(session_id_t session_id,
                                                      const agent_id_t& agent_id);

    // Caller-measured computation time, checked by the thinking guard
    [[nodiscard]] ConsensusError report_duration(session_id_t session_id,
                                                 const agent_id_t& agent_id,
                                                 std::uint64_t observed_ms);

    // ------------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------------

    [[nodiscard]] std::optional<SessionStatus> get_status(session_id_t session_id) const;
    [[nodiscard]] std::optional<ConsensusResult> get_result(session_id_t session_id) const;

    // Challenge vector agents must apply; empty when the dimension is free
    [[nodiscard]] std::optional<std::vector<double>> get_intervention(session_id_t session_id) const;

    [[nodiscard]] std::vector<session_id_t> active_sessions() const;

    // Forgets finished sessions, their stored records and duplicate-finding
    // keys, applying any penalty still queued; the evidence log and
    // reputation are kept. Returns the number of sessions removed.
    std::size_t prune_finished();

    // ------------------------------------------------------------------------
    // Collaborators
    // ------------------------------------------------------------------------

    void register_origin(const agent_id_t& agent_id, const std::string& origin);

    // Drops an agent's timing history and origin; reputation and evidence stay
    void forget_agent(const agent_id_t& agent_id);

    void set_publisher(std::shared_ptr<ResultPublisher> publisher);
    void set_identity_registry(std::shared_ptr<AgentIdentityRegistry> registry);

    [[nodiscard]] const ConsensusConfig& config() const { return config_; }
    [[nodiscard]] const std::shared_ptr<ReputationLedger>& ledger() const { return ledger_; }
    [[nodiscard]] IndependentThinkingGuard& guard() { return guard_; }
    [[nodiscard]] MaliciousDefenseManager& defense() { return defense_; }
    [[nodiscard]] const MaliciousDefenseManager& defense() const { return defense_; }

private:
    struct Session {
        session_id_t id = 0;
        std::set<agent_id_t> participants;
        ProtocolPhase phase = ProtocolPhase::PENDING;
        timestamp_ms_t created_at = 0;
        timestamp_ms_t commit_deadline = 0;
        timestamp_ms_t reveal_deadline = 0;
        std::uint64_t reveal_timeout_ms = 0;
        ConsensusError failure_reason = ConsensusError::NONE;
        std::vector<double> intervention;
        std::map<agent_id_t, AgentResponse> responses;    // decoded accepted reveals
        std::vector<hash_t> reveal_hashes;
        std::optional<ConsensusResult> result;
        PublishState publish_state = PublishState::NOT_ATTEMPTED;
        std::string publish_reference;
        mutable std::mutex mutex;
    };

    ConsensusConfig config_;
    Clock clock_;
    std::shared_ptr<ReputationLedger> ledger_;
    IndependentThinkingGuard guard_;
    MaliciousDefenseManager defense_;
    ConsensusAggregator aggregator_;

    CommitmentStore commitments_;
    RevealStore reveals_;

    std::unordered_map<session_id_t, std::shared_ptr<Session>> sessions_;
    session_id_t next_session_id_ = 1;
    std::shared_ptr<ResultPublisher> publisher_;
    std::shared_ptr<AgentIdentityRegistry> identity_;
    mutable std::mutex mutex_;   // session index and collaborators; may be taken under a session mutex, never the reverse

    [[nodiscard]] std::shared_ptr<Session> find_session(session_id_t session_id) const;

    // All *_locked helpers expect the session mutex held
    void apply_deadlines_locked(Session& session, timestamp_ms_t now);
    void close_commit_phase_locked(Session& session, timestamp_ms_t now);
    void close_reveal_phase_locked(Session& session);
    void aggregate_locked(Session& session, timestamp_ms_t now);
    void fail_locked(Session& session, ConsensusError reason);
    void record_timing_locked(Session& session, const agent_id_t& agent_id,
                              std::uint64_t observed_ms);
    [[nodiscard]] bool commitment_signature_ok(session_id_t session_id,
                                               const Commitment& commitment) const;

    void publish(const std::shared_ptr<Session>& session);
};

}  // namespace oracle
