#include "coordinator.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace oracle {

namespace {

const ConsensusConfig& validated(const ConsensusConfig& config) {
    if (auto problem = config.validate()) {
        log::protocol.error() << "Rejecting consensus config: " << *problem;
        throw std::invalid_argument("invalid consensus config: " + *problem);
    }
    return config;
}

bool valid_agent_id(const agent_id_t& agent_id) {
    return !agent_id.empty() && agent_id.size() <= MAX_AGENT_ID_LENGTH;
}

bool valid_timeout(std::uint64_t timeout_ms) {
    return timeout_ms > 0 && timeout_ms <= MAX_PHASE_TIMEOUT_MS;
}

// Saturates at the largest timestamp instead of wrapping
timestamp_ms_t deadline_after(timestamp_ms_t now, std::uint64_t timeout_ms) {
    constexpr auto latest = std::numeric_limits<timestamp_ms_t>::max();
    auto timeout = static_cast<timestamp_ms_t>(std::min<std::uint64_t>(timeout_ms, MAX_PHASE_TIMEOUT_MS));
    return now > latest - timeout ? latest : now + timeout;
}

}  // namespace

std::string_view publish_state_string(PublishState state) {
    switch (state) {
        case PublishState::NOT_ATTEMPTED: return "not_attempted";
        case PublishState::PUBLISHED: return "published";
        case PublishState::REJECTED: return "rejected";
        case PublishState::FAILED: return "failed";
    }
    return "unknown";
}

ProtocolCoordinator::ProtocolCoordinator(const ConsensusConfig& config,
                                         std::shared_ptr<ReputationLedger> ledger,
                                         Clock clock)
    : config_(validated(config))
    , clock_(clock ? std::move(clock) : Clock(system_now_ms))
    , ledger_(ledger ? std::move(ledger) : std::make_shared<ReputationLedger>(clock_))
    , guard_(config_)
    , defense_(config_, ledger_)
    , aggregator_(config_, ledger_) {}

// ============================================================================
// Session Lifecycle
// ============================================================================

SessionStart ProtocolCoordinator::start_session(const std::set<agent_id_t>& participants) {
    return start_session(participants, config_.commit_timeout_ms, config_.reveal_timeout_ms);
}

SessionStart ProtocolCoordinator::start_session(const std::set<agent_id_t>& participants,
                                                std::uint64_t commit_timeout_ms,
                                                std::uint64_t reveal_timeout_ms) {
    SessionStart start;

    if (participants.size() < MIN_PARTICIPANTS ||
        !std::all_of(participants.begin(), participants.end(), valid_agent_id)) {
        log::protocol.warn() << "Refusing session with " << participants.size()
                             << " participants";
        start.error = ConsensusError::INVALID_PARTICIPANTS;
        return start;
    }
    if (!valid_timeout(commit_timeout_ms) || !valid_timeout(reveal_timeout_ms)) {
        log::protocol.warn() << "Refusing session with timeouts " << commit_timeout_ms << "/"
                             << reveal_timeout_ms << " ms";
        start.error = ConsensusError::INVALID_CONFIG;
        return start;
    }

    auto session = std::make_shared<Session>();
    session->participants = participants;
    session->created_at = clock_();
    session->commit_deadline = deadline_after(session->created_at, commit_timeout_ms);
    session->reveal_timeout_ms = reveal_timeout_ms;

    if (config_.intervention_dimension > 0) {
        HashDRBG drbg(random_seed());
        session->intervention.reserve(config_.intervention_dimension);
        for (std::uint32_t i = 0; i < config_.intervention_dimension; ++i) {
            session->intervention.push_back(drbg.next_symmetric(config_.intervention_magnitude));
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        session->id = next_session_id_++;
        session->phase = ProtocolPhase::COMMITTING;
        sessions_.emplace(session->id, session);
    }

    log::protocol.info() << "Session " << session->id << " started with "
                         << participants.size() << " agents, commit deadline "
                         << session->commit_deadline;

    start.session_id = session->id;
    return start;
}

ConsensusError ProtocolCoordinator::submit_commitment(session_id_t session_id,
                                                      const Commitment& commitment) {
    auto session = find_session(session_id);
    if (!session) {
        return ConsensusError::UNKNOWN_SESSION;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    timestamp_ms_t now = clock_();
    apply_deadlines_locked(*session, now);

    if (session->phase != ProtocolPhase::COMMITTING) {
        ORACLE_LOG_DEBUG(log::protocol) << "Late commitment from " << commitment.agent_id
                                        << " in session " << session_id << " ("
                                        << protocol_phase_string(session->phase) << ")";
        return ConsensusError::PHASE_MISMATCH;
    }
    if (!session->participants.contains(commitment.agent_id)) {
        return ConsensusError::UNKNOWN_AGENT;
    }
    if (commitments_.contains(session_id, commitment.agent_id)) {
        return ConsensusError::DUPLICATE_COMMITMENT;
    }
    if (!commitment_signature_ok(session_id, commitment)) {
        log::protocol.warn() << "Invalid commitment signature from " << commitment.agent_id
                             << " in session " << session_id;
        return ConsensusError::INVALID_SIGNATURE;
    }

    if (commitments_.add(session_id, commitment) == CommitmentStore::AddResult::DUPLICATE) {
        return ConsensusError::DUPLICATE_COMMITMENT;
    }

    ORACLE_LOG_DEBUG(log::protocol) << "Session " << session_id << ": commitment "
                                    << short_hex(commitment.commitment_hash) << " from "
                                    << commitment.agent_id;

    if (auto elapsed = guard_.elapsed_since_start(session_id, commitment.agent_id, now)) {
        record_timing_locked(*session, commitment.agent_id, *elapsed);
    }

    if (commitments_.count(session_id) == session->participants.size()) {
        close_commit_phase_locked(*session, now);
    }
    return ConsensusError::NONE;
}

ConsensusError ProtocolCoordinator::submit_reveal(session_id_t session_id, const Reveal& reveal) {
    auto session = find_session(session_id);
    if (!session) {
        return ConsensusError::UNKNOWN_SESSION;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    apply_deadlines_locked(*session, clock_());

    if (session->phase != ProtocolPhase::REVEALING) {
        ORACLE_LOG_DEBUG(log::protocol) << "Reveal from " << reveal.agent_id << " in session "
                                        << session_id << " while "
                                        << protocol_phase_string(session->phase);
        return ConsensusError::PHASE_MISMATCH;
    }
    if (!session->participants.contains(reveal.agent_id)) {
        return ConsensusError::UNKNOWN_AGENT;
    }

    auto commitment = commitments_.get(session_id, reveal.agent_id);
    if (!commitment) {
        return ConsensusError::NO_MATCHING_COMMITMENT;
    }
    if (reveals_.contains(session_id, reveal.agent_id)) {
        return ConsensusError::DUPLICATE_REVEAL;
    }
    if (!reveal.matches(*commitment)) {
        log::protocol.warn() << "Hash mismatch for " << reveal.agent_id << " in session "
                             << session_id << ": committed "
                             << short_hex(commitment->commitment_hash) << ", revealed "
                             << short_hex(reveal.reveal_hash());
        return ConsensusError::HASH_MISMATCH;
    }

    if (reveal.response_data.size() > MAX_RESPONSE_SIZE) {
        return ConsensusError::MALFORMED_RESPONSE;
    }
    auto response = AgentResponse::deserialize(reveal.response_data);
    if (!response || !response->is_well_formed() || response->agent_id != reveal.agent_id) {
        log::protocol.warn() << "Malformed response from " << reveal.agent_id
                             << " in session " << session_id;
        return ConsensusError::MALFORMED_RESPONSE;
    }
    if (!session->intervention.empty() &&
        response->intervention_vector != session->intervention) {
        log::protocol.warn() << reveal.agent_id << " ignored the session intervention in session "
                             << session_id;
        return ConsensusError::MALFORMED_RESPONSE;
    }
    if (!session->responses.empty() &&
        session->responses.begin()->second.causal_response.size() !=
            response->causal_response.size()) {
        log::protocol.warn() << reveal.agent_id << " answered with dimension "
                             << response->causal_response.size() << " in session " << session_id;
        return ConsensusError::MALFORMED_RESPONSE;
    }

    if (reveals_.add(session_id, reveal) == RevealStore::AddResult::DUPLICATE) {
        return ConsensusError::DUPLICATE_REVEAL;
    }
    session->reveal_hashes.push_back(reveal.reveal_hash());
    session->responses.emplace(reveal.agent_id, std::move(*response));

    ORACLE_LOG_DEBUG(log::protocol) << "Session " << session_id << ": reveal from "
                                    << reveal.agent_id << " accepted";

    if (session->responses.size() == commitments_.count(session_id)) {
        close_reveal_phase_locked(*session);
    }
    return ConsensusError::NONE;
}

std::optional<ProtocolPhase> ProtocolCoordinator::advance_phase(session_id_t session_id) {
    auto session = find_session(session_id);
    if (!session) {
        return std::nullopt;
    }

    ProtocolPhase phase;
    bool completed = false;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        timestamp_ms_t now = clock_();

        switch (session->phase) {
            case ProtocolPhase::COMMITTING:
                if (now >= session->commit_deadline ||
                    commitments_.count(session_id) == session->participants.size()) {
                    close_commit_phase_locked(*session, now);
                }
                break;
            case ProtocolPhase::REVEALING:
                if (now >= session->reveal_deadline ||
                    session->responses.size() == commitments_.count(session_id)) {
                    close_reveal_phase_locked(*session);
                }
                break;
            case ProtocolPhase::AGGREGATING:
                aggregate_locked(*session, now);
                completed = session->phase == ProtocolPhase::COMPLETED;
                break;
            default:
                break;
        }
        phase = session->phase;
    }

    if (completed) {
        publish(session);
    }
    return phase;
}

// ============================================================================
// Phase Transitions
// ============================================================================

void ProtocolCoordinator::apply_deadlines_locked(Session& session, timestamp_ms_t now) {
    if (session.phase == ProtocolPhase::COMMITTING && now >= session.commit_deadline) {
        close_commit_phase_locked(session, now);
    }
    if (session.phase == ProtocolPhase::REVEALING && now >= session.reveal_deadline) {
        close_reveal_phase_locked(session);
    }
}

void ProtocolCoordinator::close_commit_phase_locked(Session& session, timestamp_ms_t now) {
    std::size_t committed = commitments_.count(session.id);
    std::size_t quorum = config_.quorum_for(session.participants.size());
    if (committed < quorum) {
        log::protocol.warn() << "Session " << session.id << " closed commitments with "
                             << committed << "/" << session.participants.size()
                             << ", quorum is " << quorum;
        fail_locked(session, ConsensusError::INSUFFICIENT_PARTICIPATION);
        return;
    }

    session.phase = ProtocolPhase::REVEALING;
    session.reveal_deadline = deadline_after(now, session.reveal_timeout_ms);
    log::protocol.info() << "Session " << session.id << " revealing (" << committed << "/"
                         << session.participants.size() << " committed)";
}

void ProtocolCoordinator::close_reveal_phase_locked(Session& session) {
    std::size_t revealed = session.responses.size();
    std::size_t quorum = config_.quorum_for(session.participants.size());
    if (revealed < quorum) {
        log::protocol.warn() << "Session " << session.id << " closed reveals with "
                             << revealed << "/" << session.participants.size()
                             << ", quorum is " << quorum;
        fail_locked(session, ConsensusError::INSUFFICIENT_PARTICIPATION);
        return;
    }

    session.phase = ProtocolPhase::AGGREGATING;
    log::protocol.info() << "Session " << session.id << " aggregating (" << revealed << "/"
                         << session.participants.size() << " revealed)";
}

void ProtocolCoordinator::aggregate_locked(Session& session, timestamp_ms_t now) {
    for (const auto& evidence : guard_.check_synchronization(session.id)) {
        defense_.record_evidence(evidence);
    }

    std::vector<AgentResponse> responses;
    responses.reserve(session.responses.size());
    for (const auto& [agent_id, response] : session.responses) {
        responses.push_back(response);
    }

    DefenseReport report = defense_.evaluate(session.id, responses);
    if (!config_.enable_instant_penalty) {
        defense_.flush_penalties(session.id);
    }

    AggregationInput input;
    input.session_id = session.id;
    input.phase = session.phase;
    input.participants = session.participants;
    input.responses = std::move(responses);
    input.reveal_hashes = session.reveal_hashes;
    input.evidence = defense_.session_evidence(session.id);
    input.warnings = std::move(report.warnings);
    input.now_ms = now;

    AggregationOutcome outcome = aggregator_.aggregate(input);
    if (!outcome.ok()) {
        fail_locked(session, outcome.error);
        return;
    }

    aggregator_.settle(*outcome.result);
    session.result = std::move(outcome.result);
    session.phase = ProtocolPhase::COMPLETED;
    log::protocol.info() << "Session " << session.id << " completed, consensus "
                         << session.result->consensus_value << ", pass rate "
                         << session.result->pass_rate;
}

void ProtocolCoordinator::fail_locked(Session& session, ConsensusError reason) {
    session.phase = ProtocolPhase::FAILED;
    session.failure_reason = reason;
    log::protocol.warn() << "Session " << session.id << " failed: "
                         << consensus_error_string(reason);

    // Findings stand whether or not the session reaches a result
    if (!config_.enable_instant_penalty) {
        std::size_t applied = defense_.flush_penalties(session.id);
        if (applied > 0) {
            log::protocol.info() << "Session " << session.id << ": applied " << applied
                                 << " queued penalties";
        }
    }
}

// ============================================================================
// Independent Thinking
// ============================================================================

ConsensusError ProtocolCoordinator::record_compute_start(session_id_t session_id,
                                                         const agent_id_t& agent_id) {
    auto session = find_session(session_id);
    if (!session) {
        return ConsensusError::UNKNOWN_SESSION;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    timestamp_ms_t now = clock_();
    apply_deadlines_locked(*session, now);

    if (session->phase != ProtocolPhase::COMMITTING) {
        return ConsensusError::PHASE_MISMATCH;
    }
    if (!session->participants.contains(agent_id)) {
        return ConsensusError::UNKNOWN_AGENT;
    }
    return guard_.record_start(agent_id, session_id, now);
}

ConsensusError ProtocolCoordinator::report_duration(session_id_t session_id,
                                                    const agent_id_t& agent_id,
                                                    std::uint64_t observed_ms) {
    auto session = find_session(session_id);
    if (!session) {
        return ConsensusError::UNKNOWN_SESSION;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    if (is_terminal(session->phase)) {
        return ConsensusError::PHASE_MISMATCH;
    }
    if (!session->participants.contains(agent_id)) {
        return ConsensusError::UNKNOWN_AGENT;
    }
    record_timing_locked(*session, agent_id, observed_ms);
    return ConsensusError::NONE;
}

void ProtocolCoordinator::record_timing_locked(Session& session, const agent_id_t& agent_id,
                                               std::uint64_t observed_ms) {
    auto observation = guard_.observe(session.id, agent_id, observed_ms);
    if (!observation.recorded) {
        ORACLE_LOG_DEBUG(log::protocol) << "Duration for " << agent_id << " in session "
                                        << session.id << " already recorded";
        return;
    }
    for (const auto& anomaly : observation.anomalies) {
        defense_.record_evidence(anomaly);
    }
}

bool ProtocolCoordinator::commitment_signature_ok(session_id_t session_id,
                                                  const Commitment& commitment) const {
    std::shared_ptr<AgentIdentityRegistry> registry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registry = identity_;
    }

    if (!registry) {
        return !config_.require_signed_commitments;
    }
    if (!config_.require_signed_commitments && !commitment.signature) {
        return true;
    }
    return registry->verify_commitment(session_id, commitment);
}

// ============================================================================
// Publication
// ============================================================================

void ProtocolCoordinator::publish(const std::shared_ptr<Session>& session) {
    std::shared_ptr<ResultPublisher> publisher;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        publisher = publisher_;
    }
    if (!publisher) {
        return;
    }

    std::optional<ConsensusResult> result;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        result = session->result;
    }
    if (!result) {
        return;
    }

    PublishState state = PublishState::FAILED;
    std::string reference;
    try {
        PublishReceipt receipt = publisher->publish(*result);
        if (!receipt.accepted) {
            log::protocol.warn() << "Ledger rejected result of session " << result->session_id;
            state = PublishState::REJECTED;
        } else if (receipt.result_hash != result->result_hash()) {
            log::protocol.warn() << "Ledger receipt for session " << result->session_id
                                 << " names result " << short_hex(receipt.result_hash);
            state = PublishState::REJECTED;
        } else {
            state = PublishState::PUBLISHED;
            reference = std::move(receipt.reference);
        }
    } catch (const std::exception& e) {
        log::protocol.error() << "Publishing session " << result->session_id
                              << " failed: " << e.what();
        state = PublishState::FAILED;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    session->publish_state = state;
    session->publish_reference = std::move(reference);
}

// ============================================================================
// Queries
// ============================================================================

std::shared_ptr<ProtocolCoordinator::Session> ProtocolCoordinator::find_session(
    session_id_t session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

std::optional<SessionStatus> ProtocolCoordinator::get_status(session_id_t session_id) const {
    auto session = find_session(session_id);
    if (!session) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(session->mutex);
    SessionStatus status;
    status.session_id = session_id;
    status.phase = session->phase;
    status.participant_count = session->participants.size();
    status.commitment_count = commitments_.count(session_id);
    status.reveal_count = session->responses.size();
    status.commit_deadline = session->commit_deadline;
    status.reveal_deadline = session->reveal_deadline;
    status.failure_reason = session->failure_reason;
    status.publish_state = session->publish_state;
    status.publish_reference = session->publish_reference;
    return status;
}

std::optional<ConsensusResult> ProtocolCoordinator::get_result(session_id_t session_id) const {
    auto session = find_session(session_id);
    if (!session) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    return session->result;
}

std::optional<std::vector<double>> ProtocolCoordinator::get_intervention(
    session_id_t session_id) const {
    auto session = find_session(session_id);
    if (!session) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(session->mutex);
    return session->intervention;
}

std::vector<session_id_t> ProtocolCoordinator::active_sessions() const {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    std::vector<session_id_t> result;
    for (const auto& session : snapshot) {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (!is_terminal(session->phase)) {
            result.push_back(session->id);
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::size_t ProtocolCoordinator::prune_finished() {
    std::vector<std::shared_ptr<Session>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            snapshot.push_back(session);
        }
    }

    std::vector<session_id_t> finished;
    for (const auto& session : snapshot) {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (is_terminal(session->phase)) {
            finished.push_back(session->id);
        }
    }

    for (session_id_t id : finished) {
        commitments_.erase_session(id);
        reveals_.erase_session(id);
        guard_.clear_session(id);
        defense_.release_session(id);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (session_id_t id : finished) {
        sessions_.erase(id);
    }
    if (!finished.empty()) {
        log::protocol.info() << "Pruned " << finished.size() << " finished sessions";
    }
    return finished.size();
}

// ============================================================================
// Collaborators
// ============================================================================

void ProtocolCoordinator::register_origin(const agent_id_t& agent_id, const std::string& origin) {
    defense_.register_origin(agent_id, origin);
}

void ProtocolCoordinator::forget_agent(const agent_id_t& agent_id) {
    guard_.forget_agent(agent_id);
    defense_.forget_agent(agent_id);
    log::protocol.info() << "Forgot agent " << agent_id;
}

void ProtocolCoordinator::set_publisher(std::shared_ptr<ResultPublisher> publisher) {
    std::lock_guard<std::mutex> lock(mutex_);
    publisher_ = std::move(publisher);
}

void ProtocolCoordinator::set_identity_registry(std::shared_ptr<AgentIdentityRegistry> registry) {
    std::lock_guard<std::mutex> lock(mutex_);
    identity_ = std::move(registry);
}

}  // namespace oracle
