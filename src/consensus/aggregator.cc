#include "aggregator.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include "similarity.hh"
#include <algorithm>
#include <cmath>
#include <utility>
#include <stdexcept>

namespace oracle {

// ============================================================================
// ConsensusResult Implementation
// ============================================================================

bool ConsensusResult::has_warning(std::string_view warning) const {
    return std::find(warnings.begin(), warnings.end(), warning) != warnings.end();
}

bool ConsensusResult::is_valid(const agent_id_t& agent_id) const {
    return std::binary_search(valid_agents.begin(), valid_agents.end(), agent_id);
}

std::vector<std::uint8_t> ConsensusResult::serialize() const {
    std::vector<std::uint8_t> result;

    auto append_agents = [&result](const std::vector<agent_id_t>& agents) {
        append_u32(result, static_cast<std::uint32_t>(agents.size()));
        for (const auto& agent : agents) {
            append_string(result, agent);
        }
    };

    append_u64(result, session_id);
    append_f64(result, consensus_value);
    append_u8(result, static_cast<std::uint8_t>(method));
    append_f64(result, consensus_similarity);
    append_f64(result, pass_rate);
    append_agents(valid_agents);
    append_agents(outliers);
    append_agents(excluded_agents);
    append_agents(missing_agents);

    append_u32(result, static_cast<std::uint32_t>(agent_similarity.size()));
    for (const auto& [agent, sim] : agent_similarity) {
        append_string(result, agent);
        append_f64(result, sim);
    }

    append_u32(result, static_cast<std::uint32_t>(evidence.size()));
    for (const auto& ev : evidence) {
        append_evidence(result, ev);
    }

    append_u32(result, static_cast<std::uint32_t>(warnings.size()));
    for (const auto& warning : warnings) {
        append_string(result, warning);
    }

    append_bytes(result, reveal_root);
    append_i64(result, finalized_at_ms);
    return result;
}

hash_t ConsensusResult::result_hash() const {
    return sha3_256(serialize());
}

// ============================================================================
// ConsensusAggregator Implementation
// ============================================================================

ConsensusAggregator::ConsensusAggregator(const ConsensusConfig& config,
                                         std::shared_ptr<ReputationLedger> ledger)
    : config_(config), ledger_(std::move(ledger)) {
    if (auto problem = config_.validate()) {
        throw std::invalid_argument("invalid consensus config: " + *problem);
    }
    if (!ledger_) {
        throw std::invalid_argument("aggregator requires a reputation ledger");
    }
}

AggregationOutcome ConsensusAggregator::aggregate(const AggregationInput& input) const {
    AggregationOutcome outcome;

    if (input.phase != ProtocolPhase::AGGREGATING) {
        log::aggregation.warn() << "Session " << input.session_id << " is "
                                << protocol_phase_string(input.phase) << ", not aggregating";
        outcome.error = ConsensusError::INSUFFICIENT_VALID_REVEALS;
        return outcome;
    }
    if (input.responses.size() < MIN_PARTICIPANTS) {
        log::aggregation.warn() << "Session " << input.session_id << " has "
                                << input.responses.size() << " valid reveals";
        outcome.error = ConsensusError::INSUFFICIENT_VALID_REVEALS;
        return outcome;
    }

    std::vector<const AgentResponse*> ordered;
    ordered.reserve(input.responses.size());
    for (const auto& response : input.responses) {
        ordered.push_back(&response);
    }
    std::sort(ordered.begin(), ordered.end(), [](const AgentResponse* a, const AgentResponse* b) {
        return a->agent_id < b->agent_id;
    });

    std::vector<std::vector<double>> vectors;
    vectors.reserve(ordered.size());
    for (const auto* response : ordered) {
        vectors.push_back(response->causal_response);
    }
    SimilarityMatrix matrix(vectors);

    ConsensusResult result;
    result.session_id = input.session_id;
    result.consensus_similarity = matrix.mean_pairwise();
    result.evidence = input.evidence;
    result.warnings = input.warnings;
    result.finalized_at_ms = input.now_ms;

    std::vector<std::size_t> valid;
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        const auto& agent_id = ordered[i]->agent_id;
        double s_i = matrix.mean_for(i);
        result.agent_similarity[agent_id] = s_i;

        bool similar = s_i >= config_.consensus_similarity_threshold;
        double score = ledger_->score_or_initial(agent_id);
        bool reputable = score >= config_.exclusion_score && ledger_->is_active(agent_id);
        if (similar && reputable) {
            valid.push_back(i);
            result.valid_agents.push_back(agent_id);
        } else {
            result.outliers.push_back(agent_id);
            if (similar) {
                log::aggregation.info() << "Session " << input.session_id << ": excluding "
                                        << agent_id << " ("
                                        << reputation_tier_string(tier_for_score(score))
                                        << ", score " << score << ")";
                result.excluded_agents.push_back(agent_id);
            }
        }
    }

    std::vector<std::size_t> members = valid;
    if (members.empty()) {
        log::aggregation.warn() << "Session " << input.session_id
                                << " has no valid agents, averaging all responses";
        result.warnings.emplace_back(DEGENERATE_CONSENSUS_WARNING);
        for (std::size_t i = 0; i < ordered.size(); ++i) {
            members.push_back(i);
        }
    }

    std::vector<double> values;
    std::vector<double> weights;
    values.reserve(members.size());
    weights.reserve(members.size());
    double total_weight = 0.0;
    for (std::size_t i : members) {
        values.push_back(ordered[i]->scalar_summary());
        double weight = config_.reputation_weighted_consensus
            ? ledger_->score_or_initial(ordered[i]->agent_id)
            : 1.0;
        weights.push_back(weight);
        total_weight += weight;
    }
    if (total_weight <= 0.0) {
        std::fill(weights.begin(), weights.end(), 1.0);
    }

    result.method = config_.aggregation_method == AggregationMethod::ADAPTIVE
        ? select_method(values, weights)
        : config_.aggregation_method;
    result.consensus_value = combine(values, weights, result.method);

    for (const auto& participant : input.participants) {
        if (!result.agent_similarity.contains(participant)) {
            result.missing_agents.push_back(participant);
        }
    }

    std::size_t participant_count = std::max(input.participants.size(), ordered.size());
    result.pass_rate = static_cast<double>(valid.size()) / static_cast<double>(participant_count);

    std::vector<hash_t> leaves = input.reveal_hashes;
    std::sort(leaves.begin(), leaves.end());
    result.reveal_root = compute_merkle_root(leaves);

    log::aggregation.info() << "Session " << input.session_id << " consensus "
                            << result.consensus_value << " ("
                            << aggregation_method_string(result.method) << ") from " << result.valid_agents.size()
                            << "/" << participant_count << " agents (similarity "
                            << result.consensus_similarity << ")";

    outcome.result = std::move(result);
    return outcome;
}

AggregationMethod ConsensusAggregator::select_method(std::span<const double> values,
                                                     std::span<const double> weights) const {
    double value_cv = coefficient_of_variation(values);
    double weight_cv = coefficient_of_variation(weights);
    if (value_cv > config_.adaptive_cv_threshold ||
        weight_cv > config_.adaptive_weight_cv_threshold) {
        ORACLE_LOG_DEBUG(log::aggregation) << "Dispersed input (value cv " << value_cv
                                           << ", weight cv " << weight_cv
                                           << "), using weighted median";
        return AggregationMethod::WEIGHTED_MEDIAN;
    }
    return AggregationMethod::MEAN;
}

double ConsensusAggregator::combine(std::span<const double> values,
                                    std::span<const double> weights,
                                    AggregationMethod method) const {
    if (values.empty()) {
        return 0.0;
    }

    auto weighted_mean = [](auto first, auto last) {
        double sum = 0.0;
        double total = 0.0;
        double plain = 0.0;
        for (auto it = first; it != last; ++it) {
            sum += it->first * it->second;
            total += it->second;
            plain += it->first;
        }
        return total > 0.0 ? sum / total : plain / static_cast<double>(last - first);
    };

    std::vector<std::pair<double, double>> points;
    points.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        points.emplace_back(values[i], i < weights.size() ? weights[i] : 1.0);
    }

    switch (method) {
        case AggregationMethod::MEAN:
            return weighted_mean(points.begin(), points.end());

        case AggregationMethod::WEIGHTED_MEDIAN: {
            std::stable_sort(points.begin(), points.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            double total = 0.0;
            for (const auto& point : points) {
                total += point.second;
            }
            double cumulative = 0.0;
            for (const auto& point : points) {
                cumulative += point.second;
                if (cumulative >= total / 2.0) {
                    return point.first;
                }
            }
            return points.back().first;
        }

        case AggregationMethod::TRIMMED_MEAN: {
            std::stable_sort(points.begin(), points.end(),
                             [](const auto& a, const auto& b) { return a.first < b.first; });
            // fraction < 0.5 always leaves at least one point
            auto trim = static_cast<std::ptrdiff_t>(
                std::floor(static_cast<double>(points.size()) * config_.trimmed_mean_fraction));
            return weighted_mean(points.begin() + trim, points.end() - trim);
        }

        case AggregationMethod::ADAPTIVE:
            return combine(values, weights, select_method(values, weights));
    }
    return weighted_mean(points.begin(), points.end());
}

void ConsensusAggregator::settle(const ConsensusResult& result) {
    for (const auto& agent_id : result.valid_agents) {
        auto it = result.agent_similarity.find(agent_id);
        double s_i = it == result.agent_similarity.end() ? 0.0 : it->second;
        ledger_->apply_reward(agent_id, CONSENSUS_REWARD * std::max(0.0, s_i),
                              ReputationReason::CONSENSUS_REWARD);
    }
    for (const auto& agent_id : result.outliers) {
        ledger_->apply_penalty(agent_id, OUTLIER_PENALTY * config_.reputation_penalty_factor,
                               ReputationReason::OUTLIER);
    }
    ORACLE_LOG_DEBUG(log::aggregation) << "Session " << result.session_id << " settled: "
                                       << result.valid_agents.size() << " rewarded, "
                                       << result.outliers.size() << " penalized";
}

}  // namespace oracle
