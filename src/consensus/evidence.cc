#include "evidence.hh"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace oracle {

namespace {

constexpr double UNBOUNDED = std::numeric_limits<double>::infinity();

template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

double clamp_severity(double severity) {
    if (std::isnan(severity)) {
        return MIN_EVIDENCE_SEVERITY;
    }
    return std::clamp(severity, MIN_EVIDENCE_SEVERITY, 1.0);
}

// ============================================================================
// Constructors
// ============================================================================

SybilEvidence make_sybil_evidence(session_id_t session_id, std::string origin,
                                  std::set<agent_id_t> agents, double similarity) {
    SybilEvidence ev;
    ev.session_id = session_id;
    ev.shared_origin = std::move(origin);
    ev.suspected_agents = std::move(agents);
    ev.similarity_score = similarity;
    ev.severity = clamp_severity(similarity);
    return ev;
}

CollusionEvidence make_collusion_evidence(session_id_t session_id, const agent_id_t& a,
                                          const agent_id_t& b, double similarity) {
    CollusionEvidence ev;
    ev.session_id = session_id;
    ev.agent_a = std::min(a, b);
    ev.agent_b = std::max(a, b);
    ev.similarity_score = similarity;
    ev.severity = clamp_severity(similarity);
    return ev;
}

TimingAnomalyEvidence make_below_floor_evidence(session_id_t session_id, const agent_id_t& agent_id,
                                                std::uint64_t observed_ms,
                                                std::uint64_t min_plausible_ms) {
    TimingAnomalyEvidence ev;
    ev.session_id = session_id;
    ev.agent_id = agent_id;
    ev.observed_ms = observed_ms;
    ev.expected_range = {static_cast<double>(min_plausible_ms), UNBOUNDED};
    ev.kind = TimingAnomalyKind::BELOW_FLOOR;
    ev.statistic = static_cast<double>(observed_ms);

    double ratio = min_plausible_ms == 0
        ? 1.0
        : static_cast<double>(observed_ms) / static_cast<double>(min_plausible_ms);
    ev.severity = clamp_severity(1.0 - ratio);
    return ev;
}

// expected_range holds the acceptable CV band, statistic the observed CV
TimingAnomalyEvidence make_synchronized_evidence(session_id_t session_id, const agent_id_t& agent_id,
                                                 std::uint64_t observed_ms, double cv,
                                                 double cv_floor) {
    TimingAnomalyEvidence ev;
    ev.session_id = session_id;
    ev.agent_id = agent_id;
    ev.observed_ms = observed_ms;
    ev.expected_range = {cv_floor, UNBOUNDED};
    ev.kind = TimingAnomalyKind::SYNCHRONIZED;
    ev.statistic = cv;
    ev.severity = clamp_severity(cv_floor > 0.0 ? 1.0 - cv / cv_floor : 1.0);
    return ev;
}

TimingAnomalyEvidence make_outlier_evidence(session_id_t session_id, const agent_id_t& agent_id,
                                            std::uint64_t observed_ms, double history_mean,
                                            double history_std, double z_score,
                                            double z_threshold) {
    TimingAnomalyEvidence ev;
    ev.session_id = session_id;
    ev.agent_id = agent_id;
    ev.observed_ms = observed_ms;
    ev.expected_range = {std::max(0.0, history_mean - z_threshold * history_std),
                         history_mean + z_threshold * history_std};
    ev.kind = TimingAnomalyKind::STATISTICAL_OUTLIER;
    ev.statistic = z_score;
    ev.severity = clamp_severity(z_score / (2.0 * z_threshold));
    return ev;
}

SpectralAnomalyEvidence make_spectral_evidence(session_id_t session_id, const agent_id_t& agent_id,
                                               double entropy, ValueRange acceptable) {
    SpectralAnomalyEvidence ev;
    ev.session_id = session_id;
    ev.agent_id = agent_id;
    ev.entropy = entropy;
    ev.acceptable_range = acceptable;

    double distance = 0.0;
    if (entropy < acceptable.min) {
        distance = acceptable.min > 0.0 ? (acceptable.min - entropy) / acceptable.min : 1.0;
    } else if (entropy > acceptable.max) {
        distance = acceptable.max < 1.0 ? (entropy - acceptable.max) / (1.0 - acceptable.max) : 1.0;
    }
    ev.severity = clamp_severity(distance);
    return ev;
}

// ============================================================================
// Accessors
// ============================================================================

EvidenceKind evidence_kind(const DefenseEvidence& evidence) {
    return std::visit(overloaded{
        [](const SybilEvidence&) { return EvidenceKind::SYBIL; },
        [](const CollusionEvidence&) { return EvidenceKind::COLLUSION; },
        [](const TimingAnomalyEvidence&) { return EvidenceKind::TIMING_ANOMALY; },
        [](const SpectralAnomalyEvidence&) { return EvidenceKind::SPECTRAL_ANOMALY; },
    }, evidence);
}

double evidence_severity(const DefenseEvidence& evidence) {
    return std::visit([](const auto& ev) { return ev.severity; }, evidence);
}

session_id_t evidence_session(const DefenseEvidence& evidence) {
    return std::visit([](const auto& ev) { return ev.session_id; }, evidence);
}

std::vector<agent_id_t> implicated_agents(const DefenseEvidence& evidence) {
    return std::visit(overloaded{
        [](const SybilEvidence& ev) {
            return std::vector<agent_id_t>(ev.suspected_agents.begin(), ev.suspected_agents.end());
        },
        [](const CollusionEvidence& ev) {
            return std::vector<agent_id_t>{ev.agent_a, ev.agent_b};
        },
        [](const TimingAnomalyEvidence& ev) {
            return std::vector<agent_id_t>{ev.agent_id};
        },
        [](const SpectralAnomalyEvidence& ev) {
            return std::vector<agent_id_t>{ev.agent_id};
        },
    }, evidence);
}

std::string evidence_key(const DefenseEvidence& evidence) {
    std::ostringstream oss;
    oss << evidence_kind_string(evidence_kind(evidence)) << '/' << evidence_session(evidence);

    std::visit(overloaded{
        [&](const SybilEvidence& ev) {
            oss << '/' << ev.shared_origin;
            for (const auto& agent : ev.suspected_agents) {
                oss << '/' << agent;
            }
        },
        [&](const CollusionEvidence& ev) {
            oss << '/' << ev.agent_a << '/' << ev.agent_b;
        },
        [&](const TimingAnomalyEvidence& ev) {
            oss << '/' << ev.agent_id << '/' << timing_anomaly_string(ev.kind);
        },
        [&](const SpectralAnomalyEvidence& ev) {
            oss << '/' << ev.agent_id;
        },
    }, evidence);

    return oss.str();
}

std::string describe_evidence(const DefenseEvidence& evidence) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    std::visit(overloaded{
        [&](const SybilEvidence& ev) {
            oss << "sybil origin=" << ev.shared_origin
                << " agents=" << ev.suspected_agents.size()
                << " similarity=" << ev.similarity_score;
        },
        [&](const CollusionEvidence& ev) {
            oss << "collusion " << ev.agent_a << " <-> " << ev.agent_b
                << " similarity=" << ev.similarity_score;
        },
        [&](const TimingAnomalyEvidence& ev) {
            oss << "timing " << timing_anomaly_string(ev.kind) << " agent=" << ev.agent_id
                << " observed=" << ev.observed_ms << "ms statistic=" << ev.statistic;
        },
        [&](const SpectralAnomalyEvidence& ev) {
            oss << "spectral agent=" << ev.agent_id << " entropy=" << ev.entropy
                << " range=[" << ev.acceptable_range.min << ", "
                << ev.acceptable_range.max << "]";
        },
    }, evidence);

    oss << " severity=" << evidence_severity(evidence);
    return oss.str();
}

void append_evidence(std::vector<std::uint8_t>& out, const DefenseEvidence& evidence) {
    append_u8(out, static_cast<std::uint8_t>(evidence_kind(evidence)));
    append_u64(out, evidence_session(evidence));

    std::visit(overloaded{
        [&](const SybilEvidence& ev) {
            append_string(out, ev.shared_origin);
            append_u32(out, static_cast<std::uint32_t>(ev.suspected_agents.size()));
            for (const auto& agent : ev.suspected_agents) {
                append_string(out, agent);
            }
            append_f64(out, ev.similarity_score);
        },
        [&](const CollusionEvidence& ev) {
            append_string(out, ev.agent_a);
            append_string(out, ev.agent_b);
            append_f64(out, ev.similarity_score);
        },
        [&](const TimingAnomalyEvidence& ev) {
            append_string(out, ev.agent_id);
            append_u64(out, ev.observed_ms);
            append_f64(out, ev.expected_range.min);
            append_f64(out, ev.expected_range.max);
            append_u8(out, static_cast<std::uint8_t>(ev.kind));
            append_f64(out, ev.statistic);
        },
        [&](const SpectralAnomalyEvidence& ev) {
            append_string(out, ev.agent_id);
            append_f64(out, ev.entropy);
            append_f64(out, ev.acceptable_range.min);
            append_f64(out, ev.acceptable_range.max);
        },
    }, evidence);

    append_f64(out, evidence_severity(evidence));
}

}  // namespace oracle
