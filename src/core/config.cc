#include "config.hh"
#include "logging.hh"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <sstream>

namespace oracle {

namespace {

bool in_unit_range(double v) {
    return std::isfinite(v) && v >= 0.0 && v <= 1.0;
}

bool parse_double(std::string_view text, double& out) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || !std::isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

template<typename T>
bool parse_unsigned(std::string_view text, T& out) {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return false;
    }
    out = value;
    return true;
}

bool parse_bool(std::string_view text, bool& out) {
    if (text == "true" || text == "1" || text == "yes" || text == "on") {
        out = true;
        return true;
    }
    if (text == "false" || text == "0" || text == "no" || text == "off") {
        out = false;
        return true;
    }
    return false;
}

}  // namespace

std::optional<std::string> ConsensusConfig::validate() const {
    struct UnitField {
        std::string_view name;
        double value;
    };
    const UnitField unit_fields[] = {
        {"sybil_threshold", sybil_threshold},
        {"collusion_similarity_threshold", collusion_similarity_threshold},
        {"min_spectral_entropy", min_spectral_entropy},
        {"max_spectral_entropy", max_spectral_entropy},
        {"reputation_penalty_factor", reputation_penalty_factor},
        {"consensus_similarity_threshold", consensus_similarity_threshold},
        {"quorum_fraction", quorum_fraction},
        {"timing_cv_floor", timing_cv_floor},
    };

    for (const auto& field : unit_fields) {
        if (!in_unit_range(field.value)) {
            std::ostringstream oss;
            oss << field.name << " must be within [0, 1], got " << field.value;
            return oss.str();
        }
    }

    if (min_spectral_entropy > max_spectral_entropy) {
        return "min_spectral_entropy exceeds max_spectral_entropy";
    }
    if (!std::isfinite(timing_anomaly_threshold) || timing_anomaly_threshold <= 0.0) {
        return "timing_anomaly_threshold must be positive";
    }
    if (min_model_diversity == 0) {
        return "min_model_diversity must be at least 1";
    }
    if (commit_timeout_ms == 0 || commit_timeout_ms > MAX_PHASE_TIMEOUT_MS) {
        return "commit_timeout_ms must be within (0, " + std::to_string(MAX_PHASE_TIMEOUT_MS) + "]";
    }
    if (reveal_timeout_ms == 0 || reveal_timeout_ms > MAX_PHASE_TIMEOUT_MS) {
        return "reveal_timeout_ms must be within (0, " + std::to_string(MAX_PHASE_TIMEOUT_MS) + "]";
    }
    if (!std::isfinite(trimmed_mean_fraction) || trimmed_mean_fraction < 0.0 ||
        trimmed_mean_fraction >= 0.5) {
        return "trimmed_mean_fraction must be within [0, 0.5)";
    }
    if (!std::isfinite(adaptive_cv_threshold) || adaptive_cv_threshold < 0.0 ||
        !std::isfinite(adaptive_weight_cv_threshold) || adaptive_weight_cv_threshold < 0.0) {
        return "adaptive thresholds must be non-negative";
    }
    if (!std::isfinite(exclusion_score) || exclusion_score < REPUTATION_MIN ||
        exclusion_score > REPUTATION_MAX) {
        return "exclusion_score must be within the reputation range";
    }
    if (intervention_dimension > MAX_VECTOR_DIMENSION) {
        return "intervention_dimension too large";
    }
    if (intervention_dimension > 0 &&
        (!std::isfinite(intervention_magnitude) || intervention_magnitude <= 0.0)) {
        return "intervention_magnitude must be positive";
    }

    return std::nullopt;
}

bool ConsensusConfig::set_option(std::string_view key, std::string_view value) {
    bool ok = false;

    if (key == "sybil_threshold") {
        ok = parse_double(value, sybil_threshold);
    } else if (key == "collusion_similarity_threshold") {
        ok = parse_double(value, collusion_similarity_threshold);
    } else if (key == "min_model_diversity") {
        ok = parse_unsigned(value, min_model_diversity);
    } else if (key == "min_spectral_entropy") {
        ok = parse_double(value, min_spectral_entropy);
    } else if (key == "max_spectral_entropy") {
        ok = parse_double(value, max_spectral_entropy);
    } else if (key == "timing_anomaly_threshold") {
        ok = parse_double(value, timing_anomaly_threshold);
    } else if (key == "reputation_penalty_factor") {
        ok = parse_double(value, reputation_penalty_factor);
    } else if (key == "enable_instant_penalty") {
        ok = parse_bool(value, enable_instant_penalty);
    } else if (key == "consensus_similarity_threshold") {
        ok = parse_double(value, consensus_similarity_threshold);
    } else if (key == "exclusion_score") {
        ok = parse_double(value, exclusion_score);
    } else if (key == "reputation_weighted_consensus") {
        ok = parse_bool(value, reputation_weighted_consensus);
    } else if (key == "aggregation_method") {
        if (auto method = parse_aggregation_method(value)) {
            aggregation_method = *method;
            ok = true;
        }
    } else if (key == "trimmed_mean_fraction") {
        ok = parse_double(value, trimmed_mean_fraction);
    } else if (key == "adaptive_cv_threshold") {
        ok = parse_double(value, adaptive_cv_threshold);
    } else if (key == "adaptive_weight_cv_threshold") {
        ok = parse_double(value, adaptive_weight_cv_threshold);
    } else if (key == "commit_timeout_ms") {
        ok = parse_unsigned(value, commit_timeout_ms);
    } else if (key == "reveal_timeout_ms") {
        ok = parse_unsigned(value, reveal_timeout_ms);
    } else if (key == "quorum_fraction") {
        ok = parse_double(value, quorum_fraction);
    } else if (key == "min_plausible_duration_ms") {
        ok = parse_unsigned(value, min_plausible_duration_ms);
    } else if (key == "timing_cv_floor") {
        ok = parse_double(value, timing_cv_floor);
    } else if (key == "intervention_dimension") {
        ok = parse_unsigned(value, intervention_dimension);
    } else if (key == "intervention_magnitude") {
        ok = parse_double(value, intervention_magnitude);
    } else if (key == "require_signed_commitments") {
        ok = parse_bool(value, require_signed_commitments);
    } else {
        log::core.warn() << "Unknown consensus option '" << key << "'";
        return false;
    }

    if (!ok) {
        log::core.warn() << "Cannot parse value '" << value << "' for option " << key;
    }
    return ok;
}

std::optional<ConsensusConfig> ConsensusConfig::from_options(
    const std::map<std::string, std::string>& options) {
    ConsensusConfig config;
    for (const auto& [key, value] : options) {
        if (!config.set_option(key, value)) {
            return std::nullopt;
        }
    }

    if (auto error = config.validate()) {
        log::core.error() << "Invalid consensus configuration: " << *error;
        return std::nullopt;
    }
    return config;
}

std::size_t ConsensusConfig::quorum_for(std::size_t participants) const {
    auto fraction = static_cast<std::size_t>(
        std::ceil(quorum_fraction * static_cast<double>(participants) - 1e-9));
    return std::max(MIN_PARTICIPANTS, fraction);
}

}  // namespace oracle
