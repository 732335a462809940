#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <compare>

namespace oracle {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// ML-DSA-65 (FIPS 204 / Dilithium Level 3)
inline constexpr std::size_t MLDSA65_PUBLIC_KEY_SIZE = 1952;
inline constexpr std::size_t MLDSA65_SECRET_KEY_SIZE = 4032;
inline constexpr std::size_t MLDSA65_SIGNATURE_SIZE = 3309;  // OQS_SIG_ml_dsa_65_length_signature

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Commitment blinding nonce
inline constexpr std::size_t NONCE_SIZE = 32;

// ============================================================================
// Protocol Constants
// ============================================================================

inline constexpr std::size_t MIN_PARTICIPANTS = 2;
inline constexpr std::size_t MAX_AGENT_ID_LENGTH = 256;
inline constexpr std::size_t MAX_RESPONSE_SIZE = 1024 * 1024;     // 1MB
inline constexpr std::size_t MAX_VECTOR_DIMENSION = 65'536;
inline constexpr std::size_t MAX_PROOF_REFERENCE_LENGTH = 1024;

// Longest commit or reveal window a session may request (one week)
inline constexpr std::uint64_t MAX_PHASE_TIMEOUT_MS = 7ULL * 24 * 60 * 60 * 1000;

// Reputation bounds
inline constexpr double REPUTATION_MIN = 0.0;
inline constexpr double REPUTATION_MAX = 1000.0;
inline constexpr double REPUTATION_INITIAL = 500.0;
inline constexpr std::size_t REPUTATION_HISTORY_LIMIT = 100;

// Reputation deltas, in score points
inline constexpr double CONSENSUS_REWARD = 10.0;
inline constexpr double OUTLIER_PENALTY = 10.0;
inline constexpr double SYBIL_BASE_PENALTY = 80.0;
inline constexpr double COLLUSION_BASE_PENALTY = 70.0;
inline constexpr double SPECTRAL_BASE_PENALTY = 50.0;
inline constexpr double TIMING_BASE_PENALTY = 30.0;

// Evidence severity never drops below this once an anomaly is confirmed
inline constexpr double MIN_EVIDENCE_SEVERITY = 0.1;

// Timing statistics
inline constexpr std::size_t TIMING_HISTORY_LIMIT = 100;
inline constexpr std::size_t TIMING_WINDOW_LIMIT = 100;
inline constexpr std::size_t MIN_ZSCORE_SAMPLES = 10;
inline constexpr std::size_t MIN_SYNC_SAMPLES = 3;

// Two entropies further apart than this come from different models
inline constexpr double MODEL_ENTROPY_GAP = 0.1;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using nonce_t = std::array<std::uint8_t, NONCE_SIZE>;
using session_id_t = std::uint64_t;
using agent_id_t = std::string;
using timestamp_ms_t = std::int64_t;  // milliseconds since the Unix epoch

using mldsa_public_key_t = std::array<std::uint8_t, MLDSA65_PUBLIC_KEY_SIZE>;
using mldsa_secret_key_t = std::array<std::uint8_t, MLDSA65_SECRET_KEY_SIZE>;
using mldsa_signature_t = std::array<std::uint8_t, MLDSA65_SIGNATURE_SIZE>;

// Wall clock in epoch milliseconds
[[nodiscard]] timestamp_ms_t system_now_ms();

// ============================================================================
// Protocol Phase
// ============================================================================

enum class ProtocolPhase : std::uint8_t {
    PENDING = 0,
    COMMITTING = 1,
    REVEALING = 2,
    AGGREGATING = 3,
    COMPLETED = 4,
    FAILED = 5,
};

[[nodiscard]] constexpr std::string_view protocol_phase_string(ProtocolPhase phase) {
    switch (phase) {
        case ProtocolPhase::PENDING: return "pending";
        case ProtocolPhase::COMMITTING: return "committing";
        case ProtocolPhase::REVEALING: return "revealing";
        case ProtocolPhase::AGGREGATING: return "aggregating";
        case ProtocolPhase::COMPLETED: return "completed";
        case ProtocolPhase::FAILED: return "failed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_terminal(ProtocolPhase phase) {
    return phase == ProtocolPhase::COMPLETED || phase == ProtocolPhase::FAILED;
}

// ============================================================================
// Aggregation Method
// ============================================================================

enum class AggregationMethod : std::uint8_t {
    MEAN = 0,              // weighted mean; equal weights unless reputation weighting is on
    WEIGHTED_MEDIAN = 1,
    TRIMMED_MEAN = 2,
    ADAPTIVE = 3,          // mean, or weighted median when values or weights are dispersed
};

[[nodiscard]] constexpr std::string_view aggregation_method_string(AggregationMethod method) {
    switch (method) {
        case AggregationMethod::MEAN: return "mean";
        case AggregationMethod::WEIGHTED_MEDIAN: return "weighted_median";
        case AggregationMethod::TRIMMED_MEAN: return "trimmed_mean";
        case AggregationMethod::ADAPTIVE: return "adaptive";
    }
    return "unknown";
}

[[nodiscard]] std::optional<AggregationMethod> parse_aggregation_method(std::string_view text);

// ============================================================================
// Error Codes
// ============================================================================

enum class ConsensusError : std::uint8_t {
    NONE = 0x00,

    // Per-call protocol errors
    PHASE_MISMATCH = 0x01,
    DUPLICATE_COMMITMENT = 0x02,
    DUPLICATE_REVEAL = 0x03,
    UNKNOWN_AGENT = 0x04,
    NO_MATCHING_COMMITMENT = 0x05,
    HASH_MISMATCH = 0x06,
    ALREADY_STARTED = 0x07,
    UNKNOWN_SESSION = 0x08,
    MALFORMED_RESPONSE = 0x09,
    INVALID_SIGNATURE = 0x0A,

    // Session-fatal
    INSUFFICIENT_PARTICIPATION = 0x10,
    INSUFFICIENT_VALID_REVEALS = 0x11,

    // Configuration
    INVALID_PARTICIPANTS = 0x20,
    INVALID_CONFIG = 0x21,
};

[[nodiscard]] constexpr std::string_view consensus_error_string(ConsensusError error) {
    switch (error) {
        case ConsensusError::NONE: return "none";
        case ConsensusError::PHASE_MISMATCH: return "phase_mismatch";
        case ConsensusError::DUPLICATE_COMMITMENT: return "duplicate_commitment";
        case ConsensusError::DUPLICATE_REVEAL: return "duplicate_reveal";
        case ConsensusError::UNKNOWN_AGENT: return "unknown_agent";
        case ConsensusError::NO_MATCHING_COMMITMENT: return "no_matching_commitment";
        case ConsensusError::HASH_MISMATCH: return "hash_mismatch";
        case ConsensusError::ALREADY_STARTED: return "already_started";
        case ConsensusError::UNKNOWN_SESSION: return "unknown_session";
        case ConsensusError::MALFORMED_RESPONSE: return "malformed_response";
        case ConsensusError::INVALID_SIGNATURE: return "invalid_signature";
        case ConsensusError::INSUFFICIENT_PARTICIPATION: return "insufficient_participation";
        case ConsensusError::INSUFFICIENT_VALID_REVEALS: return "insufficient_valid_reveals";
        case ConsensusError::INVALID_PARTICIPANTS: return "invalid_participants";
        case ConsensusError::INVALID_CONFIG: return "invalid_config";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_session_fatal(ConsensusError error) {
    return error == ConsensusError::INSUFFICIENT_PARTICIPATION ||
           error == ConsensusError::INSUFFICIENT_VALID_REVEALS;
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    for (std::size_t i = 0; i < 8; ++i) {
        dst[i] = static_cast<std::uint8_t>(val >> (8 * i));
    }
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    std::uint64_t val = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        val |= static_cast<std::uint64_t>(src[i]) << (8 * i);
    }
    return val;
}

// Append helpers used by every serialize()
void append_u8(std::vector<std::uint8_t>& out, std::uint8_t val);
void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val);
void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val);
void append_i64(std::vector<std::uint8_t>& out, std::int64_t val);
void append_f64(std::vector<std::uint8_t>& out, double val);
void append_bytes(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes);

// u32 length prefix followed by the payload
void append_string(std::vector<std::uint8_t>& out, std::string_view str);
void append_blob(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes);
void append_f64_vector(std::vector<std::uint8_t>& out, std::span<const double> values);

// Bounds-checked cursor over a serialized buffer. Every read returns false
// once the buffer is exhausted and leaves the cursor untouched.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data) : data_(data) {}

    [[nodiscard]] bool read_u8(std::uint8_t& out);
    [[nodiscard]] bool read_u32(std::uint32_t& out);
    [[nodiscard]] bool read_u64(std::uint64_t& out);
    [[nodiscard]] bool read_i64(std::int64_t& out);
    [[nodiscard]] bool read_f64(double& out);
    [[nodiscard]] bool read_bytes(std::span<std::uint8_t> out);
    [[nodiscard]] bool read_string(std::string& out, std::size_t max_length);
    [[nodiscard]] bool read_blob(std::vector<std::uint8_t>& out, std::size_t max_length);
    [[nodiscard]] bool read_f64_vector(std::vector<double>& out, std::size_t max_count);

    [[nodiscard]] std::size_t remaining() const { return data_.size() - pos_; }
    [[nodiscard]] bool at_end() const { return pos_ == data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t pos_ = 0;
};

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

// Short form for log lines
[[nodiscard]] std::string short_hex(const hash_t& h);

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace oracle

// ============================================================================
// Hash specialization for hash_t (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<oracle::hash_t> {
    std::size_t operator()(const oracle::hash_t& h) const noexcept {
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

}  // namespace std
