#include "types.hh"
#include <algorithm>
#include <atomic>
#include <bit>
#include <chrono>

namespace oracle {

timestamp_ms_t system_now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::optional<AggregationMethod> parse_aggregation_method(std::string_view text) {
    for (auto method : {AggregationMethod::MEAN, AggregationMethod::WEIGHTED_MEDIAN,
                        AggregationMethod::TRIMMED_MEAN, AggregationMethod::ADAPTIVE}) {
        if (aggregation_method_string(method) == text) {
            return method;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Append Helpers
// ============================================================================

void append_u8(std::vector<std::uint8_t>& out, std::uint8_t val) {
    out.push_back(val);
}

void append_u32(std::vector<std::uint8_t>& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_u64(std::vector<std::uint8_t>& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_i64(std::vector<std::uint8_t>& out, std::int64_t val) {
    append_u64(out, static_cast<std::uint64_t>(val));
}

void append_f64(std::vector<std::uint8_t>& out, double val) {
    append_u64(out, std::bit_cast<std::uint64_t>(val));
}

void append_bytes(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes) {
    out.insert(out.end(), bytes.begin(), bytes.end());
}

void append_string(std::vector<std::uint8_t>& out, std::string_view str) {
    append_u32(out, static_cast<std::uint32_t>(str.size()));
    out.insert(out.end(), str.begin(), str.end());
}

void append_blob(std::vector<std::uint8_t>& out, std::span<const std::uint8_t> bytes) {
    append_u32(out, static_cast<std::uint32_t>(bytes.size()));
    append_bytes(out, bytes);
}

void append_f64_vector(std::vector<std::uint8_t>& out, std::span<const double> values) {
    append_u32(out, static_cast<std::uint32_t>(values.size()));
    for (double v : values) {
        append_f64(out, v);
    }
}

// ============================================================================
// ByteReader Implementation
// ============================================================================

bool ByteReader::read_u8(std::uint8_t& out) {
    if (remaining() < 1) return false;
    out = data_[pos_++];
    return true;
}

bool ByteReader::read_u32(std::uint32_t& out) {
    if (remaining() < 4) return false;
    out = decode_u32(data_.data() + pos_);
    pos_ += 4;
    return true;
}

bool ByteReader::read_u64(std::uint64_t& out) {
    if (remaining() < 8) return false;
    out = decode_u64(data_.data() + pos_);
    pos_ += 8;
    return true;
}

bool ByteReader::read_i64(std::int64_t& out) {
    std::uint64_t raw = 0;
    if (!read_u64(raw)) return false;
    out = static_cast<std::int64_t>(raw);
    return true;
}

bool ByteReader::read_f64(double& out) {
    std::uint64_t raw = 0;
    if (!read_u64(raw)) return false;
    out = std::bit_cast<double>(raw);
    return true;
}

bool ByteReader::read_bytes(std::span<std::uint8_t> out) {
    if (remaining() < out.size()) return false;
    std::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(pos_), out.size(), out.begin());
    pos_ += out.size();
    return true;
}

bool ByteReader::read_string(std::string& out, std::size_t max_length) {
    std::size_t start = pos_;
    std::uint32_t len = 0;
    if (!read_u32(len) || len > max_length || remaining() < len) {
        pos_ = start;
        return false;
    }
    out.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
    pos_ += len;
    return true;
}

bool ByteReader::read_blob(std::vector<std::uint8_t>& out, std::size_t max_length) {
    std::size_t start = pos_;
    std::uint32_t len = 0;
    if (!read_u32(len) || len > max_length || remaining() < len) {
        pos_ = start;
        return false;
    }
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(pos_),
               data_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
    pos_ += len;
    return true;
}

bool ByteReader::read_f64_vector(std::vector<double>& out, std::size_t max_count) {
    std::size_t start = pos_;
    std::uint32_t count = 0;
    if (!read_u32(count) || count > max_count ||
        remaining() < static_cast<std::size_t>(count) * 8) {
        pos_ = start;
        return false;
    }
    out.clear();
    out.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        double v = 0.0;
        if (!read_f64(v)) {
            pos_ = start;
            return false;
        }
        out.push_back(v);
    }
    return true;
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return result;
}

std::string short_hex(const hash_t& h) {
    return bytes_to_hex(std::span<const std::uint8_t>(h.data(), 8));
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

}  // namespace oracle
