#include "hash.hh"
#include "core/logging.hh"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace oracle {

// ============================================================================
// SHA3Hasher Implementation
// ============================================================================

void SHA3Hasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

SHA3Hasher::SHA3Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        log::crypto.error("Failed to create EVP_MD_CTX");
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    init();
}

SHA3Hasher::~SHA3Hasher() = default;
SHA3Hasher::SHA3Hasher(SHA3Hasher&&) noexcept = default;
SHA3Hasher& SHA3Hasher::operator=(SHA3Hasher&&) noexcept = default;

void SHA3Hasher::init() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("Failed to initialize SHA3-256");
        throw std::runtime_error("Failed to initialize SHA3-256");
    }
}

void SHA3Hasher::update(std::span<const std::uint8_t> data) {
    update(data.data(), data.size());
}

void SHA3Hasher::update(const void* data, std::size_t len) {
    if (len == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        log::crypto.error("SHA3-256 update failed");
        throw std::runtime_error("SHA3-256 update failed");
    }
}

void SHA3Hasher::update(std::string_view text) {
    update(text.data(), text.size());
}

void SHA3Hasher::update_u64(std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    update(buf);
}

hash_t SHA3Hasher::finalize() {
    hash_t result;
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(ctx_.get(), result.data(), &len) != 1) {
        log::crypto.error("SHA3-256 finalize failed");
        throw std::runtime_error("SHA3-256 finalize failed");
    }
    init();
    return result;
}

hash_t sha3_256(std::span<const std::uint8_t> data) {
    hash_t result;
    unsigned int out_len = HASH_SIZE;
    if (EVP_Digest(data.data(), data.size(), result.data(), &out_len,
                   EVP_sha3_256(), nullptr) != 1) {
        log::crypto.error("SHA3-256 failed");
        throw std::runtime_error("SHA3-256 failed");
    }
    return result;
}

// ============================================================================
// Commitments
// ============================================================================

hash_t commitment_hash(std::span<const std::uint8_t> data, const nonce_t& nonce) {
    SHA3Hasher hasher;
    hasher.update(data);
    hasher.update(nonce);
    return hasher.finalize();
}

bool hashes_equal(const hash_t& a, const hash_t& b) {
    return CRYPTO_memcmp(a.data(), b.data(), HASH_SIZE) == 0;
}

nonce_t generate_nonce() {
    nonce_t nonce;
    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        log::crypto.error("RAND_bytes failed while generating nonce");
        throw std::runtime_error("RAND_bytes failed");
    }
    return nonce;
}

hash_t random_seed() {
    hash_t seed;
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1) {
        log::crypto.error("RAND_bytes failed while generating seed");
        throw std::runtime_error("RAND_bytes failed");
    }
    return seed;
}

// ============================================================================
// Merkle Root
// ============================================================================

hash_t merkle_hash_pair(const hash_t& left, const hash_t& right) {
    SHA3Hasher hasher;
    hasher.update(left);
    hasher.update(right);
    return hasher.finalize();
}

hash_t compute_merkle_root(std::span<const hash_t> leaves) {
    if (leaves.empty()) {
        return {};
    }

    std::vector<hash_t> layer(leaves.begin(), leaves.end());
    while (layer.size() > 1) {
        std::vector<hash_t> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const hash_t& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(merkle_hash_pair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

// ============================================================================
// HashDRBG Implementation
// ============================================================================

HashDRBG::HashDRBG(const hash_t& seed) : state_(seed), counter_(0) {}

hash_t HashDRBG::next() {
    SHA3Hasher hasher;
    hasher.update(state_);
    hasher.update_u64(counter_++);
    state_ = hasher.finalize();
    return state_;
}

std::uint64_t HashDRBG::next_u64() {
    auto h = next();
    return decode_u64(h.data());
}

double HashDRBG::next_unit() {
    return static_cast<double>(next_u64() >> 11) * 0x1.0p-53;
}

double HashDRBG::next_symmetric(double magnitude) {
    return (next_unit() * 2.0 - 1.0) * magnitude;
}

}  // namespace oracle
