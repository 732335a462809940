#pragma once

#include "core/types.hh"
#include <memory>
#include <span>
#include <vector>

struct evp_md_ctx_st;

namespace oracle {

// ============================================================================
// SHA3-256 Hashing
// ============================================================================

class SHA3Hasher {
public:
    SHA3Hasher();
    ~SHA3Hasher();

    SHA3Hasher(const SHA3Hasher&) = delete;
    SHA3Hasher& operator=(const SHA3Hasher&) = delete;
    SHA3Hasher(SHA3Hasher&&) noexcept;
    SHA3Hasher& operator=(SHA3Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(const void* data, std::size_t len);
    void update(std::string_view text);
    void update_u64(std::uint64_t val);

    // Resets the context so the hasher can be reused
    [[nodiscard]] hash_t finalize();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;

    void init();
};

[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);

template<typename... Args>
[[nodiscard]] hash_t sha3_256_multi(Args&&... args) {
    SHA3Hasher hasher;
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

// ============================================================================
// Commitments
// ============================================================================

// SHA3-256(data || nonce)
[[nodiscard]] hash_t commitment_hash(std::span<const std::uint8_t> data, const nonce_t& nonce);

// Constant-time comparison for commitment checks
[[nodiscard]] bool hashes_equal(const hash_t& a, const hash_t& b);

// Fresh blinding nonce from the OpenSSL CSPRNG. Throws std::runtime_error
// when the generator cannot be seeded.
[[nodiscard]] nonce_t generate_nonce();

// 32 bytes from the OpenSSL CSPRNG
[[nodiscard]] hash_t random_seed();

// ============================================================================
// Merkle Root
// ============================================================================

[[nodiscard]] hash_t merkle_hash_pair(const hash_t& left, const hash_t& right);

// Odd layers duplicate their last node. Empty input yields the zero hash.
[[nodiscard]] hash_t compute_merkle_root(std::span<const hash_t> leaves);

// ============================================================================
// Deterministic Random Bit Generator
// ============================================================================

// Hash chain over a seed: state' = SHA3(state || counter)
class HashDRBG {
public:
    explicit HashDRBG(const hash_t& seed);

    [[nodiscard]] hash_t next();
    [[nodiscard]] std::uint64_t next_u64();

    // Uniform in [0, 1) with 53 bits of precision
    [[nodiscard]] double next_unit();

    // Uniform in [-magnitude, magnitude)
    [[nodiscard]] double next_symmetric(double magnitude);

private:
    hash_t state_;
    std::uint64_t counter_;
};

}  // namespace oracle
