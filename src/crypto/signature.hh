#pragma once

#include "core/types.hh"
#include <memory>
#include <optional>
#include <span>

namespace oracle {

// ============================================================================
// ML-DSA-65 Key Pair
// ============================================================================

class MLDSAKeyPair {
public:
    ~MLDSAKeyPair();

    MLDSAKeyPair(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair& operator=(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair(MLDSAKeyPair&&) noexcept;
    MLDSAKeyPair& operator=(MLDSAKeyPair&&) noexcept;

    [[nodiscard]] static std::optional<MLDSAKeyPair> generate();

    // Verification-only key
    [[nodiscard]] static MLDSAKeyPair from_public_key(const mldsa_public_key_t& pk);

    [[nodiscard]] const mldsa_public_key_t& public_key() const { return public_key_; }
    [[nodiscard]] bool has_secret_key() const { return secret_key_ != nullptr; }

    // SHA3-256 of the public key; stable handle for logs and registries
    [[nodiscard]] hash_t fingerprint() const;

    [[nodiscard]] std::optional<mldsa_signature_t> sign(std::span<const std::uint8_t> message) const;

    [[nodiscard]] bool verify(std::span<const std::uint8_t> message,
                              const mldsa_signature_t& signature) const;

private:
    MLDSAKeyPair() = default;

    mldsa_public_key_t public_key_{};
    std::unique_ptr<mldsa_secret_key_t> secret_key_;

    void wipe();
};

[[nodiscard]] bool mldsa_verify(
    const mldsa_public_key_t& public_key,
    std::span<const std::uint8_t> message,
    const mldsa_signature_t& signature);

}  // namespace oracle
