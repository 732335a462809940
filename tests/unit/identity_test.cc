#include <gtest/gtest.h>
#include "consensus/identity.hh"
#include "crypto/hash.hh"
#include "crypto/signature.hh"

using namespace oracle;

namespace {

Commitment signed_commitment(const MLDSAKeyPair& keypair, const agent_id_t& agent_id,
                             session_id_t session_id) {
    std::vector<std::uint8_t> data = {1, 2, 3, 4};
    nonce_t nonce;
    nonce.fill(0x33);
    auto commitment = Commitment::create(agent_id, data, nonce, 1'000);
    auto sig = keypair.sign(commitment.signing_bytes(session_id));
    if (sig) {
        commitment.signature = *sig;
    }
    return commitment;
}

}  // namespace

// ============================================================================
// Registration Tests
// ============================================================================

TEST(AgentIdentityRegistryTest, RegisterAndLookup) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    AgentIdentityRegistry registry;
    EXPECT_EQ(registry.register_agent("agent-1", keypair->public_key()),
              AgentIdentityRegistry::RegisterResult::SUCCESS);
    EXPECT_TRUE(registry.is_registered("agent-1"));
    EXPECT_EQ(registry.size(), 1);

    auto pk = registry.public_key("agent-1");
    ASSERT_TRUE(pk.has_value());
    EXPECT_EQ(*pk, keypair->public_key());
}

TEST(AgentIdentityRegistryTest, RejectsDuplicateAgent) {
    mldsa_public_key_t pk1{}, pk2{};
    pk1.fill(0x01);
    pk2.fill(0x02);

    AgentIdentityRegistry registry;
    EXPECT_EQ(registry.register_agent("agent-1", pk1),
              AgentIdentityRegistry::RegisterResult::SUCCESS);
    EXPECT_EQ(registry.register_agent("agent-1", pk2),
              AgentIdentityRegistry::RegisterResult::DUPLICATE);
}

TEST(AgentIdentityRegistryTest, RejectsSharedKey) {
    mldsa_public_key_t pk{};
    pk.fill(0x07);

    AgentIdentityRegistry registry;
    EXPECT_EQ(registry.register_agent("agent-1", pk),
              AgentIdentityRegistry::RegisterResult::SUCCESS);
    EXPECT_EQ(registry.register_agent("agent-2", pk),
              AgentIdentityRegistry::RegisterResult::KEY_IN_USE);
    EXPECT_FALSE(registry.is_registered("agent-2"));
}

TEST(AgentIdentityRegistryTest, RejectsInvalidAgentId) {
    mldsa_public_key_t pk{};
    AgentIdentityRegistry registry;
    EXPECT_EQ(registry.register_agent("", pk),
              AgentIdentityRegistry::RegisterResult::INVALID_AGENT_ID);
    EXPECT_EQ(registry.register_agent(std::string(MAX_AGENT_ID_LENGTH + 1, 'a'), pk),
              AgentIdentityRegistry::RegisterResult::INVALID_AGENT_ID);
}

TEST(AgentIdentityRegistryTest, RevokeFreesKey) {
    mldsa_public_key_t pk{};
    pk.fill(0x09);

    AgentIdentityRegistry registry;
    EXPECT_EQ(registry.register_agent("agent-1", pk),
              AgentIdentityRegistry::RegisterResult::SUCCESS);
    EXPECT_TRUE(registry.revoke("agent-1"));
    EXPECT_FALSE(registry.revoke("agent-1"));
    EXPECT_EQ(registry.register_agent("agent-2", pk),
              AgentIdentityRegistry::RegisterResult::SUCCESS);
}

// ============================================================================
// Commitment Signature Tests
// ============================================================================

TEST(AgentIdentityRegistryTest, VerifiesSignedCommitment) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    AgentIdentityRegistry registry;
    ASSERT_EQ(registry.register_agent("agent-1", keypair->public_key()),
              AgentIdentityRegistry::RegisterResult::SUCCESS);

    auto commitment = signed_commitment(*keypair, "agent-1", 4);
    ASSERT_TRUE(commitment.signature.has_value());
    EXPECT_TRUE(registry.verify_commitment(4, commitment));
}

TEST(AgentIdentityRegistryTest, SignatureDoesNotReplayAcrossSessions) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    AgentIdentityRegistry registry;
    ASSERT_EQ(registry.register_agent("agent-1", keypair->public_key()),
              AgentIdentityRegistry::RegisterResult::SUCCESS);

    auto commitment = signed_commitment(*keypair, "agent-1", 4);
    EXPECT_FALSE(registry.verify_commitment(5, commitment));
}

TEST(AgentIdentityRegistryTest, RejectsUnsignedOrUnknown) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    AgentIdentityRegistry registry;
    auto commitment = signed_commitment(*keypair, "agent-1", 1);
    EXPECT_FALSE(registry.verify_commitment(1, commitment));  // not registered

    ASSERT_EQ(registry.register_agent("agent-1", keypair->public_key()),
              AgentIdentityRegistry::RegisterResult::SUCCESS);
    commitment.signature.reset();
    EXPECT_FALSE(registry.verify_commitment(1, commitment));
}

TEST(AgentIdentityRegistryTest, RejectsTamperedHash) {
    auto keypair = MLDSAKeyPair::generate();
    ASSERT_TRUE(keypair.has_value());

    AgentIdentityRegistry registry;
    ASSERT_EQ(registry.register_agent("agent-1", keypair->public_key()),
              AgentIdentityRegistry::RegisterResult::SUCCESS);

    auto commitment = signed_commitment(*keypair, "agent-1", 1);
    commitment.commitment_hash[0] ^= 0x01;
    EXPECT_FALSE(registry.verify_commitment(1, commitment));
}
