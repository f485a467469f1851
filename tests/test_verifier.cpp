#include <gtest/gtest.h>
#include "core/Verifier.hpp"
#include "core/Issuer.hpp"
#include "core/Db.hpp"
#include "TestUtils.hpp"

using namespace std::chrono_literals;

class VerifierTest : public ::testing::Test {
  protected:
    CFakeClock                        clock;
    std::shared_ptr<CNetworkRegistry> registry = CNetworkRegistry::fromNames(CNetworkRegistry::knownNetworks());
    std::shared_ptr<CDatabase>        store    = std::make_shared<CDatabase>(DB_IN_MEMORY, clock.fn());
    CChallengeIssuer                  issuer{testChallengeSettings(120s), registry, store, nullptr, clock.fn()};
    CSignatureVerifier                verifier{registry, store};
    CTestWallet                       wallet;

    SIssuedChallenge                  issueSolana() {
        auto issued = issuer.issue(wallet.solanaAddress(), "solana-devnet");
        if (!issued)
            throw std::runtime_error("issue failed");
        return *issued;
    }
};

TEST_F(VerifierTest, AcceptsValidSolanaSignature) {
    const auto ISSUED   = issueSolana();
    const auto IDENTITY = verifier.verify(wallet.solanaAddress(), "solana-devnet", ISSUED.message, wallet.solanaSign(ISSUED.message));

    ASSERT_TRUE(IDENTITY.has_value());
    EXPECT_EQ(IDENTITY->address(), wallet.solanaAddress());
    EXPECT_EQ(IDENTITY->network(), "solana-devnet");
    EXPECT_EQ(IDENTITY->profileId(), CVerifiedIdentity::deriveProfileId(wallet.solanaAddress(), "solana-devnet"));
    EXPECT_EQ(IDENTITY->issuedAt(), ISSUED.challenge.issuedAt);
    EXPECT_EQ(IDENTITY->expirationTime(), ISSUED.challenge.expirationTime);
}

TEST_F(VerifierTest, AcceptsValidStellarSignature) {
    const auto ISSUED = issuer.issue(wallet.stellarAddress(), "stellar-pubnet");
    ASSERT_TRUE(ISSUED.has_value());

    const auto IDENTITY = verifier.verify(wallet.stellarAddress(), "stellar-pubnet", ISSUED->message, wallet.stellarSign(ISSUED->message));
    ASSERT_TRUE(IDENTITY.has_value());
    EXPECT_EQ(IDENTITY->address(), wallet.stellarAddress());
}

TEST_F(VerifierTest, ProfileIdIsStablePerNetwork) {
    const auto A = CVerifiedIdentity::deriveProfileId(wallet.solanaAddress(), "solana-devnet");
    EXPECT_EQ(A, CVerifiedIdentity::deriveProfileId(wallet.solanaAddress(), "solana-devnet"));
    EXPECT_NE(A, CVerifiedIdentity::deriveProfileId(wallet.solanaAddress(), "solana-mainnet"));
    EXPECT_EQ(A.size(), 32u);
}

TEST_F(VerifierTest, ChallengeIsSingleUse) {
    const auto ISSUED    = issueSolana();
    const auto SIGNATURE = wallet.solanaSign(ISSUED.message);

    ASSERT_TRUE(verifier.verify(wallet.solanaAddress(), "solana-devnet", ISSUED.message, SIGNATURE).has_value());
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", ISSUED.message, SIGNATURE).error(), AUTH_ERROR_ALREADY_USED);
}

TEST_F(VerifierTest, FailedVerificationBurnsTheNonce) {
    const auto  ISSUED = issueSolana();
    CTestWallet other;

    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", ISSUED.message, other.solanaSign(ISSUED.message)).error(), AUTH_ERROR_INVALID_SIGNATURE);
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", ISSUED.message, wallet.solanaSign(ISSUED.message)).error(), AUTH_ERROR_ALREADY_USED);
}

TEST_F(VerifierTest, ExpiredChallenge) {
    const auto ISSUED = issueSolana();
    clock.advance(121s);

    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", ISSUED.message, wallet.solanaSign(ISSUED.message)).error(), AUTH_ERROR_EXPIRED);
}

TEST_F(VerifierTest, UnknownNonce) {
    auto c  = issueSolana().challenge;
    c.nonce = "00000000000000000000000000000000";

    const auto MESSAGE = NMessage::compose(c);
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", MESSAGE, wallet.solanaSign(MESSAGE)).error(), AUTH_ERROR_NOT_FOUND);
}

TEST_F(VerifierTest, TamperedStatement) {
    auto c      = issueSolana().challenge;
    c.statement = "Transfer all funds";

    const auto MESSAGE = NMessage::compose(c);
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", MESSAGE, wallet.solanaSign(MESSAGE)).error(), AUTH_ERROR_TAMPERED_MESSAGE);
}

TEST_F(VerifierTest, ExtendedExpirationIsTampering) {
    auto c           = issueSolana().challenge;
    c.expirationTime = c.expirationTime + 1h;

    const auto MESSAGE = NMessage::compose(c);
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", MESSAGE, wallet.solanaSign(MESSAGE)).error(), AUTH_ERROR_TAMPERED_MESSAGE);
}

TEST_F(VerifierTest, WrongNetwork) {
    const auto ISSUED = issueSolana();
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-mainnet", ISSUED.message, wallet.solanaSign(ISSUED.message)).error(), AUTH_ERROR_NOT_FOUND);
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "dogecoin", ISSUED.message, wallet.solanaSign(ISSUED.message)).error(), AUTH_ERROR_UNSUPPORTED_NETWORK);
}

TEST_F(VerifierTest, MalformedInputs) {
    const auto ISSUED = issueSolana();
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", "hello", wallet.solanaSign("hello")).error(), AUTH_ERROR_MALFORMED_MESSAGE);
    EXPECT_EQ(verifier.verify(wallet.solanaAddress(), "solana-devnet", ISSUED.message, "0xdeadbeef").error(), AUTH_ERROR_MALFORMED_SIGNATURE);
}

TEST_F(VerifierTest, EverySignatureBitMatters) {
    for (size_t bit = 0; bit < 64 * 8; bit += 7) {
        const auto ISSUED = issueSolana();
        const auto RAW    = wallet.sign(Bytes{ISSUED.message.begin(), ISSUED.message.end()});

        std::string flipped{RAW.begin(), RAW.end()};
        flipped = flipBit(flipped, bit);

        const auto SIGNATURE = NEncoding::base58Encode(Bytes{flipped.begin(), flipped.end()});
        const auto RESULT    = verifier.verify(wallet.solanaAddress(), "solana-devnet", ISSUED.message, SIGNATURE);
        ASSERT_FALSE(RESULT.has_value()) << "bit " << bit;
    }
}

TEST_F(VerifierTest, EveryMessageBitMatters) {
    for (size_t bit = 0; bit < 200 * 8; bit += 13) {
        const auto ISSUED = issueSolana();
        const auto SIGNED = wallet.solanaSign(ISSUED.message);
        if (bit / 8 >= ISSUED.message.size())
            break;

        const auto RESULT = verifier.verify(wallet.solanaAddress(), "solana-devnet", flipBit(ISSUED.message, bit), SIGNED);
        ASSERT_FALSE(RESULT.has_value()) << "bit " << bit;
    }
}
