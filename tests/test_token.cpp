#include <gtest/gtest.h>
#include "core/Token.hpp"
#include "core/Issuer.hpp"
#include "core/Db.hpp"
#include "TestUtils.hpp"

using namespace std::chrono_literals;

class TokenTest : public ::testing::Test {
  protected:
    CFakeClock                        clock;
    std::shared_ptr<CNetworkRegistry> registry = CNetworkRegistry::fromNames(CNetworkRegistry::knownNetworks());
    std::shared_ptr<CDatabase>        store    = std::make_shared<CDatabase>(DB_IN_MEMORY, clock.fn());
    CChallengeIssuer                  issuer{testChallengeSettings(300s), registry, store, nullptr, clock.fn()};
    CSignatureVerifier                verifier{registry, store};
    CTestWallet                       wallet;

    // identities only come out of a real verification
    CVerifiedIdentity                 verifiedIdentity() {
        const auto ISSUED = issuer.issue(wallet.solanaAddress(), "solana-testnet");
        if (!ISSUED)
            throw std::runtime_error("issue failed");
        const auto IDENTITY = verifier.verify(wallet.solanaAddress(), "solana-testnet", ISSUED->message, wallet.solanaSign(ISSUED->message));
        if (!IDENTITY)
            throw std::runtime_error("verify failed");
        return *IDENTITY;
    }

    CSessionTokenCodec codec(std::chrono::seconds lifetime = 0s, std::shared_ptr<CDatabase> denylist = nullptr, const std::string& secret = TEST_SECRET) {
        return CSessionTokenCodec(secret, lifetime, registry, denylist, clock.fn());
    }
};

TEST_F(TokenTest, RoundTrip) {
    auto       c        = codec();
    const auto IDENTITY = verifiedIdentity();
    const auto TOKEN    = c.encode(IDENTITY);
    ASSERT_TRUE(TOKEN.has_value());
    EXPECT_TRUE(TOKEN->starts_with(TOKEN_PREFIX));

    const auto SESSION = c.decode(*TOKEN);
    ASSERT_TRUE(SESSION.has_value());
    EXPECT_EQ(SESSION->identity, IDENTITY);
    EXPECT_EQ(SESSION->expiresAt, IDENTITY.expirationTime());
    EXPECT_EQ(SESSION->tokenId.size(), 32u);
}

TEST_F(TokenTest, TokensAreNotReadable) {
    auto       c        = codec();
    const auto IDENTITY = verifiedIdentity();
    const auto TOKEN    = c.encode(IDENTITY).value();

    EXPECT_FALSE(TOKEN.contains(IDENTITY.address()));
    EXPECT_FALSE(TOKEN.contains("solana"));
}

TEST_F(TokenTest, FreshIvPerToken) {
    auto       c        = codec();
    const auto IDENTITY = verifiedIdentity();

    EXPECT_NE(c.encode(IDENTITY).value(), c.encode(IDENTITY).value());
}

TEST_F(TokenTest, WrongSecretIsCorrupt) {
    const auto TOKEN = codec().encode(verifiedIdentity()).value();
    EXPECT_EQ(codec(0s, nullptr, TEST_OTHER_SECRET).decode(TOKEN).error(), TOKEN_ERROR_CORRUPT);
}

TEST_F(TokenTest, EveryBitMatters) {
    auto       c     = codec();
    const auto TOKEN = c.encode(verifiedIdentity()).value();

    for (size_t bit = 0; bit < TOKEN.size() * 8; ++bit) {
        const auto RESULT = c.decode(flipBit(TOKEN, bit));
        ASSERT_FALSE(RESULT.has_value()) << "bit " << bit;
        EXPECT_EQ(RESULT.error(), TOKEN_ERROR_CORRUPT);
    }
}

TEST_F(TokenTest, GarbageIsCorrupt) {
    auto c = codec();
    EXPECT_EQ(c.decode("").error(), TOKEN_ERROR_CORRUPT);
    EXPECT_EQ(c.decode("v1.").error(), TOKEN_ERROR_CORRUPT);
    EXPECT_EQ(c.decode("v1.AAAA").error(), TOKEN_ERROR_CORRUPT);
    EXPECT_EQ(c.decode("v2.AAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAA").error(), TOKEN_ERROR_CORRUPT);

    const auto TOKEN = c.encode(verifiedIdentity()).value();
    EXPECT_EQ(c.decode(TOKEN.substr(0, TOKEN.size() - 4)).error(), TOKEN_ERROR_CORRUPT);
    EXPECT_EQ(c.decode(TOKEN + "AA").error(), TOKEN_ERROR_CORRUPT);
}

TEST_F(TokenTest, ExpiresWithTheChallenge) {
    auto       c        = codec();
    const auto IDENTITY = verifiedIdentity();
    const auto TOKEN    = c.encode(IDENTITY).value();

    clock.advance(299s);
    EXPECT_TRUE(c.decode(TOKEN).has_value());

    clock.advance(1s);
    EXPECT_EQ(c.decode(TOKEN).error(), TOKEN_ERROR_EXPIRED);
}

TEST_F(TokenTest, SessionLifetimeShortensExpiry) {
    auto       c        = codec(60s);
    const auto IDENTITY = verifiedIdentity();
    const auto TOKEN    = c.encode(IDENTITY).value();

    EXPECT_EQ(c.expiryFor(IDENTITY), clock.now() + 60s);

    clock.advance(59s);
    EXPECT_TRUE(c.decode(TOKEN).has_value());

    clock.advance(1s);
    EXPECT_EQ(c.decode(TOKEN).error(), TOKEN_ERROR_EXPIRED);
}

TEST_F(TokenTest, SessionLifetimeNeverExtendsExpiry) {
    auto       c        = codec(24h);
    const auto IDENTITY = verifiedIdentity();

    EXPECT_EQ(c.expiryFor(IDENTITY), IDENTITY.expirationTime());
}

TEST_F(TokenTest, Revocation) {
    auto       c        = codec(0s, store);
    const auto TOKEN    = c.encode(verifiedIdentity()).value();
    const auto SESSION  = c.decode(TOKEN);
    ASSERT_TRUE(SESSION.has_value());

    ASSERT_TRUE(store->revokeToken(SESSION->tokenId, SESSION->expiresAt));
    EXPECT_EQ(c.decode(TOKEN).error(), TOKEN_ERROR_REVOKED);

    // a codec without the denylist doesn't know about it
    EXPECT_TRUE(codec().decode(TOKEN).has_value());
}

TEST_F(TokenTest, DisabledNetworkIsCorrupt) {
    const auto TOKEN = codec().encode(verifiedIdentity()).value();

    CSessionTokenCodec mainnetOnly(TEST_SECRET, 0s, CNetworkRegistry::fromNames({"solana-mainnet"}), nullptr, clock.fn());
    EXPECT_EQ(mainnetOnly.decode(TOKEN).error(), TOKEN_ERROR_CORRUPT);
}

TEST_F(TokenTest, EmptySecretThrows) {
    EXPECT_THROW(CSessionTokenCodec("", 0s, registry, nullptr, clock.fn()), std::invalid_argument);
}
