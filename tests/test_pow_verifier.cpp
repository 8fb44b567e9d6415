#include <gtest/gtest.h>
#include "pow_verifier.hpp"

using namespace powshield;

namespace {

std::string pad(const std::string& prefix) {
    return prefix + std::string(64 - prefix.size(), 'f');
}

// Finds a nonce whose stamp meets the target, counting upwards from zero.
std::string solve_pow(const std::string& endpoint, const std::string& ts, const std::string& ctx, int difficulty) {
    for (int i = 0; i < 1000000; ++i) {
        std::string nonce = std::to_string(i);
        if (DifficultyChecker::satisfies(PoWVerifier::compute_stamp(endpoint, ts, nonce, ctx), difficulty)) {
            return nonce;
        }
    }
    return "";
}

}

TEST(DifficultyCheckerTest, WholeNibbleTargets) {
    EXPECT_TRUE(DifficultyChecker::satisfies(pad("00"), 8));
    EXPECT_FALSE(DifficultyChecker::satisfies(pad("00"), 9));
    EXPECT_TRUE(DifficultyChecker::satisfies(pad("000"), 12));
    EXPECT_FALSE(DifficultyChecker::satisfies(pad("000"), 13));
    EXPECT_FALSE(DifficultyChecker::satisfies(pad("0"), 8));
}

TEST(DifficultyCheckerTest, PartialNibbleTargets) {
    // 0x7 = 0111: one leading zero bit, 0x1 = 0001: three.
    EXPECT_TRUE(DifficultyChecker::satisfies(pad("007"), 9));
    EXPECT_FALSE(DifficultyChecker::satisfies(pad("007"), 10));
    EXPECT_TRUE(DifficultyChecker::satisfies(pad("001"), 11));
    EXPECT_FALSE(DifficultyChecker::satisfies(pad("001"), 12));
    EXPECT_FALSE(DifficultyChecker::satisfies(pad("008"), 9));
    EXPECT_TRUE(DifficultyChecker::satisfies(pad("3"), 2));
    EXPECT_TRUE(DifficultyChecker::satisfies(pad("3A"), 2));
}

TEST(DifficultyCheckerTest, Bounds) {
    EXPECT_TRUE(DifficultyChecker::satisfies(pad("f"), 0));
    EXPECT_TRUE(DifficultyChecker::satisfies("", 0));
    EXPECT_TRUE(DifficultyChecker::satisfies(std::string(64, '0'), 256));
    EXPECT_FALSE(DifficultyChecker::satisfies(std::string(64, '0'), 257));
    EXPECT_FALSE(DifficultyChecker::satisfies("00", 9));
    EXPECT_FALSE(DifficultyChecker::satisfies("0g" + std::string(62, '0'), 5));
}

TEST(DifficultyCheckerTest, LeadingZeroBits) {
    EXPECT_EQ(DifficultyChecker::leading_zero_bits(pad("f")), 0);
    EXPECT_EQ(DifficultyChecker::leading_zero_bits(pad("0f")), 4);
    EXPECT_EQ(DifficultyChecker::leading_zero_bits(pad("01")), 7);
    EXPECT_EQ(DifficultyChecker::leading_zero_bits(std::string(64, '0')), 256);
}

TEST(PoWVerifierTest, StampInputLayout) {
    EXPECT_EQ(PoWVerifier::stamp_input("/api/data", "1700000000", "abc", "ctx"),
              "/api/data:1700000000:abc:ctx");
    EXPECT_EQ(PoWVerifier::compute_stamp("/api/data", "1700000000", "abc", "ctx"),
              Hasher::digest("/api/data:1700000000:abc:ctx"));
}

TEST(PoWVerifierTest, Verification) {
    std::string ts = "1700000000";
    std::string ctx = "test_context";
    
    EXPECT_FALSE(PoWVerifier::verify("/api/data", ts, "wrong_nonce", ctx, std::string(64, '0'), 4));
    EXPECT_FALSE(PoWVerifier::verify("/api/data", ts, "", ctx, std::string(64, '0'), 0));
}

TEST(PoWVerifierTest, SuccessfulVerification) {
    std::string ts = "1700000000";
    std::string ctx = "ctx";
    int diff = 8;
    
    std::string nonce = solve_pow("/api/data", ts, ctx, diff);
    ASSERT_FALSE(nonce.empty());
    std::string stamp = PoWVerifier::compute_stamp("/api/data", ts, nonce, ctx);
    EXPECT_TRUE(PoWVerifier::verify("/api/data", ts, nonce, ctx, stamp, diff));

    // Every input is bound into the stamp.
    EXPECT_FALSE(PoWVerifier::verify("/api/other", ts, nonce, ctx, stamp, diff));
    EXPECT_FALSE(PoWVerifier::verify("/api/data", "1700000001", nonce, ctx, stamp, diff));
    EXPECT_FALSE(PoWVerifier::verify("/api/data", ts, nonce, "ctx2", stamp, diff));
}
