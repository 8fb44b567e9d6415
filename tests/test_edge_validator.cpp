#include <gtest/gtest.h>
#include "edge_validator.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include "pow_client.hpp"
#include "pow_verifier.hpp"
#include "puzzle_solver.hpp"

using namespace powshield;

class EdgeValidatorTest : public ::testing::Test {
protected:
    static constexpr long long NOW = 1700000000;

    void SetUp() override {
        config.endpoints = {"/api/*", "/login"};
        config.secret = "test-secret";
        config.difficulty = 4;
        config.timestamp_tolerance_sec = 30;
        config.requests_per_minute = 30;
    }

    Clock clock() {
        return [this] { return now; };
    }

    std::unique_ptr<EdgeValidator> make_validator() {
        replay = std::make_unique<MemoryReplayCache>(config.cache_size,
                                                     std::chrono::seconds(config.timestamp_tolerance_sec), clock());
        limiter = std::make_unique<MemoryRateLimiter>(config.requests_per_minute, config.cache_size,
                                                      RateLimiter::DEFAULT_WINDOW, clock());
        return std::make_unique<EdgeValidator>(config, *replay, *limiter, clock());
    }

    HeaderMap solve(const std::string& path, long long ts = NOW, int difficulty = 4) {
        PuzzleChallenge challenge{path, ts, ContextGenerator::generate("test-agent", "", ContextMode::USER_AGENT)};
        PuzzleSolver solver(challenge, difficulty, 100);
        return PowClient::to_headers(solver.solve());
    }

    ShieldConfig config;
    std::chrono::system_clock::time_point now{std::chrono::seconds(NOW)};
    std::unique_ptr<ReplayCache> replay;
    std::unique_ptr<RateLimiter> limiter;
};

TEST_F(EdgeValidatorTest, UnprotectedPathPasses) {
    auto validator = make_validator();
    Decision d = validator->evaluate("/public", {});
    EXPECT_EQ(d.verdict, Verdict::PASS);
    EXPECT_TRUE(d.trust_signature.empty());

    // Prefix patterns only match their own subtree.
    EXPECT_EQ(validator->evaluate("/apiary", {}).verdict, Verdict::PASS);
    EXPECT_EQ(validator->evaluate("/login/extra", {}).verdict, Verdict::PASS);
}

TEST_F(EdgeValidatorTest, ValidProofProceedsWithSignature) {
    auto validator = make_validator();
    HeaderMap headers = solve("/api/data");

    Decision d = validator->evaluate("/api/data", headers, "10.0.0.1");
    ASSERT_EQ(d.verdict, Verdict::PROCEED);
    EXPECT_EQ(d.trust_signature,
              Hasher::mac(headers[header::TIMESTAMP] + ":" + headers[header::NONCE] + ":" + headers[header::CONTEXT],
                          "test-secret"));
}

TEST_F(EdgeValidatorTest, MissingHeaders) {
    auto validator = make_validator();
    HeaderMap headers = solve("/login");
    headers.erase(header::STAMP);

    Decision d = validator->evaluate("/login", headers);
    EXPECT_EQ(d.status, 400);
    EXPECT_EQ(d.reason, RejectReason::MISSING_HEADERS);
    EXPECT_EQ(d.body, "Missing PoW headers");

    EXPECT_EQ(validator->evaluate("/login", {}).status, 400);
}

TEST_F(EdgeValidatorTest, EmptyHeaderCountsAsMissing) {
    auto validator = make_validator();
    HeaderMap headers = solve("/login");
    headers[header::NONCE] = "";

    EXPECT_EQ(validator->evaluate("/login", headers).reason, RejectReason::MISSING_HEADERS);
}

TEST_F(EdgeValidatorTest, HeaderNamesAreCaseInsensitive) {
    auto validator = make_validator();
    HeaderMap solved = solve("/login");
    HeaderMap lower;
    lower["x-timestamp"] = solved[header::TIMESTAMP];
    lower["x-nonce"] = solved[header::NONCE];
    lower["x-context"] = solved[header::CONTEXT];
    lower["x-stamp"] = solved[header::STAMP];

    EXPECT_EQ(validator->evaluate("/login", lower).verdict, Verdict::PROCEED);
}

TEST_F(EdgeValidatorTest, MalformedTimestamp) {
    auto validator = make_validator();
    HeaderMap headers = solve("/login");
    headers[header::TIMESTAMP] = "17000abc";

    Decision d = validator->evaluate("/login", headers);
    EXPECT_EQ(d.status, 400);
    EXPECT_EQ(d.reason, RejectReason::MALFORMED_TIMESTAMP);
}

TEST_F(EdgeValidatorTest, TimestampToleranceBoundary) {
    auto validator = make_validator();

    EXPECT_EQ(validator->evaluate("/login", solve("/login", NOW - 30)).verdict, Verdict::PROCEED);

    Decision stale = validator->evaluate("/login", solve("/login", NOW - 31));
    EXPECT_EQ(stale.status, 403);
    EXPECT_EQ(stale.reason, RejectReason::STALE_TIMESTAMP);
    EXPECT_EQ(stale.body, "Timestamp expired or invalid");
}

TEST_F(EdgeValidatorTest, FutureTimestampsRejected) {
    auto validator = make_validator();

    EXPECT_EQ(validator->evaluate("/login", solve("/login", NOW + 30)).verdict, Verdict::PROCEED);
    EXPECT_EQ(validator->evaluate("/login", solve("/login", NOW + 31)).reason, RejectReason::STALE_TIMESTAMP);
}

TEST_F(EdgeValidatorTest, ReplayRejected) {
    auto validator = make_validator();
    HeaderMap headers = solve("/api/data");

    EXPECT_EQ(validator->evaluate("/api/data", headers).verdict, Verdict::PROCEED);

    Decision replayed = validator->evaluate("/api/data", headers);
    EXPECT_EQ(replayed.status, 403);
    EXPECT_EQ(replayed.reason, RejectReason::REPLAYED_NONCE);
    EXPECT_EQ(replayed.body, "Nonce already used");
}

TEST_F(EdgeValidatorTest, ReplayMarkerOutlivesFutureTimestamp) {
    auto validator = make_validator();
    HeaderMap headers = solve("/api/data", NOW + 30);
    EXPECT_EQ(validator->evaluate("/api/data", headers).verdict, Verdict::PROCEED);

    // Still fresh at NOW + 55, so the marker must still be there.
    now += std::chrono::seconds(55);
    EXPECT_EQ(validator->evaluate("/api/data", headers).reason, RejectReason::REPLAYED_NONCE);
}

TEST_F(EdgeValidatorTest, FailedProofIsNotMarked) {
    auto validator = make_validator();
    HeaderMap headers = solve("/api/data");
    HeaderMap tampered = headers;
    tampered[header::CONTEXT] = Hasher::digest("other-agent");

    EXPECT_EQ(validator->evaluate("/api/data", tampered).reason, RejectReason::INVALID_STAMP);
    EXPECT_EQ(validator->evaluate("/api/data", headers).verdict, Verdict::PROCEED);
}

TEST_F(EdgeValidatorTest, InvalidStamp) {
    auto validator = make_validator();
    HeaderMap headers = solve("/api/data");

    HeaderMap wrong_nonce = headers;
    wrong_nonce[header::NONCE] = "tampered";
    Decision d = validator->evaluate("/api/data", wrong_nonce);
    EXPECT_EQ(d.status, 403);
    EXPECT_EQ(d.reason, RejectReason::INVALID_STAMP);
    EXPECT_EQ(d.body, "Invalid PoW stamp");

    HeaderMap not_hex = headers;
    not_hex[header::STAMP] = std::string(64, 'z');
    EXPECT_EQ(validator->evaluate("/api/data", not_hex).reason, RejectReason::INVALID_STAMP);

    // A stamp solved for one endpoint does not open another.
    EXPECT_EQ(validator->evaluate("/api/other", headers).reason, RejectReason::INVALID_STAMP);
}

TEST_F(EdgeValidatorTest, InsufficientDifficulty) {
    auto validator = make_validator();
    const std::string ctx = Hasher::digest("test-agent");
    const std::string ts = std::to_string(NOW);

    std::string nonce;
    std::string stamp;
    for (int i = 0; i < 1000; ++i) {
        nonce = "weak" + std::to_string(i);
        stamp = PoWVerifier::compute_stamp("/api/data", ts, nonce, ctx);
        if (!DifficultyChecker::satisfies(stamp, 4)) break;
    }
    ASSERT_FALSE(DifficultyChecker::satisfies(stamp, 4));

    HeaderMap headers;
    headers[header::TIMESTAMP] = ts;
    headers[header::NONCE] = nonce;
    headers[header::CONTEXT] = ctx;
    headers[header::STAMP] = stamp;

    Decision d = validator->evaluate("/api/data", headers);
    EXPECT_EQ(d.status, 403);
    EXPECT_EQ(d.reason, RejectReason::INSUFFICIENT_DIFFICULTY);
    EXPECT_EQ(d.body, "Insufficient PoW difficulty");
}

TEST_F(EdgeValidatorTest, RateLimitAfterCeiling) {
    config.requests_per_minute = 2;
    auto validator = make_validator();

    EXPECT_EQ(validator->evaluate("/api/data", solve("/api/data"), "10.0.0.1").verdict, Verdict::PROCEED);
    EXPECT_EQ(validator->evaluate("/api/data", solve("/api/data"), "10.0.0.1").verdict, Verdict::PROCEED);

    Decision d = validator->evaluate("/api/data", solve("/api/data"), "10.0.0.1");
    EXPECT_EQ(d.status, 429);
    EXPECT_EQ(d.reason, RejectReason::RATE_LIMITED);
    EXPECT_EQ(d.body, "Rate limit exceeded");
    EXPECT_EQ(d.retry_after_sec, 60);
    EXPECT_EQ(d.rate_limit, 2);

    // Another caller has its own budget.
    EXPECT_EQ(validator->evaluate("/api/data", solve("/api/data"), "10.0.0.2").verdict, Verdict::PROCEED);
}

TEST_F(EdgeValidatorTest, RateLimitingDisabled) {
    config.requests_per_minute = 1;
    config.rate_limiting = false;
    auto validator = make_validator();

    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(validator->evaluate("/api/data", solve("/api/data"), "10.0.0.1").verdict, Verdict::PROCEED);
    }
}

TEST_F(EdgeValidatorTest, CallerIdentity) {
    config.client_ip_header = "X-Forwarded-For";
    auto validator = make_validator();

    HeaderMap headers;
    EXPECT_EQ(validator->caller_identity(headers, "10.0.0.1"), "10.0.0.1");

    headers["x-forwarded-for"] = " 203.0.113.7 , 10.0.0.1";
    EXPECT_EQ(validator->caller_identity(headers, "10.0.0.1"), "203.0.113.7");
}

TEST_F(EdgeValidatorTest, Sha512Signature) {
    config.hmac_algorithm = HashAlgorithm::SHA512;
    auto validator = make_validator();

    EXPECT_EQ(validator->sign("1", "n", "c"), Hasher::mac("1:n:c", "test-secret", HashAlgorithm::SHA512));
    EXPECT_EQ(validator->sign("1", "n", "c").size(), 128u);
}

TEST_F(EdgeValidatorTest, RejectsUnusableConfiguration) {
    config.secret.clear();
    EXPECT_THROW(make_validator(), ConfigurationError);

    config.secret = "s";
    config.endpoints.clear();
    EXPECT_THROW(make_validator(), ConfigurationError);
}
