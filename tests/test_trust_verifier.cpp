#include <gtest/gtest.h>
#include "trust_verifier.hpp"
#include "errors.hpp"
#include "hasher.hpp"

using namespace powshield;

class TrustVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.endpoints = {"/api/*"};
        config.secret = "shared-secret";
    }

    HeaderMap signed_headers() {
        HeaderMap headers;
        headers[header::TIMESTAMP] = "1700000000";
        headers[header::NONCE] = "0123456789abcdef0123456789abcdef";
        headers[header::CONTEXT] = Hasher::digest("test-agent");
        headers[header::STAMP] = std::string(64, '0');
        headers[header::HMAC] = Hasher::mac("1700000000:0123456789abcdef0123456789abcdef:" + headers[header::CONTEXT],
                                            config.secret, config.hmac_algorithm);
        return headers;
    }

    ShieldConfig config;
};

TEST_F(TrustVerifierTest, UnprotectedPathPasses) {
    TrustVerifier verifier(config);
    EXPECT_EQ(verifier.verify("/health", {}, "10.0.0.1").verdict, Verdict::PASS);
}

TEST_F(TrustVerifierTest, ValidSignatureProceeds) {
    TrustVerifier verifier(config);
    HeaderMap headers = signed_headers();

    Decision d = verifier.verify("/api/data", headers, "10.0.0.1");
    EXPECT_EQ(d.verdict, Verdict::PROCEED);
    EXPECT_EQ(d.trust_signature, headers[header::HMAC]);
}

TEST_F(TrustVerifierTest, StrictModeRequiresSignature) {
    TrustVerifier verifier(config);
    HeaderMap headers = signed_headers();
    headers.erase(header::HMAC);

    Decision d = verifier.verify("/api/data", headers, "10.0.0.1");
    EXPECT_EQ(d.status, 403);
    EXPECT_EQ(d.reason, RejectReason::MISSING_SIGNATURE);
    EXPECT_EQ(d.body, "Missing HMAC signature");
}

TEST_F(TrustVerifierTest, NonStrictAdmitsUnsigned) {
    config.strict_mode = false;
    TrustVerifier verifier(config);

    Decision d = verifier.verify("/api/data", {}, "10.0.0.1");
    EXPECT_EQ(d.verdict, Verdict::PROCEED);
    EXPECT_TRUE(d.trust_signature.empty());

    // A signature that is present is still checked.
    HeaderMap headers = signed_headers();
    headers[header::HMAC] = std::string(64, 'a');
    EXPECT_EQ(verifier.verify("/api/data", headers, "10.0.0.1").reason, RejectReason::INVALID_SIGNATURE);
}

TEST_F(TrustVerifierTest, SignatureWithoutProofFields) {
    TrustVerifier verifier(config);
    HeaderMap headers = signed_headers();
    headers.erase(header::NONCE);

    Decision d = verifier.verify("/api/data", headers, "10.0.0.1");
    EXPECT_EQ(d.status, 400);
    EXPECT_EQ(d.reason, RejectReason::MISSING_HEADERS);
    EXPECT_EQ(d.body, "Missing required headers");
}

TEST_F(TrustVerifierTest, TamperedFieldsRejected) {
    TrustVerifier verifier(config);

    HeaderMap bad_mac = signed_headers();
    bad_mac[header::HMAC][0] = bad_mac[header::HMAC][0] == 'a' ? 'b' : 'a';
    Decision d = verifier.verify("/api/data", bad_mac, "10.0.0.1");
    EXPECT_EQ(d.status, 403);
    EXPECT_EQ(d.reason, RejectReason::INVALID_SIGNATURE);
    EXPECT_EQ(d.body, "Invalid HMAC signature");

    HeaderMap bad_ts = signed_headers();
    bad_ts[header::TIMESTAMP] = "1700000001";
    EXPECT_EQ(verifier.verify("/api/data", bad_ts, "10.0.0.1").reason, RejectReason::INVALID_SIGNATURE);

    HeaderMap truncated = signed_headers();
    truncated[header::HMAC].pop_back();
    EXPECT_EQ(verifier.verify("/api/data", truncated, "10.0.0.1").reason, RejectReason::INVALID_SIGNATURE);
}

TEST_F(TrustVerifierTest, AlgorithmMustMatch) {
    HeaderMap headers = signed_headers();
    config.hmac_algorithm = HashAlgorithm::SHA512;
    TrustVerifier verifier(config);

    EXPECT_EQ(verifier.verify("/api/data", headers, "10.0.0.1").reason, RejectReason::INVALID_SIGNATURE);
    EXPECT_EQ(verifier.verify("/api/data", signed_headers(), "10.0.0.1").verdict, Verdict::PROCEED);
}

TEST_F(TrustVerifierTest, RequiresSecret) {
    config.secret.clear();
    EXPECT_THROW(TrustVerifier verifier(config), ConfigurationError);
}
