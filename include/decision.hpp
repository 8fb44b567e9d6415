#pragma once

#include <string>

namespace powshield {

// Outcome of a decision function, translated into a response by the HTTP layer.
enum class Verdict {
    PASS,     // Path not protected: forward untouched
    PROCEED,  // Checks passed: forward (edge) or admit (origin)
    REJECT    // Terminal response with status and body
};

enum class RejectReason {
    NONE,
    MISSING_HEADERS,
    MALFORMED_TIMESTAMP,
    STALE_TIMESTAMP,
    REPLAYED_NONCE,
    INVALID_STAMP,
    INSUFFICIENT_DIFFICULTY,
    RATE_LIMITED,
    MISSING_SIGNATURE,
    INVALID_SIGNATURE
};

inline const char* reject_reason_name(RejectReason reason) {
    switch (reason) {
        case RejectReason::NONE: return "none";
        case RejectReason::MISSING_HEADERS: return "missing_headers";
        case RejectReason::MALFORMED_TIMESTAMP: return "malformed_timestamp";
        case RejectReason::STALE_TIMESTAMP: return "stale_timestamp";
        case RejectReason::REPLAYED_NONCE: return "replayed_nonce";
        case RejectReason::INVALID_STAMP: return "invalid_stamp";
        case RejectReason::INSUFFICIENT_DIFFICULTY: return "insufficient_difficulty";
        case RejectReason::RATE_LIMITED: return "rate_limited";
        case RejectReason::MISSING_SIGNATURE: return "missing_signature";
        case RejectReason::INVALID_SIGNATURE: return "invalid_signature";
        default: return "unknown";
    }
}

struct Decision {
    Verdict verdict = Verdict::PASS;
    int status = 200;
    std::string body;
    RejectReason reason = RejectReason::NONE;
    std::string trust_signature;    // Set by the edge on PROCEED
    long long retry_after_sec = 0;  // Set on RATE_LIMITED
    long long rate_limit = 0;

    static Decision pass() { return Decision{}; }

    static Decision proceed(std::string signature = "") {
        Decision d;
        d.verdict = Verdict::PROCEED;
        d.trust_signature = std::move(signature);
        return d;
    }

    static Decision reject(int status, RejectReason reason, std::string body) {
        Decision d;
        d.verdict = Verdict::REJECT;
        d.status = status;
        d.reason = reason;
        d.body = std::move(body);
        return d;
    }

    bool rejected() const { return verdict == Verdict::REJECT; }
};

}
