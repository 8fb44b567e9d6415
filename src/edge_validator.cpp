#include "edge_validator.hpp"
#include "config_loader.hpp"
#include "hasher.hpp"
#include "input_validator.hpp"
#include "metrics.hpp"
#include "pow_verifier.hpp"
#include "security_logger.hpp"

#include <algorithm>

namespace powshield {

namespace {

SecurityLogger::EventType event_for(RejectReason reason) {
    switch (reason) {
        case RejectReason::MISSING_HEADERS:
        case RejectReason::MALFORMED_TIMESTAMP:
            return SecurityLogger::EventType::MALFORMED_REQUEST;
        case RejectReason::STALE_TIMESTAMP:
            return SecurityLogger::EventType::STALE_TIMESTAMP;
        case RejectReason::REPLAYED_NONCE:
            return SecurityLogger::EventType::REPLAY_ATTEMPT;
        case RejectReason::RATE_LIMITED:
            return SecurityLogger::EventType::RATE_LIMIT_HIT;
        case RejectReason::MISSING_SIGNATURE:
        case RejectReason::INVALID_SIGNATURE:
            return SecurityLogger::EventType::SIGNATURE_FAILURE;
        default:
            return SecurityLogger::EventType::POW_FAILURE;
    }
}

}

EdgeValidator::EdgeValidator(const ShieldConfig& config, ReplayCache& replay_cache,
                             RateLimiter& rate_limiter, Clock clock)
    : config_(config)
    , matcher_(config.endpoints)
    , replay_cache_(replay_cache)
    , rate_limiter_(rate_limiter)
    , clock_(std::move(clock))
{
    validate_config(config_, ConfigRole::EDGE);
}

Decision EdgeValidator::evaluate(const std::string& path, const HeaderMap& headers,
                                 const std::string& remote_addr) {
    auto& metrics = MetricsRegistry::instance();

    if (!matcher_.is_protected(path)) {
        metrics.increment_counter("edge_passthrough_total");
        return Decision::pass();
    }
    metrics.increment_counter("edge_requests_total");

    auto timestamp = find_header(headers, header::TIMESTAMP);
    auto nonce = find_header(headers, header::NONCE);
    auto context = find_header(headers, header::CONTEXT);
    auto stamp = find_header(headers, header::STAMP);

    if (!timestamp || !nonce || !context || !stamp) {
        return reject(400, RejectReason::MISSING_HEADERS, "Missing PoW headers",
                      remote_addr, "Missing PoW headers on " + path);
    }

    auto ts = InputValidator::parse_timestamp(*timestamp);
    if (!ts) {
        return reject(400, RejectReason::MALFORMED_TIMESTAMP, "Invalid timestamp",
                      remote_addr, "Unparsable X-Timestamp");
    }

    // Symmetric window: timestamps too far in the future are rejected like stale ones.
    const long long now = unix_seconds(clock_());
    const long long tolerance = config_.timestamp_tolerance_sec;
    if (*ts < now - tolerance || *ts > now + tolerance) {
        return reject(403, RejectReason::STALE_TIMESTAMP, "Timestamp expired or invalid",
                      remote_addr, "Timestamp outside tolerance window");
    }

    const std::string replay_key = *timestamp + ":" + *nonce;
    if (replay_cache_.seen(replay_key)) {
        return reject(403, RejectReason::REPLAYED_NONCE, "Nonce already used",
                      remote_addr, "Replayed timestamp:nonce pair");
    }

    if (!InputValidator::is_valid_hash(*stamp) ||
        !PoWVerifier::stamp_matches(path, *timestamp, *nonce, *context, *stamp)) {
        return reject(403, RejectReason::INVALID_STAMP, "Invalid PoW stamp",
                      remote_addr, "Stamp does not match recomputed digest");
    }

    if (!DifficultyChecker::satisfies(*stamp, config_.difficulty)) {
        return reject(403, RejectReason::INSUFFICIENT_DIFFICULTY, "Insufficient PoW difficulty",
                      remote_addr, "Stamp below difficulty " + std::to_string(config_.difficulty));
    }

    // The marker must outlive the timestamp's freshness, including future-dated ones.
    const std::chrono::seconds ttl(std::max(tolerance, *ts + tolerance - now + 1));
    if (!replay_cache_.check_and_mark(replay_key, ttl)) {
        return reject(403, RejectReason::REPLAYED_NONCE, "Nonce already used",
                      remote_addr, "Concurrent replay of timestamp:nonce pair");
    }

    if (config_.rate_limiting) {
        auto limit_res = rate_limiter_.check(caller_identity(headers, remote_addr));
        if (!limit_res.allowed) {
            Decision d = reject(429, RejectReason::RATE_LIMITED, "Rate limit exceeded",
                                remote_addr, "Per-identity request ceiling reached");
            d.retry_after_sec = limit_res.reset_after_sec;
            d.rate_limit = limit_res.limit;
            return d;
        }
    }

    metrics.increment_counter("edge_admitted_total");
    SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::PROOF_ACCEPTED,
                        remote_addr, "Admitted " + path);
    return Decision::proceed(sign(*timestamp, *nonce, *context));
}

std::string EdgeValidator::caller_identity(const HeaderMap& headers, const std::string& remote_addr) const {
    if (!config_.client_ip_header.empty()) {
        if (auto forwarded = find_header(headers, config_.client_ip_header)) {
            // X-Forwarded-For style lists: the first entry is the original client.
            std::string first = forwarded->substr(0, forwarded->find(','));
            auto begin = first.find_first_not_of(' ');
            auto end = first.find_last_not_of(' ');
            if (begin != std::string::npos) return first.substr(begin, end - begin + 1);
        }
    }
    return remote_addr;
}

std::string EdgeValidator::sign(const std::string& timestamp, const std::string& nonce,
                                const std::string& context) const {
    return Hasher::mac(timestamp + ":" + nonce + ":" + context, config_.secret, config_.hmac_algorithm);
}

Decision EdgeValidator::reject(int status, RejectReason reason, const std::string& body,
                               const std::string& remote_addr, const std::string& detail) {
    SecurityLogger::log(SecurityLogger::Level::WARNING, event_for(reason), remote_addr, detail);
    MetricsRegistry::instance().increment_labeled("edge_rejected_total", "reason", reject_reason_name(reason));
    return Decision::reject(status, reason, body);
}

}
