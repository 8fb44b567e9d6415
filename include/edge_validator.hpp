#pragma once

#include <string>

#include "clock.hpp"
#include "decision.hpp"
#include "endpoint_matcher.hpp"
#include "rate_limiter.hpp"
#include "replay_cache.hpp"
#include "request_headers.hpp"
#include "shield_config.hpp"

namespace powshield {

/**
 * Admission pipeline run at the edge for every inbound request.
 *
 * Order: endpoint match, header presence, timestamp freshness, replay lookup,
 * stamp recomputation, difficulty, replay mark, rate limit, signing. The first
 * failing step decides the response. The replay cache and rate limiter are
 * owned by the caller and may be shared by concurrent evaluations.
 */
class EdgeValidator {
public:
    // Throws ConfigurationError if the configuration cannot serve the edge role.
    EdgeValidator(const ShieldConfig& config, ReplayCache& replay_cache, RateLimiter& rate_limiter,
                  Clock clock = system_clock_source());

    Decision evaluate(const std::string& path, const HeaderMap& headers,
                      const std::string& remote_addr = "unknown");

    // Rate-limit key: the configured client IP header when present, else the peer address.
    std::string caller_identity(const HeaderMap& headers, const std::string& remote_addr) const;

    // HMAC over timestamp:nonce:context with the shared secret.
    std::string sign(const std::string& timestamp, const std::string& nonce, const std::string& context) const;

    const EndpointMatcher& matcher() const { return matcher_; }

private:
    Decision reject(int status, RejectReason reason, const std::string& body,
                    const std::string& remote_addr, const std::string& detail);

    const ShieldConfig& config_;
    EndpointMatcher matcher_;
    ReplayCache& replay_cache_;
    RateLimiter& rate_limiter_;
    Clock clock_;
};

}
