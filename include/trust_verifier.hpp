#pragma once

#include <string>

#include "decision.hpp"
#include "endpoint_matcher.hpp"
#include "request_headers.hpp"
#include "shield_config.hpp"

namespace powshield {

// Origin-side check of the edge's X-HMAC signature. Holds no mutable state.
class TrustVerifier {
public:
    // Throws ConfigurationError if the configuration cannot serve the origin role.
    explicit TrustVerifier(const ShieldConfig& config);

    /**
     * PASS for unprotected paths, PROCEED when the request may reach the
     * application, REJECT otherwise. Without X-HMAC the outcome depends on
     * strict mode; with X-HMAC but without the proof fields the request is malformed.
     */
    Decision verify(const std::string& path, const HeaderMap& headers,
                    const std::string& remote_addr = "unknown") const;

private:
    Decision reject(int status, RejectReason reason, const std::string& body,
                    const std::string& remote_addr) const;

    const ShieldConfig& config_;
    EndpointMatcher matcher_;
};

}
