#pragma once

#include "handlers/health_handler.hpp"
#include "request_handler.hpp"
#include "trust_verifier.hpp"

namespace powshield {

// Origin hop: the trust check followed by a small JSON application.
class OriginHandler : public RequestHandler {
public:
    OriginHandler(const ShieldConfig& config, const TrustVerifier& verifier)
        : verifier_(verifier), health_handler_(config, "origin") {}

    void handle(http::request<http::string_body>&& req, const std::string& remote_addr,
                Responder respond) override;

private:
    const TrustVerifier& verifier_;
    HealthHandler health_handler_;
};

}
