#pragma once

#include "edge_validator.hpp"
#include "handlers/health_handler.hpp"
#include "request_handler.hpp"
#include "upstream_client.hpp"

namespace powshield {

// Edge hop: validates, then relays to the origin or answers with the rejection.
class EdgeHandler : public RequestHandler {
public:
    EdgeHandler(const ShieldConfig& config, EdgeValidator& validator, UpstreamClient& upstream)
        : validator_(validator), upstream_(upstream), health_handler_(config, "edge") {}

    void handle(http::request<http::string_body>&& req, const std::string& remote_addr,
                Responder respond) override;

private:
    EdgeValidator& validator_;
    UpstreamClient& upstream_;
    HealthHandler health_handler_;
};

}
