#include "handlers/edge_handler.hpp"
#include "endpoint_matcher.hpp"
#include "http_response.hpp"

namespace powshield {

void EdgeHandler::handle(http::request<http::string_body>&& req, const std::string& remote_addr,
                         Responder respond) {
    const std::string target(req.target());

    if (req.method() == http::verb::get && target == "/health") {
        respond(health_handler_.handle_health(req.version()));
        return;
    }
    if (req.method() == http::verb::get && target == "/metrics") {
        if (health_handler_.verify_admin_request(req, remote_addr)) {
            respond(health_handler_.handle_metrics(req.version()));
        } else {
            respond(make_not_found(req.version()));
        }
        return;
    }

    const std::string path = EndpointMatcher::request_path(target);
    Decision decision = validator_.evaluate(path, headers_from_request(req), remote_addr);

    const unsigned version = req.version();
    const bool keep_alive = req.keep_alive();

    if (decision.rejected()) {
        auto res = make_rejection(decision, version);
        res.keep_alive(keep_alive);
        respond(std::move(res));
        return;
    }

    if (decision.verdict == Verdict::PROCEED) {
        req.set(header::HMAC, decision.trust_signature);
    }

    std::string forwarded_for = remote_addr;
    auto xff = req.find("X-Forwarded-For");
    if (xff != req.end()) {
        forwarded_for = std::string(xff->value()) + ", " + remote_addr;
    }
    req.set("X-Forwarded-For", forwarded_for);

    upstream_.forward(std::move(req),
        [respond = std::move(respond), version, keep_alive](beast::error_code ec,
                                                            http::response<http::string_body>&& res) {
            if (ec) {
                respond(make_bad_gateway(version, ec.message()));
                return;
            }
            res.keep_alive(keep_alive);
            res.prepare_payload();
            respond(std::move(res));
        });
}

}
