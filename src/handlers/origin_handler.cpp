#include "handlers/origin_handler.hpp"
#include "endpoint_matcher.hpp"
#include "http_response.hpp"

namespace powshield {

void OriginHandler::handle(http::request<http::string_body>&& req, const std::string& remote_addr,
                           Responder respond) {
    const std::string target(req.target());

    if (req.method() == http::verb::get && target == "/health") {
        respond(health_handler_.handle_health(req.version()));
        return;
    }

    const std::string path = EndpointMatcher::request_path(target);
    Decision decision = verifier_.verify(path, headers_from_request(req), remote_addr);

    if (decision.rejected()) {
        auto res = make_rejection(decision, req.version());
        res.keep_alive(req.keep_alive());
        respond(std::move(res));
        return;
    }

    json::object body;
    body["status"] = "ok";
    body["path"] = path;
    body["method"] = std::string(req.method_string());
    body["protected"] = decision.verdict == Verdict::PROCEED;
    body["verified"] = !decision.trust_signature.empty();

    auto res = make_json_response(http::status::ok, req.version(), body);
    res.keep_alive(req.keep_alive());
    respond(std::move(res));
}

}
