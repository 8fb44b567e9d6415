#include "handlers/health_handler.hpp"
#include "hasher.hpp"
#include "http_response.hpp"
#include "metrics.hpp"

namespace powshield {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["role"] = role_;
    response["difficulty"] = config_.difficulty;
    response["timestamp_tolerance"] = config_.timestamp_tolerance_sec;
    response["protected_endpoints"] = static_cast<int64_t>(config_.endpoints.size());
    if (role_ == "edge") {
        response["replay_backend"] = config_.replay_backend;
        response["rate_limiting"] = config_.rate_limiting;
    } else {
        response["strict_mode"] = config_.strict_mode;
    }
    
    return make_json_response(http::status::ok, version, response);
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    std::string body = MetricsRegistry::instance().collect_prometheus();
    
    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();
    
    add_security_headers(res);
    
    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req, const std::string& remote_addr) {
    if (remote_addr == "127.0.0.1" || remote_addr == "::1") {
        return true;
    }

    // If no token is configured, remote admin access is disabled.
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    return Hasher::constant_time_equals(provided_token, config_.admin_token);
}

}
