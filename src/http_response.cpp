#include "http_response.hpp"

#include <ctime>

namespace powshield {

HeaderMap headers_from_request(const http::request<http::string_body>& req) {
    HeaderMap headers;
    for (const auto& field : req) {
        headers[std::string(field.name_string())] = std::string(field.value());
    }
    return headers;
}

http::response<http::string_body> make_json_response(http::status status, unsigned version,
                                                     const json::object& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = json::serialize(body);
    res.prepare_payload();
    add_security_headers(res);
    return res;
}

http::response<http::string_body> make_rejection(const Decision& decision, unsigned version) {
    json::object body;
    body["error"] = decision.body;
    body["reason"] = reject_reason_name(decision.reason);

    if (decision.reason == RejectReason::RATE_LIMITED) {
        body["retry_after"] = decision.retry_after_sec;
        body["limit"] = decision.rate_limit;
    }

    auto res = make_json_response(static_cast<http::status>(decision.status), version, body);

    if (decision.reason == RejectReason::RATE_LIMITED) {
        res.set(http::field::retry_after, std::to_string(decision.retry_after_sec));
        res.set("X-RateLimit-Limit", std::to_string(decision.rate_limit));
        res.set("X-RateLimit-Remaining", "0");
        res.set("X-RateLimit-Reset", std::to_string(std::time(nullptr) + decision.retry_after_sec));
    }
    return res;
}

http::response<http::string_body> make_not_found(unsigned version) {
    json::object body;
    body["error"] = "Not Found";
    return make_json_response(http::status::not_found, version, body);
}

http::response<http::string_body> make_bad_gateway(unsigned version, const std::string& detail) {
    json::object body;
    body["error"] = "Upstream unavailable";
    body["detail"] = detail;
    auto res = make_json_response(http::status::bad_gateway, version, body);
    res.keep_alive(false);
    return res;
}

}
