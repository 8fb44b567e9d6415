#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include "decision.hpp"
#include "request_headers.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace powshield {

// Copies the request's fields into the framework-neutral header map.
HeaderMap headers_from_request(const http::request<http::string_body>& req);

template<class Body>
void add_security_headers(http::response<Body>& res) {
    res.set(http::field::server, "PowShield/1.0");
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Referrer-Policy", "strict-origin-when-cross-origin");
    res.set("Content-Security-Policy", "default-src 'none'; frame-ancestors 'none'");
}

http::response<http::string_body> make_json_response(http::status status, unsigned version,
                                                     const json::object& body);

// {"error": ..., "reason": ...}; 429 also carries Retry-After and X-RateLimit-* fields.
http::response<http::string_body> make_rejection(const Decision& decision, unsigned version);

http::response<http::string_body> make_not_found(unsigned version);

http::response<http::string_body> make_bad_gateway(unsigned version, const std::string& detail);

}
