#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>
#include "shield_config.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;

namespace powshield {

class HealthHandler {
public:
    HealthHandler(const ShieldConfig& config, std::string role)
        : config_(config), role_(std::move(role)) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_metrics(unsigned version);
    
    // Loopback callers, or a matching X-Admin-Token when one is configured.
    bool verify_admin_request(const http::request<http::string_body>& req, const std::string& remote_addr);

private:
    const ShieldConfig& config_;
    std::string role_;
};

}
