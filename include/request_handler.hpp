#pragma once

#include <functional>
#include <string>
#include <boost/beast/http.hpp>

namespace beast = boost::beast;
namespace http = beast::http;

namespace powshield {

// Per-request logic plugged into HttpSession. Implementations may answer
// synchronously or later (e.g. after an upstream round trip), but must call
// respond exactly once.
class RequestHandler {
public:
    using Responder = std::function<void(http::response<http::string_body>&&)>;

    virtual ~RequestHandler() = default;

    virtual void handle(http::request<http::string_body>&& req, const std::string& remote_addr,
                        Responder respond) = 0;
};

}
