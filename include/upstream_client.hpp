#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powshield {

// Forwards vetted requests from the edge to the origin, one connection per request.
class UpstreamClient {
public:
    using Callback = std::function<void(beast::error_code, http::response<http::string_body>&&)>;

    UpstreamClient(net::io_context& ioc, std::string host, std::string port,
                   std::chrono::seconds timeout);

    void forward(http::request<http::string_body>&& req, Callback callback);

    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }

private:
    net::io_context& ioc_;
    std::string host_;
    std::string port_;
    std::chrono::seconds timeout_;
};

}
