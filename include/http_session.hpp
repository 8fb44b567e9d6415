#pragma once

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/optional.hpp>
#include <memory>
#include <string>

#include "request_handler.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powshield {

// One HTTP/1.1 connection: read a request, hand it to the handler, write the
// response, repeat while keep-alive holds.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(
        beast::tcp_stream&& stream,
        RequestHandler& handler,
        size_t max_body_size
    );

    ~HttpSession() = default;

    void run();

private:
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    boost::optional<http::request_parser<http::string_body>> parser_;

    RequestHandler& handler_;
    size_t max_body_size_;
    std::string remote_addr_;

    void do_read();
    void on_read(beast::error_code ec, std::size_t bytes_transferred);
    void send_response(http::response<http::string_body>&& res);
    void on_write(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void do_close();
};

}
