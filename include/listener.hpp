#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <memory>

#include "request_handler.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace powshield {

// Accepts connections and starts one HttpSession per socket.
class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        tcp::endpoint endpoint,
        RequestHandler& handler,
        size_t max_body_size
    );

    void run();
    void stop();

private:
    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    RequestHandler& handler_;
    size_t max_body_size_;

    void do_accept();
    void on_accept(beast::error_code ec, tcp::socket socket);
};

}
