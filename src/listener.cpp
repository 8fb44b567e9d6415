#include "listener.hpp"
#include "http_session.hpp"
#include "security_logger.hpp"
#include <boost/asio/strand.hpp>
#include <stdexcept>

namespace powshield {

Listener::Listener(
    net::io_context& ioc,
    tcp::endpoint endpoint,
    RequestHandler& handler,
    size_t max_body_size
)
    : ioc_(ioc)
    , acceptor_(net::make_strand(ioc))
    , handler_(handler)
    , max_body_size_(max_body_size)
{
    beast::error_code ec;
    
    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }
    
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
    }
    
    acceptor_.bind(endpoint, ec);
    if (ec) {
        throw std::runtime_error("Failed to bind: " + ec.message());
    }
    
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
}

void Listener::run() {
    do_accept();
}

void Listener::stop() {
    beast::error_code ec;
    acceptor_.close(ec);
}

void Listener::do_accept() {
    acceptor_.async_accept(
        net::make_strand(ioc_),
        [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
            self->on_accept(ec, std::move(socket));
        });
}

void Listener::on_accept(beast::error_code ec, tcp::socket socket) {
    if (ec == net::error::operation_aborted) {
        return;
    }
    if (ec) {
        SecurityLogger::log(SecurityLogger::Level::ERROR, SecurityLogger::EventType::LIFECYCLE,
                            "internal", "Accept error: " + ec.message());
    } else {
        std::make_shared<HttpSession>(
            beast::tcp_stream(std::move(socket)),
            handler_,
            max_body_size_
        )->run();
    }

    do_accept();
}

}
