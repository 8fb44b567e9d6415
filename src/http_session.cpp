#include "http_session.hpp"
#include "http_response.hpp"
#include "security_logger.hpp"
#include <boost/asio/dispatch.hpp>
#include <iostream>

namespace powshield {

HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    RequestHandler& handler,
    size_t max_body_size
)
    : stream_(std::move(stream))
    , handler_(handler)
    , max_body_size_(max_body_size)
{
    beast::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

void HttpSession::run() {
    // Start on the connection's strand.
    net::dispatch(stream_.get_executor(),
                  beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
}

void HttpSession::do_read() {
    // Enforce connection timeout to prevent slow-loris attacks
    stream_.expires_after(std::chrono::seconds(60));

    parser_.emplace();
    parser_->body_limit(max_body_size_);

    http::async_read(
        stream_,
        buffer_,
        *parser_,
        beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
}

void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec == http::error::body_limit) {
        SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::MALFORMED_REQUEST,
                            remote_addr_, "Request body exceeds limit");
        auto res = make_json_response(http::status::payload_too_large, 11,
                                      json::object{{"error", "Payload too large"}});
        res.keep_alive(false);
        send_response(std::move(res));
        return;
    }
    if (ec) {
        return;
    }

    auto self = shared_from_this();
    handler_.handle(parser_->release(), remote_addr_,
        [self](http::response<http::string_body>&& res) {
            // The handler may complete on another thread; hop back onto the strand.
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            net::dispatch(self->stream_.get_executor(), [self, sp]() {
                self->send_response(std::move(*sp));
            });
        });
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    auto self = shared_from_this();

    http::async_write(
        stream_,
        *sp,
        [self, sp](beast::error_code ec, std::size_t bytes) {
            self->on_write(sp->need_eof(), ec, bytes);
        });
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        std::cerr << "[!] HTTP write error: " << ec.message() << "\n";
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
}

}
