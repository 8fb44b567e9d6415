#include "upstream_client.hpp"
#include "metrics.hpp"
#include <boost/asio/strand.hpp>

namespace powshield {

namespace {

// resolve -> connect -> write -> read; the callback fires exactly once.
class UpstreamCall : public std::enable_shared_from_this<UpstreamCall> {
public:
    UpstreamCall(net::io_context& ioc, http::request<http::string_body>&& req,
                 std::chrono::seconds timeout, UpstreamClient::Callback callback)
        : resolver_(net::make_strand(ioc))
        , stream_(net::make_strand(ioc))
        , req_(std::move(req))
        , timeout_(timeout)
        , callback_(std::move(callback))
    {}

    void run(const std::string& host, const std::string& port) {
        resolver_.async_resolve(host, port,
            beast::bind_front_handler(&UpstreamCall::on_resolve, shared_from_this()));
    }

private:
    tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
    std::chrono::seconds timeout_;
    UpstreamClient::Callback callback_;

    void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec);
        stream_.expires_after(timeout_);
        stream_.async_connect(results,
            beast::bind_front_handler(&UpstreamCall::on_connect, shared_from_this()));
    }

    void on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
        if (ec) return fail(ec);
        stream_.expires_after(timeout_);
        http::async_write(stream_, req_,
            beast::bind_front_handler(&UpstreamCall::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec);
        http::async_read(stream_, buffer_, res_,
            beast::bind_front_handler(&UpstreamCall::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) return fail(ec);
        beast::error_code shutdown_ec;
        stream_.socket().shutdown(tcp::socket::shutdown_both, shutdown_ec);
        callback_({}, std::move(res_));
    }

    void fail(beast::error_code ec) {
        MetricsRegistry::instance().increment_counter("upstream_errors_total");
        callback_(ec, http::response<http::string_body>{});
    }
};

}

UpstreamClient::UpstreamClient(net::io_context& ioc, std::string host, std::string port,
                               std::chrono::seconds timeout)
    : ioc_(ioc)
    , host_(std::move(host))
    , port_(std::move(port))
    , timeout_(timeout)
{}

void UpstreamClient::forward(http::request<http::string_body>&& req, Callback callback) {
    // Connection-level fields are hop-by-hop.
    req.keep_alive(false);
    req.prepare_payload();
    std::make_shared<UpstreamCall>(ioc_, std::move(req), timeout_, std::move(callback))->run(host_, port_);
}

}
