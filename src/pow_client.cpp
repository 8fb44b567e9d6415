#include "pow_client.hpp"
#include "config_loader.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>

namespace powshield {

using tcp = boost::asio::ip::tcp;

PowClient::PowClient(ShieldConfig config, std::string user_agent, std::string ip, Clock clock)
    : config_(std::move(config))
    , matcher_(config_.endpoints)
    , user_agent_(std::move(user_agent))
    , ip_(std::move(ip))
    , clock_(std::move(clock))
{
    validate_config(config_, ConfigRole::CLIENT);
}

std::string PowClient::context() const {
    return ContextGenerator::generate(user_agent_, ip_, config_.context_mode);
}

PuzzleChallenge PowClient::make_challenge(const std::string& endpoint) const {
    PuzzleChallenge challenge;
    challenge.endpoint = endpoint;
    challenge.timestamp = unix_seconds(clock_());
    challenge.context = context();
    return challenge;
}

HeaderMap PowClient::to_headers(const PuzzleProof& proof) {
    HeaderMap headers;
    headers[header::TIMESTAMP] = proof.timestamp;
    headers[header::NONCE] = proof.nonce;
    headers[header::CONTEXT] = proof.context;
    headers[header::STAMP] = proof.stamp;
    return headers;
}

HeaderMap PowClient::get_headers(const std::string& endpoint) const {
    PuzzleSolver solver(make_challenge(endpoint), config_.difficulty, config_.max_retries);
    return to_headers(solver.solve());
}

std::shared_ptr<PuzzleSolver> PowClient::async_get_headers(net::any_io_executor executor,
                                                           const std::string& endpoint,
                                                           HeadersHandler handler) const {
    auto solver = std::make_shared<PuzzleSolver>(make_challenge(endpoint), config_.difficulty, config_.max_retries);
    solver->async_solve(std::move(executor), [handler = std::move(handler)](std::optional<PuzzleProof> proof) {
        if (!proof) {
            handler(std::nullopt);
            return;
        }
        handler(to_headers(*proof));
    });
    return solver;
}

http::response<http::string_body> PowClient::fetch(const std::string& host, const std::string& port,
                                                   http::request<http::string_body> req) const {
    std::string path = EndpointMatcher::request_path(std::string(req.target()));
    // A request that already carries a proof is sent as is.
    if (is_protected(path) && req.find(header::STAMP) == req.end()) {
        for (const auto& [name, value] : get_headers(path)) {
            req.set(name, value);
        }
    }
    req.set(http::field::host, host);
    req.set(http::field::user_agent, user_agent_);
    req.prepare_payload();

    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    stream.connect(resolver.resolve(host, port));
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    // not_connected is expected here when the peer closed first.
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

}
