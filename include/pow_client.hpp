#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/any_io_executor.hpp>
#include <boost/beast/http.hpp>

#include "challenge.hpp"
#include "clock.hpp"
#include "endpoint_matcher.hpp"
#include "puzzle_solver.hpp"
#include "request_headers.hpp"
#include "shield_config.hpp"

namespace beast = boost::beast;
namespace http = beast::http;

namespace powshield {

// Client half of the protocol: solves a puzzle per protected request and
// attaches the four proof headers.
class PowClient {
public:
    using HeadersHandler = std::function<void(std::optional<HeaderMap>)>;

    // Throws ConfigurationError if the configuration cannot serve the client role.
    PowClient(ShieldConfig config, std::string user_agent = "unknown", std::string ip = "",
              Clock clock = system_clock_source());

    bool is_protected(const std::string& path) const { return matcher_.is_protected(path); }

    // Fingerprint derived from the user agent (and IP, depending on the context mode).
    std::string context() const;

    PuzzleChallenge make_challenge(const std::string& endpoint) const;

    // Blocking. Throws PuzzleExhaustedError when no stamp is found within the budget.
    HeaderMap get_headers(const std::string& endpoint) const;

    /**
     * Cooperative variant running on the executor. The returned solver can be
     * cancelled; the handler then receives std::nullopt.
     */
    std::shared_ptr<PuzzleSolver> async_get_headers(net::any_io_executor executor,
                                                    const std::string& endpoint,
                                                    HeadersHandler handler) const;

    // Sends the request over plain HTTP/1.1, solving and adding proof headers for
    // protected targets that do not already carry an X-Stamp.
    http::response<http::string_body> fetch(const std::string& host, const std::string& port,
                                            http::request<http::string_body> req) const;

    static HeaderMap to_headers(const PuzzleProof& proof);

    const ShieldConfig& config() const { return config_; }

private:
    ShieldConfig config_;
    EndpointMatcher matcher_;
    std::string user_agent_;
    std::string ip_;
    Clock clock_;
};

}
