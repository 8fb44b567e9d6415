#include <boost/beast/core.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <functional>

#include "config_loader.hpp"
#include "edge_validator.hpp"
#include "errors.hpp"
#include "handlers/edge_handler.hpp"
#include "listener.hpp"
#include "rate_limiter.hpp"
#include "redis_manager.hpp"
#include "replay_cache.hpp"
#include "security_logger.hpp"
#include "upstream_client.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

uint16_t parse_port(const std::string& value) {
    int port = 0;
    try {
        port = std::stoi(value);
    } catch (const std::exception&) {
        throw powshield::ConfigurationError("invalid port '" + value + "'");
    }
    if (port <= 0 || port > 65535) {
        throw powshield::ConfigurationError("port out of range: " + value);
    }
    return static_cast<uint16_t>(port);
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "Options:\n"
              << "  --config <file>         JSON configuration file\n"
              << "  --port <port>           Listening port (default 8080)\n"
              << "  --origin <host:port>    Origin to forward admitted requests to\n"
              << "  --help, -h              Show this help\n";
}

}

int main(int argc, char* argv[]) {
    using powshield::SecurityLogger;
    try {
        std::string config_path;
        std::string port_arg;
        std::string origin_arg;

        // --- CLI Argument Parsing ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            if (i + 1 >= argc) {
                std::cerr << "[!] Missing value for " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
            if (arg == "--config") {
                config_path = argv[++i];
            } else if (arg == "--port") {
                port_arg = argv[++i];
            } else if (arg == "--origin") {
                origin_arg = argv[++i];
            } else {
                std::cerr << "[!] Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        // File, then environment, then command line.
        powshield::ShieldConfig config = config_path.empty()
            ? powshield::ShieldConfig{}
            : powshield::load_config_file(config_path);
        powshield::apply_env_overrides(config);

        if (!port_arg.empty()) {
            config.edge_port = parse_port(port_arg);
        }
        if (!origin_arg.empty()) {
            auto colon = origin_arg.rfind(':');
            if (colon == std::string::npos || colon == 0) {
                throw powshield::ConfigurationError("--origin expects host:port, got '" + origin_arg + "'");
            }
            config.origin_host = origin_arg.substr(0, colon);
            config.origin_port = parse_port(origin_arg.substr(colon + 1));
        }

        powshield::validate_config(config, powshield::ConfigRole::EDGE);

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        const std::chrono::seconds replay_ttl(config.timestamp_tolerance_sec);

        std::unique_ptr<powshield::RedisManager> redis;
        std::unique_ptr<powshield::ReplayCache> replay_cache;
        std::unique_ptr<powshield::RateLimiter> rate_limiter;

        if (config.replay_backend == "redis") {
            redis = std::make_unique<powshield::RedisManager>(config.redis_url);
            if (!redis->is_connected()) {
                // Replay checks fail closed, so protected traffic is refused until Redis returns.
                SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::BACKEND_ERROR,
                                    "internal", "Redis unreachable at startup");
            }
            replay_cache = std::make_unique<powshield::RedisReplayCache>(*redis, replay_ttl);
            rate_limiter = std::make_unique<powshield::RedisRateLimiter>(*redis, config.requests_per_minute);
        } else {
            replay_cache = std::make_unique<powshield::MemoryReplayCache>(config.cache_size, replay_ttl);
            rate_limiter = std::make_unique<powshield::MemoryRateLimiter>(config.requests_per_minute,
                                                                          config.cache_size);
        }

        powshield::EdgeValidator validator(config, *replay_cache, *rate_limiter);

        std::cout << "\nPOW SHIELD EDGE\n"
                  << "  listening on " << config.address << ":" << config.edge_port << "\n"
                  << "  origin       " << config.origin_host << ":" << config.origin_port << "\n"
                  << "  difficulty   " << config.difficulty << " bits, tolerance "
                  << config.timestamp_tolerance_sec << "s\n"
                  << "  replay store " << config.replay_backend
                  << (config.rate_limiting ? ", rate limit " + std::to_string(config.requests_per_minute) + "/min"
                                           : ", rate limiting off")
                  << "\n\n";

        net::io_context ioc{config.thread_count};

        powshield::UpstreamClient upstream(ioc, config.origin_host, std::to_string(config.origin_port),
                                           std::chrono::seconds(config.upstream_timeout_sec));
        powshield::EdgeHandler handler(config, validator, upstream);

        net::steady_timer cleanup_timer(ioc, std::chrono::minutes(5));
        std::function<void(beast::error_code)> on_cleanup;
        on_cleanup = [&](beast::error_code ec) {
            if (!ec) {
                replay_cache->purge_expired();
                rate_limiter->purge_expired();
                cleanup_timer.expires_after(std::chrono::minutes(5));
                cleanup_timer.async_wait(on_cleanup);
            }
        };
        cleanup_timer.async_wait(on_cleanup);

        auto listener = std::make_shared<powshield::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.address), config.edge_port},
            handler,
            config.max_body_size
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE,
                            "internal", "Edge started");

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener, &cleanup_timer](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE,
                                    "internal", "Initiating graceful shutdown");
                beast::error_code ec;
                cleanup_timer.cancel(ec);
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        return 0;

    } catch (const powshield::ConfigurationError& e) {
        SecurityLogger::log(SecurityLogger::Level::CRITICAL, SecurityLogger::EventType::CONFIG_ERROR,
                            "internal", e.what());
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
