#include <boost/beast/core.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>

#include "config_loader.hpp"
#include "errors.hpp"
#include "handlers/origin_handler.hpp"
#include "listener.hpp"
#include "security_logger.hpp"
#include "trust_verifier.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

int main(int argc, char* argv[]) {
    using powshield::SecurityLogger;
    try {
        std::string config_path;
        std::string port_arg;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                std::cout << "Usage: " << argv[0] << " [options]\n"
                          << "Options:\n"
                          << "  --config <file>   JSON configuration file\n"
                          << "  --port <port>     Listening port (default 8081)\n"
                          << "  --help, -h        Show this help\n";
                return 0;
            } else if ((arg == "--config" || arg == "--port") && i + 1 < argc) {
                (arg == "--config" ? config_path : port_arg) = argv[++i];
            } else {
                std::cerr << "[!] Unknown or incomplete option: " << arg << "\n";
                return 1;
            }
        }

        powshield::ShieldConfig config = config_path.empty()
            ? powshield::ShieldConfig{}
            : powshield::load_config_file(config_path);
        powshield::apply_env_overrides(config);

        if (!port_arg.empty()) {
            int port = 0;
            try {
                port = std::stoi(port_arg);
            } catch (const std::exception&) {
                throw powshield::ConfigurationError("invalid port '" + port_arg + "'");
            }
            if (port <= 0 || port > 65535) {
                throw powshield::ConfigurationError("port out of range: " + port_arg);
            }
            config.origin_port = static_cast<uint16_t>(port);
        }

        powshield::TrustVerifier verifier(config);

        if (!config.strict_mode) {
            SecurityLogger::log(SecurityLogger::Level::WARNING, SecurityLogger::EventType::LIFECYCLE, "internal",
                                "Strict mode disabled: unsigned requests to protected paths are admitted");
        }

        if (config.thread_count == 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        std::cout << "\nPOW SHIELD ORIGIN\n"
                  << "  listening on " << config.address << ":" << config.origin_port << "\n"
                  << "  strict mode  " << (config.strict_mode ? "on" : "off") << "\n"
                  << "  hmac         " << powshield::hash_algorithm_name(config.hmac_algorithm) << "\n\n";

        net::io_context ioc{config.thread_count};

        powshield::OriginHandler handler(config, verifier);

        auto listener = std::make_shared<powshield::Listener>(
            ioc,
            tcp::endpoint{net::ip::make_address(config.address), config.origin_port},
            handler,
            config.max_body_size
        );
        listener->run();

        SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE,
                            "internal", "Origin started");

        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener](beast::error_code const&, int) {
                SecurityLogger::log(SecurityLogger::Level::INFO, SecurityLogger::EventType::LIFECYCLE,
                                    "internal", "Initiating graceful shutdown");
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
