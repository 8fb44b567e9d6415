#include <chrono>
#include <iostream>
#include <string>

#include "config_loader.hpp"
#include "errors.hpp"
#include "pow_client.hpp"

using namespace powshield;

namespace {

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " --endpoint <path> [options]\n"
              << "Options:\n"
              << "  --config <file>        JSON configuration file\n"
              << "  --endpoint <path>      Path to solve for (required)\n"
              << "  --difficulty <bits>    Leading zero bits (default from config, 4)\n"
              << "  --max-retries <n>      Solver budget in slices of 100 attempts\n"
              << "  --user-agent <ua>      User agent hashed into the context\n"
              << "  --ip <addr>            Client IP for the ip+userAgent context mode\n"
              << "  --send <host:port>     Send a GET with the proof headers and print the response\n"
              << "  --help, -h             Show this help\n";
}

int parse_int(const std::string& flag, const std::string& value) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size()) throw std::invalid_argument(value);
        return parsed;
    } catch (const std::exception&) {
        throw ConfigurationError(flag + " expects an integer, got '" + value + "'");
    }
}

}

int main(int argc, char* argv[]) {
    try {
        std::string config_path;
        std::string endpoint;
        std::string difficulty_arg;
        std::string retries_arg;
        std::string user_agent = "powshield-solve/1.0";
        std::string ip;
        std::string send_to;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            }
            if (i + 1 >= argc) {
                std::cerr << "[!] Missing value for " << arg << "\n";
                return 1;
            }
            std::string value = argv[++i];
            if (arg == "--config") config_path = value;
            else if (arg == "--endpoint") endpoint = value;
            else if (arg == "--difficulty") difficulty_arg = value;
            else if (arg == "--max-retries") retries_arg = value;
            else if (arg == "--user-agent") user_agent = value;
            else if (arg == "--ip") ip = value;
            else if (arg == "--send") send_to = value;
            else {
                std::cerr << "[!] Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }

        if (endpoint.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        ShieldConfig config = config_path.empty() ? ShieldConfig{} : load_config_file(config_path);
        apply_env_overrides(config);
        if (!difficulty_arg.empty()) config.difficulty = parse_int("--difficulty", difficulty_arg);
        if (!retries_arg.empty()) config.max_retries = parse_int("--max-retries", retries_arg);
        // The solver only needs the target itself to be protected.
        if (config.endpoints.empty()) config.endpoints = {EndpointMatcher::request_path(endpoint)};

        PowClient client(config, user_agent, ip);
        const std::string path = EndpointMatcher::request_path(endpoint);

        std::cout << "[*] Starting PoW Solver..." << std::endl;
        std::cout << "[*] Endpoint: " << path << std::endl;
        std::cout << "[*] Context: " << client.context() << std::endl;
        std::cout << "[*] Difficulty: " << config.difficulty << " (leading zero bits)" << std::endl;

        PuzzleSolver solver(client.make_challenge(path), config.difficulty, config.max_retries);

        auto start = std::chrono::steady_clock::now();
        PuzzleProof proof;
        try {
            proof = solver.solve();
        } catch (const PuzzleExhaustedError& e) {
            std::cout << "[-] " << e.what() << std::endl;
            return 2;
        }
        auto end = std::chrono::steady_clock::now();
        auto diff = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();

        std::cout << "[+] SUCCESS after " << solver.attempts() << " attempts" << std::endl;
        for (const auto& [name, value] : PowClient::to_headers(proof)) {
            std::cout << name << ": " << value << std::endl;
        }
        std::cout << "[*] Time taken: " << diff << "ms" << std::endl;
        if (diff > 0) {
            std::cout << "[*] Hash rate: " << (static_cast<long long>(solver.attempts()) * 1000 / diff)
                      << " H/s" << std::endl;
        }

        if (!send_to.empty()) {
            auto colon = send_to.rfind(':');
            if (colon == std::string::npos || colon == 0) {
                throw ConfigurationError("--send expects host:port, got '" + send_to + "'");
            }
            http::request<http::string_body> req{http::verb::get, endpoint, 11};
            for (const auto& [name, value] : PowClient::to_headers(proof)) {
                req.set(name, value);
            }
            auto res = client.fetch(send_to.substr(0, colon), send_to.substr(colon + 1), std::move(req));
            std::cout << "[*] Response: " << res.result_int() << " " << res.reason() << "\n"
                      << res.body() << std::endl;
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
