#pragma once

#include <string>
#include <cstdint>
#include <vector>

#include "challenge.hpp"
#include "hasher.hpp"

namespace powshield {

// Which hop a configuration is validated for.
enum class ConfigRole {
    CLIENT,
    EDGE,
    ORIGIN
};

// Shared configuration for the client, the edge validator and the origin guard.
struct ShieldConfig {
    // --- Protection Policy ---
    std::vector<std::string> endpoints = {};  // Exact paths, or prefixes ending in '*'
    std::string secret = "";                  // Shared by edge and origin only
    int difficulty = 4;                       // Leading zero bits
    int timestamp_tolerance_sec = 30;
    size_t cache_size = 10000;                // Replay cache and rate counter capacity
    ContextMode context_mode = ContextMode::USER_AGENT;
    HashAlgorithm hmac_algorithm = HashAlgorithm::SHA256;

    // --- Client ---
    int max_retries = 5;  // Solver gives up after max_retries * 100 attempts

    // --- Edge ---
    bool rate_limiting = true;
    int requests_per_minute = 30;
    std::string client_ip_header = "";  // e.g. "X-Forwarded-For"; empty uses the socket peer
    std::string replay_backend = "memory";  // "memory" or "redis"
    std::string redis_url = "tcp://127.0.0.1:6379";
    std::string admin_token = "";  // Grants /metrics to non-local callers

    // --- Origin ---
    bool strict_mode = true;  // Reject protected requests without X-HMAC

    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t edge_port = 8080;
    std::string origin_host = "127.0.0.1";
    uint16_t origin_port = 8081;  // Edge forwards here, origin listens here
    int thread_count = 0;  // 0 defaults to hardware concurrency
    int upstream_timeout_sec = 30;
    size_t max_body_size = 1024 * 1024;  // 1MB
};

}
