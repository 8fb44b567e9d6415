#include "config_loader.hpp"
#include "errors.hpp"
#include "input_validator.hpp"
#include "pow_verifier.hpp"

#include <boost/json.hpp>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace json = boost::json;

namespace powshield {

namespace {

void read_string(const json::object& obj, const char* key, std::string& out) {
    if (const json::value* v = obj.if_contains(key)) {
        if (!v->is_string()) throw ConfigurationError(std::string("'") + key + "' must be a string");
        out = std::string(v->as_string());
    }
}

void read_bool(const json::object& obj, const char* key, bool& out) {
    if (const json::value* v = obj.if_contains(key)) {
        if (!v->is_bool()) throw ConfigurationError(std::string("'") + key + "' must be a boolean");
        out = v->as_bool();
    }
}

long long as_integer(const json::value& v, const char* key) {
    if (v.is_int64()) return v.as_int64();
    if (v.is_uint64() && v.as_uint64() <= static_cast<uint64_t>(std::numeric_limits<long long>::max())) {
        return static_cast<long long>(v.as_uint64());
    }
    throw ConfigurationError(std::string("'") + key + "' must be an integer");
}

template<class Int>
void read_int(const json::object& obj, const char* key, Int& out) {
    if (const json::value* v = obj.if_contains(key)) {
        long long raw = as_integer(*v, key);
        if (raw < static_cast<long long>(std::numeric_limits<Int>::min()) ||
            (raw > 0 && static_cast<unsigned long long>(raw) >
                            static_cast<unsigned long long>(std::numeric_limits<Int>::max()))) {
            throw ConfigurationError(std::string("'") + key + "' is out of range");
        }
        out = static_cast<Int>(raw);
    }
}

const json::object* section(const json::object& obj, const char* key) {
    const json::value* v = obj.if_contains(key);
    if (!v) return nullptr;
    if (!v->is_object()) throw ConfigurationError(std::string("'") + key + "' must be an object");
    return &v->as_object();
}

void apply_edge_section(const json::object& edge, ShieldConfig& config) {
    read_bool(edge, "rateLimiting", config.rate_limiting);
    read_int(edge, "requestsPerMinute", config.requests_per_minute);
    read_string(edge, "clientIpHeader", config.client_ip_header);
    read_string(edge, "replayBackend", config.replay_backend);
    read_string(edge, "redisUrl", config.redis_url);
    read_string(edge, "adminToken", config.admin_token);
    read_int(edge, "port", config.edge_port);
    read_string(edge, "originHost", config.origin_host);
    read_int(edge, "originPort", config.origin_port);
    read_int(edge, "upstreamTimeout", config.upstream_timeout_sec);
}

}

ShieldConfig parse_config(const std::string& json_text) {
    json::value root;
    try {
        root = InputValidator::safe_parse_json(json_text);
    } catch (const std::exception& e) {
        throw ConfigurationError(std::string("invalid JSON: ") + e.what());
    }
    if (!root.is_object()) throw ConfigurationError("top-level JSON value must be an object");
    const json::object& obj = root.as_object();

    ShieldConfig config;

    if (const json::value* v = obj.if_contains("endpoints")) {
        if (!v->is_array()) throw ConfigurationError("'endpoints' must be an array of strings");
        config.endpoints.clear();
        for (const auto& e : v->as_array()) {
            if (!e.is_string()) throw ConfigurationError("'endpoints' must be an array of strings");
            config.endpoints.emplace_back(e.as_string());
        }
    }

    read_string(obj, "secret", config.secret);
    read_int(obj, "difficulty", config.difficulty);
    read_int(obj, "timestampTolerance", config.timestamp_tolerance_sec);
    read_int(obj, "cacheSize", config.cache_size);
    read_string(obj, "address", config.address);
    read_int(obj, "threads", config.thread_count);
    read_int(obj, "maxBodySize", config.max_body_size);

    std::string mode;
    read_string(obj, "contextGenerator", mode);
    if (!mode.empty()) config.context_mode = parse_context_mode(mode);

    std::string algorithm;
    read_string(obj, "hmacAlgorithm", algorithm);
    if (!algorithm.empty()) config.hmac_algorithm = parse_hash_algorithm(algorithm);

    if (const json::object* client = section(obj, "client")) {
        read_int(*client, "maxRetries", config.max_retries);
    }

    // "cloudflare" is accepted as the legacy name of the edge section.
    if (const json::object* edge = section(obj, "cloudflare")) apply_edge_section(*edge, config);
    if (const json::object* edge = section(obj, "edge")) apply_edge_section(*edge, config);

    for (const char* name : {"server", "origin"}) {
        if (const json::object* origin = section(obj, name)) {
            read_bool(*origin, "strictMode", config.strict_mode);
            read_int(*origin, "port", config.origin_port);
        }
    }

    return config;
}

ShieldConfig load_config_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ConfigurationError("cannot open config file " + path);
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_config(ss.str());
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::string item;
    std::stringstream ss(value);
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        auto last = item.find_last_not_of(" \t");
        if (first == std::string::npos) continue;
        out.push_back(item.substr(first, last - first + 1));
    }
    return out;
}

void apply_env_overrides(ShieldConfig& config) {
    auto to_int = [](const char* name, const char* value) {
        try {
            size_t pos = 0;
            int parsed = std::stoi(value, &pos);
            if (value[pos] != '\0') throw std::invalid_argument(name);
            return parsed;
        } catch (const std::exception&) {
            throw ConfigurationError(std::string(name) + " must be an integer");
        }
    };
    auto to_bool = [](const char* value) {
        std::string v(value);
        return v == "1" || v == "true" || v == "yes" || v == "on";
    };

    if (const char* e = std::getenv("POWSHIELD_ENDPOINTS")) config.endpoints = split_list(e);
    if (const char* e = std::getenv("POWSHIELD_SECRET")) config.secret = e;
    if (const char* e = std::getenv("POWSHIELD_DIFFICULTY")) config.difficulty = to_int("POWSHIELD_DIFFICULTY", e);
    if (const char* e = std::getenv("POWSHIELD_TOLERANCE")) config.timestamp_tolerance_sec = to_int("POWSHIELD_TOLERANCE", e);
    if (const char* e = std::getenv("POWSHIELD_CACHE_SIZE")) {
        int size = to_int("POWSHIELD_CACHE_SIZE", e);
        if (size < 0) throw ConfigurationError("POWSHIELD_CACHE_SIZE must not be negative");
        config.cache_size = static_cast<size_t>(size);
    }
    if (const char* e = std::getenv("POWSHIELD_CONTEXT")) config.context_mode = parse_context_mode(e);
    if (const char* e = std::getenv("POWSHIELD_HMAC_ALGORITHM")) config.hmac_algorithm = parse_hash_algorithm(e);
    if (const char* e = std::getenv("POWSHIELD_MAX_RETRIES")) config.max_retries = to_int("POWSHIELD_MAX_RETRIES", e);
    if (const char* e = std::getenv("POWSHIELD_RATE_LIMITING")) config.rate_limiting = to_bool(e);
    if (const char* e = std::getenv("POWSHIELD_RPM")) config.requests_per_minute = to_int("POWSHIELD_RPM", e);
    if (const char* e = std::getenv("POWSHIELD_CLIENT_IP_HEADER")) config.client_ip_header = e;
    if (const char* e = std::getenv("POWSHIELD_REPLAY_BACKEND")) config.replay_backend = e;
    if (const char* e = std::getenv("POWSHIELD_REDIS_URL")) config.redis_url = e;
    if (const char* e = std::getenv("POWSHIELD_ADMIN_TOKEN")) config.admin_token = e;
    if (const char* e = std::getenv("POWSHIELD_STRICT_MODE")) config.strict_mode = to_bool(e);
    if (const char* e = std::getenv("POWSHIELD_ADDR")) config.address = e;
    if (const char* e = std::getenv("POWSHIELD_EDGE_PORT")) config.edge_port = static_cast<uint16_t>(to_int("POWSHIELD_EDGE_PORT", e));
    if (const char* e = std::getenv("POWSHIELD_ORIGIN_HOST")) config.origin_host = e;
    if (const char* e = std::getenv("POWSHIELD_ORIGIN_PORT")) config.origin_port = static_cast<uint16_t>(to_int("POWSHIELD_ORIGIN_PORT", e));
}

void validate_config(const ShieldConfig& config, ConfigRole role) {
    if (config.endpoints.empty()) {
        throw ConfigurationError("PoW Shield requires at least one endpoint to protect");
    }
    if (role != ConfigRole::CLIENT && config.secret.empty()) {
        throw ConfigurationError("PoW Shield requires a shared secret for HMAC generation");
    }
    if (config.difficulty < 0 || config.difficulty > DifficultyChecker::MAX_DIFFICULTY) {
        throw ConfigurationError("difficulty must be between 0 and " +
                                 std::to_string(DifficultyChecker::MAX_DIFFICULTY));
    }
    if (config.timestamp_tolerance_sec <= 0) {
        throw ConfigurationError("timestampTolerance must be positive");
    }
    if (config.thread_count < 0) {
        throw ConfigurationError("threads must not be negative");
    }
    if (role == ConfigRole::CLIENT && config.max_retries <= 0) {
        throw ConfigurationError("client.maxRetries must be positive");
    }
    if (role == ConfigRole::EDGE) {
        if (config.cache_size == 0) throw ConfigurationError("cacheSize must be positive");
        if (config.rate_limiting && config.requests_per_minute <= 0) {
            throw ConfigurationError("requestsPerMinute must be positive when rate limiting is enabled");
        }
        if (config.replay_backend != "memory" && config.replay_backend != "redis") {
            throw ConfigurationError("replayBackend must be 'memory' or 'redis'");
        }
    }
}

}
