#pragma once

#include <string>

#include "hasher.hpp"

namespace powshield {

// How the client fingerprint bound into every stamp is derived.
enum class ContextMode {
    USER_AGENT,
    IP_USER_AGENT
};

// Accepts "userAgent", "ip+userAgent" and "custom" (same as userAgent).
// Throws ConfigurationError otherwise.
ContextMode parse_context_mode(const std::string& name);
std::string context_mode_name(ContextMode mode);

// Inputs of one puzzle. Rebuilt for every request.
struct PuzzleChallenge {
    std::string endpoint;
    long long timestamp = 0;
    std::string context;
};

// What the solver hands back and the edge consumes.
struct PuzzleProof {
    std::string timestamp;
    std::string nonce;
    std::string context;
    std::string stamp;

    // Replay cache key.
    std::string replay_key() const { return timestamp + ":" + nonce; }
};

class ContextGenerator {
public:
    static std::string generate(const std::string& user_agent, const std::string& ip, ContextMode mode) {
        if (mode == ContextMode::IP_USER_AGENT) {
            return Hasher::digest(ip + ":" + user_agent);
        }
        return Hasher::digest(user_agent);
    }
};

}
