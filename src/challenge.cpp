#include "challenge.hpp"
#include "errors.hpp"

namespace powshield {

ContextMode parse_context_mode(const std::string& name) {
    // "custom" has no generator of its own and hashes the user agent.
    if (name == "userAgent" || name == "custom") return ContextMode::USER_AGENT;
    if (name == "ip+userAgent") return ContextMode::IP_USER_AGENT;
    throw ConfigurationError("unknown context generator '" + name + "' (expected userAgent, ip+userAgent or custom)");
}

std::string context_mode_name(ContextMode mode) {
    return mode == ContextMode::IP_USER_AGENT ? "ip+userAgent" : "userAgent";
}

}
