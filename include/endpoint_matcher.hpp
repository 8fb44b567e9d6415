#pragma once

#include <string>
#include <vector>

namespace powshield {

class EndpointMatcher {
public:
    static constexpr char WILDCARD = '*';

    explicit EndpointMatcher(std::vector<std::string> patterns)
        : patterns_(std::move(patterns)) {}

    // Exact match, or prefix match for patterns ending in '*'.
    bool is_protected(const std::string& path) const {
        for (const auto& pattern : patterns_) {
            if (path == pattern) return true;
            if (!pattern.empty() && pattern.back() == WILDCARD) {
                const size_t prefix_len = pattern.size() - 1;
                if (path.size() >= prefix_len && path.compare(0, prefix_len, pattern, 0, prefix_len) == 0) {
                    return true;
                }
            }
        }
        return false;
    }

    const std::vector<std::string>& patterns() const { return patterns_; }

    // Strips the query string and fragment from a request target.
    static std::string request_path(const std::string& target) {
        auto pos = target.find_first_of("?#");
        return pos == std::string::npos ? target : target.substr(0, pos);
    }

private:
    std::vector<std::string> patterns_;
};

}
