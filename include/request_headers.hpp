#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>
#include <string>

namespace powshield {

// Transport field names. Lookups are case-insensitive.
namespace header {
inline constexpr const char* TIMESTAMP = "X-Timestamp";
inline constexpr const char* NONCE = "X-Nonce";
inline constexpr const char* CONTEXT = "X-Context";
inline constexpr const char* STAMP = "X-Stamp";
inline constexpr const char* HMAC = "X-HMAC";
}

struct HeaderNameLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) <
                       std::tolower(static_cast<unsigned char>(y));
            });
    }
};

// Framework-neutral header set handed to the decision functions.
using HeaderMap = std::map<std::string, std::string, HeaderNameLess>;

// Empty values are reported as absent.
inline std::optional<std::string> find_header(const HeaderMap& headers, const std::string& name) {
    auto it = headers.find(name);
    if (it == headers.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

}
