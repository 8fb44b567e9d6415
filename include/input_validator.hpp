#pragma once

#include <string>
#include <cctype>
#include <algorithm>
#include <charconv>
#include <optional>
#include <boost/json.hpp>

namespace powshield {

// Format checks for untrusted header values and configuration documents.
class InputValidator {
public:
    // Validates that a string is a correctly formatted hexadecimal sequence.
    static bool is_valid_hex(const std::string& str, size_t expected_length = 0) {
        if (str.empty()) return false;
        if (expected_length > 0 && str.length() != expected_length) return false;
        
        return std::all_of(str.begin(), str.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c));
        });
    }
    
    // Checks for a valid SHA256 hex hash (64 characters).
    static bool is_valid_hash(const std::string& hash) {
        return is_valid_hex(hash, 64);
    }

    /**
     * Parses a decimal integer timestamp. The whole string must be consumed,
     * so "12abc" and "" are rejected rather than truncated.
     */
    static std::optional<long long> parse_timestamp(const std::string& str) {
        if (str.empty() || str.size() > 20) return std::nullopt;
        long long value = 0;
        const char* first = str.data();
        const char* last = str.data() + str.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last) return std::nullopt;
        return value;
    }

    /**
     * JSON parsing with recursion depth limits to prevent stack-exhaustion (DoS).
     */
    static boost::json::value safe_parse_json(const std::string& input) {
        boost::json::parse_options opt;
        opt.max_depth = 16; 
        return boost::json::parse(input, {}, opt);
    }
};

}
