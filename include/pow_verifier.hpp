#pragma once

#include <string>

#include "hasher.hpp"

namespace powshield {

// Leading-zero-bit test shared by the solver and the edge validator.
class DifficultyChecker {
public:
    // Largest target that a SHA-256 stamp (64 hex chars) can ever satisfy.
    static constexpr int MAX_DIFFICULTY = 256;

    /**
     * Treats the digest as a bit string built from its hex nibbles and checks
     * that the first difficulty_bits bits are zero.
     * A zero target always passes, a target longer than the digest never does.
     * A non-hex character counts as a set nibble.
     */
    static bool satisfies(const std::string& hex_digest, int difficulty_bits) {
        if (difficulty_bits <= 0) return true;
        if (static_cast<size_t>(difficulty_bits) > hex_digest.size() * 4) return false;

        const size_t full_nibbles = static_cast<size_t>(difficulty_bits) / 4;
        const int remaining_bits = difficulty_bits % 4;

        for (size_t i = 0; i < full_nibbles; ++i) {
            if (hex_digest[i] != '0') return false;
        }
        if (remaining_bits == 0) return true;

        int nibble = nibble_value(hex_digest[full_nibbles]);
        if (nibble < 0) return false;
        int mask = (0xF << (4 - remaining_bits)) & 0xF;
        return (nibble & mask) == 0;
    }

    static int leading_zero_bits(const std::string& hex_digest) {
        int bits = 0;
        for (char c : hex_digest) {
            int nibble = nibble_value(c);
            if (nibble < 0) break;
            if (nibble == 0) {
                bits += 4;
                continue;
            }
            for (int mask = 0x8; mask > 0 && (nibble & mask) == 0; mask >>= 1) ++bits;
            break;
        }
        return bits;
    }

private:
    static int nibble_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }
};

// Stamp construction and verification for a single puzzle.
// The stamp is always SHA-256, independent of the MAC algorithm.
class PoWVerifier {
public:
    static std::string stamp_input(const std::string& endpoint, const std::string& timestamp,
                                   const std::string& nonce, const std::string& context) {
        return endpoint + ":" + timestamp + ":" + nonce + ":" + context;
    }

    static std::string compute_stamp(const std::string& endpoint, const std::string& timestamp,
                                     const std::string& nonce, const std::string& context) {
        return Hasher::digest(stamp_input(endpoint, timestamp, nonce, context), HashAlgorithm::SHA256);
    }

    // Recomputes the stamp and compares it with the supplied one in constant time.
    static bool stamp_matches(const std::string& endpoint, const std::string& timestamp,
                              const std::string& nonce, const std::string& context,
                              const std::string& stamp) {
        return Hasher::constant_time_equals(compute_stamp(endpoint, timestamp, nonce, context), stamp);
    }

    /**
     * Full proof check used by tools and tests.
     * @param target_difficulty Required number of leading zero bits.
     */
    static bool verify(const std::string& endpoint, const std::string& timestamp,
                       const std::string& nonce, const std::string& context,
                       const std::string& stamp, int target_difficulty) {
        if (nonce.empty() || stamp.empty()) return false;
        if (!stamp_matches(endpoint, timestamp, nonce, context, stamp)) return false;
        return DifficultyChecker::satisfies(stamp, target_difficulty);
    }
};

}
