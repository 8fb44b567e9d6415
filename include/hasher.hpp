#pragma once

#include <string>

namespace powshield {

enum class HashAlgorithm {
    SHA256,
    SHA512
};

// Parses "sha256" / "sha512". Throws ConfigurationError for anything else.
HashAlgorithm parse_hash_algorithm(const std::string& name);
std::string hash_algorithm_name(HashAlgorithm algorithm);

// Stateless digest, MAC and randomness primitives backed by OpenSSL.
// All outputs are lowercase hex.
class Hasher {
public:
    static constexpr size_t TOKEN_BYTES = 16;

    static std::string digest(const std::string& data, HashAlgorithm algorithm = HashAlgorithm::SHA256);

    static std::string mac(const std::string& data, const std::string& key,
                           HashAlgorithm algorithm = HashAlgorithm::SHA256);

    // 32 hex characters drawn from the OpenSSL CSPRNG.
    static std::string random_token();

    // Length check followed by CRYPTO_memcmp, so equal-length inputs take the same time.
    static bool constant_time_equals(const std::string& a, const std::string& b);

    static std::string to_hex(const unsigned char* data, size_t len);
};

}
