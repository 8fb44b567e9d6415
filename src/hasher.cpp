#include "hasher.hpp"
#include "errors.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace powshield {

namespace {

const EVP_MD* evp_for(HashAlgorithm algorithm) {
    switch (algorithm) {
        case HashAlgorithm::SHA256: return EVP_sha256();
        case HashAlgorithm::SHA512: return EVP_sha512();
    }
    throw ConfigurationError("unsupported hash algorithm");
}

}

HashAlgorithm parse_hash_algorithm(const std::string& name) {
    if (name == "sha256") return HashAlgorithm::SHA256;
    if (name == "sha512") return HashAlgorithm::SHA512;
    throw ConfigurationError("unknown hash algorithm '" + name + "' (expected sha256 or sha512)");
}

std::string hash_algorithm_name(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::SHA512 ? "sha512" : "sha256";
}

std::string Hasher::digest(const std::string& data, HashAlgorithm algorithm) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_Digest(data.data(), data.size(), out, &out_len, evp_for(algorithm), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed");
    }
    return to_hex(out, out_len);
}

std::string Hasher::mac(const std::string& data, const std::string& key, HashAlgorithm algorithm) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    unsigned char* res = HMAC(evp_for(algorithm),
                              key.data(), static_cast<int>(key.size()),
                              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                              out, &out_len);
    if (res == nullptr) {
        throw std::runtime_error("HMAC computation failed");
    }
    return to_hex(out, out_len);
}

std::string Hasher::random_token() {
    unsigned char buffer[TOKEN_BYTES];
    if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
        throw std::runtime_error("CSPRNG failure: RAND_bytes did not return random data");
    }
    return to_hex(buffer, sizeof(buffer));
}

bool Hasher::constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string Hasher::to_hex(const unsigned char* data, size_t len) {
    std::stringstream ss;
    for (size_t i = 0; i < len; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return ss.str();
}

}
