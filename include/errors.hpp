#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace powshield {

// Raised once at startup when the configuration cannot be used.
// Never raised while a request is being evaluated.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error("Configuration error: " + what) {}
};

// The solver ran out of attempts before finding a stamp at the requested difficulty.
class PuzzleExhaustedError : public std::runtime_error {
public:
    explicit PuzzleExhaustedError(int64_t attempts)
        : std::runtime_error("Failed to generate valid PoW after " + std::to_string(attempts) + " attempts")
        , attempts_(attempts) {}

    int64_t attempts() const { return attempts_; }

private:
    int64_t attempts_;
};

}
