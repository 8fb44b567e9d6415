#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <exception>

#include "hasher.hpp"

namespace powshield {

// Logs admission decisions using blinded IP identifiers (salted hash).
class SecurityLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };
    
    enum class EventType {
        PROOF_ACCEPTED,
        MALFORMED_REQUEST,
        STALE_TIMESTAMP,
        REPLAY_ATTEMPT,
        POW_FAILURE,
        RATE_LIMIT_HIT,
        SIGNATURE_FAILURE,
        CONFIG_ERROR,
        BACKEND_ERROR,
        LIFECYCLE
    };
    
    /**
     * Records a security-relevant event with blinded identifiers.
     * @param level Severity level of the event.
     * @param event The specific type of security event.
     * @param remote_addr The source IP address (blinded before logging).
     * @param message Optional descriptive message (sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr, 
                   const std::string& message = "") {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        
        std::stringstream ss;
        ss << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S") << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] ";
        
        ss << "ip=" << blind(remote_addr, gmt);
        
        if (!message.empty()) {
            ss << " msg=\"" << sanitize_log_message(message) << "\"";
        }
        
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::PROOF_ACCEPTED: return "PROOF_ACCEPTED";
            case EventType::MALFORMED_REQUEST: return "MALFORMED";
            case EventType::STALE_TIMESTAMP: return "STALE_TIMESTAMP";
            case EventType::REPLAY_ATTEMPT: return "REPLAY_ATTEMPT";
            case EventType::POW_FAILURE: return "POW_FAILURE";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::SIGNATURE_FAILURE: return "SIGNATURE_FAILURE";
            case EventType::CONFIG_ERROR: return "CONFIG_ERROR";
            case EventType::BACKEND_ERROR: return "BACKEND_ERROR";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }
    
private:
    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static constexpr auto SALT_LIFETIME = std::chrono::hours(6);
    static constexpr size_t ALIAS_HEX_CHARS = 12;

    // Salted SHA-256 prefix of the address. A fresh salt every SALT_LIFETIME
    // unlinks aliases logged before the rotation from those logged after it.
    static std::string blind(const std::string& remote_addr, const struct tm& gmt) {
        if (remote_addr == "unknown" || remote_addr == "internal") return remote_addr;

        static std::mutex salt_mutex;
        static std::string salt;
        static std::chrono::steady_clock::time_point rotated_at;

        std::string current_salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now = std::chrono::steady_clock::now();
            if (salt.empty() || now - rotated_at >= SALT_LIFETIME) {
                try {
                    salt = Hasher::random_token() + Hasher::random_token();
                } catch (const std::exception& e) {
                    // Without a salt the address cannot be blinded.
                    std::cerr << "[CRITICAL] " << e.what() << " while rotating the log salt\n";
                    std::terminate();
                }
                rotated_at = now;
                std::cout << "[" << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S")
                          << " UTC] [INFO] [LIFECYCLE] ip=internal msg=\"IP blinding salt rotated\"\n";
            }
            current_salt = salt;
        }

        return "anon_" + Hasher::digest(remote_addr + current_salt).substr(0, ALIAS_HEX_CHARS);
    }
};

}
