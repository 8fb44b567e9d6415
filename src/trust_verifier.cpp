#include "trust_verifier.hpp"
#include "config_loader.hpp"
#include "hasher.hpp"
#include "metrics.hpp"
#include "security_logger.hpp"

namespace powshield {

TrustVerifier::TrustVerifier(const ShieldConfig& config)
    : config_(config)
    , matcher_(config.endpoints)
{
    validate_config(config_, ConfigRole::ORIGIN);
}

Decision TrustVerifier::verify(const std::string& path, const HeaderMap& headers,
                               const std::string& remote_addr) const {
    if (!matcher_.is_protected(path)) {
        return Decision::pass();
    }

    auto signature = find_header(headers, header::HMAC);
    if (!signature) {
        if (config_.strict_mode) {
            return reject(403, RejectReason::MISSING_SIGNATURE, "Missing HMAC signature", remote_addr);
        }
        // Staged rollout: unsigned traffic is admitted unchecked.
        MetricsRegistry::instance().increment_counter("origin_unsigned_admitted_total");
        return Decision::proceed();
    }

    auto timestamp = find_header(headers, header::TIMESTAMP);
    auto nonce = find_header(headers, header::NONCE);
    auto context = find_header(headers, header::CONTEXT);
    auto stamp = find_header(headers, header::STAMP);
    if (!timestamp || !nonce || !context || !stamp) {
        return reject(400, RejectReason::MISSING_HEADERS, "Missing required headers", remote_addr);
    }

    std::string expected = Hasher::mac(*timestamp + ":" + *nonce + ":" + *context,
                                       config_.secret, config_.hmac_algorithm);
    if (!Hasher::constant_time_equals(expected, *signature)) {
        return reject(403, RejectReason::INVALID_SIGNATURE, "Invalid HMAC signature", remote_addr);
    }

    MetricsRegistry::instance().increment_counter("origin_admitted_total");
    return Decision::proceed(*signature);
}

Decision TrustVerifier::reject(int status, RejectReason reason, const std::string& body,
                               const std::string& remote_addr) const {
    auto event = status == 400 ? SecurityLogger::EventType::MALFORMED_REQUEST
                               : SecurityLogger::EventType::SIGNATURE_FAILURE;
    SecurityLogger::log(SecurityLogger::Level::WARNING, event, remote_addr, body);
    MetricsRegistry::instance().increment_labeled("origin_rejected_total", "reason", reject_reason_name(reason));
    return Decision::reject(status, reason, body);
}

}
