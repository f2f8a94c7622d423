#pragma once
#include <stdexcept>
#include <string>

struct RfqError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed wire payload. The message is dropped, the listener keeps running.
struct CodecError : RfqError {
    using RfqError::RfqError;
};

struct PricingError : RfqError {
    enum class Kind {
        MissingSourcePrice,
        NoSourceToken
    };

    PricingError(Kind k, const std::string& what)
        : RfqError(what), kind(k) {}

    Kind kind;
};

// Transient: no relay peer reachable while subscribing. Retried, never surfaced.
struct SubscribeError : RfqError {
    using RfqError::RfqError;
};

struct TransportError : RfqError {
    using RfqError::RfqError;
};

// No response arrived within the caller's timeout
struct TimeoutError : RfqError {
    using RfqError::RfqError;
};

struct ConfigError : RfqError {
    using RfqError::RfqError;
};

struct IdentityError : RfqError {
    using RfqError::RfqError;
};
