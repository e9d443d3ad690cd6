// FEEDROUTE - Registry Errors
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#ifndef FEEDROUTE_FEEDS_ERRORS_H
#define FEEDROUTE_FEEDS_ERRORS_H

#include <stdexcept>
#include <string>

namespace feedroute {
namespace feeds {

/// Reasons an operation is rejected. Every error aborts the whole operation.
enum class RegistryErrorCode {
    /// Parallel input sequences differ in length
    ArrayLengthMismatch,

    /// A calculated feed reports an identifier outside the calculated range
    InvalidCategory,

    /// Calculated feed already registered for the identifier
    AlreadyExists,

    /// Identifier or index not registered
    NotFound,

    /// Alias change maps an identifier onto itself
    SameIdentifier,

    /// Alias removal for an identifier that has no alias
    AliasNotFound,

    /// Calculated identifier with no registered backing feed
    CalculatedFeedNotSupported,

    /// Merkle proof does not reconstruct the published root
    InvalidProof,

    /// Caller may not mutate the registry
    Unauthorized,

    /// Forwarded payments exceed the value supplied with the call
    InsufficientValue,

    /// Arithmetic result does not fit its type
    ArithmeticOverflow,

    /// Feed name cannot be encoded into an identifier
    InvalidFeedName
};

/// Convert error code to string
const char* RegistryErrorCodeToString(RegistryErrorCode code);

/**
 * Exception thrown by registry operations.
 *
 * what() reads "<CodeName>: <detail>".
 */
class RegistryError : public std::runtime_error {
public:
    RegistryError(RegistryErrorCode code, const std::string& detail);

    RegistryErrorCode code() const noexcept { return code_; }
    const std::string& detail() const noexcept { return detail_; }

private:
    RegistryErrorCode code_;
    std::string detail_;
};

} // namespace feeds
} // namespace feedroute

#endif // FEEDROUTE_FEEDS_ERRORS_H
