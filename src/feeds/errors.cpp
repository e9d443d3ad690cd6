// FEEDROUTE - Registry Errors Implementation
// Copyright (c) 2024 FEEDROUTE Developers
// MIT License

#include "feedroute/feeds/errors.h"

namespace feedroute {
namespace feeds {

const char* RegistryErrorCodeToString(RegistryErrorCode code) {
    switch (code) {
        case RegistryErrorCode::ArrayLengthMismatch:        return "ArrayLengthMismatch";
        case RegistryErrorCode::InvalidCategory:            return "InvalidCategory";
        case RegistryErrorCode::AlreadyExists:              return "AlreadyExists";
        case RegistryErrorCode::NotFound:                   return "NotFound";
        case RegistryErrorCode::SameIdentifier:             return "SameIdentifier";
        case RegistryErrorCode::AliasNotFound:              return "AliasNotFound";
        case RegistryErrorCode::CalculatedFeedNotSupported: return "CalculatedFeedNotSupported";
        case RegistryErrorCode::InvalidProof:               return "InvalidProof";
        case RegistryErrorCode::Unauthorized:               return "Unauthorized";
        case RegistryErrorCode::InsufficientValue:          return "InsufficientValue";
        case RegistryErrorCode::ArithmeticOverflow:         return "ArithmeticOverflow";
        case RegistryErrorCode::InvalidFeedName:            return "InvalidFeedName";
        default:                                            return "Unknown";
    }
}

RegistryError::RegistryError(RegistryErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(RegistryErrorCodeToString(code)) +
                         (detail.empty() ? "" : ": " + detail))
    , code_(code)
    , detail_(detail) {}

} // namespace feeds
} // namespace feedroute
