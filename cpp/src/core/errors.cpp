#include "ocid/core/errors.hpp"

namespace ocid::core {
    const char* status_code_name(StatusCode code) noexcept {
        switch (code) {
            case StatusCode::Ok: return "Ok";
            case StatusCode::Unknown: return "Unknown";
            case StatusCode::Invalid: return "Invalid";
            case StatusCode::NotFound: return "NotFound";
            case StatusCode::Corrupt: return "Corrupt";
            case StatusCode::Io: return "Io";
            case StatusCode::Crypto: return "Crypto";
            case StatusCode::Unsupported: return "Unsupported";
            case StatusCode::Unavailable: return "Unavailable";
        }
        return "Unknown";
    }

    const char* status_domain_name(StatusDomain domain) noexcept {
        switch (domain) {
            case StatusDomain::Core: return "Core";
            case StatusDomain::Codec: return "Codec";
            case StatusDomain::Hashing: return "Hashing";
            case StatusDomain::Entropy: return "Entropy";
            case StatusDomain::Cli: return "Cli";
            case StatusDomain::External: return "External";
        }
        return "Unknown";
    }

    const char* decode_error_kind_name(DecodeErrorKind kind) noexcept {
        switch (kind) {
            case DecodeErrorKind::None: return "None";
            case DecodeErrorKind::LengthMismatch: return "LengthMismatch";
            case DecodeErrorKind::InvalidCharacter: return "InvalidCharacter";
        }
        return "Unknown";
    }
} // namespace ocid::core
