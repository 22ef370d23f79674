#pragma once
#include <cstdint>
#include <type_traits>

namespace ocid::core {
    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        NotFound,
        Corrupt,
        Io,
        Crypto,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Codec,
        Hashing,
        Entropy,
        Cli,
        External,
    };

    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // Decode failures carry their own data instead of folding it into Status::aux.
    enum class DecodeErrorKind : u8 {
        None = 0,
        LengthMismatch = 1,
        InvalidCharacter = 2,
    };

    struct DecodeError {
        DecodeErrorKind kind{DecodeErrorKind::None};
        u32 expected{0};  // LengthMismatch: required byte count
        u32 actual{0};    // LengthMismatch: byte count that was supplied or decoded
        u32 position{0};  // InvalidCharacter: index of the offending character

        friend constexpr bool operator==(DecodeError, DecodeError) noexcept = default;
    };

    [[nodiscard]] constexpr DecodeError decode_ok() noexcept {
        return DecodeError{};
    }

    [[nodiscard]] constexpr DecodeError length_mismatch(u32 expected, u32 actual) noexcept {
        return DecodeError{DecodeErrorKind::LengthMismatch, expected, actual, 0};
    }

    [[nodiscard]] constexpr DecodeError invalid_character(u32 position) noexcept {
        return DecodeError{DecodeErrorKind::InvalidCharacter, 0, 0, position};
    }

    [[nodiscard]] constexpr bool is_ok(DecodeError e) noexcept {
        return e.kind == DecodeErrorKind::None;
    }

    // aux holds the character position for InvalidCharacter and the actual
    // length for LengthMismatch.
    [[nodiscard]] constexpr Status decode_status(DecodeError e) noexcept {
        switch (e.kind) {
            case DecodeErrorKind::None:
                return ok_status();
            case DecodeErrorKind::LengthMismatch:
                return make_status(StatusDomain::Codec, StatusCode::Invalid, e.actual);
            case DecodeErrorKind::InvalidCharacter:
                return make_status(StatusDomain::Codec, StatusCode::Invalid, e.position);
        }
        return make_status(StatusDomain::Codec, StatusCode::Unknown);
    }

    const char* status_code_name(StatusCode code) noexcept;
    const char* status_domain_name(StatusDomain domain) noexcept;
    const char* decode_error_kind_name(DecodeErrorKind kind) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
    static_assert(std::is_trivially_copyable_v<DecodeError>);
    static_assert(std::is_standard_layout_v<DecodeError>);
} // namespace ocid::core
