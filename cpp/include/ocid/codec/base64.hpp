#pragma once

#include <string_view>

#include "ocid/core/buffer.hpp"
#include "ocid/core/errors.hpp"
#include "ocid/core/types.hpp"

// Unpadded Base64 over a URL-safe alphabet sorted by ASCII value:
//
//   0      '-'
//   1-10   '0'..'9'
//   11-36  'A'..'Z'
//   37     '_'
//   38-63  'a'..'z'
//
// Because the alphabet is sorted, encoded strings compare in the same order as
// the bytes they encode (for inputs of equal length).
namespace ocid::codec {
    using u8 = ocid::core::u8;
    using u32 = ocid::core::u32;
    using u64 = ocid::core::u64;

    inline constexpr char kBase64Alphabet[] =
        "-"
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "_"
        "abcdefghijklmnopqrstuvwxyz";
    static_assert(sizeof(kBase64Alphabet) - 1 == 64);

    [[nodiscard]] constexpr bool base64_alphabet_sorted() noexcept {
        for (u32 i = 0; i + 1 < sizeof(kBase64Alphabet) - 1; ++i) {
            if (!(kBase64Alphabet[i] < kBase64Alphabet[i + 1])) {
                return false;
            }
        }
        return true;
    }
    static_assert(base64_alphabet_sorted());

    inline constexpr u8 kBase64Invalid = 0xffu;

    [[nodiscard]] constexpr u8 base64_value(char c) noexcept {
        if (c == '-') {
            return 0;
        }
        if (c >= '0' && c <= '9') {
            return static_cast<u8>(1 + (c - '0'));
        }
        if (c >= 'A' && c <= 'Z') {
            return static_cast<u8>(11 + (c - 'A'));
        }
        if (c == '_') {
            return 37;
        }
        if (c >= 'a' && c <= 'z') {
            return static_cast<u8>(38 + (c - 'a'));
        }
        return kBase64Invalid;
    }

    [[nodiscard]] constexpr u32 base64_encoded_len(u32 bytes) noexcept {
        return static_cast<u32>((static_cast<u64>(bytes) * 8u + 5u) / 6u);
    }

    [[nodiscard]] constexpr u32 base64_decoded_len(u64 chars) noexcept {
        const u64 n = chars * 6u / 8u;
        return n > 0xffffffffull ? 0xffffffffu : static_cast<u32>(n);
    }

    // Writes base64_encoded_len(in.len) characters to out. No terminator.
    ocid::core::Status base64_encode(ocid::core::BufferView in, char* out, u32 out_cap, u32* written) noexcept;

    // Decodes exactly out.len bytes. Every character is checked against the
    // alphabet before the length, and the unused low bits of the final
    // character must be zero. out is untouched on failure.
    [[nodiscard]] ocid::core::DecodeError base64_decode(std::string_view in, ocid::core::BufferMut out) noexcept;

} // namespace ocid::codec
