#pragma once

#include <array>
#include <compare>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

#include "ocid/codec/base64.hpp"
#include "ocid/core/buffer.hpp"
#include "ocid/core/errors.hpp"
#include "ocid/core/types.hpp"

namespace ocid::core {

    inline constexpr u32 kContentIdBytes = 32;
    inline constexpr u32 kContentIdTextLen = ocid::codec::base64_encoded_len(kContentIdBytes);
    static_assert(kContentIdTextLen == 43);

    // Content ID: the 32-byte BLAKE3 digest of a package, manifest or blob, or
    // 32 random bytes. Every 32-byte pattern is a valid id. The bytes are the
    // wire and storage format; there is no version or length prefix.
    struct ContentId {
        std::array<u8, kContentIdBytes> b{};

        friend constexpr bool operator==(const ContentId&, const ContentId&) noexcept = default;
        friend constexpr auto operator<=>(const ContentId&, const ContentId&) noexcept = default;
    };
    static_assert(sizeof(ContentId) == kContentIdBytes);
    static_assert(alignof(ContentId) == 1);
    static_assert(std::is_trivially_copyable_v<ContentId>);
    static_assert(std::is_standard_layout_v<ContentId>);

    // Stack buffer for the text form; holds the characters and a NUL.
    struct ContentIdText {
        char c[kContentIdTextLen + 1]{};

        [[nodiscard]] std::string_view view() const noexcept {
            return std::string_view(c, kContentIdTextLen);
        }
    };
    static_assert(std::is_trivially_copyable_v<ContentIdText>);

    [[nodiscard]] constexpr bool content_id_is_zero(const ContentId& id) noexcept {
        for (u8 v : id.b) {
            if (v != 0) {
                return false;
            }
        }
        return true;
    }

    [[nodiscard]] inline BufferView content_id_as_bytes(const ContentId& id) noexcept {
        return BufferView{id.b.data(), kContentIdBytes};
    }

    // View over `count` ids laid out back to back.
    [[nodiscard]] BufferView content_ids_as_bytes(const ContentId* ids, u32 count) noexcept;

    // Exactly kContentIdBytes bytes, copied verbatim.
    [[nodiscard]] DecodeError content_id_from_bytes(BufferView in, ContentId* out) noexcept;

    // Reads the first kContentIdBytes bytes of `in`; `rest` (optional) receives what follows.
    [[nodiscard]] DecodeError content_id_from_prefix(BufferView in, ContentId* out, BufferView* rest) noexcept;

    // Writes the kContentIdTextLen-character text form without allocating.
    Status content_id_encode_text(const ContentId& id, ContentIdText* out) noexcept;

    [[nodiscard]] std::string content_id_to_text(const ContentId& id);

    [[nodiscard]] DecodeError content_id_from_text(std::string_view text, ContentId* out) noexcept;

    // FNV-1a over the payload. Stable across runs and builds; for container
    // placement only.
    [[nodiscard]] constexpr u64 content_id_hash(const ContentId& id) noexcept {
        u64 h = 14695981039346656037ull;
        for (u8 v : id.b) {
            h ^= static_cast<u64>(v);
            h *= 1099511628211ull;
        }
        return h;
    }

} // namespace ocid::core

template <>
struct std::hash<ocid::core::ContentId> {
    std::size_t operator()(const ocid::core::ContentId& id) const noexcept {
        return static_cast<std::size_t>(ocid::core::content_id_hash(id));
    }
};
