#include "ocid/codec/base64.hpp"

#include <cstddef>

namespace ocid::codec {
    namespace {
        constexpr u32 kLowSixBits = 0x3fu;
    } // namespace

    ocid::core::Status base64_encode(ocid::core::BufferView in, char* out, u32 out_cap, u32* written) noexcept {
        if (written == nullptr) {
            return ocid::core::make_status(ocid::core::StatusDomain::Codec, ocid::core::StatusCode::Invalid);
        }
        *written = 0;
        if (!ocid::core::buffer_ok(in)) {
            return ocid::core::make_status(ocid::core::StatusDomain::Codec, ocid::core::StatusCode::Invalid);
        }

        const u32 need = base64_encoded_len(in.len);
        if (need > 0 && (out == nullptr || out_cap < need)) {
            return ocid::core::make_status(ocid::core::StatusDomain::Codec, ocid::core::StatusCode::Invalid, need);
        }

        u32 acc = 0;
        u32 bits = 0;
        u32 pos = 0;
        for (u32 i = 0; i < in.len; ++i) {
            acc = (acc << 8) | in.data[i];
            bits += 8;
            while (bits >= 6) {
                bits -= 6;
                out[pos++] = kBase64Alphabet[(acc >> bits) & kLowSixBits];
            }
            acc &= (1u << bits) - 1u;
        }

        // Pad the final group with zero bits.
        if (bits > 0) {
            out[pos++] = kBase64Alphabet[(acc << (6 - bits)) & kLowSixBits];
        }

        *written = pos;
        return ocid::core::ok_status();
    }

    ocid::core::DecodeError base64_decode(std::string_view in, ocid::core::BufferMut out) noexcept {
        for (size_t i = 0; i < in.size(); ++i) {
            if (base64_value(in[i]) == kBase64Invalid) {
                return ocid::core::invalid_character(static_cast<u32>(i));
            }
        }

        const u32 decoded = base64_decoded_len(in.size());
        if (in.size() != base64_encoded_len(out.len)) {
            return ocid::core::length_mismatch(out.len, decoded);
        }
        if (!ocid::core::buffer_ok(out)) {
            return ocid::core::length_mismatch(out.len, 0);
        }

        // Reject non-canonical tails so that text and bytes stay one-to-one.
        const u32 spare_bits = static_cast<u32>((static_cast<u64>(in.size()) * 6u) % 8u);
        if (spare_bits > 0) {
            const u32 last = base64_value(in.back());
            if ((last & ((1u << spare_bits) - 1u)) != 0) {
                return ocid::core::invalid_character(static_cast<u32>(in.size() - 1));
            }
        }

        u32 acc = 0;
        u32 bits = 0;
        u32 pos = 0;
        for (size_t i = 0; i < in.size() && pos < out.len; ++i) {
            acc = (acc << 6) | base64_value(in[i]);
            bits += 6;
            if (bits >= 8) {
                bits -= 8;
                out.data[pos++] = static_cast<u8>((acc >> bits) & 0xffu);
            }
            acc &= (1u << bits) - 1u;
        }

        return ocid::core::decode_ok();
    }
} // namespace ocid::codec
