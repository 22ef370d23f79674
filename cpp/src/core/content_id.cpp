#include "ocid/core/content_id.hpp"

#include <cstring>

namespace ocid::core {
    BufferView content_ids_as_bytes(const ContentId* ids, u32 count) noexcept {
        if (ids == nullptr || count == 0) {
            return BufferView{};
        }
        const u64 len = static_cast<u64>(count) * kContentIdBytes;
        if (len > 0xffffffffull) {
            return BufferView{};
        }
        return BufferView{ids->b.data(), static_cast<u32>(len)};
    }

    DecodeError content_id_from_bytes(BufferView in, ContentId* out) noexcept {
        if (!buffer_ok(in) || out == nullptr) {
            return length_mismatch(kContentIdBytes, 0);
        }
        if (in.len != kContentIdBytes) {
            return length_mismatch(kContentIdBytes, in.len);
        }

        std::memcpy(out->b.data(), in.data, kContentIdBytes);
        return decode_ok();
    }

    DecodeError content_id_from_prefix(BufferView in, ContentId* out, BufferView* rest) noexcept {
        if (!buffer_ok(in) || out == nullptr) {
            return length_mismatch(kContentIdBytes, 0);
        }
        if (in.len < kContentIdBytes) {
            return length_mismatch(kContentIdBytes, in.len);
        }

        std::memcpy(out->b.data(), in.data, kContentIdBytes);
        if (rest != nullptr) {
            *rest = BufferView{in.data + kContentIdBytes, in.len - kContentIdBytes};
        }
        return decode_ok();
    }

    Status content_id_encode_text(const ContentId& id, ContentIdText* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Codec, StatusCode::Invalid);
        }
        u32 written = 0;
        const Status s = ocid::codec::base64_encode(content_id_as_bytes(id), out->c, kContentIdTextLen, &written);
        if (!is_ok(s)) {
            out->c[0] = '\0';
            return s;
        }
        out->c[written] = '\0';
        return ok_status();
    }

    std::string content_id_to_text(const ContentId& id) {
        ContentIdText text{};
        if (!is_ok(content_id_encode_text(id, &text))) {
            return std::string{};
        }
        return std::string(text.view());
    }

    DecodeError content_id_from_text(std::string_view text, ContentId* out) noexcept {
        if (out == nullptr) {
            return length_mismatch(kContentIdBytes, 0);
        }

        // Decode into scratch so *out only changes on success.
        ContentId tmp{};
        const DecodeError e = ocid::codec::base64_decode(text, BufferMut{tmp.b.data(), kContentIdBytes});
        if (!is_ok(e)) {
            return e;
        }
        *out = tmp;
        return decode_ok();
    }
} // namespace ocid::core
