#pragma once

#include "ocid/core/buffer.hpp"
#include "ocid/core/content_id.hpp"
#include "ocid/core/errors.hpp"

#if defined(OCID_HAVE_BLAKE3)

namespace ocid::hashing {
    using BufferView = ocid::core::BufferView;

    // BLAKE3 over the whole buffer in one pass.
    struct Blake3Hasher {
        ocid::core::Status digest(BufferView data, ocid::core::ContentId* out) noexcept;
    };

    // Hasher requirement:
    //   ocid::core::Status H::digest(BufferView data, ocid::core::ContentId* out) noexcept
    // writing exactly kContentIdBytes bytes. Its failures are returned unchanged.
    template <typename Hasher>
    ocid::core::Status content_id_from_content(Hasher& hasher, BufferView content, ocid::core::ContentId* out) noexcept {
        if (out == nullptr) {
            return ocid::core::make_status(ocid::core::StatusDomain::Hashing, ocid::core::StatusCode::Invalid);
        }
        ocid::core::ContentId id{};
        const ocid::core::Status s = hasher.digest(content, &id);
        if (!ocid::core::is_ok(s)) {
            return s;
        }
        *out = id;
        return ocid::core::ok_status();
    }

    ocid::core::Status content_id_from_content(BufferView content, ocid::core::ContentId* out) noexcept;

} // namespace ocid::hashing

#endif // OCID_HAVE_BLAKE3
