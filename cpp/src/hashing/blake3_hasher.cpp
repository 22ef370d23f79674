#include "ocid/hashing/hashing.hpp"

#include <cstddef>

#include <blake3.h>

namespace ocid::hashing {
    static_assert(BLAKE3_OUT_LEN == ocid::core::kContentIdBytes);

    ocid::core::Status Blake3Hasher::digest(BufferView data, ocid::core::ContentId* out) noexcept {
        if (out == nullptr) {
            return ocid::core::make_status(ocid::core::StatusDomain::Hashing, ocid::core::StatusCode::Invalid);
        }
        if (!ocid::core::buffer_ok(data)) {
            return ocid::core::make_status(ocid::core::StatusDomain::Hashing, ocid::core::StatusCode::Invalid);
        }

        blake3_hasher hasher;
        blake3_hasher_init(&hasher);

        if (data.len > 0) {
            blake3_hasher_update(&hasher, data.data, static_cast<size_t>(data.len));
        }

        blake3_hasher_finalize(&hasher, out->b.data(), out->b.size());
        return ocid::core::ok_status();
    }

    ocid::core::Status content_id_from_content(BufferView content, ocid::core::ContentId* out) noexcept {
        Blake3Hasher hasher;
        return content_id_from_content(hasher, content, out);
    }
} // namespace ocid::hashing
