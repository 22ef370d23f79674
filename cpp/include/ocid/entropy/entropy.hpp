#pragma once

#include "ocid/core/buffer.hpp"
#include "ocid/core/content_id.hpp"
#include "ocid/core/errors.hpp"

#if defined(OCID_HAVE_LIBSODIUM) || defined(OCID_HAVE_OPENSSL)

namespace ocid::entropy {
    using BufferMut = ocid::core::BufferMut;

    // Operating-system CSPRNG through libsodium, or OpenSSL when built without it.
    struct SystemEntropy {
        ocid::core::Status fill(BufferMut out) noexcept;
    };

    // Source requirement:
    //   ocid::core::Status S::fill(BufferMut out) noexcept
    // filling all of out.len bytes or failing. The source is used exclusively
    // for the duration of the call; a failure is returned as-is and *out keeps
    // its previous value.
    template <typename Source>
    ocid::core::Status content_id_random(Source& source, ocid::core::ContentId* out) noexcept {
        if (out == nullptr) {
            return ocid::core::make_status(ocid::core::StatusDomain::Entropy, ocid::core::StatusCode::Invalid);
        }
        ocid::core::ContentId id{};
        const ocid::core::Status s = source.fill(BufferMut{id.b.data(), ocid::core::kContentIdBytes});
        if (!ocid::core::is_ok(s)) {
            return s;
        }
        *out = id;
        return ocid::core::ok_status();
    }

} // namespace ocid::entropy

#endif // OCID_HAVE_LIBSODIUM || OCID_HAVE_OPENSSL
