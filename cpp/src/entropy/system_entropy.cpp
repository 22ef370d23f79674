#include "ocid/entropy/entropy.hpp"

#include <cstddef>

#if defined(OCID_HAVE_LIBSODIUM)
#include <sodium.h>
#elif defined(OCID_HAVE_OPENSSL)
#include <openssl/err.h>
#include <openssl/rand.h>
#endif

namespace ocid::entropy {
    namespace {
#if defined(OCID_HAVE_LIBSODIUM)
        ocid::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return ocid::core::make_status(ocid::core::StatusDomain::External, ocid::core::StatusCode::Unavailable);
            }
            return ocid::core::ok_status();
        }
#endif
    } // namespace

    ocid::core::Status SystemEntropy::fill(BufferMut out) noexcept {
        if (!ocid::core::buffer_ok(out)) {
            return ocid::core::make_status(ocid::core::StatusDomain::Entropy, ocid::core::StatusCode::Invalid);
        }
        if (out.len == 0) {
            return ocid::core::ok_status();
        }

#if defined(OCID_HAVE_LIBSODIUM)
        const ocid::core::Status init = ensure_sodium();
        if (!ocid::core::is_ok(init)) {
            return init;
        }

        randombytes_buf(out.data, static_cast<size_t>(out.len));
        return ocid::core::ok_status();
#else
        if (out.len > 0x7fffffffu) {
            return ocid::core::make_status(ocid::core::StatusDomain::Entropy, ocid::core::StatusCode::Invalid);
        }
        if (RAND_bytes(out.data, static_cast<int>(out.len)) != 1) {
            const unsigned long err = ERR_get_error();
            return ocid::core::make_status(ocid::core::StatusDomain::External,
                ocid::core::StatusCode::Unavailable,
                static_cast<ocid::core::u32>(err & 0xffffffffu));
        }
        return ocid::core::ok_status();
#endif
    }
} // namespace ocid::entropy
