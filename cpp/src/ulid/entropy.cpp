#include "kulid/ulid/entropy.hpp"

#include <climits>
#include <cstring>

#if defined(KULID_HAVE_LIBSODIUM)
#include <sodium.h>
#endif

#if defined(KULID_HAVE_OPENSSL)
#include <openssl/rand.h>
#endif

namespace kulid::ulid {
    namespace {
#if defined(KULID_HAVE_LIBSODIUM)
        kulid::core::Status ensure_sodium() noexcept {
            if (sodium_init() < 0) {
                return kulid::core::make_status(kulid::core::StatusDomain::External, kulid::core::StatusCode::Unavailable);
            }
            return kulid::core::ok_status();
        }
#endif
    } // namespace

    kulid::core::Status entropy_fill(u8* dst, u32 len) noexcept {
        if (len > 0 && dst == nullptr) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::Invalid);
        }
        if (len == 0) {
            return kulid::core::ok_status();
        }

#if defined(KULID_HAVE_LIBSODIUM)
        const kulid::core::Status init = ensure_sodium();
        if (!kulid::core::is_ok(init)) {
            return init;
        }
        randombytes_buf(dst, static_cast<size_t>(len));
        return kulid::core::ok_status();
#elif defined(KULID_HAVE_OPENSSL)
        if (len > static_cast<u32>(INT_MAX) || RAND_bytes(dst, static_cast<int>(len)) != 1) {
            return kulid::core::make_status(kulid::core::StatusDomain::External, kulid::core::StatusCode::Unavailable);
        }
        return kulid::core::ok_status();
#else
        std::memset(dst, 0, len);
        return kulid::core::make_status(kulid::core::StatusDomain::External, kulid::core::StatusCode::Unavailable);
#endif
    }
} // namespace kulid::ulid
