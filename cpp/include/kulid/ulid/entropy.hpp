#pragma once

#include "kulid/core/errors.hpp"
#include "kulid/core/types.hpp"

namespace kulid::ulid {
    using u8 = kulid::core::u8;
    using u32 = kulid::core::u32;

    // Fills dst with len cryptographically secure random bytes.
    // Unavailable when no backend is compiled in or it fails to initialise.
    kulid::core::Status entropy_fill(u8* dst, u32 len) noexcept;

} // namespace kulid::ulid
