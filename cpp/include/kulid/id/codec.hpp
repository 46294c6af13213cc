#pragma once

#include "kulid/core/buffer.hpp"
#include "kulid/core/errors.hpp"
#include "kulid/id/kind.hpp"
#include "kulid/ulid/ulid.hpp"

namespace kulid::id {

    // Symbols after the prefix in the short form. The two trailing ULID
    // symbols are implied by the kind.
    inline constexpr u32 kBodySize = kulid::ulid::kEncodedSize - 2;

    inline constexpr char kSeparator = '_';

    [[nodiscard]] constexpr u32 prefix_size(const KindInfo& kind) noexcept {
        return static_cast<u32>(kind.short_ident.size()) + 1;
    }

    [[nodiscard]] constexpr u32 encoded_size(const KindInfo& kind) noexcept {
        return prefix_size(kind) + kBodySize;
    }

    constexpr void stamp_suffix(kulid::ulid::Ulid* u, u16 number) noexcept {
        u->b[14] = suffix_high(number);
        u->b[15] = suffix_low(number);
    }

    [[nodiscard]] constexpr bool suffix_matches(const kulid::ulid::Ulid& u, u16 number) noexcept {
        return u.b[14] == suffix_high(number) && u.b[15] == suffix_low(number);
    }

    // Writes "<short>_" followed by 24 symbols. dst.len must equal
    // encoded_size(kind); on mismatch nothing is written.
    kulid::core::Status encode_short_to(const kulid::ulid::Ulid& u, const KindInfo& kind, kulid::core::TextMut dst) noexcept;

    // Accepts the short form or the bare 26 symbol form. out is only written
    // on success and then always carries the kind's suffix.
    kulid::core::Status decode_text(kulid::core::TextView text, const KindInfo& kind, kulid::ulid::Ulid* out) noexcept;

    // Parses a plain ULID and replaces its last two bytes with the kind's
    // suffix. Parse failures are wrapped in StatusDomain::Id.
    kulid::core::Status from_ulid_text(kulid::core::TextView text, const KindInfo& kind, kulid::ulid::Ulid* out) noexcept;

} // namespace kulid::id
