#pragma once

#include <array>
#include <compare>
#include <string>
#include <type_traits>

#include "kulid/core/buffer.hpp"
#include "kulid/core/errors.hpp"
#include "kulid/core/types.hpp"

namespace kulid::ulid {
    using u8 = kulid::core::u8;
    using u32 = kulid::core::u32;
    using Timestamp = kulid::core::Timestamp;

    inline constexpr u32 kSize = 16;
    inline constexpr u32 kEncodedSize = 26;
    inline constexpr u32 kTimeSize = 6;
    inline constexpr u32 kEntropySize = 10;
    // Entropy bytes advanced by ulid_make within one millisecond; the last
    // two keep their first draw.
    inline constexpr u32 kSteppedSize = kEntropySize - 2;
    inline constexpr Timestamp kMaxTime = (Timestamp{1} << 48) - 1;

    // Crockford's base32, without I, L, O and U
    inline constexpr char kEncoding[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";
    inline constexpr u8 kBadSymbol = 0xFF;

    struct Ulid {
        std::array<u8, kSize> b{};
        friend constexpr bool operator==(const Ulid&, const Ulid&) noexcept = default;
        friend constexpr auto operator<=>(const Ulid&, const Ulid&) noexcept = default;
    };
    static_assert(sizeof(Ulid) == 16);
    static_assert(std::is_trivially_copyable_v<Ulid>);
    static_assert(std::is_standard_layout_v<Ulid>);

    struct Entropy {
        std::array<u8, kEntropySize> b{};
    };

    // Symbol value for c (either case), or kBadSymbol.
    [[nodiscard]] constexpr u8 decode_symbol(char c) noexcept {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - 'a' + 'A');
        }
        for (u8 i = 0; i < 32; ++i) {
            if (kEncoding[i] == c) {
                return i;
            }
        }
        return kBadSymbol;
    }

    // Overflow when ms does not fit in 48 bits.
    kulid::core::Status ulid_new(Timestamp ms, const Entropy& entropy, Ulid* out) noexcept;

    // Current time with monotonic entropy: ids made within the same
    // millisecond increase strictly by a random step applied above the last
    // two bytes, so overwriting those keeps the order. Aborts if no entropy
    // is available.
    [[nodiscard]] Ulid ulid_make() noexcept;

    // Strict, case-insensitive parse of the 26 symbol text form.
    // out is left untouched on failure.
    kulid::core::Status ulid_parse(kulid::core::TextView text, Ulid* out) noexcept;

    // dst.len must be exactly kEncodedSize.
    kulid::core::Status ulid_marshal_text_to(const Ulid& u, kulid::core::TextMut dst) noexcept;

    [[nodiscard]] std::string ulid_string(const Ulid& u);

    [[nodiscard]] Timestamp ulid_time(const Ulid& u) noexcept;

    [[nodiscard]] Timestamp now_ms() noexcept;

} // namespace kulid::ulid
