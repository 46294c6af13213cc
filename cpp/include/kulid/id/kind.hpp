#pragma once

#include <concepts>
#include <string_view>
#include <type_traits>

#include "kulid/core/types.hpp"

namespace kulid::id {
    using u8 = kulid::core::u8;
    using u16 = kulid::core::u16;
    using u32 = kulid::core::u32;

    // Runtime copy of a descriptor, for code that only learns the kind at run time.
    struct KindInfo {
        u16 number{0};
        std::string_view ident{};
        std::string_view short_ident{};
    };

    // Both identifiers must be non-empty and the short one must not contain
    // the '_' separator.
    [[nodiscard]] constexpr bool kind_info_valid(const KindInfo& k) noexcept {
        return !k.ident.empty() && !k.short_ident.empty() && k.short_ident.find('_') == std::string_view::npos;
    }

    template <typename K>
    concept KindConstants = std::is_empty_v<K> && requires {
        { K::kNumber } -> std::convertible_to<u16>;
        { K::kIdent } -> std::convertible_to<std::string_view>;
        { K::kShortIdent } -> std::convertible_to<std::string_view>;
    };

    // An entity kind is an empty type exposing three constants:
    //
    //   struct UserKind {
    //       static constexpr u16 kNumber = 0x0001;
    //       static constexpr std::string_view kIdent = "user";
    //       static constexpr std::string_view kShortIdent = "usr";
    //   };
    //
    // kNumber is stamped into the last two bytes of every id of that kind,
    // kIdent names database objects, kShortIdent prefixes the text form.
    // Identifiers failing kind_info_valid do not satisfy the concept.
    // Numbers are expected to be unique within an application; nothing here
    // checks that.
    template <typename K>
    concept KindDescriptor = KindConstants<K> &&
        kind_info_valid(KindInfo{static_cast<u16>(K::kNumber), std::string_view{K::kIdent}, std::string_view{K::kShortIdent}});

    template <KindDescriptor K>
    [[nodiscard]] constexpr KindInfo kind_info() noexcept {
        return KindInfo{static_cast<u16>(K::kNumber), std::string_view{K::kIdent}, std::string_view{K::kShortIdent}};
    }

    [[nodiscard]] constexpr u8 suffix_high(u16 number) noexcept {
        return static_cast<u8>(number >> 8);
    }

    [[nodiscard]] constexpr u8 suffix_low(u16 number) noexcept {
        return static_cast<u8>(number & 0xFF);
    }

} // namespace kulid::id
