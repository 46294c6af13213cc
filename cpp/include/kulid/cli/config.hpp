#pragma once

#include <string>

#include "kulid/cli/options.hpp"
#include "kulid/core/errors.hpp"
#include "kulid/id/kind.hpp"

namespace kulid::cli {
    using u16 = kulid::core::u16;

    inline constexpr const char* kEnvKindNumber = "KULID_KIND_NUMBER";
    inline constexpr const char* kEnvKindIdent = "KULID_KIND_IDENT";
    inline constexpr const char* kEnvKindShort = "KULID_KIND_SHORT";

    inline constexpr u32 kMaxCount = 1000000;

    struct CliConfig {
        u16 number{0};
        bool has_number{false};
        std::string ident;
        std::string short_ident;
        u32 count{1};
    };

    // Decimal or 0x-prefixed hexadecimal, 0..65535.
    [[nodiscard]] bool parse_kind_number(const char* s, u16* out) noexcept;

    // Decimal, 1..kMaxCount.
    [[nodiscard]] bool parse_count(const char* s, u32* out) noexcept;

    // Environment first, then parsed options on top. Invalid on malformed
    // numbers or a count outside 1..kMaxCount.
    kulid::core::Status config_load(const ParsedOptions& opts, CliConfig* out);

    // Invalid unless number, ident and short ident are all set and form a
    // valid kind.
    kulid::core::Status config_kind(const CliConfig& cfg, kulid::id::KindInfo* out) noexcept;

} // namespace kulid::cli
