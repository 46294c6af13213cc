#pragma once

#include <type_traits>

#include "kulid/core/errors.hpp"
#include "kulid/core/types.hpp"

namespace kulid::cli {
    using u32 = kulid::core::u32;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionId : u32 {
        None = 0,
        Number = 1,
        Ident = 2,
        Short = 3,
        Count = 4,
        Help = 5,
    };

    // Options either take a value or are bare switches. Values stay text;
    // config_load converts them.
    struct OptionSpec {
        OptionId id{OptionId::None};
        const char* long_name{nullptr};
        char short_name{'\0'};
        bool takes_value{false};
    };

    // value points into argv, or is null for a switch.
    struct ParsedOption {
        OptionId id{OptionId::None};
        const char* value{nullptr};
    };

    // Caller-owned storage for up to cap options.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Consumes leading "-x", "-xVALUE", "--name", "--name=VALUE" and
    // "--name VALUE" tokens; stops at the first non-option or after "--".
    kulid::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of id, or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);

} // namespace kulid::cli
