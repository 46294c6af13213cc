#pragma once

#include <type_traits>

#include "kulid/cli/options.hpp"
#include "kulid/core/errors.hpp"

namespace kulid::cli {
    using u32 = kulid::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help = 1,
        Make = 2,
        Parse = 3,
        FromUlid = 4,
        Sql = 5,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    kulid::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace kulid::cli
