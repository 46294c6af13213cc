#include "kulid/cli/commands.hpp"

#include <cstring>

namespace kulid::cli {
    namespace {
        [[nodiscard]] kulid::core::Status invalid() noexcept {
            return kulid::core::make_status(kulid::core::StatusDomain::Cli, kulid::core::StatusCode::Invalid);
        }
    } // namespace

    kulid::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        *out = CommandInvocation{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        const char* name = args.argv[0];
        if (name[0] == '-') {
            return invalid();
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, name) == 0) {
                out->id = specs[i].id;
                out->args = CliArgs{args.argv + 1, args.argc - 1};
                *consumed = 1;
                return kulid::core::ok_status();
            }
        }
        return invalid();
    }
} // namespace kulid::cli
