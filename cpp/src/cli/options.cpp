#include "kulid/cli/options.hpp"

#include <cstddef>
#include <cstring>

namespace kulid::cli {
    namespace {
        [[nodiscard]] kulid::core::Status invalid() noexcept {
            return kulid::core::make_status(kulid::core::StatusDomain::Cli, kulid::core::StatusCode::Invalid);
        }

        [[nodiscard]] const OptionSpec* find_long(const OptionSpec* specs, u32 spec_count, const char* name, std::size_t name_len) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                const OptionSpec& s = specs[i];
                if (s.long_name != nullptr && std::strlen(s.long_name) == name_len &&
                    std::strncmp(s.long_name, name, name_len) == 0) {
                    return &s;
                }
            }
            return nullptr;
        }

        [[nodiscard]] const OptionSpec* find_short(const OptionSpec* specs, u32 spec_count, char c) noexcept {
            for (u32 i = 0; i < spec_count; ++i) {
                if (specs[i].short_name != '\0' && specs[i].short_name == c) {
                    return &specs[i];
                }
            }
            return nullptr;
        }

        [[nodiscard]] kulid::core::Status push_option(ParsedOptions* out, OptionId id, const char* value) noexcept {
            if (out->data == nullptr || out->len >= out->cap) {
                return invalid();
            }
            out->data[out->len++] = ParsedOption{id, value};
            return kulid::core::ok_status();
        }
    } // namespace

    kulid::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept {
        if (out == nullptr || consumed == nullptr) {
            return invalid();
        }
        *consumed = 0;
        out->len = 0;

        if (args.argc > 0 && args.argv == nullptr) {
            return invalid();
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid();
        }

        u32 i = 0;
        while (i < args.argc) {
            const char* tok = args.argv[i];
            if (tok == nullptr || tok[0] != '-' || tok[1] == '\0') {
                break;
            }
            if (std::strcmp(tok, "--") == 0) {
                ++i;
                break;
            }

            const OptionSpec* spec = nullptr;
            const char* value = nullptr;

            if (tok[1] == '-') {
                const char* name = tok + 2;
                const char* eq = std::strchr(name, '=');
                const std::size_t name_len = (eq != nullptr) ? static_cast<std::size_t>(eq - name) : std::strlen(name);
                if (name_len == 0) {
                    return invalid();
                }
                spec = find_long(specs, spec_count, name, name_len);
                if (spec == nullptr) {
                    return invalid();
                }
                if (eq != nullptr) {
                    value = eq + 1;
                }
            } else {
                spec = find_short(specs, spec_count, tok[1]);
                if (spec == nullptr) {
                    return invalid();
                }
                if (tok[2] != '\0') {
                    value = tok + 2;
                }
            }
            ++i;

            if (!spec->takes_value && value != nullptr) {
                return invalid();
            }
            if (spec->takes_value && value == nullptr) {
                if (i >= args.argc || args.argv[i] == nullptr) {
                    return invalid();
                }
                value = args.argv[i++];
            }

            const kulid::core::Status s = push_option(out, spec->id, value);
            if (!kulid::core::is_ok(s)) {
                return s;
            }
        }

        *consumed = i;
        return kulid::core::ok_status();
    }

    const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept {
        const ParsedOption* found = nullptr;
        for (u32 i = 0; i < opts.len; ++i) {
            if (opts.data[i].id == id) {
                found = &opts.data[i];
            }
        }
        return found;
    }
} // namespace kulid::cli
