#include "kulid/cli/config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <utility>

namespace kulid::cli {
    namespace {
        [[nodiscard]] kulid::core::Status invalid() noexcept {
            return kulid::core::make_status(kulid::core::StatusDomain::Cli, kulid::core::StatusCode::Invalid);
        }

        [[nodiscard]] const char* env_or_null(const char* name) noexcept {
            const char* v = std::getenv(name);
            return (v != nullptr && *v != '\0') ? v : nullptr;
        }
    } // namespace

    bool parse_kind_number(const char* s, u16* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        int base = 10;
        if (s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
            s += 2;
            base = 16;
        }
        const char* end = s + std::strlen(s);
        if (s == end) {
            return false;
        }
        u16 v{};
        const auto r = std::from_chars(s, end, v, base);
        if (r.ec != std::errc() || r.ptr != end) {
            return false;
        }
        *out = v;
        return true;
    }

    bool parse_count(const char* s, u32* out) noexcept {
        if (s == nullptr || out == nullptr) {
            return false;
        }
        const char* end = s + std::strlen(s);
        u32 v{};
        const auto r = std::from_chars(s, end, v, 10);
        if (s == end || r.ec != std::errc() || r.ptr != end || v < 1 || v > kMaxCount) {
            return false;
        }
        *out = v;
        return true;
    }

    kulid::core::Status config_load(const ParsedOptions& opts, CliConfig* out) {
        if (out == nullptr) {
            return invalid();
        }
        CliConfig cfg{};

        if (const char* v = env_or_null(kEnvKindNumber)) {
            if (!parse_kind_number(v, &cfg.number)) {
                return invalid();
            }
            cfg.has_number = true;
        }
        if (const char* v = env_or_null(kEnvKindIdent)) {
            cfg.ident = v;
        }
        if (const char* v = env_or_null(kEnvKindShort)) {
            cfg.short_ident = v;
        }

        if (const ParsedOption* o = find_option(opts, OptionId::Number)) {
            if (!parse_kind_number(o->value, &cfg.number)) {
                return invalid();
            }
            cfg.has_number = true;
        }
        if (const ParsedOption* o = find_option(opts, OptionId::Ident)) {
            cfg.ident = o->value;
        }
        if (const ParsedOption* o = find_option(opts, OptionId::Short)) {
            cfg.short_ident = o->value;
        }
        if (const ParsedOption* o = find_option(opts, OptionId::Count)) {
            if (!parse_count(o->value, &cfg.count)) {
                return invalid();
            }
        }

        *out = std::move(cfg);
        return kulid::core::ok_status();
    }

    kulid::core::Status config_kind(const CliConfig& cfg, kulid::id::KindInfo* out) noexcept {
        if (out == nullptr || !cfg.has_number) {
            return invalid();
        }
        const kulid::id::KindInfo kind{cfg.number, cfg.ident, cfg.short_ident};
        if (!kulid::id::kind_info_valid(kind)) {
            return invalid();
        }
        *out = kind;
        return kulid::core::ok_status();
    }
} // namespace kulid::cli
