#include <cstdio>
#include <cstdlib>
#include <string>

#include "kulid/cli/commands.hpp"
#include "kulid/cli/config.hpp"
#include "kulid/cli/options.hpp"
#include "kulid/core/errors.hpp"
#include "kulid/db/schema.hpp"
#include "kulid/id/codec.hpp"
#include "kulid/ulid/ulid.hpp"

namespace {

// ========================================================================
// Error Handling
// ========================================================================

void print_error(const char* msg) {
    fprintf(stderr, "error: %s\n", msg);
}

void print_status_error(const char* context, kulid::core::Status s) {
    char msg[128];
    (void)kulid::core::status_describe(s, msg, sizeof(msg));
    fprintf(stderr, "error: %s: %s (code=%u, domain=%u)\n",
            context,
            msg,
            static_cast<unsigned>(s.code),
            static_cast<unsigned>(s.domain));
}

// ========================================================================
// Output
// ========================================================================

std::string short_form(const kulid::ulid::Ulid& u, const kulid::id::KindInfo& kind) {
    std::string out(kulid::id::encoded_size(kind), '\0');
    const kulid::core::Status s =
        kulid::id::encode_short_to(u, kind, {out.data(), kulid::id::encoded_size(kind)});
    if (!kulid::core::is_ok(s)) {
        return std::string{};
    }
    return out;
}

void print_details(const kulid::ulid::Ulid& u, const kulid::id::KindInfo& kind) {
    printf("short: %s\n", short_form(u, kind).c_str());
    printf("long:  %s\n", kulid::ulid::ulid_string(u).c_str());
    printf("bytes: ");
    for (const kulid::core::u8 b : u.b) {
        printf("%02x", static_cast<unsigned>(b));
    }
    printf("\n");
    printf("time:  %llu\n", static_cast<unsigned long long>(kulid::ulid::ulid_time(u)));
    printf("kind:  %s (%u)\n", std::string(kind.ident).c_str(), static_cast<unsigned>(kind.number));
}

// ========================================================================
// Command Handlers
// ========================================================================

void handle_help() {
    printf("Usage: kulid [options] <command> [args]\n");
    printf("\n");
    printf("Options:\n");
    printf("  -n, --number <n>   Kind number, decimal or 0x hex (env %s)\n", kulid::cli::kEnvKindNumber);
    printf("  -i, --ident <s>    Kind identifier (env %s)\n", kulid::cli::kEnvKindIdent);
    printf("  -s, --short <s>    Kind short identifier (env %s)\n", kulid::cli::kEnvKindShort);
    printf("  -c, --count <n>    Number of ids for make (default 1)\n");
    printf("  -h, --help         Show this help\n");
    printf("\n");
    printf("Commands:\n");
    printf("  make               Print new ids in short form\n");
    printf("  parse <text>       Decode a short or long form id\n");
    printf("  from-ulid <ulid>   Stamp a plain ULID with the kind\n");
    printf("  sql                Print PostgreSQL and SQLite constraints\n");
    printf("  help               Show this help\n");
}

int handle_make(const kulid::id::KindInfo& kind, kulid::core::u32 count) {
    for (kulid::core::u32 i = 0; i < count; ++i) {
        kulid::ulid::Ulid u = kulid::ulid::ulid_make();
        kulid::id::stamp_suffix(&u, kind.number);
        printf("%s\n", short_form(u, kind).c_str());
    }
    return EXIT_SUCCESS;
}

int handle_parse(const kulid::id::KindInfo& kind, const kulid::cli::CliArgs& args) {
    if (args.argc != 1) {
        print_error("parse: expected exactly one id");
        return EXIT_FAILURE;
    }
    const std::string text = args.argv[0];
    kulid::ulid::Ulid u{};
    const kulid::core::Status s = kulid::id::decode_text(kulid::core::text_view(text), kind, &u);
    if (!kulid::core::is_ok(s)) {
        print_status_error("parse", s);
        return EXIT_FAILURE;
    }
    print_details(u, kind);
    return EXIT_SUCCESS;
}

int handle_from_ulid(const kulid::id::KindInfo& kind, const kulid::cli::CliArgs& args) {
    if (args.argc != 1) {
        print_error("from-ulid: expected exactly one ulid");
        return EXIT_FAILURE;
    }
    const std::string text = args.argv[0];
    kulid::ulid::Ulid u{};
    const kulid::core::Status s = kulid::id::from_ulid_text(kulid::core::text_view(text), kind, &u);
    if (!kulid::core::is_ok(s)) {
        print_status_error("from-ulid", s);
        return EXIT_FAILURE;
    }
    print_details(u, kind);
    return EXIT_SUCCESS;
}

int handle_sql(const kulid::id::KindInfo& kind) {
    printf("%s;\n", kulid::db::domain_sql(kind).c_str());
    printf("%s;\n", kulid::db::generator_sql(kind).c_str());
    printf("\n-- sqlite\n%s\n", kulid::db::sqlite_check_sql(kind, "id").c_str());
    return EXIT_SUCCESS;
}

} // namespace

// ========================================================================
// Main
// ========================================================================

int main(int argc, char** argv) {
    const kulid::cli::OptionSpec option_specs[] = {
        {kulid::cli::OptionId::Number, "number", 'n', true},
        {kulid::cli::OptionId::Ident, "ident", 'i', true},
        {kulid::cli::OptionId::Short, "short", 's', true},
        {kulid::cli::OptionId::Count, "count", 'c', true},
        {kulid::cli::OptionId::Help, "help", 'h', false},
    };
    const kulid::cli::CommandSpec command_specs[] = {
        {kulid::cli::CommandId::Help, "help"},
        {kulid::cli::CommandId::Make, "make"},
        {kulid::cli::CommandId::Parse, "parse"},
        {kulid::cli::CommandId::FromUlid, "from-ulid"},
        {kulid::cli::CommandId::Sql, "sql"},
    };
    constexpr kulid::core::u32 option_count = sizeof(option_specs) / sizeof(option_specs[0]);
    constexpr kulid::core::u32 command_count = sizeof(command_specs) / sizeof(command_specs[0]);

    const kulid::cli::CliArgs all{argv + 1, static_cast<kulid::core::u32>(argc > 0 ? argc - 1 : 0)};

    kulid::cli::ParsedOption option_buf[16]{};
    kulid::cli::ParsedOptions opts{option_buf, 0, 16};
    kulid::core::u32 consumed = 0;
    kulid::core::Status s = kulid::cli::parse_options(all, option_specs, option_count, &opts, &consumed);
    if (!kulid::core::is_ok(s)) {
        print_error("invalid options (see 'kulid help')");
        return EXIT_FAILURE;
    }

    const kulid::cli::CliArgs rest{all.argv + consumed, all.argc - consumed};
    if (kulid::cli::find_option(opts, kulid::cli::OptionId::Help) != nullptr) {
        handle_help();
        return EXIT_SUCCESS;
    }
    if (rest.argc == 0) {
        handle_help();
        return EXIT_FAILURE;
    }

    kulid::cli::CommandInvocation cmd{};
    s = kulid::cli::parse_command(rest, command_specs, command_count, &cmd, &consumed);
    if (!kulid::core::is_ok(s)) {
        fprintf(stderr, "error: unknown command %s\n", rest.argv[0]);
        return EXIT_FAILURE;
    }
    if (cmd.id == kulid::cli::CommandId::Help) {
        handle_help();
        return EXIT_SUCCESS;
    }

    kulid::cli::CliConfig cfg;
    s = kulid::cli::config_load(opts, &cfg);
    if (!kulid::core::is_ok(s)) {
        print_error("invalid kind number or count");
        return EXIT_FAILURE;
    }

    kulid::id::KindInfo kind{};
    s = kulid::cli::config_kind(cfg, &kind);
    if (!kulid::core::is_ok(s)) {
        print_error("a kind needs --number, --ident and --short (without '_')");
        return EXIT_FAILURE;
    }

    switch (cmd.id) {
        case kulid::cli::CommandId::Make:
            return handle_make(kind, cfg.count);
        case kulid::cli::CommandId::Parse:
            return handle_parse(kind, cmd.args);
        case kulid::cli::CommandId::FromUlid:
            return handle_from_ulid(kind, cmd.args);
        case kulid::cli::CommandId::Sql:
            return handle_sql(kind);
        case kulid::cli::CommandId::None:
        case kulid::cli::CommandId::Help:
            break;
    }
    handle_help();
    return EXIT_FAILURE;
}
