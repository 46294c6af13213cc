#pragma once

#include <string>
#include <string_view>

#include "kulid/id/kind.hpp"

namespace kulid::db {

    // PostgreSQL domain "<ident>_id" over bytea, checking the length and the
    // two suffix bytes of the kind.
    [[nodiscard]] std::string domain_sql(const kulid::id::KindInfo& kind);

    // PostgreSQL function "generate_<ident>_id()" returning a fresh
    // "<ident>_id": 6 timestamp bytes, 8 random bytes, 2 suffix bytes.
    // Requires the pgcrypto extension for gen_random_bytes.
    [[nodiscard]] std::string generator_sql(const kulid::id::KindInfo& kind);

    // SQLite column constraint for a BLOB column holding ids of the kind.
    // column is spliced in verbatim.
    [[nodiscard]] std::string sqlite_check_sql(const kulid::id::KindInfo& kind, std::string_view column);

    template <kulid::id::KindDescriptor K>
    [[nodiscard]] std::string domain_sql() {
        return domain_sql(kulid::id::kind_info<K>());
    }

    template <kulid::id::KindDescriptor K>
    [[nodiscard]] std::string generator_sql() {
        return generator_sql(kulid::id::kind_info<K>());
    }

    template <kulid::id::KindDescriptor K>
    [[nodiscard]] std::string sqlite_check_sql(std::string_view column) {
        return sqlite_check_sql(kulid::id::kind_info<K>(), column);
    }

} // namespace kulid::db
