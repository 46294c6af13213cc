#include "kulid/db/schema.hpp"

#include <cstdio>

namespace kulid::db {
    namespace {
        [[nodiscard]] std::string hex_byte(kulid::id::u8 b) {
            char buf[3];
            std::snprintf(buf, sizeof(buf), "%02X", static_cast<unsigned>(b));
            return std::string(buf, 2);
        }
    } // namespace

    std::string domain_sql(const kulid::id::KindInfo& kind) {
        std::string sql;
        sql += "\n\t\tCREATE DOMAIN ";
        sql += kind.ident;
        sql += "_id AS bytea \n\t\tCHECK (\n\t\t\toctet_length(VALUE) = 16 AND \n\t\t\tget_byte(VALUE, 14) = ";
        sql += std::to_string(kulid::id::suffix_high(kind.number));
        sql += " AND \n\t\t\tget_byte(VALUE, 15) = ";
        sql += std::to_string(kulid::id::suffix_low(kind.number));
        sql += "\n\t\t)";
        return sql;
    }

    std::string generator_sql(const kulid::id::KindInfo& kind) {
        const std::string ident{kind.ident};
        const std::string number = std::to_string(kind.number);

        std::string sql;
        sql += "\n\t\tCREATE FUNCTION generate_" + ident + "_id() RETURNS " + ident + "_id AS $$\n";
        sql += "\t\t\tSELECT (\n";
        sql += "\t\t\t\tsubstring(int8send((extract(epoch FROM clock_timestamp()) * 1000)::bigint) FROM 3) ||\n";
        sql += "\t\t\t\tgen_random_bytes(8) ||\n";
        sql += "\t\t\t\tset_byte(set_byte('\\x0000'::bytea, 0, (" + number + " >> 8) & 255), 1, " + number + " & 255)\n";
        sql += "\t\t\t)::" + ident + "_id\n";
        sql += "\t\t$$ LANGUAGE sql VOLATILE";
        return sql;
    }

    std::string sqlite_check_sql(const kulid::id::KindInfo& kind, std::string_view column) {
        const std::string col{column};

        std::string sql;
        sql += "CHECK (typeof(" + col + ") = 'blob' AND length(" + col + ") = 16";
        sql += " AND substr(" + col + ", 15, 1) = x'" + hex_byte(kulid::id::suffix_high(kind.number)) + "'";
        sql += " AND substr(" + col + ", 16, 1) = x'" + hex_byte(kulid::id::suffix_low(kind.number)) + "')";
        return sql;
    }
} // namespace kulid::db
