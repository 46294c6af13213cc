#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace kulid::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        Unavailable,
        BufferSize,
        NoPrefix,
        InvalidSuffix,
        DataSize,
        InvalidCharacters,
        Overflow,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Ulid,
        Id,
        Db,
        Cli,
        External,
    };

    // A status raised in StatusDomain::Id with a code owned by another domain
    // wraps that failure; aux holds the originating StatusDomain.
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    [[nodiscard]] constexpr Status wrap_status(StatusDomain domain, Status inner) noexcept {
        return Status{inner.code, domain, static_cast<u32>(inner.domain)};
    }

    [[nodiscard]] constexpr bool is_wrapped(Status s) noexcept {
        return s.domain == StatusDomain::Id &&
            (s.code == StatusCode::DataSize || s.code == StatusCode::InvalidCharacters ||
             s.code == StatusCode::Overflow) &&
            s.aux == static_cast<u32>(StatusDomain::Ulid);
    }

    // Stable, NUL-terminated message for a status code.
    [[nodiscard]] const char* status_message(Status s) noexcept;

    // Renders s into dst (always NUL-terminated when cap > 0), prefixing the
    // wrapping context for wrapped statuses. Returns the untruncated length.
    std::size_t status_describe(Status s, char* dst, std::size_t cap) noexcept;

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace kulid::core
