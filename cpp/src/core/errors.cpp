#include "kulid/core/errors.hpp"

#include <cstdio>

namespace kulid::core {
    const char* status_message(Status s) noexcept {
        switch (s.code) {
            case StatusCode::Ok:
                return "ok";
            case StatusCode::Invalid:
                return "kulid: invalid argument";
            case StatusCode::Unavailable:
                return "kulid: entropy source unavailable";
            case StatusCode::BufferSize:
                return "kulid: bad buffer size when marshaling";
            case StatusCode::NoPrefix:
                return "kulid: no prefix";
            case StatusCode::InvalidSuffix:
                return "kulid: invalid ulid suffix";
            case StatusCode::DataSize:
                return "ulid: bad data size when unmarshaling";
            case StatusCode::InvalidCharacters:
                return "ulid: bad data characters when unmarshaling";
            case StatusCode::Overflow:
                return "ulid: overflow when unmarshaling";
            case StatusCode::Unknown:
                break;
        }
        return "kulid: unknown error";
    }

    std::size_t status_describe(Status s, char* dst, std::size_t cap) noexcept {
        int n = 0;
        if (is_wrapped(s)) {
            n = std::snprintf(dst, cap, "failed to parse ulid: %s", status_message(s));
        } else {
            n = std::snprintf(dst, cap, "%s", status_message(s));
        }
        return (n < 0) ? 0 : static_cast<std::size_t>(n);
    }
} // namespace kulid::core
