#include "kulid/ulid/ulid.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <mutex>

#include <ulid.hh>

#include "kulid/ulid/entropy.hpp"

namespace kulid::ulid {
    namespace {
        using u64 = kulid::core::u64;

        struct MonotonicState {
            std::mutex mutex;
            Timestamp last_ms{0};
            Entropy last{};
            bool primed{false};
        };

        MonotonicState g_monotonic;

        [[nodiscard]] ::ulid::ULID to_lib(const Ulid& u) noexcept {
            ::ulid::ULID lib = 0;
            ::ulid::UnmarshalBinaryFrom(u.b.data(), lib);
            return lib;
        }

        // Adds 1..2^32 to the stepped entropy bytes; false on carry out.
        [[nodiscard]] bool step(Entropy* e, u32 r) noexcept {
            u64 carry = u64{r} + 1;
            for (u32 i = kSteppedSize; i-- > 0;) {
                carry += e->b[i];
                e->b[i] = static_cast<u8>(carry);
                carry >>= 8;
            }
            return carry == 0;
        }

        [[noreturn]] void fatal(kulid::core::Status s) noexcept {
            std::fprintf(stderr, "fatal: %s\n", kulid::core::status_message(s));
            std::abort();
        }

        void fill_or_die(u8* dst, u32 len) noexcept {
            const kulid::core::Status s = entropy_fill(dst, len);
            if (!kulid::core::is_ok(s)) {
                fatal(s);
            }
        }
    } // namespace

    kulid::core::Status ulid_new(Timestamp ms, const Entropy& entropy, Ulid* out) noexcept {
        if (out == nullptr) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::Invalid);
        }
        // the library truncates silently
        if (ms > kMaxTime) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::Overflow);
        }

        ::ulid::ULID lib = 0;
        ::ulid::EncodeTime(static_cast<std::time_t>(ms), lib);
        u32 next = 0;
        ::ulid::EncodeEntropy([&entropy, &next]() -> std::uint8_t { return entropy.b[next++]; }, lib);
        ::ulid::MarshalBinaryTo(lib, out->b.data());
        return kulid::core::ok_status();
    }

    Ulid ulid_make() noexcept {
        Timestamp ms = now_ms();
        Entropy entropy{};
        {
            std::lock_guard<std::mutex> lock(g_monotonic.mutex);
            if (g_monotonic.primed && ms <= g_monotonic.last_ms) {
                ms = g_monotonic.last_ms;
                entropy = g_monotonic.last;
                u8 r[4];
                fill_or_die(r, sizeof(r));
                const u32 inc = (u32{r[0]} << 24) | (u32{r[1]} << 16) | (u32{r[2]} << 8) | u32{r[3]};
                if (!step(&entropy, inc)) {
                    // stepped bytes exhausted within this millisecond, borrow the next one
                    ++ms;
                    fill_or_die(entropy.b.data(), kEntropySize);
                }
            } else {
                fill_or_die(entropy.b.data(), kEntropySize);
            }
            g_monotonic.last_ms = ms;
            g_monotonic.last = entropy;
            g_monotonic.primed = true;
        }

        Ulid u{};
        const kulid::core::Status s = ulid_new(ms, entropy, &u);
        if (!kulid::core::is_ok(s)) {
            fatal(s);
        }
        return u;
    }

    kulid::core::Status ulid_parse(kulid::core::TextView text, Ulid* out) noexcept {
        if (out == nullptr || !kulid::core::text_ok(text)) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::Invalid);
        }
        if (text.len != kEncodedSize) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::DataSize);
        }

        // UnmarshalFrom does not validate; check symbols and fold case first
        char upper[kEncodedSize];
        for (u32 i = 0; i < kEncodedSize; ++i) {
            const u8 d = decode_symbol(text.data[i]);
            if (d == kBadSymbol) {
                return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::InvalidCharacters);
            }
            upper[i] = kEncoding[d];
        }

        // 26 symbols carry 130 bits; the leading symbol may only use 3
        if (decode_symbol(upper[0]) > 7) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::Overflow);
        }

        ::ulid::ULID lib = 0;
        ::ulid::UnmarshalFrom(upper, lib);
        ::ulid::MarshalBinaryTo(lib, out->b.data());
        return kulid::core::ok_status();
    }

    kulid::core::Status ulid_marshal_text_to(const Ulid& u, kulid::core::TextMut dst) noexcept {
        if (!kulid::core::text_ok_mut(dst)) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::Invalid);
        }
        if (dst.len != kEncodedSize) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::BufferSize);
        }
        ::ulid::MarshalTo(to_lib(u), dst.data);
        return kulid::core::ok_status();
    }

    std::string ulid_string(const Ulid& u) {
        return ::ulid::Marshal(to_lib(u));
    }

    Timestamp ulid_time(const Ulid& u) noexcept {
        return static_cast<Timestamp>(::ulid::Time(to_lib(u)));
    }

    Timestamp now_ms() noexcept {
        const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
        return static_cast<Timestamp>(std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count());
    }
} // namespace kulid::ulid
