#pragma once

#include <compare>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>

#include "kulid/core/buffer.hpp"
#include "kulid/core/errors.hpp"
#include "kulid/id/codec.hpp"
#include "kulid/id/kind.hpp"
#include "kulid/ulid/ulid.hpp"

namespace kulid::id {

    // A ULID whose last two bytes always hold K::kNumber (big-endian).
    // Every constructor and successful parse restores that invariant; a
    // default constructed Id is the zero ULID carrying K's suffix.
    template <KindDescriptor K>
    class Id {
    public:
        using kind_type = K;

        constexpr Id() noexcept { stamp_suffix(&u_, kind_info<K>().number); }

        [[nodiscard]] static Id make() noexcept {
            Id id;
            id.u_ = kulid::ulid::ulid_make();
            stamp_suffix(&id.u_, kind_info<K>().number);
            return id;
        }

        // Parses a plain ULID, replacing whatever suffix it carried.
        static kulid::core::Status from_ulid(kulid::core::TextView text, Id* out) noexcept {
            if (out == nullptr) {
                return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::Invalid);
            }
            return from_ulid_text(text, kind_info<K>(), &out->u_);
        }

        static kulid::core::Status from_ulid(std::string_view text, Id* out) noexcept {
            return from_ulid(kulid::core::text_view(text), out);
        }

        // For literals known to be well formed; aborts otherwise.
        [[nodiscard]] static Id must_from_ulid(std::string_view text) noexcept {
            Id id;
            const kulid::core::Status s = from_ulid(text, &id);
            if (!kulid::core::is_ok(s)) {
                char msg[128];
                (void)kulid::core::status_describe(s, msg, sizeof(msg));
                std::fprintf(stderr, "fatal: %s\n", msg);
                std::abort();
            }
            return id;
        }

        [[nodiscard]] static constexpr u32 prefix_size() noexcept {
            return kulid::id::prefix_size(kind_info<K>());
        }

        [[nodiscard]] static constexpr u32 encoded_size() noexcept {
            return kulid::id::encoded_size(kind_info<K>());
        }

        [[nodiscard]] kulid::core::BufferView bytes() const noexcept {
            return kulid::core::BufferView{u_.b.data(), kulid::ulid::kSize};
        }

        [[nodiscard]] const kulid::ulid::Ulid& ulid() const noexcept { return u_; }

        [[nodiscard]] kulid::core::Timestamp time() const noexcept { return kulid::ulid::ulid_time(u_); }

        kulid::core::Status marshal_text_to(kulid::core::TextMut dst) const noexcept {
            return encode_short_to(u_, kind_info<K>(), dst);
        }

        kulid::core::Status marshal_text(std::string* out) const {
            if (out == nullptr) {
                return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::Invalid);
            }
            std::string dst(encoded_size(), '\0');
            const kulid::core::Status s = marshal_text_to({dst.data(), encoded_size()});
            if (kulid::core::is_ok(s)) {
                *out = std::move(dst);
            }
            return s;
        }

        // Short form, or empty when encoding fails.
        [[nodiscard]] std::string to_string() const {
            std::string s;
            if (!kulid::core::is_ok(marshal_text(&s))) {
                return std::string{};
            }
            return s;
        }

        // Plain 26 symbol ULID text, suffix included.
        [[nodiscard]] std::string to_long_string() const { return kulid::ulid::ulid_string(u_); }

        // Accepts "<short>_<24 symbols>" or a bare 26 symbol ULID carrying
        // K's suffix. Leaves *this untouched on failure.
        kulid::core::Status unmarshal_text(kulid::core::TextView text) noexcept {
            return decode_text(text, kind_info<K>(), &u_);
        }

        kulid::core::Status unmarshal_text(std::string_view text) noexcept {
            return unmarshal_text(kulid::core::text_view(text));
        }

        friend constexpr bool operator==(const Id&, const Id&) noexcept = default;
        friend constexpr auto operator<=>(const Id&, const Id&) noexcept = default;

    private:
        kulid::ulid::Ulid u_{};
    };

    template <KindDescriptor K>
    [[nodiscard]] Id<K> make() noexcept {
        return Id<K>::make();
    }

    template <KindDescriptor K>
    kulid::core::Status from_ulid(std::string_view text, Id<K>* out) noexcept {
        return Id<K>::from_ulid(text, out);
    }

    template <KindDescriptor K>
    [[nodiscard]] Id<K> must_from_ulid(std::string_view text) noexcept {
        return Id<K>::must_from_ulid(text);
    }

} // namespace kulid::id
