#include "kulid/id/codec.hpp"

#include <cstring>
#include <string_view>

namespace kulid::id {
    namespace {
        using kulid::ulid::kEncoding;

        [[nodiscard]] bool has_prefix(std::string_view in, std::string_view short_ident) noexcept {
            return in.size() > short_ident.size() &&
                in.compare(0, short_ident.size(), short_ident) == 0 &&
                in[short_ident.size()] == kSeparator;
        }
    } // namespace

    kulid::core::Status encode_short_to(const kulid::ulid::Ulid& u, const KindInfo& kind, kulid::core::TextMut dst) noexcept {
        if (!kulid::core::text_ok_mut(dst)) {
            return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::Invalid);
        }
        if (dst.len != encoded_size(kind)) {
            return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::BufferSize);
        }

        const u32 plen = prefix_size(kind);
        std::memcpy(dst.data, kind.short_ident.data(), kind.short_ident.size());
        dst.data[plen - 1] = kSeparator;

        const auto& b = u.b;
        char* o = dst.data + plen;
        // 10 symbols timestamp
        o[0] = kEncoding[(b[0] & 224) >> 5];
        o[1] = kEncoding[b[0] & 31];
        o[2] = kEncoding[(b[1] & 248) >> 3];
        o[3] = kEncoding[((b[1] & 7) << 2) | ((b[2] & 192) >> 6)];
        o[4] = kEncoding[(b[2] & 62) >> 1];
        o[5] = kEncoding[((b[2] & 1) << 4) | ((b[3] & 240) >> 4)];
        o[6] = kEncoding[((b[3] & 15) << 1) | ((b[4] & 128) >> 7)];
        o[7] = kEncoding[(b[4] & 124) >> 2];
        o[8] = kEncoding[((b[4] & 3) << 3) | ((b[5] & 224) >> 5)];
        o[9] = kEncoding[b[5] & 31];

        // 14 symbols entropy, the last one ends on the high 6 bits of byte 14
        o[10] = kEncoding[(b[6] & 248) >> 3];
        o[11] = kEncoding[((b[6] & 7) << 2) | ((b[7] & 192) >> 6)];
        o[12] = kEncoding[(b[7] & 62) >> 1];
        o[13] = kEncoding[((b[7] & 1) << 4) | ((b[8] & 240) >> 4)];
        o[14] = kEncoding[((b[8] & 15) << 1) | ((b[9] & 128) >> 7)];
        o[15] = kEncoding[(b[9] & 124) >> 2];
        o[16] = kEncoding[((b[9] & 3) << 3) | ((b[10] & 224) >> 5)];
        o[17] = kEncoding[b[10] & 31];
        o[18] = kEncoding[(b[11] & 248) >> 3];
        o[19] = kEncoding[((b[11] & 7) << 2) | ((b[12] & 192) >> 6)];
        o[20] = kEncoding[(b[12] & 62) >> 1];
        o[21] = kEncoding[((b[12] & 1) << 4) | ((b[13] & 240) >> 4)];
        o[22] = kEncoding[((b[13] & 15) << 1) | ((b[14] & 128) >> 7)];
        o[23] = kEncoding[(b[14] & 124) >> 2];

        return kulid::core::ok_status();
    }

    kulid::core::Status decode_text(kulid::core::TextView text, const KindInfo& kind, kulid::ulid::Ulid* out) noexcept {
        if (out == nullptr || !kulid::core::text_ok(text)) {
            return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::Invalid);
        }

        const std::string_view in = kulid::core::as_string_view(text);
        const u8 hi = suffix_high(kind.number);
        const u8 lo = suffix_low(kind.number);

        if (!has_prefix(in, kind.short_ident)) {
            if (in.size() != kulid::ulid::kEncodedSize) {
                return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::NoPrefix);
            }

            kulid::ulid::Ulid u{};
            const kulid::core::Status s = kulid::ulid::ulid_parse(text, &u);
            if (!kulid::core::is_ok(s)) {
                return s;
            }
            if (!suffix_matches(u, kind.number)) {
                return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::InvalidSuffix);
            }
            *out = u;
            return kulid::core::ok_status();
        }

        const std::string_view body = in.substr(prefix_size(kind));
        if (body.size() != kBodySize) {
            return kulid::core::make_status(kulid::core::StatusDomain::Ulid, kulid::core::StatusCode::DataSize);
        }

        // Rebuild the full text form: the two missing symbols carry the low
        // 2 bits of byte 14 and all of byte 15.
        char full[kulid::ulid::kEncodedSize];
        std::memcpy(full, body.data(), kBodySize);
        full[kBodySize] = kEncoding[((hi & 3) << 3) | ((lo & 224) >> 5)];
        full[kBodySize + 1] = kEncoding[lo & 31];

        kulid::ulid::Ulid u{};
        const kulid::core::Status s = kulid::ulid::ulid_parse({full, kulid::ulid::kEncodedSize}, &u);
        if (!kulid::core::is_ok(s)) {
            return s;
        }
        // The body still carries the high 6 bits of byte 14.
        if (!suffix_matches(u, kind.number)) {
            return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::InvalidSuffix);
        }
        *out = u;
        return kulid::core::ok_status();
    }

    kulid::core::Status from_ulid_text(kulid::core::TextView text, const KindInfo& kind, kulid::ulid::Ulid* out) noexcept {
        if (out == nullptr) {
            return kulid::core::make_status(kulid::core::StatusDomain::Id, kulid::core::StatusCode::Invalid);
        }

        kulid::ulid::Ulid u{};
        const kulid::core::Status s = kulid::ulid::ulid_parse(text, &u);
        if (!kulid::core::is_ok(s)) {
            return kulid::core::wrap_status(kulid::core::StatusDomain::Id, s);
        }
        stamp_suffix(&u, kind.number);
        *out = u;
        return kulid::core::ok_status();
    }
} // namespace kulid::id
