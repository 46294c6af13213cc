#include <algorithm>
#include <array>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "kulid/ulid/entropy.hpp"
#include "kulid/ulid/ulid.hpp"

using namespace kulid::ulid;
using kulid::core::StatusCode;
using kulid::core::StatusDomain;
using kulid::core::text_view;

namespace {
const std::array<u8, 16> kVectorBytes = {1, 146, 241, 124, 134, 69, 80, 16, 87, 251, 194, 161, 255, 222, 64, 0};
constexpr const char* kVectorText = "01JBRQS1J5A085FYY2M7ZXWG00";
} // namespace

TEST(Ulid, ParsesKnownVector) {
    Ulid u{};
    const kulid::core::Status s = ulid_parse(text_view(kVectorText), &u);
    ASSERT_EQ(s.code, StatusCode::Ok);
    EXPECT_EQ(u.b, kVectorBytes);
    EXPECT_EQ(ulid_string(u), kVectorText);
}

TEST(Ulid, ParseIsCaseInsensitive) {
    Ulid upper{};
    Ulid lower{};
    ASSERT_EQ(ulid_parse(text_view("01JBRQS1J5A085FYY2M7ZXWG00"), &upper).code, StatusCode::Ok);
    ASSERT_EQ(ulid_parse(text_view("01jbrqs1j5a085fyy2m7zxwg00"), &lower).code, StatusCode::Ok);
    EXPECT_EQ(upper, lower);
    EXPECT_EQ(ulid_string(lower), "01JBRQS1J5A085FYY2M7ZXWG00");
}

TEST(Ulid, ParseRejectsWrongLength) {
    Ulid u{};
    EXPECT_EQ(ulid_parse(text_view("0"), &u).code, StatusCode::DataSize);
    EXPECT_EQ(ulid_parse(text_view(""), &u).code, StatusCode::DataSize);
    EXPECT_EQ(ulid_parse(text_view("01JBRQS1J5A085FYY2M7ZXWG0"), &u).code, StatusCode::DataSize);
    EXPECT_EQ(ulid_parse(text_view("01JBRQS1J5A085FYY2M7ZXWG000"), &u).code, StatusCode::DataSize);
}

TEST(Ulid, ParseRejectsSymbolsOutsideAlphabet) {
    for (const char bad : {'I', 'L', 'O', 'U', 'i', '_', '-', ' '}) {
        std::string text = kVectorText;
        text[12] = bad;
        Ulid u{};
        const kulid::core::Status s = ulid_parse(text_view(text), &u);
        EXPECT_EQ(s.code, StatusCode::InvalidCharacters) << "symbol '" << bad << "'";
        EXPECT_EQ(s.domain, StatusDomain::Ulid);
    }
}

TEST(Ulid, ParseRejectsOverflow) {
    Ulid u{};
    EXPECT_EQ(ulid_parse(text_view("7ZZZZZZZZZZZZZZZZZZZZZZZZZ"), &u).code, StatusCode::Ok);
    EXPECT_EQ(ulid_time(u), kMaxTime);
    EXPECT_EQ(ulid_parse(text_view("8ZZZZZZZZZZZZZZZZZZZZZZZZZ"), &u).code, StatusCode::Overflow);
}

TEST(Ulid, ParseLeavesOutputUntouchedOnFailure) {
    Ulid u{};
    u.b.fill(0xAB);
    const Ulid before = u;
    EXPECT_NE(ulid_parse(text_view("01JBRQS1J5A085FYY2M7ZXWGU0"), &u).code, StatusCode::Ok);
    EXPECT_EQ(u, before);
}

TEST(Ulid, ParseInvalidOnNullOut) {
    EXPECT_EQ(ulid_parse(text_view(kVectorText), nullptr).code, StatusCode::Invalid);
}

TEST(Ulid, MarshalRequiresExactBuffer) {
    Ulid u{};
    ASSERT_EQ(ulid_parse(text_view(kVectorText), &u).code, StatusCode::Ok);

    std::array<char, 32> buf{};
    for (u32 len = 0; len < buf.size(); ++len) {
        if (len == kEncodedSize) {
            continue;
        }
        buf.fill('.');
        EXPECT_EQ(ulid_marshal_text_to(u, {buf.data(), len}).code, StatusCode::BufferSize) << "len " << len;
        EXPECT_EQ(buf[0], '.');
    }
    ASSERT_EQ(ulid_marshal_text_to(u, {buf.data(), kEncodedSize}).code, StatusCode::Ok);
    EXPECT_EQ(std::string(buf.data(), kEncodedSize), kVectorText);
}

TEST(Ulid, NewPacksTimestampBigEndian) {
    Entropy e{};
    for (u32 i = 0; i < kEntropySize; ++i) {
        e.b[i] = static_cast<u8>(0xA0 + i);
    }
    Ulid u{};
    ASSERT_EQ(ulid_new(0x010203040506ull, e, &u).code, StatusCode::Ok);
    EXPECT_EQ(u.b[0], 0x01);
    EXPECT_EQ(u.b[5], 0x06);
    EXPECT_EQ(u.b[6], 0xA0);
    EXPECT_EQ(u.b[15], 0xA9);
    EXPECT_EQ(ulid_time(u), 0x010203040506ull);
}

TEST(Ulid, NewRejectsTimeBeyond48Bits) {
    Ulid u{};
    EXPECT_EQ(ulid_new(kMaxTime, Entropy{}, &u).code, StatusCode::Ok);
    EXPECT_EQ(ulid_new(kMaxTime + 1, Entropy{}, &u).code, StatusCode::Overflow);
}

TEST(Ulid, OrderingFollowsTextOrdering) {
    Ulid a{};
    Ulid b{};
    ASSERT_EQ(ulid_parse(text_view("01JBRQS1J5A085FYY2M7ZXWG00"), &a).code, StatusCode::Ok);
    ASSERT_EQ(ulid_parse(text_view("01JBRQS1J60000000000000000"), &b).code, StatusCode::Ok);
    EXPECT_LT(a, b);
    EXPECT_LT(ulid_string(a), ulid_string(b));
}

TEST(Ulid, MakeUsesCurrentTime) {
    const Timestamp before = now_ms();
    const Ulid u = ulid_make();
    const Timestamp after = now_ms();
    EXPECT_GE(ulid_time(u), before);
    EXPECT_LE(ulid_time(u), after + 1);
}

TEST(Ulid, MakeIsStrictlyMonotonic) {
    Ulid prev = ulid_make();
    for (int i = 0; i < 10000; ++i) {
        const Ulid next = ulid_make();
        ASSERT_LT(prev, next);
        prev = next;
    }
}

TEST(Ulid, MakeStepsAboveLastTwoBytes) {
    int same_ms = 0;
    Ulid prev = ulid_make();
    for (int i = 0; i < 10000; ++i) {
        const Ulid next = ulid_make();
        if (ulid_time(next) == ulid_time(prev)) {
            ++same_ms;
            ASSERT_EQ(next.b[14], prev.b[14]);
            ASSERT_EQ(next.b[15], prev.b[15]);
            ASSERT_TRUE(std::lexicographical_compare(prev.b.begin(), prev.b.begin() + 14, next.b.begin(), next.b.begin() + 14));
        }
        prev = next;
    }
    EXPECT_GT(same_ms, 0);
}

TEST(Ulid, MakeIsUniqueAcrossThreads) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 2000;
    std::vector<std::vector<Ulid>> made(kThreads);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&made, t] {
            made[t].reserve(kPerThread);
            for (int i = 0; i < kPerThread; ++i) {
                made[t].push_back(ulid_make());
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    std::vector<Ulid> all;
    for (const auto& v : made) {
        all.insert(all.end(), v.begin(), v.end());
    }
    std::sort(all.begin(), all.end());
    EXPECT_EQ(std::adjacent_find(all.begin(), all.end()), all.end());
}

TEST(UlidEntropy, FillsAndRejectsNull) {
    EXPECT_EQ(entropy_fill(nullptr, 0).code, StatusCode::Ok);
    EXPECT_EQ(entropy_fill(nullptr, 8).code, StatusCode::Invalid);

    std::array<u8, 32> a{};
    std::array<u8, 32> b{};
    ASSERT_EQ(entropy_fill(a.data(), static_cast<u32>(a.size())).code, StatusCode::Ok);
    ASSERT_EQ(entropy_fill(b.data(), static_cast<u32>(b.size())).code, StatusCode::Ok);
    EXPECT_NE(a, b);
}
