#pragma once

#include <string_view>
#include <type_traits>

#include "kulid/core/types.hpp"

namespace kulid::core {

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct TextView {
        const char* data{nullptr};
        u32 len{0};
    };

    struct TextMut {
        char* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr TextView text_view(std::string_view s) noexcept {
        return TextView{s.data(), static_cast<u32>(s.size())};
    }

    [[nodiscard]] constexpr std::string_view as_string_view(TextView t) noexcept {
        return (t.data == nullptr) ? std::string_view{} : std::string_view{t.data, t.len};
    }

    [[nodiscard]] constexpr bool text_ok(TextView t) noexcept {
        return (t.len == 0) || (t.data != nullptr);
    }

    [[nodiscard]] constexpr bool text_ok_mut(TextMut t) noexcept {
        return (t.len == 0) || (t.data != nullptr);
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<TextView>);
    static_assert(std::is_standard_layout_v<TextView>);
    static_assert(std::is_trivially_copyable_v<TextMut>);
    static_assert(std::is_standard_layout_v<TextMut>);
} // namespace kulid::core
