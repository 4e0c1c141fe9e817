#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace hpkc::core {

    using u8 = std::uint8_t;
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;
    using u64 = std::uint64_t;

    using i64 = std::int64_t;

    // Borrowed, non-owning byte ranges. data may be null only when len == 0.
    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    [[nodiscard]] constexpr bool buffer_ok(BufferView b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    [[nodiscard]] constexpr bool buffer_ok(BufferMut b) noexcept {
        return (b.len == 0) || (b.data != nullptr);
    }

    [[nodiscard]] constexpr BufferView view_of(BufferMut b) noexcept {
        return BufferView{b.data, b.len};
    }

    // Views over string literals, without the terminating NUL. Not constexpr:
    // the char-to-u8 reinterpret_cast is not allowed in constant evaluation.
    template <std::size_t N>
    [[nodiscard]] inline BufferView literal(const char (&s)[N]) noexcept {
        return BufferView{reinterpret_cast<const u8*>(s), static_cast<u32>(N - 1)};
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);

} // namespace hpkc::core
