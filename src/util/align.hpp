#pragma once

#include <cstddef>
#include <cstdint>

namespace util {

[[nodiscard]] constexpr bool is_power_of_two(std::size_t v) noexcept {
    return v != 0 && (v & (v - 1)) == 0;
}

// Both helpers require a power-of-two alignment.
[[nodiscard]] constexpr std::uintptr_t align_down(std::uintptr_t pos, std::size_t align) noexcept {
    return pos & ~(static_cast<std::uintptr_t>(align) - 1);
}

[[nodiscard]] constexpr std::uintptr_t align_up(std::uintptr_t pos, std::size_t align) noexcept {
    return (pos + align - 1) & ~(static_cast<std::uintptr_t>(align) - 1);
}

[[nodiscard]] constexpr bool is_aligned(std::uintptr_t pos, std::size_t align) noexcept {
    return (pos & (static_cast<std::uintptr_t>(align) - 1)) == 0;
}

} // namespace util
