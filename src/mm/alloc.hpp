#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

#include "util/align.hpp"

namespace mm {

enum class AllocStatus : std::uint8_t { Ok, NoMemory, InvalidParam, Unsupported };

inline const char* to_string(AllocStatus s) noexcept {
    switch (s) {
    case AllocStatus::Ok: return "Ok";
    case AllocStatus::NoMemory: return "NoMemory";
    case AllocStatus::InvalidParam: return "InvalidParam";
    case AllocStatus::Unsupported: return "Unsupported";
    }
    return "Unknown";
}

struct AllocResult {
    AllocStatus status{AllocStatus::NoMemory};
    std::uintptr_t addr{0};

    [[nodiscard]] constexpr bool ok() const noexcept { return status == AllocStatus::Ok; }

    [[nodiscard]] static constexpr AllocResult success(std::uintptr_t a) noexcept { return {AllocStatus::Ok, a}; }
    [[nodiscard]] static constexpr AllocResult failure(AllocStatus s) noexcept { return {s, 0}; }
};

// Size and alignment of a byte allocation. Alignment is always a power of two;
// build one through make_layout() when the inputs are untrusted.
struct Layout {
    std::size_t size{0};
    std::size_t align{1};

    // Size rounded up to a multiple of align, so the next cursor position keeps
    // the same alignment.
    [[nodiscard]] constexpr std::size_t padded_size() const noexcept {
        return static_cast<std::size_t>(util::align_up(size, align));
    }
};

[[nodiscard]] constexpr bool make_layout(std::size_t size, std::size_t align, Layout& out) noexcept {
    if (!util::is_power_of_two(align)) {
        return false;
    }
    // padded_size() must not wrap.
    if (size > SIZE_MAX - (align - 1)) {
        return false;
    }
    out = Layout{size, align};
    return true;
}

template <typename T>
[[nodiscard]] constexpr Layout layout_of() noexcept {
    return Layout{sizeof(T), alignof(T)};
}

// A half-open address range [start, start + size).
struct Region {
    std::uintptr_t start{0};
    std::size_t size{0};

    [[nodiscard]] constexpr std::uintptr_t end() const noexcept { return start + size; }
    [[nodiscard]] constexpr bool empty() const noexcept { return size == 0; }
};

// Capability contracts consumed by the allocator layer that sits above the early
// allocator. A type may provide any subset.
template <typename A>
concept BaseAllocator = requires(A& a, std::uintptr_t start, std::size_t size) {
    { a.init(start, size) } -> std::same_as<void>;
    { a.add_memory(start, size) } -> std::same_as<AllocStatus>;
};

template <typename A>
concept ByteAllocator = requires(A& a, const A& ca, Layout layout, std::uintptr_t addr) {
    { a.alloc(layout) } -> std::same_as<AllocResult>;
    { a.dealloc(addr, layout) } -> std::same_as<void>;
    { ca.total_bytes() } -> std::same_as<std::size_t>;
    { ca.used_bytes() } -> std::same_as<std::size_t>;
    { ca.available_bytes() } -> std::same_as<std::size_t>;
};

template <typename A>
concept PageAllocator = requires(A& a, const A& ca, std::size_t count, std::size_t align, std::uintptr_t addr) {
    { A::page_size } -> std::convertible_to<std::size_t>;
    { a.alloc_pages(count, align) } -> std::same_as<AllocResult>;
    a.dealloc_pages(addr, count);
    { ca.total_pages() } -> std::same_as<std::size_t>;
    { ca.used_pages() } -> std::same_as<std::size_t>;
    { ca.available_pages() } -> std::same_as<std::size_t>;
};

} // namespace mm
