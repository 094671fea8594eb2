#pragma once

#include <cstddef>
#include <cstdint>

#include "mm/alloc.hpp"
#include "mm/arena_config.hpp"
#include "util/align.hpp"
#include "util/log.hpp"
#include "util/panic.hpp"

namespace mm {

// DualCursorArena is the allocator used before the real heap and page allocators
// are up. One region serves two clients growing towards each other:
//
//   [ bytes used | available | pages used ]
//   ^start       ^b_pos      ^p_pos       ^end
//
// Byte allocations bump b_pos forward and are never reclaimed. Page allocations
// move p_pos backward and are never returned. The cursors never cross, so
// start <= b_pos <= p_pos <= end holds after every call, and every failed call
// leaves both cursors untouched.
//
// Thread safety: none. Early boot runs on one CPU with interrupts off; anyone
// sharing an arena later must serialize access themselves.
template <std::size_t PageSize>
class DualCursorArena {
    static_assert(util::is_power_of_two(PageSize), "PageSize must be a power of two");

public:
    static constexpr std::size_t page_size = PageSize;

    // Empty and unusable until init(). constexpr so a global arena is
    // constant-initialized and exists before any static constructor runs.
    constexpr DualCursorArena() noexcept = default;
    constexpr explicit DualCursorArena(ArenaConfig config) noexcept : config_{config} {}

    DualCursorArena(const DualCursorArena&) = delete;
    DualCursorArena& operator=(const DualCursorArena&) = delete;

    // Takes [start, start + size) widened outward to page boundaries. A second
    // call discards all prior state.
    void init(std::uintptr_t start, std::size_t size) noexcept {
        start_ = util::align_down(start, PageSize);
        end_ = util::align_up(start + size, PageSize);
        b_pos_ = start_;
        p_pos_ = end_;
        LOG_DEBUG("early arena: init [%#llx, %#llx) page_size=%zu", as_ull(start_), as_ull(end_), PageSize);
    }

    // Only one contiguous region is ever managed.
    [[nodiscard]] AllocStatus add_memory(std::uintptr_t start, std::size_t size) noexcept {
        LOG_WARN("early arena: add_memory(%#llx, %zu) unsupported", as_ull(start), size);
        return AllocStatus::Unsupported;
    }

    [[nodiscard]] AllocResult alloc(Layout layout) noexcept {
        Layout checked{};
        if (!make_layout(layout.size, layout.align, checked)) {
            return refuse("alloc", AllocStatus::InvalidParam, layout.size, layout.align);
        }
        // Pad rather than align the cursor: every earlier grant was padded, so
        // b_pos already sits on the boundary this request needs.
        const std::size_t padded = checked.padded_size();
        if (padded > p_pos_ - b_pos_) {
            return refuse("alloc", AllocStatus::NoMemory, layout.size, layout.align);
        }
        const std::uintptr_t addr = b_pos_;
        b_pos_ += padded;
        if (config_.trace_allocations) {
            LOG_TRACE("early arena: alloc %zu/%zu -> %#llx", layout.size, layout.align, as_ull(addr));
        }
        return AllocResult::success(addr);
    }

    [[nodiscard]] AllocResult alloc_bytes(std::size_t size, std::size_t align) noexcept {
        return alloc(Layout{size, align});
    }

    // Byte memory lives until the region is handed over; nothing to do.
    void dealloc(std::uintptr_t, Layout) noexcept {}
    void dealloc_bytes(std::uintptr_t addr, Layout layout) noexcept { dealloc(addr, layout); }

    [[nodiscard]] std::size_t total_bytes() const noexcept { return p_pos_ - start_; }
    [[nodiscard]] std::size_t used_bytes() const noexcept { return b_pos_ - start_; }
    [[nodiscard]] std::size_t available_bytes() const noexcept { return total_bytes() - used_bytes(); }

    // Carves num_pages (rounded up to a multiple of the alignment in pages) off
    // the top of the free gap and returns the lowest address of the block.
    // align_bytes must be a power-of-two multiple of the page size.
    [[nodiscard]] AllocResult alloc_pages(std::size_t num_pages, std::size_t align_bytes) noexcept {
        if (align_bytes % PageSize != 0) {
            return refuse("alloc_pages", AllocStatus::InvalidParam, num_pages, align_bytes);
        }
        const std::size_t align_pages = align_bytes / PageSize;
        if (!util::is_power_of_two(align_pages) || num_pages == 0) {
            return refuse("alloc_pages", AllocStatus::InvalidParam, num_pages, align_bytes);
        }

        const std::size_t room_pages = (p_pos_ - b_pos_) / PageSize;
        if (num_pages > room_pages) {
            return refuse("alloc_pages", AllocStatus::NoMemory, num_pages, align_bytes);
        }
        // Cannot wrap: num_pages <= room_pages, which is far below SIZE_MAX / PageSize.
        const std::size_t remain = num_pages % align_pages;
        const std::size_t count = remain == 0 ? num_pages : num_pages + (align_pages - remain);
        if (count > room_pages) {
            return refuse("alloc_pages", AllocStatus::NoMemory, num_pages, align_bytes);
        }

        p_pos_ -= count * PageSize;
        if (config_.trace_allocations) {
            LOG_TRACE("early arena: alloc_pages %zu (%zu) -> %#llx", num_pages, count, as_ull(p_pos_));
        }
        return AllocResult::success(p_pos_);
    }

    // Pages handed out here are never returned; reaching this is a caller bug.
    [[noreturn]] void dealloc_pages(std::uintptr_t addr, std::size_t num_pages) noexcept {
        util::panic("early arena: dealloc_pages(%#llx, %zu) not implemented", as_ull(addr), num_pages);
    }

    // Upper bound on pages still obtainable given the current byte usage.
    [[nodiscard]] std::size_t total_pages() const noexcept { return (end_ - b_pos_) / PageSize; }
    [[nodiscard]] std::size_t used_pages() const noexcept { return (end_ - p_pos_) / PageSize; }
    [[nodiscard]] std::size_t available_pages() const noexcept { return total_pages() - used_pages(); }

    // The gap between the cursors, i.e. what the full allocator inherits when the
    // early phase ends.
    [[nodiscard]] Region unused_region() const noexcept { return Region{b_pos_, p_pos_ - b_pos_}; }

    [[nodiscard]] bool contains(std::uintptr_t addr) const noexcept { return addr >= start_ && addr < end_; }

    [[nodiscard]] std::uintptr_t start() const noexcept { return start_; }
    [[nodiscard]] std::uintptr_t end() const noexcept { return end_; }
    [[nodiscard]] std::uintptr_t byte_cursor() const noexcept { return b_pos_; }
    [[nodiscard]] std::uintptr_t page_cursor() const noexcept { return p_pos_; }

    [[nodiscard]] const ArenaConfig& config() const noexcept { return config_; }
    void set_config(ArenaConfig config) noexcept { config_ = config; }

private:
    static constexpr unsigned long long as_ull(std::uintptr_t v) noexcept { return static_cast<unsigned long long>(v); }

    AllocResult refuse(const char* op, AllocStatus status, std::size_t count, std::size_t align) const noexcept {
        if (config_.log_failures) {
            LOG_WARN("early arena: %s(%zu, %zu) failed: %s (bytes avail=%zu pages avail=%zu)", op, count, align,
                     to_string(status), available_bytes(), available_pages());
        }
        return AllocResult::failure(status);
    }

    ArenaConfig config_{};
    std::uintptr_t start_{0};
    std::uintptr_t end_{0};
    std::uintptr_t b_pos_{0};
    std::uintptr_t p_pos_{0};
};

static_assert(BaseAllocator<DualCursorArena<4096>>);
static_assert(ByteAllocator<DualCursorArena<4096>>);
static_assert(PageAllocator<DualCursorArena<4096>>);

} // namespace mm
