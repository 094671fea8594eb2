#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include "mm/dual_cursor_arena.hpp"
#include "util/log.hpp"

// Host-side walk through of the early boot sequence: a region is reserved, the
// early arena serves boot structures and page-sized blocks out of it, and what is
// left in the middle is reported as the hand-off to the full allocator.

namespace {

constexpr std::size_t kPageSize = 4096;
using EarlyArena = mm::DualCursorArena<kPageSize>;

// Constant-initialized, like the kernel-global instance would be.
constinit EarlyArena g_early_arena{};

struct BootInfo {
    std::uint64_t magic{0};
    std::uint32_t cpu_count{0};
    std::uint32_t mem_map_entries{0};
};

struct MemMapEntry {
    std::uint64_t base{0};
    std::uint64_t length{0};
    std::uint32_t type{0};
};

struct FreeDeleter {
    void operator()(std::byte* p) const noexcept { std::free(p); }
};

struct Options {
    std::size_t region_kib{256};
    std::size_t stack_pages{4};
    bool trace{false};
    bool verbose{false};
};

void usage(const char* argv0) {
    std::fprintf(stderr, "usage: %s [--region-kib N] [--stack-pages N] [--trace] [--verbose]\n", argv0);
}

bool parse_size(const char* s, std::size_t& out) {
    char* end = nullptr;
    const unsigned long long v = std::strtoull(s, &end, 10);
    if (end == s || *end != '\0' || v == 0) {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--region-kib" && i + 1 < argc) {
            if (!parse_size(argv[++i], opts.region_kib)) return false;
        } else if (arg == "--stack-pages" && i + 1 < argc) {
            if (!parse_size(argv[++i], opts.stack_pages)) return false;
        } else if (arg == "--trace") {
            opts.trace = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else {
            return false;
        }
    }
    return true;
}

void report(const char* stage, const EarlyArena& arena) {
    LOG_INFO("[%s] bytes used=%zu avail=%zu total=%zu | pages used=%zu avail=%zu total=%zu", stage,
             arena.used_bytes(), arena.available_bytes(), arena.total_bytes(), arena.used_pages(),
             arena.available_pages(), arena.total_pages());
}

} // namespace

int main(int argc, char** argv) {
    Options opts{};
    if (!parse_args(argc, argv, opts)) {
        usage(argv[0]);
        return 2;
    }
    if (opts.trace) {
        util::set_log_level(util::LogLevel::Trace);
    } else if (opts.verbose) {
        util::set_log_level(util::LogLevel::Debug);
    }

    const std::size_t region_bytes = opts.region_kib * 1024;
    if (region_bytes % kPageSize != 0) {
        LOG_ERROR("region size %zu KiB is not a multiple of the %zu byte page size", opts.region_kib, kPageSize);
        return 2;
    }

    // The arena widens its bounds to page boundaries, so the backing store has to
    // start on one or the arena would hand out memory outside it.
    std::unique_ptr<std::byte, FreeDeleter> backing{static_cast<std::byte*>(std::aligned_alloc(kPageSize, region_bytes))};
    if (!backing) {
        LOG_ERROR("failed to reserve %zu bytes for the early region", region_bytes);
        return 1;
    }

    mm::ArenaConfig cfg = mm::default_arena_config();
    cfg.trace_allocations = opts.trace;
    g_early_arena.set_config(cfg);
    g_early_arena.init(reinterpret_cast<std::uintptr_t>(backing.get()), region_bytes);
    report("init", g_early_arena);

    const mm::AllocResult info_res = g_early_arena.alloc(mm::layout_of<BootInfo>());
    if (!info_res.ok()) {
        LOG_ERROR("boot info allocation failed: %s", mm::to_string(info_res.status));
        return 1;
    }
    auto* info = reinterpret_cast<BootInfo*>(info_res.addr);
    *info = BootInfo{0x424f4f54ULL, 1, 16};

    mm::Layout map_layout{};
    if (!mm::make_layout(sizeof(MemMapEntry) * info->mem_map_entries, alignof(MemMapEntry), map_layout)) {
        LOG_ERROR("bad memory map layout");
        return 1;
    }
    const mm::AllocResult map_res = g_early_arena.alloc(map_layout);
    if (!map_res.ok()) {
        LOG_ERROR("memory map allocation failed: %s", mm::to_string(map_res.status));
        return 1;
    }
    std::memset(reinterpret_cast<void*>(map_res.addr), 0, map_layout.size);
    report("boot structures", g_early_arena);

    const mm::AllocResult root_table = g_early_arena.alloc_pages(1, kPageSize);
    if (!root_table.ok()) {
        LOG_ERROR("root page table allocation failed: %s", mm::to_string(root_table.status));
        return 1;
    }
    std::memset(reinterpret_cast<void*>(root_table.addr), 0, kPageSize);

    const mm::AllocResult stack = g_early_arena.alloc_pages(opts.stack_pages, kPageSize);
    if (!stack.ok()) {
        LOG_ERROR("boot stack of %zu pages failed: %s", opts.stack_pages, mm::to_string(stack.status));
        return 1;
    }
    report("page tables + stack", g_early_arena);

    if (g_early_arena.add_memory(0, kPageSize) != mm::AllocStatus::Unsupported) {
        LOG_ERROR("add_memory unexpectedly accepted a second region");
        return 1;
    }

    const mm::Region handoff = g_early_arena.unused_region();
    LOG_INFO("handing [%#llx, %#llx) (%zu bytes) to the full allocator",
             static_cast<unsigned long long>(handoff.start), static_cast<unsigned long long>(handoff.end()),
             handoff.size);
    return 0;
}
