#include <gtest/gtest.h>

#include "mm/arena_config.hpp"
#include "mm/dual_cursor_arena.hpp"

namespace {

TEST(ArenaConfigTest, DefaultValues) {
    const mm::ArenaConfig config{};
    EXPECT_TRUE(config.log_failures);
    EXPECT_FALSE(config.trace_allocations);
}

TEST(ArenaConfigTest, DefaultArenaConfigFunction) {
    constexpr auto config = mm::default_arena_config();
    EXPECT_TRUE(config.log_failures);
    EXPECT_FALSE(config.trace_allocations);
}

TEST(ArenaConfigTest, ArenaKeepsSuppliedConfig) {
    mm::ArenaConfig cfg{};
    cfg.log_failures = false;
    cfg.trace_allocations = true;

    mm::DualCursorArena<4096> arena{cfg};
    EXPECT_FALSE(arena.config().log_failures);
    EXPECT_TRUE(arena.config().trace_allocations);

    arena.set_config(mm::default_arena_config());
    EXPECT_TRUE(arena.config().log_failures);
    EXPECT_FALSE(arena.config().trace_allocations);
}

// Diagnostics flags must not change what the allocator grants.
TEST(ArenaConfigTest, FlagsDoNotAffectResults) {
    mm::ArenaConfig quiet{};
    quiet.log_failures = false;
    mm::ArenaConfig loud{};
    loud.trace_allocations = true;

    mm::DualCursorArena<4096> a{quiet};
    mm::DualCursorArena<4096> b{loud};
    a.init(0x10000, 2 * 4096);
    b.init(0x10000, 2 * 4096);

    EXPECT_EQ(a.alloc_bytes(40, 8).addr, b.alloc_bytes(40, 8).addr);
    EXPECT_EQ(a.alloc_pages(1, 4096).addr, b.alloc_pages(1, 4096).addr);
    EXPECT_EQ(a.alloc_pages(1, 4096).status, b.alloc_pages(1, 4096).status);
    EXPECT_EQ(a.used_bytes(), b.used_bytes());
    EXPECT_EQ(a.used_pages(), b.used_pages());
}

} // namespace
