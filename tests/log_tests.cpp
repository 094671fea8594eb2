#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mm/dual_cursor_arena.hpp"
#include "util/log.hpp"

namespace {

struct Captured {
    util::LogLevel level;
    std::string line;
};

std::vector<Captured>& captured() {
    static std::vector<Captured> lines;
    return lines;
}

void capture_sink(util::LogLevel lvl, const char* line) {
    captured().push_back(Captured{lvl, line});
}

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = util::log_level();
        captured().clear();
        util::set_log_sink(&capture_sink);
    }

    void TearDown() override {
        util::set_log_sink(nullptr);
        util::set_log_level(saved_level_);
        captured().clear();
    }

    util::LogLevel saved_level_{util::LogLevel::Info};
};

TEST_F(LogTest, LevelNames) {
    EXPECT_STREQ(util::level_name(util::LogLevel::Trace), "TRACE");
    EXPECT_STREQ(util::level_name(util::LogLevel::Warn), "WARN");
    EXPECT_STREQ(util::level_name(util::LogLevel::Fatal), "FATAL");
}

TEST_F(LogTest, FormatsThroughSink) {
    util::set_log_level(util::LogLevel::Info);
    LOG_INFO("pages=%zu name=%s", static_cast<std::size_t>(3), "boot");

    ASSERT_EQ(captured().size(), 1u);
    EXPECT_EQ(captured()[0].level, util::LogLevel::Info);
    EXPECT_EQ(captured()[0].line, "pages=3 name=boot");
}

TEST_F(LogTest, BelowMinimumLevelIsDropped) {
    util::set_log_level(util::LogLevel::Warn);
    EXPECT_FALSE(util::log_enabled(util::LogLevel::Info));
    EXPECT_TRUE(util::log_enabled(util::LogLevel::Error));

    LOG_DEBUG("dropped");
    LOG_INFO("dropped");
    LOG_ERROR("kept");

    ASSERT_EQ(captured().size(), 1u);
    EXPECT_EQ(captured()[0].level, util::LogLevel::Error);
}

TEST_F(LogTest, ArenaWarnsOnRefusal) {
    util::set_log_level(util::LogLevel::Warn);
    mm::DualCursorArena<4096> arena{};
    arena.init(0x10000, 4096);

    const auto r = arena.alloc_bytes(8192, 8);
    ASSERT_EQ(r.status, mm::AllocStatus::NoMemory);

    ASSERT_EQ(captured().size(), 1u);
    EXPECT_EQ(captured()[0].level, util::LogLevel::Warn);
    EXPECT_NE(captured()[0].line.find("NoMemory"), std::string::npos);

    captured().clear();
    ASSERT_EQ(arena.alloc_pages(1, 3 * 4096).status, mm::AllocStatus::InvalidParam);
    ASSERT_EQ(captured().size(), 1u);
    EXPECT_NE(captured()[0].line.find("InvalidParam"), std::string::npos);
}

TEST_F(LogTest, ArenaQuietWhenFailureLoggingDisabled) {
    util::set_log_level(util::LogLevel::Trace);
    mm::ArenaConfig cfg{};
    cfg.log_failures = false;
    mm::DualCursorArena<4096> arena{cfg};
    arena.init(0x10000, 4096);
    captured().clear();

    EXPECT_FALSE(arena.alloc_bytes(8192, 8).ok());
    EXPECT_FALSE(arena.alloc_pages(2, 4096).ok());
    EXPECT_TRUE(captured().empty());
}

TEST_F(LogTest, ArenaTracesGrantsWhenEnabled) {
    util::set_log_level(util::LogLevel::Trace);
    mm::ArenaConfig cfg{};
    cfg.trace_allocations = true;
    mm::DualCursorArena<4096> arena{cfg};
    arena.init(0x10000, 2 * 4096);
    captured().clear();

    ASSERT_TRUE(arena.alloc_bytes(16, 8).ok());
    ASSERT_TRUE(arena.alloc_pages(1, 4096).ok());

    ASSERT_EQ(captured().size(), 2u);
    EXPECT_EQ(captured()[0].level, util::LogLevel::Trace);
    EXPECT_NE(captured()[0].line.find("alloc 16/8"), std::string::npos);
    EXPECT_NE(captured()[1].line.find("alloc_pages"), std::string::npos);
}

TEST_F(LogTest, AddMemoryIsLogged) {
    util::set_log_level(util::LogLevel::Warn);
    mm::DualCursorArena<4096> arena{};
    EXPECT_EQ(arena.add_memory(0x20000, 4096), mm::AllocStatus::Unsupported);
    ASSERT_EQ(captured().size(), 1u);
    EXPECT_NE(captured()[0].line.find("unsupported"), std::string::npos);
}

} // namespace
