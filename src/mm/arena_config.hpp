#pragma once

#include <type_traits>

namespace mm {

// Diagnostics switches for the early allocator. Neither flag changes allocation
// results; they only decide what reaches the log.
struct ArenaConfig {
    // Log refused allocations (NoMemory / InvalidParam) at Warn.
    bool log_failures{true};

    // Log every granted allocation at Trace. Noisy; meant for bring-up.
    bool trace_allocations{false};
};

static_assert(std::is_trivially_copyable_v<ArenaConfig>, "ArenaConfig must be trivially copyable");

[[nodiscard]] inline constexpr ArenaConfig default_arena_config() noexcept {
    return ArenaConfig{};
}

} // namespace mm
