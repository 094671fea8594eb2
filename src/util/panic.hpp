#pragma once

namespace util {

// Reports an unrecoverable caller-side logic error and terminates. The message is
// logged at Fatal level through the active log sink before the process aborts, so
// a boot console sees it even though nothing unwinds.
[[noreturn]] void panic(const char* fmt, ...) noexcept;

} // namespace util
