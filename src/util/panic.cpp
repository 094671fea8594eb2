#include "util/panic.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#include "util/log.hpp"

namespace util {

void panic(const char* fmt, ...) noexcept {
    char msg[256];
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(msg, sizeof(msg), fmt, args);
    va_end(args);

    log(LogLevel::Fatal, "panic: %s", msg);
    std::fflush(stderr);
    std::abort();
}

} // namespace util
