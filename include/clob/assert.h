#pragma once
#include <cstdio>
#include <cstdlib>

#define CLOB_UNLIKELY(x) __builtin_expect(!!(x), 0)

namespace clob {

// Broken tree or queue links mean the book is corrupt. Never an exception.
[[noreturn]] inline void fatal(const char* msg, const char* file, int line) noexcept {
    std::fprintf(stderr, "ASSERT : %s (%s:%d)\n", msg, file, line);
    std::abort();
}

} // namespace clob

#define CLOB_ASSERT(cond, msg)                              \
    do {                                                    \
        if (CLOB_UNLIKELY(!(cond))) {                       \
            ::clob::fatal((msg), __FILE__, __LINE__);       \
        }                                                   \
    } while (0)
