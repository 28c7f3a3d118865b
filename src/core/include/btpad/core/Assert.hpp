/**
 * @file Assert.hpp
 * @brief Debug assertions and contract-checking macros with source location.
 *
 * BTPAD_ASSERT is debug-only, BTPAD_VERIFY is always evaluated. Both are
 * for internal invariants; recoverable failures go through Expected.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef BTPAD_CORE_ASSERT_HPP
    #define BTPAD_CORE_ASSERT_HPP

    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace btpad::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    std::fprintf(
        stderr,
        "[BTPAD ASSERT] %s:%u in %s: \"%s\" failed\n",
        loc.file_name(), loc.line(), loc.function_name(), expr
    );
    std::abort();
}

} // namespace btpad::core::detail

    #ifdef BTPAD_DEBUG
        #define BTPAD_ASSERT(cond)                                        \
            do {                                                           \
                if (BTPAD_UNLIKELY(!(cond)))                               \
                    ::btpad::core::detail::assertFail(#cond);              \
            } while (false)
    #else
        #define BTPAD_ASSERT(cond) ((void)0)
    #endif

    #define BTPAD_VERIFY(cond)                                            \
        do {                                                               \
            if (BTPAD_UNLIKELY(!(cond)))                                   \
                ::btpad::core::detail::assertFail(#cond);                  \
        } while (false)

#endif // BTPAD_CORE_ASSERT_HPP
