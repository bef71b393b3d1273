/**
 * @file Assert.hpp
 * @brief Contract-checking macros with source location.
 *
 * Provides AUR_ASSERT (debug-only) and AUR_VERIFY (always evaluated).
 * A failing check reports the expression together with the file, line,
 * and function through Log::fatal before aborting.  Contract failures
 * signal inconsistent configuration, never bad input data: data errors
 * travel through core::Expected instead.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#pragma once

#ifndef AUR_CORE_ASSERT_HPP
    #define AUR_CORE_ASSERT_HPP

    #include "Log.hpp"
    #include "Platform.hpp"

    #include <cstdio>
    #include <cstdlib>
    #include <source_location>

namespace aur::core::detail {

[[noreturn]] inline void assertFail(
    const char *expr,
    std::source_location loc = std::source_location::current()
) {
    char buffer[512];
    std::snprintf(
        buffer, sizeof(buffer),
        "%s:%u in %s: \"%s\" failed",
        loc.file_name(), static_cast<unsigned>(loc.line()), loc.function_name(), expr
    );
    Log::fatal("ASSERT", buffer);
    std::abort();
}

} // namespace aur::core::detail

    #ifdef AUR_DEBUG
        #define AUR_ASSERT(cond)                                          \
            do {                                                           \
                if (AUR_UNLIKELY(!(cond)))                                 \
                    ::aur::core::detail::assertFail(#cond);                \
            } while (false)
    #else
        #define AUR_ASSERT(cond) ((void)0)
    #endif

    #define AUR_VERIFY(cond)                                              \
        do {                                                               \
            if (AUR_UNLIKELY(!(cond)))                                     \
                ::aur::core::detail::assertFail(#cond);                    \
        } while (false)

#endif // AUR_CORE_ASSERT_HPP
