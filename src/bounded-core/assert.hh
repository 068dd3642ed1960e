#pragma once

#include <bounded-core/macros.hh>

#include <source_location>

// BC_ASSERT(cond, msg) checks a precondition of the caller.
// A failing check calls the installed assertion handler and then aborts.
// Disabled builds (see macros.hh) neither evaluate cond nor msg.
//
// Usage:
//   BC_ASSERT(_size > 0, "top() called on empty bounded_stack");

namespace bc
{
/// Called with the stringified condition, the message and the location of the failed check.
/// A handler may throw to unwind instead of letting the process abort.
using assertion_handler = void (*)(char const* expression, char const* message, std::source_location const& location);

/// Installs handler (nullptr restores the default stderr report) and returns the previous one.
/// Global state, not synchronized.
assertion_handler set_assertion_handler(assertion_handler handler);

namespace impl
{
[[noreturn]] BC_COLD_FUNC void assertion_failed(char const* expression, char const* message, std::source_location location);
}
} // namespace bc

#if BC_ASSERT_ENABLED
#define BC_ASSERT(cond, msg)                                                               \
    do                                                                                     \
    {                                                                                      \
        if (!(cond)) [[unlikely]]                                                          \
            ::bc::impl::assertion_failed(#cond, msg, ::std::source_location::current()); \
    } while (false)
#else
#define BC_ASSERT(cond, msg) \
    do                       \
    {                        \
        (void)sizeof(cond);  \
        (void)sizeof(msg);   \
    } while (false)
#endif
