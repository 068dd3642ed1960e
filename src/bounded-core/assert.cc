#include "assert.hh"

#include <cstdlib>
#include <iostream>

namespace
{
void report_to_stderr(char const* expression, char const* message, std::source_location const& location)
{
    std::cerr << location.file_name() << ':' << location.line() << ": assertion `" << expression << "` failed in "
              << location.function_name() << "\n  " << message << std::endl;
}

bc::assertion_handler g_handler = &report_to_stderr;
} // namespace

bc::assertion_handler bc::set_assertion_handler(assertion_handler handler)
{
    auto const previous = g_handler;
    g_handler = handler != nullptr ? handler : &report_to_stderr;
    return previous;
}

void bc::impl::assertion_failed(char const* expression, char const* message, std::source_location location)
{
    g_handler(expression, message, location);
    std::abort();
}
