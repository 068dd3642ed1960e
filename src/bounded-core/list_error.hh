#pragma once

#include <bounded-core/fwd.hh>

/// Errors reported by bounded_stack.
/// There is a single kind: pushing onto a stack that already holds its capacity.
/// This is routine control flow, not a fatal condition: the stack is unmodified and stays usable.
enum class bc::list_error : bc::u8
{
    /// push/emplace on a stack with size() == capacity()
    list_full,
};

namespace bc
{
/// Human-readable message, e.g. "the list is full".
[[nodiscard]] char const* to_string(list_error e);
} // namespace bc
