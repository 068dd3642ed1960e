#pragma once

#include <bounded-core/assert.hh>
#include <bounded-core/fwd.hh>
#include <bounded-core/utility.hh>

#include <type_traits>

/// Marks a value as the error of a result, see bc::error.
template <class E>
struct bc::as_error_t
{
    E value;
};

namespace bc
{
/// Usage:
///   if (is_full())
///       return bc::error(list_error::list_full);
template <class E>
[[nodiscard]] constexpr as_error_t<std::decay_t<E>> error(E&& e)
{
    return {bc::forward<E>(e)};
}
} // namespace bc

/// Outcome of an operation that either succeeds without a payload or fails with E.
/// A default constructed result is a success.
/// Only the payload-free form result<void, E> is defined.
template <class E>
struct bc::result<void, E>
{
    static_assert(std::is_trivially_copyable_v<E>, "error kinds are plain enums or codes");

    result() = default;
    result(as_error_t<E> e) : _error(e.value), _has_error(true) {} // NOLINT

    [[nodiscard]] bool has_value() const { return !_has_error; }
    [[nodiscard]] bool has_error() const { return _has_error; }

    /// Precondition: has_error().
    [[nodiscard]] E error() const
    {
        BC_ASSERT(_has_error, "error() of successful result");
        return _error;
    }

private:
    E _error = {};
    bool _has_error = false;
};
