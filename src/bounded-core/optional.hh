#pragma once

#include <bounded-core/assert.hh>
#include <bounded-core/fwd.hh>
#include <bounded-core/utility.hh>

struct bc::nullopt_t
{
};

namespace bc
{
constexpr nullopt_t nullopt = {};
}

/// The popped value of a bounded_stack, or nothing if the stack was empty.
/// Move-only: the value is owned by whoever holds the optional.
template <class T>
struct bc::optional
{
    optional() = default;
    optional(nullopt_t) {}
    optional(T&& value) : _has_value(true) { new (bc::placement_new, &_storage.value) T(bc::move(value)); }

    optional(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>) : _has_value(rhs._has_value)
    {
        if (_has_value)
            new (bc::placement_new, &_storage.value) T(bc::move(rhs._storage.value));
    }
    optional& operator=(optional&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        if (this != &rhs)
        {
            reset();
            if (rhs._has_value)
            {
                new (bc::placement_new, &_storage.value) T(bc::move(rhs._storage.value));
                _has_value = true;
            }
        }
        return *this;
    }

    ~optional() { reset(); }

    [[nodiscard]] bool has_value() const { return _has_value; }

    [[nodiscard]] T& value() &
    {
        BC_ASSERT(_has_value, "value() of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T const& value() const&
    {
        BC_ASSERT(_has_value, "value() of empty optional");
        return _storage.value;
    }
    [[nodiscard]] T&& value() &&
    {
        BC_ASSERT(_has_value, "value() of empty optional");
        return bc::move(_storage.value);
    }

    void reset()
    {
        if (_has_value)
        {
            _storage.value.~T();
            _has_value = false;
        }
    }

private:
    bc::storage_for<T> _storage;
    bool _has_value = false;
};
