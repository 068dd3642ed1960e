#pragma once

#include <cstddef>
#include <type_traits>

namespace bc
{
template <class T>
[[nodiscard]] constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Selects the placement operator new below.
/// Usage:
///   new (bc::placement_new, &slot.value) T(args...);
struct placement_new_t
{
};
constexpr placement_new_t placement_new = {};

/// Correctly sized and aligned room for one T whose lifetime is managed by the owner.
/// Neither constructs nor destroys value.
template <class T>
union storage_for
{
    T value;

    constexpr storage_for() {} // NOLINT(modernize-use-equals-default)

    ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }
};

/// End marker for ranges whose iterators know when they are done.
struct sentinel
{
};
} // namespace bc

[[nodiscard]] inline void* operator new(std::size_t, bc::placement_new_t, void* where) noexcept
{
    return where;
}
inline void operator delete(void*, bc::placement_new_t, void*) noexcept {}
