#pragma once

#include <cstdint>

namespace bc
{
// sizes and indices are signed
using isize = std::int64_t;
using u8 = std::uint8_t;

struct nullopt_t;
template <class T>
struct optional;

template <class E>
struct as_error_t;
template <class T, class E>
struct result;

enum class list_error : u8;

template <class T, isize N>
struct bounded_stack;
template <class T, isize N>
struct bounded_stack_iter;
template <class T, isize N>
struct bounded_stack_drain;
} // namespace bc
