#pragma once

#include <bounded-core/assert.hh>
#include <bounded-core/fwd.hh>
#include <bounded-core/list_error.hh>
#include <bounded-core/optional.hh>
#include <bounded-core/result.hh>
#include <bounded-core/utility.hh>

#include <type_traits>


/// Fixed-capacity LIFO list of up to N elements of type T.
/// All storage is inline (no dynamic allocation ever), so a bounded_stack can live on the call stack
/// and serve as a scratch buffer for a small, bounded number of values inside a hot loop.
///
/// Elements are pushed to and popped from the end:
///   - push/emplace fail with list_error::list_full at capacity instead of growing
///   - pop returns an empty optional on an empty stack
///   - iter() visits elements oldest first (FIFO), into_iter() consumes them newest first (LIFO)
///
/// Storage is N uninitialized slots plus the live count _size.
/// Slots [0, _size) hold live elements in push order, slots [_size, N) are never read or destroyed.
///
/// Not thread-safe. Moving a bounded_stack moves its elements one by one and leaves the source empty.
template <class T, bc::isize N>
struct bc::bounded_stack
{
    static_assert(N >= 0, "bounded_stack capacity must be non-negative");
    static_assert(std::is_object_v<T> && !std::is_const_v<T>, "bounded_stack requires a non-const object type");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    // construction
public:
    /// Creates an empty stack; no T is constructed.
    bounded_stack() = default;

    // NOTE: copy and move delegate to the default constructor so that the destructor
    //       cleans up the already-constructed prefix if an element constructor throws

    /// Moves all live elements of rhs into the new stack, then empties rhs.
    /// If a move constructor of T throws, rhs keeps all of its elements.
    bounded_stack(bounded_stack&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>) : bounded_stack()
    {
        impl_move_from(rhs);
    }

    bounded_stack(bounded_stack const& rhs)
        requires std::is_copy_constructible_v<T>
      : bounded_stack()
    {
        impl_copy_from(rhs);
    }

    bounded_stack& operator=(bounded_stack&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
    {
        if (this != &rhs)
        {
            clear();
            impl_move_from(rhs);
        }
        return *this;
    }

    bounded_stack& operator=(bounded_stack const& rhs)
        requires std::is_copy_constructible_v<T>
    {
        if (this != &rhs)
        {
            clear();
            impl_copy_from(rhs);
        }
        return *this;
    }

    ~bounded_stack()
        requires std::is_trivially_destructible_v<T>
    = default;

    /// Destroys exactly the live elements, newest first.
    ~bounded_stack()
        requires(!std::is_trivially_destructible_v<T>)
    {
        clear();
    }

    // element access
public:
    /// Returns a reference to the most recently pushed element.
    /// Precondition: !is_empty().
    [[nodiscard]] T& top()
    {
        BC_ASSERT(_size > 0, "top() called on empty bounded_stack");
        return _slots[_size - 1].value;
    }
    [[nodiscard]] T const& top() const
    {
        BC_ASSERT(_size > 0, "top() called on empty bounded_stack");
        return _slots[_size - 1].value;
    }

    // iteration
public:
    /// Returns a fresh forward view over the live elements, oldest first.
    /// Does not modify the stack. The stack must not be mutated while the view is in use.
    [[nodiscard]] bounded_stack_iter<T, N> iter() const { return bounded_stack_iter<T, N>(*this); }

    /// Enables range-based for loops (same order as iter()).
    [[nodiscard]] bounded_stack_iter<T, N> begin() const { return iter(); }
    [[nodiscard]] bc::sentinel end() const { return {}; }

    /// Converts the stack into a consuming view that yields owned elements newest first.
    /// The source stack is left empty.
    /// Usage:
    ///   for (auto v : bc::move(stack).into_iter()) { ... }
    [[nodiscard]] bounded_stack_drain<T, N> into_iter() && { return bounded_stack_drain<T, N>(bc::move(*this)); }

    // queries
public:
    /// Returns the number of live elements.
    [[nodiscard]] isize size() const { return _size; }

    /// Returns the compile-time capacity N.
    [[nodiscard]] static constexpr isize capacity() { return N; }

    [[nodiscard]] bool is_empty() const { return _size == 0; }
    [[nodiscard]] bool is_full() const { return _size == N; }

    // modifiers
public:
    /// Copies value onto the top of the stack.
    /// Returns list_error::list_full without modifying anything if the stack is full.
    [[nodiscard]] result<void, list_error> push(T const& value) { return emplace(value); }

    /// Moves value onto the top of the stack.
    /// On list_error::list_full, value is not moved from and remains with the caller.
    [[nodiscard]] result<void, list_error> push(T&& value) { return emplace(bc::move(value)); }

    /// Constructs a new element on top of the stack from args.
    /// Returns list_error::list_full without constructing anything if the stack is full.
    /// Strong exception safety; O(1) complexity.
    template <class... Args>
    [[nodiscard]] result<void, list_error> emplace(Args&&... args)
    {
        static_assert(
            requires { T(bc::forward<Args>(args)...); }, "emplace: T is not constructible from the provided "
                                                         "argument types");

        if (is_full())
            return bc::error(list_error::list_full);

        new (bc::placement_new, &_slots[_size].value) T(bc::forward<Args>(args)...);
        ++_size; // _after_ so exceptions in T(...) leave the state valid
        return {};
    }

    /// Removes the most recently pushed element and returns it by move.
    /// Returns an empty optional (and changes nothing) if the stack is empty.
    /// NOTE: Prefer remove_top() if you don't need the return value (avoids an extra move).
    [[nodiscard("use remove_top() if you don't need the return value")]] optional<T> pop()
    {
        if (_size == 0)
            return bc::nullopt;

        --_size;
        auto& slot = _slots[_size].value;
        optional<T> popped = bc::move(slot);
        slot.~T();
        return popped;
    }

    /// Destroys the most recently pushed element in place.
    /// Precondition: !is_empty().
    void remove_top()
    {
        BC_ASSERT(_size > 0, "cannot remove from empty bounded_stack");
        --_size;
        if constexpr (!std::is_trivially_destructible_v<T>)
            _slots[_size].value.~T();
    }

    /// Destroys all elements (newest first), size becomes 0.
    void clear()
    {
        if constexpr (std::is_trivially_destructible_v<T>)
        {
            _size = 0;
        }
        else
        {
            while (_size > 0)
            {
                --_size;
                _slots[_size].value.~T();
            }
        }
    }

    // helper
private:
    // Precondition for both: *this is empty.
    void impl_move_from(bounded_stack& rhs)
    {
        BC_ASSERT(_size == 0, "move target must be empty");
        for (isize i = 0; i < rhs._size; ++i)
        {
            new (bc::placement_new, &_slots[i].value) T(bc::move(rhs._slots[i].value));
            ++_size;
        }
        rhs.clear();
    }

    void impl_copy_from(bounded_stack const& rhs)
    {
        BC_ASSERT(_size == 0, "copy target must be empty");
        for (isize i = 0; i < rhs._size; ++i)
        {
            new (bc::placement_new, &_slots[i].value) T(rhs._slots[i].value);
            ++_size;
        }
    }

    // members
private:
    // N == 0 still gets one slot since zero-sized arrays are not valid C++.
    // That slot is never live: with N == 0 the stack is always full.
    bc::storage_for<T> _slots[N > 0 ? N : 1];

    // number of live slots, always in [0, N]
    isize _size = 0;

    friend bounded_stack_iter<T, N>;
};

/// Forward, non-consuming view over the live elements of a bounded_stack, oldest first (FIFO).
/// Single-pass: the view is its own iterator, begin() returns a copy at the current position and
/// end() returns bc::sentinel. Obtain a new view via stack.iter() to iterate again.
/// Borrows the stack: the stack must outlive the view and must not be mutated while it is used.
template <class T, bc::isize N>
struct bc::bounded_stack_iter
{
    using difference_type = isize;
    using value_type = T;

    bounded_stack_iter() = default;
    explicit bounded_stack_iter(bounded_stack<T, N> const& stack) : _stack(&stack) {}

    [[nodiscard]] T const& operator*() const
    {
        BC_ASSERT(!is_done(), "dereferencing exhausted bounded_stack iterator");
        return _stack->_slots[_index].value;
    }
    [[nodiscard]] T const* operator->() const { return &operator*(); }

    bounded_stack_iter& operator++()
    {
        BC_ASSERT(!is_done(), "incrementing exhausted bounded_stack iterator");
        ++_index;
        return *this;
    }
    bounded_stack_iter operator++(int)
    {
        auto const tmp = *this;
        ++(*this);
        return tmp;
    }

    [[nodiscard]] bool operator==(sentinel) const { return is_done(); }

    /// Returns a pointer to the next element and advances, or nullptr once exhausted.
    /// Usage:
    ///   auto it = stack.iter();
    ///   while (auto const* v = it.next())
    ///       use(*v);
    [[nodiscard]] T const* next()
    {
        if (is_done())
            return nullptr;
        return &_stack->_slots[_index++].value;
    }

    /// Exact number of elements not yet visited.
    [[nodiscard]] isize remaining() const { return is_done() ? 0 : _stack->_size - _index; }

    [[nodiscard]] bounded_stack_iter begin() const { return *this; }
    [[nodiscard]] sentinel end() const { return {}; }

private:
    [[nodiscard]] bool is_done() const { return _stack == nullptr || _index >= _stack->_size; }

    bounded_stack<T, N> const* _stack = nullptr;
    isize _index = 0;
};

/// Consuming view over a bounded_stack, newest first (LIFO).
/// Created by bc::move(stack).into_iter(); owns the elements from then on.
/// Each step removes the top element. Elements that are never consumed are destroyed with the view.
template <class T, bc::isize N>
struct bc::bounded_stack_drain
{
    explicit bounded_stack_drain(bounded_stack<T, N>&& stack) : _stack(bc::move(stack)) {}

    /// Removes and returns the next element (newest first), empty once exhausted.
    [[nodiscard]] optional<T> next() { return _stack.pop(); }

    /// Exact number of elements not yet consumed.
    [[nodiscard]] isize remaining() const { return _stack.size(); }

    /// Input iterator over the drain.
    /// *it hands out the current top as an rvalue so that "auto v = *it" takes ownership,
    /// ++it then destroys the (moved-from) top.
    struct iterator
    {
        using difference_type = isize;
        using value_type = T;

        iterator() = default;
        explicit iterator(bounded_stack_drain* drain) : _drain(drain) {}

        [[nodiscard]] T&& operator*() const
        {
            BC_ASSERT(_drain != nullptr, "dereferencing invalid bounded_stack_drain iterator");
            return bc::move(_drain->_stack.top());
        }

        iterator& operator++()
        {
            BC_ASSERT(_drain != nullptr, "incrementing invalid bounded_stack_drain iterator");
            _drain->_stack.remove_top();
            return *this;
        }
        void operator++(int) { ++(*this); }

        [[nodiscard]] bool operator==(sentinel) const { return _drain == nullptr || _drain->_stack.is_empty(); }

    private:
        bounded_stack_drain* _drain = nullptr;
    };

    [[nodiscard]] iterator begin() { return iterator(this); }
    [[nodiscard]] sentinel end() const { return {}; }

private:
    bounded_stack<T, N> _stack;
};
