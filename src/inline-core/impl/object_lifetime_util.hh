#pragma once

#include <inline-core/fwd.hh>
#include <inline-core/maybe_uninit.hh>
#include <inline-core/utility.hh>

#include <cstring>
#include <type_traits>

// Placement-construction primitives over raw ranges.
// All *_create_* functions assume their destination is NOT yet constructed (uninitialized memory)
// and advance dest_end past every object they construct, so that after an exception thrown by T,
// [dest_start, dest_end) is exactly the range of live objects.
// All *_assign_* functions assume their destination is already alive.
// Trivially copyable types are lowered to memcpy at compile time.

namespace ic::impl
{
/// Calls destructors on [start, end) in ascending address order.
/// Empty ranges are valid and result in a no-op.
/// Trivially destructible types are optimized out at compile time.
template <class T>
constexpr void destroy_objects_in_order(T* start, T* end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");

    if constexpr (!std::is_trivially_destructible_v<T>)
    {
        while (start != end)
        {
            start->~T();
            ++start;
        }
    }
}

/// Copy-constructs count objects from a single value.
/// Usage pattern:
///   auto obj_end = obj_start;
///   fill_create_objects_to(obj_end, count, value);
///   // [obj_start, obj_end) is now the constructed live range, each element a copy of value
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    for (isize i = 0; i < count; ++i)
    {
        new (ic::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

/// Copy-constructs objects from [src_start, src_end).
template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (ic::placement_new, dest_end) T(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-constructs objects from [src_start, src_end).
/// The source objects stay alive (moved-from) and are still owned by the caller.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memcpy(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            new (ic::placement_new, dest_end) T(ic::move(*src_start));
            ++dest_end;
            ++src_start;
        }
    }
}

/// Relocates the values held by [src_start, src_end) into uninitialized storage.
/// Each source slot is moved from and its moved-from object destroyed, so the source slots are
/// uninitialized afterwards and ownership has fully passed to the destination.
/// IMPORTANT: Assumes every source slot is initialized.
template <class T>
constexpr void relocate_create_objects_to(T*& dest_end, maybe_uninit<T>* src_start, maybe_uninit<T>* src_end)
{
    static_assert(std::is_move_constructible_v<T>, "T must be move constructible");

    while (src_start != src_end)
    {
        src_start->relocate_to(dest_end);
        ++dest_end;
        ++src_start;
    }
}

/// Copy-assigns objects from [src_start, src_end) onto live objects.
template <class T>
constexpr void copy_assign_objects_to(T*& dest_end, T const* src_start, T const* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_copy_assignable_v<T>, "T must be copy assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memmove(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            *dest_end = *src_start;
            ++dest_end;
            ++src_start;
        }
    }
}

/// Move-assigns objects from [src_start, src_end) onto live objects.
template <class T>
constexpr void move_assign_objects_to(T*& dest_end, T* src_start, T* src_end)
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(std::is_move_assignable_v<T>, "T must be move assignable");

    if constexpr (std::is_trivially_copyable_v<T>)
    {
        auto const size = src_end - src_start;
        if (size > 0)
        {
            std::memmove(dest_end, src_start, size * sizeof(T));
            dest_end += size;
        }
    }
    else
    {
        while (src_start != src_end)
        {
            *dest_end = ic::move(*src_start);
            ++dest_end;
            ++src_start;
        }
    }
}
} // namespace ic::impl
