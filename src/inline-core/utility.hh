#pragma once

#include <inline-core/fwd.hh>
#include <inline-core/macros.hh>

#include <type_traits>

// =========================================================================================================
// Utility functions for common operations
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//
// Object lifetime:
//   new (ic::placement_new, ptr) T(...) - placement new without including <new>
//


namespace ic
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   T b = ic::move(a);              // move construct b from a
template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
/// Usage:
///   template<class... Args>
///   T& write(Args&&... args) {
///       return *new (ic::placement_new, ptr) T(ic::forward<Args>(args)...);
///   }
template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}
template <class T>
[[nodiscard]] IC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>&& value) noexcept // NOLINT
{
    static_assert(!std::is_lvalue_reference_v<T>, "cannot forward an rvalue as an lvalue");
    return static_cast<T&&>(value);
}

// =========================================================================================================
// Object lifetime
// =========================================================================================================

/// Tag type selecting the placement operator new declared below.
/// Avoids pulling <new> into every header and cannot collide with user overloads of the standard form.
struct placement_new_tag
{
};
inline constexpr placement_new_tag placement_new = {};

} // namespace ic

/// Placement new for ic::placement_new: constructs in the given storage, never allocates.
/// Usage:
///   new (ic::placement_new, ptr) T(args...);
IC_FORCE_INLINE void* operator new(std::size_t, ic::placement_new_tag, void* buffer) noexcept
{
    return buffer;
}

/// Matching placement delete, only called by the runtime if a constructor throws.
IC_FORCE_INLINE void operator delete(void*, ic::placement_new_tag, void*) noexcept {}
