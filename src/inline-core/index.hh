#pragma once

#include <inline-core/assert.hh>
#include <inline-core/fwd.hh>

#include <concepts>
#include <type_traits>

// =========================================================================================================
// Index normalization for fixed-length containers
// =========================================================================================================
//
//   normalize_index(name, idx, length)     - runtime: wraps negative indices, checks [0, length)
//   normalize_static_index<I, Length>()    - compile-time: same mapping, out-of-range is a build error
//
// Negative indices count from the back: -1 is the last element, -length the first.
// Unsigned indices are never negative and only the upper bound applies.
//
// Out-of-range runtime indices are a contract violation and are ALWAYS checked, also in release builds.
// The failure goes through the assertion handler stack with a message of the form
//   "inline_array index out of bounds: index (5) valid range: -3 <= index < 3"
// and aborts unless a handler throws.

namespace ic::impl
{
// Formats the bounds report and forwards it to the active assertion handler.
// Out of line to keep string formatting out of the container headers.
// Note: does not abort, caller must follow with IC_BREAK_AND_ABORT()
IC_COLD_FUNC void handle_index_out_of_bounds(char const* container_name, i64 index, isize length, ic::source_location location);
IC_COLD_FUNC void handle_index_out_of_bounds(char const* container_name, u64 index, isize length, ic::source_location location);

template <class I>
concept index_integral = std::integral<I> && !std::is_same_v<std::remove_cv_t<I>, bool>;
} // namespace ic::impl

namespace ic
{
/// Maps idx into [0, length), treating negative values as offsets from the back.
/// container_name is only used for the failure report (e.g. "inline_array").
/// Never returns on failure.
/// Precondition: length > 0.
template <impl::index_integral I>
[[nodiscard]] constexpr isize normalize_index(char const* container_name,
                                              I idx,
                                              isize length,
                                              ic::source_location location = ic::source_location::current())
{
    if constexpr (std::is_signed_v<I>)
    {
        auto const raw = static_cast<i64>(idx);
        auto const normalized = raw < 0 ? raw + length : raw;
        if (normalized < 0 || normalized >= length) [[unlikely]]
        {
            impl::handle_index_out_of_bounds(container_name, raw, length, location);
            IC_BREAK_AND_ABORT();
        }
        return normalized;
    }
    else
    {
        auto const raw = static_cast<u64>(idx);
        if (raw >= static_cast<u64>(length)) [[unlikely]]
        {
            impl::handle_index_out_of_bounds(container_name, raw, length, location);
            IC_BREAK_AND_ABORT();
        }
        return static_cast<isize>(raw);
    }
}

/// Compile-time counterpart of normalize_index.
/// Requires -Length <= I < Length, checked by static_assert.
template <isize I, isize Length>
[[nodiscard]] consteval isize normalize_static_index()
{
    static_assert(Length > 0, "cannot index into an empty range");
    static_assert(-Length <= I && I < Length, "index out of bounds");
    return I < 0 ? I + Length : I;
}
} // namespace ic
