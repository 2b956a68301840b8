#pragma once

#include <cstddef>
#include <cstdint>


namespace ic
{

//
// Primitives
//

// Explicitly-sized primitive types
// Used wherever the range matters for correctness or memory layout.

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// generic bytes
using byte = std::byte;

// signed size type
// Sizes and indices are signed so that "size - 1" cannot wrap and so that
// negative indices (counted from the back) are representable at all.
using isize = i64;

// pointer
using nullptr_t = std::nullptr_t;

//
// Views
//

template <class T>
struct span;

//
// Container
//

template <class T>
struct maybe_uninit;

struct unsafe_uninitialized_t;
struct unsafe_assume_initialized_t;

template <class T, isize N, bool RunDestructors = false>
struct inline_array;

} // namespace ic
