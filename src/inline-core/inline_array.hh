#pragma once

#include <inline-core/assert.hh>
#include <inline-core/fwd.hh>
#include <inline-core/impl/object_lifetime_util.hh>
#include <inline-core/index.hh>
#include <inline-core/maybe_uninit.hh>
#include <inline-core/span.hh>
#include <inline-core/utility.hh>

#include <type_traits>
#include <utility> // for tuple_size


/// Tag selecting the inline_array constructor that leaves every slot uninitialized.
/// Construct as ic::unsafe_uninitialized; deliberately not default constructible so `{}` never selects it.
struct ic::unsafe_uninitialized_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr unsafe_uninitialized_t(_ctor_tag) {}
};

/// Tag selecting the inline_array constructor that takes over an array of maybe_uninit slots
/// which the caller guarantees to be initialized.
struct ic::unsafe_assume_initialized_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr unsafe_assume_initialized_t(_ctor_tag) {}
};

namespace ic
{
inline constexpr unsafe_uninitialized_t unsafe_uninitialized = unsafe_uninitialized_t{unsafe_uninitialized_t::_ctor_tag::tag};
inline constexpr unsafe_assume_initialized_t unsafe_assume_initialized
    = unsafe_assume_initialized_t{unsafe_assume_initialized_t::_ctor_tag::tag};

/// inline_array that destroys its elements when it is destroyed.
/// Prefer this over the legacy default whenever T owns resources.
template <class T, isize N>
using owning_inline_array = inline_array<T, N, true>;

namespace impl
{
template <class T>
constexpr bool is_maybe_uninit = false;
template <class T>
constexpr bool is_maybe_uninit<maybe_uninit<T>> = true;
} // namespace impl
} // namespace ic

/// Fixed-size array of exactly N elements of type T, stored inline without heap allocation.
///
/// Layout: N contiguous slots, slot i at byte offset i * sizeof(T).
/// sizeof(inline_array) == N * sizeof(T) and alignof(inline_array) == alignof(T).
///
/// Construction (there is no default constructor):
///
///     auto a = ic::inline_array<int, 3>(1, 2, 3);                      // exactly N values
///     auto b = ic::inline_array<int, 3>::create_filled(7);              // N copies of one value
///     auto c = ic::inline_array<int, 3>(ic::unsafe_uninitialized);      // caller initializes every slot
///     auto d = ic::inline_array<T, 3>(ic::unsafe_assume_initialized, slots); // from maybe_uninit slots
///     auto e = ic::inline_array<T, 3>::create_by_relocating(span);       // from runtime-length slots
///
/// Indexing:
///   a[i]            checked, negative i counts from the back, always active bounds check
///   a.get<I>()      checked at compile time, negative I counts from the back
///   a.unsafe_get(i) no normalization, bounds only checked by IC_ASSERT
///   a.unsafe_ptr()  pointer to slot 0, invalidated when the array is moved
///
/// Destruction policy (RunDestructors):
///   false (default): element destructors are NOT run when the array is destroyed.
///                    This is a legacy default kept for compatibility with existing users;
///                    elements that own resources leak unless cleaned up externally.
///   true:            elements are destroyed in ascending index order.
/// Use ic::owning_inline_array<T, N> to spell the destroying variant.
///
/// Copying is element-wise copy construction (trivial for trivially copyable T).
/// Moving is element-wise move construction; the source keeps N moved-from elements.
/// If an element constructor throws during construction, copy or move, the elements built so far
/// are destroyed in index order and the exception propagates; no partially built array is observable.
/// Not thread-safe: one logical owner at a time.
template <class T, ic::isize N, bool RunDestructors>
struct ic::inline_array
{
    static_assert(N > 0, "inline_array size must be positive");
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(!std::is_reference_v<T>, "inline_array cannot hold references");

    using element_type = T;

    /// Number of elements, same as size().
    static constexpr isize length = N;

    // construction
public:
    /// An inline_array is never silently uninitialized.
    /// Use ic::unsafe_uninitialized to opt into uninitialized slots.
    inline_array() = delete;

    /// Leaves all N slots uninitialized.
    /// The caller must initialize every slot exactly once (e.g. placement new through unsafe_ptr())
    /// before any slot is read, copied, moved or destroyed.
    /// Arrays of maybe_uninit start the (no-op) lifetime of each wrapper so write() can be called directly.
    explicit inline_array(unsafe_uninitialized_t)
    {
        if constexpr (impl::is_maybe_uninit<T>)
        {
            for (isize i = 0; i < N; ++i)
                new (ic::placement_new, slot_ptr(i)) T();
        }
    }

    /// Constructs from exactly N values, forwarded into the slots in argument order.
    /// Any other count fails to compile.
    /// Explicit for N == 1 so that a single T never converts implicitly to an array.
    template <class... Args>
        requires(sizeof...(Args) == N                                   //
                 && (std::is_constructible_v<T, Args &&> && ...)         //
                 && !(sizeof...(Args) == 1 && (std::is_same_v<std::remove_cvref_t<Args>, inline_array> || ...)))
    explicit(sizeof...(Args) == 1) inline_array(Args&&... values)
    {
        create_all([&](T*& end) { ((new (ic::placement_new, end) T(ic::forward<Args>(values)), ++end), ...); });
    }

    /// Takes over the values held by storage, slot by slot.
    /// Every value is moved into this array and its moved-from object is destroyed,
    /// so all wrappers in storage are uninitialized afterwards.
    /// Precondition: every slot of storage is initialized. This is not checked.
    template <bool R>
    inline_array(unsafe_assume_initialized_t, inline_array<maybe_uninit<T>, N, R>& storage)
      : inline_array(relocate_tag{}, storage.begin())
    {
    }
    template <bool R>
    inline_array(unsafe_assume_initialized_t tag, inline_array<maybe_uninit<T>, N, R>&& storage)
      : inline_array(tag, storage)
    {
    }

    // factories
public:
    /// Creates an array holding N copies of value.
    [[nodiscard]] static inline_array create_filled(T const& value)
    {
        static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");
        return inline_array(fill_tag{}, value);
    }

    /// Creates an array from a runtime-length sequence of initialized slots.
    /// Same result as constructing from N values; afterwards every slot of storage is uninitialized
    /// (moved from and destroyed), so no element can be destroyed twice.
    /// Precondition: storage.size() == N (IC_ASSERT) and every slot of storage is initialized.
    [[nodiscard]] static inline_array create_by_relocating(span<maybe_uninit<T>> storage)
    {
        IC_ASSERT(storage.size() == N, "storage length must match inline_array size");
        return inline_array(relocate_tag{}, storage.begin());
    }

    /// Returns an element-wise copy of this array.
    /// Same operation as the copy constructor, spelled out for call sites that copy on purpose.
    [[nodiscard]] inline_array copy() const
    {
        static_assert(std::is_copy_constructible_v<T>, "T must be copy constructible");
        return inline_array(*this);
    }

    // trivial copy/move/destroy - defaulted when T allows bitwise operations
    // each operation still requires T to support it, a move-only T gives a move-only array
public:
    inline_array(inline_array const&)
        requires(std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    = default;
    inline_array(inline_array&&)
        requires(std::is_trivially_copyable_v<T> && std::is_move_constructible_v<T>)
    = default;
    inline_array& operator=(inline_array const&)
        requires(std::is_trivially_copyable_v<T> && std::is_copy_assignable_v<T>)
    = default;
    inline_array& operator=(inline_array&&)
        requires(std::is_trivially_copyable_v<T> && std::is_move_assignable_v<T>)
    = default;

    /// Nothing to do: either destructors are not requested (legacy mode) or they are no-ops.
    ~inline_array()
        requires(!RunDestructors || std::is_trivially_destructible_v<T>)
    = default;

    // non-trivial copy/move/destroy
public:
    /// Copy-constructs every element from rhs into uninitialized storage, in index order.
    inline_array(inline_array const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        create_all([&](T*& end) { impl::copy_create_objects_to(end, rhs.unsafe_ptr(), rhs.unsafe_ptr() + N); });
    }

    /// Move-constructs every element from rhs.
    /// rhs keeps N live moved-from elements, destroyed according to its own policy.
    /// Pointers into rhs stay pointers into rhs; nothing obtained from rhs refers to *this.
    inline_array(inline_array&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>)
        requires(!std::is_trivially_copyable_v<T> && std::is_move_constructible_v<T>)
    {
        create_all([&](T*& end) { impl::move_create_objects_to(end, rhs.unsafe_ptr(), rhs.unsafe_ptr() + N); });
    }

    inline_array& operator=(inline_array const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
        {
            T* end = unsafe_ptr();
            impl::copy_assign_objects_to(end, rhs.unsafe_ptr(), rhs.unsafe_ptr() + N);
        }
        return *this;
    }

    inline_array& operator=(inline_array&& rhs) noexcept(std::is_nothrow_move_assignable_v<T>)
        requires(!std::is_trivially_copyable_v<T> && std::is_move_assignable_v<T>)
    {
        if (this != &rhs)
        {
            T* end = unsafe_ptr();
            impl::move_assign_objects_to(end, rhs.unsafe_ptr(), rhs.unsafe_ptr() + N);
        }
        return *this;
    }

    /// Destroys elements 0, 1, ..., N-1 in that order.
    ~inline_array()
        requires(RunDestructors && !std::is_trivially_destructible_v<T>)
    {
        impl::destroy_objects_in_order(unsafe_ptr(), unsafe_ptr() + N);
    }

    // element access
public:
    /// Returns the element at idx, where negative idx counts from the back (-1 is the last element).
    /// Accepts any integer type.
    /// An index outside [-N, N) is always reported through the assertion handler, also in release builds.
    template <impl::index_integral I>
    [[nodiscard]] T& operator[](I idx)
    {
        return unsafe_ptr()[ic::normalize_index("inline_array", idx, N)];
    }
    template <impl::index_integral I>
    [[nodiscard]] T const& operator[](I idx) const
    {
        return unsafe_ptr()[ic::normalize_index("inline_array", idx, N)];
    }

    /// Returns the I-th element, negative I counting from the back.
    /// Requires -N <= I < N (compile-time check).
    /// Also provides the tuple protocol for structured bindings: auto& [x, y, z] = arr;
    template <isize I>
    [[nodiscard]] T& get()
    {
        return unsafe_ptr()[ic::normalize_static_index<I, N>()];
    }
    template <isize I>
    [[nodiscard]] T const& get() const
    {
        return unsafe_ptr()[ic::normalize_static_index<I, N>()];
    }

    /// Returns the element at idx without normalization.
    /// For hot paths where the index has already been validated.
    /// Precondition: 0 <= idx < N. Only checked while IC_ASSERT is active, undefined behavior otherwise.
    [[nodiscard]] T& unsafe_get(isize idx)
    {
        IC_ASSERT(0 <= idx && idx < N, "unsafe_get index out of bounds");
        return unsafe_ptr()[idx];
    }
    [[nodiscard]] T const& unsafe_get(isize idx) const
    {
        IC_ASSERT(0 <= idx && idx < N, "unsafe_get index out of bounds");
        return unsafe_ptr()[idx];
    }

    /// Returns a pointer to slot 0; slot i is at unsafe_ptr() + i.
    /// Valid for uninitialized slots too (that is how they get initialized).
    /// Invalidated by any move of the array: re-derive it after every move.
    [[nodiscard]] T* unsafe_ptr() { return reinterpret_cast<T*>(_storage); }                   // NOLINT
    [[nodiscard]] T const* unsafe_ptr() const { return reinterpret_cast<T const*>(_storage); } // NOLINT

    // iterators
public:
    /// Pointers to the first and one past the last element, for range-based for loops.
    [[nodiscard]] T* begin() { return unsafe_ptr(); }
    [[nodiscard]] T* end() { return unsafe_ptr() + N; }
    [[nodiscard]] T const* begin() const { return unsafe_ptr(); }
    [[nodiscard]] T const* end() const { return unsafe_ptr() + N; }

    // queries
public:
    /// Returns the compile-time size N.
    [[nodiscard]] constexpr isize size() const { return N; }

    /// Returns true if any element compares equal to value.
    /// Linear scan in index order, stops at the first match.
    [[nodiscard]] bool contains(T const& value) const
        requires requires(T const& v) { bool(v == v); }
    {
        for (auto const& element : *this)
            if (element == value)
                return true;
        return false;
    }

    // construction helpers
private:
    struct fill_tag
    {
    };
    struct relocate_tag
    {
    };

    inline_array(fill_tag, T const& value)
    {
        create_all([&](T*& end) { impl::fill_create_objects_to(end, N, value); });
    }

    // storage points to N initialized slots
    inline_array(relocate_tag, maybe_uninit<T>* storage)
    {
        create_all([&](T*& end) { impl::relocate_create_objects_to(end, storage, storage + N); });
    }

    // Runs create(end) with end == unsafe_ptr(); create advances end past every element it constructs.
    // If create throws, the elements in [unsafe_ptr(), end) are destroyed before rethrowing,
    // regardless of RunDestructors: a failed construction leaves no owner behind.
    template <class F>
    void create_all(F&& create)
    {
        T* end = unsafe_ptr();
        try
        {
            create(end);
        }
        catch (...)
        {
            impl::destroy_objects_in_order(unsafe_ptr(), end);
            throw;
        }
    }

    [[nodiscard]] void* slot_ptr(isize i) { return _storage + i * isize(sizeof(T)); }

    // members
private:
    /// Raw slot memory, never default-initialized.
    /// Element lifetimes are managed explicitly through placement new and explicit destructor calls.
    alignas(T) ic::byte _storage[N * sizeof(T)];
};

/// Specialization of std::tuple_size for inline_array to enable structured bindings.
template <class T, ic::isize N, bool RunDestructors>
struct std::tuple_size<ic::inline_array<T, N, RunDestructors>>
  : std::integral_constant<std::size_t, static_cast<std::size_t>(N)>
{
};

/// Specialization of std::tuple_element for inline_array to enable structured bindings.
/// All elements have type T.
template <std::size_t I, class T, ic::isize N, bool RunDestructors>
struct std::tuple_element<I, ic::inline_array<T, N, RunDestructors>>
{
    using type = T;
};
