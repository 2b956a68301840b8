#pragma once

#include <inline-core/fwd.hh>
#include <inline-core/utility.hh>

#include <type_traits>

/// Storage for a single T that may or may not hold a live object.
/// The wrapper never tracks which state it is in: the caller does, and every accessor documents
/// the state it requires. Reading or destroying an uninitialized slot is undefined behavior.
///
/// Default construction runs no constructor of T and destruction runs no destructor of T,
/// so a maybe_uninit can be used to assemble values piecewise before moving them into a container:
///
///     auto slots = ic::inline_array<ic::maybe_uninit<widget>, 3>(ic::unsafe_uninitialized);
///     for (auto& s : slots)
///         s.write(make_widget());
///     auto widgets = ic::inline_array<widget, 3>(ic::unsafe_assume_initialized, slots);
///
/// Same size and alignment as T.
/// Trivially copyable when T is; otherwise neither copyable nor movable, since the state of the
/// slot is unknown to the wrapper.
template <class T>
struct ic::maybe_uninit
{
    static_assert(sizeof(T) > 0, "T must be a complete type (did you forget to include a header?)");
    static_assert(!std::is_reference_v<T>, "maybe_uninit cannot hold references");

    // construction
public:
    /// Leaves the slot uninitialized.
    constexpr maybe_uninit() {} // NOLINT(modernize-use-equals-default): must not initialize _value

    maybe_uninit(maybe_uninit const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    maybe_uninit& operator=(maybe_uninit const&)
        requires std::is_trivially_copyable_v<T>
    = default;

    maybe_uninit(maybe_uninit const&)
        requires(!std::is_trivially_copyable_v<T>)
    = delete;
    maybe_uninit& operator=(maybe_uninit const&)
        requires(!std::is_trivially_copyable_v<T>)
    = delete;

    /// Never destroys the held value, use assume_init_destroy() for that.
    ~maybe_uninit()
        requires std::is_trivially_destructible_v<T>
    = default;
    ~maybe_uninit()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    // state transitions
public:
    /// Constructs a T in place from args and returns it.
    /// Precondition: uninitialized (a live value would be overwritten without being destroyed).
    template <class... Args>
    T& write(Args&&... args)
    {
        return *new (ic::placement_new, &_value) T(ic::forward<Args>(args)...);
    }

    /// Moves the value out and ends its lifetime; the slot is uninitialized afterwards.
    /// Precondition: initialized.
    [[nodiscard]] T assume_init_take()
    {
        static_assert(std::is_move_constructible_v<T>, "T must be move constructible");
        T result = ic::move(_value);
        _value.~T();
        return result;
    }

    /// Move-constructs the value into the uninitialized storage at dest, then destroys the source.
    /// The slot is uninitialized afterwards.
    /// Precondition: initialized, and dest does not hold a live object.
    void relocate_to(T* dest)
    {
        static_assert(std::is_move_constructible_v<T>, "T must be move constructible");
        new (ic::placement_new, dest) T(ic::move(_value));
        _value.~T();
    }

    /// Destroys the value; the slot is uninitialized afterwards.
    /// Precondition: initialized.
    void assume_init_destroy() { _value.~T(); }

    // access
public:
    /// Precondition: initialized.
    [[nodiscard]] T& assume_init_ref() { return _value; }
    [[nodiscard]] T const& assume_init_ref() const { return _value; }

    /// Address of the slot, valid in both states.
    /// Writing through it is how a caller initializes the slot without write().
    [[nodiscard]] T* unsafe_ptr() { return &_value; }
    [[nodiscard]] T const* unsafe_ptr() const { return &_value; }

    // members
private:
    union
    {
        T _value;
    };
};
