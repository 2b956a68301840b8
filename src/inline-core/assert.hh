#pragma once

// Lean header with minimal dependencies, meant to be included from every container header.
#include <inline-core/macros.hh>
#include <inline-core/source_location.hh>

// =========================================================================================================
// IC_ASSERT - Runtime assertion with string literal message
//
// Validates a condition at runtime and triggers a debugger break + abort on failure.
//
// When assertions are active:
//   Assertions are enabled in IC_DEBUG and IC_RELWITHDEBINFO builds.
//   In IC_RELEASE builds, assertions are disabled unless IC_ENABLE_ASSERT_IN_RELEASE is defined.
//   A disabled assertion does not evaluate its condition; the guarded misuse is then undefined behavior.
//
// What assertions are for:
//   Assertions protect INVARIANTS, PRECONDITIONS, and POSTCONDITIONS.
//   They catch PROGRAMMER ERRORS early during development.
//   They are NOT for user input validation or expected error conditions.
//   Contract checks that must survive release builds (checked indexing) report through
//   ic::impl::handle_assert_failure directly, see index.hh.
//
// Usage:
//   IC_ASSERT(0 <= idx && idx < N, "index out of bounds");
//   IC_ASSERT(storage.size() == N, "storage length must match array size");
//
#define IC_ASSERT(cond, msg) IC_IMPL_ASSERT(cond, msg)

// =========================================================================================================
// IC_DEBUG_BREAK - Conditional debugger breakpoint
//
// Triggers a debugger break if a debugger is attached, otherwise does nothing.
//
#define IC_DEBUG_BREAK() IC_IMPL_DEBUG_BREAK()

// =========================================================================================================
// IC_BREAK_AND_ABORT - Debug break followed by program termination
//
// Used by the assertion macros after the failure has been reported.
//
#define IC_BREAK_AND_ABORT() (IC_DEBUG_BREAK(), ::ic::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ic::impl
{
// Called when an assertion fails
// Forwards to the active assertion handler (default: print to stderr)
// Note: does not abort, caller must follow with IC_BREAK_AND_ABORT()
IC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ic::source_location location);

// Checks if a debugger is currently attached to the process
bool is_debugger_connected() noexcept;

// Terminates the program
[[noreturn]] void perform_abort() noexcept;
} // namespace ic::impl

// The debugger should break right in the assert macro, so this cannot hide in a function call

#ifdef IC_COMPILER_MSVC

// __debugbreak() terminates immediately without an attached debugger
#define IC_IMPL_DEBUG_BREAK() (::ic::impl::is_debugger_connected() ? __debugbreak() : void(0))

#elif defined(IC_COMPILER_POSIX)

// we use a SIGTRAP to signal a breakpoint, followed by an abort anyways
// NOTE: we don't want to pull in any posix header here, so we simply declare raise
//       SIGTRAP is 5 according to https://man7.org/linux/man-pages/man7/signal.7.html
extern "C" int raise(int) noexcept;
#define IC_IMPL_DEBUG_BREAK() (::ic::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#else

#define IC_IMPL_DEBUG_BREAK() void(0)

#endif

#if IC_ASSERT_ENABLED

#define IC_IMPL_ASSERT(cond, msg)                                                            \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ic::impl::handle_assert_failure(#cond, msg, ::ic::source_location::current()); \
            IC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#else

// Stripped: the message and condition must still compile
#define IC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        IC_UNUSED(cond);          \
        IC_UNUSED(msg);           \
    } while (false)

#endif
