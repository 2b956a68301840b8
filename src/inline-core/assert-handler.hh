#pragma once

#include <inline-core/macros.hh>
#include <inline-core/source_location.hh>

#include <functional>
#include <string>

namespace ic::impl
{
// Handler stack that receives every contract violation reported by inline-core:
//   - IC_ASSERT failures (unsafe_get bounds, create_by_relocating length, span preconditions)
//   - checked indexing failures from inline_array::operator[] via ic::normalize_index,
//     which are reported in every build configuration
// Without a handler the report goes to std::cerr; either way the process aborts afterwards
// unless the handler throws.
// NOTE: the stack is global state and must be externally synchronized
//
// Turning an out-of-bounds access into an exception, e.g. in tests or at a request boundary:
//   {
//       auto handler = ic::impl::scoped_assertion_handler([](ic::impl::assertion_info const& info) {
//           throw contract_violation{info.message}; // "inline_array index out of bounds: index (5) ..."
//       });
//
//       auto value = samples[i]; // a bad i throws instead of aborting
//   } // handler is popped here

// One failure report
// expression: the failed condition as written (or the bounds condition for checked indexing)
// message:    the human-readable reason, for bounds failures including index and length
// location:   the call site (for checked indexing: the operator[] call inside inline_array)
struct assertion_info
{
    std::string expression;
    std::string message;
    ic::source_location location;
};

// Installs handler as the topmost entry; only the topmost handler sees a report
// Throwing from the handler unwinds out of the failing inline_array/span call, the container
// state is unchanged because every check runs before the access it guards
void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// Removes the topmost handler, no-op on an empty stack
// NOTE: prefer scoped_assertion_handler, which also pops when a handler throws
void pop_assertion_handler();

// Pushes on construction, pops on destruction
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ic::impl
