#pragma once

#include <source_location>

namespace ic
{
/// Type alias for std::source_location
/// Captured by the assertion macros to report file, line, column and function of a failure.
using source_location = std::source_location;
} // namespace ic
