#include "index.hh"

#include <string>

namespace
{
constexpr char const* bounds_expression = "-length <= index && index < length";

std::string make_bounds_message(char const* container_name, std::string const& index, ic::isize length)
{
    auto const len = std::to_string(length);

    std::string msg = container_name;
    msg += " index out of bounds: index (";
    msg += index;
    msg += ") valid range: -";
    msg += len;
    msg += " <= index < ";
    msg += len;
    return msg;
}
} // namespace

IC_COLD_FUNC void ic::impl::handle_index_out_of_bounds(char const* container_name,
                                                       i64 index,
                                                       isize length,
                                                       ic::source_location location)
{
    auto const msg = make_bounds_message(container_name, std::to_string(index), length);
    handle_assert_failure(bounds_expression, msg.c_str(), location);
}

IC_COLD_FUNC void ic::impl::handle_index_out_of_bounds(char const* container_name,
                                                       u64 index,
                                                       isize length,
                                                       ic::source_location location)
{
    auto const msg = make_bounds_message(container_name, std::to_string(index), length);
    handle_assert_failure(bounds_expression, msg.c_str(), location);
}
