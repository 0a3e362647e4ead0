#include "contract.hh"

#include <large-collections/assert-handler.hh>

#include <string>
#include <utility>

namespace
{
[[noreturn]] void raise_violation(lc::error_kind kind, char const* expression, std::string message, lc::source_location site)
{
    lc::impl::assertion_info const info{
        .kind = kind,
        .expression = expression,
        .message = std::move(message),
        .location = site,
    };
    lc::impl::dispatch_assertion(info);
    LC_BREAK_AND_ABORT();
}
} // namespace

void lc::impl::report_index_violation(isize index, isize count, lc::source_location site)
{
    raise_violation(error_kind::range, "0 <= index && index < count",
                    "index " + std::to_string(index) + " is out of range for count " + std::to_string(count), site);
}

void lc::impl::report_range_violation(isize offset, isize count, isize size, lc::source_location site)
{
    raise_violation(error_kind::range, "0 <= offset && 0 <= count && offset + count <= size",
                    "range [offset " + std::to_string(offset) + ", count " + std::to_string(count)
                        + ") does not fit into size " + std::to_string(size),
                    site);
}

void lc::impl::report_capacity_violation(isize capacity, isize min, isize max, lc::source_location site)
{
    raise_violation(error_kind::capacity, "min <= capacity && capacity <= max",
                    "capacity " + std::to_string(capacity) + " is outside [" + std::to_string(min) + ", "
                        + std::to_string(max) + "]",
                    site);
}

void lc::impl::report_count_limit(isize count, isize added, isize limit, lc::source_location site)
{
    raise_violation(error_kind::capacity, "count + added <= limit",
                    "cannot add " + std::to_string(added) + " element(s) to a container holding "
                        + std::to_string(count) + ", limit is " + std::to_string(limit),
                    site);
}

void lc::impl::report_not_found(char const* what, lc::source_location site)
{
    raise_violation(error_kind::not_found, "contains", std::string(what) + " not found", site);
}

void lc::impl::report_invalid_configuration(char const* expression, char const* message, lc::source_location site)
{
    raise_violation(error_kind::invalid_configuration, expression, message, site);
}
